/**
 * @file schedule_io.cpp
 * @brief Schedule document loading and rendering
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "schedule_io.hpp"
#include "oncall_logger.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace oncall {
namespace io {

namespace {

constexpr const char* kComponent = "ScheduleIO";

Error fieldError(ErrorCode code, const std::string& key, const std::string& msg) {
    return Error{code, msg, "key '" + key + "'"};
}

Result<const json::JsonValue*> requireField(const json::JsonValue& obj, const std::string& key,
                                            json::JsonType expected) {
    if (!obj.isObject()) {
        return Err<const json::JsonValue*>(ErrorCode::CONFIG_INVALID,
                                           std::string("Expected a JSON object, got ") +
                                               json::jsonTypeToString(obj.type()));
    }
    const json::JsonValue* field = obj.find(key);
    if (field == nullptr) {
        return Err<const json::JsonValue*>(fieldError(ErrorCode::CONFIG_MISSING, key,
                                                      "Missing required field"));
    }
    if (field->type() != expected) {
        return Err<const json::JsonValue*>(fieldError(
            ErrorCode::CONFIG_INVALID, key,
            std::string("Expected ") + json::jsonTypeToString(expected) + ", got " +
                json::jsonTypeToString(field->type())));
    }
    return field;
}

// Shared by overrides and shifts, which have the same document shape
Result<Shift> intervalFromJson(const json::JsonValue& obj) {
    auto user = requireField(obj, kKeyUser, json::JsonType::String);
    if (user.isError()) return Err<Shift>(user.error());
    auto start = timestampField(obj, kKeyStart);
    if (start.isError()) return Err<Shift>(start.error());
    auto end = timestampField(obj, kKeyEnd);
    if (end.isError()) return Err<Shift>(end.error());
    return Shift{(*user)->asString(), *start, *end};
}

Result<ShiftList> intervalListFromJson(const json::JsonValue& doc) {
    if (!doc.isArray()) {
        return Err<ShiftList>(ErrorCode::CONFIG_INVALID,
                              std::string("Expected a JSON array of intervals, got ") +
                                  json::jsonTypeToString(doc.type()));
    }
    ShiftList intervals;
    intervals.reserve(doc.size());
    const auto& items = doc.asArray();
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto interval = intervalFromJson(items[i]);
        if (interval.isError()) {
            return Err<ShiftList>(interval.error()).withContext("element " + std::to_string(i));
        }
        intervals.push_back(std::move(interval.value()));
    }
    return intervals;
}

} // namespace

Result<std::string> readTextFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Err<std::string>(Error{ErrorCode::IO_ERROR, "Cannot open file", path.string()});
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return Err<std::string>(Error{ErrorCode::IO_ERROR, "Read failed", path.string()});
    }
    return oss.str();
}

Result<json::JsonValue> parseJsonText(std::string_view text, const std::string& source) {
    try {
        return json::parse(text);
    } catch (const json::JsonParseError& e) {
        return Err<json::JsonValue>(Error{ErrorCode::CONFIG_PARSE_ERROR, e.what(), source});
    } catch (const std::invalid_argument& e) {
        return Err<json::JsonValue>(Error{ErrorCode::CONFIG_PARSE_ERROR, e.what(), source});
    } catch (const std::out_of_range& e) {
        // std::stod on a number literal beyond double range
        return Err<json::JsonValue>(Error{ErrorCode::CONFIG_PARSE_ERROR,
                                          std::string("Number out of range: ") + e.what(), source});
    }
}

Result<TimePoint> timestampField(const json::JsonValue& obj, const std::string& key) {
    auto field = requireField(obj, key, json::JsonType::String);
    if (field.isError()) return Err<TimePoint>(field.error());
    return time_utils::parseTimestamp((*field)->asString()).withContext("key '" + key + "'");
}

Result<RotationRule> ruleFromJson(const json::JsonValue& doc) {
    RotationRule rule;

    auto users = requireField(doc, kKeyUsers, json::JsonType::Array);
    if (users.isError()) return Err<RotationRule>(users.error());
    const auto& items = (*users)->asArray();
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto name = items[i].getString();
        if (!name) {
            return Err<RotationRule>(fieldError(ErrorCode::CONFIG_INVALID, kKeyUsers,
                                                "User " + std::to_string(i) + " is not a string"));
        }
        rule.users.push_back(*name);
    }

    auto start = timestampField(doc, kKeyHandoverStart);
    if (start.isError()) return Err<RotationRule>(start.error());
    rule.anchor_start = *start;

    auto interval = requireField(doc, kKeyHandoverInterval, json::JsonType::Number);
    if (interval.isError()) return Err<RotationRule>(interval.error());
    const double days = (*interval)->asNumber();
    if (days != std::floor(days) || std::abs(days) > static_cast<double>(std::numeric_limits<int32_t>::max())) {
        return Err<RotationRule>(fieldError(ErrorCode::CONFIG_INVALID, kKeyHandoverInterval,
                                            "Expected a whole number of days"));
    }
    rule.interval_days = static_cast<int64_t>(days);

    return rule;
}

Result<OverrideList> overridesFromJson(const json::JsonValue& doc) {
    auto intervals = intervalListFromJson(doc);
    if (intervals.isError()) return Err<OverrideList>(intervals.error());

    OverrideList overrides;
    overrides.reserve(intervals->size());
    for (const auto& s : *intervals) {
        overrides.push_back(OverrideInterval{s.user, s.start, s.end});
    }
    return overrides;
}

Result<ShiftList> shiftsFromJson(const json::JsonValue& doc) {
    return intervalListFromJson(doc);
}

json::JsonValue shiftsToJson(const ShiftList& shifts) {
    json::JsonArray arr;
    arr.reserve(shifts.size());
    for (const auto& s : shifts) {
        json::JsonObject obj;
        obj[kKeyUser] = s.user;
        obj[kKeyStart] = time_utils::formatTimestamp(s.start);
        obj[kKeyEnd] = time_utils::formatTimestamp(s.end);
        arr.push_back(json::JsonValue(std::move(obj)));
    }
    return json::JsonValue(std::move(arr));
}

Result<RotationRule> parseRule(std::string_view text) {
    auto doc = parseJsonText(text, "rotation rule");
    if (doc.isError()) return Err<RotationRule>(doc.error());
    return ruleFromJson(*doc);
}

Result<OverrideList> parseOverrides(std::string_view text) {
    auto doc = parseJsonText(text, "overrides");
    if (doc.isError()) return Err<OverrideList>(doc.error());
    return overridesFromJson(*doc);
}

Result<RotationRule> loadRule(const std::filesystem::path& path) {
    auto text = readTextFile(path);
    if (text.isError()) return Err<RotationRule>(text.error());
    ONCALL_LOG_DEBUG(kComponent, "Loading rotation rule from " + path.string());
    return parseRule(*text).withContext(path.string());
}

Result<OverrideList> loadOverrides(const std::filesystem::path& path) {
    auto text = readTextFile(path);
    if (text.isError()) return Err<OverrideList>(text.error());
    ONCALL_LOG_DEBUG(kComponent, "Loading overrides from " + path.string());
    return parseOverrides(*text).withContext(path.string());
}

std::string formatTable(const ShiftList& shifts) {
    std::size_t userWidth = 4;  // "USER"
    for (const auto& s : shifts) userWidth = std::max(userWidth, s.user.size());

    std::ostringstream oss;
    oss << std::left << std::setw(static_cast<int>(userWidth)) << "USER" << "  "
        << std::setw(static_cast<int>(time_utils::kTimestampLength)) << "START" << "  "
        << "END" << "\n";
    for (const auto& s : shifts) {
        oss << std::setw(static_cast<int>(userWidth)) << s.user << "  "
            << time_utils::formatTimestamp(s.start) << "  "
            << time_utils::formatTimestamp(s.end) << "\n";
    }
    return oss.str();
}

} // namespace io
} // namespace oncall
