/**
 * @file schedule_io.hpp
 * @brief Loading and rendering of schedule documents
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Document formats:
 * - Rule:      {"users": [..], "handover_start_at": TS, "handover_interval_days": N}
 * - Overrides: [{"user": .., "start_at": TS, "end_at": TS}, ...]
 * - Shifts:    same shape as overrides
 *
 * TS is YYYY-MM-DDTHH:MM:SSZ. Unknown keys are ignored.
 */
#ifndef ONCALL_SCHEDULE_IO_HPP
#define ONCALL_SCHEDULE_IO_HPP

#include "oncall_json.hpp"
#include "oncall_types.hpp"
#include "result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace oncall {
namespace io {

// Document keys
inline constexpr const char* kKeyUsers = "users";
inline constexpr const char* kKeyHandoverStart = "handover_start_at";
inline constexpr const char* kKeyHandoverInterval = "handover_interval_days";
inline constexpr const char* kKeyUser = "user";
inline constexpr const char* kKeyStart = "start_at";
inline constexpr const char* kKeyEnd = "end_at";

/**
 * @brief Read a whole file
 * @return File contents or IO_ERROR
 */
[[nodiscard]] Result<std::string> readTextFile(const std::filesystem::path& path);

/**
 * @brief Parse JSON text, mapping parse failures to CONFIG_PARSE_ERROR
 * @param text JSON document
 * @param source Name used in error context (file path or description)
 */
[[nodiscard]] Result<json::JsonValue> parseJsonText(std::string_view text,
                                                    const std::string& source = "<input>");

[[nodiscard]] Result<RotationRule> ruleFromJson(const json::JsonValue& doc);
[[nodiscard]] Result<OverrideList> overridesFromJson(const json::JsonValue& doc);
[[nodiscard]] Result<ShiftList> shiftsFromJson(const json::JsonValue& doc);
[[nodiscard]] json::JsonValue shiftsToJson(const ShiftList& shifts);

[[nodiscard]] Result<RotationRule> parseRule(std::string_view text);
[[nodiscard]] Result<OverrideList> parseOverrides(std::string_view text);

[[nodiscard]] Result<RotationRule> loadRule(const std::filesystem::path& path);
[[nodiscard]] Result<OverrideList> loadOverrides(const std::filesystem::path& path);

/**
 * @brief Read a required timestamp member of a JSON object
 * @return MALFORMED_TIMESTAMP or CONFIG_INVALID with the key as context
 */
[[nodiscard]] Result<TimePoint> timestampField(const json::JsonValue& obj, const std::string& key);

/**
 * @brief Render shifts as an aligned text table (USER / START / END)
 */
[[nodiscard]] std::string formatTable(const ShiftList& shifts);

} // namespace io
} // namespace oncall

#endif // ONCALL_SCHEDULE_IO_HPP
