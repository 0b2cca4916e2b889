/**
 * @file fixture_runner.cpp
 * @brief Fixture self-test implementation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "fixture_runner.hpp"
#include "oncall_logger.hpp"
#include "schedule_io.hpp"

#include <algorithm>
#include <sstream>

namespace oncall {
namespace fixture {

namespace {

constexpr const char* kComponent = "FixtureRunner";

constexpr ErrorCode kKnownCodes[] = {
    ErrorCode::UNKNOWN_ERROR, ErrorCode::INVALID_ARGUMENT, ErrorCode::INTERNAL_ERROR,
    ErrorCode::MALFORMED_TIMESTAMP, ErrorCode::EMPTY_USER_SET, ErrorCode::NON_POSITIVE_INTERVAL,
    ErrorCode::INVALID_INTERVAL, ErrorCode::OVERLAPPING_OVERRIDES, ErrorCode::IO_ERROR,
    ErrorCode::CONFIG_INVALID, ErrorCode::CONFIG_MISSING, ErrorCode::CONFIG_PARSE_ERROR,
    ErrorCode::FIXTURE_MISMATCH,
};

std::string shiftOrNone(const ShiftList& list, std::size_t i) {
    if (i >= list.size()) return "(none)";
    std::ostringstream oss;
    oss << list[i];
    return oss.str();
}

} // namespace

std::optional<ErrorCode> errorCodeFromString(const std::string& name) {
    for (ErrorCode code : kKnownCodes) {
        if (errorCodeToString(code) == name) return code;
    }
    return std::nullopt;
}

Result<Fixture> fixtureFromJson(const json::JsonValue& doc, const std::string& name) {
    if (!doc.isObject()) {
        return Err<Fixture>(Error{ErrorCode::CONFIG_INVALID, "Fixture must be a JSON object", name});
    }

    Fixture fx;
    fx.name = name;

    const json::JsonValue* schedule = doc.find("schedule");
    if (schedule == nullptr) {
        return Err<Fixture>(Error{ErrorCode::CONFIG_MISSING, "Missing 'schedule'", name});
    }
    auto rule = io::ruleFromJson(*schedule);
    if (rule.isError()) return Err<Fixture>(rule.error()).withContext(name + ": schedule");
    fx.request.rule = std::move(rule.value());

    if (const json::JsonValue* overrides = doc.find("overrides"); overrides && !overrides->isNull()) {
        auto parsed = io::overridesFromJson(*overrides);
        if (parsed.isError()) return Err<Fixture>(parsed.error()).withContext(name + ": overrides");
        fx.request.overrides = std::move(parsed.value());
    }

    if (const json::JsonValue* from = doc.find("from"); from && !from->isNull()) {
        auto ts = io::timestampField(doc, "from");
        if (ts.isError()) return Err<Fixture>(ts.error()).withContext(name);
        fx.request.from = *ts;
    }

    auto until = io::timestampField(doc, "until");
    if (until.isError()) return Err<Fixture>(until.error()).withContext(name);
    fx.request.until = *until;

    if (const json::JsonValue* code = doc.find("expected_error")) {
        auto codeName = code->getString();
        auto parsedCode = codeName ? errorCodeFromString(*codeName) : std::nullopt;
        if (!parsedCode) {
            return Err<Fixture>(Error{ErrorCode::CONFIG_INVALID, "Unknown 'expected_error'", name});
        }
        fx.expected_error = parsedCode;
        return fx;
    }

    const json::JsonValue* expected = doc.find("expected");
    if (expected == nullptr) {
        return Err<Fixture>(Error{ErrorCode::CONFIG_MISSING,
                                  "Missing 'expected' or 'expected_error'", name});
    }
    auto shifts = io::shiftsFromJson(*expected);
    if (shifts.isError()) return Err<Fixture>(shifts.error()).withContext(name + ": expected");
    fx.expected = std::move(shifts.value());
    return fx;
}

Result<Fixture> parseFixture(std::string_view text, const std::string& name) {
    auto doc = io::parseJsonText(text, name);
    if (doc.isError()) return Err<Fixture>(doc.error());
    return fixtureFromJson(*doc, name);
}

Result<Fixture> loadFixture(const std::filesystem::path& path) {
    auto text = io::readTextFile(path);
    if (text.isError()) return Err<Fixture>(text.error());
    return parseFixture(*text, path.filename().string());
}

FixtureReport runFixture(const Fixture& fixture) {
    FixtureReport report;
    report.name = fixture.name;
    report.expected = fixture.expected;
    report.expected_error = fixture.expected_error;

    auto result = compute(fixture.request);
    if (result.isError()) {
        report.actual_error = result.error();
        report.passed = fixture.expected_error && result.error().is(*fixture.expected_error);
    } else {
        report.actual = std::move(result.value());
        if (!fixture.expected_error) {
            auto diff = std::mismatch(report.expected.begin(), report.expected.end(),
                                      report.actual.begin(), report.actual.end());
            if (diff.first != report.expected.end() || diff.second != report.actual.end()) {
                report.first_mismatch =
                    static_cast<std::size_t>(diff.first - report.expected.begin());
            }
            report.passed = !report.first_mismatch;
        }
    }

    ONCALL_LOG_DEBUG(kComponent, report.describe());
    return report;
}

std::string FixtureReport::describe() const {
    std::ostringstream oss;
    oss << name << ": " << (passed ? "PASS" : "FAIL");
    if (passed) return oss.str();

    if (expected_error && !actual_error) {
        oss << " - expected error " << errorCodeToString(*expected_error)
            << ", got " << actual.size() << " shifts";
    } else if (actual_error) {
        oss << " - " << actual_error->toString();
        if (expected_error) oss << " (expected " << errorCodeToString(*expected_error) << ")";
    } else if (first_mismatch) {
        const std::size_t i = *first_mismatch;
        oss << " - first difference at index " << i
            << "\n    expected: " << shiftOrNone(expected, i)
            << "\n    actual:   " << shiftOrNone(actual, i)
            << "\n    (" << expected.size() << " expected, " << actual.size() << " actual)";
    }
    return oss.str();
}

} // namespace fixture
} // namespace oncall
