/**
 * @file fixture_runner.hpp
 * @brief Self-test of the schedule pipeline against JSON fixtures
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * A fixture is a JSON object:
 * {
 *   "schedule":  <rule document>,
 *   "overrides": <override document>,        (optional)
 *   "from":      TS,                          (optional, default: anchor)
 *   "until":     TS,
 *   "expected":  <shift document>             (or "expected_error": CODE)
 * }
 */
#ifndef ONCALL_FIXTURE_RUNNER_HPP
#define ONCALL_FIXTURE_RUNNER_HPP

#include "oncall_json.hpp"
#include "result.hpp"
#include "schedule_engine.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace oncall {
namespace fixture {

struct Fixture {
    std::string name;
    ScheduleRequest request;
    ShiftList expected;
    std::optional<ErrorCode> expected_error;
};

struct FixtureReport {
    std::string name;
    ShiftList expected;
    ShiftList actual;
    std::optional<ErrorCode> expected_error;
    std::optional<Error> actual_error;
    std::optional<std::size_t> first_mismatch;  // index into expected/actual
    bool passed = false;

    /**
     * @brief Human-readable verdict, with the first differing shift on failure
     */
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] std::optional<ErrorCode> errorCodeFromString(const std::string& name);

[[nodiscard]] Result<Fixture> fixtureFromJson(const json::JsonValue& doc, const std::string& name);
[[nodiscard]] Result<Fixture> parseFixture(std::string_view text, const std::string& name);
[[nodiscard]] Result<Fixture> loadFixture(const std::filesystem::path& path);

/**
 * @brief Run the pipeline on a fixture and compare structurally
 *
 * Never fails itself: pipeline errors are recorded in the report and
 * count as a pass only when they match expected_error.
 */
[[nodiscard]] FixtureReport runFixture(const Fixture& fixture);

} // namespace fixture
} // namespace oncall

#endif // ONCALL_FIXTURE_RUNNER_HPP
