/**
 * @file test_schedule_io.cpp
 * @brief Tests for timestamps, JSON documents, fixtures, configuration and arguments
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "test_framework.hpp"
#include "fixture_runner.hpp"
#include "oncall_args.hpp"
#include "oncall_config.hpp"
#include "oncall_json.hpp"
#include "oncall_time_utils.hpp"
#include "schedule_io.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace oncall;
using namespace oncall::testing;

namespace {

TimePoint ts(const char* text) {
    return time_utils::parseTimestamp(text).value();
}

// Temp file removed on scope exit
class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path_);
        out << content;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

const char* kWeeklyRule = R"({
    "users": ["alice", "bob"],
    "handover_start_at": "2023-01-01T00:00:00Z",
    "handover_interval_days": 7
})";

} // namespace

//=============================================================================
// Timestamps
//=============================================================================

TEST_CASE_SUITE(ParsesCanonicalForm, Time) {
    auto tp = time_utils::parseTimestamp("2023-01-01T00:00:00Z");
    REQUIRE_OK(tp);
    REQUIRE_EQ(time_utils::toUnixSeconds(*tp), 1672531200);
}

TEST_CASE_SUITE(FormatsEpochAndBeforeEpoch, Time) {
    REQUIRE_EQ(time_utils::formatTimestamp(time_utils::fromUnixSeconds(0)), "1970-01-01T00:00:00Z");
    REQUIRE_EQ(time_utils::formatTimestamp(time_utils::fromUnixSeconds(-1)), "1969-12-31T23:59:59Z");
}

TEST_CASE_SUITE(FormatMatchesParse, Time) {
    for (const char* text : {"2024-02-29T23:59:59Z", "1999-12-31T12:34:56Z", "2100-03-01T00:00:00Z"}) {
        REQUIRE_EQ(time_utils::formatTimestamp(ts(text)), text);
    }
}

TEST_CASE_SUITE(RoundTripsOutsideNanosecondClockRange, Time) {
    auto farFuture = time_utils::parseTimestamp("2300-01-01T00:00:00Z");
    REQUIRE_OK(farFuture);
    REQUIRE_EQ(time_utils::toUnixSeconds(*farFuture), 10413792000LL);
    for (const char* text : {"2300-01-01T00:00:00Z", "9999-12-31T23:59:59Z",
                             "0001-01-01T00:00:00Z", "1600-02-29T12:00:00Z"}) {
        REQUIRE_EQ(time_utils::formatTimestamp(ts(text)), text);
    }
    REQUIRE(ts("1600-01-01T00:00:00Z") < ts("1970-01-01T00:00:00Z"));
    REQUIRE(ts("2262-04-12T00:00:00Z") < ts("2300-01-01T00:00:00Z"));
}

TEST_CASE_SUITE(LeapDayRules, Time) {
    REQUIRE(time_utils::isTimestamp("2024-02-29T00:00:00Z"));
    REQUIRE(time_utils::isTimestamp("2000-02-29T00:00:00Z"));
    REQUIRE_FALSE(time_utils::isTimestamp("2023-02-29T00:00:00Z"));
    REQUIRE_FALSE(time_utils::isTimestamp("1900-02-29T00:00:00Z"));
}

TEST_CASE_SUITE(RejectsMalformedTimestamps, Time) {
    for (const char* bad : {"", "2023-01-01", "2023-01-01 00:00:00Z", "2023-01-01T00:00:00z",
                            "2023-01-01T00:00:00+00:00", "2023-13-01T00:00:00Z",
                            "2023-00-10T00:00:00Z", "2023-04-31T00:00:00Z", "2023-01-01T24:00:00Z",
                            "2023-01-01T00:60:00Z", "2023-01-01T00:00:60Z", "2023-0a-01T00:00:00Z",
                            "2023-01-01T00:00:00.5Z"}) {
        auto r = time_utils::parseTimestamp(bad);
        REQUIRE_ERROR(r, ErrorCode::MALFORMED_TIMESTAMP);
    }
}

TEST_CASE_SUITE(AddDaysIsExact, Time) {
    const TimePoint start = ts("2023-03-25T10:00:00Z");
    REQUIRE_EQ(time_utils::formatTimestamp(time_utils::addDays(start, 7)), "2023-04-01T10:00:00Z");
    REQUIRE_EQ(time_utils::formatTimestamp(time_utils::addDays(start, -25)), "2023-02-28T10:00:00Z");
}

//=============================================================================
// JSON
//=============================================================================

TEST_CASE_SUITE(ParsesNestedDocument, Json) {
    auto doc = json::parse(R"({"a": [1, 2.5, "x", true, null], "b": {"c": "\u00e9"}})");
    REQUIRE(doc.isObject());
    REQUIRE_EQ(doc.find("a")->size(), 5u);
    REQUIRE_EQ(doc.find("a")->asArray()[1].asNumber(), 2.5);
    REQUIRE(doc.find("a")->asArray()[4].isNull());
    REQUIRE_EQ(doc.find("b")->find("c")->asString(), "\xc3\xa9");
    REQUIRE(doc.find("missing") == nullptr);
}

TEST_CASE_SUITE(RejectsInvalidJson, Json) {
    REQUIRE_THROWS_AS(json::parse("{"), json::JsonParseError);
    REQUIRE_THROWS_AS(json::parse("[1,]"), json::JsonParseError);
    REQUIRE_THROWS_AS(json::parse("{\"a\": 01}"), json::JsonParseError);
    REQUIRE_THROWS_AS(json::parse("[1] trailing"), json::JsonParseError);
}

TEST_CASE_SUITE(DumpIsParseable, Json) {
    json::JsonObject obj;
    obj["name"] = "quote\"and\\slash";
    obj["n"] = 3;
    json::JsonValue value(obj);
    REQUIRE_EQ(value.dump(), R"({"n":3,"name":"quote\"and\\slash"})");
    REQUIRE(json::parse(value.dump(2)) == value);
}

//=============================================================================
// Schedule Documents
//=============================================================================

TEST_CASE_SUITE(ParsesRotationRule, Documents) {
    auto rule = io::parseRule(kWeeklyRule);
    REQUIRE_OK(rule);
    REQUIRE_SIZE(rule->users, 2u);
    REQUIRE_EQ(rule->users[1], "bob");
    REQUIRE_EQ(rule->interval_days, 7);
    REQUIRE_EQ(time_utils::formatTimestamp(rule->anchor_start), "2023-01-01T00:00:00Z");
}

TEST_CASE_SUITE(RuleFieldErrors, Documents) {
    REQUIRE_ERROR(io::parseRule(R"({"users": ["a"], "handover_interval_days": 7})"),
                  ErrorCode::CONFIG_MISSING);
    REQUIRE_ERROR(io::parseRule(R"({"users": "a", "handover_start_at": "2023-01-01T00:00:00Z",
                                    "handover_interval_days": 7})"),
                  ErrorCode::CONFIG_INVALID);
    REQUIRE_ERROR(io::parseRule(R"({"users": ["a", 3], "handover_start_at": "2023-01-01T00:00:00Z",
                                    "handover_interval_days": 7})"),
                  ErrorCode::CONFIG_INVALID);
    REQUIRE_ERROR(io::parseRule(R"({"users": ["a"], "handover_start_at": "2023-01-01T00:00:00Z",
                                    "handover_interval_days": 1.5})"),
                  ErrorCode::CONFIG_INVALID);
    REQUIRE_ERROR(io::parseRule(R"({"users": ["a"], "handover_start_at": "2023-01-01",
                                    "handover_interval_days": 7})"),
                  ErrorCode::MALFORMED_TIMESTAMP);
    REQUIRE_ERROR(io::parseRule("[1, 2"), ErrorCode::CONFIG_PARSE_ERROR);
}

TEST_CASE_SUITE(RuleSemanticsLeftToEngine, Documents) {
    // Empty users and zero intervals are well-formed documents
    auto rule = io::parseRule(R"({"users": [], "handover_start_at": "2023-01-01T00:00:00Z",
                                  "handover_interval_days": 0})");
    REQUIRE_OK(rule);
    REQUIRE_EMPTY(rule->users);
    REQUIRE_EQ(rule->interval_days, 0);
}

TEST_CASE_SUITE(ErrorNamesMissingKey, Documents) {
    auto rule = io::parseRule(R"({"users": ["a"], "handover_start_at": "2023-01-01T00:00:00Z"})");
    REQUIRE_ERROR(rule, ErrorCode::CONFIG_MISSING);
    REQUIRE_CONTAINS(rule.error().toString(), "handover_interval_days");
}

TEST_CASE_SUITE(ParsesOverrides, Documents) {
    auto overrides = io::parseOverrides(R"([
        {"user": "carol", "start_at": "2023-01-03T00:00:00Z", "end_at": "2023-01-05T00:00:00Z"}
    ])");
    REQUIRE_OK(overrides);
    REQUIRE_SIZE(*overrides, 1u);
    REQUIRE_EQ(overrides->front().user, "carol");
    REQUIRE_EQ(time_utils::formatTimestamp(overrides->front().end), "2023-01-05T00:00:00Z");

    auto empty = io::parseOverrides("[]");
    REQUIRE_OK(empty);
    REQUIRE_EMPTY(*empty);
}

TEST_CASE_SUITE(OverrideErrorNamesElement, Documents) {
    auto overrides = io::parseOverrides(R"([
        {"user": "carol", "start_at": "2023-01-03T00:00:00Z", "end_at": "2023-01-05T00:00:00Z"},
        {"user": "dave", "start_at": "2023-01-06T00:00:00Z"}
    ])");
    REQUIRE_ERROR(overrides, ErrorCode::CONFIG_MISSING);
    REQUIRE_CONTAINS(overrides.error().context, "element 1");
    REQUIRE_ERROR(io::parseOverrides(R"({"user": "carol"})"), ErrorCode::CONFIG_INVALID);
}

TEST_CASE_SUITE(ShiftsJsonShape, Documents) {
    ShiftList shifts{Shift{"alice", ts("2023-01-01T00:00:00Z"), ts("2023-01-08T00:00:00Z")}};
    const std::string text = io::shiftsToJson(shifts).dump();
    REQUIRE_EQ(text, R"([{"end_at":"2023-01-08T00:00:00Z","start_at":"2023-01-01T00:00:00Z","user":"alice"}])");

    auto back = io::shiftsFromJson(json::parse(text));
    REQUIRE_OK(back);
    REQUIRE(*back == shifts);
}

TEST_CASE_SUITE(TableLayout, Documents) {
    ShiftList shifts{Shift{"alice", ts("2023-01-01T00:00:00Z"), ts("2023-01-08T00:00:00Z")},
                     Shift{"bo", ts("2023-01-08T00:00:00Z"), ts("2023-01-15T00:00:00Z")}};
    std::istringstream table(io::formatTable(shifts));
    std::string header, first, second;
    std::getline(table, header);
    std::getline(table, first);
    std::getline(table, second);
    REQUIRE_EQ(header.rfind("USER   START", 0), 0u);
    REQUIRE_EQ(first, "alice  2023-01-01T00:00:00Z  2023-01-08T00:00:00Z");
    REQUIRE_EQ(second, "bo     2023-01-08T00:00:00Z  2023-01-15T00:00:00Z");
}

TEST_CASE_SUITE(LoadsFromFiles, Documents) {
    TempFile file("oncall_test_rule.json", kWeeklyRule);
    auto rule = io::loadRule(file.path());
    REQUIRE_OK(rule);
    REQUIRE_EQ(rule->users.front(), "alice");

    auto missing = io::loadRule(std::filesystem::temp_directory_path() / "oncall_no_such_file.json");
    REQUIRE_ERROR(missing, ErrorCode::IO_ERROR);
}

//=============================================================================
// Fixtures
//=============================================================================

TEST_CASE_SUITE(PassingFixture, Fixture) {
    auto fx = fixture::parseFixture(R"({
        "schedule": {"users": ["A", "B"], "handover_start_at": "2023-01-01T00:00:00Z",
                     "handover_interval_days": 7},
        "overrides": [{"user": "C", "start_at": "2023-01-03T00:00:00Z", "end_at": "2023-01-05T00:00:00Z"}],
        "from": "2023-01-01T00:00:00Z",
        "until": "2023-01-15T00:00:00Z",
        "expected": [
            {"user": "A", "start_at": "2023-01-01T00:00:00Z", "end_at": "2023-01-03T00:00:00Z"},
            {"user": "C", "start_at": "2023-01-03T00:00:00Z", "end_at": "2023-01-05T00:00:00Z"},
            {"user": "A", "start_at": "2023-01-05T00:00:00Z", "end_at": "2023-01-08T00:00:00Z"},
            {"user": "B", "start_at": "2023-01-08T00:00:00Z", "end_at": "2023-01-15T00:00:00Z"}
        ]
    })", "split");
    REQUIRE_OK(fx);
    REQUIRE(fx->request.overrides.has_value());
    auto report = fixture::runFixture(*fx);
    REQUIRE(report.passed);
    REQUIRE_EQ(report.describe(), "split: PASS");
}

TEST_CASE_SUITE(MismatchReportsFirstDifference, Fixture) {
    auto fx = fixture::parseFixture(R"({
        "schedule": {"users": ["A", "B"], "handover_start_at": "2023-01-01T00:00:00Z",
                     "handover_interval_days": 7},
        "until": "2023-01-15T00:00:00Z",
        "expected": [
            {"user": "A", "start_at": "2023-01-01T00:00:00Z", "end_at": "2023-01-08T00:00:00Z"},
            {"user": "A", "start_at": "2023-01-08T00:00:00Z", "end_at": "2023-01-15T00:00:00Z"}
        ]
    })", "wrong-user");
    REQUIRE_OK(fx);
    REQUIRE_FALSE(fx->request.from.has_value());
    auto report = fixture::runFixture(*fx);
    REQUIRE_FALSE(report.passed);
    REQUIRE(report.first_mismatch.has_value());
    REQUIRE_EQ(*report.first_mismatch, 1u);
    REQUIRE_CONTAINS(report.describe(), "first difference at index 1");
}

TEST_CASE_SUITE(ShorterOutputIsMismatch, Fixture) {
    auto fx = fixture::parseFixture(R"({
        "schedule": {"users": ["A"], "handover_start_at": "2023-01-01T00:00:00Z",
                     "handover_interval_days": 7},
        "until": "2023-01-08T00:00:00Z",
        "expected": [
            {"user": "A", "start_at": "2023-01-01T00:00:00Z", "end_at": "2023-01-08T00:00:00Z"},
            {"user": "A", "start_at": "2023-01-08T00:00:00Z", "end_at": "2023-01-15T00:00:00Z"}
        ]
    })", "short");
    REQUIRE_OK(fx);
    auto report = fixture::runFixture(*fx);
    REQUIRE_FALSE(report.passed);
    REQUIRE_EQ(*report.first_mismatch, 1u);
    REQUIRE_CONTAINS(report.describe(), "(none)");
}

TEST_CASE_SUITE(ExpectedErrorFixture, Fixture) {
    const char* text = R"({
        "schedule": {"users": [], "handover_start_at": "2023-01-01T00:00:00Z",
                     "handover_interval_days": 7},
        "until": "2023-01-15T00:00:00Z",
        "expected_error": "EMPTY_USER_SET"
    })";
    auto fx = fixture::parseFixture(text, "no-users");
    REQUIRE_OK(fx);
    REQUIRE(fx->expected_error == ErrorCode::EMPTY_USER_SET);
    auto report = fixture::runFixture(*fx);
    REQUIRE(report.passed);
    REQUIRE(report.actual_error.has_value());
}

TEST_CASE_SUITE(WrongExpectedErrorFails, Fixture) {
    auto fx = fixture::parseFixture(R"({
        "schedule": {"users": [], "handover_start_at": "2023-01-01T00:00:00Z",
                     "handover_interval_days": 7},
        "until": "2023-01-15T00:00:00Z",
        "expected_error": "NON_POSITIVE_INTERVAL"
    })", "wrong-error");
    REQUIRE_OK(fx);
    auto report = fixture::runFixture(*fx);
    REQUIRE_FALSE(report.passed);
    REQUIRE_CONTAINS(report.describe(), "expected NON_POSITIVE_INTERVAL");
}

TEST_CASE_SUITE(MalformedFixtures, Fixture) {
    REQUIRE_ERROR(fixture::parseFixture("[]", "array"), ErrorCode::CONFIG_INVALID);
    REQUIRE_ERROR(fixture::parseFixture(R"({"until": "2023-01-15T00:00:00Z", "expected": []})", "no-schedule"),
                  ErrorCode::CONFIG_MISSING);
    REQUIRE_ERROR(fixture::parseFixture(R"({
        "schedule": {"users": ["A"], "handover_start_at": "2023-01-01T00:00:00Z",
                     "handover_interval_days": 7},
        "until": "2023-01-15T00:00:00Z"
    })", "no-expected"), ErrorCode::CONFIG_MISSING);
    REQUIRE_ERROR(fixture::parseFixture(R"({
        "schedule": {"users": ["A"], "handover_start_at": "2023-01-01T00:00:00Z",
                     "handover_interval_days": 7},
        "until": "2023-01-15T00:00:00Z",
        "expected_error": "NOT_A_CODE"
    })", "bad-code"), ErrorCode::CONFIG_INVALID);
}

TEST_CASE_SUITE(ErrorCodeNames, Fixture) {
    REQUIRE(fixture::errorCodeFromString("OVERLAPPING_OVERRIDES") == ErrorCode::OVERLAPPING_OVERRIDES);
    REQUIRE(fixture::errorCodeFromString("MALFORMED_TIMESTAMP") == ErrorCode::MALFORMED_TIMESTAMP);
    REQUIRE_FALSE(fixture::errorCodeFromString("overlapping_overrides").has_value());
}

TEST_CASE_SUITE(LoadFixtureUsesFileName, Fixture) {
    TempFile file("oncall_fixture_single.json", R"({
        "schedule": {"users": ["A"], "handover_start_at": "2023-01-01T00:00:00Z",
                     "handover_interval_days": 1},
        "until": "2023-01-03T00:00:00Z",
        "expected": [
            {"user": "A", "start_at": "2023-01-01T00:00:00Z", "end_at": "2023-01-02T00:00:00Z"},
            {"user": "A", "start_at": "2023-01-02T00:00:00Z", "end_at": "2023-01-03T00:00:00Z"}
        ]
    })");
    auto fx = fixture::loadFixture(file.path());
    REQUIRE_OK(fx);
    REQUIRE_EQ(fx->name, "oncall_fixture_single.json");
    REQUIRE(fixture::runFixture(*fx).passed);
}

//=============================================================================
// Configuration
//=============================================================================

TEST_CASE_SUITE(Defaults, Config) {
    AppConfig config;
    REQUIRE_EQ(config.log_level, "ERROR");
    REQUIRE(config.output_format == OutputFormat::JSON);
    REQUIRE_OK(config.validate());
    REQUIRE_EQ(config.toMap().at("output_format"), "json");
}

TEST_CASE_SUITE(LoadsKeyValueLines, Config) {
    std::istringstream in(
        "# oncall settings\n"
        "log_level = DEBUG\n"
        "\n"
        "output_format=Table\n"
        "log_to_console = off\n"
        "json_indent = 4\n");
    AppConfig config;
    REQUIRE_OK(config.load(in, "test.conf"));
    REQUIRE_EQ(config.log_level, "DEBUG");
    REQUIRE(config.output_format == OutputFormat::TABLE);
    REQUIRE_FALSE(config.log_to_console);
    REQUIRE_EQ(config.json_indent, 4);
}

TEST_CASE_SUITE(ReportsBadLines, Config) {
    AppConfig config;
    std::istringstream noEquals("log_level DEBUG\n");
    auto r1 = config.load(noEquals, "a.conf");
    REQUIRE_ERROR(r1, ErrorCode::CONFIG_PARSE_ERROR);
    REQUIRE_EQ(r1.error().context, "a.conf:1");

    std::istringstream unknownKey("# header\ncolour = blue\n");
    auto r2 = config.load(unknownKey, "b.conf");
    REQUIRE_ERROR(r2, ErrorCode::CONFIG_INVALID);
    REQUIRE_EQ(r2.error().context, "b.conf:2");

    REQUIRE_ERROR(config.setFromString("json_indent", "4x"), ErrorCode::CONFIG_INVALID);
    REQUIRE_ERROR(config.setFromString("output_format", "xml"), ErrorCode::CONFIG_INVALID);
    REQUIRE_ERROR(config.setFromString("log_to_console", "maybe"), ErrorCode::CONFIG_INVALID);
}

TEST_CASE_SUITE(ValidateCollectsAllProblems, Config) {
    AppConfig config;
    config.log_level = "LOUD";
    config.json_indent = 40;
    auto r = config.validate();
    REQUIRE_ERROR(r, ErrorCode::CONFIG_INVALID);
    REQUIRE_CONTAINS(r.error().message, "log_level");
    REQUIRE_CONTAINS(r.error().message, "json_indent");
}

TEST_CASE_SUITE(MissingFile, Config) {
    AppConfig config;
    REQUIRE_ERROR(config.loadFromFile(std::filesystem::temp_directory_path() / "oncall_missing.conf"),
                  ErrorCode::IO_ERROR);
}

TEST_CASE_SUITE(LogLevelNames, Config) {
    REQUIRE(parseLogLevel("warn") == LogLevel::LOG_WARNING);
    REQUIRE(parseLogLevel("WARNING") == LogLevel::LOG_WARNING);
    REQUIRE(parseLogLevel("trace") == LogLevel::LOG_TRACE);
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());
}

//=============================================================================
// Arguments
//=============================================================================

namespace {

args::ArgParser testParser() {
    args::ArgParser parser("oncall");
    parser.addOption("schedule", 's', "Rule file", "FILE")
          .addOption("until", 'u', "Window end", "TS")
          .addFlag("verbose", 'v', "More logging")
          .addMulti("self-test", '\0', "Fixture", "FIXTURE");
    return parser;
}

} // namespace

TEST_CASE_SUITE(LongAndShortForms, Args) {
    auto cli = testParser().parse({"--schedule", "rule.json", "-u2023-01-15T00:00:00Z", "-v"});
    REQUIRE(cli.success());
    REQUIRE_EQ(cli["schedule"].asString(), "rule.json");
    REQUIRE_EQ(cli["until"].asString(), "2023-01-15T00:00:00Z");
    REQUIRE(cli.has("verbose"));
    REQUIRE_FALSE(cli.has("self-test"));
}

TEST_CASE_SUITE(InlineValueAndRepeats, Args) {
    auto cli = testParser().parse({"--schedule=a.json", "--self-test", "x.json",
                                   "--self-test=y.json", "--", "-v"});
    REQUIRE(cli.success());
    REQUIRE_EQ(cli["schedule"].asString(), "a.json");
    REQUIRE_SIZE(cli["self-test"].values(), 2u);
    REQUIRE_EQ(cli["self-test"].values()[1], "y.json");
    REQUIRE_SIZE(cli.positional(), 1u);
    REQUIRE_EQ(cli.positional()[0], "-v");
}

TEST_CASE_SUITE(UsageErrors, Args) {
    REQUIRE_CONTAINS(testParser().parse({"--bogus"}).error(), "Unknown option");
    REQUIRE_CONTAINS(testParser().parse({"--schedule"}).error(), "requires a value");
    REQUIRE_CONTAINS(testParser().parse({"--verbose=yes"}).error(), "does not take a value");
}

TEST_CASE_SUITE(HelpListsOptions, Args) {
    auto parser = testParser();
    REQUIRE(parser.parse({"-h"}).has("help"));
    const std::string help = parser.help();
    REQUIRE_CONTAINS(help, "--schedule FILE");
    REQUIRE_CONTAINS(help, "(repeatable)");
}

int main(int argc, char* argv[]) {
    std::string filter;
    if (argc > 1) filter = argv[1];
    return TestRunner::instance().run(filter);
}
