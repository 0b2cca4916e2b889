/**
 * @file main.cpp
 * @brief oncall command-line entry point
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */

#include "fixture_runner.hpp"
#include "oncall_args.hpp"
#include "oncall_config.hpp"
#include "oncall_logger.hpp"
#include "schedule_engine.hpp"
#include "schedule_io.hpp"

#include <iostream>
#include <string>

using namespace oncall;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitMismatch = 3;

args::ArgParser makeParser() {
    args::ArgParser parser("oncall",
        "Compute an on-call rotation schedule, applying manual overrides,\n"
        "for the window [--from, --until). Timestamps are YYYY-MM-DDTHH:MM:SSZ.");
    parser.addOption("schedule", 's', "Rotation rule JSON file", "FILE")
          .addOption("overrides", 'o', "Override intervals JSON file", "FILE")
          .addOption("from", 'f', "Window start (default: rotation anchor)", "TS")
          .addOption("until", 'u', "Window end, exclusive", "TS")
          .addOption("format", '\0', "Output format: json or table", "FMT")
          .addOption("config", 'c', "Settings file (key=value lines)", "FILE")
          .addOption("log-level", '\0', "TRACE, DEBUG, INFO, WARN, ERROR or FATAL", "LEVEL")
          .addFlag("verbose", 'v', "Same as --log-level DEBUG")
          .addMulti("self-test", '\0', "Run a fixture and compare with its expected output", "FIXTURE");
    return parser;
}

int reportError(const Error& err) {
    std::cerr << "oncall: " << err.toString() << "\n";
    return kExitError;
}

Result<AppConfig> buildConfig(const args::ParseResult& cli) {
    AppConfig config;
    if (cli.has("config")) {
        if (auto loaded = config.loadFromFile(cli["config"].asString()); loaded.isError()) {
            return Err<AppConfig>(loaded.error());
        }
    }

    // Command-line flags take precedence over the file
    if (cli.has("format")) {
        if (auto r = config.setFromString("output_format", cli["format"].asString()); r.isError()) {
            return Err<AppConfig>(r.error());
        }
    }
    if (cli.has("log-level")) {
        if (auto r = config.setFromString("log_level", cli["log-level"].asString()); r.isError()) {
            return Err<AppConfig>(r.error());
        }
    }
    if (cli.has("verbose")) config.log_level = "DEBUG";

    if (auto valid = config.validate(); valid.isError()) {
        return Err<AppConfig>(valid.error());
    }
    return config;
}

void configureLogging(const AppConfig& config) {
    Logger& logger = Logger::instance();
    logger.setLevel(parseLogLevel(config.log_level).value_or(LogLevel::LOG_ERROR));
    logger.setConsoleOutput(config.log_to_console);
    if (!config.log_directory.empty() && !logger.initialize(config.log_directory)) {
        ONCALL_LOG_WARNING("oncall", "Cannot open log directory " + config.log_directory);
    }
}

int runSelfTests(const std::vector<std::string>& paths) {
    int failed = 0;
    int broken = 0;
    for (const auto& path : paths) {
        auto fx = fixture::loadFixture(path);
        if (fx.isError()) {
            std::cerr << "oncall: cannot load fixture " << path << ": " << fx.error().toString() << "\n";
            ++broken;
            continue;
        }
        fixture::FixtureReport report = fixture::runFixture(*fx);
        std::cout << report.describe() << "\n";
        if (!report.passed) ++failed;
    }

    std::cout << (paths.size() - static_cast<std::size_t>(failed + broken)) << "/" << paths.size()
              << " fixtures passed\n";
    if (broken > 0) return kExitError;
    if (failed > 0) {
        reportError(Error{ErrorCode::FIXTURE_MISMATCH,
                          std::to_string(failed) + " fixture(s) did not match"});
        return kExitMismatch;
    }
    return kExitOk;
}

int runSchedule(const args::ParseResult& cli, const AppConfig& config) {
    ScheduleRequest request;

    auto rule = io::loadRule(cli["schedule"].asString());
    if (rule.isError()) return reportError(rule.error());
    request.rule = std::move(rule.value());

    if (cli.has("overrides")) {
        auto overrides = io::loadOverrides(cli["overrides"].asString());
        if (overrides.isError()) return reportError(overrides.error());
        request.overrides = std::move(overrides.value());
    }

    if (cli.has("from")) {
        auto from = time_utils::parseTimestamp(cli["from"].asString());
        if (from.isError()) return reportError(from.withContext("--from").error());
        request.from = *from;
    }

    auto until = time_utils::parseTimestamp(cli["until"].asString());
    if (until.isError()) return reportError(until.withContext("--until").error());
    request.until = *until;

    auto shifts = compute(request);
    if (shifts.isError()) return reportError(shifts.error());

    if (config.output_format == OutputFormat::TABLE) {
        std::cout << io::formatTable(*shifts);
    } else {
        std::cout << io::shiftsToJson(*shifts).dump(config.json_indent) << "\n";
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    const args::ArgParser parser = makeParser();
    const args::ParseResult cli = parser.parse(argc, argv);

    if (!cli.success()) {
        std::cerr << "oncall: " << cli.error() << "\n" << "Try 'oncall --help'.\n";
        return kExitUsage;
    }
    if (cli.has("help")) {
        std::cout << parser.help();
        return kExitOk;
    }
    if (!cli.positional().empty()) {
        std::cerr << "oncall: unexpected argument '" << cli.positional().front() << "'\n";
        return kExitUsage;
    }

    auto config = buildConfig(cli);
    if (config.isError()) return reportError(config.error());
    configureLogging(*config);

    int rc = kExitOk;
    if (cli.has("self-test")) {
        rc = runSelfTests(cli["self-test"].values());
    } else if (!cli.has("schedule") || !cli.has("until")) {
        std::cerr << "oncall: --schedule and --until are required\n" << "Try 'oncall --help'.\n";
        rc = kExitUsage;
    } else {
        rc = runSchedule(cli, *config);
    }
    Logger::instance().shutdown();
    return rc;
}
