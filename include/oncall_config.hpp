/**
 * @file oncall_config.hpp
 * @brief Runtime configuration for the oncall tool
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * Settings come from an optional key=value file ('#' starts a comment
 * line) and are then overridden by command-line flags.
 */
#ifndef ONCALL_CONFIG_HPP
#define ONCALL_CONFIG_HPP

#include "oncall_logger.hpp"
#include "result.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <istream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace oncall {

enum class OutputFormat { JSON, TABLE };

inline std::string outputFormatToString(OutputFormat format) {
    return format == OutputFormat::TABLE ? "table" : "json";
}

//=============================================================================
// Structured Configuration
//=============================================================================

/**
 * @struct AppConfig
 * @brief Structured tool configuration with typed fields
 */
struct AppConfig {
    // Logging
    std::string log_level = "ERROR";
    bool log_to_console = true;
    std::string log_directory;  // empty: no log file

    // Output
    OutputFormat output_format = OutputFormat::JSON;
    int json_indent = 2;

    /**
     * @brief Set configuration value from string
     * @return CONFIG_INVALID for unknown keys or unparsable values
     */
    [[nodiscard]] Result<void> setFromString(const std::string& key, const std::string& value) {
        if (key == "log_level") {
            log_level = value;
        } else if (key == "log_to_console") {
            auto b = parseBool(value);
            if (!b) return invalid(key, value);
            log_to_console = *b;
        } else if (key == "log_directory") {
            log_directory = value;
        } else if (key == "output_format") {
            std::string lower = toLower(value);
            if (lower == "json") output_format = OutputFormat::JSON;
            else if (lower == "table") output_format = OutputFormat::TABLE;
            else return invalid(key, value);
        } else if (key == "json_indent") {
            try {
                std::size_t used = 0;
                json_indent = std::stoi(value, &used);
                if (used != value.size()) return invalid(key, value);
            } catch (const std::exception&) {
                return invalid(key, value);
            }
        } else {
            return Err(ErrorCode::CONFIG_INVALID, "Unknown configuration key: " + key);
        }
        return Ok();
    }

    [[nodiscard]] std::map<std::string, std::string> toMap() const {
        std::map<std::string, std::string> m;
        m["log_level"] = log_level;
        m["log_to_console"] = log_to_console ? "true" : "false";
        m["log_directory"] = log_directory;
        m["output_format"] = outputFormatToString(output_format);
        m["json_indent"] = std::to_string(json_indent);
        return m;
    }

    /**
     * @brief Validate all fields, reporting every problem at once
     */
    [[nodiscard]] Result<void> validate() const {
        std::vector<std::string> errors;
        if (!parseLogLevel(log_level)) {
            errors.push_back("log_level: Invalid log level: " + log_level);
        }
        if (json_indent < -1 || json_indent > 16) {
            errors.push_back("json_indent: Must be between -1 (compact) and 16");
        }

        if (!errors.empty()) {
            std::ostringstream oss;
            oss << "Configuration validation failed:";
            for (const auto& err : errors) oss << "\n  - " << err;
            return Err(ErrorCode::CONFIG_INVALID, oss.str());
        }
        return Ok();
    }

    /**
     * @brief Apply key=value lines from a stream
     */
    [[nodiscard]] Result<void> load(std::istream& in, const std::string& source = "<config>") {
        std::string line;
        int lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;
            auto pos = line.find('=');
            if (pos == std::string::npos) {
                return Error{ErrorCode::CONFIG_PARSE_ERROR, "Expected key=value",
                             source + ":" + std::to_string(lineNo)};
            }
            auto applied = setFromString(trim(line.substr(0, pos)), trim(line.substr(pos + 1)));
            if (applied.isError()) {
                Error err = applied.error();
                err.context = source + ":" + std::to_string(lineNo);
                return err;
            }
        }
        return Ok();
    }

    [[nodiscard]] Result<void> loadFromFile(const std::filesystem::path& filepath) {
        std::ifstream file(filepath);
        if (!file) {
            return Error{ErrorCode::IO_ERROR, "Cannot open configuration file", filepath.string()};
        }
        return load(file, filepath.string());
    }

private:
    static Result<void> invalid(const std::string& key, const std::string& value) {
        return Err(ErrorCode::CONFIG_INVALID, "Invalid value for " + key + ": " + value);
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static std::optional<bool> parseBool(const std::string& s) {
        std::string lower = toLower(s);
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
        return std::nullopt;
    }

    static std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        auto end = s.find_last_not_of(" \t\r\n");
        return (start == std::string::npos) ? "" : s.substr(start, end - start + 1);
    }
};

} // namespace oncall
#endif // ONCALL_CONFIG_HPP
