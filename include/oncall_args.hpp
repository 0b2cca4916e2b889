/**
 * @file oncall_args.hpp
 * @brief Command-line argument parsing for the oncall tool
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 *
 * This header provides:
 * - Option definitions with short/long forms
 * - Flags, single-value and repeatable options
 * - Help generation
 */

#ifndef ONCALL_ARGS_HPP
#define ONCALL_ARGS_HPP

#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace oncall {
namespace args {

enum class ArgType {
    Flag,       // Boolean flag (no value)
    Value,      // Single value, last occurrence wins
    MultiValue  // Repeatable
};

/**
 * @brief Parsed argument value
 */
class ArgValue {
public:
    [[nodiscard]] bool isSet() const noexcept { return isSet_; }

    [[nodiscard]] std::string asString(const std::string& defaultValue = "") const {
        return values_.empty() ? defaultValue : values_.back();
    }

    [[nodiscard]] const std::vector<std::string>& values() const noexcept { return values_; }

    [[nodiscard]] explicit operator bool() const noexcept { return isSet_; }

    void set() { isSet_ = true; }
    void addValue(std::string value) {
        isSet_ = true;
        values_.push_back(std::move(value));
    }

private:
    bool isSet_ = false;
    std::vector<std::string> values_;
};

struct ArgDef {
    std::string name;           // Long name (e.g., "schedule")
    char shortName = '\0';      // Short name (e.g., 's')
    std::string description;
    ArgType type = ArgType::Value;
    std::string metavar;        // Value placeholder in help (e.g., "FILE")
};

/**
 * @brief Result of argument parsing
 */
class ParseResult {
public:
    [[nodiscard]] bool success() const noexcept { return error_.empty(); }
    [[nodiscard]] const std::string& error() const noexcept { return error_; }

    [[nodiscard]] const ArgValue& get(const std::string& name) const {
        static const ArgValue empty;
        auto it = args_.find(name);
        return it != args_.end() ? it->second : empty;
    }

    [[nodiscard]] bool has(const std::string& name) const { return get(name).isSet(); }

    [[nodiscard]] const std::vector<std::string>& positional() const noexcept { return positional_; }

    [[nodiscard]] const ArgValue& operator[](const std::string& name) const { return get(name); }

    void setError(std::string error) { error_ = std::move(error); }
    void addPositional(std::string value) { positional_.push_back(std::move(value)); }
    ArgValue& argRef(const std::string& name) { return args_[name]; }

private:
    std::string error_;
    std::map<std::string, ArgValue> args_;
    std::vector<std::string> positional_;
};

/**
 * @brief Command-line argument parser
 */
class ArgParser {
public:
    explicit ArgParser(std::string programName = "", std::string description = "")
        : programName_(std::move(programName))
        , description_(std::move(description)) {}

    ArgParser& addFlag(const std::string& name, char shortName = '\0',
                       const std::string& description = "") {
        args_.push_back(ArgDef{name, shortName, description, ArgType::Flag, ""});
        return *this;
    }

    ArgParser& addOption(const std::string& name, char shortName = '\0',
                         const std::string& description = "",
                         const std::string& metavar = "VALUE") {
        args_.push_back(ArgDef{name, shortName, description, ArgType::Value, metavar});
        return *this;
    }

    ArgParser& addMulti(const std::string& name, char shortName = '\0',
                        const std::string& description = "",
                        const std::string& metavar = "VALUE") {
        args_.push_back(ArgDef{name, shortName, description, ArgType::MultiValue, metavar});
        return *this;
    }

    [[nodiscard]] ParseResult parse(int argc, char* argv[]) const {
        return parse(std::vector<std::string>(argv + (argc > 0 ? 1 : 0), argv + argc));
    }

    /**
     * @brief Parse from string vector (program name excluded)
     *
     * Accepts --name VALUE, --name=VALUE, -n VALUE and -nVALUE. A bare
     * "--" ends option processing.
     */
    [[nodiscard]] ParseResult parse(const std::vector<std::string>& args) const {
        ParseResult result;
        bool optionsDone = false;

        for (std::size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (optionsDone || arg.size() < 2 || arg[0] != '-') {
                result.addPositional(arg);
                continue;
            }
            if (arg == "--") {
                optionsDone = true;
                continue;
            }
            if (arg == "--help" || arg == "-h") {
                result.argRef("help").set();
                continue;
            }

            const bool isLong = arg[1] == '-';
            std::string name;
            std::string value;
            bool hasInlineValue = false;
            const ArgDef* def = nullptr;

            if (isLong) {
                name = arg.substr(2);
                auto eqPos = name.find('=');
                if (eqPos != std::string::npos) {
                    value = name.substr(eqPos + 1);
                    name = name.substr(0, eqPos);
                    hasInlineValue = true;
                }
                def = findByName(name);
            } else {
                def = findByShort(arg[1]);
                name = std::string(1, arg[1]);
                if (arg.size() > 2) {
                    value = arg.substr(2);
                    hasInlineValue = true;
                }
            }

            const std::string shown = (isLong ? "--" : "-") + name;
            if (def == nullptr) {
                result.setError("Unknown option: " + shown);
                return result;
            }

            if (def->type == ArgType::Flag) {
                if (hasInlineValue) {
                    result.setError("Option " + shown + " does not take a value");
                    return result;
                }
                result.argRef(def->name).set();
                continue;
            }

            if (!hasInlineValue) {
                if (i + 1 >= args.size()) {
                    result.setError("Option " + shown + " requires a value");
                    return result;
                }
                value = args[++i];
            }
            if (value.empty()) {
                result.setError("Option " + shown + " requires a value");
                return result;
            }
            result.argRef(def->name).addValue(value);
        }

        return result;
    }

    /**
     * @brief Generate help text
     */
    [[nodiscard]] std::string help() const {
        std::ostringstream oss;
        oss << "Usage: " << programName_ << " [OPTIONS]\n\n";
        if (!description_.empty()) {
            oss << description_ << "\n\n";
        }
        oss << "Options:\n";

        std::size_t maxWidth = 20;
        for (const auto& def : args_) {
            maxWidth = std::max(maxWidth, labelFor(def).size());
        }

        oss << "  " << padded("-h, --help", maxWidth) << "Show this help message\n";
        for (const auto& def : args_) {
            oss << "  " << padded(labelFor(def), maxWidth) << def.description;
            if (def.type == ArgType::MultiValue) oss << " (repeatable)";
            oss << "\n";
        }
        return oss.str();
    }

private:
    std::string programName_;
    std::string description_;
    std::vector<ArgDef> args_;

    static std::string labelFor(const ArgDef& def) {
        std::string label = def.shortName != '\0' ? std::string("-") + def.shortName + ", " : "    ";
        label += "--" + def.name;
        if (def.type != ArgType::Flag) label += " " + def.metavar;
        return label;
    }

    static std::string padded(const std::string& s, std::size_t width) {
        return s + std::string(width - s.size() + 2, ' ');
    }

    [[nodiscard]] const ArgDef* findByName(const std::string& name) const {
        for (const auto& def : args_) {
            if (def.name == name) return &def;
        }
        return nullptr;
    }

    [[nodiscard]] const ArgDef* findByShort(char shortName) const {
        for (const auto& def : args_) {
            if (def.shortName == shortName) return &def;
        }
        return nullptr;
    }
};

} // namespace args
} // namespace oncall

#endif // ONCALL_ARGS_HPP
