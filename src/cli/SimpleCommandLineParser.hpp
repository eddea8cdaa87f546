/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace pgexport {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --name VALUE, --name=VALUE, -x VALUE, flags, defaults and
 * required options. Options are grouped into help sections in the order
 * they were added.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    /// Start a new help section; subsequent options are listed under it
    void add_section(const std::string& title) {
        sections_.push_back({title, {}});
    }

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, required, true, default_value));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, false, false));
    }

    /**
     * @brief Parse command line arguments
     * @return false on --help or on error; error() is empty for --help
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        error_.clear();
        help_requested_ = false;

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // --option=value
                size_t eq_pos = option_name.find('=');
                std::optional<std::string> value;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    error_ = "Unknown option: --" + option_name;
                    return false;
                }

                if (it->second.has_value) {
                    if (!value.has_value()) {
                        if (i + 1 >= args_.size() || looks_like_option(args_[i + 1])) {
                            error_ = "Option --" + option_name + " requires a value";
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value.value();
                } else {
                    if (value.has_value()) {
                        error_ = "Option --" + option_name + " does not take a value";
                        return false;
                    }
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);

                auto short_it = short_to_long_.find(short_name);
                if (short_it == short_to_long_.end()) {
                    error_ = "Unknown option: -" + short_name;
                    return false;
                }

                const std::string& option_name = short_it->second;
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args_.size() || looks_like_option(args_[i + 1])) {
                        error_ = "Option -" + short_name + " requires a value";
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                error_ = "Required option --" + name + " not provided";
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    const std::string& error() const { return error_; }

    bool help_requested() const { return help_requested_; }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && (iss >> std::ws).eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help(std::ostream& out = std::cout) const {
        out << description_ << "\n\n";
        out << "USAGE:\n";
        out << "    " << program_name_ << " [OPTIONS]\n\n";

        for (const auto& section : sections_) {
            out << section.title << ":\n";
            for (const auto& name : section.options) {
                print_help_section(out, options_.at(name));
            }
            out << "\n";
        }

        out << "HELP:\n";
        out << "    -h, --help                    Show this help\n";
    }

private:
    struct Section {
        std::string title;
        std::vector<std::string> options;
    };

    // A lone "-" or a negative number is a value, not an option
    static bool looks_like_option(const std::string& arg) {
        if (arg.size() < 2 || arg[0] != '-') {
            return false;
        }
        return !(arg[1] >= '0' && arg[1] <= '9');
    }

    void register_option(const Option& option) {
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
        if (sections_.empty()) {
            sections_.push_back({"OPTIONS", {}});
        }
        sections_.back().options.push_back(option.long_name);
    }

    void print_help_section(std::ostream& out, const Option& option) const {
        std::string usage = "    ";
        usage += option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        usage += "--" + option.long_name;
        if (option.has_value) {
            usage += " VALUE";
        }
        if (usage.size() < 34) {
            usage.append(34 - usage.size(), ' ');
        } else {
            usage += "  ";
        }
        out << usage << option.description;
        if (!option.default_value.empty()) {
            out << " (default: " << option.default_value << ")";
        }
        out << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<Section> sections_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    std::string error_;
    bool help_requested_ = false;
};

} // namespace pgexport
