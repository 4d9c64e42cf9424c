/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for "hexmosaic <command> [options]"
 */

#pragma once

#include <cctype>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace hexmosaic {

/**
 * @brief Simple command-line argument parser
 *
 * The first positional argument is the command. Options are registered
 * in sections, and help lists them in registration order.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        std::string section;
        bool required;
        bool has_value;
        std::string default_value;

        // Default constructor for std::map
        Option() : required(false), has_value(true) {}

        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, const std::string& section,
               bool required = false, bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description), section(section),
              required(required), has_value(has_value), default_value(default_value) {}
    };

    struct Command {
        std::string name;
        std::string usage;
        std::string description;
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void begin_section(const std::string& title) {
        current_section_ = title;
    }

    void add_command(const std::string& name, const std::string& usage, const std::string& description) {
        commands_.push_back({name, usage, description});
    }

    // Add command line options
    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, current_section_,
                               required, true, default_value));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, current_section_, false, false));
    }

    /**
     * @brief Parse command line arguments
     * @return false on a usage error or when help was requested
     */
    bool parse(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        return parse(args);
    }

    bool parse(const std::vector<std::string>& args) {
        args_ = args;
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;
        last_error_.clear();

        // Check for help request
        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                return false;
            }
        }

        // Parse arguments
        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                if (options_.find(option_name) == options_.end()) {
                    return fail("Unknown option: --" + option_name);
                }

                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (!inline_value) {
                        if (i + 1 >= args_.size() || !is_value(args_[i + 1])) {
                            return fail("Option --" + option_name + " requires a value");
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1 && !is_number_like(arg)) {
                std::string short_name = arg.substr(1);

                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    return fail("Unknown option: -" + short_name);
                }

                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args_.size() || !is_value(args_[i + 1])) {
                        return fail("Option -" + short_name + " requires a value");
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                // Positional argument
                positional_args_.push_back(arg);
            }
        }

        // Check required options
        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                return fail("Required option --" + name + " not provided");
            }
        }

        // Set default values
        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    // Get parsed values
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool has(const std::string& option_name) const {
        return parsed_values_.find(option_name) != parsed_values_.end();
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
        if (iss >> result) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    /// First positional argument, or empty
    std::string command() const {
        return positional_args_.empty() ? std::string() : positional_args_.front();
    }

    bool help_requested() const { return help_requested_; }
    const std::string& last_error() const { return last_error_; }

    void show_help(std::ostream& out = std::cout) const {
        out << description_ << "\n\n";

        out << "USAGE:\n";
        out << "    " << program_name_ << " <command> [OPTIONS]\n\n";

        out << "COMMANDS:\n";
        for (const auto& command : commands_) {
            out << "    " << pad(command.name, 20) << command.description << "\n";
        }
        out << "\n";

        std::string section;
        for (const auto& name : option_order_) {
            const auto& option = options_.at(name);
            if (option.section != section) {
                section = option.section;
                out << "\n" << section << ":\n";
            }
            print_help_section(out, option);
        }
        out << "\n";

        out << "EXAMPLES:\n";
        for (const auto& command : commands_) {
            if (!command.usage.empty()) {
                out << "    " << program_name_ << " " << command.usage << "\n";
            }
        }
        out << "\n";

        out << "DISTANCES:\n";
        out << "    Distances accept m, km, ft and mi suffixes (default: m), e.g. --hex-size 1km\n";
        out << "    Map-tile offsets accept km or arc-minutes, e.g. --offset-ns 7.5arcmin\n";
    }

private:
    void register_option(const Option& option) {
        if (options_.find(option.long_name) == options_.end()) {
            option_order_.push_back(option.long_name);
        }
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    bool fail(const std::string& message) {
        last_error_ = message;
        return false;
    }

    static bool is_number_like(const std::string& arg) {
        return arg.size() > 1 && arg[0] == '-' &&
               (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
    }

    // Negative numbers such as "-151.2,63.1" are values, not options
    static bool is_value(const std::string& arg) {
        return !arg.starts_with("-") || is_number_like(arg);
    }

    static std::string pad(const std::string& text, size_t width) {
        return text.size() >= width ? text + " " : text + std::string(width - text.size(), ' ');
    }

    void print_help_section(std::ostream& out, const Option& option) const {
        std::string flag = "--" + option.long_name;
        if (!option.short_name.empty()) {
            flag = "-" + option.short_name + ", " + flag;
        }
        if (option.has_value) {
            flag += " VALUE";
        }
        out << "    " << pad(flag, 30) << option.description;
        if (!option.default_value.empty()) {
            out << " (default: " << option.default_value << ")";
        }
        out << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::string current_section_ = "OPTIONS";
    std::vector<Command> commands_;
    std::map<std::string, Option> options_;
    std::vector<std::string> option_order_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
    std::string last_error_;
};

} // namespace hexmosaic
