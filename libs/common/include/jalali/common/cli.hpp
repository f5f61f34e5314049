// =============================================================================
// Jalali Calendar Engine - Command Line Argument Parser
// Version: 1.2.0
// =============================================================================

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace jalali::cli {

/**
 * @brief Command-line argument parser
 * 
 * Provides simple, dependency-free argument parsing with support for:
 * - Long options (--name, --name=value)
 * - Short options (-n, -n value)
 * - Boolean flags
 * - Positional arguments, including negative numbers such as -30
 * - "--" to end option parsing
 * - Help generation
 */
class ArgParser {
public:
    struct Option {
        std::string long_name;
        char short_name = 0;
        std::string description;
        std::string default_value;
        bool is_flag = false;
        bool required = false;
    };

    explicit ArgParser(const std::string& program_name = "",
                       const std::string& description = "")
        : program_name_(program_name), description_(description) {}

    /**
     * @brief Add a string option
     */
    ArgParser& add_option(const std::string& long_name,
                          char short_name = 0,
                          const std::string& description = "",
                          const std::string& default_value = "",
                          bool required = false) {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.default_value = default_value;
        opt.is_flag = false;
        opt.required = required;
        options_.push_back(opt);
        return *this;
    }

    /**
     * @brief Add a boolean flag
     */
    ArgParser& add_flag(const std::string& long_name,
                        char short_name = 0,
                        const std::string& description = "") {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.is_flag = true;
        options_.push_back(opt);
        return *this;
    }

    /**
     * @brief Add a positional argument
     */
    ArgParser& add_positional(const std::string& name,
                              const std::string& description = "",
                              bool required = true) {
        positional_names_.push_back(name);
        positional_descriptions_.push_back(description);
        positional_required_.push_back(required);
        return *this;
    }

    /**
     * @brief Parse command-line arguments
     * @return true if parsing succeeded; false on error or after --help
     */
    bool parse(int argc, char* argv[]) {
        if (argc > 0) {
            if (program_name_.empty()) {
                program_name_ = argv[0];
            }
        }

        for (const auto& opt : options_) {
            if (!opt.default_value.empty()) {
                values_[opt.long_name] = opt.default_value;
            }
            if (opt.is_flag) {
                flags_[opt.long_name] = false;
            }
        }

        bool options_done = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (!options_done && arg == "--") {
                options_done = true;
                continue;
            }

            if (!options_done && (arg == "-h" || arg == "--help")) {
                help_requested_ = true;
                show_help();
                return false;
            }

            if (!options_done && arg.starts_with("--")) {
                std::string name;
                std::string value;
                bool has_value = false;
                
                auto eq_pos = arg.find('=');
                if (eq_pos != std::string::npos) {
                    name = arg.substr(2, eq_pos - 2);
                    value = arg.substr(eq_pos + 1);
                    has_value = true;
                } else {
                    name = arg.substr(2);
                }

                auto* opt = find_option(name);
                if (!opt) {
                    error_ = "Unknown option: --" + name;
                    return false;
                }

                if (opt->is_flag) {
                    flags_[opt->long_name] = true;
                } else {
                    if (!has_value) {
                        if (i + 1 < argc) {
                            value = argv[++i];
                        } else {
                            error_ = "Option --" + name + " requires a value";
                            return false;
                        }
                    }
                    values_[opt->long_name] = value;
                    explicit_.push_back(opt->long_name);
                }
            } else if (!options_done && arg.starts_with("-") && arg.length() > 1 &&
                       !is_negative_number(arg)) {
                for (size_t j = 1; j < arg.length(); ++j) {
                    char c = arg[j];
                    auto* opt = find_option(c);
                    if (!opt) {
                        error_ = "Unknown option: -";
                        error_ += c;
                        return false;
                    }

                    if (opt->is_flag) {
                        flags_[opt->long_name] = true;
                    } else {
                        std::string value;
                        if (j + 1 < arg.length()) {
                            value = arg.substr(j + 1);
                            j = arg.length();
                        } else if (i + 1 < argc) {
                            value = argv[++i];
                        } else {
                            error_ = "Option -";
                            error_ += c;
                            error_ += " requires a value";
                            return false;
                        }
                        values_[opt->long_name] = value;
                        explicit_.push_back(opt->long_name);
                    }
                }
            } else {
                if (positional_values_.size() < positional_names_.size()) {
                    positional_values_.push_back(arg);
                } else {
                    extra_args_.push_back(arg);
                }
            }
        }

        for (const auto& opt : options_) {
            if (opt.required && values_.find(opt.long_name) == values_.end()) {
                error_ = "Required option missing: --" + opt.long_name;
                return false;
            }
        }

        return true;
    }

    /**
     * @brief Check required positional arguments; separate from parse() so
     * that flags such as --list can run without them
     */
    bool check_positionals() {
        for (size_t i = 0; i < positional_required_.size(); ++i) {
            if (positional_required_[i] && i >= positional_values_.size()) {
                error_ = "Required argument missing: " + positional_names_[i];
                return false;
            }
        }
        return true;
    }

    std::optional<std::string> get(const std::string& name) const {
        auto it = values_.find(name);
        if (it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string get(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    /**
     * @brief True when the option was given on the command line rather than
     * filled from its default
     */
    bool is_set(const std::string& name) const {
        return std::find(explicit_.begin(), explicit_.end(), name) != explicit_.end();
    }

    bool flag(const std::string& name) const {
        auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    std::optional<std::string> positional(size_t index) const {
        if (index < positional_values_.size()) {
            return positional_values_[index];
        }
        return std::nullopt;
    }

    const std::vector<std::string>& positional_args() const {
        return positional_values_;
    }

    /**
     * @brief Arguments beyond the defined positionals
     */
    const std::vector<std::string>& extra_args() const {
        return extra_args_;
    }

    const std::string& error() const {
        return error_;
    }

    bool help_requested() const {
        return help_requested_;
    }

    void show_help(std::ostream& out = std::cout) const {
        out << "Usage: " << program_name_;
        
        for (const auto& opt : options_) {
            if (opt.is_flag) {
                out << " [--" << opt.long_name << "]";
            } else if (opt.required) {
                out << " --" << opt.long_name << "=<value>";
            } else {
                out << " [--" << opt.long_name << "=<value>]";
            }
        }
        
        for (size_t i = 0; i < positional_names_.size(); ++i) {
            if (positional_required_[i]) {
                out << " <" << positional_names_[i] << ">";
            } else {
                out << " [" << positional_names_[i] << "]";
            }
        }
        out << " [args...]";
        
        out << "\n\n";
        
        if (!description_.empty()) {
            out << description_ << "\n\n";
        }

        if (!options_.empty()) {
            out << "Options:\n";
            for (const auto& opt : options_) {
                out << "  ";
                if (opt.short_name) {
                    out << "-" << opt.short_name << ", ";
                } else {
                    out << "    ";
                }
                out << "--" << std::left << std::setw(20) << opt.long_name;
                out << opt.description;
                if (!opt.default_value.empty()) {
                    out << " [default: " << opt.default_value << "]";
                }
                if (opt.required) {
                    out << " (required)";
                }
                out << "\n";
            }
        }

        if (!positional_names_.empty()) {
            out << "\nArguments:\n";
            for (size_t i = 0; i < positional_names_.size(); ++i) {
                out << "  " << std::left << std::setw(22) << positional_names_[i];
                out << positional_descriptions_[i];
                if (positional_required_[i]) {
                    out << " (required)";
                }
                out << "\n";
            }
        }

        out << "\n  -h, --help                Show this help message\n";
    }

private:
    static bool is_negative_number(const std::string& arg) {
        return arg.size() > 1 && arg[0] == '-' &&
               std::all_of(arg.begin() + 1, arg.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    Option* find_option(const std::string& name) {
        for (auto& opt : options_) {
            if (opt.long_name == name) return &opt;
        }
        return nullptr;
    }

    Option* find_option(char short_name) {
        for (auto& opt : options_) {
            if (opt.short_name == short_name) return &opt;
        }
        return nullptr;
    }

    std::string program_name_;
    std::string description_;
    std::vector<Option> options_;
    std::vector<std::string> positional_names_;
    std::vector<std::string> positional_descriptions_;
    std::vector<bool> positional_required_;
    
    std::map<std::string, std::string> values_;
    std::map<std::string, bool> flags_;
    std::vector<std::string> explicit_;
    std::vector<std::string> positional_values_;
    std::vector<std::string> extra_args_;
    std::string error_;
    bool help_requested_ = false;
};

} // namespace jalali::cli
