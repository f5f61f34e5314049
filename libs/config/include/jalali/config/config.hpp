#pragma once
// =============================================================================
// Jalali Calendar Engine - Configuration File Parser
// Version: 1.2.0
// INI/Config file support for Windows, Linux, and macOS
// =============================================================================

#include "jalali/common/types.hpp"
#include "jalali/common/error.hpp"
#include <map>

namespace jalali::config {

// =============================================================================
// Configuration Value
// =============================================================================

class ConfigValue {
private:
    String value_;
    
public:
    ConfigValue() = default;
    explicit ConfigValue(String value) : value_(std::move(value)) {}
    
    [[nodiscard]] const String& str() const { return value_; }
    [[nodiscard]] StringView view() const { return value_; }
    [[nodiscard]] bool empty() const { return value_.empty(); }
    
    // Type conversions
    [[nodiscard]] Result<Int64> to_int() const;
    [[nodiscard]] Result<bool> to_bool() const;
    
    // With defaults
    [[nodiscard]] Int64 to_int_or(Int64 default_val) const;
    [[nodiscard]] bool to_bool_or(bool default_val) const;
    [[nodiscard]] String to_string_or(StringView default_val) const;
};

// =============================================================================
// Configuration Section
// =============================================================================

class ConfigSection {
private:
    String name_;
    std::map<String, ConfigValue, std::less<>> values_;
    
public:
    ConfigSection() = default;
    explicit ConfigSection(String name) : name_(std::move(name)) {}
    
    [[nodiscard]] const String& name() const { return name_; }
    
    // Value access
    [[nodiscard]] bool has(StringView key) const;
    [[nodiscard]] const ConfigValue& get(StringView key) const;
    
    // Typed access with defaults
    [[nodiscard]] String get_string(StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView key, bool default_val = false) const;
    
    // Modification
    void set(StringView key, StringView value);
    void set(StringView key, Int64 value);
    void remove(StringView key);
    
    // Iteration
    [[nodiscard]] Vector<String> keys() const;
    [[nodiscard]] Size size() const { return values_.size(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }
    
    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }
};

// =============================================================================
// Configuration File
// =============================================================================

class ConfigFile {
private:
    Path filepath_;
    String default_section_name_ = "default";
    std::map<String, ConfigSection, std::less<>> sections_;
    
    void parse_line(StringView line, String& current_section);
    
public:
    ConfigFile() = default;
    
    // File operations
    [[nodiscard]] Result<void> load(const Path& path);
    void parse(StringView content);
    
    [[nodiscard]] const Path& path() const { return filepath_; }
    [[nodiscard]] bool is_loaded() const { return !filepath_.empty(); }
    
    // Section access
    [[nodiscard]] bool has_section(StringView name) const;
    [[nodiscard]] ConfigSection& section(StringView name);
    [[nodiscard]] const ConfigSection& section(StringView name) const;
    [[nodiscard]] ConfigSection& default_section();
    [[nodiscard]] const ConfigSection& default_section() const;
    
    // Quick access
    [[nodiscard]] bool has(StringView section, StringView key) const;
    [[nodiscard]] String get_string(StringView section, StringView key, StringView default_val = "") const;
    [[nodiscard]] Int64 get_int(StringView section, StringView key, Int64 default_val = 0) const;
    [[nodiscard]] bool get_bool(StringView section, StringView key, bool default_val = false) const;
    
    // Modification
    void set(StringView section, StringView key, StringView value);
    ConfigSection& add_section(StringView name);
    
    [[nodiscard]] Vector<String> section_names() const;
    [[nodiscard]] Size section_count() const { return sections_.size(); }
    
    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Environment Variable Support
// =============================================================================

[[nodiscard]] Optional<String> get_env(StringView name);
[[nodiscard]] String get_env_or(StringView name, StringView default_val);
[[nodiscard]] Result<void> set_env(StringView name, StringView value);
[[nodiscard]] Result<void> unset_env(StringView name);

// Expand environment variables in string (${VAR} or %VAR%)
[[nodiscard]] String expand_env(StringView str);

// =============================================================================
// Factory Functions
// =============================================================================

[[nodiscard]] Result<ConfigFile> load_config(const Path& path);
[[nodiscard]] Result<ConfigFile> parse_config(StringView content);

// Standard section names
namespace sections {
    constexpr StringView CALENDAR = "calendar";
    constexpr StringView PERIOD = "period";
    constexpr StringView LOGGING = "logging";
}

} // namespace jalali::config
