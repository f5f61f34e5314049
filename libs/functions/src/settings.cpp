// =============================================================================
// Jalali Calendar Engine - Engine Settings Implementation
// Version: 1.2.0
// =============================================================================

#include "jalali/functions/settings.hpp"
#include <sstream>

namespace jalali::functions {

namespace {

constexpr StringView COMPONENT = "settings";

template<typename T>
Result<T> setting_error(StringView section, StringView key, StringView value, StringView expected) {
    return make_input_error<T>(ErrorCode::INVALID_ARGUMENT,
        std::format("[{}] {} = '{}': expected {}", section, key, value, expected),
        String(COMPONENT), value);
}

} // anonymous namespace

Result<EngineSettings> EngineSettings::from_config(const config::ConfigFile& cfg) {
    EngineSettings settings;
    
    if (cfg.has(config::sections::CALENDAR, keys::LEAP_RULE)) {
        String rule = cfg.get_string(config::sections::CALENDAR, keys::LEAP_RULE);
        auto resolved = calendar::make_leap_rule(rule);
        if (resolved.is_error()) {
            return setting_error<EngineSettings>(config::sections::CALENDAR, keys::LEAP_RULE, rule,
                "one of: " + join(calendar::leap_rule_names(), ", "));
        }
        settings.leap_rule = String(resolved.value()->name());
    }
    
    if (cfg.has(config::sections::PERIOD, keys::ANCHOR_DAY)) {
        const auto& value = cfg.section(config::sections::PERIOD).get(keys::ANCHOR_DAY);
        auto anchor = value.to_int();
        if (anchor.is_error() || anchor.value() < 1 || anchor.value() > 31) {
            return setting_error<EngineSettings>(config::sections::PERIOD, keys::ANCHOR_DAY,
                                                 value.str(), "an integer in [1, 31]");
        }
        settings.anchor_day = static_cast<Int32>(anchor.value());
    }
    
    if (cfg.has(config::sections::LOGGING, keys::LEVEL)) {
        String level = cfg.get_string(config::sections::LOGGING, keys::LEVEL);
        auto parsed = logging::parse_level(level);
        if (!parsed) {
            return setting_error<EngineSettings>(config::sections::LOGGING, keys::LEVEL, level,
                                                 "trace, debug, info, warn, error or off");
        }
        settings.log_level = *parsed;
    }
    
    if (cfg.has(config::sections::LOGGING, keys::LOG_FILE)) {
        String file = config::expand_env(cfg.get_string(config::sections::LOGGING, keys::LOG_FILE));
        if (!file.empty()) {
            settings.log_file = Path(file);
        }
    }
    
    return settings;
}

Result<SharedPtr<const calendar::LeapYearRule>> EngineSettings::make_rule() const {
    return calendar::make_leap_rule(leap_rule);
}

String EngineSettings::to_string() const {
    std::ostringstream oss;
    oss << "leap_rule=" << leap_rule
        << " anchor_day=" << (anchor_day ? std::to_string(*anchor_day) : String("none"))
        << " log_level=" << logging::to_string(log_level)
        << " log_file=" << (log_file ? log_file->string() : String("none"));
    return oss.str();
}

} // namespace jalali::functions
