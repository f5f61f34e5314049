#pragma once
// =============================================================================
// Jalali Calendar Engine - Engine Settings
// Version: 1.2.0
// Recognized configuration keys, validated
// =============================================================================

#include "jalali/calendar/leap_rule.hpp"
#include "jalali/common/logging.hpp"
#include "jalali/config/config.hpp"

namespace jalali::functions {

namespace keys {
    constexpr StringView LEAP_RULE = "leap_rule";     // [calendar]
    constexpr StringView ANCHOR_DAY = "anchor_day";   // [period]
    constexpr StringView LEVEL = "level";             // [logging]
    constexpr StringView LOG_FILE = "file";            // [logging]
}

struct EngineSettings {
    String leap_rule{calendar::ArithmeticLeapRule::NAME};
    Optional<Int32> anchor_day;
    logging::LogLevel log_level = logging::LogLevel::WARN;
    Optional<Path> log_file;
    
    // INVALID_ARGUMENT when a recognized key holds an unusable value
    [[nodiscard]] static Result<EngineSettings> from_config(const config::ConfigFile& cfg);
    
    [[nodiscard]] Result<SharedPtr<const calendar::LeapYearRule>> make_rule() const;
    
    [[nodiscard]] String to_string() const;
};

} // namespace jalali::functions
