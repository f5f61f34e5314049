// =============================================================================
// Jalali Calendar Engine - Persian Leap-Year Rules Implementation
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/leap_rule.hpp"
#include "jalali/common/logging.hpp"

namespace jalali::calendar {

namespace {

constexpr Int64 floor_div(Int64 numerator, Int64 denominator) {
    Int64 quotient = numerator / denominator;
    if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
        --quotient;
    }
    return quotient;
}

constexpr Int64 floor_mod(Int64 numerator, Int64 denominator) {
    return numerator - denominator * floor_div(numerator, denominator);
}

} // anonymous namespace

// =============================================================================
// LeapYearRule
// =============================================================================

Int64 LeapYearRule::leap_years_before(Int32 year) const {
    Int64 count = 0;
    if (year >= 1) {
        for (Int32 y = 1; y < year; ++y) {
            if (is_leap_year(y)) ++count;
        }
    } else {
        for (Int32 y = year; y < 1; ++y) {
            if (is_leap_year(y)) --count;
        }
    }
    return count;
}

// =============================================================================
// ArithmeticLeapRule
// =============================================================================

bool ArithmeticLeapRule::is_leap_year(Int32 year) const {
    return floor_mod(25 * static_cast<Int64>(year) + 11, 33) < 8;
}

Int64 ArithmeticLeapRule::leap_years_before(Int32 year) const {
    return floor_div(8 * static_cast<Int64>(year) + 21, 33);
}

// =============================================================================
// TabulatedLeapRule
// =============================================================================

TabulatedLeapRule::TabulatedLeapRule(SharedPtr<const LeapYearRule> rule)
    : rule_(rule ? std::move(rule) : default_leap_rule()) {
    const auto size = static_cast<Size>(MAX_YEAR - MIN_YEAR + 2);
    leap_.reserve(size);
    leaps_before_.reserve(size);
    
    Int64 count = rule_->leap_years_before(MIN_YEAR);
    for (Int32 year = MIN_YEAR; year <= MAX_YEAR + 1; ++year) {
        const bool leap = rule_->is_leap_year(year);
        leap_.push_back(leap);
        leaps_before_.push_back(count);
        if (leap) ++count;
    }
}

bool TabulatedLeapRule::is_leap_year(Int32 year) const {
    return in_table(year) ? leap_[static_cast<Size>(year - MIN_YEAR)] : rule_->is_leap_year(year);
}

Int64 TabulatedLeapRule::leap_years_before(Int32 year) const {
    return in_table(year) ? leaps_before_[static_cast<Size>(year - MIN_YEAR)]
                          : rule_->leap_years_before(year);
}

// =============================================================================
// Factory Functions
// =============================================================================

SharedPtr<const LeapYearRule> default_leap_rule() {
    static const SharedPtr<const LeapYearRule> rule = std::make_shared<const ArithmeticLeapRule>();
    return rule;
}

Result<SharedPtr<const LeapYearRule>> make_leap_rule(StringView name) {
    String key = to_lower(trim(name));
    if (key == ArithmeticLeapRule::NAME) {
        return default_leap_rule();
    }
    
    auto logger = logging::LogManager::instance().get_logger("calendar");
    logger->debug("Unknown leap-year rule '{}'", name);
    return make_input_error<SharedPtr<const LeapYearRule>>(
        ErrorCode::INVALID_ARGUMENT,
        std::format("Unknown leap-year rule '{}' (known: {})", name, join(leap_rule_names(), ", ")),
        "leap_rule", name);
}

Vector<String> leap_rule_names() {
    return {String(ArithmeticLeapRule::NAME)};
}

} // namespace jalali::calendar
