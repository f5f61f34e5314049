#pragma once
// =============================================================================
// Jalali Calendar Engine - Persian Leap-Year Rules
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/calendar_types.hpp"
#include "jalali/common/error.hpp"

namespace jalali::calendar {

// =============================================================================
// LeapYearRule - decides whether Esfand (month 12) has 30 days
// =============================================================================
class LeapYearRule {
public:
    virtual ~LeapYearRule() = default;
    
    [[nodiscard]] virtual bool is_leap_year(Int32 year) const = 0;
    
    // Leap years in [1, year); negative for years below 1.
    // The default counts with is_leap_year() and is linear in |year|;
    // CalendarConverter wraps such rules in a TabulatedLeapRule.
    [[nodiscard]] virtual Int64 leap_years_before(Int32 year) const;
    
    [[nodiscard]] virtual StringView name() const = 0;
};

// Fixed 33-year cycle with 8 leap years, as used by ICU's Persian calendar
class ArithmeticLeapRule final : public LeapYearRule {
public:
    static constexpr StringView NAME = "arithmetic-33";
    
    [[nodiscard]] bool is_leap_year(Int32 year) const override;
    [[nodiscard]] Int64 leap_years_before(Int32 year) const override;
    [[nodiscard]] StringView name() const override { return NAME; }
};

// Precomputed leap flags and prefix counts for [MIN_YEAR, MAX_YEAR + 1];
// years outside the table are answered by the wrapped rule
class TabulatedLeapRule final : public LeapYearRule {
private:
    SharedPtr<const LeapYearRule> rule_;
    Vector<bool> leap_;
    Vector<Int64> leaps_before_;
    
    [[nodiscard]] static bool in_table(Int32 year) {
        return year >= MIN_YEAR && year <= MAX_YEAR + 1;
    }
    
public:
    explicit TabulatedLeapRule(SharedPtr<const LeapYearRule> rule);
    
    [[nodiscard]] bool is_leap_year(Int32 year) const override;
    [[nodiscard]] Int64 leap_years_before(Int32 year) const override;
    [[nodiscard]] StringView name() const override { return rule_->name(); }
    
    [[nodiscard]] const LeapYearRule& wrapped() const { return *rule_; }
};

// =============================================================================
// Factory Functions
// =============================================================================

[[nodiscard]] Result<SharedPtr<const LeapYearRule>> make_leap_rule(StringView name);
[[nodiscard]] SharedPtr<const LeapYearRule> default_leap_rule();
[[nodiscard]] Vector<String> leap_rule_names();

// Proleptic Gregorian rule
[[nodiscard]] constexpr bool is_gregorian_leap_year(Int32 year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

} // namespace jalali::calendar
