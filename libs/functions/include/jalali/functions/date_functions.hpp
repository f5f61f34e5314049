#pragma once
// =============================================================================
// Jalali Calendar Engine - Text-Level Date Functions
// Version: 1.2.0
// Host-callable operations over "YYYY/MM/DD" and "YYYY-MM-DD" text
// =============================================================================

#include "jalali/calendar/arithmetic.hpp"
#include "jalali/calendar/period.hpp"
#include <functional>

namespace jalali::functions {

// Source of the current instant; replaced in tests
using ClockFunction = std::function<SystemTimePoint()>;

class DateFunctions {
private:
    SharedPtr<const calendar::CalendarConverter> converter_;
    calendar::DateArithmetic arithmetic_;
    calendar::PeriodClassifier classifier_;
    ClockFunction clock_;
    
    [[nodiscard]] Result<calendar::CalendarDate> parse_jalali(StringView text) const;
    
public:
    explicit DateFunctions(SharedPtr<const calendar::CalendarConverter> converter = nullptr,
                           ClockFunction clock = nullptr);
    
    [[nodiscard]] const calendar::CalendarConverter& converter() const { return *converter_; }
    
    // "YYYY/MM/DD" -> "YYYY-MM-DD"
    [[nodiscard]] Result<String> jalali_to_gregorian(StringView jalali_text) const;
    
    // "YYYY-MM-DD" -> "YYYY/MM/DD"
    [[nodiscard]] Result<String> gregorian_to_jalali(StringView gregorian_text) const;
    
    [[nodiscard]] Result<Int32> diff_days(StringView start, StringView end) const;
    [[nodiscard]] Result<Int32> diff_days_with_adjustment(StringView start, StringView end,
                                                          Int32 adjustment) const;
    
    [[nodiscard]] Result<String> add_days(StringView jalali_text, Int32 days) const;
    [[nodiscard]] Result<String> add_months(StringView jalali_text, Int32 months) const;
    
    // Current UTC civil date as Jalali text. DATE_OVERFLOW only for a clock
    // reading before 0622-03-21 or after Jalali 9999/12/29; a nanosecond
    // system clock (1677-2262) never reaches either bound.
    [[nodiscard]] Result<String> now() const;
    
    [[nodiscard]] Result<bool> is_leap_year(StringView jalali_text) const;
    
    // "Start", "Middle", "End" or "Unknown"
    [[nodiscard]] Result<String> period_state(StringView jalali_text, Int32 anchor_day) const;
};

} // namespace jalali::functions
