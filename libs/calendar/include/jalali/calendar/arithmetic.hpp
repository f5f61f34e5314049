#pragma once
// =============================================================================
// Jalali Calendar Engine - Date Arithmetic
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/converter.hpp"

namespace jalali::calendar {

class DateArithmetic {
private:
    SharedPtr<const CalendarConverter> converter_;
    
public:
    explicit DateArithmetic(SharedPtr<const CalendarConverter> converter = nullptr);
    
    [[nodiscard]] const CalendarConverter& converter() const { return *converter_; }
    
    // Result stays in the input's calendar; DATE_OVERFLOW past the year range
    [[nodiscard]] Result<CalendarDate> add_days(const CalendarDate& date, Int64 delta) const;
    
    // day_count(end) - day_count(start); calendars may differ
    [[nodiscard]] Int64 diff_days(const CalendarDate& start, const CalendarDate& end) const;
    
    // (|diff| + adjustment), negated when end precedes start
    [[nodiscard]] Int64 diff_days_with_adjustment(const CalendarDate& start, const CalendarDate& end,
                                                  Int64 adjustment) const;
    
    // Jalali only, months > 0. The day is clamped to the destination month.
    [[nodiscard]] Result<CalendarDate> add_months(const CalendarDate& date, Int64 months) const;
};

} // namespace jalali::calendar
