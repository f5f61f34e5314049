#pragma once
// =============================================================================
// Jalali Calendar Engine - Calendar Converter
// Version: 1.2.0
// Jalali <-> Gregorian conversion through a day-count pivot
// =============================================================================

#include "jalali/calendar/calendar_types.hpp"
#include "jalali/calendar/leap_rule.hpp"
#include "jalali/common/error.hpp"

namespace jalali::calendar {

class CalendarConverter {
private:
    SharedPtr<const LeapYearRule> leap_rule_;
    
    [[nodiscard]] DayCount jalali_year_start(Int32 year) const;
    
public:
    // 0001/01/01 Jalali == 0622-03-21 Gregorian
    static constexpr DayCount JALALI_EPOCH = -492268;
    
    explicit CalendarConverter(SharedPtr<const LeapYearRule> rule = default_leap_rule());
    
    [[nodiscard]] const LeapYearRule& leap_rule() const { return *leap_rule_; }
    
    // =========================================================================
    // Construction and validation
    // =========================================================================
    
    // INVALID_DATE unless year is in [MIN_YEAR, MAX_YEAR], month in [1, 12]
    // and day within the month
    [[nodiscard]] Result<CalendarDate> make_date(Int32 year, Int32 month, Int32 day,
                                                 CalendarKind calendar) const;
    [[nodiscard]] Result<CalendarDate> make_date(const RawDate& raw, CalendarKind calendar) const;
    
    // parse_date_text() followed by make_date(), with the text as error input
    [[nodiscard]] Result<CalendarDate> parse(StringView text, CalendarKind calendar) const;
    
    [[nodiscard]] bool is_leap_year(Int32 year, CalendarKind calendar) const;
    [[nodiscard]] UInt8 days_in_month(Int32 year, UInt8 month, CalendarKind calendar) const;
    
    // =========================================================================
    // Day-count pivot
    // =========================================================================
    
    [[nodiscard]] DayCount to_day_count(const CalendarDate& date) const;
    
    // DATE_OVERFLOW when the resulting year leaves [MIN_YEAR, MAX_YEAR]
    [[nodiscard]] Result<CalendarDate> from_day_count(DayCount days, CalendarKind calendar) const;
    
    // Representable day-count range of a calendar
    [[nodiscard]] DayCount min_day_count(CalendarKind calendar) const;
    [[nodiscard]] DayCount max_day_count(CalendarKind calendar) const;
    
    // =========================================================================
    // Conversion
    // =========================================================================
    
    [[nodiscard]] Result<CalendarDate> convert(const CalendarDate& date, CalendarKind target) const;
    [[nodiscard]] Result<CalendarDate> to_gregorian(const CalendarDate& date) const;
    [[nodiscard]] Result<CalendarDate> to_jalali(const CalendarDate& date) const;
};

// Hinnant's civil calendar algorithms, proleptic Gregorian
[[nodiscard]] DayCount days_from_civil(Int64 year, UInt32 month, UInt32 day);
[[nodiscard]] RawDate civil_from_days(DayCount days);

} // namespace jalali::calendar
