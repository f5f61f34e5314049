#pragma once
// =============================================================================
// Jalali Calendar Engine - Calendar Value Types
// Version: 1.2.0
// =============================================================================

#include "jalali/common/types.hpp"

namespace jalali::calendar {

// Days since 1970-01-01 (Gregorian), the pivot for conversion and arithmetic
using DayCount = Int64;

// Four-digit year field of the text formats
constexpr Int32 MIN_YEAR = 1;
constexpr Int32 MAX_YEAR = 9999;

enum class CalendarKind : UInt8 {
    JALALI,
    GREGORIAN
};

[[nodiscard]] constexpr StringView to_string(CalendarKind kind) {
    switch (kind) {
        case CalendarKind::JALALI:    return "Jalali";
        case CalendarKind::GREGORIAN: return "Gregorian";
    }
    return "Unknown";
}

// Parser output; not validated against any calendar
struct RawDate {
    Int32 year = 0;
    UInt8 month = 0;
    UInt8 day = 0;
    
    [[nodiscard]] bool operator==(const RawDate&) const = default;
};

class CalendarConverter;

// =============================================================================
// CalendarDate - validated, immutable civil date in one calendar
// Only CalendarConverter::make_date and its derived operations construct one.
// =============================================================================
class CalendarDate {
    friend class CalendarConverter;
    
private:
    Int32 year_;
    UInt8 month_;
    UInt8 day_;
    CalendarKind calendar_;
    
    CalendarDate(Int32 year, UInt8 month, UInt8 day, CalendarKind calendar)
        : year_(year), month_(month), day_(day), calendar_(calendar) {}
    
public:
    [[nodiscard]] Int32 year() const { return year_; }
    [[nodiscard]] UInt8 month() const { return month_; }
    [[nodiscard]] UInt8 day() const { return day_; }
    [[nodiscard]] CalendarKind calendar() const { return calendar_; }
    
    [[nodiscard]] bool is_jalali() const { return calendar_ == CalendarKind::JALALI; }
    [[nodiscard]] bool is_gregorian() const { return calendar_ == CalendarKind::GREGORIAN; }
    
    [[nodiscard]] RawDate to_raw() const { return RawDate{year_, month_, day_}; }
    
    [[nodiscard]] bool operator==(const CalendarDate&) const = default;
};

// Position of a date inside its recurring custom period
enum class PeriodState : UInt8 {
    START,
    END,
    MIDDLE,
    UNKNOWN
};

} // namespace jalali::calendar
