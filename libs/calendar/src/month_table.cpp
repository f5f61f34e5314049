// =============================================================================
// Jalali Calendar Engine - Month Length Table Implementation
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/month_table.hpp"
#include <array>

namespace jalali::calendar {

namespace {

// [calendar][leap][month - 1]
constexpr std::array<std::array<std::array<UInt8, 12>, 2>, 2> DAYS_IN_MONTH = {{
    // Jalali
    {{
        {31, 31, 31, 31, 31, 31, 30, 30, 30, 30, 30, 29},
        {31, 31, 31, 31, 31, 31, 30, 30, 30, 30, 30, 30}
    }},
    // Gregorian
    {{
        {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31},
        {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31}
    }}
}};

constexpr Size index_of(CalendarKind calendar) {
    return calendar == CalendarKind::JALALI ? 0 : 1;
}

} // anonymous namespace

UInt8 days_in_month(CalendarKind calendar, UInt8 month, bool leap) {
    if (month < 1 || month > 12) {
        return 0;
    }
    return DAYS_IN_MONTH[index_of(calendar)][leap ? 1 : 0][month - 1];
}

UInt16 days_before_month(CalendarKind calendar, UInt8 month, bool leap) {
    UInt16 total = 0;
    for (UInt8 m = 1; m < month && m <= 12; ++m) {
        total = static_cast<UInt16>(total + days_in_month(calendar, m, leap));
    }
    return total;
}

UInt16 days_in_year(CalendarKind calendar, bool leap) {
    return days_before_month(calendar, 13, leap);
}

} // namespace jalali::calendar
