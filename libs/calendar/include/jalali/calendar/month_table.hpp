#pragma once
// =============================================================================
// Jalali Calendar Engine - Month Length Table
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/calendar_types.hpp"

namespace jalali::calendar {

// Length of a month, 0 when month is outside [1, 12]
[[nodiscard]] UInt8 days_in_month(CalendarKind calendar, UInt8 month, bool leap);

// Days in the months preceding month (0 for month 1)
[[nodiscard]] UInt16 days_before_month(CalendarKind calendar, UInt8 month, bool leap);

[[nodiscard]] UInt16 days_in_year(CalendarKind calendar, bool leap);

} // namespace jalali::calendar
