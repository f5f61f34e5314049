#pragma once
// =============================================================================
// Jalali Calendar Engine - Date Text Parsing and Formatting
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/calendar_types.hpp"
#include "jalali/common/error.hpp"

namespace jalali::calendar {

constexpr char JALALI_DELIMITER = '/';
constexpr char GREGORIAN_DELIMITER = '-';

[[nodiscard]] constexpr char delimiter_for(CalendarKind calendar) {
    return calendar == CalendarKind::JALALI ? JALALI_DELIMITER : GREGORIAN_DELIMITER;
}

// Splits "Y<d>M<d>D" into raw fields. Year is a signed 32-bit integer, month
// and day unsigned 8-bit; an optional leading '+' is accepted. Fails with
// FORMAT_ERROR, without any calendar validation.
[[nodiscard]] Result<RawDate> parse_date_text(StringView text, char delimiter);

// YYYY/MM/DD for Jalali, YYYY-MM-DD for Gregorian
[[nodiscard]] String format_date_text(const CalendarDate& date);

} // namespace jalali::calendar
