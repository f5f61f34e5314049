// =============================================================================
// Jalali Calendar Engine - Date Arithmetic Implementation
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/arithmetic.hpp"
#include "jalali/calendar/date_text.hpp"
#include "jalali/common/logging.hpp"
#include <algorithm>

namespace jalali::calendar {

namespace {

constexpr StringView COMPONENT = "arithmetic";

} // anonymous namespace

DateArithmetic::DateArithmetic(SharedPtr<const CalendarConverter> converter)
    : converter_(converter ? std::move(converter) : std::make_shared<const CalendarConverter>()) {}

Result<CalendarDate> DateArithmetic::add_days(const CalendarDate& date, Int64 delta) const {
    const DayCount start = converter_->to_day_count(date);
    const DayCount lowest = converter_->min_day_count(date.calendar());
    const DayCount highest = converter_->max_day_count(date.calendar());
    
    // Compare against the distance to each bound so the sum never overflows
    if (delta > highest - start || delta < lowest - start) {
        auto logger = logging::LogManager::instance().get_logger("calendar");
        logger->debug("add_days({}, {}) leaves the representable range",
                      format_date_text(date), delta);
        return make_input_error<CalendarDate>(ErrorCode::DATE_OVERFLOW,
            std::format("Adding {} days to {} leaves years [{}, {}]",
                        delta, format_date_text(date), MIN_YEAR, MAX_YEAR),
            String(COMPONENT), format_date_text(date));
    }
    
    return converter_->from_day_count(start + delta, date.calendar());
}

Int64 DateArithmetic::diff_days(const CalendarDate& start, const CalendarDate& end) const {
    return converter_->to_day_count(end) - converter_->to_day_count(start);
}

Int64 DateArithmetic::diff_days_with_adjustment(const CalendarDate& start, const CalendarDate& end,
                                                Int64 adjustment) const {
    const Int64 diff = diff_days(start, end);
    const Int64 adjusted = (diff < 0 ? -diff : diff) + adjustment;
    return diff < 0 ? -adjusted : adjusted;
}

Result<CalendarDate> DateArithmetic::add_months(const CalendarDate& date, Int64 months) const {
    if (!date.is_jalali()) {
        return make_input_error<CalendarDate>(ErrorCode::INVALID_ARGUMENT,
            std::format("Month addition is defined for Jalali dates, got {}", format_date_text(date)),
            String(COMPONENT), format_date_text(date));
    }
    if (months <= 0) {
        return make_input_error<CalendarDate>(ErrorCode::INVALID_ARGUMENT,
            std::format("Months must be positive, got {}", months),
            String(COMPONENT), std::to_string(months));
    }
    
    Int64 new_year = date.year() + months / 12;
    Int64 new_month = date.month() + months % 12;
    if (new_month > 12) {
        new_month -= 12;
        ++new_year;
    }
    
    if (new_year > MAX_YEAR) {
        return make_input_error<CalendarDate>(ErrorCode::DATE_OVERFLOW,
            std::format("Adding {} months to {} passes year {}", months,
                        format_date_text(date), MAX_YEAR),
            String(COMPONENT), format_date_text(date));
    }
    
    const auto year = static_cast<Int32>(new_year);
    const auto month = static_cast<UInt8>(new_month);
    const UInt8 day = std::min(date.day(), converter_->days_in_month(year, month, CalendarKind::JALALI));
    return converter_->make_date(year, month, day, CalendarKind::JALALI);
}

} // namespace jalali::calendar
