// =============================================================================
// Jalali Calendar Engine - Calendar Converter Implementation
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/converter.hpp"
#include "jalali/calendar/date_text.hpp"
#include "jalali/calendar/month_table.hpp"
#include "jalali/common/logging.hpp"

namespace jalali::calendar {

namespace {

constexpr StringView COMPONENT = "converter";

// Mean Jalali year under a 33-year cycle is 12053/33 days
constexpr Int64 CYCLE_YEARS = 33;
constexpr Int64 CYCLE_DAYS = 12053;

constexpr Int64 floor_div(Int64 numerator, Int64 denominator) {
    Int64 quotient = numerator / denominator;
    if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
        --quotient;
    }
    return quotient;
}

// Rules without a closed-form leap_years_before() get a lookup table
SharedPtr<const LeapYearRule> with_constant_time_counts(SharedPtr<const LeapYearRule> rule) {
    if (!rule) {
        return default_leap_rule();
    }
    if (dynamic_cast<const ArithmeticLeapRule*>(rule.get()) ||
        dynamic_cast<const TabulatedLeapRule*>(rule.get())) {
        return rule;
    }
    return std::make_shared<const TabulatedLeapRule>(std::move(rule));
}

SharedPtr<logging::Logger> converter_logger() {
    return logging::LogManager::instance().get_logger("calendar");
}

} // anonymous namespace

// =============================================================================
// Gregorian civil algorithms
// =============================================================================

DayCount days_from_civil(Int64 year, UInt32 month, UInt32 day) {
    year -= month <= 2 ? 1 : 0;
    const Int64 era = (year >= 0 ? year : year - 399) / 400;
    const Int64 yoe = year - era * 400;                                     // [0, 399]
    const Int64 doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;  // [0, 365]
    const Int64 doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;                // [0, 146096]
    return era * 146097 + doe - 719468;
}

RawDate civil_from_days(DayCount days) {
    days += 719468;
    const Int64 era = (days >= 0 ? days : days - 146096) / 146097;
    const Int64 doe = days - era * 146097;
    const Int64 yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const Int64 doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const Int64 mp = (5 * doy + 2) / 153;
    const Int64 day = doy - (153 * mp + 2) / 5 + 1;
    const Int64 month = mp < 10 ? mp + 3 : mp - 9;
    const Int64 year = yoe + era * 400 + (month <= 2 ? 1 : 0);
    return RawDate{static_cast<Int32>(year), static_cast<UInt8>(month), static_cast<UInt8>(day)};
}

// =============================================================================
// CalendarConverter
// =============================================================================

CalendarConverter::CalendarConverter(SharedPtr<const LeapYearRule> rule)
    : leap_rule_(with_constant_time_counts(std::move(rule))) {}

DayCount CalendarConverter::jalali_year_start(Int32 year) const {
    return JALALI_EPOCH + 365 * (static_cast<Int64>(year) - 1) + leap_rule_->leap_years_before(year);
}

bool CalendarConverter::is_leap_year(Int32 year, CalendarKind calendar) const {
    return calendar == CalendarKind::JALALI ? leap_rule_->is_leap_year(year)
                                            : is_gregorian_leap_year(year);
}

UInt8 CalendarConverter::days_in_month(Int32 year, UInt8 month, CalendarKind calendar) const {
    return calendar::days_in_month(calendar, month, is_leap_year(year, calendar));
}

Result<CalendarDate> CalendarConverter::make_date(Int32 year, Int32 month, Int32 day,
                                                  CalendarKind calendar) const {
    auto input = [&] { return std::format("{}/{}/{}", year, month, day); };
    
    if (year < MIN_YEAR || year > MAX_YEAR) {
        return make_input_error<CalendarDate>(ErrorCode::INVALID_DATE,
            std::format("{} year {} outside [{}, {}]", to_string(calendar), year, MIN_YEAR, MAX_YEAR),
            String(COMPONENT), input());
    }
    if (month < 1 || month > 12) {
        return make_input_error<CalendarDate>(ErrorCode::INVALID_DATE,
            std::format("{} month {} outside [1, 12]", to_string(calendar), month),
            String(COMPONENT), input());
    }
    
    const auto month_length = days_in_month(year, static_cast<UInt8>(month), calendar);
    if (day < 1 || day > month_length) {
        return make_input_error<CalendarDate>(ErrorCode::INVALID_DATE,
            std::format("{} day {} outside [1, {}] for month {} of {}", to_string(calendar),
                        day, month_length, month, year),
            String(COMPONENT), input());
    }
    
    return CalendarDate(year, static_cast<UInt8>(month), static_cast<UInt8>(day), calendar);
}

Result<CalendarDate> CalendarConverter::make_date(const RawDate& raw, CalendarKind calendar) const {
    return make_date(raw.year, raw.month, raw.day, calendar);
}

Result<CalendarDate> CalendarConverter::parse(StringView text, CalendarKind calendar) const {
    auto raw = parse_date_text(text, delimiter_for(calendar));
    if (raw.is_error()) {
        converter_logger()->trace("Rejected {} text '{}': {}", to_string(calendar), text,
                                  raw.error().message);
        return raw.error();
    }
    
    auto date = make_date(raw.value(), calendar);
    if (date.is_error()) {
        converter_logger()->trace("Rejected {} date '{}': {}", to_string(calendar), text,
                                  date.error().message);
        auto error = date.error();
        error.with_context("input", String(text));
        return error;
    }
    return date;
}

DayCount CalendarConverter::to_day_count(const CalendarDate& date) const {
    if (date.is_gregorian()) {
        return days_from_civil(date.year(), date.month(), date.day());
    }
    return jalali_year_start(date.year())
         + days_before_month(CalendarKind::JALALI, date.month(), false)
         + date.day() - 1;
}

DayCount CalendarConverter::min_day_count(CalendarKind calendar) const {
    if (calendar == CalendarKind::GREGORIAN) {
        return days_from_civil(MIN_YEAR, 1, 1);
    }
    return jalali_year_start(MIN_YEAR);
}

DayCount CalendarConverter::max_day_count(CalendarKind calendar) const {
    if (calendar == CalendarKind::GREGORIAN) {
        return days_from_civil(MAX_YEAR, 12, 31);
    }
    return jalali_year_start(MAX_YEAR + 1) - 1;
}

Result<CalendarDate> CalendarConverter::from_day_count(DayCount days, CalendarKind calendar) const {
    if (days < min_day_count(calendar) || days > max_day_count(calendar)) {
        converter_logger()->debug("Day count {} outside the {} range", days, to_string(calendar));
        return make_input_error<CalendarDate>(ErrorCode::DATE_OVERFLOW,
            std::format("Day count {} is outside the representable {} years [{}, {}]",
                        days, to_string(calendar), MIN_YEAR, MAX_YEAR),
            String(COMPONENT), std::to_string(days));
    }
    
    if (calendar == CalendarKind::GREGORIAN) {
        auto raw = civil_from_days(days);
        return CalendarDate(raw.year, raw.month, raw.day, CalendarKind::GREGORIAN);
    }
    
    // Estimate from the mean year length, then settle on the rule's year starts
    Int32 year = static_cast<Int32>(1 + floor_div((days - JALALI_EPOCH) * CYCLE_YEARS, CYCLE_DAYS));
    while (jalali_year_start(year) > days) {
        --year;
    }
    while (jalali_year_start(year + 1) <= days) {
        ++year;
    }
    
    const bool leap = leap_rule_->is_leap_year(year);
    Int64 day_of_year = days - jalali_year_start(year);
    UInt8 month = 1;
    while (month < 12 && day_of_year >= calendar::days_in_month(CalendarKind::JALALI, month, leap)) {
        day_of_year -= calendar::days_in_month(CalendarKind::JALALI, month, leap);
        ++month;
    }
    
    return CalendarDate(year, month, static_cast<UInt8>(day_of_year + 1), CalendarKind::JALALI);
}

// =============================================================================
// Conversion
// =============================================================================

Result<CalendarDate> CalendarConverter::convert(const CalendarDate& date, CalendarKind target) const {
    if (date.calendar() == target) {
        return date;
    }
    
    auto result = from_day_count(to_day_count(date), target);
    if (result.is_error()) {
        auto error = result.error();
        error.with_context("input", format_date_text(date));
        return error;
    }
    
    auto logger = converter_logger();
    if (logger->should_log(logging::LogLevel::TRACE)) {
        logger->trace("{} -> {}", format_date_text(date), format_date_text(result.value()));
    }
    return result;
}

Result<CalendarDate> CalendarConverter::to_gregorian(const CalendarDate& date) const {
    return convert(date, CalendarKind::GREGORIAN);
}

Result<CalendarDate> CalendarConverter::to_jalali(const CalendarDate& date) const {
    return convert(date, CalendarKind::JALALI);
}

} // namespace jalali::calendar
