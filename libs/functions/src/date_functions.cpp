// =============================================================================
// Jalali Calendar Engine - Text-Level Date Functions Implementation
// Version: 1.2.0
// =============================================================================

#include "jalali/functions/date_functions.hpp"
#include "jalali/calendar/date_text.hpp"
#include "jalali/common/logging.hpp"
#include <chrono>
#include <limits>

namespace jalali::functions {

using calendar::CalendarDate;
using calendar::CalendarKind;

namespace {

constexpr StringView COMPONENT = "functions";

Result<Int32> narrow_to_int32(Int64 value, StringView what) {
    if (value < std::numeric_limits<Int32>::min() || value > std::numeric_limits<Int32>::max()) {
        return make_input_error<Int32>(ErrorCode::DATE_OVERFLOW,
            std::format("{} result {} does not fit a 32-bit integer", what, value),
            String(COMPONENT), std::to_string(value));
    }
    return static_cast<Int32>(value);
}

Result<String> to_text(const Result<CalendarDate>& date) {
    if (date.is_error()) {
        return date.error();
    }
    return calendar::format_date_text(date.value());
}

} // anonymous namespace

DateFunctions::DateFunctions(SharedPtr<const calendar::CalendarConverter> converter, ClockFunction clock)
    : converter_(converter ? std::move(converter) : std::make_shared<const calendar::CalendarConverter>())
    , arithmetic_(converter_)
    , classifier_(converter_)
    , clock_(clock ? std::move(clock) : ClockFunction([] { return SystemClock::now(); })) {}

Result<CalendarDate> DateFunctions::parse_jalali(StringView text) const {
    return converter_->parse(text, CalendarKind::JALALI);
}

Result<String> DateFunctions::jalali_to_gregorian(StringView jalali_text) const {
    auto date = parse_jalali(jalali_text);
    if (date.is_error()) {
        return date.error();
    }
    return to_text(converter_->to_gregorian(date.value()));
}

Result<String> DateFunctions::gregorian_to_jalali(StringView gregorian_text) const {
    auto date = converter_->parse(gregorian_text, CalendarKind::GREGORIAN);
    if (date.is_error()) {
        return date.error();
    }
    return to_text(converter_->to_jalali(date.value()));
}

Result<Int32> DateFunctions::diff_days(StringView start, StringView end) const {
    auto start_date = parse_jalali(start);
    if (start_date.is_error()) {
        return start_date.error();
    }
    auto end_date = parse_jalali(end);
    if (end_date.is_error()) {
        return end_date.error();
    }
    return narrow_to_int32(arithmetic_.diff_days(start_date.value(), end_date.value()), "diff_days");
}

Result<Int32> DateFunctions::diff_days_with_adjustment(StringView start, StringView end,
                                                       Int32 adjustment) const {
    auto start_date = parse_jalali(start);
    if (start_date.is_error()) {
        return start_date.error();
    }
    auto end_date = parse_jalali(end);
    if (end_date.is_error()) {
        return end_date.error();
    }
    return narrow_to_int32(
        arithmetic_.diff_days_with_adjustment(start_date.value(), end_date.value(), adjustment),
        "diff_days_with_adjustment");
}

Result<String> DateFunctions::add_days(StringView jalali_text, Int32 days) const {
    auto date = parse_jalali(jalali_text);
    if (date.is_error()) {
        return date.error();
    }
    return to_text(arithmetic_.add_days(date.value(), days));
}

Result<String> DateFunctions::add_months(StringView jalali_text, Int32 months) const {
    auto date = parse_jalali(jalali_text);
    if (date.is_error()) {
        return date.error();
    }
    return to_text(arithmetic_.add_months(date.value(), months));
}

Result<String> DateFunctions::now() const {
    const auto today = std::chrono::floor<std::chrono::days>(clock_());
    const calendar::DayCount days = today.time_since_epoch().count();
    return to_text(converter_->from_day_count(days, CalendarKind::JALALI));
}

Result<bool> DateFunctions::is_leap_year(StringView jalali_text) const {
    auto date = parse_jalali(jalali_text);
    if (date.is_error()) {
        return date.error();
    }
    return converter_->is_leap_year(date.value().year(), CalendarKind::JALALI);
}

Result<String> DateFunctions::period_state(StringView jalali_text, Int32 anchor_day) const {
    auto date = parse_jalali(jalali_text);
    if (date.is_error()) {
        return date.error();
    }
    auto state = classifier_.classify(date.value(), anchor_day);
    if (state.is_error()) {
        return state.error();
    }
    return String(calendar::period_state_name(state.value()));
}

} // namespace jalali::functions
