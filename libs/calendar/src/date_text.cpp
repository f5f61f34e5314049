// =============================================================================
// Jalali Calendar Engine - Date Text Parsing and Formatting Implementation
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/date_text.hpp"
#include <charconv>
#include <cctype>

namespace jalali::calendar {

namespace {

constexpr StringView COMPONENT = "date_text";

template<Integral T>
Optional<T> parse_field(StringView segment) {
    if (!segment.empty() && segment.front() == '+') {
        segment.remove_prefix(1);
        if (segment.empty() || !std::isdigit(static_cast<unsigned char>(segment.front()))) {
            return nullopt;
        }
    }
    if (segment.empty()) {
        return nullopt;
    }
    
    T value{};
    const char* last = segment.data() + segment.size();
    auto [ptr, ec] = std::from_chars(segment.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return nullopt;
    }
    return value;
}

} // anonymous namespace

Result<RawDate> parse_date_text(StringView text, char delimiter) {
    auto parts = split(text, delimiter);
    if (parts.size() != 3) {
        return make_input_error<RawDate>(ErrorCode::FORMAT_ERROR,
            std::format("Expected 3 '{}'-separated fields in '{}', found {}",
                        delimiter, text, parts.size()),
            String(COMPONENT), text);
    }
    
    auto year = parse_field<Int32>(parts[0]);
    if (!year) {
        return make_input_error<RawDate>(ErrorCode::FORMAT_ERROR,
            std::format("Invalid year '{}' in '{}'", parts[0], text),
            String(COMPONENT), text);
    }
    
    auto month = parse_field<UInt8>(parts[1]);
    if (!month) {
        return make_input_error<RawDate>(ErrorCode::FORMAT_ERROR,
            std::format("Invalid month '{}' in '{}'", parts[1], text),
            String(COMPONENT), text);
    }
    
    auto day = parse_field<UInt8>(parts[2]);
    if (!day) {
        return make_input_error<RawDate>(ErrorCode::FORMAT_ERROR,
            std::format("Invalid day '{}' in '{}'", parts[2], text),
            String(COMPONENT), text);
    }
    
    return RawDate{*year, *month, *day};
}

String format_date_text(const CalendarDate& date) {
    char delimiter = delimiter_for(date.calendar());
    return std::format("{:04}{}{:02}{}{:02}", date.year(), delimiter,
                       static_cast<UInt32>(date.month()), delimiter,
                       static_cast<UInt32>(date.day()));
}

} // namespace jalali::calendar
