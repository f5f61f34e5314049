#include "../framework/test_framework.hpp"
#include "jalali/calendar/converter.hpp"
#include "jalali/calendar/date_text.hpp"

using namespace jalali;
using namespace jalali::calendar;
using namespace jalali::test;

namespace {

const CalendarConverter& converter() {
    static const CalendarConverter instance;
    return instance;
}

CalendarDate jalali_date(Int32 y, Int32 m, Int32 d) {
    auto date = converter().make_date(y, m, d, CalendarKind::JALALI);
    JALALI_THROW_IF_ERROR(date);
    return date.value();
}

CalendarDate gregorian_date(Int32 y, Int32 m, Int32 d) {
    auto date = converter().make_date(y, m, d, CalendarKind::GREGORIAN);
    JALALI_THROW_IF_ERROR(date);
    return date.value();
}

String to_gregorian_text(Int32 y, Int32 m, Int32 d) {
    auto result = converter().to_gregorian(jalali_date(y, m, d));
    JALALI_THROW_IF_ERROR(result);
    return format_date_text(result.value());
}

String to_jalali_text(Int32 y, Int32 m, Int32 d) {
    auto result = converter().to_jalali(gregorian_date(y, m, d));
    JALALI_THROW_IF_ERROR(result);
    return format_date_text(result.value());
}

} // anonymous namespace

void test_make_date_validation() {
    ASSERT_OK(converter().make_date(1403, 12, 30, CalendarKind::JALALI));
    ASSERT_ERROR_CODE(converter().make_date(1404, 12, 30, CalendarKind::JALALI), ErrorCode::INVALID_DATE);
    ASSERT_ERROR_CODE(converter().make_date(1403, 7, 31, CalendarKind::JALALI), ErrorCode::INVALID_DATE);
    ASSERT_ERROR_CODE(converter().make_date(1403, 13, 1, CalendarKind::JALALI), ErrorCode::INVALID_DATE);
    ASSERT_ERROR_CODE(converter().make_date(1403, 0, 1, CalendarKind::JALALI), ErrorCode::INVALID_DATE);
    ASSERT_ERROR_CODE(converter().make_date(1403, 1, 0, CalendarKind::JALALI), ErrorCode::INVALID_DATE);
    ASSERT_ERROR_CODE(converter().make_date(0, 1, 1, CalendarKind::JALALI), ErrorCode::INVALID_DATE);
    ASSERT_ERROR_CODE(converter().make_date(10000, 1, 1, CalendarKind::JALALI), ErrorCode::INVALID_DATE);
    
    ASSERT_OK(converter().make_date(2024, 2, 29, CalendarKind::GREGORIAN));
    ASSERT_ERROR_CODE(converter().make_date(2023, 2, 29, CalendarKind::GREGORIAN), ErrorCode::INVALID_DATE);
    ASSERT_ERROR_CODE(converter().make_date(1900, 2, 29, CalendarKind::GREGORIAN), ErrorCode::INVALID_DATE);
    ASSERT_ERROR_CODE(converter().make_date(2024, 4, 31, CalendarKind::GREGORIAN), ErrorCode::INVALID_DATE);
}

void test_make_date_fields() {
    auto date = jalali_date(1403, 5, 29);
    ASSERT_EQ(date.year(), 1403);
    ASSERT_EQ(date.month(), 5);
    ASSERT_EQ(date.day(), 29);
    ASSERT_TRUE(date.is_jalali());
    ASSERT_FALSE(date.is_gregorian());
    ASSERT_TRUE(date.to_raw() == (RawDate{1403, 5, 29}));
    ASSERT_TRUE(date == jalali_date(1403, 5, 29));
    ASSERT_FALSE(date == jalali_date(1403, 5, 28));
}

void test_parse() {
    auto date = converter().parse("1403/05/29", CalendarKind::JALALI);
    ASSERT_OK(date);
    ASSERT_TRUE(date.value() == jalali_date(1403, 5, 29));
    
    auto malformed = converter().parse("1403-05-29", CalendarKind::JALALI);
    ASSERT_ERROR_CODE(malformed, ErrorCode::FORMAT_ERROR);
    
    auto invalid = converter().parse("1404/12/30", CalendarKind::JALALI);
    ASSERT_ERROR_CODE(invalid, ErrorCode::INVALID_DATE);
    ASSERT_EQ(invalid.error().input(), "1404/12/30");
    ASSERT_EQ(invalid.error().component, "converter");
    
    ASSERT_OK(converter().parse("2024-08-19", CalendarKind::GREGORIAN));
    ASSERT_ERROR_CODE(converter().parse("2023-02-29", CalendarKind::GREGORIAN), ErrorCode::INVALID_DATE);
}

void test_day_count_pivot() {
    ASSERT_EQ(converter().to_day_count(gregorian_date(1970, 1, 1)), 0);
    ASSERT_EQ(converter().to_day_count(jalali_date(1348, 10, 11)), 0);
    ASSERT_EQ(converter().to_day_count(jalali_date(1, 1, 1)), CalendarConverter::JALALI_EPOCH);
    ASSERT_EQ(converter().to_day_count(gregorian_date(622, 3, 21)), CalendarConverter::JALALI_EPOCH);
    ASSERT_EQ(days_from_civil(2000, 3, 1), 11017);
    ASSERT_TRUE(civil_from_days(11017) == (RawDate{2000, 3, 1}));
    ASSERT_TRUE(civil_from_days(-1) == (RawDate{1969, 12, 31}));
}

void test_known_conversions() {
    ASSERT_EQ(to_gregorian_text(1, 1, 1), "0622-03-21");
    ASSERT_EQ(to_gregorian_text(1403, 5, 29), "2024-08-19");
    ASSERT_EQ(to_gregorian_text(1403, 1, 1), "2024-03-20");
    ASSERT_EQ(to_gregorian_text(1403, 12, 30), "2025-03-20");
    ASSERT_EQ(to_gregorian_text(1404, 1, 1), "2025-03-21");
    ASSERT_EQ(to_gregorian_text(1399, 12, 30), "2021-03-20");
    ASSERT_EQ(to_gregorian_text(1354, 1, 1), "1975-03-21");
    
    ASSERT_EQ(to_jalali_text(2024, 8, 19), "1403/05/29");
    ASSERT_EQ(to_jalali_text(1970, 1, 1), "1348/10/11");
    ASSERT_EQ(to_jalali_text(2000, 1, 1), "1378/10/11");
    ASSERT_EQ(to_jalali_text(2021, 3, 21), "1400/01/01");
    ASSERT_EQ(to_jalali_text(9999, 12, 31), "9378/10/10");
}

void test_same_calendar_is_identity() {
    auto date = jalali_date(1403, 5, 29);
    auto same = converter().to_jalali(date);
    ASSERT_OK(same);
    ASSERT_TRUE(same.value() == date);
    
    auto gregorian = gregorian_date(2024, 8, 19);
    ASSERT_TRUE(converter().to_gregorian(gregorian).value() == gregorian);
}

void test_conversion_overflow() {
    auto beyond = converter().to_gregorian(jalali_date(9999, 12, 29));
    ASSERT_ERROR_CODE(beyond, ErrorCode::DATE_OVERFLOW);
    ASSERT_EQ(beyond.error().input(), "9999/12/29");
    
    ASSERT_ERROR_CODE(converter().to_jalali(gregorian_date(622, 3, 20)), ErrorCode::DATE_OVERFLOW);
    ASSERT_ERROR_CODE(converter().to_jalali(gregorian_date(1, 1, 1)), ErrorCode::DATE_OVERFLOW);
}

void test_from_day_count_range() {
    const auto lowest = converter().min_day_count(CalendarKind::JALALI);
    const auto highest = converter().max_day_count(CalendarKind::JALALI);
    
    ASSERT_TRUE(converter().from_day_count(lowest, CalendarKind::JALALI).value() == jalali_date(1, 1, 1));
    ASSERT_TRUE(converter().from_day_count(highest, CalendarKind::JALALI).value() == jalali_date(9999, 12, 29));
    ASSERT_ERROR_CODE(converter().from_day_count(lowest - 1, CalendarKind::JALALI), ErrorCode::DATE_OVERFLOW);
    ASSERT_ERROR_CODE(converter().from_day_count(highest + 1, CalendarKind::JALALI), ErrorCode::DATE_OVERFLOW);
    
    ASSERT_EQ(converter().min_day_count(CalendarKind::GREGORIAN), -719162);
    ASSERT_ERROR_CODE(converter().from_day_count(-719163, CalendarKind::GREGORIAN), ErrorCode::DATE_OVERFLOW);
}

void test_year_boundaries() {
    // Last day of a leap year and first day of the next
    auto last = converter().from_day_count(converter().to_day_count(jalali_date(1403, 12, 30)),
                                           CalendarKind::JALALI);
    ASSERT_TRUE(last.value() == jalali_date(1403, 12, 30));
    auto next = converter().from_day_count(converter().to_day_count(jalali_date(1403, 12, 30)) + 1,
                                           CalendarKind::JALALI);
    ASSERT_TRUE(next.value() == jalali_date(1404, 1, 1));
    
    // Month 7 starts after six 31-day months
    auto mehr = converter().from_day_count(converter().to_day_count(jalali_date(1403, 1, 1)) + 186,
                                           CalendarKind::JALALI);
    ASSERT_TRUE(mehr.value() == jalali_date(1403, 7, 1));
}

void test_custom_rule_injection() {
    class EveryYearLeap : public LeapYearRule {
    public:
        bool is_leap_year(Int32) const override { return true; }
        StringView name() const override { return "every-year"; }
    };
    
    CalendarConverter custom(std::make_shared<const EveryYearLeap>());
    ASSERT_EQ(custom.leap_rule().name(), "every-year");
    ASSERT_OK(custom.make_date(1404, 12, 30, CalendarKind::JALALI));
    ASSERT_TRUE(custom.is_leap_year(1404, CalendarKind::JALALI));
    ASSERT_FALSE(custom.is_leap_year(2023, CalendarKind::GREGORIAN));
    
    CalendarConverter fallback(nullptr);
    ASSERT_EQ(fallback.leap_rule().name(), "arithmetic-33");
}

void test_custom_rule_is_tabulated() {
    // No closed-form count: the converter puts a table in front of it
    class ArithmeticByCounting : public LeapYearRule {
    public:
        bool is_leap_year(Int32 year) const override { return ArithmeticLeapRule{}.is_leap_year(year); }
        StringView name() const override { return "arithmetic-by-counting"; }
    };
    
    CalendarConverter custom(std::make_shared<const ArithmeticByCounting>());
    ASSERT_TRUE(dynamic_cast<const TabulatedLeapRule*>(&custom.leap_rule()) != nullptr);
    ASSERT_EQ(custom.leap_rule().name(), "arithmetic-by-counting");
    ASSERT_TRUE(dynamic_cast<const ArithmeticLeapRule*>(&converter().leap_rule()) != nullptr);
    
    for (Int32 year : {1, 1348, 1403, 1404, 9377, 9999}) {
        auto date = custom.make_date(year, 12, 29, CalendarKind::JALALI);
        ASSERT_OK(date);
        ASSERT_EQ(custom.to_day_count(date.value()), converter().to_day_count(date.value()));
        auto back = custom.from_day_count(custom.to_day_count(date.value()), CalendarKind::JALALI);
        ASSERT_TRUE(back.value() == date.value());
    }
    ASSERT_EQ(custom.max_day_count(CalendarKind::JALALI), converter().max_day_count(CalendarKind::JALALI));
}

int main() {
    TestSuite suite("Calendar Converter Tests");
    
    suite.add_test("make_date Validation", test_make_date_validation);
    suite.add_test("make_date Fields", test_make_date_fields);
    suite.add_test("Parse", test_parse);
    suite.add_test("Day-Count Pivot", test_day_count_pivot);
    suite.add_test("Known Conversions", test_known_conversions);
    suite.add_test("Same Calendar Is Identity", test_same_calendar_is_identity);
    suite.add_test("Conversion Overflow", test_conversion_overflow);
    suite.add_test("from_day_count Range", test_from_day_count_range);
    suite.add_test("Year Boundaries", test_year_boundaries);
    suite.add_test("Custom Rule Injection", test_custom_rule_injection);
    suite.add_test("Custom Rule Is Tabulated", test_custom_rule_is_tabulated);
    
    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
