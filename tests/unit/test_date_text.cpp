#include "../framework/test_framework.hpp"
#include "jalali/calendar/date_text.hpp"
#include "jalali/calendar/converter.hpp"

using namespace jalali;
using namespace jalali::calendar;
using namespace jalali::test;

void test_parse_jalali_text() {
    auto raw = parse_date_text("1403/05/29", '/');
    ASSERT_OK(raw);
    ASSERT_EQ(raw.value().year, 1403);
    ASSERT_EQ(raw.value().month, 5);
    ASSERT_EQ(raw.value().day, 29);
}

void test_parse_gregorian_text() {
    auto raw = parse_date_text("2024-08-19", '-');
    ASSERT_OK(raw);
    ASSERT_TRUE(raw.value() == (RawDate{2024, 8, 19}));
}

void test_parse_does_not_validate_calendar() {
    auto raw = parse_date_text("1403/13/45", '/');
    ASSERT_OK(raw);
    ASSERT_EQ(raw.value().month, 13);
    ASSERT_EQ(raw.value().day, 45);
    
    auto negative_year = parse_date_text("-5/01/01", '/');
    ASSERT_OK(negative_year);
    ASSERT_EQ(negative_year.value().year, -5);
}

void test_parse_accepts_plus_and_short_fields() {
    auto raw = parse_date_text("+1403/+5/7", '/');
    ASSERT_OK(raw);
    ASSERT_TRUE(raw.value() == (RawDate{1403, 5, 7}));
}

void test_wrong_segment_count() {
    ASSERT_ERROR_CODE(parse_date_text("1403/05", '/'), ErrorCode::FORMAT_ERROR);
    ASSERT_ERROR_CODE(parse_date_text("1403/05/29/1", '/'), ErrorCode::FORMAT_ERROR);
    ASSERT_ERROR_CODE(parse_date_text("", '/'), ErrorCode::FORMAT_ERROR);
    ASSERT_ERROR_CODE(parse_date_text("2024-08-19", '/'), ErrorCode::FORMAT_ERROR);
    ASSERT_ERROR_CODE(parse_date_text("1403/05/29", '-'), ErrorCode::FORMAT_ERROR);
}

void test_bad_fields_name_the_field() {
    auto year = parse_date_text("14x3/05/29", '/');
    ASSERT_ERROR_CODE(year, ErrorCode::FORMAT_ERROR);
    ASSERT_TRUE(year.error().message.find("year") != String::npos);
    ASSERT_EQ(year.error().input(), "14x3/05/29");
    ASSERT_EQ(year.error().component, "date_text");
    
    auto month = parse_date_text("1403//29", '/');
    ASSERT_ERROR_CODE(month, ErrorCode::FORMAT_ERROR);
    ASSERT_TRUE(month.error().message.find("month") != String::npos);
    
    auto day = parse_date_text("1403/05/ 29", '/');
    ASSERT_ERROR_CODE(day, ErrorCode::FORMAT_ERROR);
    ASSERT_TRUE(day.error().message.find("day") != String::npos);
}

void test_field_width_limits() {
    ASSERT_ERROR_CODE(parse_date_text("1403/256/01", '/'), ErrorCode::FORMAT_ERROR);
    ASSERT_ERROR_CODE(parse_date_text("1403/05/-1", '/'), ErrorCode::FORMAT_ERROR);
    ASSERT_ERROR_CODE(parse_date_text("99999999999/01/01", '/'), ErrorCode::FORMAT_ERROR);
    ASSERT_ERROR_CODE(parse_date_text("+-5/01/01", '/'), ErrorCode::FORMAT_ERROR);
    ASSERT_ERROR_CODE(parse_date_text("+/01/01", '/'), ErrorCode::FORMAT_ERROR);
    ASSERT_OK(parse_date_text("1403/255/255", '/'));
}

void test_format_pads_fields() {
    CalendarConverter converter;
    auto jalali_date = converter.make_date(1403, 5, 7, CalendarKind::JALALI);
    ASSERT_OK(jalali_date);
    ASSERT_EQ(format_date_text(jalali_date.value()), "1403/05/07");
    
    auto early = converter.make_date(33, 1, 1, CalendarKind::JALALI);
    ASSERT_EQ(format_date_text(early.value()), "0033/01/01");
    
    auto gregorian = converter.make_date(622, 3, 21, CalendarKind::GREGORIAN);
    ASSERT_EQ(format_date_text(gregorian.value()), "0622-03-21");
}

void test_delimiters() {
    ASSERT_EQ(delimiter_for(CalendarKind::JALALI), '/');
    ASSERT_EQ(delimiter_for(CalendarKind::GREGORIAN), '-');
}

int main() {
    TestSuite suite("Date Text Tests");
    
    suite.add_test("Parse Jalali Text", test_parse_jalali_text);
    suite.add_test("Parse Gregorian Text", test_parse_gregorian_text);
    suite.add_test("Parse Does Not Validate Calendar", test_parse_does_not_validate_calendar);
    suite.add_test("Parse Accepts Plus and Short Fields", test_parse_accepts_plus_and_short_fields);
    suite.add_test("Wrong Segment Count", test_wrong_segment_count);
    suite.add_test("Bad Fields Name the Field", test_bad_fields_name_the_field);
    suite.add_test("Field Width Limits", test_field_width_limits);
    suite.add_test("Format Pads Fields", test_format_pads_fields);
    suite.add_test("Delimiters", test_delimiters);
    
    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
