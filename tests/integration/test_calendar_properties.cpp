#include "../framework/test_framework.hpp"
#include "jalali/calendar/arithmetic.hpp"
#include "jalali/calendar/date_text.hpp"
#include "jalali/calendar/period.hpp"
#include <format>

using namespace jalali;
using namespace jalali::calendar;
using namespace jalali::test;

namespace {

const CalendarConverter& converter() {
    static const CalendarConverter instance;
    return instance;
}

const DateArithmetic& arithmetic() {
    static const DateArithmetic instance;
    return instance;
}

CalendarDate from_days(DayCount days, CalendarKind calendar) {
    auto date = converter().from_day_count(days, calendar);
    JALALI_THROW_IF_ERROR(date);
    return date.value();
}

} // anonymous namespace

void test_jalali_round_trip_whole_range() {
    // Every Jalali date whose Gregorian image is representable
    const DayCount first = converter().min_day_count(CalendarKind::JALALI);
    const DayCount last = converter().max_day_count(CalendarKind::GREGORIAN);
    
    for (DayCount days = first; days <= last; ++days) {
        auto jalali_date = from_days(days, CalendarKind::JALALI);
        auto gregorian = converter().to_gregorian(jalali_date);
        if (gregorian.is_error()) {
            throw std::runtime_error("to_gregorian failed for " + format_date_text(jalali_date));
        }
        auto back = converter().to_jalali(gregorian.value());
        if (back.is_error() || !(back.value() == jalali_date)) {
            throw std::runtime_error("Round trip failed for " + format_date_text(jalali_date));
        }
    }
}

void test_gregorian_round_trip_whole_range() {
    const DayCount first = converter().min_day_count(CalendarKind::JALALI);
    const DayCount last = converter().max_day_count(CalendarKind::GREGORIAN);
    
    for (DayCount days = first; days <= last; ++days) {
        auto gregorian = from_days(days, CalendarKind::GREGORIAN);
        auto jalali_date = converter().to_jalali(gregorian);
        auto back = jalali_date.and_then([](const CalendarDate& d) { return converter().to_gregorian(d); });
        if (back.is_error() || !(back.value() == gregorian)) {
            throw std::runtime_error("Round trip failed for " + format_date_text(gregorian));
        }
    }
}

void test_day_counts_are_contiguous() {
    // Consecutive day counts walk the calendar one valid date at a time
    DayCount days = converter().min_day_count(CalendarKind::JALALI);
    for (Int32 year = MIN_YEAR; year <= MAX_YEAR; ++year) {
        for (UInt8 month = 1; month <= 12; ++month) {
            const UInt8 length = converter().days_in_month(year, month, CalendarKind::JALALI);
            for (UInt8 day = 1; day <= length; ++day) {
                auto date = converter().make_date(year, month, day, CalendarKind::JALALI);
                if (date.is_error() || converter().to_day_count(date.value()) != days) {
                    throw std::runtime_error(std::format("Day count gap at {}/{}/{}", year, month, day));
                }
                ++days;
            }
        }
    }
    ASSERT_EQ(days - 1, converter().max_day_count(CalendarKind::JALALI));
}

void test_leap_consistency() {
    for (Int32 year = MIN_YEAR; year <= MAX_YEAR; ++year) {
        const bool leap = converter().is_leap_year(year, CalendarKind::JALALI);
        const bool has_day_30 = converter().make_date(year, 12, 30, CalendarKind::JALALI).is_success();
        ASSERT_EQ(leap, has_day_30);
    }
}

void test_antisymmetry_and_additive_identity() {
    const DayCount first = converter().min_day_count(CalendarKind::JALALI);
    const DayCount last = converter().max_day_count(CalendarKind::JALALI);
    const Int64 deltas[] = {-40000, -366, -1, 0, 1, 29, 365, 12053, 40000};
    
    for (DayCount days = first; days <= last; days += 997) {
        auto start = from_days(days, CalendarKind::JALALI);
        for (Int64 delta : deltas) {
            auto moved = arithmetic().add_days(start, delta);
            if (days + delta < first || days + delta > last) {
                ASSERT_ERROR_CODE(moved, ErrorCode::DATE_OVERFLOW);
                continue;
            }
            ASSERT_OK(moved);
            ASSERT_EQ(arithmetic().diff_days(start, moved.value()), delta);
            ASSERT_EQ(arithmetic().diff_days(moved.value(), start), -delta);
        }
    }
}

void test_add_months_stays_valid() {
    for (Int32 year = 1390; year <= 1420; ++year) {
        for (UInt8 month = 1; month <= 12; ++month) {
            auto date = converter().make_date(year, month, 31 - (month > 6 ? 1 : 0) - (month == 12 ? 1 : 0),
                                              CalendarKind::JALALI);
            ASSERT_OK(date);
            for (Int64 months = 1; months <= 24; ++months) {
                auto moved = arithmetic().add_months(date.value(), months);
                ASSERT_OK(moved);
                const Int64 total = (year * 12 + month - 1) + months;
                ASSERT_EQ(moved.value().year(), total / 12);
                ASSERT_EQ(moved.value().month(), total % 12 + 1);
                ASSERT_LE(moved.value().day(), date.value().day());
            }
        }
    }
}

void test_period_state_always_classifies() {
    PeriodClassifier classifier;
    auto date = converter().parse("1403/01/01", CalendarKind::JALALI).value();
    for (int i = 0; i < 366 * 2; ++i) {
        for (Int32 anchor = 1; anchor <= 31; ++anchor) {
            auto state = classifier.classify(date, anchor);
            ASSERT_OK(state);
            ASSERT_TRUE(state.value() != PeriodState::UNKNOWN);
        }
        date = arithmetic().add_days(date, 1).value();
    }
}

int main() {
    TestSuite suite("Calendar Property Tests");
    
    suite.add_test("Jalali Round Trip Whole Range", test_jalali_round_trip_whole_range);
    suite.add_test("Gregorian Round Trip Whole Range", test_gregorian_round_trip_whole_range);
    suite.add_test("Day Counts Are Contiguous", test_day_counts_are_contiguous);
    suite.add_test("Leap Consistency", test_leap_consistency);
    suite.add_test("Antisymmetry and Additive Identity", test_antisymmetry_and_additive_identity);
    suite.add_test("add_months Stays Valid", test_add_months_stays_valid);
    suite.add_test("Period State Always Classifies", test_period_state_always_classifies);
    
    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
