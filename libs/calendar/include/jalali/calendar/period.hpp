#pragma once
// =============================================================================
// Jalali Calendar Engine - Custom Period Classifier
// Version: 1.2.0
// Classifies a date against a recurring period that ends on an anchor day
// =============================================================================

#include "jalali/calendar/converter.hpp"
#include <array>

namespace jalali::calendar {

[[nodiscard]] constexpr StringView period_state_name(PeriodState state) {
    switch (state) {
        case PeriodState::START:   return "Start";
        case PeriodState::END:     return "End";
        case PeriodState::MIDDLE:  return "Middle";
        case PeriodState::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

// Facts about a Jalali date that the rules inspect
struct PeriodContext {
    Int32 year = 0;
    UInt8 month = 0;
    UInt8 day = 0;
    Int32 anchor_day = 0;
    UInt8 month_length = 0;     // length of month in year
    UInt8 previous_day = 0;     // day-of-month of the preceding date
};

struct PeriodRule {
    StringView label;
    bool (*matches)(const PeriodContext& ctx);
    PeriodState state;
};

class PeriodClassifier {
private:
    SharedPtr<const CalendarConverter> converter_;
    
public:
    static constexpr Size RULE_COUNT = 6;
    
    explicit PeriodClassifier(SharedPtr<const CalendarConverter> converter = nullptr);
    
    // Rows in evaluation order; the first match wins, no match means UNKNOWN
    [[nodiscard]] static const std::array<PeriodRule, RULE_COUNT>& rules();
    
    [[nodiscard]] static PeriodState evaluate(const PeriodContext& ctx);
    
    // Label of the first matching row, "fallthrough" when none matches
    [[nodiscard]] static StringView matching_rule(const PeriodContext& ctx);
    
    [[nodiscard]] PeriodContext make_context(const CalendarDate& jalali_date, Int32 anchor_day) const;
    
    // Gregorian input is converted to Jalali first
    [[nodiscard]] Result<PeriodState> classify(const CalendarDate& date, Int32 anchor_day) const;
};

} // namespace jalali::calendar
