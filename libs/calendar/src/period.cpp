// =============================================================================
// Jalali Calendar Engine - Custom Period Classifier Implementation
// Version: 1.2.0
// =============================================================================

#include "jalali/calendar/period.hpp"
#include "jalali/calendar/date_text.hpp"
#include "jalali/common/logging.hpp"

namespace jalali::calendar {

namespace {

bool anchor_in_month_range(const PeriodContext& ctx) {
    return ctx.anchor_day >= 1 && ctx.anchor_day <= 31;
}

// A negative anchor compares as an unsigned value above every day of month
bool month_end_before_anchor(const PeriodContext& ctx) {
    return ctx.day == ctx.month_length &&
           (ctx.anchor_day < 0 || static_cast<Int32>(ctx.day) <= ctx.anchor_day);
}

bool new_year_rollover(const PeriodContext& ctx) {
    return ctx.day == 1 && ctx.month == 1 &&
           (ctx.anchor_day >= 30 || ctx.anchor_day == static_cast<Int32>(ctx.previous_day));
}

bool short_month_rollover(const PeriodContext& ctx) {
    if (ctx.day != 1) return false;
    if (ctx.month >= 2 && ctx.month <= 7) return ctx.anchor_day == 31;
    if (ctx.month >= 8 && ctx.month <= 12) return ctx.anchor_day >= 30;
    return false;
}

bool anchor_day(const PeriodContext& ctx) {
    return anchor_in_month_range(ctx) && static_cast<Int32>(ctx.day) == ctx.anchor_day;
}

bool day_after_anchor(const PeriodContext& ctx) {
    return anchor_in_month_range(ctx) && static_cast<Int32>(ctx.day) == ctx.anchor_day + 1;
}

bool inside_period(const PeriodContext& ctx) {
    return anchor_in_month_range(ctx);
}

constexpr std::array<PeriodRule, PeriodClassifier::RULE_COUNT> RULES = {{
    {"month-end-before-anchor", &month_end_before_anchor, PeriodState::END},
    {"new-year-rollover",       &new_year_rollover,       PeriodState::START},
    {"short-month-rollover",    &short_month_rollover,    PeriodState::START},
    {"anchor-day",              &anchor_day,              PeriodState::END},
    {"day-after-anchor",        &day_after_anchor,        PeriodState::START},
    {"inside-period",           &inside_period,           PeriodState::MIDDLE}
}};

const PeriodRule* first_match(const PeriodContext& ctx) {
    for (const auto& rule : RULES) {
        if (rule.matches(ctx)) return &rule;
    }
    return nullptr;
}

} // anonymous namespace

PeriodClassifier::PeriodClassifier(SharedPtr<const CalendarConverter> converter)
    : converter_(converter ? std::move(converter) : std::make_shared<const CalendarConverter>()) {}

const std::array<PeriodRule, PeriodClassifier::RULE_COUNT>& PeriodClassifier::rules() {
    return RULES;
}

PeriodState PeriodClassifier::evaluate(const PeriodContext& ctx) {
    const auto* rule = first_match(ctx);
    return rule ? rule->state : PeriodState::UNKNOWN;
}

StringView PeriodClassifier::matching_rule(const PeriodContext& ctx) {
    const auto* rule = first_match(ctx);
    return rule ? rule->label : "fallthrough";
}

PeriodContext PeriodClassifier::make_context(const CalendarDate& jalali_date, Int32 anchor) const {
    PeriodContext ctx;
    ctx.year = jalali_date.year();
    ctx.month = jalali_date.month();
    ctx.day = jalali_date.day();
    ctx.anchor_day = anchor;
    ctx.month_length = converter_->days_in_month(ctx.year, ctx.month, CalendarKind::JALALI);
    
    if (ctx.day > 1) {
        ctx.previous_day = static_cast<UInt8>(ctx.day - 1);
    } else if (ctx.month > 1) {
        ctx.previous_day = converter_->days_in_month(ctx.year, static_cast<UInt8>(ctx.month - 1),
                                                     CalendarKind::JALALI);
    } else {
        ctx.previous_day = converter_->days_in_month(ctx.year - 1, 12, CalendarKind::JALALI);
    }
    return ctx;
}

Result<PeriodState> PeriodClassifier::classify(const CalendarDate& date, Int32 anchor) const {
    auto jalali_date = converter_->to_jalali(date);
    if (jalali_date.is_error()) {
        return jalali_date.error();
    }
    
    const auto ctx = make_context(jalali_date.value(), anchor);
    const auto* rule = first_match(ctx);
    const auto state = rule ? rule->state : PeriodState::UNKNOWN;
    
    auto logger = logging::LogManager::instance().get_logger("calendar");
    logger->trace("period_state({}, {}) = {} via {}", format_date_text(jalali_date.value()), anchor,
                  period_state_name(state), rule ? rule->label : StringView("fallthrough"));
    return state;
}

} // namespace jalali::calendar
