// =============================================================================
// Jalali Calendar Engine - Function Registry Implementation
// Version: 1.2.0
// =============================================================================

#include "jalali/functions/registry.hpp"
#include <cctype>
#include <charconv>

namespace jalali::functions {

namespace {

constexpr StringView COMPONENT = "functions";

Result<String> int_text(const Result<Int32>& result) {
    if (result.is_error()) {
        return result.error();
    }
    return std::to_string(result.value());
}

Result<String> bool_text(const Result<bool>& result) {
    if (result.is_error()) {
        return result.error();
    }
    return String(result.value() ? "true" : "false");
}

} // anonymous namespace

// =============================================================================
// FunctionDescriptor
// =============================================================================

String FunctionDescriptor::signature() const {
    String out = name + "(";
    for (Size i = 0; i < arguments.size(); ++i) {
        if (i > 0) out += ", ";
        out += i >= min_arguments() ? "[" + arguments[i] + "]" : arguments[i];
    }
    out += ")";
    return out;
}

// =============================================================================
// FunctionRegistry
// =============================================================================

FunctionRegistry::FunctionRegistry()
    : logger_(logging::LogManager::instance().get_logger("functions")) {}

Result<void> FunctionRegistry::define_function(FunctionDescriptor descriptor) {
    if (descriptor.name.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Function name is empty");
    }
    if (!descriptor.invoker) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
            "Function " + descriptor.name + " has no invoker");
    }
    if (descriptor.optional_arguments > descriptor.arguments.size()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
            "Function " + descriptor.name + " has more optional than declared arguments");
    }
    if (exists(descriptor.name)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
            "Function already defined: " + descriptor.name);
    }
    
    logger_->trace("Defined {}", descriptor.signature());
    String key = descriptor.name;
    functions_.emplace(std::move(key), std::move(descriptor));
    return make_success();
}

bool FunctionRegistry::exists(StringView name) const {
    return functions_.find(name) != functions_.end();
}

const FunctionDescriptor* FunctionRegistry::find(StringView name) const {
    auto it = functions_.find(name);
    return it != functions_.end() ? &it->second : nullptr;
}

Vector<String> FunctionRegistry::list_functions() const {
    Vector<String> names;
    names.reserve(functions_.size());
    for (const auto& [name, _] : functions_) {
        names.push_back(name);
    }
    return names;
}

Result<String> FunctionRegistry::fail(ErrorInfo error) const {
    ++failure_count_;
    ErrorStatistics::instance().record_error(error);
    logger_->debug("{}", error.to_string());
    return error;
}

Result<String> FunctionRegistry::invoke(StringView name, const Vector<String>& args) const {
    ++invocation_count_;
    
    const auto* descriptor = find(name);
    if (!descriptor) {
        ErrorInfo error(ErrorCode::NOT_FOUND, std::format("Unknown function '{}'", name),
                        String(COMPONENT));
        error.with_context("input", String(name));
        return fail(std::move(error));
    }
    
    if (args.size() < descriptor->min_arguments() || args.size() > descriptor->max_arguments()) {
        ErrorInfo error(ErrorCode::INVALID_ARGUMENT,
            std::format("{} expects {} argument(s), got {}", descriptor->signature(),
                        descriptor->min_arguments() == descriptor->max_arguments()
                            ? std::to_string(descriptor->max_arguments())
                            : std::format("{}-{}", descriptor->min_arguments(),
                                          descriptor->max_arguments()),
                        args.size()),
            String(COMPONENT));
        error.with_context("input", join(args, ","));
        return fail(std::move(error));
    }
    
    logger_->trace("{}({})", name, join(args, ", "));
    auto result = descriptor->invoker(args);
    if (result.is_error()) {
        return fail(result.error());
    }
    return result;
}

void FunctionRegistry::reset_statistics() {
    invocation_count_.reset();
    failure_count_.reset();
}

// =============================================================================
// Argument parsing
// =============================================================================

Result<Int32> parse_int_argument(StringView name, StringView text) {
    StringView digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        if (!digits.empty() && !std::isdigit(static_cast<unsigned char>(digits.front()))) {
            digits = StringView();
        }
    }
    
    Int32 value = 0;
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(digits.data(), last, value);
    if (digits.empty() || ec != std::errc{} || ptr != last) {
        return make_input_error<Int32>(ErrorCode::INVALID_ARGUMENT,
            std::format("Argument '{}' must be a 32-bit integer, got '{}'", name, text),
            String(COMPONENT), text);
    }
    return value;
}

// =============================================================================
// Date function registration
// =============================================================================

Result<void> register_date_functions(FunctionRegistry& registry,
                                     SharedPtr<const DateFunctions> functions,
                                     Optional<Int32> default_anchor_day) {
    if (!functions) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "No date functions to register");
    }
    
    Vector<FunctionDescriptor> descriptors;
    
    descriptors.push_back({String(names::JALALI_TO_GREGORIAN), {"jalali_date"},
        "Convert a Jalali YYYY/MM/DD date to Gregorian YYYY-MM-DD",
        [functions](const Vector<String>& args) -> Result<String> {
            return functions->jalali_to_gregorian(args[0]);
        }});
    
    descriptors.push_back({String(names::GREGORIAN_TO_JALALI), {"gregorian_date"},
        "Convert a Gregorian YYYY-MM-DD date to Jalali YYYY/MM/DD",
        [functions](const Vector<String>& args) -> Result<String> {
            return functions->gregorian_to_jalali(args[0]);
        }});
    
    descriptors.push_back({String(names::DIFF), {"start", "end"},
        "Signed number of days from start to end",
        [functions](const Vector<String>& args) -> Result<String> {
            return int_text(functions->diff_days(args[0], args[1]));
        }});
    
    descriptors.push_back({String(names::DIFF_WITH_ADDITION), {"start", "end", "addition"},
        "Day difference with addition applied before the sign",
        [functions](const Vector<String>& args) -> Result<String> {
            auto addition = parse_int_argument("addition", args[2]);
            if (addition.is_error()) {
                return addition.error();
            }
            return int_text(functions->diff_days_with_adjustment(args[0], args[1], addition.value()));
        }});
    
    descriptors.push_back({String(names::ADD_DAYS), {"jalali_date", "days"},
        "Add a signed number of days to a Jalali date",
        [functions](const Vector<String>& args) -> Result<String> {
            auto days = parse_int_argument("days", args[1]);
            if (days.is_error()) {
                return days.error();
            }
            return functions->add_days(args[0], days.value());
        }});
    
    descriptors.push_back({String(names::ADD_MONTHS), {"jalali_date", "months"},
        "Add a positive number of months, clamping the day to the month length",
        [functions](const Vector<String>& args) -> Result<String> {
            auto months = parse_int_argument("months", args[1]);
            if (months.is_error()) {
                return months.error();
            }
            return functions->add_months(args[0], months.value());
        }});
    
    descriptors.push_back({String(names::NOW), {},
        "Current UTC date as Jalali YYYY/MM/DD",
        [functions](const Vector<String>&) -> Result<String> {
            return functions->now();
        }});
    
    descriptors.push_back({String(names::IS_LEAP_YEAR), {"jalali_date"},
        "true when the date's Jalali year is a leap year",
        [functions](const Vector<String>& args) -> Result<String> {
            return bool_text(functions->is_leap_year(args[0]));
        }});
    
    descriptors.push_back({String(names::PERIOD_STATE), {"jalali_date", "anchor_day"},
        "Start, Middle, End or Unknown within the period ending on anchor_day",
        [functions, default_anchor_day](const Vector<String>& args) -> Result<String> {
            if (args.size() < 2) {
                return functions->period_state(args[0], default_anchor_day.value_or(0));
            }
            auto anchor = parse_int_argument("anchor_day", args[1]);
            if (anchor.is_error()) {
                return anchor.error();
            }
            return functions->period_state(args[0], anchor.value());
        },
        default_anchor_day ? Size{1} : Size{0}});
    
    for (auto& descriptor : descriptors) {
        auto defined = registry.define_function(std::move(descriptor));
        if (defined.is_error()) {
            return defined;
        }
    }
    return make_success();
}

} // namespace jalali::functions
