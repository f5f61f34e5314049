#pragma once
// =============================================================================
// Jalali Calendar Engine - Function Registry
// Version: 1.2.0
// Binds host-visible function names to text-argument invokers
// =============================================================================

#include "jalali/functions/date_functions.hpp"
#include "jalali/common/logging.hpp"
#include <map>

namespace jalali::functions {

// Arguments arrive as text; integers and booleans are returned as text
using FunctionInvoker = std::function<Result<String>(const Vector<String>& args)>;

struct FunctionDescriptor {
    String name;
    Vector<String> arguments;
    String description;
    FunctionInvoker invoker;
    Size optional_arguments = 0;    // trailing arguments that may be omitted
    
    [[nodiscard]] Size min_arguments() const { return arguments.size() - optional_arguments; }
    [[nodiscard]] Size max_arguments() const { return arguments.size(); }
    [[nodiscard]] String signature() const;
};

class FunctionRegistry {
private:
    std::map<String, FunctionDescriptor, std::less<>> functions_;
    SharedPtr<logging::Logger> logger_;
    
    mutable AtomicCounter<> invocation_count_;
    mutable AtomicCounter<> failure_count_;
    
    [[nodiscard]] Result<String> fail(ErrorInfo error) const;
    
public:
    FunctionRegistry();
    
    FunctionRegistry(const FunctionRegistry&) = delete;
    FunctionRegistry& operator=(const FunctionRegistry&) = delete;
    
    // INVALID_ARGUMENT for an empty name, a missing invoker or a duplicate
    [[nodiscard]] Result<void> define_function(FunctionDescriptor descriptor);
    
    [[nodiscard]] bool exists(StringView name) const;
    [[nodiscard]] const FunctionDescriptor* find(StringView name) const;
    [[nodiscard]] Vector<String> list_functions() const;
    [[nodiscard]] Size size() const { return functions_.size(); }
    
    // NOT_FOUND for an unknown name, INVALID_ARGUMENT for a wrong argument
    // count; every failure is recorded in ErrorStatistics
    [[nodiscard]] Result<String> invoke(StringView name, const Vector<String>& args) const;
    
    [[nodiscard]] UInt64 invocation_count() const { return invocation_count_.get(); }
    [[nodiscard]] UInt64 failure_count() const { return failure_count_.get(); }
    void reset_statistics();
};

// Integer argument as accepted by the invokers: optional sign, decimal digits
[[nodiscard]] Result<Int32> parse_int_argument(StringView name, StringView text);

// Registers the nine date functions under their host names. default_anchor_day
// makes the anchor argument of jalali_date_period_state optional.
[[nodiscard]] Result<void> register_date_functions(FunctionRegistry& registry,
                                                   SharedPtr<const DateFunctions> functions,
                                                   Optional<Int32> default_anchor_day = nullopt);

namespace names {
    constexpr StringView JALALI_TO_GREGORIAN = "jalali_date_to_gregorian";
    constexpr StringView GREGORIAN_TO_JALALI = "gregorian_date_to_jalali";
    constexpr StringView DIFF = "jalali_date_diff";
    constexpr StringView DIFF_WITH_ADDITION = "jalali_date_diff_with_addition";
    constexpr StringView ADD_DAYS = "jalali_date_add_days";
    constexpr StringView ADD_MONTHS = "jalali_date_add_months";
    constexpr StringView NOW = "jalali_date_now";
    constexpr StringView IS_LEAP_YEAR = "jalali_date_is_leap_year";
    constexpr StringView PERIOD_STATE = "jalali_date_period_state";
}

} // namespace jalali::functions
