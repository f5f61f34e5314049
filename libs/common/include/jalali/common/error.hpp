#pragma once
// =============================================================================
// Jalali Calendar Engine - Error Handling (C++20)
// Version: 1.2.0
// =============================================================================

#include "jalali/common/types.hpp"
#include <system_error>
#include <stdexcept>

namespace jalali {

// =============================================================================
// Error Codes
// =============================================================================
enum class ErrorCode : Int32 {
    SUCCESS = 0,
    UNKNOWN_ERROR = 1000,
    INVALID_ARGUMENT = 1001,
    OUT_OF_RANGE = 1002,
    NOT_FOUND = 1003,
    NOT_IMPLEMENTED = 1004,
    
    // Calendar Errors (1100-1199)
    FORMAT_ERROR = 1100,
    INVALID_DATE = 1101,
    DATE_OVERFLOW = 1102,   // OVERFLOW collides with the <math.h> SVID macro
    
    // I/O Errors (1200-1299)
    IO_ERROR = 1200,
    FILE_NOT_FOUND = 1201,
    
    // Configuration Errors (1300-1399)
    CONFIG_ERROR = 1300
};

// =============================================================================
// Error Category
// =============================================================================
class JalaliErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override;
    [[nodiscard]] String message(int code) const override;
    [[nodiscard]] bool equivalent(int code, const std::error_condition& condition) const noexcept override;
};

[[nodiscard]] const std::error_category& jalali_error_category() noexcept;
[[nodiscard]] std::error_code make_error_code(ErrorCode e) noexcept;

} // namespace jalali

namespace std {
    template<>
    struct is_error_code_enum<jalali::ErrorCode> : true_type {};
}

namespace jalali {

// =============================================================================
// ErrorInfo - Detailed error information
// =============================================================================
struct ErrorInfo {
    ErrorCode code = ErrorCode::SUCCESS;
    String message;
    String component;
    SystemTimePoint timestamp = SystemClock::now();
    std::source_location location = std::source_location::current();
    std::unordered_map<String, String> context;
    
    ErrorInfo() = default;
    ErrorInfo(ErrorCode c, String msg, String comp = "",
              std::source_location loc = std::source_location::current());
    
    ErrorInfo& with_context(String key, String value);
    
    // Raw input that caused the failure, empty when not recorded
    [[nodiscard]] String input() const;
    
    [[nodiscard]] String to_string() const;
    [[nodiscard]] String to_json() const;
    [[nodiscard]] String format_full() const;
};

// =============================================================================
// Result<T> - Monadic error handling
// =============================================================================
template<typename T>
class Result {
private:
    Variant<T, ErrorInfo> data_;
    
public:
    Result(T value) : data_(std::move(value)) {}
    Result(ErrorInfo error) : data_(std::move(error)) {}
    
    [[nodiscard]] bool is_success() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_error() const { return std::holds_alternative<ErrorInfo>(data_); }
    
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }
    
    [[nodiscard]] ErrorInfo& error() & { return std::get<ErrorInfo>(data_); }
    [[nodiscard]] const ErrorInfo& error() const& { return std::get<ErrorInfo>(data_); }
    
    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    
    [[nodiscard]] T value_or(T default_val) const {
        return is_success() ? value() : std::move(default_val);
    }
    
    template<typename F>
    [[nodiscard]] auto map(F&& f) const -> Result<decltype(f(std::declval<T>()))> {
        if (is_success()) return f(value());
        return error();
    }
    
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> decltype(f(std::declval<T>())) {
        if (is_success()) return f(value());
        return error();
    }
    
    template<typename F>
    [[nodiscard]] Result<T> or_else(F&& f) const {
        if (is_success()) return *this;
        return f(error());
    }
    
    explicit operator bool() const { return is_success(); }
};

// Specialization for void
template<>
class Result<void> {
private:
    Optional<ErrorInfo> error_;
    
public:
    Result() = default;
    Result(ErrorInfo err) : error_(std::move(err)) {}
    
    [[nodiscard]] bool is_success() const { return !error_.has_value(); }
    [[nodiscard]] bool is_error() const { return error_.has_value(); }
    [[nodiscard]] const ErrorInfo& error() const { return *error_; }
    
    explicit operator bool() const { return is_success(); }
};

// =============================================================================
// Result Factory Functions
// =============================================================================
template<typename T>
[[nodiscard]] Result<T> make_success(T value) {
    return Result<T>(std::move(value));
}

[[nodiscard]] inline Result<void> make_success() {
    return Result<void>();
}

template<typename T>
[[nodiscard]] Result<T> make_error(ErrorCode code, String message,
                                   std::source_location loc = std::source_location::current()) {
    return Result<T>(ErrorInfo(code, std::move(message), "", loc));
}

template<typename T>
[[nodiscard]] Result<T> make_error(const ErrorInfo& info) {
    return Result<T>(info);
}

// Error raised by a named component on behalf of a raw input value
template<typename T>
[[nodiscard]] Result<T> make_input_error(ErrorCode code, String message, String component,
                                         StringView input,
                                         std::source_location loc = std::source_location::current()) {
    ErrorInfo info(code, std::move(message), std::move(component), loc);
    info.with_context("input", String(input));
    return Result<T>(std::move(info));
}

// =============================================================================
// Exception Hierarchy
// =============================================================================
class JalaliException : public std::runtime_error {
protected:
    ErrorInfo error_info_;
    
public:
    explicit JalaliException(ErrorInfo info);
    JalaliException(ErrorCode code, const String& message,
                    std::source_location loc = std::source_location::current());
    
    [[nodiscard]] ErrorCode code() const { return error_info_.code; }
    [[nodiscard]] const ErrorInfo& error_info() const { return error_info_; }
    [[nodiscard]] String detailed_message() const;
};

// =============================================================================
// Error Statistics
// =============================================================================
class ErrorStatistics {
private:
    std::unordered_map<ErrorCode, AtomicCounter<>> error_counts_;
    std::unordered_map<String, AtomicCounter<>> component_errors_;
    mutable std::shared_mutex mutex_;
    
public:
    static ErrorStatistics& instance();
    
    void record_error(const ErrorInfo& info);
    void reset();
    [[nodiscard]] UInt64 get_error_count(ErrorCode code) const;
    [[nodiscard]] UInt64 get_component_error_count(const String& component) const;
    [[nodiscard]] UInt64 total_errors() const;
};

// =============================================================================
// Helper Functions
// =============================================================================
[[nodiscard]] StringView error_code_name(ErrorCode code);
[[nodiscard]] StringView error_category_name(ErrorCode code);
[[nodiscard]] String format_error_code(ErrorCode code);

// =============================================================================
// Macros
// =============================================================================
#define JALALI_TRY(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) return _result.error(); \
    } while(0)

#define JALALI_THROW_IF_ERROR(expr) \
    do { \
        auto _result = (expr); \
        if (_result.is_error()) throw jalali::JalaliException(_result.error()); \
    } while(0)

} // namespace jalali
