#include "jalali/common/error.hpp"
#include <sstream>
#include <iomanip>

namespace jalali {

const char* JalaliErrorCategory::name() const noexcept { return "jalali"; }

String JalaliErrorCategory::message(int code) const {
    switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::UNKNOWN_ERROR: return "Unknown error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::OUT_OF_RANGE: return "Out of range";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::NOT_IMPLEMENTED: return "Not implemented";
        case ErrorCode::FORMAT_ERROR: return "Malformed date text";
        case ErrorCode::INVALID_DATE: return "Invalid date";
        case ErrorCode::DATE_OVERFLOW: return "Date out of representable range";
        case ErrorCode::IO_ERROR: return "I/O error";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::CONFIG_ERROR: return "Configuration error";
    }
    return "Unknown jalali error";
}

bool JalaliErrorCategory::equivalent(int code, const std::error_condition& condition) const noexcept {
    return default_error_condition(code) == condition;
}

const std::error_category& jalali_error_category() noexcept {
    static JalaliErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode e) noexcept {
    return {static_cast<int>(e), jalali_error_category()};
}

ErrorInfo::ErrorInfo(ErrorCode c, String msg, String comp, std::source_location loc)
    : code(c), message(std::move(msg)), component(std::move(comp))
    , timestamp(SystemClock::now()), location(loc) {}

ErrorInfo& ErrorInfo::with_context(String key, String value) {
    context[std::move(key)] = std::move(value);
    return *this;
}

String ErrorInfo::input() const {
    auto it = context.find("input");
    return it != context.end() ? it->second : String{};
}

String ErrorInfo::to_string() const {
    return std::format("[{}] {}: {}", static_cast<int>(code), 
        jalali_error_category().message(static_cast<int>(code)), message);
}

String ErrorInfo::to_json() const {
    std::ostringstream oss;
    oss << R"({"code":)" << static_cast<int>(code)
        << R"(,"name":")" << error_code_name(code) << R"(")"
        << R"(,"message":")" << message << R"(")"
        << R"(,"component":")" << component << R"(")"
        << R"(,"input":")" << input() << R"("})";
    return oss.str();
}

String ErrorInfo::format_full() const {
    std::ostringstream oss;
    oss << "Error: " << to_string() << "\n";
    oss << "  Component: " << (component.empty() ? "unknown" : component) << "\n";
    oss << "  Location: " << location.file_name() << ":" << location.line() << "\n";
    oss << "  Function: " << location.function_name() << "\n";
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [k, v] : context) {
            oss << "    " << k << ": " << v << "\n";
        }
    }
    return oss.str();
}

JalaliException::JalaliException(ErrorInfo info)
    : std::runtime_error(info.to_string()), error_info_(std::move(info)) {}

JalaliException::JalaliException(ErrorCode code, const String& message, std::source_location loc)
    : std::runtime_error(message), error_info_(code, message, "", loc) {}

String JalaliException::detailed_message() const {
    return error_info_.format_full();
}

ErrorStatistics& ErrorStatistics::instance() {
    static ErrorStatistics stats;
    return stats;
}

void ErrorStatistics::record_error(const ErrorInfo& info) {
    std::unique_lock lock(mutex_);
    error_counts_[info.code]++;
    if (!info.component.empty()) {
        component_errors_[info.component]++;
    }
}

void ErrorStatistics::reset() {
    std::unique_lock lock(mutex_);
    error_counts_.clear();
    component_errors_.clear();
}

UInt64 ErrorStatistics::get_error_count(ErrorCode code) const {
    std::shared_lock lock(mutex_);
    auto it = error_counts_.find(code);
    return it != error_counts_.end() ? it->second.get() : 0;
}

UInt64 ErrorStatistics::get_component_error_count(const String& component) const {
    std::shared_lock lock(mutex_);
    auto it = component_errors_.find(component);
    return it != component_errors_.end() ? it->second.get() : 0;
}

UInt64 ErrorStatistics::total_errors() const {
    UInt64 total = 0;
    std::shared_lock lock(mutex_);
    for (const auto& [_, count] : error_counts_) {
        total += count.get();
    }
    return total;
}

StringView error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR: return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::NOT_IMPLEMENTED: return "NOT_IMPLEMENTED";
        case ErrorCode::FORMAT_ERROR: return "FORMAT_ERROR";
        case ErrorCode::INVALID_DATE: return "INVALID_DATE";
        case ErrorCode::DATE_OVERFLOW: return "OVERFLOW";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorCode::CONFIG_ERROR: return "CONFIG_ERROR";
    }
    return "UNKNOWN";
}

StringView error_category_name(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c >= 1000 && c < 1100) return "General";
    if (c >= 1100 && c < 1200) return "Calendar";
    if (c >= 1200 && c < 1300) return "I/O";
    if (c >= 1300 && c < 1400) return "Configuration";
    return "Unknown";
}

String format_error_code(ErrorCode code) {
    return std::format("JAL{:04d}", static_cast<int>(code));
}

} // namespace jalali
