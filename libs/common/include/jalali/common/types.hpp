#pragma once
// =============================================================================
// Jalali Calendar Engine - Core Types (C++20)
// Version: 1.2.0
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <variant>
#include <memory>
#include <functional>
#include <chrono>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <format>
#include <concepts>
#include <type_traits>
#include <filesystem>
#include <source_location>
#include <unordered_map>

namespace jalali {

// =============================================================================
// Fundamental Types
// =============================================================================
using Byte = std::uint8_t;
using Int8 = std::int8_t;
using UInt8 = std::uint8_t;
using Int16 = std::int16_t;
using UInt16 = std::uint16_t;
using Int32 = std::int32_t;
using UInt32 = std::uint32_t;
using Int64 = std::int64_t;
using UInt64 = std::uint64_t;
using Float64 = double;
using Size = std::size_t;

// =============================================================================
// String Types
// =============================================================================
using String = std::string;
using StringView = std::string_view;

// =============================================================================
// Container Types
// =============================================================================
template<typename T> using Vector = std::vector<T>;

// =============================================================================
// Smart Pointers
// =============================================================================
template<typename T> using UniquePtr = std::unique_ptr<T>;
template<typename T> using SharedPtr = std::shared_ptr<T>;

template<typename T, typename... Args>
[[nodiscard]] UniquePtr<T> make_unique(Args&&... args) {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template<typename T, typename... Args>
[[nodiscard]] SharedPtr<T> make_shared(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// =============================================================================
// Optional and Variant
// =============================================================================
template<typename T> using Optional = std::optional<T>;
template<typename... Ts> using Variant = std::variant<Ts...>;
inline constexpr std::nullopt_t nullopt = std::nullopt;

// =============================================================================
// Time Types
// =============================================================================
using Clock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using SystemTimePoint = SystemClock::time_point;
using Duration = Clock::duration;
using Nanoseconds = std::chrono::nanoseconds;
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// =============================================================================
// Filesystem
// =============================================================================
using Path = std::filesystem::path;

// =============================================================================
// C++20 Concepts
// =============================================================================
template<typename T>
concept Integral = std::is_integral_v<T>;

// =============================================================================
// AtomicCounter - Thread-safe counter
// =============================================================================
template<typename T = UInt64>
class AtomicCounter {
private:
    std::atomic<T> value_{0};
    
public:
    AtomicCounter() = default;
    explicit AtomicCounter(T initial) : value_(initial) {}
    
    T operator++() noexcept { return value_.fetch_add(1, std::memory_order_relaxed) + 1; }
    T operator++(int) noexcept { return value_.fetch_add(1, std::memory_order_relaxed); }
    T operator+=(T v) noexcept { return value_.fetch_add(v, std::memory_order_relaxed) + v; }
    
    [[nodiscard]] T get() const noexcept { return value_.load(std::memory_order_relaxed); }
    void reset() noexcept { value_.store(0, std::memory_order_relaxed); }
    
    operator T() const noexcept { return get(); }
};

// =============================================================================
// Version
// =============================================================================
struct Version {
    UInt16 major = 0;
    UInt16 minor = 0;
    UInt16 patch = 0;
    String pre_release;
    
    [[nodiscard]] String to_string() const {
        String s = std::format("{}.{}.{}", major, minor, patch);
        if (!pre_release.empty()) s += "-" + pre_release;
        return s;
    }
    
    auto operator<=>(const Version&) const = default;
    static Version parse(StringView sv);
};

// Library version reported by the command line host
inline const Version LIBRARY_VERSION{1, 2, 0, ""};

// =============================================================================
// String Utilities
// =============================================================================
[[nodiscard]] String to_lower(StringView str);
[[nodiscard]] String trim(StringView str);
[[nodiscard]] std::vector<String> split(StringView str, char delimiter);
[[nodiscard]] String join(const std::vector<String>& strings, StringView delimiter);
[[nodiscard]] bool starts_with(StringView str, StringView prefix);
[[nodiscard]] String pad_left(StringView str, Size width, char pad = ' ');
[[nodiscard]] String pad_right(StringView str, Size width, char pad = ' ');

} // namespace jalali
