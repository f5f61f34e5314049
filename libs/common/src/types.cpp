#include "jalali/common/types.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace jalali {

String to_lower(StringView str) {
    String result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

String trim(StringView str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == StringView::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return String(str.substr(start, end - start + 1));
}

std::vector<String> split(StringView str, char delimiter) {
    std::vector<String> result;
    Size start = 0, end = 0;
    while ((end = str.find(delimiter, start)) != StringView::npos) {
        result.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }
    result.emplace_back(str.substr(start));
    return result;
}

String join(const std::vector<String>& strings, StringView delimiter) {
    if (strings.empty()) return "";
    String result = strings[0];
    for (Size i = 1; i < strings.size(); ++i) {
        result += delimiter;
        result += strings[i];
    }
    return result;
}

bool starts_with(StringView str, StringView prefix) {
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

String pad_left(StringView str, Size width, char pad) {
    if (str.size() >= width) return String(str);
    return String(width - str.size(), pad) + String(str);
}

String pad_right(StringView str, Size width, char pad) {
    if (str.size() >= width) return String(str);
    return String(str) + String(width - str.size(), pad);
}

Version Version::parse(StringView sv) {
    Version v{};
    auto parts = split(sv, '.');
    auto field = [](const String& s) -> UInt16 {
        UInt16 value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        return ec == std::errc{} ? value : UInt16{0};
    };
    if (parts.size() >= 1) v.major = field(parts[0]);
    if (parts.size() >= 2) v.minor = field(parts[1]);
    if (parts.size() >= 3) {
        auto dash = parts[2].find('-');
        v.patch = field(parts[2].substr(0, dash));
        if (dash != String::npos) v.pre_release = parts[2].substr(dash + 1);
    }
    return v;
}

} // namespace jalali
