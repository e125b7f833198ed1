#pragma once

// C++20 utilities for SpreadBridge: strict numeric parsing of untrusted venue
// fields and the log/timestamp formatting shared by the feed and fan-out paths.

#include <string>
#include <string_view>
#include <format>
#include <optional>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <cstdint>
#include <chrono>
#include <nlohmann/json.hpp>

namespace Cpp20Utils {

inline char asciiToLower(unsigned char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c + ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline char asciiToUpper(unsigned char c) {
    if (c >= 'a' && c <= 'z') {
        return static_cast<char>(c - ('a' - 'A'));
    }
    return static_cast<char>(c);
}

inline bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) return false;
    for (size_t i = 0; i < lhs.size(); ++i) {
        if (asciiToLower(static_cast<unsigned char>(lhs[i])) != asciiToLower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

inline std::string toUpperAscii(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = asciiToUpper(static_cast<unsigned char>(c));
    return out;
}

/**
 * Strict string-to-double conversion.
 * The whole string (ignoring surrounding blanks) must be consumed and the value must be finite.
 * @return Converted value, or std::nullopt when the text is not a number
 */
inline std::optional<double> strictStringToDouble(std::string_view str) {
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) str.remove_prefix(1);
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t')) str.remove_suffix(1);
    if (str.empty()) return std::nullopt;

    // strtod needs a terminated buffer; venue fields are short
    const std::string buffer(str);
    char* end = nullptr;
    const double value = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() + buffer.size()) return std::nullopt;
    if (!std::isfinite(value)) return std::nullopt;
    return value;
}

/**
 * Read a numeric field that the venue may send either as a JSON number or as a string.
 * @return std::nullopt for missing keys, nulls, booleans, objects, or unparsable strings
 */
inline std::optional<double> numberField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_number()) {
        const double v = it->get<double>();
        if (!std::isfinite(v)) return std::nullopt;
        return v;
    }
    if (it->is_string()) return strictStringToDouble(it->get_ref<const std::string&>());
    return std::nullopt;
}

/**
 * Read a field that must be a non-empty string (numbers are rendered, e.g. symbol tokens).
 */
inline std::optional<std::string> textField(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object()) return std::nullopt;
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (it->is_number_integer()) return std::to_string(it->get<std::int64_t>());
    return std::nullopt;
}

/**
 * UTC ISO8601 rendering with microseconds, e.g. "2024-01-25T09:15:00.123456Z"
 */
inline std::string formatIsoTimestamp(std::chrono::system_clock::time_point timestamp) {
    return std::format("{:%FT%T}Z", std::chrono::floor<std::chrono::microseconds>(timestamp));
}

inline std::string formatTickLog(std::string_view symbol, double ltp, std::uint64_t tickCount) {
    return std::format("📊 Tick {} ltp={:.2f} [#{}]", symbol, ltp, tickCount);
}

inline std::string formatFanoutLog(std::string_view symbol, std::size_t delivered, std::size_t dropped) {
    if (dropped == 0) {
        return std::format("📡 {} → {} subscribers", symbol, delivered);
    }
    return std::format("📡 {} → {} subscribers ({} dropped)", symbol, delivered, dropped);
}

inline std::string formatErrorLog(std::string_view context, std::string_view detail) {
    return std::format("❌ {}: {}", context, detail);
}

} // namespace Cpp20Utils
