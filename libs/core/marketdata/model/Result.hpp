#pragma once
#include <string>
#include <variant>
#include "../auth/AuthError.hpp"

// Caller supplied a symbol or parameter outside the supported set.
struct ValidationError {
    std::string field;
    std::string message;
};

// Expected failures travel as values; exceptions stay inside the I/O helpers.
template <typename T>
using Result = std::variant<T, AuthError, ValidationError>;

template <typename T>
[[nodiscard]] inline bool isOk(const Result<T>& r) { return std::holds_alternative<T>(r); }

template <typename T>
[[nodiscard]] inline std::string errorText(const Result<T>& r) {
    if (const auto* a = std::get_if<AuthError>(&r)) return a->what();
    if (const auto* v = std::get_if<ValidationError>(&r)) return v->field + ": " + v->message;
    return {};
}
