#pragma once
#include <string>
#include <string_view>

// Venue rejection carried as a value: the venue's error code plus a readable cause.
class AuthError {
public:
    explicit AuthError(std::string code, std::string message = {});

    [[nodiscard]] const std::string& code() const { return m_code; }
    [[nodiscard]] const std::string& message() const { return m_message; }

    /// "AB1000: Invalid Email Or Password"
    [[nodiscard]] std::string what() const;

    /// Readable cause for a venue code; "Unknown error" when the code is not in the table.
    static std::string_view describe(std::string_view code);

private:
    std::string m_code;
    std::string m_message;
};

namespace auth_codes {
    inline constexpr const char* kNotSpecified   = "AB2000";
    inline constexpr const char* kInternal       = "AB2001";
    inline constexpr const char* kClientNotLogin = "AB1011";
    inline constexpr const char* kInvalidRefresh = "AB8050";
}
