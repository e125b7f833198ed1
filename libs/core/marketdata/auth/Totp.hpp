#pragma once
// ─────────────────────────────────────────────────────────────
// Totp – RFC 6238 one-time codes (HMAC-SHA1, 30 s step).
// ─────────────────────────────────────────────────────────────
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Totp {

/// Decode an RFC 4648 base32 string. Case-insensitive; spaces, dashes and '=' padding are ignored.
/// Throws std::invalid_argument on any other character.
std::vector<std::uint8_t> decodeBase32(std::string_view encoded);

/// HOTP value (RFC 4226) for a raw key and counter, zero-padded to `digits`.
std::string hotp(const std::vector<std::uint8_t>& key, std::uint64_t counter, int digits = 6);

/// Current TOTP code for a base32 seed. Throws std::invalid_argument for a bad seed.
std::string generate(std::string_view base32Secret,
                     std::chrono::system_clock::time_point now,
                     int digits = 6,
                     std::chrono::seconds step = std::chrono::seconds{30});

} // namespace Totp
