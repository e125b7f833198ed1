#pragma once
#include "marketdata/decode/BinaryFeedDecoder.hpp"
#include <cstdint>
#include <string>
#include <vector>

/// Upstream binary packet builders matching the venue's LTP layout.
namespace fixtures {

/// 51-byte packet: mode, exchange type, NUL-padded token, LTP in paise (little-endian).
inline std::vector<std::uint8_t> ltpPacket(const std::string& token,
                                           std::uint32_t ltpPaise,
                                           std::uint8_t mode = 1,
                                           std::uint8_t exchangeType = 1,
                                           std::size_t size = BinaryFeedDecoder::kMinPacketSize) {
    std::vector<std::uint8_t> p(size, 0);
    if (size > BinaryFeedDecoder::kModeOffset) p[BinaryFeedDecoder::kModeOffset] = mode;
    if (size > 1) p[1] = exchangeType;
    for (std::size_t i = 0; i < token.size() && i < BinaryFeedDecoder::kTokenLength; ++i) {
        const std::size_t at = BinaryFeedDecoder::kTokenOffset + i;
        if (at < size) p[at] = static_cast<std::uint8_t>(token[i]);
    }
    for (std::size_t b = 0; b < 4; ++b) {
        const std::size_t at = BinaryFeedDecoder::kLtpOffset + b;
        if (at < size) p[at] = static_cast<std::uint8_t>((ltpPaise >> (8 * b)) & 0xFF);
    }
    return p;
}

/// Same packet as a WebSocket payload string.
inline std::string ltpFrame(const std::string& token, std::uint32_t ltpPaise, std::uint8_t mode = 1) {
    const auto p = ltpPacket(token, ltpPaise, mode);
    return std::string(p.begin(), p.end());
}

inline constexpr const char* kNiftyToken     = "99926000";
inline constexpr const char* kBankNiftyToken = "99926009";

} // namespace fixtures
