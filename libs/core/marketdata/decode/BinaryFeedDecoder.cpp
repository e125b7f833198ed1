#include "BinaryFeedDecoder.hpp"
#include "../model/Instruments.hpp"

namespace BinaryFeedDecoder {

namespace {

std::uint32_t readLe32(std::span<const std::uint8_t> bytes) {
    return static_cast<std::uint32_t>(bytes[0])
         | (static_cast<std::uint32_t>(bytes[1]) << 8)
         | (static_cast<std::uint32_t>(bytes[2]) << 16)
         | (static_cast<std::uint32_t>(bytes[3]) << 24);
}

} // namespace

std::optional<Tick> decode(std::span<const std::uint8_t> packet,
                           std::chrono::system_clock::time_point receivedAt) {
    if (packet.size() < kMinPacketSize) return std::nullopt;

    // Bytes 0 (mode) and 1 (exchange type) are not needed: every mode starts with the
    // LTP layout and tokens are unique across the instrument table.
    const auto tokenBytes = packet.subspan(kTokenOffset, kTokenLength);
    std::string_view token(reinterpret_cast<const char*>(tokenBytes.data()), tokenBytes.size());
    while (!token.empty() && token.back() == '\0') token.remove_suffix(1);
    if (token.empty()) return std::nullopt;

    const auto* info = instruments::findByToken(token);
    if (!info) return std::nullopt;

    const std::uint32_t paise = readLe32(packet.subspan(kLtpOffset, 4));

    Tick tick;
    tick.instrument_id = std::string(info->token);
    tick.symbol = std::string(info->symbol);
    tick.last_traded_price = static_cast<double>(paise) / 100.0;
    tick.received_at = receivedAt;
    return tick;
}

std::optional<Tick> decode(std::string_view packet,
                           std::chrono::system_clock::time_point receivedAt) {
    return decode(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(packet.data()), packet.size()),
                  receivedAt);
}

} // namespace BinaryFeedDecoder
