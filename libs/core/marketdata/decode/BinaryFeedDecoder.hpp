#pragma once
// ─────────────────────────────────────────────────────────────
// BinaryFeedDecoder – upstream binary packet → Tick.
// Pure and stateless; fails closed (std::nullopt) on any bad input.
// ─────────────────────────────────────────────────────────────
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include "../model/MarketTypes.h"

namespace BinaryFeedDecoder {

// Packet layout (little-endian)
inline constexpr std::size_t kMinPacketSize = 51;
inline constexpr std::size_t kModeOffset    = 0;
inline constexpr std::size_t kTokenOffset   = 2;
inline constexpr std::size_t kTokenLength   = 25;
inline constexpr std::size_t kLtpOffset     = 43;

std::optional<Tick> decode(std::span<const std::uint8_t> packet,
                           std::chrono::system_clock::time_point receivedAt);

/// Convenience overload for WebSocket payloads held in a std::string.
std::optional<Tick> decode(std::string_view packet,
                           std::chrono::system_clock::time_point receivedAt);

} // namespace BinaryFeedDecoder
