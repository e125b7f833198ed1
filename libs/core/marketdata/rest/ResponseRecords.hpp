#pragma once
// ─────────────────────────────────────────────────────────────
// ResponseRecords – fallible parse of venue JSON replies into
// typed records. Nothing here throws; bad rows are dropped.
// ─────────────────────────────────────────────────────────────
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../auth/AuthError.hpp"
#include "../model/MarketTypes.h"

struct LoginReply {
    bool ok = false;
    std::string errorCode;
    std::string message;
    std::string jwtToken;
    std::string refreshToken;
    std::string feedToken;
};

template <typename Row>
struct ParsedRows {
    std::vector<Row> rows;
    std::size_t dropped = 0;
};

namespace records {

/// Venue rejection carried in a reply with an explicit `status:false`.
/// Code from `errorcode`/`errorCode` (default AB2000), message from `message`.
std::optional<AuthError> venueFailure(const nlohmann::json& reply);

/// Login reply. Success needs `status` or `success` true and a `data` object carrying
/// `jwtToken`, `refreshToken` and `feedToken`; otherwise ok=false with a code
/// (AB2001 "Malformed login response" when a token is missing).
LoginReply parseLoginReply(const nlohmann::json& reply);

/// Token-refresh reply. Same as parseLoginReply, but only `jwtToken` is required;
/// absent refresh/feed tokens come back empty.
LoginReply parseRefreshReply(const nlohmann::json& reply);

/// `data.ltp` of an LTP reply.
std::optional<double> parseLtp(const nlohmann::json& reply);

/// One option Greeks row. std::nullopt if any required key is missing or unparsable.
std::optional<OptionContract> parseGreeksRow(const nlohmann::json& row, const std::string& underlying);

/// Every row of `data`; a non-array `data` yields no rows.
ParsedRows<OptionContract> parseGreeksRows(const nlohmann::json& reply, const std::string& underlying);

std::optional<MoverRow> parseMoverRow(const nlohmann::json& row);
ParsedRows<MoverRow> parseMoverRows(const nlohmann::json& reply);

} // namespace records
