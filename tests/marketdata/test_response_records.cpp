/*
SpreadBridge — ResponseRecords Tests
Role: Verify the fallible parse step between venue JSON and typed records
Testing Strategy: Golden venue replies → assert records, dropped counts and error codes
Coverage: Login/refresh replies, status:false mapping, LTP, Greeks rows, gainer/loser rows
*/
#include <gtest/gtest.h>
#include "marketdata/rest/ResponseRecords.hpp"
#include "fixtures/fake_venue_api.hpp"

using nlohmann::json;

// =============================================================================
// Venue Failures
// =============================================================================

TEST(ResponseRecords, StatusFalseMapsCodeAndMessage) {
    auto err = records::venueFailure(FakeVenueApi::failure("AB1000", "Invalid Email Or Password"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code(), "AB1000");
    EXPECT_EQ(err->message(), "Invalid Email Or Password");
}

TEST(ResponseRecords, StatusFalseWithoutCodeDefaultsToNotSpecified) {
    auto err = records::venueFailure(json{{"status", false}});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code(), "AB2000");
    EXPECT_EQ(err->message(), "Error not specified");
}

TEST(ResponseRecords, CamelCaseErrorCodeIsAccepted) {
    auto err = records::venueFailure(json{{"status", false}, {"errorCode", "AG8002"}});
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->what(), "AG8002: Token Expired");
}

TEST(ResponseRecords, NonObjectReplyIsInternalError) {
    auto err = records::venueFailure(json::array());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code(), "AB2001");
}

TEST(ResponseRecords, SuccessfulReplyIsNotAFailure) {
    EXPECT_FALSE(records::venueFailure(FakeVenueApi::ltpOk(1.0)).has_value());
    EXPECT_FALSE(records::venueFailure(json{{"data", json::object()}}).has_value());
}

// =============================================================================
// Login Replies
// =============================================================================

TEST(ResponseRecords, LoginReplyCarriesAllTokens) {
    auto reply = records::parseLoginReply(FakeVenueApi::loginOk("jwt", "refresh", "feed"));
    ASSERT_TRUE(reply.ok);
    EXPECT_EQ(reply.jwtToken, "jwt");
    EXPECT_EQ(reply.refreshToken, "refresh");
    EXPECT_EQ(reply.feedToken, "feed");
}

TEST(ResponseRecords, LoginReplyAcceptsSuccessFlag) {
    json reply{{"success", true}, {"data", {{"jwtToken", "jwt"}, {"refreshToken", "r"}, {"feedToken", "f"}}}};
    EXPECT_TRUE(records::parseLoginReply(reply).ok);
}

TEST(ResponseRecords, LoginRejectionKeepsVenueCode) {
    auto reply = records::parseLoginReply(FakeVenueApi::failure("AB1000", "Invalid Email Or Password"));
    EXPECT_FALSE(reply.ok);
    EXPECT_EQ(reply.errorCode, "AB1000");
    EXPECT_EQ(reply.message, "Invalid Email Or Password");
}

TEST(ResponseRecords, LoginWithoutJwtIsMalformed) {
    json reply{{"status", true}, {"data", {{"refreshToken", "r"}}}};
    auto parsed = records::parseLoginReply(reply);
    EXPECT_FALSE(parsed.ok);
    EXPECT_EQ(parsed.errorCode, "AB2001");
    EXPECT_EQ(parsed.message, "Malformed login response");
}

TEST(ResponseRecords, LoginWithoutRefreshOrFeedTokenIsMalformed) {
    for (const auto& reply : {FakeVenueApi::loginOk("jwt", "", "feed"), FakeVenueApi::loginOk("jwt", "refresh", "")}) {
        auto parsed = records::parseLoginReply(reply);
        EXPECT_FALSE(parsed.ok);
        EXPECT_EQ(parsed.errorCode, "AB2001");
        EXPECT_EQ(parsed.message, "Malformed login response");
    }
}

TEST(ResponseRecords, RefreshReplyMayOmitUnrotatedTokens) {
    auto parsed = records::parseRefreshReply(FakeVenueApi::loginOk("jwt_2"));
    ASSERT_TRUE(parsed.ok);
    EXPECT_EQ(parsed.jwtToken, "jwt_2");
    EXPECT_TRUE(parsed.refreshToken.empty());
    EXPECT_TRUE(parsed.feedToken.empty());
}

TEST(ResponseRecords, RefreshWithoutJwtIsMalformed) {
    json reply{{"status", true}, {"data", {{"refreshToken", "r"}}}};
    EXPECT_EQ(records::parseRefreshReply(reply).errorCode, "AB2001");
}

TEST(ResponseRecords, LoginWithNullDataIsMalformed) {
    json reply{{"status", true}, {"data", nullptr}};
    EXPECT_EQ(records::parseLoginReply(reply).errorCode, "AB2001");
}

// =============================================================================
// LTP
// =============================================================================

TEST(ResponseRecords, LtpFromNumberOrString) {
    EXPECT_DOUBLE_EQ(*records::parseLtp(FakeVenueApi::ltpOk(21450.75)), 21450.75);
    EXPECT_DOUBLE_EQ(*records::parseLtp(json{{"data", {{"ltp", "21450.75"}}}}), 21450.75);
}

TEST(ResponseRecords, LtpMissingOrGarbage) {
    EXPECT_FALSE(records::parseLtp(json{{"data", nullptr}}).has_value());
    EXPECT_FALSE(records::parseLtp(json{{"data", {{"ltp", "n/a"}}}}).has_value());
    EXPECT_FALSE(records::parseLtp(json{{"status", true}}).has_value());
}

// =============================================================================
// Greeks Rows
// =============================================================================

TEST(ResponseRecords, GreeksRowParsesStringNumbers) {
    auto c = records::parseGreeksRow(FakeVenueApi::greeksRow(22000, "CE", 0.52, 1500), "NIFTY");
    ASSERT_TRUE(c.has_value());
    EXPECT_DOUBLE_EQ(c->strike, 22000.0);
    EXPECT_DOUBLE_EQ(c->delta, 0.52);
    EXPECT_DOUBLE_EQ(c->gamma, 0.0012);
    EXPECT_DOUBLE_EQ(c->theta, -11.5);
    EXPECT_DOUBLE_EQ(c->vega, 12.3);
    EXPECT_DOUBLE_EQ(c->implied_volatility, 14.2);
    EXPECT_EQ(c->volume, 1500);
    EXPECT_EQ(c->option_type, OptionType::Call);
    EXPECT_EQ(c->expiry, "25JAN2024");
    EXPECT_EQ(c->underlying_symbol, "NIFTY");
}

TEST(ResponseRecords, PutDeltaStoredAsMagnitude) {
    auto c = records::parseGreeksRow(FakeVenueApi::greeksRow(21900, "PE", -0.45), "NIFTY");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->option_type, OptionType::Put);
    EXPECT_DOUBLE_EQ(c->delta, 0.45);
}

TEST(ResponseRecords, GreeksRowMissingRequiredKeyIsDropped) {
    for (const char* key : {"strikePrice", "delta", "gamma", "theta", "vega",
                            "impliedVolatility", "tradeVolume", "optionType"}) {
        auto row = FakeVenueApi::greeksRow(22000, "CE", 0.5);
        row.erase(key);
        EXPECT_FALSE(records::parseGreeksRow(row, "NIFTY").has_value()) << key;
    }
}

TEST(ResponseRecords, GreeksRowWithOutOfRangeVolumeIsDropped) {
    for (const char* volume : {"1e300", "-1e300", "9223372036854775808"}) {
        auto row = FakeVenueApi::greeksRow(22000, "CE", 0.5);
        row["tradeVolume"] = volume;
        EXPECT_FALSE(records::parseGreeksRow(row, "NIFTY").has_value()) << volume;
    }

    auto row = FakeVenueApi::greeksRow(22000, "CE", 0.5);
    row["tradeVolume"] = "123456789012";
    auto parsed = records::parseGreeksRow(row, "NIFTY");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->volume, 123456789012);
}

TEST(ResponseRecords, GreeksRowsCountDroppedRows) {
    auto bad = FakeVenueApi::greeksRow(22100, "CE", 0.4);
    bad["delta"] = "abc";
    const auto reply = FakeVenueApi::rowsReply(json::array({
        FakeVenueApi::greeksRow(22000, "CE", 0.5),
        bad,
        "not an object",
        FakeVenueApi::greeksRow(22000, "PE", -0.5),
    }));

    auto parsed = records::parseGreeksRows(reply, "NIFTY");
    EXPECT_EQ(parsed.rows.size(), 2u);
    EXPECT_EQ(parsed.dropped, 2u);
}

TEST(ResponseRecords, GreeksNonArrayDataYieldsNothing) {
    auto parsed = records::parseGreeksRows(json{{"status", true}, {"data", nullptr}}, "NIFTY");
    EXPECT_TRUE(parsed.rows.empty());
    EXPECT_EQ(parsed.dropped, 0u);
}

// =============================================================================
// Gainers / Losers Rows
// =============================================================================

TEST(ResponseRecords, MoverRowWithOptionalFields) {
    json row{{"tradingSymbol", "HDFCBANK25JAN24FUT"}, {"symbolToken", 35009}, {"percentChange", 4.12},
             {"ltp", 1650.5}, {"netChange", 65.3}, {"opnInterest", 1200}, {"netChangeOpnInterest", -50}};
    auto m = records::parseMoverRow(row);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->trading_symbol, "HDFCBANK25JAN24FUT");
    EXPECT_EQ(m->symbol_token, "35009");
    EXPECT_DOUBLE_EQ(m->percent_change, 4.12);
    EXPECT_DOUBLE_EQ(m->ltp, 1650.5);
    EXPECT_DOUBLE_EQ(m->net_change, 65.3);
    EXPECT_DOUBLE_EQ(m->open_interest, 1200.0);
    EXPECT_DOUBLE_EQ(m->net_change_open_interest, -50.0);
}

TEST(ResponseRecords, MoverRowOptionalFieldsDefaultToZero) {
    json row{{"tradingSymbol", "SBIN25JAN24FUT"}, {"symbolToken", "3045"}, {"percentChange", "-2.5"}};
    auto m = records::parseMoverRow(row);
    ASSERT_TRUE(m.has_value());
    EXPECT_DOUBLE_EQ(m->percent_change, -2.5);
    EXPECT_DOUBLE_EQ(m->ltp, 0.0);
    EXPECT_DOUBLE_EQ(m->open_interest, 0.0);
}

TEST(ResponseRecords, MoverRowsDropRowsWithoutPercentChange) {
    const auto reply = FakeVenueApi::rowsReply(json::array({
        {{"tradingSymbol", "A"}, {"symbolToken", "1"}, {"percentChange", 1.0}},
        {{"tradingSymbol", "B"}, {"symbolToken", "2"}},
    }));
    auto parsed = records::parseMoverRows(reply);
    ASSERT_EQ(parsed.rows.size(), 1u);
    EXPECT_EQ(parsed.rows[0].trading_symbol, "A");
    EXPECT_EQ(parsed.dropped, 1u);
}
