/*
SpreadBridge — spread_scan main.cpp
Role: One-shot recommendation dump: logs in, fetches price and Greeks, prints ranked spreads as JSON.
Usage: spread_scan [SYMBOL] [strikes_range] [bridge.json]
*/
#include "Log.hpp"
#include "marketdata/BridgeContext.hpp"
#include "marketdata/MarketDataService.hpp"
#include "marketdata/auth/SessionManager.hpp"
#include "marketdata/model/MarketJson.hpp"
#include <charconv>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

static constexpr auto CAT = "Scan";

int main(int argc, char* argv[])
{
    const std::string symbol     = argc > 1 ? argv[1] : "NIFTY";
    const std::string configPath = argc > 3 ? argv[3] : "bridge.json";

    std::optional<int> rangeArg;
    if (argc > 2) {
        const std::string_view arg(argv[2]);
        int value = 0;
        const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
        if (ec != std::errc{} || ptr != arg.data() + arg.size() || value < 0) {
            LOG_E(CAT, "Invalid strikes range '{}'", arg);
            return 2;
        }
        rangeArg = value;
    }

    try {
        BridgeContext context(BridgeConfig::load(configPath));
        const int range = rangeArg.value_or(context.config().analysis.strikesRange);

        LOG_I(CAT, "Scanning {} spreads (strikes range {})", symbol, range);
        auto result = context.service().recommendations(symbol, range);
        if (!isOk(result)) {
            LOG_E(CAT, "Scan failed: {}", errorText(result));
            context.session().logout();
            return 1;
        }

        const auto& spreads = std::get<std::vector<SpreadRecommendation>>(result);
        const nlohmann::json out = {
            {"symbol", symbol},
            {"count", spreads.size()},
            {"recommendations", spreads},
        };
        std::puts(out.dump(2).c_str());
        LOG_I(CAT, "{} recommendations", spreads.size());

        context.session().logout();
    } catch (const std::exception& ex) {
        LOG_E(CAT, "Startup failed: {}", ex.what());
        return 1;
    }
    return 0;
}
