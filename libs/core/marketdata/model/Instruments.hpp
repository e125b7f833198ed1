#pragma once
#include <array>
#include <string_view>
#include <vector>
#include <string>

// Static table of the index instruments the bridge knows about.
struct InstrumentInfo {
    std::string_view symbol;
    std::string_view token;         // venue symbol token, also the feed instrument id
    std::string_view exchange;      // REST exchange segment
    int exchangeType;               // feed exchange type (1 = NSE_CM)
    int lotSize;
    int strikeInterval;
};

namespace instruments {
    inline constexpr int kDefaultLotSize = 50;

    inline constexpr std::array<InstrumentInfo, 2> kIndices{{
        {"NIFTY",     "99926000", "NSE", 1, 75, 50},
        {"BANKNIFTY", "99926009", "NSE", 1, 35, 100},
    }};

    inline const InstrumentInfo* findBySymbol(std::string_view symbol) {
        for (const auto& i : kIndices) {
            if (i.symbol == symbol) return &i;
        }
        return nullptr;
    }

    inline const InstrumentInfo* findByToken(std::string_view token) {
        for (const auto& i : kIndices) {
            if (i.token == token) return &i;
        }
        return nullptr;
    }

    inline int lotSizeFor(std::string_view symbol) {
        const auto* info = findBySymbol(symbol);
        return info ? info->lotSize : kDefaultLotSize;
    }

    inline std::vector<std::string> feedTokens() {
        std::vector<std::string> out;
        out.reserve(kIndices.size());
        for (const auto& i : kIndices) out.emplace_back(i.token);
        return out;
    }
}
