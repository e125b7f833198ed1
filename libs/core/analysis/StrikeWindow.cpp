#include "StrikeWindow.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string_view>

std::vector<OptionContract> selectStrikeWindow(std::span<const OptionContract> contracts,
                                               double currentPrice,
                                               int strikeInterval,
                                               int range) {
    if (strikeInterval <= 0) {
        throw std::invalid_argument("selectStrikeWindow: strike interval must be positive");
    }

    std::vector<OptionContract> out;
    if (range < 0) return out;

    const double interval = strikeInterval;
    // Ties go to the even multiple (default FE_TONEAREST), e.g. 22025 -> 22000 on a 50 grid.
    const double atm = std::nearbyint(currentPrice / interval) * interval;
    const double lo = atm - range * interval;
    const double hi = atm + range * interval;

    for (const auto& c : contracts) {
        if (c.strike < lo || c.strike > hi) continue;
        // Strikes come from decimal text; accept exact grid points only.
        const double steps = (c.strike - atm) / interval;
        if (std::fabs(steps - std::round(steps)) > 1e-9) continue;
        out.push_back(c);
    }

    std::stable_sort(out.begin(), out.end(), [](const OptionContract& a, const OptionContract& b) {
        if (a.strike != b.strike) return a.strike < b.strike;
        return std::string_view(toString(a.option_type)) < std::string_view(toString(b.option_type));
    });
    return out;
}
