#pragma once
// JSON views of the market records (snake_case keys, as served to clients).
#include <nlohmann/json.hpp>
#include "MarketTypes.h"

void to_json(nlohmann::json& j, const Tick& t);
void to_json(nlohmann::json& j, const OptionContract& c);
void to_json(nlohmann::json& j, const SpreadRecommendation& s);
void to_json(nlohmann::json& j, const MoverRow& m);
