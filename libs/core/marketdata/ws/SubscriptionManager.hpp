#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model/Instruments.hpp"

// Builds the upstream subscribe/unsubscribe control frames for the desired instruments.
class SubscriptionManager {
public:
    enum class Action : int { Unsubscribe = 0, Subscribe = 1 };

    explicit SubscriptionManager(std::string correlationId = "price_feed", int mode = 1)
        : m_correlationId(std::move(correlationId))
        , m_mode(mode)
    {
        for (const auto& i : instruments::kIndices) {
            m_desired[i.exchangeType].emplace_back(i.token);
        }
    }

    void setDesiredTokens(int exchangeType, std::vector<std::string> tokens) {
        if (tokens.empty()) {
            m_desired.erase(exchangeType);
        } else {
            m_desired[exchangeType] = std::move(tokens);
        }
    }
    const std::map<int, std::vector<std::string>>& desired() const { return m_desired; }

    std::string buildSubscribeMsg() const { return buildMsg(Action::Subscribe); }
    std::string buildUnsubscribeMsg() const { return buildMsg(Action::Unsubscribe); }

private:
    std::string m_correlationId;
    int m_mode;
    std::map<int, std::vector<std::string>> m_desired;   // exchangeType -> tokens

    std::string buildMsg(Action action) const {
        if (m_desired.empty()) return {};
        nlohmann::json tokenList = nlohmann::json::array();
        for (const auto& [exchangeType, tokens] : m_desired) {
            tokenList.push_back({{"exchangeType", exchangeType}, {"tokens", tokens}});
        }
        nlohmann::json msg;
        msg["correlationID"] = m_correlationId;
        msg["action"] = static_cast<int>(action);
        msg["params"] = {{"mode", m_mode}, {"tokenList", tokenList}};
        return msg.dump();
    }
};
