#pragma once
#include <string>

// Static venue secrets. Pure data; loaded once by BridgeConfig.
struct CredentialStore {
    std::string apiKey;       // X-PrivateKey
    std::string clientCode;   // account id
    std::string password;     // trading PIN
    std::string totpSecret;   // base32 TOTP seed

    [[nodiscard]] bool complete() const {
        return !apiKey.empty() && !clientCode.empty() && !password.empty() && !totpSecret.empty();
    }
};
