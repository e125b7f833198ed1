/*
SpreadBridge — SessionManager
Role: Owns the venue Session; acquires it by password+TOTP login, refreshes it, and guards its validity window.
Inputs/Outputs: Takes a CredentialStore and an IVenueApi; hands out Session value snapshots.
Threading: Thread-safe. Session fields sit behind a shared_mutex; refresh/login attempts are serialized
           on a separate mutex so at most one attempt is ever in flight.
Integration: Used by MarketDataService before every REST call and by FeedConnection before every connect.
Observability: Logs login, refresh, fallback and logout through the app category; failures via sbLog_Warning.
Related: SessionManager.cpp, AuthError.hpp, Totp.hpp, IVenueApi.hpp.
Assumptions: The CredentialStore and IVenueApi outlive this object.
*/
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <variant>
#include "AuthError.hpp"
#include "CredentialStore.hpp"
#include "../model/MarketTypes.h"

class IVenueApi;

class SessionManager {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using AuthResult = std::variant<Session, AuthError>;

    static constexpr std::chrono::hours   kLoginLifetime{27};
    static constexpr std::chrono::hours   kRefreshLifetime{23};
    static constexpr std::chrono::minutes kExpiryGuard{5};

    SessionManager(const CredentialStore& credentials, IVenueApi& api, Clock clock = {});

    /// Full login with a fresh TOTP code. On failure the session is left empty.
    AuthResult authenticate();

    /// Exchange the refresh token for new tokens. False (never throws) when no refresh
    /// token is held or the venue rejects; the previous session is then left untouched.
    bool refresh();

    /// Tokens present and now < expires_at - 5min.
    [[nodiscard]] bool isValid() const;

    /// No I/O when already valid; otherwise refresh, then authenticate as fallback.
    /// Callers that queued behind an in-flight attempt return that attempt's outcome.
    bool ensureValid();

    /// Best-effort venue logout, then the session is emptied.
    void logout();

    [[nodiscard]] Session snapshot() const;

    [[nodiscard]] const std::string& clientCode() const { return m_credentials.clientCode; }
    [[nodiscard]] const std::string& apiKey() const { return m_credentials.apiKey; }

    SessionManager(const SessionManager&)            = delete;
    SessionManager& operator=(const SessionManager&) = delete;

private:
    // Callers hold m_attemptMx.
    AuthResult doAuthenticate();
    bool doRefresh();

    std::chrono::system_clock::time_point now() const;
    std::chrono::system_clock::time_point expiryFor(const std::string& accessToken,
                                                    std::chrono::hours lifetime) const;

    const CredentialStore& m_credentials;
    IVenueApi&             m_api;
    Clock                  m_clock;

    mutable std::shared_mutex m_sessionMx;
    Session                   m_session;

    std::mutex m_attemptMx;
    std::atomic<std::uint64_t> m_attemptGeneration{0};   // bumped by each ensureValid attempt
    bool m_lastAttemptOk = false;                        // guarded by m_attemptMx
};
