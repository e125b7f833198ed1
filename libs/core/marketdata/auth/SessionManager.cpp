/*
SpreadBridge — SessionManager
Role: Implements venue login, token refresh, validity checks and logout.
Threading: Public methods lock; the do* helpers assume the attempt lock is already held.
Observability: Never logs secrets or tokens, only outcomes and venue error codes.
*/
#include "SessionManager.hpp"
#include "Totp.hpp"
#include "../rest/IVenueApi.hpp"
#include "../rest/ResponseRecords.hpp"
#include "SpreadBridgeLogging.hpp"
#include <jwt-cpp/jwt.h>
#include <string_view>

SessionManager::SessionManager(const CredentialStore& credentials, IVenueApi& api, Clock clock)
    : m_credentials(credentials)
    , m_api(api)
    , m_clock(std::move(clock))
{}

std::chrono::system_clock::time_point SessionManager::now() const {
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

std::chrono::system_clock::time_point SessionManager::expiryFor(const std::string& accessToken,
                                                                std::chrono::hours lifetime) const {
    const auto fallback = now() + lifetime;

    std::string_view raw = accessToken;
    if (raw.starts_with("Bearer ")) raw.remove_prefix(7);

    try {
        const auto decoded = jwt::decode(std::string(raw));
        if (decoded.has_expires_at()) {
            const auto exp = decoded.get_expires_at();
            if (exp < fallback) {
                return exp;
            }
        }
    }
    catch (const std::exception& ex) {
        // Opaque tokens are fine; the fixed lifetime applies.
        sbLog_Debug(QString("Access token is not a decodable JWT: %1").arg(ex.what()));
    }
    return fallback;
}

SessionManager::AuthResult SessionManager::authenticate() {
    std::lock_guard<std::mutex> attempt(m_attemptMx);
    return doAuthenticate();
}

SessionManager::AuthResult SessionManager::doAuthenticate() {
    auto fail = [this](AuthError err) -> AuthResult {
        {
            std::unique_lock<std::shared_mutex> lock(m_sessionMx);
            m_session = Session{};
        }
        sbLog_Warning(QString("Authentication failed: %1").arg(QString::fromStdString(err.what())));
        return err;
    };

    LoginReply reply;
    try {
        const auto totp = Totp::generate(m_credentials.totpSecret, now());
        sbLog_App("Generated TOTP for authentication");
        reply = records::parseLoginReply(
            m_api.loginByPassword(m_credentials.clientCode, m_credentials.password, totp));
    }
    catch (const std::exception& ex) {
        return fail(AuthError(auth_codes::kInternal, std::string("Authentication failed: ") + ex.what()));
    }

    if (!reply.ok) {
        return fail(AuthError(reply.errorCode, reply.message));
    }

    Session fresh;
    fresh.access_token  = std::move(reply.jwtToken);
    fresh.refresh_token = std::move(reply.refreshToken);
    fresh.feed_token    = std::move(reply.feedToken);
    fresh.expires_at    = expiryFor(fresh.access_token, kLoginLifetime);

    {
        std::unique_lock<std::shared_mutex> lock(m_sessionMx);
        m_session = fresh;
    }
    sbLog_App("Successfully authenticated with venue");
    return fresh;
}

bool SessionManager::refresh() {
    std::lock_guard<std::mutex> attempt(m_attemptMx);
    return doRefresh();
}

bool SessionManager::doRefresh() {
    const Session current = snapshot();
    if (current.refresh_token.empty()) {
        sbLog_App("No refresh token available, need to re-authenticate");
        return false;
    }

    LoginReply reply;
    try {
        reply = records::parseRefreshReply(m_api.generateTokens(current.refresh_token, current.access_token));
    }
    catch (const std::exception& ex) {
        sbLog_Warning(QString("Token refresh error: %1").arg(ex.what()));
        return false;
    }

    if (!reply.ok) {
        const AuthError err(reply.errorCode.empty() ? auth_codes::kInvalidRefresh : reply.errorCode, reply.message);
        sbLog_Warning(QString("Token refresh failed: %1").arg(QString::fromStdString(err.what())));
        return false;
    }

    Session next;
    next.access_token  = std::move(reply.jwtToken);
    next.refresh_token = reply.refreshToken.empty() ? current.refresh_token : std::move(reply.refreshToken);
    next.feed_token    = reply.feedToken.empty() ? current.feed_token : std::move(reply.feedToken);
    next.expires_at    = expiryFor(next.access_token, kRefreshLifetime);

    {
        std::unique_lock<std::shared_mutex> lock(m_sessionMx);
        m_session = std::move(next);
    }
    sbLog_App("Successfully refreshed authentication token");
    return true;
}

bool SessionManager::isValid() const {
    std::shared_lock<std::shared_mutex> lock(m_sessionMx);
    if (!m_session.populated()) return false;
    return now() < m_session.expires_at - kExpiryGuard;
}

bool SessionManager::ensureValid() {
    if (isValid()) return true;

    const std::uint64_t seen = m_attemptGeneration.load(std::memory_order_acquire);
    std::lock_guard<std::mutex> attempt(m_attemptMx);
    // An attempt finished while we waited: share its outcome, failed or not.
    if (m_attemptGeneration.load(std::memory_order_relaxed) != seen) return m_lastAttemptOk;
    if (isValid()) return true;

    bool ok = false;
    sbLog_App("Session expired or expiring soon, attempting refresh");
    if (doRefresh()) {
        ok = true;
    } else {
        sbLog_App("Token refresh failed, re-authenticating");
        ok = std::holds_alternative<Session>(doAuthenticate());
    }

    m_lastAttemptOk = ok;
    m_attemptGeneration.fetch_add(1, std::memory_order_release);
    return ok;
}

void SessionManager::logout() {
    std::lock_guard<std::mutex> attempt(m_attemptMx);
    const Session current = snapshot();

    if (current.populated()) {
        try {
            const auto reply = m_api.logout(m_credentials.clientCode, current.access_token);
            if (auto err = records::venueFailure(reply)) {
                sbLog_Warning(QString("Venue logout rejected: %1").arg(QString::fromStdString(err->what())));
            }
        }
        catch (const std::exception& ex) {
            sbLog_Warning(QString("Venue logout failed: %1").arg(ex.what()));
        }
    } else {
        sbLog_App("No active session to logout");
    }

    {
        std::unique_lock<std::shared_mutex> lock(m_sessionMx);
        m_session = Session{};
    }
    sbLog_App("Session cleared");
}

Session SessionManager::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(m_sessionMx);
    return m_session;
}
