#pragma once

#include <QLoggingCategory>
#include <QDebug>
#include <atomic>
#include <cstdint>
#include <cstdlib>

// =============================================================================
// SPREADBRIDGE LOGGING CATEGORIES
// =============================================================================
// Four categories; hot paths (feed, fan-out) are throttled per call site.

Q_DECLARE_LOGGING_CATEGORY(logApp)       // Application: init, lifecycle, config, auth
Q_DECLARE_LOGGING_CATEGORY(logData)      // Data: upstream feed, REST, fan-out, WebSocket
Q_DECLARE_LOGGING_CATEGORY(logAnalysis)  // Analysis: snapshot parsing, spread matching
Q_DECLARE_LOGGING_CATEGORY(logDebug)     // Debug: detailed diagnostics (disabled by default)

// =============================================================================
// ATOMIC THROTTLING
// =============================================================================

namespace spreadbridge::log_throttle {
    // Compile-time defaults (overridden by env vars)
    inline constexpr int kApp      = 1;    // every app event
    inline constexpr int kData     = 20;   // every 20th data operation
    inline constexpr int kAnalysis = 1;    // every analysis event (low frequency)
    inline constexpr int kDebug    = 10;   // every 10th debug message
}

#define SBLOG_THROTTLED(cat, defaultInterval, ...)                                  \
    do {                                                                             \
        static std::atomic<uint32_t> _counter{0};                                    \
        static int _interval = []() {                                                \
            const char* env = std::getenv("SPREADBRIDGE_LOG_" #cat "_INTERVAL");    \
            const int v = env ? std::atoi(env) : (defaultInterval);                  \
            return v > 0 ? v : 1;                                                    \
        }();                                                                         \
        if (_interval == 1 || (++_counter % _interval) == 1) {                       \
            qCDebug(log##cat).noquote() << __VA_ARGS__;                              \
        }                                                                            \
    } while(false)

#define sbLog_App(...)       SBLOG_THROTTLED(App, spreadbridge::log_throttle::kApp, __VA_ARGS__)
#define sbLog_Data(...)      SBLOG_THROTTLED(Data, spreadbridge::log_throttle::kData, __VA_ARGS__)
#define sbLog_Analysis(...)  SBLOG_THROTTLED(Analysis, spreadbridge::log_throttle::kAnalysis, __VA_ARGS__)
#define sbLog_Debug(...)     SBLOG_THROTTLED(Debug, spreadbridge::log_throttle::kDebug, __VA_ARGS__)

#define sbLog_DataN(n, ...)  SBLOG_THROTTLED(Data, n, __VA_ARGS__)
#define sbLog_DebugN(n, ...) SBLOG_THROTTLED(Debug, n, __VA_ARGS__)

// Always-on (no throttling)
#define sbLog_Warning(...)  qCWarning(logApp).noquote() << __VA_ARGS__
#define sbLog_Error(...)    qCCritical(logApp).noquote() << __VA_ARGS__

// Runtime control:
//   export SPREADBRIDGE_LOG_Data_INTERVAL=1     # every feed/fan-out message
//   export QT_LOGGING_RULES="spreadbridge.debug=true"
