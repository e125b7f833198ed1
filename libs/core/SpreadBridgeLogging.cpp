#include "SpreadBridgeLogging.hpp"

// =============================================================================
// LOGGING CATEGORY DEFINITIONS
// =============================================================================

Q_LOGGING_CATEGORY(logApp, "spreadbridge.app")
Q_LOGGING_CATEGORY(logData, "spreadbridge.data")
Q_LOGGING_CATEGORY(logAnalysis, "spreadbridge.analysis")
Q_LOGGING_CATEGORY(logDebug, "spreadbridge.debug", QtWarningMsg)   // debug output off unless enabled by rules
