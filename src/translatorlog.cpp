#include "translatorlog.h"

// Debug output stays off unless enabled via --verbose or QT_LOGGING_RULES.
Q_LOGGING_CATEGORY(translatorLog, "voicebridge.translator", QtInfoMsg)
