// Logging categories for the console app. Debug/info output is off unless
// --verbose is passed or QT_LOGGING_RULES enables it.
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(qsSession)
Q_DECLARE_LOGGING_CATEGORY(qsAuth)
Q_DECLARE_LOGGING_CATEGORY(qsXfer)

namespace quickscpapp {
void enableVerboseLogging();
}
