#include "AppLogging.hpp"

Q_LOGGING_CATEGORY(qsSession, "quickscp.session", QtWarningMsg)
Q_LOGGING_CATEGORY(qsAuth, "quickscp.auth", QtWarningMsg)
Q_LOGGING_CATEGORY(qsXfer, "quickscp.transfer", QtWarningMsg)

namespace quickscpapp {

void enableVerboseLogging() {
    QLoggingCategory::setFilterRules(QStringLiteral("quickscp.*=true"));
}

} // namespace quickscpapp
