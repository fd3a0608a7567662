#include "ConsoleStyle.hpp"

#include <cstdio>
#include <unistd.h>

namespace quickscpapp {

bool stdoutIsTty() { return ::isatty(fileno(stdout)) == 1; }
bool stderrIsTty() { return ::isatty(fileno(stderr)) == 1; }

QString styled(const QString &text, Tone tone, bool bold, bool colour) {
    if (!colour || (tone == Tone::Plain && !bold))
        return text;
    QString code;
    switch (tone) {
    case Tone::Plain:
        break;
    case Tone::Info:
        code = QStringLiteral("34");
        break;
    case Tone::Success:
        code = QStringLiteral("32");
        break;
    case Tone::Warning:
        code = QStringLiteral("33");
        break;
    case Tone::Error:
        code = QStringLiteral("31");
        break;
    case Tone::Accent:
        code = QStringLiteral("36");
        break;
    }
    if (bold)
        code = code.isEmpty() ? QStringLiteral("1") : QStringLiteral("1;") + code;
    return QStringLiteral("\x1b[") + code + QLatin1Char('m') + text +
           QStringLiteral("\x1b[0m");
}

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream &err() {
    static QTextStream s(stderr);
    return s;
}

void printBanner() {
    const bool c = stdoutIsTty();
    const QString rule = QStringLiteral("=====================================");
    out() << styled(rule, Tone::Accent, false, c) << '\n'
          << styled(QStringLiteral("Interactive SCP File Transfer Tool"),
                    Tone::Accent, true, c)
          << '\n'
          << styled(rule, Tone::Accent, false, c) << Qt::endl;
}

void status(Tone tone, const QString &text, bool bold) {
    out() << styled(text, tone, bold, stdoutIsTty()) << Qt::endl;
}

void failure(const QString &text, bool bold) {
    err() << styled(text, Tone::Error, bold, stderrIsTty()) << Qt::endl;
}

} // namespace quickscpapp
