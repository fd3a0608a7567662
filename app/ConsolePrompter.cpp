#include "ConsolePrompter.hpp"
#include "ConsoleStyle.hpp"

#include <cstdio>
#include <termios.h>
#include <unistd.h>

namespace quickscpapp {

namespace {

// Turns terminal echo off for its lifetime when stdin is a TTY.
class EchoGuard {
public:
    explicit EchoGuard(int fd) : fd_(fd) {
        if (::isatty(fd_) != 1 || ::tcgetattr(fd_, &saved_) != 0)
            return;
        termios quiet = saved_;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = ::tcsetattr(fd_, TCSAFLUSH, &quiet) == 0;
    }
    ~EchoGuard() {
        if (active_)
            ::tcsetattr(fd_, TCSAFLUSH, &saved_);
    }
    EchoGuard(const EchoGuard &) = delete;
    EchoGuard &operator=(const EchoGuard &) = delete;

    bool active() const { return active_; }

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

QString decorate(const QString &prompt) {
    return styled(QStringLiteral("? "), Tone::Success, true, stdoutIsTty()) +
           styled(prompt, Tone::Plain, true, stdoutIsTty()) +
           QStringLiteral(": ");
}

} // namespace

void secureClear(QString &s) {
    for (int i = 0, n = s.size(); i < n; ++i)
        s[i] = QChar(u'\0');
    s.clear();
}

ConsolePrompter::ConsolePrompter(FILE *input) : input_(input), in_(input, QIODevice::ReadOnly) {}

bool ConsolePrompter::readLine(QString &line) {
    line = in_.readLine();
    if (line.isNull())
        return false; // EOF
    if (line.endsWith(QLatin1Char('\r')))
        line.chop(1);
    return true;
}

bool ConsolePrompter::askLine(const QString &prompt, QString &answer,
                              bool allowEmpty) {
    for (;;) {
        out() << decorate(prompt) << Qt::flush;
        QString line;
        if (!readLine(line))
            return false;
        line = line.trimmed();
        if (line.isEmpty() && !allowEmpty)
            continue;
        answer = line;
        return true;
    }
}

bool ConsolePrompter::askSecret(const QString &prompt, QString &answer) {
    for (;;) {
        out() << decorate(prompt) << Qt::flush;
        QString line;
        bool ok = false;
        {
            EchoGuard guard(fileno(input_));
            ok = readLine(line);
            if (guard.active())
                out() << Qt::endl;
        }
        if (!ok)
            return false;
        if (line.isEmpty())
            continue;
        answer = line;
        secureClear(line);
        return true;
    }
}

} // namespace quickscpapp
