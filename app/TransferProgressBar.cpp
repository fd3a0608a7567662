#include "TransferProgressBar.hpp"
#include "ConsoleStyle.hpp"

#include <QLocale>

namespace quickscpapp {

static const char *const kSpinner[] = {"⠁", "⠂", "⠄", "⡀", "⢀", "⠠", "⠐", "⠈"};
static constexpr int kSpinnerFrames = 8;
static constexpr qint64 kRedrawIntervalMs = 80;

TransferProgressBar::TransferProgressBar(int width) : width_(width < 10 ? 10 : width) {}

QString TransferProgressBar::formatBytes(std::uint64_t bytes) {
    return QLocale::c().formattedDataSize(static_cast<qint64>(bytes), 2,
                                          QLocale::DataSizeIecFormat);
}

QString TransferProgressBar::formatDuration(qint64 secs) {
    if (secs < 0)
        secs = 0;
    return QStringLiteral("%1:%2:%3")
        .arg(secs / 3600, 2, 10, QLatin1Char('0'))
        .arg((secs / 60) % 60, 2, 10, QLatin1Char('0'))
        .arg(secs % 60, 2, 10, QLatin1Char('0'));
}

void TransferProgressBar::start(std::uint64_t total) {
    total_ = total;
    done_ = 0;
    tick_ = 0;
    lastDrawMs_ = -1;
    active_ = true;
    timer_.start();
    draw(true);
}

void TransferProgressBar::update(std::uint64_t done) {
    if (!active_)
        return;
    done_ = done;
    draw(done_ >= total_);
}

void TransferProgressBar::finish(const QString &message) {
    if (!active_)
        return;
    done_ = total_;
    draw(true);
    out() << ' ' << message << Qt::endl;
    active_ = false;
}

void TransferProgressBar::abandon() {
    if (!active_)
        return;
    out() << Qt::endl;
    active_ = false;
}

QString TransferProgressBar::bar() const {
    const double ratio =
        total_ == 0 ? 1.0 : static_cast<double>(done_) / static_cast<double>(total_);
    int filled = static_cast<int>(ratio * width_);
    if (filled > width_)
        filled = width_;
    QString s;
    s.reserve(width_);
    s += QString(filled, QLatin1Char('#'));
    if (filled < width_) {
        s += QLatin1Char('>');
        s += QString(width_ - filled - 1, QLatin1Char('-'));
    }
    return s;
}

QString TransferProgressBar::eta() const {
    const qint64 ms = timer_.elapsed();
    if (done_ == 0 || ms <= 0)
        return QStringLiteral("?");
    if (done_ >= total_)
        return QStringLiteral("0s");
    const double rate = static_cast<double>(done_) / static_cast<double>(ms);
    const qint64 left = static_cast<qint64>(static_cast<double>(total_ - done_) / rate / 1000.0);
    if (left >= 3600)
        return QStringLiteral("%1h").arg(left / 3600);
    if (left >= 60)
        return QStringLiteral("%1m").arg(left / 60);
    return QStringLiteral("%1s").arg(left);
}

void TransferProgressBar::draw(bool force) {
    const qint64 now = timer_.elapsed();
    if (!force && lastDrawMs_ >= 0 && now - lastDrawMs_ < kRedrawIntervalMs)
        return;
    lastDrawMs_ = now;
    const bool c = stdoutIsTty();
    const QString spin = QString::fromUtf8(kSpinner[tick_++ % kSpinnerFrames]);
    out() << '\r' << styled(spin, Tone::Success, false, c) << " ["
          << formatDuration(now / 1000) << "] ["
          << styled(bar(), Tone::Accent, false, c) << "] "
          << formatBytes(done_) << '/' << formatBytes(total_) << " (" << eta()
          << ')' << (c ? QStringLiteral("\x1b[K") : QString()) << Qt::flush;
}

} // namespace quickscpapp
