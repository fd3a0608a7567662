// Single-line progress bar on stdout: spinner, elapsed time, bar, bytes, ETA.
#pragma once
#include <QElapsedTimer>
#include <QString>
#include <cstdint>

namespace quickscpapp {

class TransferProgressBar {
public:
    explicit TransferProgressBar(int width = 40);

    void start(std::uint64_t total);
    void update(std::uint64_t done);
    void finish(const QString &message);
    // Ends the line without the completion message (on failure).
    void abandon();

    // Rendering helpers, public for reuse in status lines.
    static QString formatBytes(std::uint64_t bytes);
    static QString formatDuration(qint64 secs);

private:
    int width_;
    std::uint64_t total_ = 0;
    std::uint64_t done_ = 0;
    int tick_ = 0;
    qint64 lastDrawMs_ = -1;
    bool active_ = false;
    QElapsedTimer timer_;

    void draw(bool force);
    QString bar() const;
    QString eta() const;
};

} // namespace quickscpapp
