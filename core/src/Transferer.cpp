// Upload loop and orderly channel shutdown for a single SCP transfer.
#include "quickscp/Transferer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <vector>

#include <sys/stat.h>

namespace quickscp {

namespace {

struct FileCloser {
    void operator()(FILE* f) const {
        if (f) std::fclose(f);
    }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

} // namespace

Transferer::Transferer(std::size_t chunkSize)
    : chunkSize_(chunkSize ? chunkSize : kChunkSize) {}

TransferStatus Transferer::transfer(ScpSession& session,
                                    const TransferConfig& config,
                                    std::string& err,
                                    ProgressCB progress,
                                    FinishedCB finished) {
    transferred_ = 0;
    if (!session.isConnected() || !session.isAuthenticated()) {
        err = "Session is not authenticated";
        return TransferStatus::TransferError;
    }

    // Local file and its size. The earlier existence check may be stale.
    FilePtr lf(std::fopen(config.localFilePath.c_str(), "rb"));
    if (!lf) {
        err = "Could not open local file for reading: " + config.localFilePath +
              " (" + std::strerror(errno) + ")";
        return TransferStatus::LocalFileError;
    }
    struct stat st{};
    if (::fstat(fileno(lf.get()), &st) != 0) {
        err = "Could not read local file metadata: " + config.localFilePath +
              " (" + std::strerror(errno) + ")";
        return TransferStatus::LocalFileError;
    }
    const std::uint64_t total = static_cast<std::uint64_t>(st.st_size);

    std::unique_ptr<ScpChannel> channel =
        session.openScpWrite(config.remotePath, kRemoteFileMode, total, err);
    if (!channel) {
        if (err.empty()) err = "Could not open SCP channel for " + config.remotePath;
        return TransferStatus::TransferError;
    }

    std::vector<char> buf(chunkSize_);
    std::uint64_t done = 0;
    while (true) {
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), lf.get());
        if (n == 0) {
            if (std::ferror(lf.get())) {
                err = "Local read failed: " + config.localFilePath;
                return TransferStatus::LocalFileError;
            }
            break; // EOF
        }
        if (n > total - done) {
            err = "Local file grew during transfer: " + config.localFilePath;
            return TransferStatus::LocalFileError;
        }
        std::string werr;
        const std::int64_t w = channel->write(buf.data(), n, werr);
        if (w < 0) {
            err = "Remote write failed" + (werr.empty() ? std::string() : ": " + werr);
            return TransferStatus::TransferError;
        }
        if (static_cast<std::size_t>(w) != n) {
            err = "Short write on SCP channel (" + std::to_string(w) + " of " +
                  std::to_string(n) + " bytes)";
            return TransferStatus::TransferError;
        }
        done += n;
        transferred_ = done;
        if (progress) progress(done, total);
    }
    if (done != total) {
        err = "Local file shrank during transfer: " + config.localFilePath;
        return TransferStatus::LocalFileError;
    }

    // All four steps must succeed; bytes already sent do not count as success.
    std::string serr;
    if (!channel->sendEof(serr)) {
        err = "send EOF failed: " + serr;
        return TransferStatus::TransferError;
    }
    if (!channel->waitEof(serr)) {
        err = "waiting for remote EOF failed: " + serr;
        return TransferStatus::TransferError;
    }
    if (!channel->close(serr)) {
        err = "channel close failed: " + serr;
        return TransferStatus::TransferError;
    }
    if (!channel->waitClosed(serr)) {
        err = "waiting for channel close failed: " + serr;
        return TransferStatus::TransferError;
    }

    if (finished) finished();
    return TransferStatus::Completed;
}

} // namespace quickscp
