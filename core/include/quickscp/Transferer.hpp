// Streams one local file into an SCP write channel in fixed-size chunks.
#pragma once
#include "ScpSession.hpp"
#include "ScpTypes.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace quickscp {

class Transferer {
public:
    using ProgressCB = std::function<void(std::uint64_t /*done*/, std::uint64_t /*total*/)>;
    using FinishedCB = std::function<void()>;

    explicit Transferer(std::size_t chunkSize = kChunkSize);

    // Uploads config.localFilePath to config.remotePath with mode 0644.
    // The session must already be authenticated. `progress` is called after
    // every chunk with the running total; `finished` once the channel was
    // shut down cleanly.
    TransferStatus transfer(ScpSession& session,
                            const TransferConfig& config,
                            std::string& err,
                            ProgressCB progress = {},
                            FinishedCB finished = {});

    // Bytes written by the last transfer() call.
    std::uint64_t transferred() const { return transferred_; }

private:
    std::size_t chunkSize_;
    std::uint64_t transferred_ = 0;
};

} // namespace quickscp
