// Per-file progress accounting for tree transfers.
#pragma once
#include "DeployTypes.hpp"
#include <cstddef>

namespace opendeploy {

// Consumer of progress events (the front end). Called on the thread running
// the operation.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void onProgress(const TransferProgress& p) = 0;
};

// Notified by the transfer engine after each file lands; `completed` is the
// running count of files transferred so far in this operation.
class TransferObserver {
public:
    virtual ~TransferObserver() = default;
    virtual void fileTransferred(std::size_t completed) = 0;
};

// Turns a running file count into percentage events for a single sink.
class ProgressReporter : public TransferObserver {
public:
    // sink may be null (events are computed but dropped).
    ProgressReporter(std::size_t total, ProgressSink* sink);

    void fileTransferred(std::size_t completed) override { report(completed); }

    // Emit {completed, total, completed / total * 100}.
    void report(std::size_t completed);

    std::size_t total() const { return total_; }
    std::size_t eventsEmitted() const { return emitted_; }

private:
    std::size_t total_;
    ProgressSink* sink_; // not owned
    std::size_t emitted_ = 0;
};

} // namespace opendeploy
