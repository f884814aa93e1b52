#include "opendeploy/ProgressReporter.hpp"

namespace opendeploy {

ProgressReporter::ProgressReporter(std::size_t total, ProgressSink* sink)
    : total_(total), sink_(sink) {}

void ProgressReporter::report(std::size_t completed) {
    TransferProgress p;
    p.current = completed;
    p.total = total_;
    // total == 0 only for a reporter that never reaches an upload
    p.percentage = total_ ? (double(completed) * 100.0) / double(total_) : 0.0;
    ++emitted_;
    if (sink_) sink_->onProgress(p);
}

} // namespace opendeploy
