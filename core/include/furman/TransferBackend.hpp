// Abstract interface for transfer execution. Concrete backends (local filesystem,
// SFTP, archive extraction) follow this API so the registry stays decoupled
// from the I/O layer.
#pragma once
#include "TransferTypes.hpp"
#include <mutex>
#include <string>

namespace furman {

// Receives events from a backend. Calls may arrive on any thread; events for
// one transfer id arrive in the order they were sent.
class TransferEventSink {
public:
    virtual ~TransferEventSink() = default;

    virtual void transferProgress(std::uint64_t id, const ProgressEvent& ev) = 0;
    virtual void transferFinished(std::uint64_t id, const TerminalOutcome& outcome) = 0;
    // Answer to a pause/resume/cancel request. A cancel that is accepted is
    // followed by transferFinished(Cancelled).
    virtual void controlAcknowledged(std::uint64_t id,
                                     ControlSignal signal,
                                     bool accepted,
                                     const std::string& message) = 0;
};

class TransferBackend {
public:
    virtual ~TransferBackend() = default;

    // Sink for progress and terminal events (not owned). nullptr detaches.
    virtual void setEventSink(TransferEventSink* sink) = 0;

    // True if this backend can execute the job at all.
    virtual bool accepts(const TransferJob& job) const = 0;

    // Begin execution; returns immediately. Events are keyed by job.id.
    virtual bool startTransfer(const TransferJob& job, std::string& err) = 0;

    // Control signals. Returning false means the request was refused outright.
    // Resume and cancel of a transfer whose terminal event was already sent
    // return true and change nothing; that terminal event stands.
    virtual bool pauseTransfer(std::uint64_t id, std::string& err) = 0;
    virtual bool resumeTransfer(std::uint64_t id, std::string& err) = 0;
    virtual bool cancelTransfer(std::uint64_t id, std::string& err) = 0;

    // Global throttle in bytes/s (0 = unlimited). Applies to running jobs on
    // their next chunk and to every job started afterwards.
    virtual void setBandwidthLimit(std::uint64_t bytesPerSec) = 0;
};

// Thread-safe reference to the sink a backend reports to. The lock is held
// while an event is delivered so detaching waits for in-flight calls.
class SinkRef {
public:
    void set(TransferEventSink* sink) {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        sink_ = sink;
    }

    void progress(std::uint64_t id, const ProgressEvent& ev) {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        if (sink_) sink_->transferProgress(id, ev);
    }

    void finished(std::uint64_t id, const TerminalOutcome& outcome) {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        if (sink_) sink_->transferFinished(id, outcome);
    }

    void acknowledged(std::uint64_t id, ControlSignal signal, bool accepted,
                      const std::string& message = {}) {
        std::lock_guard<std::recursive_mutex> lk(mtx_);
        if (sink_) sink_->controlAcknowledged(id, signal, accepted, message);
    }

private:
    std::recursive_mutex mtx_;
    TransferEventSink* sink_ = nullptr;
};

} // namespace furman
