// Scriptable backend that records every call and emits events on demand.
// Nothing runs by itself: tests drive progress and outcomes explicitly.
#pragma once
#include "TransferBackend.hpp"
#include <mutex>
#include <optional>
#include <vector>

namespace furman {

class MockTransferBackend : public TransferBackend {
public:
    void setEventSink(TransferEventSink* sink) override { sink_.set(sink); }
    bool accepts(const TransferJob& job) const override;

    bool startTransfer(const TransferJob& job, std::string& err) override;
    bool pauseTransfer(std::uint64_t id, std::string& err) override;
    bool resumeTransfer(std::uint64_t id, std::string& err) override;
    bool cancelTransfer(std::uint64_t id, std::string& err) override;
    void setBandwidthLimit(std::uint64_t bytesPerSec) override;

    // Behaviour knobs
    void setAcceptsAll(bool on);
    void failNextStart(const std::string& message);
    // Control requests are refused with `message` while set.
    void setRejectControls(bool on, const std::string& message = "rejected by backend");

    // Event injection (delivered synchronously on the calling thread)
    void emitProgress(std::uint64_t id, const ProgressEvent& ev);
    void emitFinished(std::uint64_t id, const TerminalOutcome& outcome);
    void emitAck(std::uint64_t id, ControlSignal signal, bool accepted,
                 const std::string& message = {});

    // Recorded calls
    std::vector<TransferJob> started() const;
    std::vector<std::uint64_t> startedIds() const;
    std::vector<std::uint64_t> paused() const;
    std::vector<std::uint64_t> resumed() const;
    std::vector<std::uint64_t> cancelled() const;
    std::vector<std::uint64_t> bandwidthLimits() const;
    void clearRecords();

private:
    SinkRef sink_;
    mutable std::mutex mtx_;
    bool acceptsAll_ = true;
    std::optional<std::string> failStart_;
    bool rejectControls_ = false;
    std::string rejectMessage_;
    std::vector<TransferJob> started_;
    std::vector<std::uint64_t> paused_;
    std::vector<std::uint64_t> resumed_;
    std::vector<std::uint64_t> cancelled_;
    std::vector<std::uint64_t> limits_;

    bool control(std::vector<std::uint64_t>& log, std::uint64_t id, std::string& err);
};

} // namespace furman
