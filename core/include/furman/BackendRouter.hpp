// Dispatches transfers to the backend registered for their endpoints.
#pragma once
#include "TransferBackend.hpp"
#include <map>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace furman {

// A TransferBackend that owns no I/O itself. Copy/Move jobs are routed by
// (source kind, target kind), Extract jobs to the extract backend. Controls
// go to whichever backend started the id; events from all children are
// forwarded to the router's own sink.
class BackendRouter : public TransferBackend, private TransferEventSink {
public:
    BackendRouter() = default;
    ~BackendRouter() override;

    // Children are not owned and must outlive the router.
    void addRoute(BackendKind from, BackendKind to, TransferBackend* backend);
    void setExtractBackend(TransferBackend* backend);

    void setEventSink(TransferEventSink* sink) override { sink_.set(sink); }
    bool accepts(const TransferJob& job) const override;

    bool startTransfer(const TransferJob& job, std::string& err) override;
    bool pauseTransfer(std::uint64_t id, std::string& err) override;
    bool resumeTransfer(std::uint64_t id, std::string& err) override;
    bool cancelTransfer(std::uint64_t id, std::string& err) override;
    void setBandwidthLimit(std::uint64_t bytesPerSec) override;

private:
    void transferProgress(std::uint64_t id, const ProgressEvent& ev) override;
    void transferFinished(std::uint64_t id, const TerminalOutcome& outcome) override;
    void controlAcknowledged(std::uint64_t id, ControlSignal signal,
                             bool accepted, const std::string& message) override;

    TransferBackend* routeFor(const TransferJob& job) const;
    TransferBackend* ownerOf(std::uint64_t id, std::string& err) const;
    bool alreadyFinished(std::uint64_t id) const;
    void attach(TransferBackend* backend);

    SinkRef sink_;
    mutable std::mutex mtx_; // protects routes_, extract_, owners_ and finished_; never held while calling a child
    std::map<std::pair<BackendKind, BackendKind>, TransferBackend*> routes_;
    TransferBackend* extract_ = nullptr;
    std::vector<TransferBackend*> children_;
    std::unordered_map<std::uint64_t, TransferBackend*> owners_;
    std::unordered_set<std::uint64_t> finished_; // terminal event forwarded
};

} // namespace furman
