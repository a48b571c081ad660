#include "furman/BackendRouter.hpp"
#include "furman/Log.hpp"
#include <algorithm>

namespace furman {

BackendRouter::~BackendRouter() {
    std::vector<TransferBackend*> children;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        children = children_;
    }
    for (auto* b : children) b->setEventSink(nullptr);
}

void BackendRouter::addRoute(BackendKind from, BackendKind to, TransferBackend* backend) {
    if (!backend) return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        routes_[{from, to}] = backend;
    }
    attach(backend);
}

void BackendRouter::setExtractBackend(TransferBackend* backend) {
    if (!backend) return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        extract_ = backend;
    }
    attach(backend);
}

void BackendRouter::attach(TransferBackend* backend) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (std::find(children_.begin(), children_.end(), backend) != children_.end()) return;
        children_.push_back(backend);
    }
    backend->setEventSink(this);
}

TransferBackend* BackendRouter::routeFor(const TransferJob& job) const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (job.type == TransferType::Extract) return extract_;
    auto it = routes_.find({job.source.kind, job.target.kind});
    return it == routes_.end() ? nullptr : it->second;
}

bool BackendRouter::accepts(const TransferJob& job) const {
    TransferBackend* b = routeFor(job);
    return b && b->accepts(job);
}

bool BackendRouter::startTransfer(const TransferJob& job, std::string& err) {
    TransferBackend* b = routeFor(job);
    if (!b || !b->accepts(job)) {
        err = std::string("no backend for ") + toString(job.type) + " from " +
              toString(job.source.kind) + " to " + toString(job.target.kind);
        LOGW("router: %s", err.c_str());
        return false;
    }
    // Registered first: a backend may report before startTransfer returns.
    {
        std::lock_guard<std::mutex> lk(mtx_);
        owners_[job.id] = b;
    }
    if (!b->startTransfer(job, err)) {
        std::lock_guard<std::mutex> lk(mtx_);
        owners_.erase(job.id);
        return false;
    }
    return true;
}

TransferBackend* BackendRouter::ownerOf(std::uint64_t id, std::string& err) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = owners_.find(id);
    if (it == owners_.end()) {
        err = "unknown transfer";
        return nullptr;
    }
    return it->second;
}

bool BackendRouter::pauseTransfer(std::uint64_t id, std::string& err) {
    TransferBackend* b = ownerOf(id, err);
    return b && b->pauseTransfer(id, err);
}

bool BackendRouter::resumeTransfer(std::uint64_t id, std::string& err) {
    if (alreadyFinished(id)) return true;
    TransferBackend* b = ownerOf(id, err);
    return b && b->resumeTransfer(id, err);
}

bool BackendRouter::cancelTransfer(std::uint64_t id, std::string& err) {
    if (alreadyFinished(id)) return true;
    TransferBackend* b = ownerOf(id, err);
    return b && b->cancelTransfer(id, err);
}

bool BackendRouter::alreadyFinished(std::uint64_t id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return finished_.count(id) > 0;
}

void BackendRouter::setBandwidthLimit(std::uint64_t bytesPerSec) {
    std::vector<TransferBackend*> children;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        children = children_;
    }
    for (auto* b : children) b->setBandwidthLimit(bytesPerSec);
}

void BackendRouter::transferProgress(std::uint64_t id, const ProgressEvent& ev) {
    sink_.progress(id, ev);
}

void BackendRouter::transferFinished(std::uint64_t id, const TerminalOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        owners_.erase(id);
        finished_.insert(id);
    }
    sink_.finished(id, outcome);
}

void BackendRouter::controlAcknowledged(std::uint64_t id, ControlSignal signal,
                                        bool accepted, const std::string& message) {
    sink_.acknowledged(id, signal, accepted, message);
}

} // namespace furman
