#include "furman/MockTransferBackend.hpp"

namespace furman {

bool MockTransferBackend::accepts(const TransferJob& job) const {
    (void)job;
    std::lock_guard<std::mutex> lk(mtx_);
    return acceptsAll_;
}

bool MockTransferBackend::startTransfer(const TransferJob& job, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (failStart_) {
        err = *failStart_;
        failStart_.reset();
        return false;
    }
    started_.push_back(job);
    return true;
}

bool MockTransferBackend::control(std::vector<std::uint64_t>& log, std::uint64_t id, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    log.push_back(id);
    if (rejectControls_) {
        err = rejectMessage_;
        return false;
    }
    return true;
}

bool MockTransferBackend::pauseTransfer(std::uint64_t id, std::string& err) {
    return control(paused_, id, err);
}

bool MockTransferBackend::resumeTransfer(std::uint64_t id, std::string& err) {
    return control(resumed_, id, err);
}

bool MockTransferBackend::cancelTransfer(std::uint64_t id, std::string& err) {
    return control(cancelled_, id, err);
}

void MockTransferBackend::setBandwidthLimit(std::uint64_t bytesPerSec) {
    std::lock_guard<std::mutex> lk(mtx_);
    limits_.push_back(bytesPerSec);
}

void MockTransferBackend::setAcceptsAll(bool on) {
    std::lock_guard<std::mutex> lk(mtx_);
    acceptsAll_ = on;
}

void MockTransferBackend::failNextStart(const std::string& message) {
    std::lock_guard<std::mutex> lk(mtx_);
    failStart_ = message;
}

void MockTransferBackend::setRejectControls(bool on, const std::string& message) {
    std::lock_guard<std::mutex> lk(mtx_);
    rejectControls_ = on;
    rejectMessage_ = message;
}

void MockTransferBackend::emitProgress(std::uint64_t id, const ProgressEvent& ev) {
    sink_.progress(id, ev);
}

void MockTransferBackend::emitFinished(std::uint64_t id, const TerminalOutcome& outcome) {
    sink_.finished(id, outcome);
}

void MockTransferBackend::emitAck(std::uint64_t id, ControlSignal signal, bool accepted,
                                  const std::string& message) {
    sink_.acknowledged(id, signal, accepted, message);
}

std::vector<TransferJob> MockTransferBackend::started() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return started_;
}

std::vector<std::uint64_t> MockTransferBackend::startedIds() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<std::uint64_t> ids;
    for (const auto& j : started_) ids.push_back(j.id);
    return ids;
}

std::vector<std::uint64_t> MockTransferBackend::paused() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return paused_;
}

std::vector<std::uint64_t> MockTransferBackend::resumed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return resumed_;
}

std::vector<std::uint64_t> MockTransferBackend::cancelled() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cancelled_;
}

std::vector<std::uint64_t> MockTransferBackend::bandwidthLimits() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return limits_;
}

void MockTransferBackend::clearRecords() {
    std::lock_guard<std::mutex> lk(mtx_);
    started_.clear();
    paused_.clear();
    resumed_.clear();
    cancelled_.clear();
    limits_.clear();
}

} // namespace furman
