// TransferBackend for copies and moves on the local filesystem.
// Each job runs on its own worker thread; pause stops the worker and keeps a
// checkpoint, resume starts a new worker that skips completed files.
#pragma once
#include "TransferBackend.hpp"
#include "Throttle.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace furman {

class LocalTransferBackend : public TransferBackend {
public:
    static constexpr std::size_t kChunk = 64 * 1024;

    LocalTransferBackend() = default;
    ~LocalTransferBackend() override;

    void setEventSink(TransferEventSink* sink) override { sink_.set(sink); }
    bool accepts(const TransferJob& job) const override;

    bool startTransfer(const TransferJob& job, std::string& err) override;
    bool pauseTransfer(std::uint64_t id, std::string& err) override;
    bool resumeTransfer(std::uint64_t id, std::string& err) override;
    bool cancelTransfer(std::uint64_t id, std::string& err) override;
    void setBandwidthLimit(std::uint64_t bytesPerSec) override;

private:
    enum class RunResult { Done, Paused, Cancelled, Failed };

    struct Job {
        TransferJob request;
        std::thread worker;
        std::atomic<bool> pauseFlag{false};
        std::atomic<bool> cancelFlag{false};
        std::atomic<bool> exited{false}; // worker returned (safe to join)
        bool active = false;   // worker running
        bool paused = false;   // stopped with a checkpoint
        bool finished = false; // terminal event sent
        bool measured = false; // totals computed
        TransferCheckpoint checkpoint;
        Throttle throttle;
    };

    // Per-run copy state shared by the recursive helpers.
    struct Run {
        Job* job = nullptr;
        std::set<std::string> skip;
        ProgressEvent progress;
        std::uint64_t completedBytes = 0; // bytes of fully copied files
        std::string error;
    };

    SinkRef sink_;
    std::mutex mtx_; // protects jobs_ and the non-atomic Job flags
    std::unordered_map<std::uint64_t, std::unique_ptr<Job>> jobs_;
    std::unordered_set<std::uint64_t> retired_; // reaped ids, terminal event already sent

    void launch(Job* job);
    void run(Job* job);
    RunResult execute(Run& r);
    RunResult copyTree(Run& r, const std::filesystem::path& src, const std::filesystem::path& dst);
    RunResult copyFile(Run& r, const std::filesystem::path& src, const std::filesystem::path& dst);
    RunResult checkFlags(const Run& r) const;
    void markCompleted(Run& r, const std::string& path);
    void reapFinished();
    bool alreadyFinished(std::uint64_t id) const; // caller holds mtx_
};

} // namespace furman
