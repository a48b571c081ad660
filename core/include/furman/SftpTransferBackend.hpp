// TransferBackend for uploads (local -> sftp) and downloads (sftp -> local)
// driven through an SftpClient. Same worker/pause/cancel model as the local
// backend; an interrupted file is resumed from its partial size.
#pragma once
#include "TransferBackend.hpp"
#include "SftpClient.hpp"
#include "Throttle.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace furman {

class SftpTransferBackend : public TransferBackend {
public:
    SftpTransferBackend() = default;
    ~SftpTransferBackend() override;

    // Inject the SFTP client to use (not owned by the backend)
    void setClient(SftpClient* c) { client_ = c; }
    // Session options for auto-reconnect
    void setSessionOptions(const SessionOptions& opt) { sessionOpt_ = opt; }

    void setEventSink(TransferEventSink* sink) override { sink_.set(sink); }
    bool accepts(const TransferJob& job) const override;

    bool startTransfer(const TransferJob& job, std::string& err) override;
    bool pauseTransfer(std::uint64_t id, std::string& err) override;
    bool resumeTransfer(std::uint64_t id, std::string& err) override;
    bool cancelTransfer(std::uint64_t id, std::string& err) override;
    void setBandwidthLimit(std::uint64_t bytesPerSec) override;

private:
    enum class RunResult { Done, Paused, Cancelled, Failed };

    // One file to move over the wire.
    struct Item {
        std::string src;
        std::string dst;
        std::uint64_t size = 0;
    };

    struct Job {
        TransferJob request;
        bool upload = true;
        std::thread worker;
        std::atomic<bool> pauseFlag{false};
        std::atomic<bool> cancelFlag{false};
        std::atomic<bool> exited{false};
        bool active = false;
        bool paused = false;
        bool finished = false;
        bool planned = false;           // items/dirs computed
        std::vector<Item> items;
        std::vector<std::string> dirs;  // directories to create at the target
        TransferCheckpoint checkpoint;
        Throttle throttle;
    };

    SftpClient* client_ = nullptr; // not owned by the backend
    std::optional<SessionOptions> sessionOpt_;
    SinkRef sink_;
    std::mutex mtx_;        // protects jobs_ and the non-atomic Job flags
    std::mutex sftpMutex_;  // serializes client calls (protocol clients are not thread-safe)
    std::unordered_map<std::uint64_t, std::unique_ptr<Job>> jobs_;
    std::unordered_set<std::uint64_t> retired_; // reaped ids, terminal event already sent

    void launch(Job* job);
    void run(Job* job);
    RunResult execute(Job& job, TransferCheckpoint& cp, ProgressEvent& progress, std::string& err);
    bool plan(Job& job, std::string& err);
    bool planRemote(const std::string& dir, const std::string& localBase,
                    Job& job, std::string& err);
    bool ensureRemoteDir(const std::string& dir, std::string& err);
    bool removeRemoteTree(const std::string& path, std::string& err);
    RunResult checkFlags(const Job& job) const;
    // Reconnect the client if disconnected (with backoff). Returns true on success.
    bool ensureConnected(std::string& err);
    void reapFinished();
    bool alreadyFinished(std::uint64_t id) const; // caller holds mtx_
};

} // namespace furman
