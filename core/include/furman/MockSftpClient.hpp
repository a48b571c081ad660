// Simulated SFTP client keeping a small remote filesystem in memory.
// Used by tests and by the SFTP backend when no real session is wired in.
#pragma once
#include "SftpClient.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>

namespace furman {

class MockSftpClient : public SftpClient {
public:
    MockSftpClient();

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_.load(); }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              std::string& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             std::string& err,
             ProgressCB progress,
             CancelCB shouldCancel,
             bool resume) override;

    bool put(const std::string& local,
             const std::string& remote,
             std::string& err,
             ProgressCB progress,
             CancelCB shouldCancel,
             bool resume) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                std::string& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              std::string& err) override;

    bool mkdir(const std::string& remote_dir,
               std::string& err,
               unsigned int mode = 0755) override;

    bool removeFile(const std::string& remote_path,
                    std::string& err) override;

    bool removeDir(const std::string& remote_dir,
                   std::string& err) override;

    // Remote fixture helpers (parent directories are created as needed)
    void setRemoteFile(const std::string& path, const std::string& data);
    std::optional<std::string> remoteFile(const std::string& path) const;
    bool remoteDirExists(const std::string& path) const;
    // While held, get/put stall before every chunk until released or cancelled.
    void setHold(bool on) { hold_.store(on); }
    void setChunkSize(std::size_t n) { chunk_.store(n ? n : 1); }
    // Number of get/put calls made with resume=true.
    int resumedCalls() const { return resumedCalls_.load(); }

private:
    std::atomic<bool> connected_{false};
    std::atomic<bool> hold_{false};
    std::atomic<std::size_t> chunk_{4096};
    std::atomic<int> resumedCalls_{0};
    mutable std::mutex mtx_; // protects files_ and dirs_
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_;

    // Returns false if cancelled while held.
    bool waitWhileHeld(const CancelCB& shouldCancel) const;
    void addParents(const std::string& path);
};

} // namespace furman
