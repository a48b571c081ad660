// Abstract interface for the SFTP operations the transfer backend needs.
// Protocol implementations live outside this repository and plug in here.
#pragma once
#include "SftpTypes.hpp"
#include <functional>
#include <vector>

namespace furman {

class SftpClient {
public:
    using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;
    using CancelCB = std::function<bool()>;

    virtual ~SftpClient() = default;

    // Connect and disconnect
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Remote directory listing
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      std::string& err) = 0;

    // Download a remote file to local; if resume=true, continue a partial download.
    // `done` passed to progress includes the resumed offset.
    virtual bool get(const std::string& remote,
                     const std::string& local,
                     std::string& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {},
                     bool resume = false) = 0;

    // Upload a local file to remote; if resume=true, continue a partial upload
    virtual bool put(const std::string& local,
                     const std::string& remote,
                     std::string& err,
                     ProgressCB progress = {},
                     CancelCB shouldCancel = {},
                     bool resume = false) = 0;

    // Check existence (leave err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    // Detailed metadata (stat). Returns true if it exists.
    virtual bool stat(const std::string& remote_path,
                      FileInfo& info,
                      std::string& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       std::string& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool removeDir(const std::string& remote_dir,
                           std::string& err) = 0;
};

} // namespace furman
