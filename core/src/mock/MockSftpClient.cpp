// Mock implementation: files live in a map keyed by absolute remote path.
#include "furman/MockSftpClient.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <thread>

namespace furman {

namespace {

std::string parentOf(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return path.substr(0, pos);
}

std::string baseName(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

MockSftpClient::MockSftpClient() {
    dirs_.insert("/");
}

bool MockSftpClient::connect(const SessionOptions& opt, std::string& err) {
    if (opt.host.empty() || opt.username.empty()) {
        err = "host and user are required";
        return false;
    }
    connected_ = true;
    return true;
}

void MockSftpClient::disconnect() {
    connected_ = false;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          std::string& err) {
    if (!connected_) {
        err = "not connected";
        return false;
    }
    std::string path = remote_path.empty() ? "/" : remote_path;
    std::lock_guard<std::mutex> lk(mtx_);
    if (!dirs_.count(path)) {
        err = "remote path not found: " + path;
        return false;
    }
    out.clear();
    for (const auto& d : dirs_)
        if (d != "/" && parentOf(d) == path) out.push_back({baseName(d), true, 0, 0});
    for (const auto& f : files_)
        if (parentOf(f.first) == path) out.push_back({baseName(f.first), false, f.second.size(), 0});
    std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
        if (a.is_dir != b.is_dir) return a.is_dir > b.is_dir; // directories first
        return a.name < b.name;
    });
    return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         std::string& err,
                         ProgressCB progress,
                         CancelCB shouldCancel,
                         bool resume) {
    if (!connected_) {
        err = "not connected";
        return false;
    }
    std::string data;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto it = files_.find(remote);
        if (it == files_.end()) {
            err = "no such remote file: " + remote;
            return false;
        }
        data = it->second;
    }
    if (resume) resumedCalls_.fetch_add(1);

    FILE* lf = nullptr;
    std::size_t offset = 0;
    if (resume) {
        lf = ::fopen(local.c_str(), "ab");
        if (lf && std::fseek(lf, 0, SEEK_END) == 0) {
            long cur = std::ftell(lf);
            if (cur > 0) offset = std::min<std::size_t>((std::size_t)cur, data.size());
        }
    }
    if (!lf) lf = ::fopen(local.c_str(), "wb");
    if (!lf) {
        err = "cannot open local file for writing";
        return false;
    }

    std::size_t done = offset;
    while (done < data.size()) {
        if (!waitWhileHeld(shouldCancel) || (shouldCancel && shouldCancel())) {
            err = "cancelled by user";
            std::fclose(lf);
            return false;
        }
        const std::size_t n = std::min(chunk_.load(), data.size() - done);
        if (std::fwrite(data.data() + done, 1, n, lf) != n) {
            err = "local write failed";
            std::fclose(lf);
            return false;
        }
        std::fflush(lf);
        done += n;
        if (progress) progress(done, data.size());
    }
    std::fclose(lf);
    return true;
}

bool MockSftpClient::put(const std::string& local,
                         const std::string& remote,
                         std::string& err,
                         ProgressCB progress,
                         CancelCB shouldCancel,
                         bool resume) {
    if (!connected_) {
        err = "not connected";
        return false;
    }
    FILE* lf = ::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "cannot open local file for reading";
        return false;
    }
    std::string data;
    char buf[4096];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), lf)) > 0) data.append(buf, n);
    std::fclose(lf);

    std::size_t done = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!dirs_.count(parentOf(remote))) {
            err = "no such remote directory: " + parentOf(remote);
            return false;
        }
        auto it = files_.find(remote);
        if (resume && it != files_.end() && it->second.size() <= data.size())
            done = it->second.size();
        else
            files_[remote].clear();
    }
    if (resume) resumedCalls_.fetch_add(1);

    while (done < data.size()) {
        if (!waitWhileHeld(shouldCancel) || (shouldCancel && shouldCancel())) {
            err = "cancelled by user";
            return false;
        }
        const std::size_t chunk = std::min(chunk_.load(), data.size() - done);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            files_[remote].append(data, done, chunk);
        }
        done += chunk;
        if (progress) progress(done, data.size());
    }
    return true;
}

bool MockSftpClient::exists(const std::string& remote_path,
                            bool& isDir,
                            std::string& err) {
    if (!connected_) {
        err = "not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    isDir = dirs_.count(remote_path) > 0;
    return isDir || files_.count(remote_path) > 0;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          std::string& err) {
    if (!connected_) {
        err = "not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (dirs_.count(remote_path)) {
        info = {baseName(remote_path), true, 0, 0};
        return true;
    }
    auto it = files_.find(remote_path);
    if (it == files_.end()) return false;
    info = {baseName(remote_path), false, it->second.size(), 0};
    return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir,
                           std::string& err,
                           unsigned int mode) {
    (void)mode;
    if (!connected_) {
        err = "not connected";
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if (!dirs_.count(parentOf(remote_dir))) {
        err = "no such remote directory: " + parentOf(remote_dir);
        return false;
    }
    dirs_.insert(remote_dir);
    return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path,
                                std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!files_.erase(remote_path)) {
        err = "no such remote file: " + remote_path;
        return false;
    }
    return true;
}

bool MockSftpClient::removeDir(const std::string& remote_dir,
                               std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& f : files_)
        if (parentOf(f.first) == remote_dir) {
            err = "directory not empty: " + remote_dir;
            return false;
        }
    for (const auto& d : dirs_)
        if (d != remote_dir && parentOf(d) == remote_dir) {
            err = "directory not empty: " + remote_dir;
            return false;
        }
    if (!dirs_.erase(remote_dir)) {
        err = "no such remote directory: " + remote_dir;
        return false;
    }
    return true;
}

void MockSftpClient::setRemoteFile(const std::string& path, const std::string& data) {
    std::lock_guard<std::mutex> lk(mtx_);
    addParents(path);
    files_[path] = data;
}

std::optional<std::string> MockSftpClient::remoteFile(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = files_.find(path);
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

bool MockSftpClient::remoteDirExists(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dirs_.count(path) > 0;
}

bool MockSftpClient::waitWhileHeld(const CancelCB& shouldCancel) const {
    while (hold_.load()) {
        if (shouldCancel && shouldCancel()) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

void MockSftpClient::addParents(const std::string& path) {
    std::string dir = parentOf(path);
    while (dir != "/" && !dirs_.count(dir)) {
        dirs_.insert(dir);
        dir = parentOf(dir);
    }
}

} // namespace furman
