// SFTP backend: per-job worker threads calling into a shared SftpClient.
#include "furman/SftpTransferBackend.hpp"
#include "furman/Log.hpp"
#include <chrono>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace furman {

namespace {

std::string joinRemote(const std::string& base, const std::string& name) {
    if (base.empty() || base == "/") return "/" + name;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

std::string remoteBaseName(std::string path) {
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

void clampProgress(ProgressEvent& ev) {
    if (ev.bytesDone > ev.bytesTotal) ev.bytesTotal = ev.bytesDone;
    if (ev.filesDone > ev.filesTotal) ev.filesTotal = ev.filesDone;
}

} // namespace

SftpTransferBackend::~SftpTransferBackend() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto& kv : jobs_) {
            kv.second->cancelFlag = true;
            if (kv.second->worker.joinable()) threads.push_back(std::move(kv.second->worker));
        }
    }
    for (auto& t : threads) t.join();
    jobs_.clear();
}

bool SftpTransferBackend::accepts(const TransferJob& job) const {
    if (job.type != TransferType::Copy && job.type != TransferType::Move) return false;
    const bool upload = job.source.kind == BackendKind::Local && job.target.kind == BackendKind::Sftp;
    const bool download = job.source.kind == BackendKind::Sftp && job.target.kind == BackendKind::Local;
    return upload || download;
}

bool SftpTransferBackend::startTransfer(const TransferJob& job, std::string& err) {
    if (!accepts(job)) {
        err = std::string("sftp backend cannot run ") + toString(job.type) + " from " +
              toString(job.source.kind) + " to " + toString(job.target.kind);
        return false;
    }
    if (!client_) {
        err = "no sftp client";
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    reapFinished();
    if (jobs_.count(job.id)) {
        err = "duplicate transfer id";
        return false;
    }
    auto j = std::make_unique<Job>();
    j->request = job;
    j->upload = job.source.kind == BackendKind::Local;
    j->throttle.setLimit(job.bandwidthLimit);
    j->active = true;
    Job* p = j.get();
    jobs_.emplace(job.id, std::move(j));
    launch(p);
    LOGI("sftp: started %s #%llu", p->upload ? "upload" : "download", (unsigned long long)job.id);
    return true;
}

bool SftpTransferBackend::pauseTransfer(std::uint64_t id, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second->finished) {
        err = "unknown transfer";
        return false;
    }
    if (!it->second->active) {
        err = "transfer is not running";
        return false;
    }
    it->second->pauseFlag = true;
    return true;
}

bool SftpTransferBackend::resumeTransfer(std::uint64_t id, std::string& err) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (alreadyFinished(id)) return true;
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            err = "unknown transfer";
            return false;
        }
        Job& j = *it->second;
        if (j.active && j.pauseFlag.load()) {
            j.pauseFlag = false;
        } else if (!j.paused) {
            err = "transfer is not paused";
            return false;
        } else {
            if (j.worker.joinable()) j.worker.join();
            j.paused = false;
            j.active = true;
            j.pauseFlag = false;
            j.exited = false;
            j.throttle.restart(j.checkpoint.bytesDone);
            launch(&j);
        }
    }
    sink_.acknowledged(id, ControlSignal::Resume, true);
    return true;
}

bool SftpTransferBackend::cancelTransfer(std::uint64_t id, std::string& err) {
    bool finishedNow = false;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (alreadyFinished(id)) return true;
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            err = "unknown transfer";
            return false;
        }
        Job& j = *it->second;
        if (j.active) {
            j.cancelFlag = true;
        } else {
            j.paused = false;
            j.finished = true;
            finishedNow = true;
        }
    }
    if (finishedNow) sink_.finished(id, TerminalOutcome::cancelled());
    return true;
}

void SftpTransferBackend::setBandwidthLimit(std::uint64_t bytesPerSec) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& kv : jobs_) kv.second->throttle.setLimit(bytesPerSec);
}

void SftpTransferBackend::launch(Job* job) {
    job->worker = std::thread([this, job]() { run(job); });
}

void SftpTransferBackend::run(Job* job) {
    std::string err;
    ProgressEvent progress;
    RunResult res = RunResult::Failed;
    if (!ensureConnected(err)) {
        res = RunResult::Failed;
    } else if (!job->planned && !plan(*job, err)) {
        res = RunResult::Failed;
    } else {
        res = execute(*job, job->checkpoint, progress, err);
    }

    const std::uint64_t id = job->request.id;
    for (;;) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (res == RunResult::Paused && !job->pauseFlag.load()) {
            // Resumed before this worker parked: keep going
            lk.unlock();
            res = execute(*job, job->checkpoint, progress, err);
            continue;
        }
        job->active = false;
        if (res == RunResult::Paused) job->paused = true;
        else job->finished = true;
        break;
    }
    switch (res) {
        case RunResult::Done:
            sink_.finished(id, TerminalOutcome::success());
            break;
        case RunResult::Paused:
            sink_.acknowledged(id, ControlSignal::Pause, true);
            break;
        case RunResult::Cancelled:
            sink_.finished(id, TerminalOutcome::cancelled());
            break;
        case RunResult::Failed:
            LOGE("sftp: #%llu failed: %s", (unsigned long long)id, err.c_str());
            sink_.finished(id, TerminalOutcome::error(err));
            break;
    }
    job->exited = true;
}

bool SftpTransferBackend::plan(Job& job, std::string& err) {
    job.items.clear();
    job.dirs.clear();
    const std::string& dest = job.request.destination;
    for (const auto& s : job.request.sources) {
        if (job.upload) {
            const fs::path src(s);
            std::error_code ec;
            if (!fs::exists(src, ec)) {
                err = "source not found: " + s;
                return false;
            }
            fs::path name = src.filename();
            if (name.empty()) name = src.parent_path().filename();
            const std::string remoteBase = joinRemote(dest, name.string());
            if (fs::is_directory(src, ec)) {
                job.dirs.push_back(remoteBase);
                for (fs::recursive_directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec)) {
                    const std::string rel = fs::relative(it->path(), src, ec).generic_string();
                    if (it->is_directory(ec)) {
                        job.dirs.push_back(joinRemote(remoteBase, rel));
                    } else {
                        job.items.push_back({it->path().string(), joinRemote(remoteBase, rel), it->file_size(ec)});
                    }
                }
                if (ec) {
                    err = "cannot list " + s + ": " + ec.message();
                    return false;
                }
            } else {
                job.items.push_back({s, remoteBase, fs::file_size(src, ec)});
            }
        } else {
            FileInfo info{};
            std::string stErr;
            bool found = false;
            {
                std::lock_guard<std::mutex> slk(sftpMutex_);
                found = client_->stat(s, info, stErr);
            }
            if (!found) {
                err = stErr.empty() ? "source not found: " + s : stErr;
                return false;
            }
            const std::string localBase = (fs::path(dest) / remoteBaseName(s)).string();
            if (info.is_dir) {
                job.dirs.push_back(localBase);
                if (!planRemote(s, localBase, job, err)) return false;
            } else {
                job.items.push_back({s, localBase, info.size});
            }
        }
    }

    TransferCheckpoint& cp = job.checkpoint;
    cp.bytesTotal = 0;
    for (const auto& it : job.items) cp.bytesTotal += it.size;
    cp.filesTotal = (std::uint32_t)job.items.size();
    job.planned = true;
    return true;
}

bool SftpTransferBackend::planRemote(const std::string& dir, const std::string& localBase,
                                     Job& job, std::string& err) {
    std::vector<FileInfo> entries;
    {
        std::lock_guard<std::mutex> slk(sftpMutex_);
        if (!client_->list(dir, entries, err)) return false;
    }
    for (const auto& e : entries) {
        const std::string r = joinRemote(dir, e.name);
        const std::string l = (fs::path(localBase) / e.name).string();
        if (e.is_dir) {
            job.dirs.push_back(l);
            if (!planRemote(r, l, job, err)) return false;
        } else {
            job.items.push_back({r, l, e.size});
        }
    }
    return true;
}

SftpTransferBackend::RunResult SftpTransferBackend::execute(Job& job, TransferCheckpoint& cp,
                                                            ProgressEvent& progress, std::string& err) {
    // Target directories first
    if (job.upload) {
        if (!ensureRemoteDir(job.request.destination, err)) return RunResult::Failed;
        for (const auto& d : job.dirs)
            if (!ensureRemoteDir(d, err)) return RunResult::Failed;
    } else {
        std::error_code ec;
        fs::create_directories(job.request.destination, ec);
        for (const auto& d : job.dirs) fs::create_directories(d, ec);
        if (ec) {
            err = "cannot create local directories: " + ec.message();
            return RunResult::Failed;
        }
    }

    const std::set<std::string> skip(cp.filesCompleted.begin(), cp.filesCompleted.end());
    progress.bytesDone = cp.bytesDone;
    progress.bytesTotal = cp.bytesTotal;
    progress.filesDone = cp.filesDone;
    progress.filesTotal = cp.filesTotal;

    auto shouldCancel = [&job]() -> bool {
        return job.cancelFlag.load() || job.pauseFlag.load();
    };

    for (const Item& item : job.items) {
        if (skip.count(item.src)) continue;
        RunResult f = checkFlags(job);
        if (f != RunResult::Done) {
            if (f == RunResult::Paused) cp.partialFile.clear();
            return f;
        }

        const bool resume = item.src == cp.partialFile;
        const std::uint64_t base = cp.bytesDone;
        progress.currentFile = item.src;
        auto onProgress = [&, base](std::size_t done, std::size_t total) {
            (void)total;
            progress.bytesDone = base + done;
            clampProgress(progress);
            sink_.progress(job.request.id, progress);
            job.throttle.pace(progress.bytesDone, shouldCancel);
        };

        std::string xerr;
        bool ok = false;
        {
            std::lock_guard<std::mutex> slk(sftpMutex_);
            ok = job.upload
                ? client_->put(item.src, item.dst, xerr, onProgress, shouldCancel, resume)
                : client_->get(item.src, item.dst, xerr, onProgress, shouldCancel, resume);
        }
        if (!ok) {
            f = checkFlags(job);
            if (f == RunResult::Paused) {
                cp.partialFile = item.src;
                return f;
            }
            if (f == RunResult::Cancelled) {
                std::string rmErr;
                if (job.upload) {
                    std::lock_guard<std::mutex> slk(sftpMutex_);
                    if (!client_->removeFile(item.dst, rmErr))
                        LOGW("sftp: could not remove partial %s: %s", item.dst.c_str(), rmErr.c_str());
                } else {
                    std::error_code ec;
                    fs::remove(item.dst, ec);
                }
                return f;
            }
            err = xerr.empty() ? "transfer of " + item.src + " failed" : xerr;
            return RunResult::Failed;
        }

        cp.bytesDone += item.size;
        cp.filesDone += 1;
        cp.filesCompleted.push_back(item.src);
        cp.partialFile.clear();
        progress.bytesDone = cp.bytesDone;
        progress.filesDone = cp.filesDone;
        clampProgress(progress);
        sink_.progress(job.request.id, progress);
    }

    if (job.request.type == TransferType::Move) {
        for (const auto& s : job.request.sources) {
            if (job.upload) {
                std::error_code ec;
                fs::remove_all(s, ec);
                if (ec) {
                    err = "cannot remove source " + s + ": " + ec.message();
                    return RunResult::Failed;
                }
            } else if (!removeRemoteTree(s, err)) {
                return RunResult::Failed;
            }
        }
    }
    return RunResult::Done;
}

bool SftpTransferBackend::ensureRemoteDir(const std::string& dir, std::string& err) {
    if (dir.empty()) return true;
    std::string cur = "/";
    std::size_t start = 0;
    while (start <= dir.size()) {
        std::size_t end = dir.find('/', start);
        if (end == std::string::npos) end = dir.size();
        const std::string part = dir.substr(start, end - start);
        start = end + 1;
        if (part.empty()) continue;
        const std::string next = joinRemote(cur, part);
        bool isDir = false;
        std::string e;
        std::lock_guard<std::mutex> slk(sftpMutex_);
        const bool exists = client_->exists(next, isDir, e);
        if (!exists && e.empty()) {
            if (!client_->mkdir(next, err, 0755)) return false;
        } else if (!e.empty()) {
            err = e;
            return false;
        } else if (!isDir) {
            err = "not a directory: " + next;
            return false;
        }
        cur = next;
    }
    return true;
}

bool SftpTransferBackend::removeRemoteTree(const std::string& path, std::string& err) {
    FileInfo info{};
    std::vector<FileInfo> entries;
    {
        std::lock_guard<std::mutex> slk(sftpMutex_);
        if (!client_->stat(path, info, err)) {
            if (err.empty()) err = "no such remote path: " + path;
            return false;
        }
        if (!info.is_dir) return client_->removeFile(path, err);
        if (!client_->list(path, entries, err)) return false;
    }
    for (const auto& e : entries)
        if (!removeRemoteTree(joinRemote(path, e.name), err)) return false;
    std::lock_guard<std::mutex> slk(sftpMutex_);
    return client_->removeDir(path, err);
}

SftpTransferBackend::RunResult SftpTransferBackend::checkFlags(const Job& job) const {
    if (job.cancelFlag.load()) return RunResult::Cancelled;
    if (job.pauseFlag.load()) return RunResult::Paused;
    return RunResult::Done;
}

bool SftpTransferBackend::ensureConnected(std::string& err) {
    if (!client_) {
        err = "no sftp client";
        return false;
    }
    {
        std::lock_guard<std::mutex> slk(sftpMutex_);
        if (client_->isConnected()) return true;
    }
    if (!sessionOpt_.has_value()) {
        err = "not connected and no session options to reconnect";
        return false;
    }
    // Try reconnecting with exponential backoff
    using namespace std::chrono_literals;
    for (int i = 0; i < 3; ++i) {
        std::this_thread::sleep_for((1 << i) * 500ms);
        std::lock_guard<std::mutex> slk(sftpMutex_);
        if (client_->connect(*sessionOpt_, err)) return true;
    }
    return false;
}

void SftpTransferBackend::reapFinished() {
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        Job& j = *it->second;
        if (j.finished && j.exited.load()) {
            if (j.worker.joinable()) j.worker.join();
            retired_.insert(it->first);
            it = jobs_.erase(it);
        } else {
            ++it;
        }
    }
}

bool SftpTransferBackend::alreadyFinished(std::uint64_t id) const {
    if (retired_.count(id)) return true;
    auto it = jobs_.find(id);
    return it != jobs_.end() && it->second->finished;
}

} // namespace furman
