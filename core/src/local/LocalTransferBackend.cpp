// Local filesystem backend: chunked copies on worker threads with progress,
// throttling and cooperative pause/cancel.
#include "furman/LocalTransferBackend.hpp"
#include "furman/Log.hpp"
#include <cstdio>
#include <vector>

namespace fs = std::filesystem;

namespace furman {

namespace {

std::uint64_t totalBytes(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_directory(p, ec)) {
        const auto sz = fs::file_size(p, ec);
        return ec ? 0 : sz;
    }
    std::uint64_t total = 0;
    for (fs::recursive_directory_iterator it(p, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec)) {
            const auto sz = it->file_size(fec);
            if (!fec) total += sz;
        }
    }
    return total;
}

std::uint32_t countFiles(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_directory(p, ec)) return 1;
    std::uint32_t count = 0;
    for (fs::recursive_directory_iterator it(p, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_directory(fec)) ++count;
    }
    return count;
}

// Name a source gets under the destination ("/a/b/" -> "b").
fs::path leafName(const fs::path& src) {
    fs::path name = src.filename();
    if (name.empty()) name = src.parent_path().filename();
    return name;
}

void clampProgress(ProgressEvent& ev) {
    if (ev.bytesDone > ev.bytesTotal) ev.bytesTotal = ev.bytesDone;
    if (ev.filesDone > ev.filesTotal) ev.filesTotal = ev.filesDone;
}

} // namespace

LocalTransferBackend::~LocalTransferBackend() {
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

bool LocalTransferBackend::accepts(const TransferJob& job) const {
    return (job.type == TransferType::Copy || job.type == TransferType::Move) &&
           job.source.kind == BackendKind::Local &&
           job.target.kind == BackendKind::Local;
}

bool LocalTransferBackend::startTransfer(const TransferJob& job, std::string& err) {
    if (!accepts(job)) {
        err = std::string("local backend cannot run ") + toString(job.type) + " from " +
              toString(job.source.kind) + " to " + toString(job.target.kind);
        return false;
    }
    if (job.sources.empty()) {
        err = "no sources";
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
    j->throttle.setLimit(job.bandwidthLimit);
    j->active = true;
    Job* p = j.get();
    jobs_.emplace(job.id, std::move(j));
    launch(p);
    LOGI("local: started %s #%llu (%zu sources)", toString(job.type),
         (unsigned long long)job.id, job.sources.size());
    return true;
}

bool LocalTransferBackend::pauseTransfer(std::uint64_t id, std::string& err) {
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

bool LocalTransferBackend::resumeTransfer(std::uint64_t id, std::string& err) {
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
            // Worker has not parked yet
            j.pauseFlag = false;
        } else if (!j.paused) {
            err = "transfer is not paused";
            return false;
        } else {
            // The previous worker already returned; joining does not block.
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

bool LocalTransferBackend::cancelTransfer(std::uint64_t id, std::string& err) {
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
            // Paused: no worker to cooperate, finish right away
            j.paused = false;
            j.finished = true;
            finishedNow = true;
        }
    }
    if (finishedNow) sink_.finished(id, TerminalOutcome::cancelled());
    return true;
}

void LocalTransferBackend::setBandwidthLimit(std::uint64_t bytesPerSec) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& kv : jobs_) kv.second->throttle.setLimit(bytesPerSec);
}

void LocalTransferBackend::launch(Job* job) {
    job->worker = std::thread([this, job]() { run(job); });
}

void LocalTransferBackend::run(Job* job) {
    Run r;
    r.job = job;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const TransferCheckpoint& cp = job->checkpoint;
        r.skip.insert(cp.filesCompleted.begin(), cp.filesCompleted.end());
        r.completedBytes = cp.bytesDone;
        r.progress.bytesDone = cp.bytesDone;
        r.progress.bytesTotal = cp.bytesTotal;
        r.progress.filesDone = cp.filesDone;
        r.progress.filesTotal = cp.filesTotal;
    }
    if (!job->measured) {
        for (const auto& s : job->request.sources) {
            r.progress.bytesTotal += totalBytes(s);
            r.progress.filesTotal += countFiles(s);
        }
        job->measured = true;
    }

    RunResult res = RunResult::Done;
    const std::uint64_t id = job->request.id;
    for (;;) {
        res = execute(r);
        std::lock_guard<std::mutex> lk(mtx_);
        // Resumed before this worker parked: keep going
        if (res == RunResult::Paused && !job->pauseFlag.load()) continue;
        job->active = false;
        if (res == RunResult::Paused) {
            TransferCheckpoint& cp = job->checkpoint;
            cp.filesCompleted.assign(r.skip.begin(), r.skip.end());
            cp.bytesDone = r.completedBytes;
            cp.bytesTotal = r.progress.bytesTotal;
            cp.filesDone = r.progress.filesDone;
            cp.filesTotal = r.progress.filesTotal;
            job->paused = true;
        } else {
            job->finished = true;
        }
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
            LOGE("local: #%llu failed: %s", (unsigned long long)id, r.error.c_str());
            sink_.finished(id, TerminalOutcome::error(r.error));
            break;
    }
    job->exited = true;
}

LocalTransferBackend::RunResult LocalTransferBackend::execute(Run& r) {
    const TransferJob& request = r.job->request;
    const fs::path dest(request.destination);
    std::error_code ec;

    fs::create_directories(dest, ec);
    if (ec) {
        r.error = "cannot create destination " + dest.string() + ": " + ec.message();
        return RunResult::Failed;
    }

    for (const auto& s : request.sources) {
        if (r.skip.count(s)) continue;
        RunResult f = checkFlags(r);
        if (f != RunResult::Done) return f;

        const fs::path src(s);
        if (!fs::exists(src, ec)) {
            r.error = "source not found: " + s;
            return RunResult::Failed;
        }
        const fs::path name = leafName(src);
        if (name.empty()) {
            r.error = "invalid source path: " + s;
            return RunResult::Failed;
        }
        const fs::path dst = dest / name;
        if (fs::equivalent(src, dst, ec)) {
            r.error = "source and destination are the same: " + s;
            return RunResult::Failed;
        }

        if (request.type == TransferType::Move && !fs::exists(dst, ec)) {
            // Fast path: same filesystem
            const std::uint64_t bytes = totalBytes(src);
            const std::uint32_t files = countFiles(src);
            std::error_code rec;
            fs::rename(src, dst, rec);
            if (!rec) {
                r.completedBytes += bytes;
                r.progress.bytesDone = r.completedBytes;
                r.progress.filesDone += files;
                r.progress.currentFile = s;
                markCompleted(r, s);
                clampProgress(r.progress);
                sink_.progress(request.id, r.progress);
                continue;
            }
            LOGI("local: rename %s failed (%s), copying instead", s.c_str(), rec.message().c_str());
        }

        f = copyTree(r, src, dst);
        if (f != RunResult::Done) return f;

        if (request.type == TransferType::Move) {
            fs::remove_all(src, ec);
            if (ec) {
                r.error = "cannot remove source " + s + ": " + ec.message();
                return RunResult::Failed;
            }
        }
        markCompleted(r, s);
    }
    return RunResult::Done;
}

LocalTransferBackend::RunResult LocalTransferBackend::copyTree(Run& r, const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    if (!fs::is_directory(src, ec)) return copyFile(r, src, dst);

    fs::create_directories(dst, ec);
    if (ec) {
        r.error = "cannot create directory " + dst.string() + ": " + ec.message();
        return RunResult::Failed;
    }
    for (fs::directory_iterator it(src, ec), end; !ec && it != end; it.increment(ec)) {
        const RunResult res = copyTree(r, it->path(), dst / it->path().filename());
        if (res != RunResult::Done) return res;
    }
    if (ec) {
        r.error = "cannot list " + src.string() + ": " + ec.message();
        return RunResult::Failed;
    }
    return RunResult::Done;
}

LocalTransferBackend::RunResult LocalTransferBackend::copyFile(Run& r, const fs::path& src, const fs::path& dst) {
    const std::string key = src.string();
    if (r.skip.count(key)) return RunResult::Done;
    RunResult result = checkFlags(r);
    if (result != RunResult::Done) return result;

    std::error_code ec;
    if (dst.has_parent_path()) fs::create_directories(dst.parent_path(), ec);

    FILE* in = ::fopen(src.c_str(), "rb");
    if (!in) {
        r.error = "cannot open " + key + " for reading";
        return RunResult::Failed;
    }
    FILE* out = ::fopen(dst.c_str(), "wb");
    if (!out) {
        std::fclose(in);
        r.error = "cannot open " + dst.string() + " for writing";
        return RunResult::Failed;
    }

    Job& job = *r.job;
    const std::uint64_t id = job.request.id;
    auto interrupted = [&job]() { return job.cancelFlag.load() || job.pauseFlag.load(); };
    std::vector<char> buf(kChunk);
    std::uint64_t fileDone = 0;
    r.progress.currentFile = key;

    for (;;) {
        result = checkFlags(r);
        if (result != RunResult::Done) break;
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), in);
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, n, out) != n) {
                r.error = "write to " + dst.string() + " failed";
                result = RunResult::Failed;
                break;
            }
            fileDone += n;
            r.progress.bytesDone = r.completedBytes + fileDone;
            clampProgress(r.progress);
            sink_.progress(id, r.progress);
            job.throttle.pace(r.progress.bytesDone, interrupted);
        }
        if (n < buf.size()) {
            if (std::ferror(in)) {
                r.error = "read from " + key + " failed";
                result = RunResult::Failed;
            }
            break;
        }
    }
    std::fclose(in);
    if (std::fclose(out) != 0 && result == RunResult::Done) {
        r.error = "write to " + dst.string() + " failed";
        result = RunResult::Failed;
    }
    if (result != RunResult::Done) {
        // Partial file; a resumed run copies it again from the start
        fs::remove(dst, ec);
        r.progress.bytesDone = r.completedBytes;
        return result;
    }

    r.completedBytes += fileDone;
    r.progress.bytesDone = r.completedBytes;
    r.progress.filesDone += 1;
    markCompleted(r, key);
    clampProgress(r.progress);
    sink_.progress(id, r.progress);
    return RunResult::Done;
}

LocalTransferBackend::RunResult LocalTransferBackend::checkFlags(const Run& r) const {
    if (r.job->cancelFlag.load()) return RunResult::Cancelled;
    if (r.job->pauseFlag.load()) return RunResult::Paused;
    return RunResult::Done;
}

void LocalTransferBackend::markCompleted(Run& r, const std::string& path) {
    r.skip.insert(path);
}

void LocalTransferBackend::reapFinished() {
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

bool LocalTransferBackend::alreadyFinished(std::uint64_t id) const {
    if (retired_.count(id)) return true;
    auto it = jobs_.find(id);
    return it != jobs_.end() && it->second->finished;
}

} // namespace furman
