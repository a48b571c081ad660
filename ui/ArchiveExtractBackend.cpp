#include "ArchiveExtractBackend.hpp"
#include "furman/Log.hpp"
#include <QDir>
#include <QFileInfo>

namespace furman {

ArchiveExtractBackend::ArchiveExtractBackend(QObject* parent) : QObject(parent) {}

ArchiveExtractBackend::~ArchiveExtractBackend() {
    for (auto& kv : jobs_) {
        QProcess* p = kv.second.process;
        p->disconnect(this);
        p->kill();
        p->waitForFinished(1000);
    }
    jobs_.clear();
}

bool ArchiveExtractBackend::accepts(const TransferJob& job) const {
    return job.type == TransferType::Extract &&
           job.source.kind == BackendKind::Local &&
           job.target.kind == BackendKind::Local;
}

QStringList ArchiveExtractBackend::argumentsFor(const TransferJob& job) {
    QStringList args;
    args << QStringLiteral("x")
         << QString::fromStdString(job.archivePath)
         << QStringLiteral("-o%1").arg(QString::fromStdString(job.destination))
         << QStringLiteral("-y");
    for (const auto& entry : job.sources) args << QString::fromStdString(entry);
    return args;
}

bool ArchiveExtractBackend::startTransfer(const TransferJob& job, std::string& err) {
    if (!accepts(job)) {
        err = "archive backend only extracts local archives";
        return false;
    }
    if (jobs_.count(job.id)) {
        err = "duplicate transfer id";
        return false;
    }
    const QString archive = QString::fromStdString(job.archivePath);
    if (archive.isEmpty() || !QFileInfo::exists(archive)) {
        err = "archive not found: " + job.archivePath;
        return false;
    }
    if (!QDir(QString::fromStdString(job.destination)).exists()) {
        err = "destination not found: " + job.destination;
        return false;
    }

    auto* proc = new QProcess(this);
    proc->setProcessChannelMode(QProcess::MergedChannels);
    const std::uint64_t id = job.id;
    connect(proc, &QProcess::finished, this, [this, id](int exitCode, QProcess::ExitStatus status) {
        onFinished(id, exitCode, status);
    });
    proc->start(program_, argumentsFor(job));
    if (!proc->waitForStarted(5000)) {
        err = proc->error() == QProcess::FailedToStart
            ? program_.toStdString() + " not found"
            : "failed to run " + program_.toStdString() + ": " + proc->errorString().toStdString();
        proc->disconnect(this);
        proc->deleteLater();
        return false;
    }

    Job j;
    j.process = proc;
    j.filesTotal = (std::uint32_t)job.sources.size();
    jobs_.emplace(id, j);
    LOGI("extract: #%llu %s -> %s", (unsigned long long)id, job.archivePath.c_str(), job.destination.c_str());

    ProgressEvent ev;
    ev.filesTotal = j.filesTotal;
    sink_.progress(id, ev);
    return true;
}

bool ArchiveExtractBackend::pauseTransfer(std::uint64_t id, std::string& err) {
    (void)id;
    err = "extraction cannot be paused";
    return false;
}

bool ArchiveExtractBackend::resumeTransfer(std::uint64_t id, std::string& err) {
    (void)id;
    err = "extraction cannot be paused";
    return false;
}

bool ArchiveExtractBackend::cancelTransfer(std::uint64_t id, std::string& err) {
    if (finished_.count(id)) return true;
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        err = "unknown transfer";
        return false;
    }
    it->second.cancelled = true;
    it->second.process->kill();
    return true;
}

void ArchiveExtractBackend::setBandwidthLimit(std::uint64_t bytesPerSec) {
    (void)bytesPerSec;
}

void ArchiveExtractBackend::onFinished(std::uint64_t id, int exitCode, QProcess::ExitStatus status) {
    auto it = jobs_.find(id);
    if (it == jobs_.end()) return;
    const Job j = it->second;
    jobs_.erase(it);
    finished_.insert(id);
    const QString output = QString::fromLocal8Bit(j.process->readAll()).trimmed();
    j.process->deleteLater();

    if (j.cancelled) {
        sink_.finished(id, TerminalOutcome::cancelled());
        return;
    }
    if (status != QProcess::NormalExit || exitCode != 0) {
        std::string msg = status == QProcess::NormalExit
            ? "7z extract failed with exit code: " + std::to_string(exitCode)
            : std::string("7z extract crashed");
        LOGE("extract: #%llu %s: %s", (unsigned long long)id, msg.c_str(), output.toStdString().c_str());
        sink_.finished(id, TerminalOutcome::error(msg));
        return;
    }
    ProgressEvent ev;
    ev.filesDone = j.filesTotal;
    ev.filesTotal = j.filesTotal;
    sink_.progress(id, ev);
    sink_.finished(id, TerminalOutcome::success());
}

} // namespace furman
