// Registry implementation: descriptors live on the owning thread; backend
// events are re-posted there before they touch any state.
#include "TransferRegistry.hpp"
#include "furman/Format.hpp"
#include "furman/Log.hpp"
#include <QMetaObject>
#include <cmath>

namespace furman {

const char* toString(TransferError e) {
    switch (e) {
        case TransferError::None: return "none";
        case TransferError::EmptySources: return "empty sources";
        case TransferError::UnknownTransfer: return "unknown transfer";
        case TransferError::InvalidTransition: return "invalid transition";
        case TransferError::BackendRejected: return "backend rejected";
    }
    return "?";
}

const char* toString(TransferDescriptor::Status s) {
    switch (s) {
        case TransferDescriptor::Status::Queued: return "queued";
        case TransferDescriptor::Status::Running: return "running";
        case TransferDescriptor::Status::Paused: return "paused";
        case TransferDescriptor::Status::Completed: return "completed";
        case TransferDescriptor::Status::Failed: return "failed";
        case TransferDescriptor::Status::Cancelled: return "cancelled";
    }
    return "?";
}

class TransferRegistry::EventRelay : public TransferEventSink {
public:
    explicit EventRelay(TransferRegistry* owner) : owner_(owner) {}

    void transferProgress(std::uint64_t id, const ProgressEvent& ev) override {
        TransferRegistry* r = owner_;
        QMetaObject::invokeMethod(r, [r, id, ev]() { r->onProgress(id, ev); }, Qt::AutoConnection);
    }

    void transferFinished(std::uint64_t id, const TerminalOutcome& outcome) override {
        TransferRegistry* r = owner_;
        QMetaObject::invokeMethod(r, [r, id, outcome]() { r->onTerminal(id, outcome); }, Qt::AutoConnection);
    }

    void controlAcknowledged(std::uint64_t id, ControlSignal signal,
                             bool accepted, const std::string& message) override {
        TransferRegistry* r = owner_;
        const QString msg = QString::fromStdString(message);
        QMetaObject::invokeMethod(r, [r, id, signal, accepted, msg]() {
            r->onControlAck(id, signal, accepted, msg);
        }, Qt::AutoConnection);
    }

private:
    TransferRegistry* owner_;
};

TransferRegistry::TransferRegistry(TransferBackend& backend, QObject* parent)
    : QObject(parent), backend_(backend), now_([]() { return Clock::now(); }),
      relay_(std::make_unique<EventRelay>(this)) {
    backend_.setEventSink(relay_.get());
    rateTimer_.setInterval(1000);
    connect(&rateTimer_, &QTimer::timeout, this, &TransferRegistry::refreshRates);
    rateTimer_.start();
}

TransferRegistry::~TransferRegistry() {
    // Waits for an event being delivered on a worker thread
    backend_.setEventSink(nullptr);
}

int TransferRegistry::indexForId(quint64 id) const {
    for (int i = 0; i < transfers_.size(); ++i)
        if (transfers_[i].id == id) return i;
    return -1;
}

const TransferDescriptor* TransferRegistry::find(quint64 id) const {
    const int idx = indexForId(id);
    return idx < 0 ? nullptr : &transfers_[idx];
}

int TransferRegistry::slotsInUse() const {
    int n = 0;
    for (const auto& t : transfers_)
        if (t.status == TransferDescriptor::Status::Running || t.status == TransferDescriptor::Status::Paused) ++n;
    return n;
}

TransferJob TransferRegistry::jobFor(const TransferDescriptor& d) const {
    TransferJob job;
    job.id = d.id;
    job.type = d.type;
    for (const auto& s : d.sources) job.sources.push_back(s.toStdString());
    job.destination = d.destination.toStdString();
    job.source = d.sourceEndpoint;
    job.target = d.targetEndpoint;
    job.archivePath = d.archivePath.toStdString();
    job.bandwidthLimit = bandwidthLimit_;
    return job;
}

quint64 TransferRegistry::submit(const TransferRequest& request, TransferError* error) {
    if (request.sources.isEmpty()) {
        LOGW("registry: rejected %s with no sources", toString(request.type));
        if (error) *error = TransferError::EmptySources;
        return 0;
    }
    TransferDescriptor d;
    d.id = nextId_++;
    d.type = request.type;
    d.sources = request.sources;
    d.destination = request.destination;
    d.sourceEndpoint = request.source;
    d.targetEndpoint = request.target;
    d.archivePath = request.archivePath;
    d.createdAt = QDateTime::currentDateTime();
    transfers_.push_back(d);
    scheduler_.enqueue(d.id);
    LOGI("registry: submitted %s #%llu (%d sources)", toString(d.type),
         (unsigned long long)d.id, int(d.sources.size()));
    if (error) *error = TransferError::None;
    emit transfersChanged();
    setPanelVisible(true);
    processQueue();
    return d.id;
}

quint64 TransferRegistry::submit(TransferType type, const QStringList& sources, const QString& destination,
                                 TransferError* error) {
    TransferRequest request;
    request.type = type;
    request.sources = sources;
    request.destination = destination;
    return submit(request, error);
}

void TransferRegistry::processQueue() {
    // A start may report back synchronously; the outer loop keeps admitting.
    if (admitting_) return;
    admitting_ = true;
    while (auto next = scheduler_.admitNext(slotsInUse(), maxConcurrent_)) {
        const quint64 id = *next;
        const int idx = indexForId(id);
        if (idx < 0) continue;
        TransferDescriptor& d = transfers_[idx];
        d.status = TransferDescriptor::Status::Running;
        d.startedAt = QDateTime::currentDateTime();
        trackers_[id].reset();
        const TransferJob job = jobFor(d);
        emit transfersChanged();

        std::string err;
        if (!backend_.startTransfer(job, err)) {
            LOGE("registry: backend refused #%llu: %s", (unsigned long long)id, err.c_str());
            const int cur = indexForId(id);
            if (cur >= 0 && !transfers_[cur].isTerminal()) {
                finish(cur, TransferDescriptor::Status::Failed,
                       err.empty() ? QStringLiteral("backend refused to start the transfer")
                                   : QString::fromStdString(err));
            }
            continue;
        }
        LOGI("registry: admitted #%llu", (unsigned long long)id);
    }
    admitting_ = false;
}

TransferError TransferRegistry::pause(quint64 id) {
    int idx = indexForId(id);
    if (idx < 0) return TransferError::UnknownTransfer;
    if (transfers_[idx].status != TransferDescriptor::Status::Running || transfers_[idx].cancelRequested)
        return TransferError::InvalidTransition;
    transfers_[idx].status = TransferDescriptor::Status::Paused;
    transfers_[idx].speedBytesPerSec = 0.0;
    trackers_[id].reset();
    emit transfersChanged();

    std::string err;
    if (!backend_.pauseTransfer(id, err)) {
        LOGW("registry: pause of #%llu rejected: %s", (unsigned long long)id, err.c_str());
        idx = indexForId(id);
        if (idx >= 0 && transfers_[idx].status == TransferDescriptor::Status::Paused) {
            transfers_[idx].status = TransferDescriptor::Status::Running;
            emit transfersChanged();
        }
        return TransferError::BackendRejected;
    }
    return TransferError::None;
}

TransferError TransferRegistry::resume(quint64 id) {
    int idx = indexForId(id);
    if (idx < 0) return TransferError::UnknownTransfer;
    if (transfers_[idx].status != TransferDescriptor::Status::Paused || transfers_[idx].cancelRequested)
        return TransferError::InvalidTransition;
    transfers_[idx].status = TransferDescriptor::Status::Running;
    emit transfersChanged();

    std::string err;
    if (!backend_.resumeTransfer(id, err)) {
        LOGW("registry: resume of #%llu rejected: %s", (unsigned long long)id, err.c_str());
        idx = indexForId(id);
        if (idx >= 0 && !transfers_[idx].isTerminal()) {
            finish(idx, TransferDescriptor::Status::Failed,
                   QStringLiteral("resume rejected: %1").arg(QString::fromStdString(err)));
            processQueue();
        }
        return TransferError::BackendRejected;
    }
    return TransferError::None;
}

TransferError TransferRegistry::cancel(quint64 id) {
    int idx = indexForId(id);
    if (idx < 0) return TransferError::UnknownTransfer;
    TransferDescriptor& d = transfers_[idx];
    if (d.isTerminal()) return TransferError::InvalidTransition;

    if (d.status == TransferDescriptor::Status::Queued) {
        // Never started: the backend does not know about it
        scheduler_.remove(id);
        trackers_.erase(id);
        transfers_.remove(idx);
        LOGI("registry: removed queued #%llu", (unsigned long long)id);
        emit transfersChanged();
        return TransferError::None;
    }
    if (d.cancelRequested) return TransferError::None;

    d.cancelRequested = true;
    emit transfersChanged();

    std::string err;
    if (!backend_.cancelTransfer(id, err)) {
        LOGW("registry: cancel of #%llu rejected: %s", (unsigned long long)id, err.c_str());
        idx = indexForId(id);
        if (idx >= 0 && !transfers_[idx].isTerminal()) {
            finish(idx, TransferDescriptor::Status::Failed,
                   QStringLiteral("cancel rejected: %1").arg(QString::fromStdString(err)));
            processQueue();
        }
        return TransferError::BackendRejected;
    }
    return TransferError::None;
}

TransferError TransferRegistry::moveUp(quint64 id) {
    const int idx = indexForId(id);
    if (idx < 0) return TransferError::UnknownTransfer;
    if (transfers_[idx].status != TransferDescriptor::Status::Queued) return TransferError::InvalidTransition;
    const int before = scheduler_.position(id);
    scheduler_.moveUp(id);
    if (scheduler_.position(id) != before) emit transfersChanged();
    return TransferError::None;
}

TransferError TransferRegistry::moveDown(quint64 id) {
    const int idx = indexForId(id);
    if (idx < 0) return TransferError::UnknownTransfer;
    if (transfers_[idx].status != TransferDescriptor::Status::Queued) return TransferError::InvalidTransition;
    const int before = scheduler_.position(id);
    scheduler_.moveDown(id);
    if (scheduler_.position(id) != before) emit transfersChanged();
    return TransferError::None;
}

TransferError TransferRegistry::dismiss(quint64 id) {
    const int idx = indexForId(id);
    if (idx < 0) return TransferError::UnknownTransfer;
    if (!transfers_[idx].isTerminal()) return TransferError::InvalidTransition;
    transfers_.remove(idx);
    trackers_.erase(id);
    emit transfersChanged();
    return TransferError::None;
}

int TransferRegistry::dismissCompleted() {
    QVector<TransferDescriptor> next;
    next.reserve(transfers_.size());
    for (const auto& t : transfers_) {
        if (t.isTerminal()) trackers_.erase(t.id);
        else next.push_back(t);
    }
    const int removed = int(transfers_.size() - next.size());
    transfers_.swap(next);
    if (removed > 0) emit transfersChanged();
    return removed;
}

void TransferRegistry::toggle() {
    setPanelVisible(!panelVisible_);
}

void TransferRegistry::setPanelVisible(bool visible) {
    if (panelVisible_ == visible) return;
    panelVisible_ = visible;
    emit panelVisibleChanged(visible);
}

void TransferRegistry::useSettings(TransferSettings* settings) {
    settings_ = nullptr;
    if (!settings) return;
    setMaxConcurrent(settings->maxConcurrent());
    setBandwidthLimit(settings->bandwidthLimit());
    settings_ = settings;
}

void TransferRegistry::setMaxConcurrent(int n) {
    if (n < 1) n = 1;
    if (n != maxConcurrent_) {
        maxConcurrent_ = n;
        persistConfig();
        emit settingsChanged(maxConcurrent_, bandwidthLimit_);
    }
    processQueue();
}

void TransferRegistry::setBandwidthLimit(quint64 bytesPerSec) {
    const bool changed = bytesPerSec != bandwidthLimit_;
    bandwidthLimit_ = bytesPerSec;
    backend_.setBandwidthLimit(bytesPerSec);
    LOGI("registry: bandwidth limit %llu B/s", (unsigned long long)bytesPerSec);
    if (changed) {
        persistConfig();
        emit settingsChanged(maxConcurrent_, bandwidthLimit_);
    }
}

void TransferRegistry::persistConfig() {
    if (!settings_) return;
    settings_->setMaxConcurrent(maxConcurrent_);
    settings_->setBandwidthLimit(bandwidthLimit_);
    if (!settings_->sync()) LOGW("registry: transfer settings were not saved");
}

void TransferRegistry::finish(int idx, TransferDescriptor::Status status, const QString& error) {
    TransferDescriptor& d = transfers_[idx];
    d.status = status;
    d.error = status == TransferDescriptor::Status::Failed ? error : QString();
    if (status == TransferDescriptor::Status::Failed && d.error.isEmpty()) d.error = QStringLiteral("transfer failed");
    d.cancelRequested = false;
    d.speedBytesPerSec = 0.0;
    d.completedAt = QDateTime::currentDateTime();
    scheduler_.remove(d.id);
    trackers_.erase(d.id);
    const quint64 id = d.id;
    LOGI("registry: #%llu %s", (unsigned long long)id, toString(status));
    emit transfersChanged();
    emit transferFinished(id);
}

void TransferRegistry::onProgress(quint64 id, const ProgressEvent& ev) {
    const int idx = indexForId(id);
    if (idx < 0) return;
    TransferDescriptor& d = transfers_[idx];
    if (d.status != TransferDescriptor::Status::Running && d.status != TransferDescriptor::Status::Paused) return;

    ProgressEvent p = ev;
    if (p.bytesDone > p.bytesTotal) p.bytesTotal = p.bytesDone;
    if (p.filesDone > p.filesTotal) p.filesTotal = p.filesDone;
    d.progress = p;
    ProgressTracker& tracker = trackers_[id];
    tracker.update(p.bytesDone, now_());
    d.speedBytesPerSec = d.status == TransferDescriptor::Status::Running ? tracker.bytesPerSec() : 0.0;
    emit transfersChanged();
}

void TransferRegistry::onTerminal(quint64 id, const TerminalOutcome& outcome) {
    const int idx = indexForId(id);
    if (idx < 0) return;
    const TransferDescriptor& d = transfers_[idx];
    // Late or duplicate events
    if (d.status != TransferDescriptor::Status::Running && d.status != TransferDescriptor::Status::Paused) return;

    switch (outcome.kind) {
        case TerminalKind::Success:
            if (d.progress) {
                ProgressEvent p = *d.progress;
                p.bytesDone = p.bytesTotal;
                p.filesDone = p.filesTotal;
                transfers_[idx].progress = p;
            }
            finish(idx, TransferDescriptor::Status::Completed);
            break;
        case TerminalKind::Error:
            finish(idx, TransferDescriptor::Status::Failed, QString::fromStdString(outcome.message));
            break;
        case TerminalKind::Cancelled:
            finish(idx, TransferDescriptor::Status::Cancelled);
            break;
    }
    processQueue();
}

void TransferRegistry::onControlAck(quint64 id, ControlSignal signal, bool accepted, const QString& message) {
    if (accepted) return;
    const int idx = indexForId(id);
    if (idx < 0 || transfers_[idx].isTerminal()) return;
    TransferDescriptor& d = transfers_[idx];
    LOGW("registry: %s of #%llu rejected: %s", toString(signal), (unsigned long long)id,
         message.toStdString().c_str());

    switch (signal) {
        case ControlSignal::Pause:
            if (d.status == TransferDescriptor::Status::Paused) {
                d.status = TransferDescriptor::Status::Running;
                emit transfersChanged();
            }
            break;
        case ControlSignal::Resume:
            finish(idx, TransferDescriptor::Status::Failed, QStringLiteral("resume rejected: %1").arg(message));
            processQueue();
            break;
        case ControlSignal::Cancel:
            finish(idx, TransferDescriptor::Status::Failed, QStringLiteral("cancel rejected: %1").arg(message));
            processQueue();
            break;
    }
}

void TransferRegistry::refreshRates() {
    const auto now = now_();
    bool changed = false;
    for (auto& d : transfers_) {
        if (d.status != TransferDescriptor::Status::Running) continue;
        auto it = trackers_.find(d.id);
        if (it == trackers_.end()) continue;
        if (it->second.decayIfIdle(now)) {
            d.speedBytesPerSec = it->second.bytesPerSec();
            changed = true;
        }
    }
    if (changed) emit transfersChanged();
}

QVector<TransferDescriptor> TransferRegistry::active() const {
    QVector<TransferDescriptor> out;
    for (const auto& t : transfers_)
        if (t.status == TransferDescriptor::Status::Running) out.push_back(t);
    return out;
}

QVector<TransferDescriptor> TransferRegistry::paused() const {
    QVector<TransferDescriptor> out;
    for (const auto& t : transfers_)
        if (t.status == TransferDescriptor::Status::Paused) out.push_back(t);
    return out;
}

QVector<TransferDescriptor> TransferRegistry::queued() const {
    QVector<TransferDescriptor> out;
    for (const quint64 id : scheduler_.order()) {
        const int idx = indexForId(id);
        if (idx >= 0) out.push_back(transfers_[idx]);
    }
    return out;
}

bool TransferRegistry::hasActive() const {
    for (const auto& t : transfers_)
        if (t.status == TransferDescriptor::Status::Running) return true;
    return false;
}

TransferSummary TransferRegistry::summary() const {
    TransferSummary s;
    for (const auto& t : transfers_) {
        if (t.isTerminal()) continue;
        switch (t.status) {
            case TransferDescriptor::Status::Running: ++s.active; break;
            case TransferDescriptor::Status::Paused: ++s.paused; break;
            default: ++s.queued; break;
        }
        switch (t.type) {
            case TransferType::Copy: ++s.copies; break;
            case TransferType::Move: ++s.moves; break;
            case TransferType::Extract: ++s.extracts; break;
        }
        if (t.status != TransferDescriptor::Status::Queued && t.progress) {
            s.bytesDone += t.progress->bytesDone;
            s.bytesTotal += t.progress->bytesTotal;
        }
    }
    return s;
}

int TransferRegistry::aggregatePercent() const {
    quint64 done = 0;
    quint64 total = 0;
    for (const auto& t : transfers_) {
        if (t.status != TransferDescriptor::Status::Running && t.status != TransferDescriptor::Status::Paused) continue;
        if (!t.progress || t.progress->bytesTotal == 0) continue;
        done += t.progress->bytesDone;
        total += t.progress->bytesTotal;
    }
    if (total == 0) return 0;
    return int(std::lround(double(done) / double(total) * 100.0));
}

QString TransferRegistry::aggregateSummary() const {
    const TransferSummary s = summary();
    const int count = s.active + s.paused;
    if (count == 0 && s.queued == 0) return QString();

    QString line;
    if (count > 0) {
        line = count == 1 ? QStringLiteral("1 transfer") : QStringLiteral("%1 transfers").arg(count);
        line += QStringLiteral(" - %1%").arg(aggregatePercent());
        if (s.bytesTotal > 0) {
            line += QStringLiteral(" %1/%2").arg(QString::fromStdString(formatSize(s.bytesDone)),
                                                 QString::fromStdString(formatSize(s.bytesTotal)));
        }
    }
    if (s.queued > 0) {
        if (!line.isEmpty()) line += QStringLiteral(", ");
        line += QStringLiteral("%1 queued").arg(s.queued);
    }
    return line;
}

std::optional<double> TransferRegistry::eta(quint64 id) const {
    const TransferDescriptor* d = find(id);
    if (!d || !d->progress) return std::nullopt;
    return etaSeconds(d->progress->bytesDone, d->progress->bytesTotal, d->speedBytesPerSec);
}

} // namespace furman
