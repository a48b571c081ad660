// Owns every transfer of the session: lifecycle, admission and aggregates.
#pragma once
#include <QDateTime>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>
#include <QVector>
#include <functional>
#include <memory>
#include <optional>
#include <unordered_map>
#include "furman/ProgressTracker.hpp"
#include "furman/QueueScheduler.hpp"
#include "furman/TransferBackend.hpp"
#include "TransferSettings.hpp"

namespace furman {

// Why a registry operation was refused. State is unchanged for every value
// except BackendRejected, where the descriptor was reconciled.
enum class TransferError {
    None,
    EmptySources,
    UnknownTransfer,
    InvalidTransition,
    BackendRejected
};

const char* toString(TransferError e);

// One copy/move/extract job as seen by the UI.
struct TransferDescriptor {
    // Status:
    //  - Queued: waiting for a free slot
    //  - Running: handed to the backend
    //  - Paused: stopped by the user, keeps its slot
    //  - Completed / Failed / Cancelled: terminal
    enum class Status { Queued, Running, Paused, Completed, Failed, Cancelled };

    quint64 id = 0;
    TransferType type = TransferType::Copy;
    QStringList sources;   // entry paths inside the archive for Extract
    QString destination;
    Endpoint sourceEndpoint;
    Endpoint targetEndpoint;
    QString archivePath;   // Extract only

    Status status = Status::Queued;
    std::optional<ProgressEvent> progress; // set by the first progress event
    double speedBytesPerSec = 0.0;
    QString error;                 // non-empty iff Failed
    bool cancelRequested = false;  // cancel sent, waiting for the backend
    QDateTime createdAt;
    QDateTime startedAt;
    QDateTime completedAt;

    bool isTerminal() const {
        return status == Status::Completed || status == Status::Failed || status == Status::Cancelled;
    }
};

const char* toString(TransferDescriptor::Status s);

struct TransferRequest {
    TransferType type = TransferType::Copy;
    QStringList sources;
    QString destination;
    Endpoint source;
    Endpoint target;
    QString archivePath;
};

// Counters over the non-terminal transfers.
struct TransferSummary {
    int active = 0;
    int paused = 0;
    int queued = 0;
    int copies = 0;
    int moves = 0;
    int extracts = 0;
    quint64 bytesDone = 0;  // running + paused with progress
    quint64 bytesTotal = 0;
};

class TransferRegistry : public QObject {
    Q_OBJECT
public:
    using Clock = ProgressTracker::Clock;

    // The backend is not owned; it must outlive the registry.
    explicit TransferRegistry(TransferBackend& backend, QObject* parent = nullptr);
    ~TransferRegistry() override;

    // Returns the new id, or 0 when the request is refused.
    quint64 submit(const TransferRequest& request, TransferError* error = nullptr);
    quint64 submit(TransferType type, const QStringList& sources, const QString& destination,
                   TransferError* error = nullptr);

    TransferError pause(quint64 id);
    TransferError resume(quint64 id);
    TransferError cancel(quint64 id);
    TransferError moveUp(quint64 id);
    TransferError moveDown(quint64 id);
    TransferError dismiss(quint64 id);
    // Returns the number of descriptors removed.
    int dismissCompleted();

    void toggle();
    void setPanelVisible(bool visible);
    bool panelVisible() const { return panelVisible_; }

    // Applies the stored limits and writes them back on every change.
    // nullptr stops persisting. Not owned; must outlive the registry.
    void useSettings(TransferSettings* settings);

    // Values < 1 are clamped to 1.
    void setMaxConcurrent(int n);
    int maxConcurrent() const { return maxConcurrent_; }
    // 0 = unlimited
    void setBandwidthLimit(quint64 bytesPerSec);
    quint64 bandwidthLimit() const { return bandwidthLimit_; }

    // Views
    const QVector<TransferDescriptor>& transfers() const { return transfers_; }
    const TransferDescriptor* find(quint64 id) const;
    QVector<TransferDescriptor> active() const;
    QVector<TransferDescriptor> paused() const;
    QVector<TransferDescriptor> queued() const; // admission order
    bool hasActive() const;
    int aggregatePercent() const;
    TransferSummary summary() const;
    QString aggregateSummary() const;
    // Remaining seconds for one transfer; nullopt while the rate is unknown.
    std::optional<double> eta(quint64 id) const;

    // Time source for rate computation (tests replace it).
    void setClock(std::function<Clock::time_point()> now) { now_ = std::move(now); }

signals:
    // Emitted when the list or any descriptor changes
    void transfersChanged();
    // Emitted once when a descriptor reaches a terminal status
    void transferFinished(quint64 id);
    void panelVisibleChanged(bool visible);
    void settingsChanged(int maxConcurrent, quint64 bandwidthLimit);

public slots:
    // Admits queued transfers while slots are free
    void processQueue();
    // Lets rates decay for transfers that stopped reporting
    void refreshRates();

private:
    TransferBackend& backend_;
    TransferSettings* settings_ = nullptr;
    QVector<TransferDescriptor> transfers_;
    QueueScheduler scheduler_;
    std::unordered_map<quint64, ProgressTracker> trackers_;
    std::function<Clock::time_point()> now_;
    QTimer rateTimer_;
    quint64 nextId_ = 1;
    int maxConcurrent_ = 2;
    quint64 bandwidthLimit_ = 0;
    bool panelVisible_ = false;
    bool admitting_ = false;

    // Receives backend events on any thread and re-posts them here
    class EventRelay;
    std::unique_ptr<EventRelay> relay_;

    void onProgress(quint64 id, const ProgressEvent& ev);
    void onTerminal(quint64 id, const TerminalOutcome& outcome);
    void onControlAck(quint64 id, ControlSignal signal, bool accepted, const QString& message);

    int indexForId(quint64 id) const;
    int slotsInUse() const;
    TransferJob jobFor(const TransferDescriptor& d) const;
    void persistConfig();
    // Moves a non-terminal descriptor to a terminal status and notifies.
    void finish(int idx, TransferDescriptor::Status status, const QString& error = {});
};

} // namespace furman
