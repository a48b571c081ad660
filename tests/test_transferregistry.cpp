#include <QtTest>
#include <QSignalSpy>
#include <QFile>
#include <QSettings>
#include <QTemporaryDir>
#include <QThread>
#include <thread>

#include "furman/BackendRouter.hpp"
#include "furman/LocalTransferBackend.hpp"
#include "furman/MockTransferBackend.hpp"
#include "TransferRegistry.hpp"
#include "TransferSettings.hpp"

using namespace furman;
using Status = TransferDescriptor::Status;

class TestTransferRegistry : public QObject
{
    Q_OBJECT

private:
    MockTransferBackend* backend = nullptr;
    TransferRegistry* registry = nullptr;
    TransferRegistry::Clock::time_point fakeNow;

    quint64 submitCopy(const QString& name)
    {
        return registry->submit(TransferType::Copy, QStringList{"/src/" + name}, "/dst");
    }

    Status statusOf(quint64 id) const
    {
        const TransferDescriptor* d = registry->find(id);
        return d ? d->status : Status::Cancelled;
    }

    static QList<quint64> idsOf(const QVector<TransferDescriptor>& v)
    {
        QList<quint64> ids;
        for (const auto& d : v) ids << d.id;
        return ids;
    }

    static ProgressEvent progress(quint64 done, quint64 total)
    {
        ProgressEvent ev;
        ev.bytesDone = done;
        ev.bytesTotal = total;
        ev.filesTotal = 1;
        return ev;
    }

private slots:
    void init()
    {
        backend = new MockTransferBackend();
        registry = new TransferRegistry(*backend);
        fakeNow = TransferRegistry::Clock::now();
        registry->setClock([this]() { return fakeNow; });
    }

    void cleanup()
    {
        delete registry;
        delete backend;
        registry = nullptr;
        backend = nullptr;
    }

    void testSubmitUnderCapacityStartsImmediately()
    {
        QSignalSpy changed(registry, &TransferRegistry::transfersChanged);
        const quint64 id = submitCopy("a");

        QCOMPARE(id, quint64(1));
        QCOMPARE(statusOf(id), Status::Running);
        QCOMPARE(backend->startedIds(), std::vector<std::uint64_t>{1});
        QVERIFY(changed.count() >= 1);

        const TransferJob job = backend->started().front();
        QCOMPARE(job.type, TransferType::Copy);
        QCOMPARE(job.sources, std::vector<std::string>{"/src/a"});
        QCOMPARE(job.destination, std::string("/dst"));

        const TransferDescriptor* d = registry->find(id);
        QVERIFY(!d->progress.has_value());
        QVERIFY(d->error.isEmpty());
        QVERIFY(d->createdAt.isValid());
        QVERIFY(d->startedAt.isValid());
    }

    void testEmptySourcesRejected()
    {
        QSignalSpy changed(registry, &TransferRegistry::transfersChanged);
        TransferError err = TransferError::None;
        const quint64 id = registry->submit(TransferType::Copy, QStringList{}, "/dst", &err);

        QCOMPARE(id, quint64(0));
        QCOMPARE(err, TransferError::EmptySources);
        QVERIFY(registry->transfers().isEmpty());
        QCOMPARE(changed.count(), 0);
        QVERIFY(backend->started().empty());
    }

    void testIdsAreNeverReused()
    {
        const quint64 a = submitCopy("a");
        backend->emitFinished(a, TerminalOutcome::success());
        QCOMPARE(registry->dismiss(a), TransferError::None);
        const quint64 b = submitCopy("b");
        QVERIFY(b > a);
    }

    void testCompletionAdmitsOldestQueued()
    {
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");
        const quint64 c = submitCopy("c");

        QCOMPARE(statusOf(a), Status::Running);
        QCOMPARE(statusOf(b), Status::Running);
        QCOMPARE(statusOf(c), Status::Queued);
        QCOMPARE(idsOf(registry->queued()), QList<quint64>{c});

        backend->emitFinished(a, TerminalOutcome::success());

        QCOMPARE(statusOf(a), Status::Completed);
        QCOMPARE(statusOf(c), Status::Running);
        QCOMPARE(idsOf(registry->active()), (QList<quint64>{b, c}));
        QVERIFY(registry->queued().isEmpty());
        QCOMPARE(backend->startedIds(), (std::vector<std::uint64_t>{a, b, c}));
    }

    void testRunningNeverExceedsMaxConcurrent()
    {
        QList<quint64> ids;
        for (int i = 0; i < 6; ++i) ids << submitCopy(QString::number(i));
        QCOMPARE(registry->active().size(), 2);
        QCOMPARE(registry->queued().size(), 4);

        backend->emitFinished(ids[0], TerminalOutcome::error("disk full"));
        backend->emitFinished(ids[1], TerminalOutcome::cancelled());
        QCOMPARE(registry->active().size(), 2);
        QCOMPARE(idsOf(registry->active()), (QList<quint64>{ids[2], ids[3]}));
    }

    void testPausedJobKeepsItsSlot()
    {
        registry->setMaxConcurrent(1);
        const quint64 a = submitCopy("a");
        QCOMPARE(registry->pause(a), TransferError::None);
        QCOMPARE(statusOf(a), Status::Paused);
        QCOMPARE(backend->paused(), std::vector<std::uint64_t>{a});

        const quint64 b = submitCopy("b");
        QCOMPARE(statusOf(b), Status::Queued);

        QCOMPARE(registry->resume(a), TransferError::None);
        QCOMPARE(statusOf(a), Status::Running);
        QCOMPARE(backend->resumed(), std::vector<std::uint64_t>{a});
        QCOMPARE(statusOf(b), Status::Queued);
        QCOMPARE(registry->paused().size(), 0);
    }

    void testPauseResumeInvalidTransitions()
    {
        registry->setMaxConcurrent(1);
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");

        QCOMPARE(registry->resume(a), TransferError::InvalidTransition);
        QCOMPARE(registry->pause(b), TransferError::InvalidTransition);
        QCOMPARE(registry->pause(99), TransferError::UnknownTransfer);
        QVERIFY(backend->paused().empty());
        QVERIFY(backend->resumed().empty());
    }

    void testQueuedCancelIsLocal()
    {
        registry->setMaxConcurrent(1);
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");

        QCOMPARE(registry->cancel(b), TransferError::None);
        QVERIFY(registry->find(b) == nullptr);
        QVERIFY(backend->cancelled().empty());
        QCOMPARE(registry->transfers().size(), 1);

        // The removed job is never admitted
        backend->emitFinished(a, TerminalOutcome::success());
        QCOMPARE(backend->startedIds(), std::vector<std::uint64_t>{a});
    }

    void testCancelRunningWaitsForBackend()
    {
        const quint64 a = submitCopy("a");
        QSignalSpy finished(registry, &TransferRegistry::transferFinished);

        QCOMPARE(registry->cancel(a), TransferError::None);
        QCOMPARE(statusOf(a), Status::Running);
        QVERIFY(registry->find(a)->cancelRequested);
        QCOMPARE(backend->cancelled(), std::vector<std::uint64_t>{a});

        // Repeated cancel while pending
        QCOMPARE(registry->cancel(a), TransferError::None);
        QCOMPARE(backend->cancelled().size(), std::size_t(1));

        backend->emitFinished(a, TerminalOutcome::cancelled());
        QCOMPARE(statusOf(a), Status::Cancelled);
        QVERIFY(!registry->find(a)->cancelRequested);
        QCOMPARE(finished.count(), 1);
        QCOMPARE(finished.at(0).at(0).toULongLong(), a);

        QCOMPARE(registry->cancel(a), TransferError::InvalidTransition);
    }

    void testSuccessQueuedBeforeCancelWins()
    {
        const quint64 a = submitCopy("a");
        QSignalSpy finished(registry, &TransferRegistry::transferFinished);
        std::thread worker([this, a]() { backend->emitFinished(a, TerminalOutcome::success()); });
        worker.join();

        // The success is still waiting in the event loop
        QCOMPARE(registry->cancel(a), TransferError::None);
        QVERIFY(registry->find(a)->cancelRequested);

        QTRY_COMPARE(statusOf(a), Status::Completed);
        QVERIFY(registry->find(a)->error.isEmpty());
        QVERIFY(!registry->find(a)->cancelRequested);
        QCOMPARE(finished.count(), 1);
    }

    void testSuccessQueuedBeforeResumeWins()
    {
        const quint64 a = submitCopy("a");
        QCOMPARE(registry->pause(a), TransferError::None);
        std::thread worker([this, a]() { backend->emitFinished(a, TerminalOutcome::success()); });
        worker.join();

        QCOMPARE(registry->resume(a), TransferError::None);
        QTRY_COMPARE(statusOf(a), Status::Completed);
        QVERIFY(registry->find(a)->error.isEmpty());
    }

    void testCancelAfterLocalCopyFinishedKeepsItCompleted()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        {
            QFile f(dir.filePath("in.txt"));
            QVERIFY(f.open(QIODevice::WriteOnly));
            f.write("hello");
        }
        LocalTransferBackend local;
        BackendRouter router;
        router.addRoute(BackendKind::Local, BackendKind::Local, &local);
        TransferRegistry reg(router);

        const quint64 id = reg.submit(TransferType::Copy, QStringList{dir.filePath("in.txt")}, dir.filePath("out"));
        QVERIFY(id != 0);

        // Let the worker finish without running the event loop
        const QString copied = dir.filePath("out/in.txt");
        for (int i = 0; i < 100 && QFileInfo(copied).size() != 5; ++i) QThread::msleep(20);
        QCOMPARE(QFileInfo(copied).size(), qint64(5));
        QThread::msleep(200);
        QCOMPARE(reg.find(id)->status, Status::Running);

        QCOMPARE(reg.cancel(id), TransferError::None);
        QTRY_COMPARE(reg.find(id)->status, Status::Completed);
        QVERIFY(reg.find(id)->error.isEmpty());
        QVERIFY(QFile::exists(copied));
    }

    void testCancelPausedJob()
    {
        const quint64 a = submitCopy("a");
        registry->pause(a);
        QCOMPARE(registry->cancel(a), TransferError::None);
        QCOMPARE(statusOf(a), Status::Paused);
        backend->emitFinished(a, TerminalOutcome::cancelled());
        QCOMPARE(statusOf(a), Status::Cancelled);
    }

    void testPauseRejectedRevertsToRunning()
    {
        const quint64 a = submitCopy("a");
        backend->setRejectControls(true, "cannot pause");

        QCOMPARE(registry->pause(a), TransferError::BackendRejected);
        QCOMPARE(statusOf(a), Status::Running);
        QVERIFY(registry->find(a)->error.isEmpty());
    }

    void testResumeRejectedFails()
    {
        registry->setMaxConcurrent(1);
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");
        registry->pause(a);
        backend->setRejectControls(true, "gone");

        QCOMPARE(registry->resume(a), TransferError::BackendRejected);
        QCOMPARE(statusOf(a), Status::Failed);
        QVERIFY(registry->find(a)->error.contains("gone"));
        // The slot was released
        QCOMPARE(statusOf(b), Status::Running);
    }

    void testCancelRejectedFails()
    {
        registry->setMaxConcurrent(1);
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");
        backend->setRejectControls(true, "stuck");

        QCOMPARE(registry->cancel(a), TransferError::BackendRejected);
        QCOMPARE(statusOf(a), Status::Failed);
        QVERIFY(registry->find(a)->error.contains("stuck"));
        QCOMPARE(statusOf(b), Status::Running);
    }

    void testNegativeAcknowledgements()
    {
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");

        registry->pause(a);
        backend->emitAck(a, ControlSignal::Pause, false, "too late");
        QCOMPARE(statusOf(a), Status::Running);

        registry->cancel(b);
        backend->emitAck(b, ControlSignal::Cancel, false, "refused");
        QCOMPARE(statusOf(b), Status::Failed);
        QVERIFY(!registry->find(b)->cancelRequested);

        // Accepted acknowledgements change nothing
        registry->pause(a);
        backend->emitAck(a, ControlSignal::Pause, true);
        QCOMPARE(statusOf(a), Status::Paused);
    }

    void testRefusedStartFailsAndAdmissionContinues()
    {
        registry->setMaxConcurrent(1);
        backend->failNextStart("no route");
        QSignalSpy finished(registry, &TransferRegistry::transferFinished);

        const quint64 a = submitCopy("a");
        QCOMPARE(statusOf(a), Status::Failed);
        QCOMPARE(registry->find(a)->error, QString("no route"));
        QCOMPARE(finished.count(), 1);

        const quint64 b = submitCopy("b");
        QCOMPARE(statusOf(b), Status::Running);
    }

    void testRefusedStartAdmitsNextQueued()
    {
        registry->setMaxConcurrent(1);
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");
        const quint64 c = submitCopy("c");
        backend->failNextStart("refused");

        backend->emitFinished(a, TerminalOutcome::success());
        QCOMPARE(statusOf(b), Status::Failed);
        QCOMPARE(statusOf(c), Status::Running);
    }

    void testMoveUpDownOnlyForQueued()
    {
        registry->setMaxConcurrent(1);
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");
        const quint64 c = submitCopy("c");
        const quint64 d = submitCopy("d");

        QCOMPARE(registry->moveUp(a), TransferError::InvalidTransition);
        QCOMPARE(registry->moveDown(99), TransferError::UnknownTransfer);

        QCOMPARE(registry->moveUp(d), TransferError::None);
        QCOMPARE(idsOf(registry->queued()), (QList<quint64>{b, d, c}));
        QCOMPARE(registry->moveDown(b), TransferError::None);
        QCOMPARE(idsOf(registry->queued()), (QList<quint64>{d, b, c}));

        // Edges
        QCOMPARE(registry->moveUp(d), TransferError::None);
        QCOMPARE(registry->moveDown(c), TransferError::None);
        QCOMPARE(idsOf(registry->queued()), (QList<quint64>{d, b, c}));

        // Creation order is untouched
        QCOMPARE(idsOf(registry->transfers()), (QList<quint64>{a, b, c, d}));

        backend->emitFinished(a, TerminalOutcome::success());
        QCOMPARE(statusOf(d), Status::Running);
    }

    void testDismiss()
    {
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");

        QCOMPARE(registry->dismiss(a), TransferError::InvalidTransition);
        backend->emitFinished(a, TerminalOutcome::error("boom"));
        QCOMPARE(registry->dismiss(a), TransferError::None);
        QVERIFY(registry->find(a) == nullptr);
        QCOMPARE(registry->dismiss(a), TransferError::UnknownTransfer);
        QCOMPARE(statusOf(b), Status::Running);
    }

    void testDismissCompletedRemovesTerminalSet()
    {
        registry->setMaxConcurrent(3);
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");
        const quint64 c = submitCopy("c");
        const quint64 d = submitCopy("d");
        const quint64 e = submitCopy("e");

        backend->emitFinished(a, TerminalOutcome::success());
        backend->emitFinished(b, TerminalOutcome::error("x"));
        registry->cancel(c);
        backend->emitFinished(c, TerminalOutcome::cancelled());
        // d and e are now running

        QCOMPARE(registry->dismissCompleted(), 3);
        QCOMPARE(idsOf(registry->transfers()), (QList<quint64>{d, e}));
        QCOMPARE(registry->dismissCompleted(), 0);
    }

    void testDuplicateTerminalEventsAreIgnored()
    {
        const quint64 a = submitCopy("a");
        QSignalSpy finished(registry, &TransferRegistry::transferFinished);

        backend->emitFinished(a, TerminalOutcome::success());
        backend->emitFinished(a, TerminalOutcome::error("late"));
        backend->emitFinished(a, TerminalOutcome::cancelled());

        QCOMPARE(finished.count(), 1);
        QCOMPARE(statusOf(a), Status::Completed);
        QVERIFY(registry->find(a)->error.isEmpty());
        QVERIFY(registry->find(a)->completedAt.isValid());
    }

    void testEventsForUnknownIdsAreIgnored()
    {
        backend->emitProgress(42, progress(1, 2));
        backend->emitFinished(42, TerminalOutcome::success());
        QVERIFY(registry->transfers().isEmpty());
    }

    void testFailedCarriesError()
    {
        const quint64 a = submitCopy("a");
        backend->emitFinished(a, TerminalOutcome::error("permission denied"));
        QCOMPARE(statusOf(a), Status::Failed);
        QCOMPARE(registry->find(a)->error, QString("permission denied"));
        QCOMPARE(registry->find(a)->speedBytesPerSec, 0.0);
    }

    void testProgressIsClampedAndRated()
    {
        using namespace std::chrono_literals;
        const quint64 a = submitCopy("a");

        backend->emitProgress(a, progress(0, 4000));
        fakeNow += 1s;
        backend->emitProgress(a, progress(1000, 4000));

        const TransferDescriptor* d = registry->find(a);
        QVERIFY(d->progress.has_value());
        QCOMPARE(d->progress->bytesDone, quint64(1000));
        QCOMPARE(d->speedBytesPerSec, 1000.0);
        QCOMPARE(*registry->eta(a), 3.0);

        fakeNow += 1s;
        backend->emitProgress(a, progress(3000, 4000));
        QVERIFY(qFuzzyCompare(registry->find(a)->speedBytesPerSec, 0.3 * 2000.0 + 0.7 * 1000.0));

        // A backend overshooting its own total
        backend->emitProgress(a, progress(5000, 4000));
        d = registry->find(a);
        QVERIFY(d->progress->bytesDone <= d->progress->bytesTotal);
        QVERIFY(d->progress->filesDone <= d->progress->filesTotal);
    }

    void testProgressIgnoredForQueuedJobs()
    {
        registry->setMaxConcurrent(1);
        submitCopy("a");
        const quint64 b = submitCopy("b");
        backend->emitProgress(b, progress(10, 100));
        QVERIFY(!registry->find(b)->progress.has_value());
    }

    void testIdleRateDecays()
    {
        using namespace std::chrono_literals;
        const quint64 a = submitCopy("a");
        backend->emitProgress(a, progress(0, 10000));
        fakeNow += 1s;
        backend->emitProgress(a, progress(1000, 10000));
        QCOMPARE(registry->find(a)->speedBytesPerSec, 1000.0);

        fakeNow += 1s;
        registry->refreshRates();
        QCOMPARE(registry->find(a)->speedBytesPerSec, 1000.0);

        fakeNow += 2s;
        QSignalSpy changed(registry, &TransferRegistry::transfersChanged);
        registry->refreshRates();
        QVERIFY(qFuzzyCompare(registry->find(a)->speedBytesPerSec, 700.0));
        QCOMPARE(changed.count(), 1);
    }

    void testAggregatePercentAndSummary()
    {
        QCOMPARE(registry->aggregatePercent(), 0);
        QCOMPARE(registry->aggregateSummary(), QString());

        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");
        const quint64 c = submitCopy("c");
        Q_UNUSED(c);

        QCOMPARE(registry->aggregateSummary(), QString("2 transfers - 0%, 1 queued"));

        backend->emitProgress(a, progress(300, 1000));
        backend->emitProgress(b, progress(0, 1000));
        QCOMPARE(registry->aggregatePercent(), 15);
        QCOMPARE(registry->aggregateSummary(), QString("2 transfers - 15% 300/2.0K, 1 queued"));

        // Paused transfers still count
        registry->pause(b);
        QCOMPARE(registry->aggregatePercent(), 15);

        const TransferSummary s = registry->summary();
        QCOMPARE(s.active, 1);
        QCOMPARE(s.paused, 1);
        QCOMPARE(s.queued, 1);
        QCOMPARE(s.copies, 3);
        QCOMPARE(s.bytesDone, quint64(300));
        QCOMPARE(s.bytesTotal, quint64(2000));
        QVERIFY(registry->hasActive());
    }

    void testAggregateSkipsZeroTotals()
    {
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");
        backend->emitProgress(a, progress(0, 0));
        backend->emitProgress(b, progress(512, 1024));
        QCOMPARE(registry->aggregatePercent(), 50);
        QCOMPARE(registry->aggregateSummary(), QString("2 transfers - 50% 512/1.0K"));
    }

    void testSummaryWithSingleTransfer()
    {
        const quint64 a = submitCopy("a");
        backend->emitProgress(a, progress(1258291, 3145728));
        QCOMPARE(registry->aggregateSummary(), QString("1 transfer - 40% 1.2M/3.0M"));
        backend->emitFinished(a, TerminalOutcome::success());
        QCOMPARE(registry->aggregateSummary(), QString());
        QVERIFY(!registry->hasActive());
    }

    void testPanelVisibility()
    {
        QSignalSpy visible(registry, &TransferRegistry::panelVisibleChanged);
        QVERIFY(!registry->panelVisible());
        submitCopy("a");
        QVERIFY(registry->panelVisible());
        QCOMPARE(visible.count(), 1);
        QCOMPARE(visible.at(0).at(0).toBool(), true);

        registry->toggle();
        QVERIFY(!registry->panelVisible());
        registry->toggle();
        QVERIFY(registry->panelVisible());
        QCOMPARE(visible.count(), 3);

        // Already visible: no extra notification
        submitCopy("b");
        QCOMPARE(visible.count(), 3);
    }

    void testMaxConcurrentChanges()
    {
        QSignalSpy settings(registry, &TransferRegistry::settingsChanged);
        const quint64 a = submitCopy("a");
        const quint64 b = submitCopy("b");
        const quint64 c = submitCopy("c");
        const quint64 d = submitCopy("d");

        registry->setMaxConcurrent(3);
        QCOMPARE(statusOf(c), Status::Running);
        QCOMPARE(statusOf(d), Status::Queued);
        QCOMPARE(settings.count(), 1);

        // Lowering never preempts
        registry->setMaxConcurrent(1);
        QCOMPARE(registry->active().size(), 3);
        backend->emitFinished(a, TerminalOutcome::success());
        QCOMPARE(statusOf(d), Status::Queued);
        backend->emitFinished(b, TerminalOutcome::success());
        backend->emitFinished(c, TerminalOutcome::success());
        QCOMPARE(statusOf(d), Status::Running);

        registry->setMaxConcurrent(0);
        QCOMPARE(registry->maxConcurrent(), 1);
        registry->setMaxConcurrent(-5);
        QCOMPARE(registry->maxConcurrent(), 1);
    }

    void testBandwidthLimitIsPushedAndPassedOn()
    {
        QSignalSpy settings(registry, &TransferRegistry::settingsChanged);
        registry->setBandwidthLimit(5242880);

        QCOMPARE(backend->bandwidthLimits(), std::vector<std::uint64_t>{5242880});
        QCOMPARE(registry->bandwidthLimit(), quint64(5242880));
        QCOMPARE(settings.count(), 1);
        QCOMPARE(settings.at(0).at(1).toULongLong(), quint64(5242880));

        submitCopy("a");
        QCOMPARE(backend->started().back().bandwidthLimit, std::uint64_t(5242880));

        registry->setBandwidthLimit(0);
        submitCopy("b");
        QCOMPARE(backend->started().back().bandwidthLimit, std::uint64_t(0));
    }

    void testSettingsAreAppliedAndWrittenOnChange()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString ini = dir.filePath("furman.ini");
        TransferSettings settings(ini);
        settings.setMaxConcurrent(3);
        settings.setBandwidthLimit(1000);
        QVERIFY(settings.sync());

        registry->useSettings(&settings);
        QCOMPARE(registry->maxConcurrent(), 3);
        QCOMPARE(registry->bandwidthLimit(), quint64(1000));
        QCOMPARE(backend->bandwidthLimits().back(), std::uint64_t(1000));

        registry->setMaxConcurrent(5);
        registry->setBandwidthLimit(2048);
        {
            QSettings stored(ini, QSettings::IniFormat);
            QCOMPARE(stored.value("Transfers/maxConcurrent").toInt(), 5);
            QCOMPARE(stored.value("Transfers/bandwidthLimitBytesPerSec").toULongLong(), quint64(2048));
        }

        // Detached: later changes stay in memory only
        registry->useSettings(nullptr);
        registry->setMaxConcurrent(1);
        QCOMPARE(TransferSettings(ini).maxConcurrent(), 5);
    }

    void testEndpointsAndArchivePathReachBackend()
    {
        TransferRequest req;
        req.type = TransferType::Extract;
        req.sources = QStringList{"docs/readme.txt"};
        req.destination = "/tmp/out";
        req.archivePath = "/tmp/a.zip";
        req.target.kind = BackendKind::Local;
        const quint64 id = registry->submit(req);

        const TransferJob job = backend->started().back();
        QCOMPARE(job.id, std::uint64_t(id));
        QCOMPARE(job.type, TransferType::Extract);
        QCOMPARE(job.archivePath, std::string("/tmp/a.zip"));
        QCOMPARE(registry->find(id)->archivePath, QString("/tmp/a.zip"));
        QCOMPARE(registry->summary().extracts, 1);
    }

    void testEventsFromWorkerThreadsAreQueued()
    {
        const quint64 a = submitCopy("a");
        std::thread worker([this, a]() {
            backend->emitProgress(a, progress(50, 100));
            backend->emitFinished(a, TerminalOutcome::success());
        });
        worker.join();

        // Nothing is applied until the event loop runs
        QCOMPARE(statusOf(a), Status::Running);
        QTRY_COMPARE(statusOf(a), Status::Completed);
        QCOMPARE(registry->find(a)->progress->bytesDone, quint64(100));
    }
};

QTEST_GUILESS_MAIN(TestTransferRegistry)
#include "test_transferregistry.moc"
