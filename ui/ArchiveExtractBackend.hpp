// Extracts entries from a local archive by running the 7z command-line tool.
#pragma once
#include <QObject>
#include <QProcess>
#include <QString>
#include <unordered_map>
#include <unordered_set>
#include "furman/TransferBackend.hpp"

namespace furman {

// Runs `7z x <archive> -o<dest> -y <entries...>` per job. Must be used from
// the thread it lives on (QProcess is driven by that thread's event loop).
// Extraction cannot be paused; cancel kills the process.
class ArchiveExtractBackend : public QObject, public TransferBackend {
    Q_OBJECT
public:
    explicit ArchiveExtractBackend(QObject* parent = nullptr);
    ~ArchiveExtractBackend() override;

    // Executable to run instead of "7z"
    void setProgram(const QString& program) { program_ = program; }
    const QString& program() const { return program_; }

    void setEventSink(TransferEventSink* sink) override { sink_.set(sink); }
    bool accepts(const TransferJob& job) const override;

    bool startTransfer(const TransferJob& job, std::string& err) override;
    bool pauseTransfer(std::uint64_t id, std::string& err) override;
    bool resumeTransfer(std::uint64_t id, std::string& err) override;
    bool cancelTransfer(std::uint64_t id, std::string& err) override;
    // The external tool has no throttle; the value is ignored.
    void setBandwidthLimit(std::uint64_t bytesPerSec) override;

    static QStringList argumentsFor(const TransferJob& job);

private:
    struct Job {
        QProcess* process = nullptr;
        bool cancelled = false;
        std::uint32_t filesTotal = 0;
    };

    QString program_ = QStringLiteral("7z");
    SinkRef sink_;
    std::unordered_map<std::uint64_t, Job> jobs_;
    std::unordered_set<std::uint64_t> finished_;

    void onFinished(std::uint64_t id, int exitCode, QProcess::ExitStatus status);
};

} // namespace furman
