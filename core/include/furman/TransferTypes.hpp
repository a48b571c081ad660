// Basic types shared between the transfer registry and the I/O backends.
// Kept free of Qt so backends can run on plain worker threads.
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <utility>

namespace furman {

enum class TransferType { Copy, Move, Extract };

// Where a path lives.
enum class BackendKind {
    Local,  // this machine's filesystem
    S3,     // S3-compatible object storage
    Sftp    // remote host over SFTP
};

struct Endpoint {
    BackendKind   kind = BackendKind::Local;
    std::string   connectionId; // empty for Local
};

// Everything a backend needs to execute one transfer.
struct TransferJob {
    std::uint64_t            id = 0;
    TransferType             type = TransferType::Copy;
    std::vector<std::string> sources;     // entry paths inside the archive for Extract
    std::string              destination;
    Endpoint                 source;
    Endpoint                 target;
    std::string              archivePath; // Extract only
    std::uint64_t            bandwidthLimit = 0; // bytes/s, 0 = unlimited
};

struct ProgressEvent {
    std::uint64_t bytesDone  = 0;
    std::uint64_t bytesTotal = 0;
    std::uint32_t filesDone  = 0;
    std::uint32_t filesTotal = 0;
    std::string   currentFile;
};

// State retained by a backend when a job is paused; resuming skips
// everything listed in filesCompleted.
struct TransferCheckpoint {
    std::vector<std::string> filesCompleted;
    std::string   partialFile;   // file interrupted mid-way and resumable (SFTP only, may be empty)
    std::uint64_t bytesDone  = 0; // bytes of completed files only
    std::uint64_t bytesTotal = 0;
    std::uint32_t filesDone  = 0;
    std::uint32_t filesTotal = 0;
};

enum class TerminalKind { Success, Error, Cancelled };

struct TerminalOutcome {
    TerminalKind kind = TerminalKind::Success;
    std::string  message; // only meaningful for Error

    static TerminalOutcome success() { return {TerminalKind::Success, {}}; }
    static TerminalOutcome error(std::string msg) { return {TerminalKind::Error, std::move(msg)}; }
    static TerminalOutcome cancelled() { return {TerminalKind::Cancelled, {}}; }
};

enum class ControlSignal { Pause, Resume, Cancel };

const char* toString(TransferType t);
const char* toString(BackendKind k);
const char* toString(ControlSignal s);

} // namespace furman
