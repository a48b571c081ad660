// String names for transfer enums (used in logs and summaries).
#include "furman/TransferTypes.hpp"

namespace furman {

const char* toString(TransferType t) {
    switch (t) {
        case TransferType::Copy:    return "copy";
        case TransferType::Move:    return "move";
        case TransferType::Extract: return "extract";
    }
    return "?";
}

const char* toString(BackendKind k) {
    switch (k) {
        case BackendKind::Local: return "local";
        case BackendKind::S3:    return "s3";
        case BackendKind::Sftp:  return "sftp";
    }
    return "?";
}

const char* toString(ControlSignal s) {
    switch (s) {
        case ControlSignal::Pause:  return "pause";
        case ControlSignal::Resume: return "resume";
        case ControlSignal::Cancel: return "cancel";
    }
    return "?";
}

} // namespace furman
