#include "TransferSettings.hpp"
#include "furman/Log.hpp"
#include <QSettings>
#include <memory>

namespace furman {

namespace {

const char* kMaxConcurrentKey = "Transfers/maxConcurrent";
const char* kBandwidthKey = "Transfers/bandwidthLimitBytesPerSec";

std::unique_ptr<QSettings> openStore(const QString& iniPath) {
    if (iniPath.isEmpty()) return std::make_unique<QSettings>("Furman", "Furman");
    return std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
}

} // namespace

TransferSettings::TransferSettings(const QString& iniPath) : iniPath_(iniPath) {}

int TransferSettings::maxConcurrent() const {
    auto s = openStore(iniPath_);
    bool ok = false;
    const int n = s->value(kMaxConcurrentKey, kDefaultMaxConcurrent).toInt(&ok);
    return (ok && n >= 1) ? n : kDefaultMaxConcurrent;
}

void TransferSettings::setMaxConcurrent(int n) {
    auto s = openStore(iniPath_);
    s->setValue(kMaxConcurrentKey, n < 1 ? 1 : n);
}

quint64 TransferSettings::bandwidthLimit() const {
    auto s = openStore(iniPath_);
    bool ok = false;
    const quint64 v = s->value(kBandwidthKey, 0).toULongLong(&ok);
    return ok ? v : 0;
}

void TransferSettings::setBandwidthLimit(quint64 bytesPerSec) {
    auto s = openStore(iniPath_);
    s->setValue(kBandwidthKey, bytesPerSec);
}

bool TransferSettings::sync() {
    auto s = openStore(iniPath_);
    s->sync();
    if (s->status() != QSettings::NoError) {
        LOGE("settings: cannot write %s", s->fileName().toStdString().c_str());
        return false;
    }
    return true;
}

} // namespace furman
