// Persisted transfer preferences (concurrency and bandwidth limit).
#pragma once
#include <QString>
#include <QtGlobal>

namespace furman {

class TransferSettings {
public:
    static constexpr int kDefaultMaxConcurrent = 2;

    // Empty path: the per-user native store ("Furman", "Furman").
    // Otherwise an INI file at that path.
    explicit TransferSettings(const QString& iniPath = QString());

    // Values below 1 read back as the default.
    int maxConcurrent() const;
    void setMaxConcurrent(int n);

    // 0 = unlimited
    quint64 bandwidthLimit() const;
    void setBandwidthLimit(quint64 bytesPerSec);

    // Write pending changes now; returns false if the store is not writable.
    bool sync();

private:
    QString iniPath_;
};

} // namespace furman
