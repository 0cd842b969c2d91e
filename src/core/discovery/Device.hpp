#pragma once

#include <QMap>
#include <QString>

namespace hrb {

/// A verified tuner. Identity is the IPv4 address; the record is immutable
/// once a probe has produced it.
struct Device {
    QString ip;
    QString friendlyName;
    QString deviceId;
    QString modelNumber;
    QString firmwareVersion;   // optional
    QString baseUrl;           // optional, as reported by the device
    QString lineupUrl;         // optional, as reported by the device
    int tunerCount = 0;

    /// Only a successful probe fills in ip, so an empty ip means "absent".
    bool isValid() const { return !ip.isEmpty(); }
};

/// ip -> friendly name, the currency of all discovery strategies.
using DeviceMap = QMap<QString, QString>;

/// Merge src into dst without overwriting existing entries (first writer wins).
/// Returns the number of entries added.
inline int mergeFirstWriterWins(DeviceMap& dst, const DeviceMap& src)
{
    int added = 0;
    for (auto it = src.cbegin(); it != src.cend(); ++it) {
        if (dst.contains(it.key())) continue;
        dst.insert(it.key(), it.value());
        ++added;
    }
    return added;
}

} // namespace hrb
