#pragma once

#include <QList>
#include <QString>

namespace hrb {

/// One lineup entry of a tuner, enriched with the identifiers the bridge
/// uses to expose it. Rebuilt on every lineup fetch.
struct Channel {
    QString guideNumber;   // "88.5", "5.1", "101-1"
    QString guideName;
    QString streamUrl;
    QString deviceIp;
    QString deviceName;
    QString tag;           // stable id, see tagFor()
    QString displayName;   // human-facing name, see displayNameFor()
    bool isRadio = false;
};

using ChannelList = QList<Channel>;

} // namespace hrb
