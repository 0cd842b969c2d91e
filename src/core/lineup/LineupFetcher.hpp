#pragma once

#include "Channel.hpp"

class QJsonArray;

namespace hrb {

/// Reads http://<ip>[:port]/lineup.json from a tuner and turns it into
/// channels. Every failure (transport, status, JSON shape) yields an empty
/// list; nothing here throws.
class LineupFetcher {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 5000;

    explicit LineupFetcher(int timeoutMs = DEFAULT_TIMEOUT_MS,
                           bool includeAllChannels = false,
                           int port = 80);

    ChannelList fetchLineup(const QString& deviceIp, const QString& deviceName) const;

    /// Build channels from an already parsed lineup array. Entries without a
    /// URL are skipped, as are non-radio entries unless all channels are
    /// included, and later entries repeating an earlier tag.
    ChannelList parseLineup(const QJsonArray& lineup, const QString& deviceIp,
                            const QString& deviceName) const;

    bool includeAllChannels() const { return includeAll_; }

private:
    int timeoutMs_;
    bool includeAll_;
    int port_;
};

} // namespace hrb
