#pragma once

#include "core/discovery/Device.hpp"
#include "core/lineup/Channel.hpp"
#include "core/stream/StreamSupervisor.hpp"
#include <QVariantMap>

namespace hrb {

/// Narrow control surface of the bridge for request-triggered paths.
/// All calls must come from the bridge's own thread.
class IBridgeControl {
public:
    virtual ~IBridgeControl() = default;

    virtual DeviceMap devices() const = 0;
    virtual ChannelList channels() const = 0;
    virtual bool channelByTag(const QString& tag, Channel& out) const = 0;
    virtual QList<SessionInfo> activeStreams() const = 0;
    virtual QString instanceIdFor(const QString& tag) const = 0;
    virtual QVariantMap status() const = 0;

    virtual bool requestDiscovery() = 0;
    virtual bool requestLineupRefresh() = 0;
    virtual bool play(const QString& tag) = 0;
    virtual bool stopChannel(const QString& tag) = 0;
};

} // namespace hrb
