#pragma once

#include "IDiscoveryStrategy.hpp"
#include "MdnsPacket.hpp"

class QUdpSocket;

namespace hrb {

class IDeviceProbe;

/// Service-announcement discovery: browses _hdhomerun._tcp.local. over
/// multicast DNS for a bounded window. Every announced address is verified
/// through the probe before it is accepted.
class MdnsDiscovery : public IDiscoveryStrategy {
public:
    static constexpr const char* SERVICE_TYPE = "_hdhomerun._tcp.local.";
    static constexpr int DEFAULT_WINDOW_MS = 10000;
    static constexpr int REQUERY_INTERVAL_MS = 1000;
    static constexpr int QUERY_BURSTS = 3;

    explicit MdnsDiscovery(IDeviceProbe* probe, int windowMs = DEFAULT_WINDOW_MS);

    QString name() const override { return QStringLiteral("mDNS"); }
    int defaultWindowMs() const override { return windowMs_; }
    DeviceMap discover(int windowMs) override;

private:
    bool openSocket(QUdpSocket& socket, bool& unicastFallback) const;
    void sendQueries(QUdpSocket& socket, const mdns::ServiceCache& cache, bool qu) const;
    void drain(QUdpSocket& socket, mdns::ServiceCache& cache) const;

    IDeviceProbe* probe_;
    int windowMs_;
};

} // namespace hrb
