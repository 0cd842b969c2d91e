#pragma once

#include "IDiscoveryStrategy.hpp"
#include <QStringList>

namespace hrb {

class IDeviceProbe;

/// Last-resort discovery: probes every plausible host of the local /24
/// through a bounded pool. Costs at most ceil(hosts / workers) probe timeouts.
class SubnetSweep : public IDiscoveryStrategy {
public:
    static constexpr int DEFAULT_WORKERS = 50;
    static constexpr int FIRST_HOST = 2;
    static constexpr int LAST_HOST = 252;

    explicit SubnetSweep(IDeviceProbe* probe, int workers = DEFAULT_WORKERS);

    QString name() const override { return QStringLiteral("subnet sweep"); }
    int defaultWindowMs() const override { return 0; }

    /// windowMs is ignored: the sweep is bounded by the probe timeout instead.
    DeviceMap discover(int windowMs) override;

    /// Probe the given hosts concurrently and collect the ones that describe
    /// as tuners.
    DeviceMap sweep(const QStringList& hosts);

    /// Address the kernel would use to reach the public internet. Found by
    /// connecting a UDP socket (no datagram is sent). Empty on failure.
    static QString localOutboundIp();

    /// a.b.c.2 .. a.b.c.252 for an IPv4 address a.b.c.d, empty otherwise.
    static QStringList hostsInSubnet(const QString& localIp);

private:
    IDeviceProbe* probe_;
    int workers_;
};

} // namespace hrb
