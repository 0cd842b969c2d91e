#pragma once

#include "IDiscoveryStrategy.hpp"
#include <QByteArray>
#include <QHostAddress>
#include <cstdint>

namespace hrb {

class IDeviceProbe;

/// UDP broadcast discovery using the tuner's native discover request.
///
/// Wire format (big-endian, fixed 16 bytes):
///   [type:u16 = 0x0002][length:u16 = 0x000C]
///   [tag 0x01][len 0x04][FF FF FF FF]   device type wildcard
///   [tag 0x02][len 0x04][FF FF FF FF]   device id wildcard
class BroadcastDiscovery : public IDiscoveryStrategy {
public:
    static constexpr uint16_t DISCOVER_PORT = 65001;
    static constexpr uint16_t TYPE_DISCOVER_REQUEST = 0x0002;
    static constexpr uint16_t TYPE_DISCOVER_REPLY = 0x0003;
    static constexpr int DEFAULT_WINDOW_MS = 3000;
    static constexpr int IDLE_TIMEOUT_MS = 3000;

    explicit BroadcastDiscovery(IDeviceProbe* probe,
                                int windowMs = DEFAULT_WINDOW_MS,
                                uint16_t port = DISCOVER_PORT);

    QString name() const override { return QStringLiteral("broadcast"); }
    int defaultWindowMs() const override { return windowMs_; }
    DeviceMap discover(int windowMs) override;

    /// Where the request goes. Defaults to the limited broadcast address.
    void setTargetAddress(const QHostAddress& target) { target_ = target; }

    static QByteArray buildDiscoverRequest();

    /// Packet type of a received datagram, 0 when too short to tell.
    static uint16_t packetType(const QByteArray& datagram);

private:
    IDeviceProbe* probe_;
    int windowMs_;
    uint16_t port_;
    QHostAddress target_{QHostAddress::Broadcast};
};

} // namespace hrb
