#include "BroadcastDiscovery.hpp"
#include "DeviceVerifier.hpp"
#include <QElapsedTimer>
#include <QNetworkDatagram>
#include <QSet>
#include <QUdpSocket>
#include <QtEndian>
#include <boost/log/trivial.hpp>

namespace hrb {

namespace {

constexpr uint8_t kTagDeviceType = 0x01;
constexpr uint8_t kTagDeviceId = 0x02;
constexpr uint32_t kWildcard = 0xFFFFFFFF;

void appendTlv(QByteArray& out, uint8_t tag, uint32_t value)
{
    out.append(static_cast<char>(tag));
    out.append(static_cast<char>(sizeof(uint32_t)));
    uchar be[4];
    qToBigEndian<quint32>(value, be);
    out.append(reinterpret_cast<const char*>(be), 4);
}

} // namespace

BroadcastDiscovery::BroadcastDiscovery(IDeviceProbe* probe, int windowMs, uint16_t port)
    : probe_(probe)
    , windowMs_(windowMs)
    , port_(port)
{
}

QByteArray BroadcastDiscovery::buildDiscoverRequest()
{
    QByteArray payload;
    appendTlv(payload, kTagDeviceType, kWildcard);
    appendTlv(payload, kTagDeviceId, kWildcard);

    QByteArray packet;
    uchar header[4];
    qToBigEndian<quint16>(TYPE_DISCOVER_REQUEST, header);
    qToBigEndian<quint16>(static_cast<quint16>(payload.size()), header + 2);
    packet.append(reinterpret_cast<const char*>(header), 4);
    packet.append(payload);
    return packet;
}

uint16_t BroadcastDiscovery::packetType(const QByteArray& datagram)
{
    if (datagram.size() < 2) return 0;
    return qFromBigEndian<quint16>(reinterpret_cast<const uchar*>(datagram.constData()));
}

DeviceMap BroadcastDiscovery::discover(int windowMs)
{
    BOOST_LOG_TRIVIAL(info) << "[BroadcastDiscovery] Sending discover request to "
                            << target_.toString().toStdString() << ":" << port_;

    DeviceMap devices;
    QUdpSocket socket;
    if (!socket.bind(QHostAddress::AnyIPv4, 0)) {
        BOOST_LOG_TRIVIAL(error) << "[BroadcastDiscovery] Cannot bind UDP socket: "
                                 << socket.errorString().toStdString();
        return devices;
    }
    const QByteArray request = buildDiscoverRequest();
    if (socket.writeDatagram(request, target_, port_) != request.size()) {
        BOOST_LOG_TRIVIAL(error) << "[BroadcastDiscovery] Broadcast send failed: "
                                 << socket.errorString().toStdString();
        return devices;
    }

    QSet<QString> probed;
    QElapsedTimer clock;
    clock.start();

    while (clock.elapsed() < windowMs) {
        const int remaining = static_cast<int>(qMin<qint64>(windowMs - clock.elapsed(), IDLE_TIMEOUT_MS));
        if (!socket.waitForReadyRead(remaining))
            break;  // idle timeout ends collection early

        while (socket.hasPendingDatagrams()) {
            const QNetworkDatagram datagram = socket.receiveDatagram(1024);
            if (packetType(datagram.data()) == TYPE_DISCOVER_REQUEST)
                continue;  // another client's request, not a reply

            const QString ip = QHostAddress(datagram.senderAddress().toIPv4Address()).toString();
            if (ip.isEmpty() || probed.contains(ip)) continue;
            probed.insert(ip);

            const Device device = probe_->describe(ip);
            if (!device.isValid()) continue;

            devices.insert(device.ip, device.friendlyName);
            BOOST_LOG_TRIVIAL(info) << "[BroadcastDiscovery] Found " << device.friendlyName.toStdString()
                                    << " at " << device.ip.toStdString();
        }
    }

    BOOST_LOG_TRIVIAL(info) << "[BroadcastDiscovery] Found " << devices.size() << " device(s)";
    return devices;
}

} // namespace hrb
