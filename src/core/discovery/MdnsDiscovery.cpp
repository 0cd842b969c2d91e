#include "MdnsDiscovery.hpp"
#include "DeviceVerifier.hpp"
#include <QElapsedTimer>
#include <QHostAddress>
#include <QNetworkDatagram>
#include <QSet>
#include <QUdpSocket>
#include <boost/log/trivial.hpp>

namespace hrb {

MdnsDiscovery::MdnsDiscovery(IDeviceProbe* probe, int windowMs)
    : probe_(probe)
    , windowMs_(windowMs)
{
}

bool MdnsDiscovery::openSocket(QUdpSocket& socket, bool& unicastFallback) const
{
    unicastFallback = false;

    if (socket.bind(QHostAddress::AnyIPv4, mdns::kPort,
                    QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        if (!socket.joinMulticastGroup(QHostAddress(QString::fromLatin1(mdns::kGroupV4)))) {
            BOOST_LOG_TRIVIAL(warning) << "[MdnsDiscovery] Cannot join " << mdns::kGroupV4 << ": "
                                       << socket.errorString().toStdString();
        }
        socket.setSocketOption(QAbstractSocket::MulticastTtlOption, 255);
        return true;
    }

    // 5353 owned exclusively by a system responder: ask for unicast replies instead
    BOOST_LOG_TRIVIAL(debug) << "[MdnsDiscovery] Port " << mdns::kPort << " busy ("
                             << socket.errorString().toStdString() << "), using QU queries";
    socket.close();
    if (!socket.bind(QHostAddress::AnyIPv4, 0)) {
        BOOST_LOG_TRIVIAL(error) << "[MdnsDiscovery] Cannot bind UDP socket: "
                                 << socket.errorString().toStdString();
        return false;
    }
    unicastFallback = true;
    return true;
}

void MdnsDiscovery::sendQueries(QUdpSocket& socket, const mdns::ServiceCache& cache, bool qu) const
{
    const QHostAddress group(QString::fromLatin1(mdns::kGroupV4));

    const QByteArray ptr = mdns::buildQuery(QString::fromLatin1(SERVICE_TYPE), mdns::TypePtr, qu);
    if (socket.writeDatagram(ptr, group, mdns::kPort) < 0) {
        BOOST_LOG_TRIVIAL(debug) << "[MdnsDiscovery] PTR query send failed: "
                                 << socket.errorString().toStdString();
    }

    for (const auto& instance : cache.unresolvedInstances())
        socket.writeDatagram(mdns::buildQuery(instance, mdns::TypeSrv, qu), group, mdns::kPort);
    for (const auto& host : cache.unresolvedHosts())
        socket.writeDatagram(mdns::buildQuery(host, mdns::TypeA, qu), group, mdns::kPort);
}

void MdnsDiscovery::drain(QUdpSocket& socket, mdns::ServiceCache& cache) const
{
    while (socket.hasPendingDatagrams()) {
        const QNetworkDatagram datagram = socket.receiveDatagram();
        QList<mdns::Record> records;
        if (mdns::parseResponse(datagram.data(), records))
            cache.add(records);
    }
}

DeviceMap MdnsDiscovery::discover(int windowMs)
{
    BOOST_LOG_TRIVIAL(info) << "[MdnsDiscovery] Browsing " << SERVICE_TYPE
                            << " for " << windowMs << " ms";

    DeviceMap devices;
    QUdpSocket socket;
    bool unicast = false;
    if (!openSocket(socket, unicast))
        return devices;

    mdns::ServiceCache cache(QString::fromLatin1(SERVICE_TYPE));
    QSet<QString> probed;
    QElapsedTimer clock;
    clock.start();

    int bursts = 0;
    qint64 nextQuery = 0;

    while (clock.elapsed() < windowMs) {
        if (clock.elapsed() >= nextQuery) {
            // First query asks for a unicast answer so cached records arrive at once
            sendQueries(socket, cache, unicast || bursts == 0);
            ++bursts;
            const int interval = bursts < QUERY_BURSTS ? REQUERY_INTERVAL_MS : REQUERY_INTERVAL_MS * 3;
            nextQuery = clock.elapsed() + interval;
        }

        const qint64 untilEvent = qMin<qint64>(nextQuery, windowMs) - clock.elapsed();
        if (untilEvent > 0 && socket.waitForReadyRead(static_cast<int>(untilEvent)))
            drain(socket, cache);

        for (const auto& event : cache.takeResolved()) {
            if (probed.contains(event.ip)) continue;
            probed.insert(event.ip);

            BOOST_LOG_TRIVIAL(debug) << "[MdnsDiscovery] Announcement " << event.instance.toStdString()
                                     << " -> " << event.ip.toStdString() << ":" << event.port;

            const Device device = probe_->describe(event.ip);
            if (!device.isValid()) continue;

            devices.insert(device.ip, device.friendlyName);
            BOOST_LOG_TRIVIAL(info) << "[MdnsDiscovery] Found " << device.friendlyName.toStdString()
                                    << " at " << device.ip.toStdString();
        }
    }

    BOOST_LOG_TRIVIAL(info) << "[MdnsDiscovery] Found " << devices.size() << " device(s)";
    return devices;
}

} // namespace hrb
