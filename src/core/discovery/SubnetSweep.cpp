#include "SubnetSweep.hpp"
#include "DeviceVerifier.hpp"
#include <QHostAddress>
#include <QMutex>
#include <QMutexLocker>
#include <QThreadPool>
#include <QUdpSocket>
#include <boost/log/trivial.hpp>

namespace hrb {

SubnetSweep::SubnetSweep(IDeviceProbe* probe, int workers)
    : probe_(probe)
    , workers_(qMax(1, workers))
{
}

QString SubnetSweep::localOutboundIp()
{
    QUdpSocket socket;
    socket.connectToHost(QHostAddress(QStringLiteral("8.8.8.8")), 80);
    if (!socket.waitForConnected(1000)) {
        BOOST_LOG_TRIVIAL(warning) << "[SubnetSweep] No route to determine local address: "
                                   << socket.errorString().toStdString();
        return {};
    }
    const QHostAddress local = socket.localAddress();
    socket.close();

    bool ok = false;
    local.toIPv4Address(&ok);
    return ok ? QHostAddress(local.toIPv4Address()).toString() : QString();
}

QStringList SubnetSweep::hostsInSubnet(const QString& localIp)
{
    QHostAddress address;
    if (!address.setAddress(localIp) || address.protocol() != QAbstractSocket::IPv4Protocol)
        return {};

    const quint32 base = address.toIPv4Address() & 0xFFFFFF00u;
    QStringList hosts;
    hosts.reserve(LAST_HOST - FIRST_HOST + 1);
    for (int i = FIRST_HOST; i <= LAST_HOST; ++i)
        hosts.append(QHostAddress(base | static_cast<quint32>(i)).toString());
    return hosts;
}

DeviceMap SubnetSweep::sweep(const QStringList& hosts)
{
    DeviceMap devices;
    QMutex mutex;

    QThreadPool pool;
    pool.setMaxThreadCount(workers_);

    for (const QString& ip : hosts) {
        pool.start([this, ip, &devices, &mutex]() {
            const Device device = probe_->describe(ip);
            if (!device.isValid()) return;

            QMutexLocker lock(&mutex);
            devices.insert(device.ip, device.friendlyName);
            BOOST_LOG_TRIVIAL(info) << "[SubnetSweep] Found " << device.friendlyName.toStdString()
                                    << " at " << device.ip.toStdString();
        });
    }
    pool.waitForDone();

    return devices;
}

DeviceMap SubnetSweep::discover(int /*windowMs*/)
{
    const QString local = localOutboundIp();
    const QStringList hosts = hostsInSubnet(local);
    if (hosts.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[SubnetSweep] No usable IPv4 address, skipping sweep";
        return {};
    }

    BOOST_LOG_TRIVIAL(info) << "[SubnetSweep] Scanning " << hosts.first().toStdString()
                            << " - " << hosts.last().toStdString()
                            << " with " << workers_ << " workers";

    const DeviceMap devices = sweep(hosts);
    BOOST_LOG_TRIVIAL(info) << "[SubnetSweep] Found " << devices.size() << " device(s)";
    return devices;
}

} // namespace hrb
