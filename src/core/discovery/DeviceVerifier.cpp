#include "DeviceVerifier.hpp"
#include "core/net/HttpJson.hpp"
#include <QJsonObject>
#include <QUrl>
#include <boost/log/trivial.hpp>

namespace hrb {

DeviceVerifier::DeviceVerifier(int timeoutMs, int port)
    : timeoutMs_(timeoutMs)
    , port_(port)
{
}

QString DeviceVerifier::fallbackName(const QString& ip)
{
    return QStringLiteral("HDHomeRun at %1").arg(ip);
}

QString DeviceVerifier::discoverUrl(const QString& ip) const
{
    if (port_ == 80)
        return QStringLiteral("http://%1/discover.json").arg(ip);
    return QStringLiteral("http://%1:%2/discover.json").arg(ip).arg(port_);
}

bool DeviceVerifier::verify(const QString& ip)
{
    return describe(ip).isValid();
}

Device DeviceVerifier::describe(const QString& ip)
{
    JsonReply reply = fetchJson(QUrl(discoverUrl(ip)), timeoutMs_);
    if (!reply.ok) {
        BOOST_LOG_TRIVIAL(trace) << "[Verifier] " << ip.toStdString() << ": "
                                 << reply.error.toStdString();
        return {};
    }
    if (!reply.document.isObject()) {
        BOOST_LOG_TRIVIAL(debug) << "[Verifier] " << ip.toStdString()
                                 << ": discover.json is not an object";
        return {};
    }

    const QJsonObject info = reply.document.object();
    if (!info.contains(QLatin1String("DeviceID")) || !info.contains(QLatin1String("ModelNumber"))) {
        BOOST_LOG_TRIVIAL(debug) << "[Verifier] " << ip.toStdString()
                                 << ": descriptor lacks DeviceID/ModelNumber";
        return {};
    }

    Device device;
    device.ip = ip;
    device.deviceId = info.value(QLatin1String("DeviceID")).toVariant().toString();
    device.modelNumber = info.value(QLatin1String("ModelNumber")).toVariant().toString();
    device.friendlyName = info.value(QLatin1String("FriendlyName")).toString(fallbackName(ip));
    device.firmwareVersion = info.value(QLatin1String("FirmwareVersion")).toString();
    device.baseUrl = info.value(QLatin1String("BaseURL")).toString();
    device.lineupUrl = info.value(QLatin1String("LineupURL")).toString();
    device.tunerCount = info.value(QLatin1String("TunerCount")).toInt(0);

    return device;
}

} // namespace hrb
