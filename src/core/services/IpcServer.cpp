#include "IpcServer.hpp"
#include "IBridgeControl.hpp"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QFile>
#include <QDebug>

namespace hrb {

namespace {

QByteArray errorReply(const QString& message)
{
    QJsonObject obj;
    obj["error"] = message;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray compact(const QJsonObject& obj)
{
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QJsonObject channelToJson(const Channel& channel)
{
    QJsonObject c;
    c["tag"] = channel.tag;
    c["name"] = channel.displayName;
    c["guide_number"] = channel.guideNumber;
    c["guide_name"] = channel.guideName;
    c["url"] = channel.streamUrl;
    c["device_ip"] = channel.deviceIp;
    c["radio"] = channel.isRadio;
    return c;
}

} // namespace

IpcServer::IpcServer(QObject* parent)
    : QObject(parent)
{
}

IpcServer::~IpcServer()
{
    stop();
}

bool IpcServer::start(const QString& socketPath)
{
    if (server_) return false;

    // Remove stale socket file
    QFile::remove(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    connect(server_, &QLocalServer::newConnection, this, &IpcServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        qWarning() << "IpcServer: Failed to listen on" << socketPath
                   << ":" << server_->errorString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    qInfo() << "IpcServer: Listening on" << socketPath;
    return true;
}

void IpcServer::stop()
{
    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

void IpcServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        connect(socket, &QLocalSocket::readyRead, this, &IpcServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &IpcServer::onDisconnected);
    }
}

void IpcServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    while (socket->canReadLine()) {
        const QByteArray line = socket->readLine().trimmed();
        if (line.isEmpty()) continue;
        socket->write(handleRequest(line) + "\n");
    }
    socket->flush();
}

void IpcServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (socket)
        socket->deleteLater();
}

QByteArray IpcServer::handleRequest(const QByteArray& request)
{
    QJsonDocument doc = QJsonDocument::fromJson(request);
    if (!doc.isObject()) {
        return R"({"error":"Invalid JSON"})";
    }
    if (!bridge_) return R"({"error":"Bridge not available"})";

    QJsonObject obj = doc.object();
    QString command = obj.value("command").toString();
    QVariantMap data = obj.value("data").toObject().toVariantMap();

    if (command == QLatin1String("list_devices"))
        return handleListDevices();
    if (command == QLatin1String("list_channels"))
        return handleListChannels();
    if (command == QLatin1String("get_channel"))
        return handleGetChannel(data);
    if (command == QLatin1String("refresh_lineup"))
        return handleRefreshLineup();
    if (command == QLatin1String("discover"))
        return handleDiscover();
    if (command == QLatin1String("active_streams"))
        return handleActiveStreams();
    if (command == QLatin1String("play"))
        return handlePlay(data);
    if (command == QLatin1String("stop"))
        return handleStop(data);
    if (command == QLatin1String("status"))
        return handleStatus();

    return R"({"error":"Unknown command"})";
}

QByteArray IpcServer::handleListDevices()
{
    QJsonObject devices;
    const DeviceMap map = bridge_->devices();
    for (auto it = map.cbegin(); it != map.cend(); ++it)
        devices[it.key()] = it.value();

    QJsonObject obj;
    obj["devices"] = devices;
    return compact(obj);
}

QByteArray IpcServer::handleListChannels()
{
    QJsonArray arr;
    for (const auto& channel : bridge_->channels())
        arr.append(channelToJson(channel));

    QJsonObject obj;
    obj["channels"] = arr;
    obj["total"] = int(arr.size());
    return compact(obj);
}

QByteArray IpcServer::handleGetChannel(const QVariantMap& data)
{
    const QString tag = data.value("tag").toString();
    Channel channel;
    if (!bridge_->channelByTag(tag, channel))
        return errorReply(QStringLiteral("Channel %1 not found").arg(tag));
    return compact(channelToJson(channel));
}

QByteArray IpcServer::handleRefreshLineup()
{
    if (!bridge_->requestLineupRefresh())
        return errorReply(QStringLiteral("No devices to refresh"));

    QJsonObject obj;
    obj["status"] = "refreshing";
    obj["devices"] = int(bridge_->devices().size());
    return compact(obj);
}

QByteArray IpcServer::handleDiscover()
{
    QJsonObject obj;
    obj["status"] = bridge_->requestDiscovery() ? "started" : "already_running";
    return compact(obj);
}

QByteArray IpcServer::handleActiveStreams()
{
    QJsonArray arr;
    for (const auto& session : bridge_->activeStreams()) {
        QJsonObject s;
        s["tag"] = session.tag;
        s["url"] = session.url;
        s["instance_id"] = bridge_->instanceIdFor(session.tag);
        s["pid"] = static_cast<qint64>(session.pid);
        s["state"] = QString::fromLatin1(sessionStateName(session.state));
        s["started_at_ms"] = session.startedAtMs;
        s["bytes_read"] = session.bytesRead;
        s["partial_reads"] = session.partialReads;
        arr.append(s);
    }

    QJsonObject obj;
    obj["active_streams"] = arr;
    obj["count"] = int(arr.size());
    return compact(obj);
}

QByteArray IpcServer::handlePlay(const QVariantMap& data)
{
    const QString tag = data.value("tag").toString();
    Channel channel;
    if (!bridge_->channelByTag(tag, channel))
        return errorReply(QStringLiteral("Channel %1 not found").arg(tag));
    if (!bridge_->play(tag))
        return errorReply(QStringLiteral("Failed to start stream for %1").arg(tag));

    QJsonObject obj;
    obj["status"] = "started";
    obj["tag"] = tag;
    obj["url"] = channel.streamUrl;
    obj["instance_id"] = bridge_->instanceIdFor(tag);
    return compact(obj);
}

QByteArray IpcServer::handleStop(const QVariantMap& data)
{
    const QString tag = data.value("tag").toString();
    if (!bridge_->stopChannel(tag))
        return errorReply(QStringLiteral("Stream %1 not active").arg(tag));

    QJsonObject obj;
    obj["status"] = "stopped";
    obj["tag"] = tag;
    return compact(obj);
}

QByteArray IpcServer::handleStatus()
{
    QJsonObject obj = QJsonObject::fromVariantMap(bridge_->status());
    obj["version"] = QStringLiteral("1.0.0");
    return compact(obj);
}

} // namespace hrb
