#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>
#include <QVariantMap>

namespace hrb {

class IBridgeControl;

/// Unix domain socket control server.
///
/// Requests are single JSON objects {"command": ..., "data": {...}}, one per
/// line; every request gets one compact JSON line back. Commands:
///   list_devices, list_channels, get_channel {tag}, refresh_lineup,
///   discover, active_streams, play {tag}, stop {tag}, status
class IpcServer : public QObject {
    Q_OBJECT

public:
    explicit IpcServer(QObject* parent = nullptr);
    ~IpcServer() override;

    /// Start listening. Returns false if the socket cannot be created.
    bool start(const QString& socketPath = QStringLiteral("/tmp/hdhr-radio-bridge.sock"));
    void stop();

    void setBridge(IBridgeControl* bridge) { bridge_ = bridge; }

    QByteArray handleRequest(const QByteArray& request);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    QByteArray handleListDevices();
    QByteArray handleListChannels();
    QByteArray handleGetChannel(const QVariantMap& data);
    QByteArray handleRefreshLineup();
    QByteArray handleDiscover();
    QByteArray handleActiveStreams();
    QByteArray handlePlay(const QVariantMap& data);
    QByteArray handleStop(const QVariantMap& data);
    QByteArray handleStatus();

    QLocalServer* server_ = nullptr;
    IBridgeControl* bridge_ = nullptr;
};

} // namespace hrb
