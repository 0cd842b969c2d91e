#pragma once

#include "core/plugin/IPlugin.hpp"
#include "core/plugin/IRouteView.hpp"
#include "core/services/IBridgeControl.hpp"
#include "core/discovery/Device.hpp"
#include "core/lineup/Channel.hpp"
#include "core/stream/RouteReconciler.hpp"
#include "core/stream/StreamSupervisor.hpp"
#include <QElapsedTimer>
#include <QHash>
#include <QMap>
#include <QObject>
#include <QSet>
#include <QThreadPool>
#include <QVariantMap>
#include <functional>
#include <memory>

class QTimer;

namespace hrb {

class IHostContext;
class IConfigService;

namespace plugins {

/// Exposes the radio channels of every tuner on the LAN as host audio sources.
///
/// All state (devices, channel registry, sessions) lives on the thread the
/// plugin was created on and is only touched by its loop timer and by the
/// request methods below. Discovery and lineup fetches run on a private
/// worker pool and post their results back to that thread.
///
/// Each tick:
///   1. start discovery / lineup refresh when due
///   2. reconcile sessions against the host's routes
///   3. drain every running session into the sink
///   4. fall back to the idle interval when nothing runs
class TunerRadioPlugin : public QObject, public IPlugin, public IStreamControl, public IBridgeControl {
    Q_OBJECT

public:
    using DiscoverFunction = std::function<DeviceMap()>;
    using LineupFunction = std::function<ChannelList(const QString& ip, const QString& name)>;

    static constexpr int MAX_CHUNKS_PER_TICK = 16;

    explicit TunerRadioPlugin(QObject* parent = nullptr);
    ~TunerRadioPlugin() override;

    // IPlugin: identity
    QString id() const override { return QStringLiteral("org.hrb.tuner-radio"); }
    QString name() const override { return QStringLiteral("HDHomeRun Radio"); }
    QString version() const override { return QStringLiteral("1.0.0"); }
    int apiVersion() const override { return 1; }

    // IPlugin: lifecycle
    bool initialize(IHostContext* context) override;
    void shutdown() override;
    QStringList requiredServices() const override;

    // IStreamControl, driven by the reconciler
    bool start(const Channel& channel) override;
    void stop(const QString& tag) override;
    QStringList runningTags() const override;

    /// Replace the network-facing discovery / lineup steps. Both run on a
    /// worker thread. Must be set before initialize() to take effect.
    void setDiscoverFunction(DiscoverFunction fn) { discoverFn_ = std::move(fn); }
    void setLineupFunction(LineupFunction fn) { lineupFn_ = std::move(fn); }

    // IBridgeControl: snapshots
    DeviceMap devices() const override { return devices_; }
    ChannelList channels() const override { return channels_.values(); }
    bool channelByTag(const QString& tag, Channel& out) const override;
    QList<SessionInfo> activeStreams() const override;
    QString instanceIdFor(const QString& tag) const override { return instanceIds_.value(tag); }
    QVariantMap status() const override;

    // IBridgeControl: actions. false means refused (in flight, nothing to do, not initialized)
    bool requestDiscovery() override;
    bool requestLineupRefresh() override;

    /// Start a channel regardless of host routes and keep it wanted until
    /// stopChannel(). false when the tag is unknown or the start failed.
    bool play(const QString& tag) override;

    /// Drop a manual play and stop the session. A host route still naming the
    /// channel brings it back on the next reconcile. false when nothing ran.
    bool stopChannel(const QString& tag) override;

public slots:
    /// One loop iteration. Normally driven by the internal timer.
    void tick();

signals:
    void devicesChanged();
    void channelsChanged();

private:
    void loadSettings();
    void buildDefaultBackends();

    void startDiscovery();
    void onDiscoveryFinished(const DeviceMap& found);
    void startLineupFetch(const DeviceMap& targets);
    void onLineupFetched(const QMap<QString, ChannelList>& byDevice);

    void reconcileRoutes();
    void drainSession(const QString& tag);
    void releaseSource(const QString& tag);
    void updateTimerInterval();

    QVariant setting(const char* key) const;
    int intSetting(const char* key, int fallback) const;
    bool boolSetting(const char* key, bool fallback) const;

    IHostContext* host_ = nullptr;
    QTimer* timer_ = nullptr;
    QThreadPool workers_;
    QElapsedTimer clock_;
    bool running_ = false;

    DiscoverFunction discoverFn_;
    LineupFunction lineupFn_;
    std::unique_ptr<StreamSupervisor> supervisor_;
    std::unique_ptr<RouteReconciler> reconciler_;

    // Loop schedule
    int tickMs_ = 20;
    int idleTickMs_ = 1000;
    int reconcileIntervalMs_ = 1000;
    qint64 discoveryIntervalMs_ = 300000;
    qint64 lineupIntervalMs_ = 3600000;
    bool fillSilence_ = false;

    qint64 lastDiscoveryMs_ = -1;
    qint64 lastLineupMs_ = -1;
    qint64 lastReconcileMs_ = -1;
    bool discoveryInFlight_ = false;
    bool lineupInFlight_ = false;
    DeviceMap pendingLineup_;

    // Owned state
    DeviceMap devices_;
    QMap<QString, Channel> channels_;         // tag -> channel
    QHash<QString, QString> instanceIds_;     // tag -> host source id
    QSet<QString> manualTags_;
    QList<ActiveRoute> lastRoutes_;
    qint64 chunksForwarded_ = 0;
    qint64 chunksDropped_ = 0;
};

} // namespace plugins
} // namespace hrb
