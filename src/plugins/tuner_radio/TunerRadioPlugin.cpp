#include "TunerRadioPlugin.hpp"
#include "core/discovery/DiscoveryPipeline.hpp"
#include "core/lineup/LineupFetcher.hpp"
#include "core/plugin/IAudioSink.hpp"
#include "core/plugin/IHostContext.hpp"
#include "core/plugin/ISourceRegistry.hpp"
#include "core/services/IConfigService.hpp"
#include <QMetaObject>
#include <QTimer>
#include <exception>

namespace hrb {
namespace plugins {

TunerRadioPlugin::TunerRadioPlugin(QObject* parent)
    : QObject(parent)
{
}

TunerRadioPlugin::~TunerRadioPlugin()
{
    shutdown();
}

QStringList TunerRadioPlugin::requiredServices() const
{
    return {QStringLiteral("audioSink"), QStringLiteral("sourceRegistry")};
}

QVariant TunerRadioPlugin::setting(const char* key) const
{
    IConfigService* config = host_ ? host_->configService() : nullptr;
    return config ? config->value(QString::fromLatin1(key)) : QVariant();
}

int TunerRadioPlugin::intSetting(const char* key, int fallback) const
{
    const QVariant v = setting(key);
    bool ok = false;
    const int i = v.toInt(&ok);
    return (v.isValid() && ok) ? i : fallback;
}

bool TunerRadioPlugin::boolSetting(const char* key, bool fallback) const
{
    const QVariant v = setting(key);
    return v.isValid() ? v.toBool() : fallback;
}

void TunerRadioPlugin::loadSettings()
{
    tickMs_ = qMax(1, intSetting("streaming.tick_ms", 20));
    idleTickMs_ = qMax(tickMs_, intSetting("streaming.idle_tick_ms", 1000));
    reconcileIntervalMs_ = qMax(0, intSetting("streaming.reconcile_interval_ms", 1000));
    fillSilence_ = boolSetting("streaming.fill_silence", false);
    discoveryIntervalMs_ = qint64(intSetting("discovery.interval_s", 300)) * 1000;
    lineupIntervalMs_ = qint64(intSetting("lineup.refresh_interval_s", 3600)) * 1000;

    DecoderCommand command;
    const QString program = setting("decoder.program").toString();
    if (!program.isEmpty())
        command.program = program;
    const QStringList args = setting("decoder.arguments").toStringList();
    if (!args.isEmpty())
        command.arguments = args;

    supervisor_ = std::make_unique<StreamSupervisor>(
        command, AudioFormat{},
        intSetting("streaming.poll_wait_ms", StreamSupervisor::DEFAULT_POLL_WAIT_MS),
        intSetting("decoder.stop_grace_ms", StreamSupervisor::DEFAULT_STOP_GRACE_MS),
        boolSetting("decoder.show_output", false));
}

void TunerRadioPlugin::buildDefaultBackends()
{
    const int probePort = intSetting("discovery.probe_port", 80);

    if (!discoverFn_) {
        DiscoverySettings settings;
        settings.probeTimeoutMs = intSetting("discovery.probe_timeout_ms", settings.probeTimeoutMs);
        settings.probePort = probePort;
        settings.mdnsWindowMs = intSetting("discovery.mdns_timeout_s", 10) * 1000;
        settings.broadcastWindowMs = intSetting("discovery.broadcast_timeout_s", 3) * 1000;
        settings.broadcastPort = static_cast<uint16_t>(intSetting("discovery.broadcast_port", 65001));
        settings.sweepWorkers = intSetting("discovery.sweep_workers", settings.sweepWorkers);
        settings.staticDevices = setting("discovery.static_devices").toStringList();

        auto pipeline = std::make_shared<DiscoveryPipeline>(settings);
        discoverFn_ = [pipeline]() { return pipeline->run(); };
    }

    if (!lineupFn_) {
        auto fetcher = std::make_shared<LineupFetcher>(
            intSetting("lineup.timeout_ms", LineupFetcher::DEFAULT_TIMEOUT_MS),
            boolSetting("lineup.include_all_channels", false),
            probePort);
        lineupFn_ = [fetcher](const QString& ip, const QString& name) {
            return fetcher->fetchLineup(ip, name);
        };
    }
}

bool TunerRadioPlugin::initialize(IHostContext* context)
{
    if (running_) return true;

    host_ = context;
    if (!host_ || !host_->audioSink() || !host_->sourceRegistry()) {
        if (host_)
            host_->log(LogLevel::Error, QStringLiteral("TunerRadio: host has no audio sink or source registry"));
        return false;
    }

    loadSettings();
    buildDefaultBackends();
    reconciler_ = std::make_unique<RouteReconciler>(this);

    // One discovery and one lineup job at a time
    workers_.setMaxThreadCount(2);

    timer_ = new QTimer(this);
    connect(timer_, &QTimer::timeout, this, &TunerRadioPlugin::tick);

    running_ = true;
    clock_.start();
    timer_->start(idleTickMs_);

    host_->log(LogLevel::Info, QStringLiteral("TunerRadio: initialized (tick %1 ms, discovery every %2 s)")
                                   .arg(tickMs_).arg(discoveryIntervalMs_ / 1000));
    return true;
}

void TunerRadioPlugin::shutdown()
{
    if (!running_) return;
    running_ = false;

    const QStringList tags = runningTags();
    for (const auto& tag : tags)
        stop(tag);
    const QStringList leftovers = instanceIds_.keys();
    for (const auto& tag : leftovers)
        releaseSource(tag);
    manualTags_.clear();

    if (timer_)
        timer_->stop();

    // In-flight probes only end on their own timeouts
    workers_.clear();
    workers_.waitForDone();

    if (host_)
        host_->log(LogLevel::Info, QStringLiteral("TunerRadio: shut down"));
}

// --- Loop ---

void TunerRadioPlugin::tick()
{
    if (!running_) return;

    const qint64 now = clock_.elapsed();

    if (!discoveryInFlight_ && (lastDiscoveryMs_ < 0 || now - lastDiscoveryMs_ >= discoveryIntervalMs_))
        startDiscovery();

    if (!lineupInFlight_ && lastLineupMs_ >= 0 && !devices_.isEmpty()
        && now - lastLineupMs_ >= lineupIntervalMs_) {
        host_->log(LogLevel::Info, QStringLiteral("TunerRadio: periodic lineup refresh"));
        startLineupFetch(devices_);
    }

    if (lastReconcileMs_ < 0 || now - lastReconcileMs_ >= reconcileIntervalMs_) {
        lastReconcileMs_ = now;
        reconcileRoutes();
    }

    const QStringList tags = supervisor_->runningTags();
    for (const auto& tag : tags)
        drainSession(tag);

    updateTimerInterval();
}

void TunerRadioPlugin::updateTimerInterval()
{
    if (!timer_) return;
    const int wanted = supervisor_->runningTags().isEmpty() ? idleTickMs_ : tickMs_;
    if (timer_->interval() != wanted)
        timer_->setInterval(wanted);
}

// --- Discovery and lineup (worker side) ---

void TunerRadioPlugin::startDiscovery()
{
    discoveryInFlight_ = true;
    DiscoverFunction fn = discoverFn_;

    workers_.start([this, fn]() {
        DeviceMap found;
        try {
            found = fn();
        } catch (const std::exception& e) {
            host_->log(LogLevel::Error, QStringLiteral("TunerRadio: discovery failed: %1")
                                           .arg(QString::fromUtf8(e.what())));
        }
        QMetaObject::invokeMethod(this, [this, found]() { onDiscoveryFinished(found); },
                                  Qt::QueuedConnection);
    });
}

void TunerRadioPlugin::onDiscoveryFinished(const DeviceMap& found)
{
    discoveryInFlight_ = false;
    lastDiscoveryMs_ = clock_.elapsed();
    if (!running_) return;

    DeviceMap added;
    for (auto it = found.cbegin(); it != found.cend(); ++it) {
        if (devices_.contains(it.key())) continue;
        devices_.insert(it.key(), it.value());
        added.insert(it.key(), it.value());
        host_->log(LogLevel::Info, QStringLiteral("TunerRadio: added device %1 (%2)")
                                       .arg(it.value(), it.key()));
    }

    if (!added.isEmpty()) {
        emit devicesChanged();
        startLineupFetch(added);
    }
}

void TunerRadioPlugin::startLineupFetch(const DeviceMap& targets)
{
    if (targets.isEmpty()) return;
    if (lineupInFlight_) {
        mergeFirstWriterWins(pendingLineup_, targets);
        return;
    }

    lineupInFlight_ = true;
    LineupFunction fn = lineupFn_;

    workers_.start([this, fn, targets]() {
        QMap<QString, ChannelList> byDevice;
        for (auto it = targets.cbegin(); it != targets.cend(); ++it) {
            try {
                byDevice.insert(it.key(), fn(it.key(), it.value()));
            } catch (const std::exception& e) {
                host_->log(LogLevel::Error, QStringLiteral("TunerRadio: lineup of %1 failed: %2")
                                               .arg(it.key(), QString::fromUtf8(e.what())));
            }
        }
        QMetaObject::invokeMethod(this, [this, byDevice]() { onLineupFetched(byDevice); },
                                  Qt::QueuedConnection);
    });
}

void TunerRadioPlugin::onLineupFetched(const QMap<QString, ChannelList>& byDevice)
{
    lineupInFlight_ = false;
    lastLineupMs_ = clock_.elapsed();
    if (!running_) return;

    bool changed = false;
    for (auto it = byDevice.cbegin(); it != byDevice.cend(); ++it) {
        // An empty answer is indistinguishable from a failed fetch: keep what we had
        if (it.value().isEmpty()) continue;

        for (auto ch = channels_.begin(); ch != channels_.end();) {
            if (ch->deviceIp == it.key())
                ch = channels_.erase(ch);
            else
                ++ch;
        }
        for (const auto& channel : it.value())
            channels_.insert(channel.tag, channel);
        changed = true;

        host_->log(LogLevel::Info, QStringLiteral("TunerRadio: %1 channel(s) from %2")
                                       .arg(it.value().size()).arg(it.key()));
    }

    if (changed)
        emit channelsChanged();

    if (!pendingLineup_.isEmpty()) {
        const DeviceMap next = pendingLineup_;
        pendingLineup_.clear();
        startLineupFetch(next);
    }
}

// --- Sessions ---

void TunerRadioPlugin::reconcileRoutes()
{
    IRouteView* view = host_->routeView();
    QList<ActiveRoute> routes;
    if (view && view->activeRoutes(routes))
        lastRoutes_ = routes;

    QList<ActiveRoute> wanted = lastRoutes_;
    for (const auto& tag : manualTags_)
        wanted.append(ActiveRoute{tag, true});

    reconciler_->reconcile(wanted, channels_.values());
}

bool TunerRadioPlugin::start(const Channel& channel)
{
    if (!running_) return false;
    if (supervisor_->isRunning(channel.tag)) return true;

    ISourceRegistry* registry = host_->sourceRegistry();
    QString instanceId = instanceIds_.value(channel.tag);
    if (instanceId.isEmpty()) {
        instanceId = registry->registerSource(SourceDescriptor{channel.displayName, channel.tag});
        if (instanceId.isEmpty()) {
            host_->log(LogLevel::Error, QStringLiteral("TunerRadio: host refused source for %1")
                                           .arg(channel.tag));
            return false;
        }
        instanceIds_.insert(channel.tag, instanceId);
    }

    if (!supervisor_->start(channel.tag, channel.streamUrl)) {
        releaseSource(channel.tag);
        return false;
    }

    host_->log(LogLevel::Info, QStringLiteral("TunerRadio: streaming %1 as %2")
                                   .arg(channel.displayName, instanceId));
    updateTimerInterval();
    return true;
}

void TunerRadioPlugin::stop(const QString& tag)
{
    if (supervisor_)
        supervisor_->stop(tag);
    releaseSource(tag);
}

QStringList TunerRadioPlugin::runningTags() const
{
    return supervisor_ ? supervisor_->runningTags() : QStringList{};
}

void TunerRadioPlugin::releaseSource(const QString& tag)
{
    const QString instanceId = instanceIds_.take(tag);
    if (instanceId.isEmpty() || !host_) return;
    if (ISourceRegistry* registry = host_->sourceRegistry())
        registry->unregisterSource(instanceId);
}

void TunerRadioPlugin::drainSession(const QString& tag)
{
    const AudioFormat& format = supervisor_->format();
    const int chunkSize = format.chunkSizeBytes();
    const QString instanceId = instanceIds_.value(tag);
    IAudioSink* sink = host_->audioSink();

    for (int i = 0; i < MAX_CHUNKS_PER_TICK; ++i) {
        const PollResult result = supervisor_->poll(tag, chunkSize);

        if (result.kind == PollResult::Eof) {
            host_->log(LogLevel::Warning, QStringLiteral("TunerRadio: stream %1 ended").arg(tag));
            releaseSource(tag);
            return;
        }

        if (result.kind == PollResult::NoDataYet) {
            if (fillSilence_ && i == 0)
                sink->write(instanceId, QByteArray(chunkSize, '\0'), format.channels,
                            format.sampleRate, format.bitDepth, format.chlayout1, format.chlayout2);
            return;
        }

        if (result.bytes.size() != chunkSize) {
            ++chunksDropped_;
            host_->log(LogLevel::Warning, QStringLiteral("TunerRadio: partial packet from %1: %2 bytes")
                                              .arg(tag).arg(result.bytes.size()));
            continue;
        }

        if (sink->write(instanceId, result.bytes, format.channels, format.sampleRate,
                        format.bitDepth, format.chlayout1, format.chlayout2))
            ++chunksForwarded_;
        else
            ++chunksDropped_;
    }
}

// --- Control surface ---

bool TunerRadioPlugin::channelByTag(const QString& tag, Channel& out) const
{
    auto it = channels_.constFind(tag);
    if (it == channels_.cend()) return false;
    out = it.value();
    return true;
}

QList<SessionInfo> TunerRadioPlugin::activeStreams() const
{
    return supervisor_ ? supervisor_->sessions() : QList<SessionInfo>{};
}

QVariantMap TunerRadioPlugin::status() const
{
    QVariantMap s;
    s[QStringLiteral("running")] = running_;
    s[QStringLiteral("devices")] = int(devices_.size());
    s[QStringLiteral("channels")] = int(channels_.size());
    s[QStringLiteral("sessions")] = int(runningTags().size());
    s[QStringLiteral("manual")] = int(manualTags_.size());
    s[QStringLiteral("discovery_in_flight")] = discoveryInFlight_;
    s[QStringLiteral("lineup_in_flight")] = lineupInFlight_;
    s[QStringLiteral("chunks_forwarded")] = chunksForwarded_;
    s[QStringLiteral("chunks_dropped")] = chunksDropped_;
    if (running_ && lastDiscoveryMs_ >= 0)
        s[QStringLiteral("last_discovery_age_s")] = (clock_.elapsed() - lastDiscoveryMs_) / 1000;
    return s;
}

bool TunerRadioPlugin::requestDiscovery()
{
    if (!running_ || discoveryInFlight_) return false;
    startDiscovery();
    return true;
}

bool TunerRadioPlugin::requestLineupRefresh()
{
    if (!running_ || devices_.isEmpty()) return false;
    startLineupFetch(devices_);
    return true;
}

bool TunerRadioPlugin::play(const QString& tag)
{
    if (!running_) return false;

    Channel channel;
    if (!channelByTag(tag, channel)) {
        host_->log(LogLevel::Error, QStringLiteral("TunerRadio: cannot play unknown channel %1").arg(tag));
        return false;
    }

    manualTags_.insert(tag);
    if (!start(channel)) {
        manualTags_.remove(tag);
        return false;
    }
    return true;
}

bool TunerRadioPlugin::stopChannel(const QString& tag)
{
    manualTags_.remove(tag);
    const bool wasActive = supervisor_ && supervisor_->isRunning(tag);
    stop(tag);
    return wasActive;
}

} // namespace plugins
} // namespace hrb
