#include <QtTest>
#include <QAtomicInt>
#include "core/lineup/ChannelClassifier.hpp"
#include "core/plugin/HostContext.hpp"
#include "core/plugin/IAudioSink.hpp"
#include "core/plugin/IRouteView.hpp"
#include "core/plugin/ISourceRegistry.hpp"
#include "core/services/IConfigService.hpp"
#include "plugins/tuner_radio/TunerRadioPlugin.hpp"

using hrb::plugins::TunerRadioPlugin;

namespace {

class MapConfig : public hrb::IConfigService {
public:
    QVariant value(const QString& key) const override { return values.value(key); }
    bool setValue(const QString& key, const QVariant& v) override
    {
        values.insert(key, v);
        return true;
    }
    void save() override {}

    QVariantMap values;
};

class MemorySink : public hrb::IAudioSink, public hrb::ISourceRegistry {
public:
    QString registerSource(const hrb::SourceDescriptor& source) override
    {
        if (refuse) return {};
        const QString id = QStringLiteral("%1#%2").arg(source.tag).arg(++registrations);
        active.insert(id, source.name);
        return id;
    }

    void unregisterSource(const QString& instanceId) override { active.remove(instanceId); }

    bool write(const QString& instanceId, const QByteArray& pcm, int channels, int sampleRate,
               int bitDepth, uint8_t chlayout1, uint8_t chlayout2) override
    {
        Q_UNUSED(chlayout1);
        Q_UNUSED(chlayout2);
        if (!active.contains(instanceId)) {
            ++writesToUnknown;
            return false;
        }
        chunkSizes.append(pcm.size());
        if (pcm.count('\0') == pcm.size()) ++silentChunks;
        lastFormat = {channels, sampleRate, bitDepth};
        return true;
    }

    QMap<QString, QString> active;
    QList<int> chunkSizes;
    QList<int> lastFormat;
    int registrations = 0;
    int silentChunks = 0;
    int writesToUnknown = 0;
    bool refuse = false;
};

class ScriptedRoutes : public hrb::IRouteView {
public:
    bool activeRoutes(QList<hrb::ActiveRoute>& out) override
    {
        if (!available) return false;
        out = routes;
        return true;
    }

    QList<hrb::ActiveRoute> routes;
    bool available = true;
};

hrb::Channel radioChannel(const QString& ip, const QString& device, const QString& number,
                          const QString& name)
{
    hrb::Channel c;
    c.deviceIp = ip;
    c.deviceName = device;
    c.guideNumber = number;
    c.guideName = name;
    c.streamUrl = QStringLiteral("http://%1:5004/auto/v%2").arg(ip, number);
    c.tag = hrb::tagFor(ip, number);
    c.displayName = hrb::displayNameFor(device, name, number);
    c.isRadio = true;
    return c;
}

const QString kTunerIp = QStringLiteral("10.0.0.5");
const QString kTag885 = QStringLiteral("hdhomerun_10_0_0_5_88_5");
const QString kTag957 = QStringLiteral("hdhomerun_10_0_0_5_95_7");

// Host, mocks and plugin wired together. Members are destroyed in reverse
// order, so the plugin goes before the services it uses.
struct Bench {
    MapConfig config;
    MemorySink sink;
    ScriptedRoutes routes;
    hrb::HostContext host;
    QAtomicInt lineupCalls{0};
    QAtomicInt emptyLineups{0};
    std::unique_ptr<TunerRadioPlugin> plugin;

    explicit Bench(const QString& decoderScript)
    {
        config.values = {
            {"streaming.tick_ms", 5},
            {"streaming.idle_tick_ms", 5},
            {"streaming.reconcile_interval_ms", 0},
            {"streaming.poll_wait_ms", 5},
            {"discovery.interval_s", 3600},
            {"lineup.refresh_interval_s", 3600},
            {"decoder.program", "/bin/sh"},
            {"decoder.arguments", QStringList{"-c", decoderScript, "{url}"}},
            {"decoder.stop_grace_ms", 300},
        };

        host.setAudioSink(&sink);
        host.setSourceRegistry(&sink);
        host.setRouteView(&routes);
        host.setConfigService(&config);

        plugin = std::make_unique<TunerRadioPlugin>();
        plugin->setDiscoverFunction([]() {
            return hrb::DeviceMap{{kTunerIp, QStringLiteral("Den")}};
        });
        plugin->setLineupFunction([this](const QString& ip, const QString& name) {
            lineupCalls.fetchAndAddOrdered(1);
            if (emptyLineups.loadAcquire() > 0) return hrb::ChannelList{};
            return hrb::ChannelList{radioChannel(ip, name, "88.5", "KQED"),
                                    radioChannel(ip, name, "95.7", "Jazz")};
        });
    }

    bool startAndLoad()
    {
        if (!plugin->initialize(&host)) return false;
        return QTest::qWaitFor([this]() { return plugin->channels().size() == 2; }, 5000);
    }

    void route(const QString& source) { routes.routes = {hrb::ActiveRoute{source, true}}; }
};

} // namespace

class TestTunerRadioPlugin : public QObject {
    Q_OBJECT
private slots:
    void testIdentity();
    void testInitializeNeedsSinkAndRegistry();
    void testDiscoveryPopulatesRegistry();
    void testOnlyWholeChunksReachTheSink();
    void testEofReleasesSourceAndRestarts();
    void testRouteRemovalStopsSession();
    void testRouteByDisplayName();
    void testUnavailableRouteViewKeepsSessions();
    void testRefusedSourceStartsNothing();
    void testManualPlayAndStop();
    void testPlayUnknownChannel();
    void testEmptyLineupKeepsChannels();
    void testSilenceFill();
    void testShutdownReleasesEverything();
};

void TestTunerRadioPlugin::testIdentity()
{
    TunerRadioPlugin plugin;
    QCOMPARE(plugin.id(), QString("org.hrb.tuner-radio"));
    QCOMPARE(plugin.apiVersion(), 1);
    QVERIFY(plugin.requiredServices().contains("audioSink"));
    QVERIFY(!plugin.requestDiscovery());
}

void TestTunerRadioPlugin::testInitializeNeedsSinkAndRegistry()
{
    hrb::HostContext host;
    TunerRadioPlugin plugin;
    QVERIFY(!plugin.initialize(&host));
    QVERIFY(!plugin.initialize(nullptr));
}

void TestTunerRadioPlugin::testDiscoveryPopulatesRegistry()
{
    Bench bench("sleep 5");
    QSignalSpy devicesSpy(bench.plugin.get(), &TunerRadioPlugin::devicesChanged);
    QVERIFY(bench.startAndLoad());

    QCOMPARE(devicesSpy.count(), 1);
    QCOMPARE(bench.plugin->devices().value(kTunerIp), QString("Den"));

    hrb::Channel channel;
    QVERIFY(bench.plugin->channelByTag(kTag885, channel));
    QCOMPARE(channel.displayName, QString("HDHomeRun [Den]: KQED (88.5)"));
    QVERIFY(!bench.plugin->channelByTag("hdhomerun_10_0_0_9_1_1", channel));

    // No routes yet, nothing decoded or registered
    QVERIFY(bench.plugin->runningTags().isEmpty());
    QCOMPARE(bench.sink.registrations, 0);
}

void TestTunerRadioPlugin::testOnlyWholeChunksReachTheSink()
{
    // Two full chunks and a 96-byte tail per decoder run
    Bench bench("head -c 2400 /dev/zero; sleep 0.3");
    QVERIFY(bench.startAndLoad());
    bench.route(kTag885);

    QTRY_VERIFY_WITH_TIMEOUT(bench.sink.chunkSizes.size() >= 4, 5000);
    for (int size : bench.sink.chunkSizes)
        QCOMPARE(size, 1152);
    QCOMPARE(bench.sink.lastFormat, QList<int>({2, 48000, 16}));
    QVERIFY(bench.plugin->status().value("chunks_dropped").toLongLong() >= 1);
}

void TestTunerRadioPlugin::testEofReleasesSourceAndRestarts()
{
    Bench bench("head -c 1152 /dev/zero");
    QVERIFY(bench.startAndLoad());
    bench.route(kTag885);

    // Every run ends in EOF; each restart registers a fresh source
    QTRY_VERIFY_WITH_TIMEOUT(bench.sink.registrations >= 3, 5000);
    QVERIFY(bench.sink.active.size() <= 1);
    QCOMPARE(bench.sink.writesToUnknown, 0);
}

void TestTunerRadioPlugin::testRouteRemovalStopsSession()
{
    Bench bench("sleep 5");
    QVERIFY(bench.startAndLoad());

    bench.route(kTag885);
    QTRY_COMPARE_WITH_TIMEOUT(bench.plugin->runningTags(), QStringList{kTag885}, 3000);
    QCOMPARE(bench.sink.active.size(), 1);
    QVERIFY(!bench.plugin->instanceIdFor(kTag885).isEmpty());

    bench.routes.routes.clear();
    QTRY_VERIFY_WITH_TIMEOUT(bench.plugin->runningTags().isEmpty(), 3000);
    QVERIFY(bench.sink.active.isEmpty());
    QVERIFY(bench.plugin->instanceIdFor(kTag885).isEmpty());
}

void TestTunerRadioPlugin::testRouteByDisplayName()
{
    Bench bench("sleep 5");
    QVERIFY(bench.startAndLoad());

    bench.route("HDHomeRun [Den]: Jazz (95.7)");
    QTRY_COMPARE_WITH_TIMEOUT(bench.plugin->runningTags(), QStringList{kTag957}, 3000);
    QCOMPARE(bench.sink.active.first(), QString("HDHomeRun [Den]: Jazz (95.7)"));
}

void TestTunerRadioPlugin::testUnavailableRouteViewKeepsSessions()
{
    Bench bench("sleep 5");
    QVERIFY(bench.startAndLoad());

    bench.route(kTag885);
    QTRY_COMPARE_WITH_TIMEOUT(bench.plugin->runningTags().size(), 1, 3000);

    bench.routes.available = false;
    bench.routes.routes.clear();
    QTest::qWait(200);
    QCOMPARE(bench.plugin->runningTags(), QStringList{kTag885});
}

void TestTunerRadioPlugin::testRefusedSourceStartsNothing()
{
    Bench bench("sleep 5");
    bench.sink.refuse = true;
    QVERIFY(bench.startAndLoad());

    bench.route(kTag885);
    QTest::qWait(200);
    QVERIFY(bench.plugin->runningTags().isEmpty());

    // Retried on the next reconcile once the host accepts sources again
    bench.sink.refuse = false;
    QTRY_COMPARE_WITH_TIMEOUT(bench.plugin->runningTags().size(), 1, 3000);
}

void TestTunerRadioPlugin::testManualPlayAndStop()
{
    Bench bench("sleep 5");
    QVERIFY(bench.startAndLoad());

    QVERIFY(bench.plugin->play(kTag957));
    QCOMPARE(bench.plugin->runningTags(), QStringList{kTag957});
    QVERIFY(!bench.plugin->instanceIdFor(kTag957).isEmpty());

    // Survives reconciliation although no host route names it
    QTest::qWait(100);
    QCOMPARE(bench.plugin->runningTags(), QStringList{kTag957});
    QCOMPARE(bench.plugin->activeStreams().size(), 1);

    QVERIFY(bench.plugin->stopChannel(kTag957));
    QVERIFY(bench.plugin->runningTags().isEmpty());
    QVERIFY(bench.sink.active.isEmpty());
    QVERIFY(!bench.plugin->stopChannel(kTag957));
}

void TestTunerRadioPlugin::testPlayUnknownChannel()
{
    Bench bench("sleep 5");
    QVERIFY(bench.startAndLoad());
    QVERIFY(!bench.plugin->play("hdhomerun_10_0_0_9_101_1"));
    QVERIFY(bench.plugin->runningTags().isEmpty());
}

void TestTunerRadioPlugin::testEmptyLineupKeepsChannels()
{
    Bench bench("sleep 5");
    QVERIFY(bench.startAndLoad());
    const int callsBefore = bench.lineupCalls.loadAcquire();

    bench.emptyLineups.storeRelease(1);
    QVERIFY(bench.plugin->requestLineupRefresh());
    QTRY_VERIFY_WITH_TIMEOUT(bench.lineupCalls.loadAcquire() > callsBefore, 3000);
    QTRY_VERIFY_WITH_TIMEOUT(!bench.plugin->status().value("lineup_in_flight").toBool(), 3000);

    QCOMPARE(bench.plugin->channels().size(), 2);
}

void TestTunerRadioPlugin::testSilenceFill()
{
    Bench bench("sleep 5");
    bench.config.values.insert("streaming.fill_silence", true);
    QVERIFY(bench.startAndLoad());

    bench.route(kTag885);
    QTRY_VERIFY_WITH_TIMEOUT(bench.sink.silentChunks >= 2, 3000);
    for (int size : bench.sink.chunkSizes)
        QCOMPARE(size, 1152);
}

void TestTunerRadioPlugin::testShutdownReleasesEverything()
{
    Bench bench("sleep 5");
    QVERIFY(bench.startAndLoad());
    bench.route(kTag885);
    QVERIFY(bench.plugin->play(kTag957));
    QTRY_COMPARE_WITH_TIMEOUT(bench.plugin->runningTags().size(), 2, 3000);

    bench.plugin->shutdown();
    QVERIFY(bench.plugin->runningTags().isEmpty());
    QVERIFY(bench.sink.active.isEmpty());
    QVERIFY(!bench.plugin->status().value("running").toBool());
}

QTEST_MAIN(TestTunerRadioPlugin)
#include "test_tuner_radio_plugin.moc"
