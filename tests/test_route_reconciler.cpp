#include <QtTest>
#include "core/lineup/ChannelClassifier.hpp"
#include "core/stream/RouteReconciler.hpp"

namespace {

class RecordingControl : public hrb::IStreamControl {
public:
    bool start(const hrb::Channel& channel) override
    {
        starts.append(channel.tag);
        if (refuse.contains(channel.tag)) return false;
        running.append(channel.tag);
        return true;
    }

    void stop(const QString& tag) override
    {
        stops.append(tag);
        running.removeAll(tag);
    }

    QStringList runningTags() const override { return running; }

    QStringList running;
    QStringList starts;
    QStringList stops;
    QSet<QString> refuse;
};

hrb::Channel channel(const QString& ip, const QString& device, const QString& number,
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

hrb::ActiveRoute route(const QString& source, bool enabled = true)
{
    hrb::ActiveRoute r;
    r.source = source;
    r.enabled = enabled;
    return r;
}

} // namespace

class TestRouteReconciler : public QObject {
    Q_OBJECT
private slots:
    void testConvergence();
    void testStopsUnroutedSessions();
    void testDisabledRoutesIgnored();
    void testDisplayNameFallback();
    void testAmbiguousDisplayNameSkipped();
    void testFailedStartRetried();
    void testUnknownSourcesIgnored();
};

void TestRouteReconciler::testConvergence()
{
    const hrb::ChannelList channels = {
        channel("10.0.0.5", "Den", "88.5", "KQED"),
        channel("10.0.0.5", "Den", "95.7", "Jazz"),
    };
    const QList<hrb::ActiveRoute> routes = {route(channels[0].tag), route(channels[1].tag)};

    RecordingControl control;
    hrb::RouteReconciler reconciler(&control);

    auto first = reconciler.reconcile(routes, channels);
    QCOMPARE(first.started.size(), 2);
    QVERIFY(first.changed());

    auto second = reconciler.reconcile(routes, channels);
    QVERIFY(!second.changed());
    QCOMPARE(control.starts.size(), 2);
    QVERIFY(control.stops.isEmpty());
}

void TestRouteReconciler::testStopsUnroutedSessions()
{
    const hrb::ChannelList channels = {
        channel("10.0.0.5", "Den", "88.5", "KQED"),
        channel("10.0.0.5", "Den", "95.7", "Jazz"),
    };

    RecordingControl control;
    hrb::RouteReconciler reconciler(&control);
    reconciler.reconcile({route(channels[0].tag), route(channels[1].tag)}, channels);

    auto outcome = reconciler.reconcile({route(channels[1].tag)}, channels);
    QCOMPARE(outcome.stopped, QStringList{channels[0].tag});
    QVERIFY(outcome.started.isEmpty());
    QCOMPARE(control.running, QStringList{channels[1].tag});

    reconciler.reconcile({}, channels);
    QVERIFY(control.running.isEmpty());
}

void TestRouteReconciler::testDisabledRoutesIgnored()
{
    const hrb::ChannelList channels = {channel("10.0.0.5", "Den", "88.5", "KQED")};

    RecordingControl control;
    hrb::RouteReconciler reconciler(&control);
    auto outcome = reconciler.reconcile({route(channels[0].tag, false)}, channels);

    QVERIFY(!outcome.changed());
    QVERIFY(control.starts.isEmpty());
}

void TestRouteReconciler::testDisplayNameFallback()
{
    const hrb::ChannelList channels = {channel("10.0.0.5", "Den", "88.5", "KQED")};

    RecordingControl control;
    hrb::RouteReconciler reconciler(&control);
    const QSet<QString> active = reconciler.activeTags(
        {route("HDHomeRun [Den]: KQED (88.5)")}, channels);

    QCOMPARE(active, QSet<QString>{channels[0].tag});
}

void TestRouteReconciler::testAmbiguousDisplayNameSkipped()
{
    // Two tuners with the same friendly name carrying the same station
    const hrb::ChannelList channels = {
        channel("10.0.0.5", "Tuner", "88.5", "KQED"),
        channel("10.0.0.6", "Tuner", "88.5", "KQED"),
    };

    RecordingControl control;
    hrb::RouteReconciler reconciler(&control);
    const QString sharedName = channels[0].displayName;
    QCOMPARE(channels[1].displayName, sharedName);

    QVERIFY(reconciler.activeTags({route(sharedName)}, channels).isEmpty());
    // Tags still resolve exactly
    QCOMPARE(reconciler.activeTags({route(channels[1].tag)}, channels),
             QSet<QString>{channels[1].tag});
}

void TestRouteReconciler::testFailedStartRetried()
{
    const hrb::ChannelList channels = {channel("10.0.0.5", "Den", "88.5", "KQED")};

    RecordingControl control;
    control.refuse.insert(channels[0].tag);
    hrb::RouteReconciler reconciler(&control);

    auto first = reconciler.reconcile({route(channels[0].tag)}, channels);
    QCOMPARE(first.failed, QStringList{channels[0].tag});
    QVERIFY(first.started.isEmpty());

    control.refuse.clear();
    auto second = reconciler.reconcile({route(channels[0].tag)}, channels);
    QCOMPARE(second.started, QStringList{channels[0].tag});
    QCOMPARE(control.starts.size(), 2);
}

void TestRouteReconciler::testUnknownSourcesIgnored()
{
    const hrb::ChannelList channels = {channel("10.0.0.5", "Den", "88.5", "KQED")};

    RecordingControl control;
    hrb::RouteReconciler reconciler(&control);
    auto outcome = reconciler.reconcile(
        {route("Spotify"), route("hdhomerun_10_0_0_9_101_1"), route("")}, channels);

    QVERIFY(!outcome.changed());
    QVERIFY(outcome.failed.isEmpty());
}

QTEST_MAIN(TestRouteReconciler)
#include "test_route_reconciler.moc"
