#include <QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include "core/lineup/LineupFetcher.hpp"
#include "FakeTuner.hpp"

namespace {

QJsonArray lineupArray(const QByteArray& json)
{
    return QJsonDocument::fromJson(json).array();
}

const QByteArray kMixedLineup = R"([
    {"GuideNumber":"88.5","GuideName":"KQED FM","URL":"http://10.0.0.5:5004/auto/v88.5"},
    {"GuideNumber":"4.1","GuideName":"KRON","URL":"http://10.0.0.5:5004/auto/v4.1"},
    {"GuideNumber":"250.1","GuideName":"NPR Radio","URL":"http://10.0.0.5:5004/auto/v250.1"},
    {"GuideNumber":"99.7","GuideName":"No Url"}
])";

} // namespace

class TestLineupFetcher : public QObject {
    Q_OBJECT
private slots:
    void testRadioOnlyByDefault();
    void testIncludeAllChannels();
    void testEntriesWithoutUrlSkipped();
    void testMissingGuideNameDefaults();
    void testDuplicateTagsKeepFirst();
    void testFetchFromTuner();
    void testFetchFailureIsEmpty();
    void testNonArrayBodyIsEmpty();
};

void TestLineupFetcher::testRadioOnlyByDefault()
{
    hrb::LineupFetcher fetcher;
    const auto channels = fetcher.parseLineup(lineupArray(kMixedLineup), "10.0.0.5", "Den");

    QCOMPARE(channels.size(), 2);
    QCOMPARE(channels[0].guideNumber, QString("88.5"));
    QCOMPARE(channels[0].tag, QString("hdhomerun_10_0_0_5_88_5"));
    QCOMPARE(channels[0].displayName, QString("HDHomeRun [Den]: KQED FM (88.5)"));
    QCOMPARE(channels[0].streamUrl, QString("http://10.0.0.5:5004/auto/v88.5"));
    QCOMPARE(channels[0].deviceIp, QString("10.0.0.5"));
    QVERIFY(channels[0].isRadio);
    QCOMPARE(channels[1].guideName, QString("NPR Radio"));
}

void TestLineupFetcher::testIncludeAllChannels()
{
    hrb::LineupFetcher fetcher(1000, true);
    const auto channels = fetcher.parseLineup(lineupArray(kMixedLineup), "10.0.0.5", "Den");

    QCOMPARE(channels.size(), 3);
    QCOMPARE(channels[1].guideNumber, QString("4.1"));
    QVERIFY(!channels[1].isRadio);
}

void TestLineupFetcher::testEntriesWithoutUrlSkipped()
{
    hrb::LineupFetcher fetcher(1000, true);
    const auto channels = fetcher.parseLineup(lineupArray(kMixedLineup), "10.0.0.5", "Den");
    for (const auto& channel : channels)
        QVERIFY(channel.guideNumber != "99.7");
}

void TestLineupFetcher::testMissingGuideNameDefaults()
{
    hrb::LineupFetcher fetcher;
    const auto channels = fetcher.parseLineup(
        lineupArray(R"([{"GuideNumber":"101.1","URL":"http://x/v101.1"}])"), "10.0.0.5", "Den");

    QCOMPARE(channels.size(), 1);
    QCOMPARE(channels[0].guideName, QString("Unknown"));
}

void TestLineupFetcher::testDuplicateTagsKeepFirst()
{
    hrb::LineupFetcher fetcher;
    const auto channels = fetcher.parseLineup(lineupArray(R"([
        {"GuideNumber":"95.5","GuideName":"First","URL":"http://x/a"},
        {"GuideNumber":"95.5","GuideName":"Second","URL":"http://x/b"}
    ])"), "10.0.0.5", "Den");

    QCOMPARE(channels.size(), 1);
    QCOMPARE(channels[0].guideName, QString("First"));
}

void TestLineupFetcher::testFetchFromTuner()
{
    FakeTuner tuner;
    QVERIFY(tuner.listen());
    tuner.lineupJson(kMixedLineup);

    hrb::LineupFetcher fetcher(1000, false, tuner.port());
    const auto channels = fetcher.fetchLineup("127.0.0.1", "Bench");

    QCOMPARE(channels.size(), 2);
    QCOMPARE(channels[0].tag, QString("hdhomerun_127_0_0_1_88_5"));
    QCOMPARE(channels[0].deviceName, QString("Bench"));
}

void TestLineupFetcher::testFetchFailureIsEmpty()
{
    FakeTuner tuner;
    QVERIFY(tuner.listen());
    // no lineup route -> 404

    hrb::LineupFetcher fetcher(1000, false, tuner.port());
    QVERIFY(fetcher.fetchLineup("127.0.0.1", "Bench").isEmpty());
}

void TestLineupFetcher::testNonArrayBodyIsEmpty()
{
    FakeTuner tuner;
    QVERIFY(tuner.listen());
    tuner.lineupJson(R"({"GuideNumber":"88.5"})");

    hrb::LineupFetcher fetcher(1000, false, tuner.port());
    QVERIFY(fetcher.fetchLineup("127.0.0.1", "Bench").isEmpty());
}

QTEST_MAIN(TestLineupFetcher)
#include "test_lineup_fetcher.moc"
