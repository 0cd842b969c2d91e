#include <QtTest>
#include "cli/ProbeReport.hpp"
#include "core/YamlConfig.hpp"
#include "core/lineup/ChannelClassifier.hpp"
#include "FakeTuner.hpp"

namespace {

hrb::Channel entry(const QString& number, const QString& name)
{
    hrb::Channel c;
    c.deviceIp = "10.0.0.5";
    c.deviceName = "Den";
    c.guideNumber = number;
    c.guideName = name;
    c.streamUrl = "http://10.0.0.5:5004/auto/v" + number;
    c.tag = hrb::tagFor(c.deviceIp, number);
    c.displayName = hrb::displayNameFor(c.deviceName, name, number);
    c.isRadio = hrb::isLikelyRadio(number, name);
    return c;
}

} // namespace

class TestProbeReport : public QObject {
    Q_OBJECT
private slots:
    void testEmptyLineup();
    void testTableAndSources();
    void testTvOnlyHasNoSources();
    void testProbeReportAgainstTuner();
    void testProbeReportNoAnswer();
};

void TestProbeReport::testEmptyLineup()
{
    QCOMPARE(hrb::cli::formatLineupTable("Den", {}), QString("No channels found.\n"));
}

void TestProbeReport::testTableAndSources()
{
    const QString text = hrb::cli::formatLineupTable(
        "Den", {entry("88.5", "KQED"), entry("4.1", "KRON"), entry("250.1", "NPR Radio")});

    QVERIFY(text.contains("Channels from Den"));
    QVERIFY(text.contains("Total channels: 3 (2 radio, 1 TV)"));
    QVERIFY(text.contains("Sources that would be created (radio only)"));
    QVERIFY(text.contains("Source name: HDHomeRun [Den]: KQED (88.5)"));
    QVERIFY(text.contains("Tag: hdhomerun_10_0_0_5_250_1"));
    QVERIFY(text.contains("URL: http://10.0.0.5:5004/auto/v88.5"));
    QVERIFY(!text.contains("Source name: HDHomeRun [Den]: KRON (4.1)"));
}

void TestProbeReport::testTvOnlyHasNoSources()
{
    const QString text = hrb::cli::formatLineupTable("Den", {entry("4.1", "KRON")});
    QVERIFY(text.contains("Total channels: 1 (0 radio, 1 TV)"));
    QVERIFY(!text.contains("Sources that would be created"));
}

void TestProbeReport::testProbeReportAgainstTuner()
{
    FakeTuner tuner;
    QVERIFY(tuner.listen());
    tuner.discoverJson(R"({"FriendlyName":"Bench","ModelNumber":"HDHR5-4US","DeviceID":"10AA0001"})");
    tuner.lineupJson(R"([{"GuideNumber":"101.1","GuideName":"Rock","URL":"http://127.0.0.1/v101.1"},
                         {"GuideNumber":"7.1","GuideName":"Movies","URL":"http://127.0.0.1/v7.1"}])");

    hrb::YamlConfig config;
    QVERIFY(config.setValueByPath("discovery.probe_port", tuner.port()));
    QVERIFY(config.setValueByPath("discovery.probe_timeout_ms", 1000));

    QString text;
    QTextStream out(&text);
    QCOMPARE(hrb::cli::runProbeReport(config, "127.0.0.1", out), 0);

    QVERIFY(text.contains("Found Bench at 127.0.0.1"));
    QVERIFY(text.contains("Model: HDHR5-4US"));
    QVERIFY(text.contains("Firmware: Unknown"));
    QVERIFY(text.contains("Total channels: 2 (1 radio, 1 TV)"));
    QVERIFY(text.contains("Tag: hdhomerun_127_0_0_1_101_1"));
}

void TestProbeReport::testProbeReportNoAnswer()
{
    int freePort = 0;
    {
        FakeTuner tuner;
        QVERIFY(tuner.listen());
        freePort = tuner.port();
    }

    hrb::YamlConfig config;
    QVERIFY(config.setValueByPath("discovery.probe_port", freePort));

    QString text;
    QTextStream out(&text);
    QCOMPARE(hrb::cli::runProbeReport(config, "127.0.0.1", out), 1);
    QVERIFY(text.contains("No tuner answered at 127.0.0.1"));
}

QTEST_MAIN(TestProbeReport)
#include "test_probe_report.moc"
