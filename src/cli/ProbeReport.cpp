#include "ProbeReport.hpp"
#include "core/YamlConfig.hpp"
#include "core/discovery/DeviceVerifier.hpp"
#include "core/discovery/DiscoveryPipeline.hpp"
#include "core/lineup/LineupFetcher.hpp"
#include <QTextStream>

namespace hrb {
namespace cli {

namespace {

const QString kRule = QString(80, QLatin1Char('='));
const QString kThinRule = QString(80, QLatin1Char('-'));

DiscoverySettings settingsFrom(const YamlConfig& config)
{
    DiscoverySettings s;
    s.probeTimeoutMs = config.probeTimeoutMs();
    s.probePort = config.probePort();
    s.mdnsWindowMs = config.mdnsTimeoutSec() * 1000;
    s.broadcastWindowMs = config.broadcastTimeoutSec() * 1000;
    s.broadcastPort = config.broadcastPort();
    s.sweepWorkers = config.sweepWorkers();
    s.staticDevices = config.staticDevices();
    return s;
}

// The report lists TV entries too, so always fetch everything
LineupFetcher reportFetcher(const YamlConfig& config)
{
    return LineupFetcher(config.lineupTimeoutMs(), true, config.probePort());
}

} // namespace

QString formatLineupTable(const QString& deviceName, const ChannelList& channels)
{
    QString text;
    QTextStream out(&text);

    if (channels.isEmpty()) {
        out << "No channels found.\n";
        return text;
    }

    out << "\n" << kRule << "\n"
        << "Channels from " << deviceName << "\n"
        << kRule << "\n"
        << QStringLiteral("%1 %2 %3").arg(QStringLiteral("Channel"), -12)
                                     .arg(QStringLiteral("Name"), -40)
                                     .arg(QStringLiteral("Type"), -10).trimmed()
        << "\n" << kThinRule << "\n";

    int radio = 0;
    for (const auto& channel : channels) {
        if (channel.isRadio) ++radio;
        out << QStringLiteral("%1 %2 %3")
                   .arg(channel.guideNumber, -12)
                   .arg(channel.guideName.left(40), -40)
                   .arg(channel.isRadio ? QStringLiteral("Radio") : QStringLiteral("TV"), -10).trimmed()
            << "\n";
    }

    out << kThinRule << "\n"
        << "Total channels: " << channels.size()
        << " (" << radio << " radio, " << (channels.size() - radio) << " TV)\n";

    if (radio > 0) {
        out << "\n" << kRule << "\n"
            << "Sources that would be created (radio only)\n"
            << kRule << "\n";
        for (const auto& channel : channels) {
            if (!channel.isRadio) continue;
            out << "\nSource name: " << channel.displayName << "\n"
                << "  Tag: " << channel.tag << "\n"
                << "  URL: " << channel.streamUrl << "\n";
        }
    }
    return text;
}

int runDiscoveryReport(const YamlConfig& config, QTextStream& out)
{
    out << kRule << "\nHDHomeRun device discovery\n" << kRule << "\n" << Qt::flush;

    DiscoveryPipeline pipeline(settingsFrom(config));
    const DeviceMap devices = pipeline.run();

    out << "\nDiscovery complete: " << devices.size() << " device(s)\n";
    if (devices.isEmpty()) {
        out << "No tuners found. Check that the device is powered and on this subnet,\n"
               "that UDP 65001 and mDNS (5353) are not blocked, or probe one directly with --ip.\n";
        return 1;
    }

    const LineupFetcher fetcher = reportFetcher(config);
    for (auto it = devices.cbegin(); it != devices.cend(); ++it) {
        out << "\n" << it.value() << " (" << it.key() << ")\n" << Qt::flush;
        out << formatLineupTable(it.value(), fetcher.fetchLineup(it.key(), it.value()));
    }
    out << Qt::flush;
    return 0;
}

int runProbeReport(const YamlConfig& config, const QString& ip, QTextStream& out)
{
    DeviceVerifier verifier(config.probeTimeoutMs(), config.probePort());
    const Device device = verifier.describe(ip);
    if (!device.isValid()) {
        out << "No tuner answered at " << ip << "\n" << Qt::flush;
        return 1;
    }

    out << "Found " << device.friendlyName << " at " << device.ip << "\n"
        << "  Model: " << device.modelNumber << "\n"
        << "  Device ID: " << device.deviceId << "\n"
        << "  Firmware: " << (device.firmwareVersion.isEmpty() ? QStringLiteral("Unknown") : device.firmwareVersion) << "\n";
    if (device.tunerCount > 0)
        out << "  Tuners: " << device.tunerCount << "\n";

    out << formatLineupTable(device.friendlyName,
                             reportFetcher(config).fetchLineup(device.ip, device.friendlyName));
    out << Qt::flush;
    return 0;
}

} // namespace cli
} // namespace hrb
