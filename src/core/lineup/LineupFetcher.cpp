#include "LineupFetcher.hpp"
#include "ChannelClassifier.hpp"
#include "core/net/HttpJson.hpp"
#include <QJsonArray>
#include <QJsonObject>
#include <QSet>
#include <QUrl>
#include <boost/log/trivial.hpp>

namespace hrb {

LineupFetcher::LineupFetcher(int timeoutMs, bool includeAllChannels, int port)
    : timeoutMs_(timeoutMs)
    , includeAll_(includeAllChannels)
    , port_(port)
{
}

ChannelList LineupFetcher::parseLineup(const QJsonArray& lineup, const QString& deviceIp,
                                       const QString& deviceName) const
{
    ChannelList channels;
    QSet<QString> seen;
    int skippedNoUrl = 0;
    int skippedTv = 0;

    for (const auto& value : lineup) {
        const QJsonObject entry = value.toObject();

        Channel channel;
        channel.guideNumber = entry.value(QLatin1String("GuideNumber")).toVariant().toString();
        channel.guideName = entry.value(QLatin1String("GuideName")).toString(QStringLiteral("Unknown"));
        channel.streamUrl = entry.value(QLatin1String("URL")).toString();

        if (channel.streamUrl.isEmpty()) {
            ++skippedNoUrl;
            continue;
        }

        channel.isRadio = isLikelyRadio(channel.guideNumber, channel.guideName);
        if (!channel.isRadio && !includeAll_) {
            ++skippedTv;
            continue;
        }

        channel.deviceIp = deviceIp;
        channel.deviceName = deviceName;
        channel.tag = tagFor(deviceIp, channel.guideNumber);
        channel.displayName = displayNameFor(deviceName, channel.guideName, channel.guideNumber);

        if (seen.contains(channel.tag)) continue;
        seen.insert(channel.tag);

        BOOST_LOG_TRIVIAL(debug) << "[Lineup] " << channel.displayName.toStdString()
                                 << " -> " << channel.tag.toStdString()
                                 << " (" << channel.streamUrl.toStdString() << ")";
        channels.append(channel);
    }

    BOOST_LOG_TRIVIAL(info) << "[Lineup] " << deviceName.toStdString() << ": "
                            << channels.size() << " channel(s) kept, "
                            << skippedTv << " non-radio skipped, "
                            << skippedNoUrl << " without URL";
    return channels;
}

ChannelList LineupFetcher::fetchLineup(const QString& deviceIp, const QString& deviceName) const
{
    const QString url = port_ == 80
        ? QStringLiteral("http://%1/lineup.json").arg(deviceIp)
        : QStringLiteral("http://%1:%2/lineup.json").arg(deviceIp).arg(port_);

    const JsonReply reply = fetchJson(QUrl(url), timeoutMs_);
    if (!reply.ok) {
        BOOST_LOG_TRIVIAL(error) << "[Lineup] Failed to fetch lineup from " << deviceIp.toStdString()
                                 << ": " << reply.error.toStdString();
        return {};
    }
    if (!reply.document.isArray()) {
        BOOST_LOG_TRIVIAL(warning) << "[Lineup] " << deviceIp.toStdString()
                                   << ": lineup.json is not an array";
        return {};
    }

    const QJsonArray lineup = reply.document.array();
    if (lineup.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[Lineup] No channels found on " << deviceName.toStdString();
        return {};
    }
    return parseLineup(lineup, deviceIp, deviceName);
}

} // namespace hrb
