#include "ChannelClassifier.hpp"
#include <QStringList>

namespace hrb {

namespace {

constexpr double kFmLowMHz = 88.0;
constexpr double kFmHighMHz = 108.0;

const QStringList& radioKeywords()
{
    static const QStringList keywords = {
        QStringLiteral("radio"), QStringLiteral("fm"), QStringLiteral("am"),
        QStringLiteral("music"), QStringLiteral("npr"), QStringLiteral("jazz"),
        QStringLiteral("classical"), QStringLiteral("rock"),
        QStringLiteral("news radio"), QStringLiteral("talk radio"),
    };
    return keywords;
}

} // namespace

bool isLikelyRadio(const QString& guideNumber, const QString& guideName)
{
    bool ok = false;
    const double number = guideNumber.section(QLatin1Char('-'), 0, 0).trimmed().toDouble(&ok);
    if (ok && number >= kFmLowMHz && number <= kFmHighMHz)
        return true;

    const QString name = guideName.toLower();
    for (const auto& keyword : radioKeywords()) {
        if (name.contains(keyword))
            return true;
    }
    return false;
}

QString tagFor(const QString& deviceIp, const QString& guideNumber)
{
    QString ip = deviceIp;
    QString number = guideNumber;
    return QStringLiteral("hdhomerun_%1_%2")
        .arg(ip.replace(QLatin1Char('.'), QLatin1Char('_')),
             number.replace(QLatin1Char('.'), QLatin1Char('_')));
}

QString displayNameFor(const QString& deviceName, const QString& guideName,
                       const QString& guideNumber)
{
    return QStringLiteral("HDHomeRun [%1]: %2 (%3)").arg(deviceName, guideName, guideNumber);
}

} // namespace hrb
