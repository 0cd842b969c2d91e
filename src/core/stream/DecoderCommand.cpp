#include "DecoderCommand.hpp"

namespace hrb {

QStringList DecoderCommand::defaultArguments()
{
    return {
        QStringLiteral("-hide_banner"),
        QStringLiteral("-re"),
        QStringLiteral("-i"), QStringLiteral("{url}"),
        QStringLiteral("-f"), QStringLiteral("{format}"),
        QStringLiteral("-ac"), QStringLiteral("{channels}"),
        QStringLiteral("-ar"), QStringLiteral("{sample_rate}"),
        QStringLiteral("pipe:1"),
    };
}

QStringList DecoderCommand::expand(const QString& url, const AudioFormat& format) const
{
    QStringList out;
    out.reserve(arguments.size());
    for (QString arg : arguments) {
        arg.replace(QLatin1String("{sample_rate}"), QString::number(format.sampleRate));
        arg.replace(QLatin1String("{channels}"), QString::number(format.channels));
        arg.replace(QLatin1String("{format}"), format.sampleFormat());
        // url last so placeholder-like text inside it is left alone
        arg.replace(QLatin1String("{url}"), url);
        out.append(arg);
    }
    return out;
}

} // namespace hrb
