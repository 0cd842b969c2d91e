#pragma once

#include "AudioFormat.hpp"
#include <QStringList>

namespace hrb {

/// Program and argument template used to launch one decoder. The decoder
/// must write raw PCM in the requested format to its standard output.
///
/// Placeholders substituted in every argument:
///   {url} {sample_rate} {channels} {format}
struct DecoderCommand {
    QString program = QStringLiteral("ffmpeg");
    QStringList arguments = defaultArguments();

    static QStringList defaultArguments();

    /// Arguments with placeholders filled in, program name excluded.
    QStringList expand(const QString& url, const AudioFormat& format) const;
};

} // namespace hrb
