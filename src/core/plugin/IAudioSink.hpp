#pragma once

#include <QByteArray>
#include <QString>
#include <cstdint>

namespace hrb {

/// Where decoded PCM leaves the bridge. One call carries exactly one chunk.
class IAudioSink {
public:
    virtual ~IAudioSink() = default;

    /// Deliver pcm for the source registered as instanceId.
    /// Returns false when the chunk could not be handed over; the caller
    /// drops it and carries on.
    virtual bool write(const QString& instanceId, const QByteArray& pcm,
                       int channels, int sampleRate, int bitDepth,
                       uint8_t chlayout1, uint8_t chlayout2) = 0;
};

} // namespace hrb
