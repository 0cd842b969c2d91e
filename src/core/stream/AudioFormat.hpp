#pragma once

#include <QString>
#include <cstdint>

namespace hrb {

/// PCM profile every decoder is asked to produce. One fixed profile; the
/// bridge does no format negotiation.
struct AudioFormat {
    static constexpr int FRAMES_PER_CHUNK = 288;

    int bitDepth = 16;
    int sampleRate = 48000;
    int channels = 2;
    QString layout = QStringLiteral("stereo");

    // Scream channel mask, little-endian over two bytes (FL|FR = 0x0003)
    uint8_t chlayout1 = 0x03;
    uint8_t chlayout2 = 0x00;

    int bytesPerFrame() const { return channels * bitDepth / 8; }
    int chunkSizeBytes() const { return bytesPerFrame() * FRAMES_PER_CHUNK; }

    /// ffmpeg raw sample format name for the bit depth ("s16le", "s24le", "s32le").
    QString sampleFormat() const { return QStringLiteral("s%1le").arg(bitDepth); }
};

} // namespace hrb
