#pragma once

#include "core/plugin/IAudioSink.hpp"
#include "core/plugin/ISourceRegistry.hpp"
#include <QHash>
#include <QHostAddress>
#include <memory>

class QUdpSocket;

namespace hrb {

/// Delivers PCM to an audio router as Scream UDP packets.
///
/// Packet layout: 5-byte header then exactly one PCM chunk.
///   [0] rate: bit 7 set = 44.1 kHz base, clear = 48 kHz base; bits 0-6 multiplier
///   [1] bit depth
///   [2] channel count
///   [3] channel mask low byte
///   [4] channel mask high byte
///
/// Every registered source gets its own UDP socket so the router sees a
/// distinct sender address per channel.
class ScreamSink : public IAudioSink, public ISourceRegistry {
public:
    static constexpr int HEADER_SIZE = 5;

    ScreamSink(const QHostAddress& target, uint16_t port);
    ~ScreamSink() override;

    QString registerSource(const SourceDescriptor& source) override;
    void unregisterSource(const QString& instanceId) override;

    bool write(const QString& instanceId, const QByteArray& pcm,
               int channels, int sampleRate, int bitDepth,
               uint8_t chlayout1, uint8_t chlayout2) override;

    /// Scream rate byte for sampleRate, 0 when the rate cannot be expressed.
    static uint8_t rateByte(int sampleRate);

    /// Header for one packet. Empty when the rate cannot be expressed.
    static QByteArray buildHeader(int sampleRate, int bitDepth, int channels,
                                  uint8_t chlayout1, uint8_t chlayout2);

    int sourceCount() const { return sockets_.size(); }

    /// Local port the source's packets leave from, 0 for unknown ids.
    uint16_t localPort(const QString& instanceId) const;

private:
    QHostAddress target_;
    uint16_t port_;
    int nextId_ = 1;
    QHash<QString, std::shared_ptr<QUdpSocket>> sockets_;
};

} // namespace hrb
