#include "ScreamSink.hpp"
#include <QUdpSocket>
#include <boost/log/trivial.hpp>

namespace hrb {

namespace {

constexpr int kBase48k = 48000;
constexpr int kBase44k = 44100;
constexpr uint8_t kBase44kFlag = 0x80;
constexpr int kMaxMultiplier = 0x7F;

} // namespace

ScreamSink::ScreamSink(const QHostAddress& target, uint16_t port)
    : target_(target)
    , port_(port)
{
}

ScreamSink::~ScreamSink() = default;

uint8_t ScreamSink::rateByte(int sampleRate)
{
    if (sampleRate <= 0) return 0;
    if (sampleRate % kBase48k == 0 && sampleRate / kBase48k <= kMaxMultiplier)
        return static_cast<uint8_t>(sampleRate / kBase48k);
    if (sampleRate % kBase44k == 0 && sampleRate / kBase44k <= kMaxMultiplier)
        return static_cast<uint8_t>(kBase44kFlag | (sampleRate / kBase44k));
    return 0;
}

QByteArray ScreamSink::buildHeader(int sampleRate, int bitDepth, int channels,
                                   uint8_t chlayout1, uint8_t chlayout2)
{
    const uint8_t rate = rateByte(sampleRate);
    if (rate == 0) return {};

    QByteArray header(HEADER_SIZE, '\0');
    header[0] = static_cast<char>(rate);
    header[1] = static_cast<char>(bitDepth);
    header[2] = static_cast<char>(channels);
    header[3] = static_cast<char>(chlayout1);
    header[4] = static_cast<char>(chlayout2);
    return header;
}

QString ScreamSink::registerSource(const SourceDescriptor& source)
{
    auto socket = std::make_shared<QUdpSocket>();
    if (!socket->bind(QHostAddress::AnyIPv4, 0)) {
        BOOST_LOG_TRIVIAL(error) << "[ScreamSink] Cannot open socket for " << source.tag.toStdString()
                                 << ": " << socket->errorString().toStdString();
        return {};
    }

    const QString id = QStringLiteral("%1#%2").arg(source.tag).arg(nextId_++);
    sockets_.insert(id, socket);

    BOOST_LOG_TRIVIAL(info) << "[ScreamSink] Registered \"" << source.name.toStdString()
                            << "\" as " << id.toStdString()
                            << " (local port " << socket->localPort() << ")";
    return id;
}

void ScreamSink::unregisterSource(const QString& instanceId)
{
    if (sockets_.remove(instanceId) > 0)
        BOOST_LOG_TRIVIAL(info) << "[ScreamSink] Removed " << instanceId.toStdString();
}

uint16_t ScreamSink::localPort(const QString& instanceId) const
{
    auto it = sockets_.constFind(instanceId);
    return it == sockets_.cend() ? 0 : (*it)->localPort();
}

bool ScreamSink::write(const QString& instanceId, const QByteArray& pcm,
                       int channels, int sampleRate, int bitDepth,
                       uint8_t chlayout1, uint8_t chlayout2)
{
    auto it = sockets_.constFind(instanceId);
    if (it == sockets_.cend()) return false;

    QByteArray packet = buildHeader(sampleRate, bitDepth, channels, chlayout1, chlayout2);
    if (packet.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[ScreamSink] Unsupported sample rate " << sampleRate;
        return false;
    }
    packet.append(pcm);

    const qint64 sent = (*it)->writeDatagram(packet, target_, port_);
    if (sent != packet.size()) {
        BOOST_LOG_TRIVIAL(debug) << "[ScreamSink] Send failed for " << instanceId.toStdString()
                                 << ": " << (*it)->errorString().toStdString();
        return false;
    }
    return true;
}

} // namespace hrb
