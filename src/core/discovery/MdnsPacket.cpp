#include "MdnsPacket.hpp"
#include <QtEndian>

namespace hrb {
namespace mdns {

namespace {

constexpr int kHeaderSize = 12;
constexpr int kMaxPointerJumps = 32;
constexpr uint16_t kClassIn = 0x0001;
constexpr uint16_t kUnicastResponseBit = 0x8000;
constexpr uint16_t kFlagResponse = 0x8000;

uint16_t rd16(const QByteArray& buf, int off)
{
    return qFromBigEndian<quint16>(reinterpret_cast<const uchar*>(buf.constData()) + off);
}

void wr16(QByteArray& buf, uint16_t v)
{
    buf.append(static_cast<char>((v >> 8) & 0xFF));
    buf.append(static_cast<char>(v & 0xFF));
}

// Reads a possibly compressed name starting at off. On success advances off
// past the name as it appears in place (a pointer counts as two bytes).
bool readName(const QByteArray& buf, int& off, QString& out)
{
    QStringList labels;
    int pos = off;
    int jumps = 0;
    bool jumped = false;

    while (true) {
        if (pos >= buf.size()) return false;
        const auto len = static_cast<uint8_t>(buf.at(pos));

        if (len == 0) {
            if (!jumped) off = pos + 1;
            break;
        }
        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= buf.size()) return false;
            if (++jumps > kMaxPointerJumps) return false;
            const int target = ((len & 0x3F) << 8) | static_cast<uint8_t>(buf.at(pos + 1));
            if (!jumped) off = pos + 2;
            jumped = true;
            pos = target;
            continue;
        }
        if ((len & 0xC0) != 0) return false;  // reserved label types
        if (pos + 1 + len > buf.size()) return false;

        labels.append(QString::fromUtf8(buf.constData() + pos + 1, len));
        pos += 1 + len;
    }

    out = canonicalName(labels.join(QLatin1Char('.')));
    return true;
}

bool skipQuestion(const QByteArray& buf, int& off)
{
    QString ignored;
    if (!readName(buf, off, ignored)) return false;
    if (off + 4 > buf.size()) return false;
    off += 4;
    return true;
}

bool readRecord(const QByteArray& buf, int& off, Record& rec, bool& keep)
{
    if (!readName(buf, off, rec.name)) return false;
    if (off + 10 > buf.size()) return false;

    rec.type = rd16(buf, off);
    const int rdlen = rd16(buf, off + 8);
    off += 10;
    if (off + rdlen > buf.size()) return false;

    const int rdata = off;
    off += rdlen;
    keep = false;

    switch (rec.type) {
    case TypePtr: {
        int p = rdata;
        if (!readName(buf, p, rec.target)) return false;
        keep = true;
        break;
    }
    case TypeSrv: {
        if (rdlen < 7) return false;
        rec.port = rd16(buf, rdata + 4);
        int p = rdata + 6;
        if (!readName(buf, p, rec.target)) return false;
        keep = true;
        break;
    }
    case TypeA: {
        if (rdlen != 4) return false;
        const auto* b = reinterpret_cast<const uchar*>(buf.constData()) + rdata;
        rec.address = QStringLiteral("%1.%2.%3.%4").arg(b[0]).arg(b[1]).arg(b[2]).arg(b[3]);
        keep = true;
        break;
    }
    default:
        // TXT, AAAA, NSEC... not needed for IPv4 discovery
        break;
    }
    return true;
}

} // namespace

QString canonicalName(const QString& name)
{
    QString out = name.toLower();
    while (out.endsWith(QLatin1Char('.')))
        out.chop(1);
    return out;
}

QByteArray buildQuery(const QString& name, uint16_t type, bool qu)
{
    QByteArray msg;
    msg.reserve(kHeaderSize + name.size() + 6);

    wr16(msg, 0);   // id
    wr16(msg, 0);   // flags: standard query
    wr16(msg, 1);   // qdcount
    wr16(msg, 0);
    wr16(msg, 0);
    wr16(msg, 0);

    const auto labels = canonicalName(name).split(QLatin1Char('.'), Qt::SkipEmptyParts);
    for (const auto& label : labels) {
        const QByteArray raw = label.toUtf8();
        if (raw.size() > 63) return {};
        msg.append(static_cast<char>(raw.size()));
        msg.append(raw);
    }
    msg.append('\0');

    wr16(msg, type);
    wr16(msg, kClassIn | (qu ? kUnicastResponseBit : 0));
    return msg;
}

bool parseResponse(const QByteArray& message, QList<Record>& records)
{
    if (message.size() < kHeaderSize) return false;

    const uint16_t flags = rd16(message, 2);
    if ((flags & kFlagResponse) == 0) return false;

    const int qd = rd16(message, 4);
    const int rrCount = rd16(message, 6) + rd16(message, 8) + rd16(message, 10);

    int off = kHeaderSize;
    for (int i = 0; i < qd; ++i) {
        if (!skipQuestion(message, off)) return false;
    }

    QList<Record> parsed;
    for (int i = 0; i < rrCount; ++i) {
        Record rec;
        bool keep = false;
        if (!readRecord(message, off, rec, keep)) return false;
        if (keep) parsed.append(rec);
    }

    records.append(parsed);
    return true;
}

ServiceCache::ServiceCache(const QString& serviceType)
    : serviceType_(canonicalName(serviceType))
{
}

void ServiceCache::add(const QList<Record>& records)
{
    for (const auto& rec : records) {
        switch (rec.type) {
        case TypePtr:
            if (rec.name == serviceType_)
                instances_.insert(rec.target);
            break;
        case TypeSrv:
            // Responders often send SRV without the PTR that names it
            if (rec.name.endsWith(QLatin1Char('.') + serviceType_)) {
                instances_.insert(rec.name);
                srv_.insert(rec.name, rec);
            }
            break;
        case TypeA: {
            auto& list = addresses_[rec.name];
            if (!list.contains(rec.address))
                list.append(rec.address);
            break;
        }
        default:
            break;
        }
    }
}

QList<ServiceEvent> ServiceCache::takeResolved()
{
    QList<ServiceEvent> events;
    for (const auto& instance : instances_) {
        if (reported_.contains(instance)) continue;

        auto srvIt = srv_.constFind(instance);
        if (srvIt == srv_.constEnd()) continue;

        auto addrIt = addresses_.constFind(srvIt->target);
        if (addrIt == addresses_.constEnd() || addrIt->isEmpty()) continue;

        ServiceEvent ev;
        ev.instance = instance;
        ev.host = srvIt->target;
        ev.port = srvIt->port;
        ev.ip = addrIt->first();
        events.append(ev);
        reported_.insert(instance);
    }
    return events;
}

QStringList ServiceCache::unresolvedHosts() const
{
    QStringList hosts;
    for (const auto& srv : srv_) {
        if (!addresses_.contains(srv.target) && !hosts.contains(srv.target))
            hosts.append(srv.target);
    }
    return hosts;
}

QStringList ServiceCache::unresolvedInstances() const
{
    QStringList pending;
    for (const auto& instance : instances_) {
        if (!srv_.contains(instance))
            pending.append(instance);
    }
    pending.sort();
    return pending;
}

} // namespace mdns
} // namespace hrb
