#pragma once

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <cstdint>

namespace hrb {
namespace mdns {

constexpr uint16_t kPort = 5353;
constexpr const char* kGroupV4 = "224.0.0.251";

enum RecordType : uint16_t {
    TypeA = 1,
    TypePtr = 12,
    TypeTxt = 16,
    TypeAaaa = 28,
    TypeSrv = 33
};

/// One resource record of interest, names canonicalized (lowercase, no trailing dot).
struct Record {
    uint16_t type = 0;
    QString name;
    QString target;      // PTR: instance name, SRV: host name
    uint16_t port = 0;   // SRV only
    QString address;     // A only, dotted quad
};

/// A browsed service instance joined across PTR, SRV and A records.
struct ServiceEvent {
    QString instance;    // e.g. "hdhomerun 1045abcd._hdhomerun._tcp.local"
    QString host;        // SRV target
    uint16_t port = 0;
    QString ip;          // first IPv4 address of host
};

/// Lowercase and strip trailing dots.
QString canonicalName(const QString& name);

/// Encode a single-question query. qu requests a unicast response.
QByteArray buildQuery(const QString& name, uint16_t type, bool qu = false);

/// Parse a DNS message. Returns false for queries (QR bit clear) and for
/// malformed messages; records parsed before the damage are discarded too.
bool parseResponse(const QByteArray& message, QList<Record>& records);

/// Accumulates records from many responses and yields newly resolved
/// instances of one service type.
class ServiceCache {
public:
    explicit ServiceCache(const QString& serviceType);

    void add(const QList<Record>& records);

    /// Instances resolved to an IPv4 address since the last call.
    QList<ServiceEvent> takeResolved();

    /// SRV targets that still lack an address (candidates for an A query).
    QStringList unresolvedHosts() const;

    /// Instances named by a PTR answer but still lacking SRV (candidates for an SRV query).
    QStringList unresolvedInstances() const;

private:
    QString serviceType_;
    QSet<QString> instances_;
    QHash<QString, Record> srv_;               // instance -> SRV
    QHash<QString, QStringList> addresses_;    // host -> IPv4 list
    QSet<QString> reported_;
};

} // namespace mdns
} // namespace hrb
