#pragma once

#include "Device.hpp"
#include <QString>

namespace hrb {

/// Probe seam used by every discovery strategy.
/// Implementations must be reentrant: the subnet sweep calls them from
/// many pool threads at once.
class IDeviceProbe {
public:
    virtual ~IDeviceProbe() = default;

    /// True iff a tuner answers at ip with a descriptor carrying both
    /// DeviceID and ModelNumber. Never throws.
    virtual bool verify(const QString& ip) = 0;

    /// Full descriptor, or an invalid Device when nothing usable answered.
    virtual Device describe(const QString& ip) = 0;
};

/// HTTP probe against http://<ip>[:port]/discover.json.
class DeviceVerifier : public IDeviceProbe {
public:
    static constexpr int DEFAULT_TIMEOUT_MS = 2000;

    explicit DeviceVerifier(int timeoutMs = DEFAULT_TIMEOUT_MS, int port = 80);

    bool verify(const QString& ip) override;
    Device describe(const QString& ip) override;

    int timeoutMs() const { return timeoutMs_; }
    int port() const { return port_; }

    /// Name used when the descriptor carries no FriendlyName.
    static QString fallbackName(const QString& ip);

private:
    QString discoverUrl(const QString& ip) const;

    int timeoutMs_;
    int port_;
};

} // namespace hrb
