#pragma once

#include "Device.hpp"
#include <QString>

namespace hrb {

/// One way of finding tuners on the local network.
/// discover() blocks for at most its window plus per-candidate probe time,
/// returns only verified devices and never throws on network trouble.
class IDiscoveryStrategy {
public:
    virtual ~IDiscoveryStrategy() = default;

    virtual QString name() const = 0;

    /// Listen window used when the caller has no preference.
    virtual int defaultWindowMs() const = 0;

    virtual DeviceMap discover(int windowMs) = 0;
};

} // namespace hrb
