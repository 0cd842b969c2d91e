#pragma once

#include "Device.hpp"

namespace hrb {

class IDiscoveryStrategy;

/// Runs the discovery strategies in priority order and merges their results.
/// Announcement and broadcast always run; the subnet sweep only when both
/// came back empty. An address found by an earlier strategy keeps its name.
class DiscoveryOrchestrator {
public:
    DiscoveryOrchestrator(IDiscoveryStrategy* announcement,
                          IDiscoveryStrategy* broadcast,
                          IDiscoveryStrategy* sweep);

    /// announcementWindowMs < 0 uses the announcement strategy's own window.
    /// Never throws.
    DeviceMap discoverAll(int announcementWindowMs = -1);

private:
    DeviceMap runStrategy(IDiscoveryStrategy* strategy, int windowMs);

    IDiscoveryStrategy* announcement_;
    IDiscoveryStrategy* broadcast_;
    IDiscoveryStrategy* sweep_;
};

} // namespace hrb
