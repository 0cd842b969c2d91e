#include "DiscoveryOrchestrator.hpp"
#include "IDiscoveryStrategy.hpp"
#include <boost/log/trivial.hpp>
#include <exception>

namespace hrb {

DiscoveryOrchestrator::DiscoveryOrchestrator(IDiscoveryStrategy* announcement,
                                             IDiscoveryStrategy* broadcast,
                                             IDiscoveryStrategy* sweep)
    : announcement_(announcement)
    , broadcast_(broadcast)
    , sweep_(sweep)
{
}

DeviceMap DiscoveryOrchestrator::runStrategy(IDiscoveryStrategy* strategy, int windowMs)
{
    if (!strategy) return {};

    try {
        return strategy->discover(windowMs < 0 ? strategy->defaultWindowMs() : windowMs);
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "[Discovery] " << strategy->name().toStdString()
                                 << " failed: " << e.what();
    }
    return {};
}

DeviceMap DiscoveryOrchestrator::discoverAll(int announcementWindowMs)
{
    DeviceMap all;

    const DeviceMap announced = runStrategy(announcement_, announcementWindowMs);
    mergeFirstWriterWins(all, announced);

    const DeviceMap broadcasted = runStrategy(broadcast_, -1);
    const int added = mergeFirstWriterWins(all, broadcasted);
    if (added > 0) {
        BOOST_LOG_TRIVIAL(debug) << "[Discovery] Broadcast added " << added
                                 << " device(s) not announced";
    }

    if (all.isEmpty()) {
        BOOST_LOG_TRIVIAL(info) << "[Discovery] Nothing announced or broadcast, sweeping subnet";
        mergeFirstWriterWins(all, runStrategy(sweep_, -1));
    }

    BOOST_LOG_TRIVIAL(info) << "[Discovery] " << all.size() << " device(s) total";
    for (auto it = all.cbegin(); it != all.cend(); ++it) {
        BOOST_LOG_TRIVIAL(info) << "[Discovery]   " << it.key().toStdString()
                                << ": " << it.value().toStdString();
    }
    return all;
}

} // namespace hrb
