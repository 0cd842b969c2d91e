#include "DiscoveryPipeline.hpp"
#include "BroadcastDiscovery.hpp"
#include "DeviceVerifier.hpp"
#include "DiscoveryOrchestrator.hpp"
#include "MdnsDiscovery.hpp"
#include "SubnetSweep.hpp"
#include <boost/log/trivial.hpp>

namespace hrb {

DiscoveryPipeline::DiscoveryPipeline(const DiscoverySettings& settings)
    : settings_(settings)
    , verifier_(std::make_unique<DeviceVerifier>(settings.probeTimeoutMs, settings.probePort))
    , mdns_(std::make_unique<MdnsDiscovery>(verifier_.get(), settings.mdnsWindowMs))
    , broadcast_(std::make_unique<BroadcastDiscovery>(verifier_.get(), settings.broadcastWindowMs,
                                                      settings.broadcastPort))
    , sweep_(std::make_unique<SubnetSweep>(verifier_.get(), settings.sweepWorkers))
    , orchestrator_(std::make_unique<DiscoveryOrchestrator>(mdns_.get(), broadcast_.get(), sweep_.get()))
{
}

DiscoveryPipeline::~DiscoveryPipeline() = default;

DeviceMap DiscoveryPipeline::run()
{
    DeviceMap found;
    for (const auto& ip : settings_.staticDevices) {
        const Device device = verifier_->describe(ip.trimmed());
        if (!device.isValid()) {
            BOOST_LOG_TRIVIAL(warning) << "[Discovery] Configured device " << ip.toStdString()
                                       << " did not answer";
            continue;
        }
        found.insert(device.ip, device.friendlyName);
    }

    mergeFirstWriterWins(found, orchestrator_->discoverAll());
    return found;
}

} // namespace hrb
