#pragma once

#include "Device.hpp"
#include <QStringList>
#include <cstdint>
#include <memory>

namespace hrb {

class DeviceVerifier;
class MdnsDiscovery;
class BroadcastDiscovery;
class SubnetSweep;
class DiscoveryOrchestrator;

struct DiscoverySettings {
    int probeTimeoutMs = 2000;
    int probePort = 80;
    int mdnsWindowMs = 10000;
    int broadcastWindowMs = 3000;
    uint16_t broadcastPort = 65001;
    int sweepWorkers = 50;
    QStringList staticDevices;   // described directly, ahead of any strategy
};

/// The production discovery stack: one HTTP verifier shared by the three
/// strategies and the orchestrator that runs them. run() blocks, so call it
/// from a worker thread or a one-shot CLI.
class DiscoveryPipeline {
public:
    explicit DiscoveryPipeline(const DiscoverySettings& settings);
    ~DiscoveryPipeline();

    DeviceMap run();

    DeviceVerifier* verifier() const { return verifier_.get(); }

private:
    DiscoverySettings settings_;
    std::unique_ptr<DeviceVerifier> verifier_;
    std::unique_ptr<MdnsDiscovery> mdns_;
    std::unique_ptr<BroadcastDiscovery> broadcast_;
    std::unique_ptr<SubnetSweep> sweep_;
    std::unique_ptr<DiscoveryOrchestrator> orchestrator_;
};

} // namespace hrb
