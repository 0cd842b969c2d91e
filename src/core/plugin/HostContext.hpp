#pragma once

#include "IHostContext.hpp"

namespace hrb {

class HostContext : public IHostContext {
public:
    void setAudioSink(IAudioSink* sink) { sink_ = sink; }
    void setSourceRegistry(ISourceRegistry* registry) { registry_ = registry; }
    void setRouteView(IRouteView* view) { routes_ = view; }
    void setConfigService(IConfigService* svc) { config_ = svc; }

    IAudioSink* audioSink() override { return sink_; }
    ISourceRegistry* sourceRegistry() override { return registry_; }
    IRouteView* routeView() override { return routes_; }
    IConfigService* configService() override { return config_; }

    void log(LogLevel level, const QString& message) override;

private:
    IAudioSink* sink_ = nullptr;
    ISourceRegistry* registry_ = nullptr;
    IRouteView* routes_ = nullptr;
    IConfigService* config_ = nullptr;
};

} // namespace hrb
