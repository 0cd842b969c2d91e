#pragma once

#include <QString>

namespace hrb {

class IAudioSink;
class ISourceRegistry;
class IRouteView;
class IConfigService;

enum class LogLevel { Debug, Info, Warning, Error };

/// Everything a plugin may touch of its host. Any accessor may return
/// nullptr when the host runs without that service.
class IHostContext {
public:
    virtual ~IHostContext() = default;

    virtual IAudioSink* audioSink() = 0;
    virtual ISourceRegistry* sourceRegistry() = 0;
    virtual IRouteView* routeView() = 0;
    virtual IConfigService* configService() = 0;

    /// Log a message through the host's logging system.
    /// Thread-safe.
    virtual void log(LogLevel level, const QString& message) = 0;
};

} // namespace hrb
