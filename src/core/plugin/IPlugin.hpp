#pragma once

#include <QString>
#include <QStringList>

namespace hrb {

class IHostContext;

class IPlugin {
public:
    virtual ~IPlugin() = default;

    // Identity
    virtual QString id() const = 0;
    virtual QString name() const = 0;
    virtual QString version() const = 0;
    virtual int apiVersion() const = 0;

    /// Called once before any other call. Returning false leaves the plugin
    /// unusable; shutdown() is still safe to call.
    virtual bool initialize(IHostContext* context) = 0;

    /// Stop all work and release every external resource. Idempotent.
    virtual void shutdown() = 0;

    /// Host services the plugin cannot run without, by accessor name.
    virtual QStringList requiredServices() const = 0;
};

} // namespace hrb
