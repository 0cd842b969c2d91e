#pragma once

#include <QString>

namespace hrb {

struct SourceDescriptor {
    QString name;   // shown to the user by the host
    QString tag;    // stable channel tag
};

/// Host-side registry of temporary audio sources. A source exists only while
/// its channel is being decoded.
class ISourceRegistry {
public:
    virtual ~ISourceRegistry() = default;

    /// Returns the host's instance id, or an empty string on failure.
    virtual QString registerSource(const SourceDescriptor& source) = 0;

    /// Unknown ids are ignored.
    virtual void unregisterSource(const QString& instanceId) = 0;
};

} // namespace hrb
