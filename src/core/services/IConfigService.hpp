#pragma once

#include <QString>
#include <QVariant>

namespace hrb {

class IConfigService {
public:
    virtual ~IConfigService() = default;

    /// Read a config value by dot-notation key (e.g. "decoder.program").
    /// Lists come back as QStringList. Returns invalid QVariant if key not found.
    virtual QVariant value(const QString& key) const = 0;

    /// Write a config value. Keys outside the defaults schema are rejected.
    /// Must be called from the main thread (single-writer rule).
    virtual bool setValue(const QString& key, const QVariant& value) = 0;

    /// Flush config to disk.
    /// Must be called from the main thread.
    virtual void save() = 0;
};

} // namespace hrb
