#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace hrb {

/// Bridge configuration backed by a single YAML tree. Built-in defaults are
/// always present; a loaded file is deep-merged over them.
class YamlConfig {
public:
    YamlConfig();

    /// Throws YAML::Exception when the file cannot be read or parsed.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Logging
    QString logLevel() const;

    // Discovery
    int mdnsTimeoutSec() const;
    int broadcastTimeoutSec() const;
    uint16_t broadcastPort() const;
    int probeTimeoutMs() const;
    int probePort() const;
    int sweepWorkers() const;
    int discoveryIntervalSec() const;
    QStringList staticDevices() const;
    void setStaticDevices(const QStringList& ips);

    // Lineup
    int lineupRefreshIntervalSec() const;
    int lineupTimeoutMs() const;
    bool includeAllChannels() const;

    // Decoder
    QString decoderProgram() const;
    QStringList decoderArguments() const;

    // Streaming loop
    int tickMs() const;
    bool fillSilence() const;
    void setFillSilence(bool v);

    // Host
    QString hostApiUrl() const;
    void setHostApiUrl(const QString& v);
    int routePollMs() const;
    QString screamAddress() const;
    uint16_t screamPort() const;

    // Control socket
    QString ipcSocketPath() const;

    /// Generic dot-path access (e.g. "decoder.program"). Sequences of scalars
    /// come back as QStringList, maps as invalid QVariant.
    QVariant valueByPath(const QString& dottedKey) const;

    /// Only keys present in the defaults schema can be written, and only
    /// with the same shape (scalar or list).
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;  // single source of truth

    void initDefaults();
    static YAML::Node buildDefaultsNode();

    int intAt(const char* section, const char* key, int fallback) const;
    bool boolAt(const char* section, const char* key, bool fallback) const;
    QString stringAt(const char* section, const char* key, const char* fallback) const;
    QStringList listAt(const char* section, const char* key) const;
};

} // namespace hrb
