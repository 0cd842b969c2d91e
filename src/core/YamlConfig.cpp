#include "core/YamlConfig.hpp"
#include "core/stream/DecoderCommand.hpp"
#include <fstream>

namespace hrb {

namespace {

// Deep merge: mappings recurse, sequences and scalars from the overlay
// replace the base, keys missing in the overlay keep their defaults.
YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (base.IsMap() && overlay.IsMap()) {
        YAML::Node result = YAML::Clone(base);
        for (auto it = overlay.begin(); it != overlay.end(); ++it) {
            const auto key = it->first.as<std::string>();
            if (result[key])
                result[key] = mergeYaml(result[key], it->second);
            else
                result[key] = YAML::Clone(it->second);
        }
        return result;
    }
    return YAML::Clone(overlay);
}

YAML::Node toSequence(const QStringList& values)
{
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const auto& v : values)
        seq.push_back(v.toStdString());
    return seq;
}

QVariant yamlScalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const std::string s = node.Scalar();

    if (s == "true") return QVariant(true);
    if (s == "false") return QVariant(false);

    bool intOk = false;
    int i = QString::fromStdString(s).toInt(&intOk);
    if (intOk) return QVariant(i);

    bool dblOk = false;
    double d = QString::fromStdString(s).toDouble(&dblOk);
    if (dblOk) return QVariant(d);

    return QVariant(QString::fromStdString(s));
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["logging"]["level"] = "info";

    root_["discovery"]["mdns_timeout_s"] = 10;
    root_["discovery"]["broadcast_timeout_s"] = 3;
    root_["discovery"]["broadcast_port"] = 65001;
    root_["discovery"]["probe_timeout_ms"] = 2000;
    root_["discovery"]["probe_port"] = 80;
    root_["discovery"]["sweep_workers"] = 50;
    root_["discovery"]["interval_s"] = 300;
    root_["discovery"]["static_devices"] = YAML::Node(YAML::NodeType::Sequence);

    root_["lineup"]["refresh_interval_s"] = 3600;
    root_["lineup"]["timeout_ms"] = 5000;
    root_["lineup"]["include_all_channels"] = false;

    root_["decoder"]["program"] = "ffmpeg";
    root_["decoder"]["arguments"] = toSequence(DecoderCommand::defaultArguments());
    root_["decoder"]["show_output"] = false;
    root_["decoder"]["stop_grace_ms"] = 2000;

    root_["streaming"]["tick_ms"] = 20;
    root_["streaming"]["idle_tick_ms"] = 1000;
    root_["streaming"]["reconcile_interval_ms"] = 1000;
    root_["streaming"]["poll_wait_ms"] = 10;
    root_["streaming"]["fill_silence"] = false;

    root_["host"]["api_url"] = "http://127.0.0.1:8080";
    root_["host"]["route_poll_ms"] = 1000;
    root_["host"]["scream_address"] = "127.0.0.1";
    root_["host"]["scream_port"] = 16401;

    root_["ipc"]["socket_path"] = "/tmp/hdhr-radio-bridge.sock";
}

void YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeYaml(defaults, loaded);
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

int YamlConfig::intAt(const char* section, const char* key, int fallback) const
{
    try {
        return root_[section][key].as<int>(fallback);
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

bool YamlConfig::boolAt(const char* section, const char* key, bool fallback) const
{
    try {
        return root_[section][key].as<bool>(fallback);
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

QString YamlConfig::stringAt(const char* section, const char* key, const char* fallback) const
{
    try {
        return QString::fromStdString(root_[section][key].as<std::string>(fallback));
    } catch (const YAML::Exception&) {
        return QString::fromUtf8(fallback);
    }
}

QStringList YamlConfig::listAt(const char* section, const char* key) const
{
    QStringList result;
    try {
        const YAML::Node node = root_[section][key];
        if (!node.IsSequence()) return result;
        for (const auto& item : node) {
            if (item.IsScalar())
                result.append(QString::fromStdString(item.Scalar()));
        }
    } catch (const YAML::Exception&) {
        result.clear();
    }
    return result;
}

// --- Logging ---

QString YamlConfig::logLevel() const { return stringAt("logging", "level", "info"); }

// --- Discovery ---

int YamlConfig::mdnsTimeoutSec() const { return intAt("discovery", "mdns_timeout_s", 10); }
int YamlConfig::broadcastTimeoutSec() const { return intAt("discovery", "broadcast_timeout_s", 3); }

uint16_t YamlConfig::broadcastPort() const
{
    return static_cast<uint16_t>(intAt("discovery", "broadcast_port", 65001));
}

int YamlConfig::probeTimeoutMs() const { return intAt("discovery", "probe_timeout_ms", 2000); }
int YamlConfig::probePort() const { return intAt("discovery", "probe_port", 80); }
int YamlConfig::sweepWorkers() const { return intAt("discovery", "sweep_workers", 50); }
int YamlConfig::discoveryIntervalSec() const { return intAt("discovery", "interval_s", 300); }
QStringList YamlConfig::staticDevices() const { return listAt("discovery", "static_devices"); }

void YamlConfig::setStaticDevices(const QStringList& ips)
{
    root_["discovery"]["static_devices"] = toSequence(ips);
}

// --- Lineup ---

int YamlConfig::lineupRefreshIntervalSec() const { return intAt("lineup", "refresh_interval_s", 3600); }
int YamlConfig::lineupTimeoutMs() const { return intAt("lineup", "timeout_ms", 5000); }
bool YamlConfig::includeAllChannels() const { return boolAt("lineup", "include_all_channels", false); }

// --- Decoder ---

QString YamlConfig::decoderProgram() const { return stringAt("decoder", "program", "ffmpeg"); }

QStringList YamlConfig::decoderArguments() const
{
    QStringList args = listAt("decoder", "arguments");
    return args.isEmpty() ? DecoderCommand::defaultArguments() : args;
}

// --- Streaming loop ---

int YamlConfig::tickMs() const { return intAt("streaming", "tick_ms", 20); }
bool YamlConfig::fillSilence() const { return boolAt("streaming", "fill_silence", false); }
void YamlConfig::setFillSilence(bool v) { root_["streaming"]["fill_silence"] = v; }

// --- Host ---

QString YamlConfig::hostApiUrl() const { return stringAt("host", "api_url", "http://127.0.0.1:8080"); }
void YamlConfig::setHostApiUrl(const QString& v) { root_["host"]["api_url"] = v.toStdString(); }
int YamlConfig::routePollMs() const { return intAt("host", "route_poll_ms", 1000); }
QString YamlConfig::screamAddress() const { return stringAt("host", "scream_address", "127.0.0.1"); }

uint16_t YamlConfig::screamPort() const
{
    return static_cast<uint16_t>(intAt("host", "scream_port", 16401));
}

// --- Control socket ---

QString YamlConfig::ipcSocketPath() const
{
    return stringAt("ipc", "socket_path", "/tmp/hdhr-radio-bridge.sock");
}

// --- Generic dot-path access ---

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    const QStringList parts = dottedKey.split('.');

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : parts) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }

    if (node.IsSequence()) {
        QStringList items;
        for (const auto& item : node) {
            if (item.IsScalar())
                items.append(QString::fromStdString(item.Scalar()));
        }
        return items;
    }
    return yamlScalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Validate against the defaults tree, not the merged one
    bool isList = false;
    {
        YAML::Node defaults = buildDefaultsNode();
        for (const auto& part : parts) {
            if (!defaults.IsMap()) return false;
            defaults.reset(defaults[part.toStdString()]);
            if (!defaults.IsDefined()) return false;
        }
        if (defaults.IsMap()) return false;
        isList = defaults.IsSequence();
    }

    const bool valueIsList = value.typeId() == QMetaType::QStringList;
    if (isList != valueIsList) return false;

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i) {
        if (!node.IsMap()) return false;
        node.reset(node[parts[i].toStdString()]);
    }

    const std::string leafKey = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::QStringList:
        node[leafKey] = toSequence(value.toStringList());
        break;
    case QMetaType::Bool:
        node[leafKey] = value.toBool();
        break;
    case QMetaType::Int:
        node[leafKey] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leafKey] = value.toDouble();
        break;
    default:
        node[leafKey] = value.toString().toStdString();
        break;
    }

    return true;
}

} // namespace hrb
