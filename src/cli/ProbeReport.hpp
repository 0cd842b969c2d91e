#pragma once

#include "core/lineup/Channel.hpp"
#include <QString>

class QTextStream;

namespace hrb {

class YamlConfig;

namespace cli {

/// Channel table for one device: guide number, name and radio/TV type,
/// followed by the sources the bridge would expose for the radio entries.
QString formatLineupTable(const QString& deviceName, const ChannelList& channels);

/// One orchestrated discovery pass plus every found device's lineup.
/// Returns the process exit code (0 when at least one device was found).
int runDiscoveryReport(const YamlConfig& config, QTextStream& out);

/// Describe a single address and print its lineup.
/// Returns the process exit code (0 when a tuner answered).
int runProbeReport(const YamlConfig& config, const QString& ip, QTextStream& out);

} // namespace cli
} // namespace hrb
