#pragma once

#include <QString>

namespace hrb {

/// Radio heuristic: a guide number whose part before '-' parses into the
/// FM band [88.0, 108.0], or a guide name containing a radio keyword
/// (case-insensitive substring).
bool isLikelyRadio(const QString& guideNumber, const QString& guideName);

/// "hdhomerun_<ip>_<guideNumber>" with every '.' replaced by '_'.
/// Deterministic, and distinct for distinct (ip, guideNumber) pairs of
/// dotted-decimal addresses.
QString tagFor(const QString& deviceIp, const QString& guideNumber);

/// "HDHomeRun [<deviceName>]: <guideName> (<guideNumber>)"
QString displayNameFor(const QString& deviceName, const QString& guideName,
                       const QString& guideNumber);

} // namespace hrb
