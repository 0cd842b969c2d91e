#pragma once

#include <QString>

namespace hrb {

/// Set the minimum severity passed by Boost.Log's core.
/// Accepts trace, debug, info, warning, error (case-insensitive).
/// Unknown names leave the filter unchanged and return false.
bool applyLogLevel(const QString& level);

} // namespace hrb
