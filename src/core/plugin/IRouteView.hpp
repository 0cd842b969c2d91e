#pragma once

#include <QList>
#include <QString>

namespace hrb {

/// A route as reported by the host. source is either a channel tag or the
/// display name the host was given at registration.
struct ActiveRoute {
    QString source;
    bool enabled = true;
};

class IRouteView {
public:
    virtual ~IRouteView() = default;

    /// Latest known routes. false means the view is unavailable right now and
    /// out is left untouched; callers treat that as "no change".
    virtual bool activeRoutes(QList<ActiveRoute>& out) = 0;
};

} // namespace hrb
