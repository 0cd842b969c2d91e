#pragma once

#include "core/lineup/Channel.hpp"
#include "core/plugin/IRouteView.hpp"
#include <QHash>
#include <QSet>
#include <QStringList>

namespace hrb {

/// What the reconciler drives. start() receives the channel so the
/// implementation can register a source under its display name.
class IStreamControl {
public:
    virtual ~IStreamControl() = default;

    virtual bool start(const Channel& channel) = 0;
    virtual void stop(const QString& tag) = 0;
    virtual QStringList runningTags() const = 0;
};

/// Converges running sessions onto the set of channels the host routes.
class RouteReconciler {
public:
    struct Outcome {
        QStringList started;
        QStringList stopped;
        QStringList failed;

        bool changed() const { return !started.isEmpty() || !stopped.isEmpty(); }
    };

    explicit RouteReconciler(IStreamControl* control);

    /// Tags wanted by enabled routes. A source naming a known tag matches
    /// directly; otherwise it is looked up by display name. Names shared by
    /// several channels cannot be resolved and are skipped.
    QSet<QString> activeTags(const QList<ActiveRoute>& routes, const ChannelList& channels);

    /// Start what is wanted but not running, stop what runs but is no longer
    /// wanted. A second call with the same input issues no start or stop.
    Outcome reconcile(const QList<ActiveRoute>& routes, const ChannelList& channels);

private:
    IStreamControl* control_;
    QSet<QString> warnedAmbiguous_;
    QSet<QString> warnedUnknown_;
};

} // namespace hrb
