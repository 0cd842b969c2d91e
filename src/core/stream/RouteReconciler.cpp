#include "RouteReconciler.hpp"
#include <boost/log/trivial.hpp>

namespace hrb {

RouteReconciler::RouteReconciler(IStreamControl* control)
    : control_(control)
{
}

QSet<QString> RouteReconciler::activeTags(const QList<ActiveRoute>& routes,
                                          const ChannelList& channels)
{
    QSet<QString> knownTags;
    QHash<QString, QString> tagByName;
    QSet<QString> ambiguousNames;
    for (const auto& channel : channels) {
        knownTags.insert(channel.tag);
        if (tagByName.contains(channel.displayName) && tagByName.value(channel.displayName) != channel.tag)
            ambiguousNames.insert(channel.displayName);
        else
            tagByName.insert(channel.displayName, channel.tag);
    }

    QSet<QString> active;
    for (const auto& route : routes) {
        if (!route.enabled || route.source.isEmpty()) continue;

        if (knownTags.contains(route.source)) {
            active.insert(route.source);
            continue;
        }

        if (ambiguousNames.contains(route.source)) {
            if (!warnedAmbiguous_.contains(route.source)) {
                warnedAmbiguous_.insert(route.source);
                BOOST_LOG_TRIVIAL(warning) << "[Reconciler] Route source \"" << route.source.toStdString()
                                           << "\" matches several channels, ignoring it";
            }
            continue;
        }

        auto it = tagByName.constFind(route.source);
        if (it != tagByName.cend()) {
            active.insert(it.value());
        } else if (route.source.startsWith(QLatin1String("hdhomerun_"))
                   && !warnedUnknown_.contains(route.source)) {
            warnedUnknown_.insert(route.source);
            BOOST_LOG_TRIVIAL(debug) << "[Reconciler] No channel for routed tag "
                                     << route.source.toStdString();
        }
    }
    return active;
}

RouteReconciler::Outcome RouteReconciler::reconcile(const QList<ActiveRoute>& routes,
                                                    const ChannelList& channels)
{
    Outcome outcome;
    const QSet<QString> wanted = activeTags(routes, channels);

    const QStringList runningList = control_->runningTags();
    const QSet<QString> running(runningList.cbegin(), runningList.cend());

    for (const auto& tag : runningList) {
        if (wanted.contains(tag)) continue;
        control_->stop(tag);
        outcome.stopped.append(tag);
    }

    for (const auto& channel : channels) {
        if (!wanted.contains(channel.tag) || running.contains(channel.tag)) continue;
        if (outcome.started.contains(channel.tag) || outcome.failed.contains(channel.tag)) continue;

        if (control_->start(channel))
            outcome.started.append(channel.tag);
        else
            outcome.failed.append(channel.tag);
    }

    if (outcome.changed()) {
        BOOST_LOG_TRIVIAL(info) << "[Reconciler] " << wanted.size() << " active, started "
                                << outcome.started.size() << ", stopped " << outcome.stopped.size();
    }
    for (const auto& tag : outcome.failed)
        BOOST_LOG_TRIVIAL(warning) << "[Reconciler] Could not start " << tag.toStdString()
                                   << ", retrying next tick";

    return outcome;
}

} // namespace hrb
