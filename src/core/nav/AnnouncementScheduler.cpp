#include "AnnouncementScheduler.hpp"
#include <algorithm>
#include <functional>
#include <boost/log/trivial.hpp>

namespace fnav {
namespace nav {

AnnouncementScheduler::AnnouncementScheduler(const QList<int>& thresholds, int kilometerCutoff)
    : kilometerCutoff_(kilometerCutoff > 0 ? kilometerCutoff : kDefaultKilometerCutoff)
{
    for (int t : thresholds) {
        if (t > 0 && !thresholds_.contains(t))
            thresholds_.append(t);
    }
    if (thresholds_.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[AnnouncementScheduler] No usable thresholds, using defaults";
        thresholds_ = defaultThresholds();
    }
    std::sort(thresholds_.begin(), thresholds_.end(), std::greater<int>());
}

AnnouncementDecision AnnouncementScheduler::evaluate(double distance, double lastSpokenMarker) const
{
    AnnouncementDecision decision;
    decision.marker = lastSpokenMarker;

    const bool markerUnset = lastSpokenMarker < 0;
    for (int t : thresholds_) {
        if (distance < t && (markerUnset || lastSpokenMarker >= t)) {
            decision.fired = true;
            decision.threshold = t;
            decision.prefix = prefixFor(t);
            decision.marker = distance;
            break;
        }
    }
    return decision;
}

QString AnnouncementScheduler::prefixFor(int threshold) const
{
    if (threshold >= kilometerCutoff_)
        return QStringLiteral("In %1 kilometers, ").arg(threshold / 1000.0, 0, 'f', 1);
    return QStringLiteral("In %1 meters, ").arg(threshold);
}

} // namespace nav
} // namespace fnav
