#pragma once

#include <QList>
#include <QString>

namespace fnav {
namespace nav {

/// Outcome of one scheduler evaluation.
struct AnnouncementDecision {
    bool fired = false;
    int threshold = 0;      // ladder rung that fired (meters)
    QString prefix;         // "In 200 meters, "
    double marker = -1.0;   // last-spoken marker after this evaluation
};

/// Distance-ladder voice prompts ahead of a maneuver.
///
/// Rungs are checked largest first and only the first match fires, so a
/// position jump across several rungs yields a single prompt. A rung T
/// fires when distance < T and the last-spoken marker is unset or >= T.
/// After firing the marker is the distance at which the prompt was
/// spoken, not the rung itself.
///
/// The scheduler is stateless; callers own the marker.
class AnnouncementScheduler {
public:
    static constexpr double kMarkerUnset = -1.0;
    static constexpr int kDefaultKilometerCutoff = 500;

    static QList<int> defaultThresholds() { return {500, 200, 100, 50}; }

    explicit AnnouncementScheduler(const QList<int>& thresholds = defaultThresholds(),
                                   int kilometerCutoff = kDefaultKilometerCutoff);

    AnnouncementDecision evaluate(double distance, double lastSpokenMarker) const;

    /// Spoken lead-in for a rung: kilometres at or above the cutoff.
    QString prefixFor(int threshold) const;

    QList<int> thresholds() const { return thresholds_; }
    int kilometerCutoff() const { return kilometerCutoff_; }

private:
    QList<int> thresholds_;  // descending
    int kilometerCutoff_;
};

} // namespace nav
} // namespace fnav
