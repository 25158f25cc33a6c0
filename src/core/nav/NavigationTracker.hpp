#pragma once

#include "AnnouncementScheduler.hpp"
#include "RouteTypes.hpp"
#include <QObject>

namespace fnav {

class ISpeechService;

namespace nav {

/// Mutable guidance state for the active route.
struct NavigationState {
    QList<Step> steps;
    int stepIndex = 0;
    double lastSpokenMarker = AnnouncementScheduler::kMarkerUnset;
    double distanceToManeuver = -1.0;  // -1 until the first position fix
};

/// Turn-by-turn state machine driven by position fixes.
///
/// Inactive -> Navigating when a route with at least one step is set; the
/// first instruction is spoken straight away. Each fix within the advance
/// radius of the current maneuver moves to the next step and speaks it,
/// pre-empting the distance ladder for that fix. Reaching the last
/// maneuver speaks the arrival prompt once and drops back to Inactive,
/// after which fixes are ignored until a new route is set.
///
/// Lives on the thread that delivers positions; not thread-safe.
class NavigationTracker : public QObject {
    Q_OBJECT
public:
    enum class State {
        Inactive,
        Navigating
    };
    Q_ENUM(State)

    static constexpr double kDefaultAdvanceRadius = 30.0;

    explicit NavigationTracker(QObject* parent = nullptr);

    /// Not owned; may be null (announcements are then only signalled).
    void setSpeechService(ISpeechService* speech) { speech_ = speech; }
    void setScheduler(const AnnouncementScheduler& scheduler) { scheduler_ = scheduler; }
    void setAdvanceRadius(double meters);

    /// Returns false (and leaves the tracker Inactive) for a route without steps.
    bool setRoute(const Route& route);
    void updatePosition(const GeoPoint& position);
    void stop();

    void setVoiceEnabled(bool enabled);
    bool voiceEnabled() const { return voiceEnabled_; }

    State state() const { return state_; }
    bool isNavigating() const { return state_ == State::Navigating; }
    int currentStepIndex() const { return nav_.stepIndex; }
    int stepCount() const { return nav_.steps.size(); }
    double lastSpokenMarker() const { return nav_.lastSpokenMarker; }
    double distanceToManeuver() const { return nav_.distanceToManeuver; }
    double advanceRadius() const { return advanceRadius_; }

    QString currentInstruction() const;
    QString currentLabel() const;
    /// Preview of the maneuver after the current one; empty at the last step.
    QString nextLabel() const;
    /// Distance to the current maneuver plus every remaining step; -1 without a fix.
    double remainingDistance() const;

signals:
    void stateChanged(fnav::nav::NavigationTracker::State state);
    void instructionChanged(int stepIndex, const QString& instruction);
    void announcement(const QString& text);
    void arrived();

private:
    void enterStep(int index, double distance = -1.0);
    void announce(const QString& text);
    void setState(State state);

    NavigationState nav_;
    State state_ = State::Inactive;
    AnnouncementScheduler scheduler_;
    ISpeechService* speech_ = nullptr;
    double advanceRadius_ = kDefaultAdvanceRadius;
    bool voiceEnabled_ = true;
};

} // namespace nav
} // namespace fnav
