#include "NavigationTracker.hpp"
#include "GeoDistance.hpp"
#include "ManeuverFormatter.hpp"
#include "core/services/ISpeechService.hpp"
#include <boost/log/trivial.hpp>

namespace fnav {
namespace nav {

NavigationTracker::NavigationTracker(QObject* parent)
    : QObject(parent)
{
}

void NavigationTracker::setAdvanceRadius(double meters)
{
    if (meters <= 0) {
        BOOST_LOG_TRIVIAL(warning) << "[NavigationTracker] Ignoring advance radius " << meters
                                   << ", keeping " << advanceRadius_;
        return;
    }
    advanceRadius_ = meters;
}

bool NavigationTracker::setRoute(const Route& route)
{
    const QList<Step> steps = route.steps();
    if (steps.isEmpty()) {
        BOOST_LOG_TRIVIAL(info) << "[NavigationTracker] Route has no steps, not navigating";
        stop();
        return false;
    }

    nav_ = NavigationState{};
    nav_.steps = steps;

    BOOST_LOG_TRIVIAL(info) << "[NavigationTracker] Starting navigation: " << steps.size()
                            << " steps, " << route.distance << " m";

    setState(State::Navigating);
    enterStep(0);
    return true;
}

void NavigationTracker::updatePosition(const GeoPoint& position)
{
    if (state_ != State::Navigating)
        return;

    const Step& target = nav_.steps.at(nav_.stepIndex);
    const double distance = distanceMeters(position, target.location);
    nav_.distanceToManeuver = distance;

    if (distance < advanceRadius_) {
        const int next = nav_.stepIndex + 1;
        if (next < nav_.steps.size()) {
            enterStep(next, distanceMeters(position, nav_.steps.at(next).location));
            return;
        }

        BOOST_LOG_TRIVIAL(info) << "[NavigationTracker] Arrived at destination";
        announce(kArrivedText);
        emit arrived();
        stop();
        return;
    }

    const AnnouncementDecision decision = scheduler_.evaluate(distance, nav_.lastSpokenMarker);
    if (!decision.fired)
        return;

    nav_.lastSpokenMarker = decision.marker;
    BOOST_LOG_TRIVIAL(debug) << "[NavigationTracker] " << decision.threshold
                             << " m prompt at " << distance << " m";
    announce(decision.prefix + currentInstruction());
}

void NavigationTracker::stop()
{
    nav_ = NavigationState{};
    setState(State::Inactive);
}

void NavigationTracker::setVoiceEnabled(bool enabled)
{
    if (voiceEnabled_ == enabled) return;
    voiceEnabled_ = enabled;
    BOOST_LOG_TRIVIAL(info) << "[NavigationTracker] Voice guidance " << (enabled ? "on" : "off");
}

QString NavigationTracker::currentInstruction() const
{
    if (state_ != State::Navigating) return {};
    return spokenInstruction(nav_.steps.at(nav_.stepIndex));
}

QString NavigationTracker::currentLabel() const
{
    if (state_ != State::Navigating) return {};
    return shortLabel(nav_.steps.at(nav_.stepIndex));
}

QString NavigationTracker::nextLabel() const
{
    if (state_ != State::Navigating) return {};
    const int next = nav_.stepIndex + 1;
    if (next >= nav_.steps.size()) return {};
    return shortLabel(nav_.steps.at(next));
}

double NavigationTracker::remainingDistance() const
{
    if (state_ != State::Navigating || nav_.distanceToManeuver < 0)
        return -1.0;

    double total = nav_.distanceToManeuver;
    for (int i = nav_.stepIndex; i < nav_.steps.size(); ++i)
        total += nav_.steps.at(i).distance;
    return total;
}

void NavigationTracker::enterStep(int index, double distance)
{
    nav_.stepIndex = index;
    nav_.lastSpokenMarker = AnnouncementScheduler::kMarkerUnset;
    nav_.distanceToManeuver = distance;

    const QString instruction = currentInstruction();
    BOOST_LOG_TRIVIAL(info) << "[NavigationTracker] Step " << (index + 1) << "/" << nav_.steps.size()
                            << ": " << instruction.toStdString();
    emit instructionChanged(index, instruction);
    announce(instruction);
}

void NavigationTracker::announce(const QString& text)
{
    if (!voiceEnabled_ || text.isEmpty())
        return;

    emit announcement(text);
    if (speech_)
        speech_->requestSpeech(text);
}

void NavigationTracker::setState(State state)
{
    if (state_ == state) return;
    state_ = state;
    emit stateChanged(state);
}

} // namespace nav
} // namespace fnav
