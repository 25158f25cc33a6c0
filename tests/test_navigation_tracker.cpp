#include <QTest>
#include <QSignalSpy>
#include <cmath>
#include "core/nav/NavigationTracker.hpp"
#include "core/nav/ManeuverFormatter.hpp"
#include "core/services/ISpeechService.hpp"

using fnav::nav::GeoPoint;
using fnav::nav::ManeuverType;
using fnav::nav::NavigationTracker;
using fnav::nav::Route;
using fnav::nav::Step;

namespace {

// Along a meridian the haversine distance is exactly R * dLat
constexpr double kMetersPerDegree = 6371000.0 * M_PI / 180.0;

GeoPoint north(const GeoPoint& p, double meters)
{
    return {p.lat + meters / kMetersPerDegree, p.lon};
}

Step makeStep(ManeuverType type, const QString& modifier, const QString& road,
              const GeoPoint& location, double distance = 0.0)
{
    Step s;
    s.type = type;
    s.rawType = fnav::nav::maneuverTypeName(type);
    s.modifier = modifier;
    s.roadName = road;
    s.location = location;
    s.distance = distance;
    return s;
}

Route makeRoute(const QList<Step>& steps)
{
    Route r;
    fnav::nav::Leg leg;
    leg.steps = steps;
    r.legs.append(leg);
    for (const auto& s : steps)
        r.distance += s.distance;
    return r;
}

class RecordingSpeech : public fnav::ISpeechService {
public:
    void requestSpeech(const QString& text) override { spoken.append(text); }
    QStringList spoken;
};

const GeoPoint kStart{52.0, 13.0};

// depart Main St -> turn right onto Oak Ave (1 km on) -> arrive on the right (600 m later)
Route threeStepRoute()
{
    const GeoPoint turn = north(kStart, 1000);
    const GeoPoint dest = north(turn, 600);
    return makeRoute({
        makeStep(ManeuverType::Depart, QString(), "Main St", kStart, 1000),
        makeStep(ManeuverType::Turn, "right", "Oak Ave", turn, 600),
        makeStep(ManeuverType::Arrive, "right", QString(), dest, 0),
    });
}

QStringList stringsFrom(const QSignalSpy& spy, int arg = 0)
{
    QStringList out;
    for (const auto& call : spy)
        out.append(call.at(arg).toString());
    return out;
}

} // namespace

class TestNavigationTracker : public QObject {
    Q_OBJECT
private slots:
    void startsInactive()
    {
        NavigationTracker tracker;
        QCOMPARE(tracker.state(), NavigationTracker::State::Inactive);
        QCOMPARE(tracker.stepCount(), 0);
        QVERIFY(tracker.currentInstruction().isEmpty());
        QVERIFY(tracker.nextLabel().isEmpty());
        QCOMPARE(tracker.remainingDistance(), -1.0);
    }

    void emptyRouteDoesNotStart()
    {
        NavigationTracker tracker;
        QSignalSpy stateSpy(&tracker, &NavigationTracker::stateChanged);
        QSignalSpy instrSpy(&tracker, &NavigationTracker::instructionChanged);

        QVERIFY(!tracker.setRoute(Route{}));

        Route legsWithoutSteps;
        legsWithoutSteps.legs.append(fnav::nav::Leg{});
        QVERIFY(!tracker.setRoute(legsWithoutSteps));

        QCOMPARE(tracker.state(), NavigationTracker::State::Inactive);
        QCOMPARE(stateSpy.count(), 0);
        QCOMPARE(instrSpy.count(), 0);
    }

    void setRouteSpeaksFirstInstructionOnce()
    {
        NavigationTracker tracker;
        RecordingSpeech speech;
        tracker.setSpeechService(&speech);
        QSignalSpy stateSpy(&tracker, &NavigationTracker::stateChanged);
        QSignalSpy instrSpy(&tracker, &NavigationTracker::instructionChanged);

        QVERIFY(tracker.setRoute(threeStepRoute()));

        QCOMPARE(tracker.state(), NavigationTracker::State::Navigating);
        QCOMPARE(stateSpy.count(), 1);
        QCOMPARE(tracker.currentStepIndex(), 0);
        QCOMPARE(tracker.lastSpokenMarker(), fnav::nav::AnnouncementScheduler::kMarkerUnset);
        QCOMPARE(instrSpy.count(), 1);
        QCOMPARE(instrSpy.at(0).at(0).toInt(), 0);
        QCOMPARE(speech.spoken, QStringList{"Start by heading forward on Main St"});
    }

    void advanceWithinRadiusPreemptsLadder()
    {
        const GeoPoint turn = north(kStart, 400);
        Route route = makeRoute({
            makeStep(ManeuverType::Depart, QString(), "Main St", kStart, 400),
            makeStep(ManeuverType::Turn, "left", "Oak Ave", turn),
        });

        NavigationTracker tracker;
        RecordingSpeech speech;
        tracker.setSpeechService(&speech);
        tracker.setRoute(route);
        speech.spoken.clear();

        QSignalSpy instrSpy(&tracker, &NavigationTracker::instructionChanged);
        QSignalSpy announceSpy(&tracker, &NavigationTracker::announcement);

        // 10 m from the depart point, 390 m from the turn: both the advance
        // rule and the 500 m rung would apply, only the advance may speak
        tracker.updatePosition(north(kStart, 10));

        QCOMPARE(tracker.currentStepIndex(), 1);
        QCOMPARE(instrSpy.count(), 1);
        QCOMPARE(announceSpy.count(), 1);
        QCOMPARE(announceSpy.at(0).at(0).toString(), QString("Turn left onto Oak Ave"));
        QCOMPARE(speech.spoken, QStringList{"Turn left onto Oak Ave"});
        QCOMPARE(tracker.lastSpokenMarker(), fnav::nav::AnnouncementScheduler::kMarkerUnset);
        QVERIFY(qAbs(tracker.distanceToManeuver() - 390.0) < 0.01);
    }

    void endToEndGuidance()
    {
        NavigationTracker tracker;
        RecordingSpeech speech;
        tracker.setSpeechService(&speech);
        QSignalSpy instrSpy(&tracker, &NavigationTracker::instructionChanged);
        QSignalSpy arrivedSpy(&tracker, &NavigationTracker::arrived);

        QVERIFY(tracker.setRoute(threeStepRoute()));
        const GeoPoint turn = north(kStart, 1000);

        tracker.updatePosition(kStart);             // at depart -> step 1
        tracker.updatePosition(north(kStart, 300)); // 700 m to turn
        tracker.updatePosition(north(kStart, 520)); // 480 m
        tracker.updatePosition(north(kStart, 550)); // 450 m
        tracker.updatePosition(north(kStart, 810)); // 190 m
        tracker.updatePosition(north(kStart, 920)); // 80 m
        tracker.updatePosition(north(kStart, 960)); // 40 m
        tracker.updatePosition(north(kStart, 990)); // 10 m -> step 2
        QCOMPARE(tracker.currentStepIndex(), 2);
        tracker.updatePosition(north(turn, 150));   // 450 m to destination
        tracker.updatePosition(north(turn, 590));   // 10 m -> arrived

        const QStringList expected = {
            "Start by heading forward on Main St",
            "Turn right onto Oak Ave",
            "In 0.5 kilometers, Turn right onto Oak Ave",
            "In 200 meters, Turn right onto Oak Ave",
            "In 100 meters, Turn right onto Oak Ave",
            "In 50 meters, Turn right onto Oak Ave",
            "Your destination is on the right",
            "In 0.5 kilometers, Your destination is on the right",
            "You have arrived at your destination",
        };
        QCOMPARE(speech.spoken, expected);

        QCOMPARE(instrSpy.count(), 3);
        QCOMPARE(stringsFrom(instrSpy, 1), (QStringList{
            "Start by heading forward on Main St",
            "Turn right onto Oak Ave",
            "Your destination is on the right",
        }));
        QCOMPARE(arrivedSpy.count(), 1);
        QCOMPARE(tracker.state(), NavigationTracker::State::Inactive);
    }

    void arrivalIsTerminalUntilNewRoute()
    {
        NavigationTracker tracker;
        RecordingSpeech speech;
        tracker.setSpeechService(&speech);

        const GeoPoint dest = north(kStart, 200);
        tracker.setRoute(makeRoute({
            makeStep(ManeuverType::Depart, "straight", QString(), kStart, 200),
            makeStep(ManeuverType::Arrive, QString(), QString(), dest),
        }));
        tracker.updatePosition(kStart);
        tracker.updatePosition(north(dest, -5));

        QCOMPARE(tracker.state(), NavigationTracker::State::Inactive);
        QCOMPARE(speech.spoken.count(fnav::nav::kArrivedText), 2);  // arrive step + final prompt
        QCOMPARE(speech.spoken.last(), fnav::nav::kArrivedText);

        QSignalSpy instrSpy(&tracker, &NavigationTracker::instructionChanged);
        QSignalSpy announceSpy(&tracker, &NavigationTracker::announcement);
        QSignalSpy arrivedSpy(&tracker, &NavigationTracker::arrived);
        tracker.updatePosition(dest);
        tracker.updatePosition(north(dest, -300));
        QCOMPARE(instrSpy.count(), 0);
        QCOMPARE(announceSpy.count(), 0);
        QCOMPARE(arrivedSpy.count(), 0);
        QCOMPARE(tracker.stepCount(), 0);

        QVERIFY(tracker.setRoute(threeStepRoute()));
        QCOMPARE(tracker.state(), NavigationTracker::State::Navigating);
        QCOMPARE(instrSpy.count(), 1);
    }

    void singleStepRouteArrivesOnFirstFix()
    {
        NavigationTracker tracker;
        QSignalSpy announceSpy(&tracker, &NavigationTracker::announcement);
        QSignalSpy arrivedSpy(&tracker, &NavigationTracker::arrived);

        tracker.setRoute(makeRoute({makeStep(ManeuverType::Arrive, "left", QString(), kStart)}));
        tracker.updatePosition(north(kStart, 3));

        QCOMPARE(arrivedSpy.count(), 1);
        QCOMPARE(stringsFrom(announceSpy), (QStringList{
            "Your destination is on the left",
            fnav::nav::kArrivedText,
        }));
        QCOMPARE(tracker.state(), NavigationTracker::State::Inactive);
    }

    void stepIndexNeverDecreases()
    {
        NavigationTracker tracker;
        tracker.setRoute(threeStepRoute());
        tracker.updatePosition(kStart);
        QCOMPARE(tracker.currentStepIndex(), 1);

        // Driving back to the start must not rewind guidance
        tracker.updatePosition(kStart);
        tracker.updatePosition(north(kStart, 5));
        QCOMPARE(tracker.currentStepIndex(), 1);
    }

    void voiceDisabledStillTracksMarker()
    {
        NavigationTracker tracker;
        RecordingSpeech speech;
        tracker.setSpeechService(&speech);
        tracker.setVoiceEnabled(false);
        QSignalSpy announceSpy(&tracker, &NavigationTracker::announcement);

        tracker.setRoute(threeStepRoute());
        tracker.updatePosition(kStart);
        tracker.updatePosition(north(kStart, 520));  // 480 m to the turn

        QCOMPARE(announceSpy.count(), 0);
        QVERIFY(speech.spoken.isEmpty());
        QCOMPARE(tracker.currentStepIndex(), 1);
        QVERIFY(qAbs(tracker.lastSpokenMarker() - 480.0) < 0.01);

        // Re-enabling does not replay the rung that already fired silently
        tracker.setVoiceEnabled(true);
        tracker.updatePosition(north(kStart, 550));
        QCOMPARE(announceSpy.count(), 0);
        tracker.updatePosition(north(kStart, 810));
        QCOMPARE(announceSpy.count(), 1);
        QCOMPARE(announceSpy.at(0).at(0).toString(), QString("In 200 meters, Turn right onto Oak Ave"));
    }

    void stopClearsEverything()
    {
        NavigationTracker tracker;
        tracker.setRoute(threeStepRoute());
        tracker.updatePosition(kStart);
        tracker.updatePosition(north(kStart, 520));

        QSignalSpy stateSpy(&tracker, &NavigationTracker::stateChanged);
        tracker.stop();

        QCOMPARE(stateSpy.count(), 1);
        QCOMPARE(tracker.state(), NavigationTracker::State::Inactive);
        QCOMPARE(tracker.stepCount(), 0);
        QCOMPARE(tracker.currentStepIndex(), 0);
        QCOMPARE(tracker.lastSpokenMarker(), fnav::nav::AnnouncementScheduler::kMarkerUnset);
        QVERIFY(tracker.currentInstruction().isEmpty());
        QVERIFY(tracker.currentLabel().isEmpty());

        QSignalSpy announceSpy(&tracker, &NavigationTracker::announcement);
        tracker.updatePosition(north(kStart, 1000));
        QCOMPARE(announceSpy.count(), 0);
    }

    void newRouteReplacesActiveRoute()
    {
        NavigationTracker tracker;
        tracker.setRoute(threeStepRoute());
        tracker.updatePosition(kStart);
        tracker.updatePosition(north(kStart, 520));
        QCOMPARE(tracker.currentStepIndex(), 1);

        QSignalSpy stateSpy(&tracker, &NavigationTracker::stateChanged);
        const GeoPoint other{48.0, 11.0};
        QVERIFY(tracker.setRoute(makeRoute({
            makeStep(ManeuverType::Depart, "left", "Ring Rd", other),
            makeStep(ManeuverType::Arrive, QString(), QString(), north(other, 100)),
        })));

        QCOMPARE(stateSpy.count(), 0);  // still navigating
        QCOMPARE(tracker.currentStepIndex(), 0);
        QCOMPARE(tracker.stepCount(), 2);
        QCOMPARE(tracker.lastSpokenMarker(), fnav::nav::AnnouncementScheduler::kMarkerUnset);
        QCOMPARE(tracker.currentInstruction(), QString("Start by heading left on Ring Rd"));

        // An empty replacement ends navigation
        QVERIFY(!tracker.setRoute(Route{}));
        QCOMPARE(tracker.state(), NavigationTracker::State::Inactive);
    }

    void labelsAndRemainingDistance()
    {
        NavigationTracker tracker;
        tracker.setRoute(threeStepRoute());
        QCOMPARE(tracker.currentLabel(), fnav::nav::kGlyphStraight + " Depart");
        QCOMPARE(tracker.nextLabel(), fnav::nav::kGlyphRight + " Turn right");

        tracker.updatePosition(kStart);
        tracker.updatePosition(north(kStart, 300));
        QCOMPARE(tracker.currentLabel(), fnav::nav::kGlyphRight + " Turn right");
        QCOMPARE(tracker.nextLabel(), fnav::nav::kGlyphArrive + " Arrive");

        // 700 m to the turn, then the 600 m turn step, then the 0 m arrive step
        QVERIFY(qAbs(tracker.distanceToManeuver() - 700.0) < 0.01);
        QVERIFY(qAbs(tracker.remainingDistance() - 1300.0) < 0.01);

        tracker.updatePosition(north(kStart, 995));
        QVERIFY(tracker.nextLabel().isEmpty());
    }

    void customAdvanceRadius()
    {
        NavigationTracker tracker;
        tracker.setAdvanceRadius(100);
        tracker.setAdvanceRadius(-5);  // ignored
        QCOMPARE(tracker.advanceRadius(), 100.0);

        tracker.setRoute(threeStepRoute());
        tracker.updatePosition(north(kStart, 80));
        QCOMPARE(tracker.currentStepIndex(), 1);
    }

    void customLadder()
    {
        NavigationTracker tracker;
        tracker.setScheduler(fnav::nav::AnnouncementScheduler({1500, 300}, 1000));
        QSignalSpy announceSpy(&tracker, &NavigationTracker::announcement);

        const GeoPoint turn = north(kStart, 2000);
        tracker.setRoute(makeRoute({
            makeStep(ManeuverType::Depart, QString(), QString(), kStart, 2000),
            makeStep(ManeuverType::Turn, "sharp left", QString(), turn),
            makeStep(ManeuverType::Arrive, QString(), QString(), north(turn, 500)),
        }));
        tracker.updatePosition(kStart);
        tracker.updatePosition(north(kStart, 600));   // 1400 m
        tracker.updatePosition(north(kStart, 1750));  // 250 m

        QCOMPARE(stringsFrom(announceSpy), (QStringList{
            "Start by heading forward",
            "Turn sharp left",
            "In 1.5 kilometers, Turn sharp left",
            "In 300 meters, Turn sharp left",
        }));
    }
};

QTEST_MAIN(TestNavigationTracker)
#include "test_navigation_tracker.moc"
