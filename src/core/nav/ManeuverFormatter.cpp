#include "ManeuverFormatter.hpp"
#include <cmath>

namespace fnav {
namespace nav {

namespace {

QString capitalized(const QString& s)
{
    if (s.isEmpty()) return s;
    return s.at(0).toUpper() + s.mid(1);
}

// " on Main St" / " onto Main St", or nothing when the road is unnamed
QString roadClause(const char* preposition, const QString& road)
{
    if (road.isEmpty()) return {};
    return QStringLiteral(" %1 %2").arg(QLatin1String(preposition), road);
}

bool isKeepManeuver(ManeuverType type)
{
    return type == ManeuverType::Fork || type == ManeuverType::Merge
        || type == ManeuverType::OnRamp || type == ManeuverType::OffRamp;
}

QString instructionFor(const Step& step)
{
    const QString& modifier = step.modifier;
    const QString road = step.roadName.trimmed();

    switch (step.type) {
    case ManeuverType::Depart:
        return QStringLiteral("Start by heading ")
               + (modifier.isEmpty() ? QStringLiteral("forward") : modifier)
               + roadClause("on", road);

    case ManeuverType::Arrive:
        if (modifier.contains(QLatin1String("left")))
            return QStringLiteral("Your destination is on the left");
        if (modifier.contains(QLatin1String("right")))
            return QStringLiteral("Your destination is on the right");
        return kArrivedText;

    case ManeuverType::Turn:
        return QStringLiteral("Turn ") + modifier + roadClause("onto", road);

    case ManeuverType::Merge:
        return QStringLiteral("Merge ") + modifier + roadClause("onto", road);

    case ManeuverType::OnRamp:
    case ManeuverType::OffRamp:
        return QStringLiteral("Take the ramp ") + modifier;

    case ManeuverType::Fork:
        return QStringLiteral("Keep %1 at the fork").arg(modifier);

    case ManeuverType::EndOfRoad:
        return QStringLiteral("At the end of the road, turn ") + modifier;

    case ManeuverType::Continue:
        return QStringLiteral("Continue ")
               + (modifier.isEmpty() ? QStringLiteral("straight") : modifier)
               + roadClause("on", road);

    case ManeuverType::Roundabout:
    case ManeuverType::Rotary:
        return QStringLiteral("At the %1, take exit %2")
            .arg(step.type == ManeuverType::Rotary ? QStringLiteral("rotary")
                                                   : QStringLiteral("roundabout"))
            .arg(step.exit > 0 ? step.exit : 1);

    case ManeuverType::NewName:
        return QStringLiteral("Continue onto ")
               + (road.isEmpty() ? QStringLiteral("the road") : road);

    case ManeuverType::Notification:
        return step.instruction;

    case ManeuverType::Other:
        break;
    }

    if (modifier.isEmpty())
        return QStringLiteral("Continue");
    return capitalized(modifier) + roadClause("on", road);
}

} // namespace

QString spokenInstruction(const Step& step)
{
    // Collapses the gaps an empty modifier leaves behind ("Turn  onto")
    return instructionFor(step).simplified();
}

QString shortLabel(const Step& step)
{
    const QString& modifier = step.modifier;

    if (step.type == ManeuverType::Arrive)
        return kGlyphArrive + QStringLiteral(" Arrive");

    if (step.type == ManeuverType::Roundabout || step.type == ManeuverType::Rotary)
        return kGlyphRoundabout + QStringLiteral(" Exit %1").arg(step.exit > 0 ? step.exit : 1);

    if (modifier.contains(QLatin1String("uturn")))
        return kGlyphUTurn + QStringLiteral(" U-turn");

    const QString verb = isKeepManeuver(step.type) ? QStringLiteral("Keep") : QStringLiteral("Turn");
    if (modifier.contains(QLatin1String("left")))
        return kGlyphLeft + QLatin1Char(' ') + verb + QStringLiteral(" left");
    if (modifier.contains(QLatin1String("right")))
        return kGlyphRight + QLatin1Char(' ') + verb + QStringLiteral(" right");

    if (step.type == ManeuverType::Depart)
        return kGlyphStraight + QStringLiteral(" Depart");
    return kGlyphStraight + QStringLiteral(" Continue");
}

QString formatDistance(double meters)
{
    if (!std::isfinite(meters) || meters < 0)
        meters = 0;

    const long rounded = meters >= 100 ? std::lround(meters / 10.0) * 10 : std::lround(meters);
    if (rounded >= 1000)
        return QStringLiteral("%1 km").arg(meters / 1000.0, 0, 'f', 1);
    return QStringLiteral("%1 m").arg(rounded);
}

QString formatDuration(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0)
        seconds = 0;

    int totalMinutes = static_cast<int>(std::lround(seconds / 60.0));
    if (totalMinutes < 1)
        totalMinutes = 1;

    if (totalMinutes < 60)
        return QStringLiteral("%1 min").arg(totalMinutes);
    return QStringLiteral("%1 h %2 min").arg(totalMinutes / 60).arg(totalMinutes % 60);
}

} // namespace nav
} // namespace fnav
