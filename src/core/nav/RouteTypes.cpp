#include "RouteTypes.hpp"

namespace fnav {
namespace nav {

ManeuverType maneuverTypeFromString(const QString& raw)
{
    if (raw == QLatin1String("depart")) return ManeuverType::Depart;
    if (raw == QLatin1String("arrive")) return ManeuverType::Arrive;
    if (raw == QLatin1String("turn")) return ManeuverType::Turn;
    if (raw == QLatin1String("merge")) return ManeuverType::Merge;
    if (raw == QLatin1String("on ramp")) return ManeuverType::OnRamp;
    if (raw == QLatin1String("off ramp")) return ManeuverType::OffRamp;
    if (raw == QLatin1String("fork")) return ManeuverType::Fork;
    if (raw == QLatin1String("end of road")) return ManeuverType::EndOfRoad;
    if (raw == QLatin1String("continue")) return ManeuverType::Continue;
    if (raw == QLatin1String("roundabout")
        || raw == QLatin1String("exit roundabout")
        || raw == QLatin1String("roundabout turn"))
        return ManeuverType::Roundabout;
    if (raw == QLatin1String("rotary") || raw == QLatin1String("exit rotary"))
        return ManeuverType::Rotary;
    if (raw == QLatin1String("new name")) return ManeuverType::NewName;
    if (raw == QLatin1String("notification")) return ManeuverType::Notification;
    return ManeuverType::Other;
}

QString maneuverTypeName(ManeuverType type)
{
    switch (type) {
    case ManeuverType::Depart: return QStringLiteral("depart");
    case ManeuverType::Arrive: return QStringLiteral("arrive");
    case ManeuverType::Turn: return QStringLiteral("turn");
    case ManeuverType::Merge: return QStringLiteral("merge");
    case ManeuverType::OnRamp: return QStringLiteral("on ramp");
    case ManeuverType::OffRamp: return QStringLiteral("off ramp");
    case ManeuverType::Fork: return QStringLiteral("fork");
    case ManeuverType::EndOfRoad: return QStringLiteral("end of road");
    case ManeuverType::Continue: return QStringLiteral("continue");
    case ManeuverType::Roundabout: return QStringLiteral("roundabout");
    case ManeuverType::Rotary: return QStringLiteral("rotary");
    case ManeuverType::NewName: return QStringLiteral("new name");
    case ManeuverType::Notification: return QStringLiteral("notification");
    case ManeuverType::Other: break;
    }
    return QStringLiteral("other");
}

QList<Step> Route::steps() const
{
    QList<Step> all;
    for (const auto& leg : legs)
        all.append(leg.steps);
    return all;
}

bool Route::isEmpty() const
{
    for (const auto& leg : legs) {
        if (!leg.steps.isEmpty())
            return false;
    }
    return true;
}

} // namespace nav
} // namespace fnav
