#pragma once

#include <QList>
#include <QMetaType>
#include <QString>

namespace fnav {
namespace nav {

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;
};

/// Maneuver kinds understood by the formatter. Decoded once from the
/// routing service's type string; anything unknown becomes Other and the
/// raw string is kept on the Step.
enum class ManeuverType {
    Depart,
    Arrive,
    Turn,
    Merge,
    OnRamp,
    OffRamp,
    Fork,
    EndOfRoad,
    Continue,
    Roundabout,
    Rotary,
    NewName,
    Notification,
    Other
};

ManeuverType maneuverTypeFromString(const QString& raw);
QString maneuverTypeName(ManeuverType type);

struct Step {
    ManeuverType type = ManeuverType::Other;
    QString rawType;
    QString modifier;       // lower-case, e.g. "slight left"; may be empty
    QString roadName;       // may be empty
    int exit = 1;           // roundabout / rotary exit number
    GeoPoint location;      // maneuver location
    QString instruction;    // notification text, if any
    double distance = 0.0;  // meters until the next maneuver
    double duration = 0.0;  // seconds
};

struct Leg {
    QList<Step> steps;
    QString summary;
    double distance = 0.0;
    double duration = 0.0;
};

struct Route {
    QList<Leg> legs;
    double distance = 0.0;  // meters
    double duration = 0.0;  // seconds

    /// All steps of all legs, in travel order.
    QList<Step> steps() const;
    bool isEmpty() const;
};

} // namespace nav
} // namespace fnav

Q_DECLARE_METATYPE(fnav::nav::Route)
