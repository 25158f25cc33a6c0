#include "RouteParser.hpp"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <boost/log/trivial.hpp>

namespace fnav {
namespace nav {

namespace {

Step parseStep(const QJsonObject& obj)
{
    Step step;
    const QJsonObject maneuver = obj.value("maneuver").toObject();

    step.rawType = maneuver.value("type").toString();
    step.type = maneuverTypeFromString(step.rawType);
    step.modifier = maneuver.value("modifier").toString().trimmed().toLower();
    step.roadName = obj.value("name").toString().trimmed();
    step.instruction = maneuver.value("instruction").toString();

    const int exit = maneuver.value("exit").toInt(1);
    step.exit = exit > 0 ? exit : 1;

    // GeoJSON order: [lon, lat]
    const QJsonArray loc = maneuver.value("location").toArray();
    if (loc.size() >= 2) {
        step.location.lon = loc.at(0).toDouble();
        step.location.lat = loc.at(1).toDouble();
    }

    step.distance = obj.value("distance").toDouble();
    step.duration = obj.value("duration").toDouble();

    if (step.type == ManeuverType::Other && !step.rawType.isEmpty())
        BOOST_LOG_TRIVIAL(debug) << "[RouteParser] Unrecognized maneuver type '"
                                 << step.rawType.toStdString() << "'";
    return step;
}

} // namespace

bool parseRouteResponse(const QByteArray& body, Route& route, QString& error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        error = QStringLiteral("Invalid routing response: %1").arg(parseError.errorString());
        return false;
    }
    if (!doc.isObject()) {
        error = QStringLiteral("Invalid routing response: expected an object");
        return false;
    }
    return parseRouteObject(doc.object(), route, error);
}

bool parseRouteObject(const QJsonObject& response, Route& route, QString& error)
{
    const QString code = response.value("code").toString();
    if (code != QLatin1String("Ok")) {
        const QString message = response.value("message").toString();
        error = message.isEmpty()
            ? QStringLiteral("Routing failed (%1)").arg(code.isEmpty() ? QStringLiteral("no code") : code)
            : message;
        return false;
    }

    const QJsonArray routes = response.value("routes").toArray();
    if (routes.isEmpty()) {
        error = QStringLiteral("No route found");
        return false;
    }

    const QJsonObject first = routes.at(0).toObject();
    Route parsed;
    parsed.distance = first.value("distance").toDouble();
    parsed.duration = first.value("duration").toDouble();

    const QJsonArray legs = first.value("legs").toArray();
    for (const auto& legValue : legs) {
        const QJsonObject legObj = legValue.toObject();
        Leg leg;
        leg.summary = legObj.value("summary").toString();
        leg.distance = legObj.value("distance").toDouble();
        leg.duration = legObj.value("duration").toDouble();
        for (const auto& stepValue : legObj.value("steps").toArray())
            leg.steps.append(parseStep(stepValue.toObject()));
        parsed.legs.append(leg);
    }

    BOOST_LOG_TRIVIAL(debug) << "[RouteParser] Parsed route: " << parsed.legs.size() << " legs, "
                             << parsed.steps().size() << " steps, " << parsed.distance << " m";
    route = parsed;
    return true;
}

} // namespace nav
} // namespace fnav
