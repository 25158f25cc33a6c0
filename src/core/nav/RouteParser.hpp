#pragma once

#include "RouteTypes.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace fnav {
namespace nav {

/// Decode an OSRM route/v1 response (first route only). Missing step
/// fields get neutral defaults; only a response without a usable route
/// fails. On failure `error` is set and `route` is left untouched.
bool parseRouteResponse(const QByteArray& body, Route& route, QString& error);
bool parseRouteObject(const QJsonObject& response, Route& route, QString& error);

} // namespace nav
} // namespace fnav
