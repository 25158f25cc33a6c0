#include "RouteClient.hpp"
#include "core/nav/RouteParser.hpp"
#include <QJsonDocument>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrlQuery>
#include <boost/log/trivial.hpp>

namespace fnav {

RouteClient::RouteClient(QObject* parent)
    : QObject(parent)
    , network_(new QNetworkAccessManager(this))
{
}

void RouteClient::setTimeoutMs(int timeoutMs)
{
    timeoutMs_ = timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs;
}

QUrl RouteClient::routeUrl(const nav::GeoPoint& from, const nav::GeoPoint& to) const
{
    QString base = baseUrl_;
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);

    // OSRM coordinate order is lon,lat
    const QString coords = QStringLiteral("%1,%2;%3,%4")
        .arg(from.lon, 0, 'f', 6)
        .arg(from.lat, 0, 'f', 6)
        .arg(to.lon, 0, 'f', 6)
        .arg(to.lat, 0, 'f', 6);

    QUrl url(base + QStringLiteral("/route/v1/") + profile_ + QLatin1Char('/') + coords);
    QUrlQuery query;
    query.addQueryItem("overview", "false");
    query.addQueryItem("steps", "true");
    url.setQuery(query);
    return url;
}

quint64 RouteClient::requestRoute(const nav::GeoPoint& from, const nav::GeoPoint& to)
{
    const quint64 generation = ++generation_;
    pending_ = generation;

    QNetworkRequest request(routeUrl(from, to));
    request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("flick-nav"));
    request.setTransferTimeout(timeoutMs_);

    BOOST_LOG_TRIVIAL(info) << "[RouteClient] Request #" << generation << ": "
                            << request.url().toString().toStdString();

    QNetworkReply* reply = network_->get(request);
    connect(reply, &QNetworkReply::finished, this, [this, reply, generation]() {
        onReplyFinished(reply, generation);
    });
    return generation;
}

void RouteClient::cancel()
{
    if (pending_ == 0) return;
    BOOST_LOG_TRIVIAL(info) << "[RouteClient] Cancelled request #" << pending_;
    pending_ = 0;
    ++generation_;
}

void RouteClient::onReplyFinished(QNetworkReply* reply, quint64 generation)
{
    reply->deleteLater();

    QString networkError;
    if (reply->error() == QNetworkReply::OperationCanceledError
        || reply->error() == QNetworkReply::TimeoutError) {
        networkError = QStringLiteral("Routing request timed out after %1 ms").arg(timeoutMs_);
    } else if (reply->error() != QNetworkReply::NoError) {
        networkError = reply->errorString();
    }

    handleResponse(generation, reply->readAll(), networkError);
}

void RouteClient::handleResponse(quint64 generation, const QByteArray& body, const QString& networkError)
{
    if (generation != generation_) {
        BOOST_LOG_TRIVIAL(debug) << "[RouteClient] Dropping stale response #" << generation
                                 << " (latest #" << generation_ << ")";
        return;
    }
    pending_ = 0;

    nav::Route route;
    QString error;
    bool parsed = !body.isEmpty() && nav::parseRouteResponse(body, route, error);
    if (parsed && route.isEmpty()) {
        parsed = false;
        error = QStringLiteral("Route has no steps");
    }

    if (networkError.isEmpty() && parsed) {
        BOOST_LOG_TRIVIAL(info) << "[RouteClient] Route #" << generation << ": "
                                << route.distance << " m, " << route.duration << " s";
        emit routeReady(generation, route);
        return;
    }

    QString message = error;
    if (!networkError.isEmpty()) {
        // OSRM explains 4xx replies in a JSON body; prefer that text when present
        const bool osrmError = !body.isEmpty() && QJsonDocument::fromJson(body).isObject();
        if (!osrmError || error.isEmpty())
            message = networkError;
    } else if (body.isEmpty()) {
        message = QStringLiteral("Empty routing response");
    }

    BOOST_LOG_TRIVIAL(warning) << "[RouteClient] Request #" << generation << " failed: "
                               << message.toStdString();
    emit routeFailed(generation, message);
}

} // namespace fnav
