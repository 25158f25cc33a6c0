#pragma once

#include "core/nav/RouteTypes.hpp"
#include <QObject>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;

namespace fnav {

/// Fetches driving routes from an OSRM-compatible routing service.
///
/// Every request gets a new generation number. Only the newest
/// generation may deliver a result; replies for older ones are dropped,
/// so a slow response can never replace a route the user asked for later.
/// Failures (network, timeout, "NoRoute", a route without steps) are
/// reported through routeFailed() and never throw.
class RouteClient : public QObject {
    Q_OBJECT
public:
    static constexpr int kDefaultTimeoutMs = 15000;

    explicit RouteClient(QObject* parent = nullptr);

    void setBaseUrl(const QString& baseUrl) { baseUrl_ = baseUrl; }
    void setProfile(const QString& profile) { profile_ = profile; }
    void setTimeoutMs(int timeoutMs);

    QString baseUrl() const { return baseUrl_; }
    QString profile() const { return profile_; }
    int timeoutMs() const { return timeoutMs_; }

    /// Starts a request and returns its generation.
    quint64 requestRoute(const nav::GeoPoint& from, const nav::GeoPoint& to);

    /// Invalidates any outstanding request.
    void cancel();

    quint64 latestGeneration() const { return generation_; }
    bool isBusy() const { return pending_ != 0; }

    QUrl routeUrl(const nav::GeoPoint& from, const nav::GeoPoint& to) const;

    /// Completes a request. An empty networkError means the transfer succeeded.
    void handleResponse(quint64 generation, const QByteArray& body,
                        const QString& networkError = {});

signals:
    void routeReady(quint64 generation, const fnav::nav::Route& route);
    void routeFailed(quint64 generation, const QString& message);

private:
    void onReplyFinished(QNetworkReply* reply, quint64 generation);

    QNetworkAccessManager* network_;
    QString baseUrl_ = QStringLiteral("https://router.project-osrm.org");
    QString profile_ = QStringLiteral("driving");
    int timeoutMs_ = kDefaultTimeoutMs;
    quint64 generation_ = 0;
    quint64 pending_ = 0;  // generation still awaiting a reply, 0 if none
};

} // namespace fnav
