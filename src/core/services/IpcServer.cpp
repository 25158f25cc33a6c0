#include "IpcServer.hpp"
#include "RouteClient.hpp"
#include "core/YamlConfig.hpp"
#include "core/nav/ManeuverFormatter.hpp"
#include "core/nav/NavigationTracker.hpp"
#include "core/nav/RouteParser.hpp"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>
#include <cmath>

namespace fnav {

namespace {

bool readPoint(const QJsonValue& value, nav::GeoPoint& point)
{
    const QJsonObject obj = value.toObject();
    const QJsonValue lat = obj.value("lat");
    const QJsonValue lon = obj.value("lon");
    if (!lat.isDouble() || !lon.isDouble())
        return false;

    point.lat = lat.toDouble();
    point.lon = lon.toDouble();
    return std::isfinite(point.lat) && std::isfinite(point.lon)
        && std::abs(point.lat) <= 90.0 && std::abs(point.lon) <= 180.0;
}

QString stateName(nav::NavigationTracker::State state)
{
    return state == nav::NavigationTracker::State::Navigating ? QStringLiteral("navigating")
                                                              : QStringLiteral("inactive");
}

QByteArray toLine(const QJsonObject& obj)
{
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

} // namespace

IpcServer::IpcServer(QObject* parent)
    : QObject(parent)
{
}

IpcServer::~IpcServer()
{
    stop();
}

bool IpcServer::start(const QString& socketPath)
{
    if (server_) return false;

    // Remove stale socket file
    QFile::remove(socketPath);

    server_ = new QLocalServer(this);
    server_->setSocketOptions(QLocalServer::UserAccessOption);

    connect(server_, &QLocalServer::newConnection, this, &IpcServer::onNewConnection);

    if (!server_->listen(socketPath)) {
        qWarning() << "IpcServer: Failed to listen on" << socketPath
                   << "-" << server_->errorString();
        delete server_;
        server_ = nullptr;
        return false;
    }

    qInfo() << "IpcServer: Listening on" << socketPath;
    return true;
}

void IpcServer::stop()
{
    for (auto* socket : clients_) {
        socket->disconnect(this);
        socket->deleteLater();
    }
    clients_.clear();
    pending_.clear();

    if (server_) {
        server_->close();
        delete server_;
        server_ = nullptr;
    }
}

bool IpcServer::isListening() const
{
    return server_ && server_->isListening();
}

void IpcServer::setConfig(YamlConfig* config, const QString& configPath)
{
    config_ = config;
    configPath_ = configPath;
}

void IpcServer::setTracker(nav::NavigationTracker* tracker)
{
    if (tracker_)
        tracker_->disconnect(this);
    tracker_ = tracker;
    if (!tracker_) return;

    connect(tracker_, &nav::NavigationTracker::instructionChanged, this,
            [this](int stepIndex, const QString& instruction) {
        QJsonObject ev;
        ev["event"] = QStringLiteral("instruction");
        ev["step"] = stepIndex;
        ev["text"] = instruction;
        ev["label"] = tracker_->currentLabel();
        ev["next_label"] = tracker_->nextLabel();
        broadcast(ev);
    });
    connect(tracker_, &nav::NavigationTracker::announcement, this, [this](const QString& text) {
        QJsonObject ev;
        ev["event"] = QStringLiteral("announcement");
        ev["text"] = text;
        broadcast(ev);
    });
    connect(tracker_, &nav::NavigationTracker::stateChanged, this,
            [this](nav::NavigationTracker::State state) {
        QJsonObject ev;
        ev["event"] = QStringLiteral("state");
        ev["state"] = stateName(state);
        broadcast(ev);
    });
    connect(tracker_, &nav::NavigationTracker::arrived, this, [this]() {
        broadcast(QJsonObject{{"event", QStringLiteral("arrived")}});
    });
}

void IpcServer::setRouteClient(RouteClient* routeClient)
{
    if (routeClient_)
        routeClient_->disconnect(this);
    routeClient_ = routeClient;
    if (!routeClient_) return;

    connect(routeClient_, &RouteClient::routeReady, this,
            [this](quint64 generation, const nav::Route& route) {
        QJsonObject ev;
        ev["event"] = QStringLiteral("route_ready");
        ev["generation"] = static_cast<qint64>(generation);
        ev["distance"] = route.distance;
        ev["duration"] = route.duration;
        ev["summary"] = nav::formatDistance(route.distance) + QStringLiteral(" · ")
                        + nav::formatDuration(route.duration);
        broadcast(ev);
    });
    connect(routeClient_, &RouteClient::routeFailed, this,
            [this](quint64 generation, const QString& message) {
        QJsonObject ev;
        ev["event"] = QStringLiteral("route_failed");
        ev["generation"] = static_cast<qint64>(generation);
        ev["message"] = message;
        broadcast(ev);
    });
}

void IpcServer::onNewConnection()
{
    while (auto* socket = server_->nextPendingConnection()) {
        clients_.append(socket);
        connect(socket, &QLocalSocket::readyRead, this, &IpcServer::onReadyRead);
        connect(socket, &QLocalSocket::disconnected, this, &IpcServer::onDisconnected);
    }
}

void IpcServer::onReadyRead()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;

    // Taken out of the map: a handler may broadcast, fail a write and
    // drop this client before the loop is done
    QByteArray buffer = pending_.take(socket) + socket->readAll();

    int newline;
    while ((newline = buffer.indexOf('\n')) >= 0) {
        const QByteArray line = buffer.left(newline);
        buffer.remove(0, newline + 1);
        if (line.trimmed().isEmpty()) continue;
        socket->write(handleRequest(line) + "\n");
    }

    if (buffer.size() > kMaxRequestBytes) {
        qWarning() << "IpcServer: Dropping" << buffer.size() << "bytes without a newline";
        buffer.clear();
        socket->write(R"({"error":"Request too large"})" "\n");
    }
    socket->flush();

    if (!buffer.isEmpty() && clients_.contains(socket))
        pending_.insert(socket, buffer);
}

void IpcServer::onDisconnected()
{
    auto* socket = qobject_cast<QLocalSocket*>(sender());
    if (!socket) return;
    clients_.removeAll(socket);
    pending_.remove(socket);
    socket->deleteLater();
}

void IpcServer::broadcast(const QJsonObject& event)
{
    const QByteArray line = toLine(event) + "\n";
    // A failed write aborts the socket and re-enters onDisconnected()
    const QList<QLocalSocket*> clients = clients_;
    for (auto* socket : clients) {
        if (socket->state() == QLocalSocket::ConnectedState) {
            socket->write(line);
            socket->flush();
        }
    }
}

QByteArray IpcServer::handleRequest(const QByteArray& request)
{
    QJsonDocument doc = QJsonDocument::fromJson(request);
    if (!doc.isObject()) {
        return R"({"error":"Invalid JSON"})";
    }

    QJsonObject obj = doc.object();
    QString command = obj.value("command").toString();
    QJsonObject data = obj.value("data").toObject();

    if (command == QLatin1String("route"))
        return handleRoute(data);
    if (command == QLatin1String("set_route"))
        return handleSetRoute(data);
    if (command == QLatin1String("position"))
        return handlePosition(data);
    if (command == QLatin1String("stop"))
        return handleStop();
    if (command == QLatin1String("voice"))
        return handleVoice(data);
    if (command == QLatin1String("status"))
        return handleStatus();
    if (command == QLatin1String("get_config"))
        return handleGetConfig(data);
    if (command == QLatin1String("set_config"))
        return handleSetConfig(data);

    return R"({"error":"Unknown command"})";
}

QByteArray IpcServer::handleRoute(const QJsonObject& data)
{
    if (!routeClient_) return R"({"error":"Routing not available"})";

    nav::GeoPoint from;
    nav::GeoPoint to;
    if (!readPoint(data.value("from"), from) || !readPoint(data.value("to"), to))
        return R"({"ok":false,"error":"Invalid coordinates"})";

    const quint64 generation = routeClient_->requestRoute(from, to);

    QJsonObject obj;
    obj["ok"] = true;
    obj["generation"] = static_cast<qint64>(generation);
    return toLine(obj);
}

QByteArray IpcServer::handleSetRoute(const QJsonObject& data)
{
    if (!tracker_) return R"({"error":"Navigation not available"})";

    nav::Route route;
    QString error;
    if (!nav::parseRouteObject(data.value("osrm").toObject(), route, error)) {
        QJsonObject obj;
        obj["ok"] = false;
        obj["error"] = error;
        return toLine(obj);
    }

    // An unusable route leaves the current guidance running
    if (route.isEmpty())
        return R"({"ok":false,"error":"Route has no steps"})";

    // A route handed over directly supersedes any fetch still in flight
    if (routeClient_)
        routeClient_->cancel();

    tracker_->setRoute(route);
    return R"({"ok":true})";
}

QByteArray IpcServer::handlePosition(const QJsonObject& data)
{
    if (!tracker_) return R"({"error":"Navigation not available"})";

    nav::GeoPoint position;
    if (!readPoint(data, position))
        return R"({"ok":false,"error":"Invalid coordinates"})";

    tracker_->updatePosition(position);
    return R"({"ok":true})";
}

QByteArray IpcServer::handleStop()
{
    if (!tracker_) return R"({"error":"Navigation not available"})";

    if (routeClient_)
        routeClient_->cancel();
    tracker_->stop();
    return R"({"ok":true})";
}

QByteArray IpcServer::handleVoice(const QJsonObject& data)
{
    if (!tracker_) return R"({"error":"Navigation not available"})";
    if (!data.value("enabled").isBool())
        return R"({"ok":false,"error":"Missing 'enabled'"})";

    const bool enabled = data.value("enabled").toBool();
    tracker_->setVoiceEnabled(enabled);

    if (config_) {
        config_->setVoiceEnabled(enabled);
        if (!configPath_.isEmpty())
            config_->save(configPath_);
    }
    return R"({"ok":true})";
}

QByteArray IpcServer::handleStatus()
{
    if (!tracker_) return R"({"error":"Navigation not available"})";

    QJsonObject obj;
    obj["state"] = stateName(tracker_->state());
    obj["voice"] = tracker_->voiceEnabled();
    obj["step"] = tracker_->currentStepIndex();
    obj["step_count"] = tracker_->stepCount();
    obj["instruction"] = tracker_->currentInstruction();
    obj["label"] = tracker_->currentLabel();
    obj["next_label"] = tracker_->nextLabel();

    const double toManeuver = tracker_->distanceToManeuver();
    if (tracker_->isNavigating() && toManeuver >= 0) {
        obj["distance_to_maneuver"] = toManeuver;
        obj["distance_text"] = nav::formatDistance(toManeuver);
        obj["remaining_distance"] = tracker_->remainingDistance();
    }
    obj["routing"] = routeClient_ && routeClient_->isBusy();
    return toLine(obj);
}

QByteArray IpcServer::handleGetConfig(const QJsonObject& data)
{
    if (!config_) return R"({"error":"Config not available"})";

    const QString path = data.value("path").toString();
    const QVariant value = config_->valueByPath(path);
    if (!value.isValid())
        return R"({"ok":false,"error":"Unknown config path"})";

    QJsonObject obj;
    obj["ok"] = true;
    obj["path"] = path;
    obj["value"] = QJsonValue::fromVariant(value);
    return toLine(obj);
}

QByteArray IpcServer::handleSetConfig(const QJsonObject& data)
{
    if (!config_) return R"({"error":"Config not available"})";

    const QString path = data.value("path").toString();
    const QVariant value = data.value("value").toVariant();

    if (!config_->setValueByPath(path, value))
        return R"({"ok":false,"error":"Unknown config path or wrong value type"})";

    if (!configPath_.isEmpty())
        config_->save(configPath_);
    emit configChanged(path);
    return R"({"ok":true})";
}

} // namespace fnav
