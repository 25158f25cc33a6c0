#pragma once

#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QLocalServer>
#include <QLocalSocket>
#include <QObject>

namespace fnav {

class YamlConfig;
class RouteClient;

namespace nav {
class NavigationTracker;
}

/// Unix domain socket between the maps UI and the navigation daemon.
///
/// Requests are single JSON objects {"command": ..., "data": {...}}, each
/// terminated by a newline, and get one compact JSON line back. A request
/// may arrive over several reads; bytes are buffered per client until the
/// newline shows up. Guidance events (instruction changes,
/// announcements, state changes, route results) are pushed to every
/// connected client as {"event": ...} lines.
class IpcServer : public QObject {
    Q_OBJECT

public:
    explicit IpcServer(QObject* parent = nullptr);
    ~IpcServer() override;

    /// Start listening. Returns false if the socket cannot be bound.
    bool start(const QString& socketPath = QStringLiteral("/tmp/flick-nav.sock"));
    void stop();
    bool isListening() const;
    int clientCount() const { return clients_.size(); }

    // Inject dependencies (not owned)
    void setConfig(YamlConfig* config, const QString& configPath);
    void setTracker(nav::NavigationTracker* tracker);
    void setRouteClient(RouteClient* routeClient);

    QByteArray handleRequest(const QByteArray& request);

signals:
    /// A setting was changed through set_config and saved.
    void configChanged(const QString& path);

private slots:
    void onNewConnection();
    void onReadyRead();
    void onDisconnected();

private:
    QByteArray handleRoute(const QJsonObject& data);
    QByteArray handleSetRoute(const QJsonObject& data);
    QByteArray handlePosition(const QJsonObject& data);
    QByteArray handleStop();
    QByteArray handleVoice(const QJsonObject& data);
    QByteArray handleStatus();
    QByteArray handleGetConfig(const QJsonObject& data);
    QByteArray handleSetConfig(const QJsonObject& data);

    void broadcast(const QJsonObject& event);

    static constexpr int kMaxRequestBytes = 4 * 1024 * 1024;

    QLocalServer* server_ = nullptr;
    QList<QLocalSocket*> clients_;
    QHash<QLocalSocket*, QByteArray> pending_;  // partial request per client
    YamlConfig* config_ = nullptr;
    QString configPath_;
    nav::NavigationTracker* tracker_ = nullptr;
    RouteClient* routeClient_ = nullptr;
};

} // namespace fnav
