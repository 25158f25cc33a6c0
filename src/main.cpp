#include <signal.h>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <memory>
#include <yaml-cpp/yaml.h>
#include "core/YamlConfig.hpp"
#include "core/nav/AnnouncementScheduler.hpp"
#include "core/nav/NavigationTracker.hpp"
#include "core/services/IpcServer.hpp"
#include "core/services/RouteClient.hpp"
#include "core/services/SpeechQueueService.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("flick-nav");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Flick");

    QCommandLineParser parser;
    parser.setApplicationDescription("Turn-by-turn guidance daemon for the Flick maps app");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "YAML config file.", "path",
                                    QDir::homePath() + "/.local/state/flick/nav_config.yaml");
    parser.addOption(configOption);
    parser.process(app);

    const QString configPath = parser.value(configOption);
    auto config = std::make_unique<fnav::YamlConfig>();
    if (QFile::exists(configPath)) {
        try {
            config->load(configPath);
            qInfo() << "Config: loaded" << configPath;
        } catch (const YAML::Exception& e) {
            qWarning() << "Config: cannot parse" << configPath << "-" << e.what()
                       << "- using defaults";
            config = std::make_unique<fnav::YamlConfig>();
        }
    } else {
        qInfo() << "Config: no file at" << configPath << "- using defaults";
    }

    // --- Speech hand-off ---
    auto speech = new fnav::SpeechQueueService(config->speechQueuePath(), &app);
    qInfo() << "Speech: queue at" << speech->queuePath();

    // --- Guidance ---
    auto tracker = new fnav::nav::NavigationTracker(&app);
    tracker->setSpeechService(speech);

    // --- Routing ---
    auto routeClient = new fnav::RouteClient(&app);

    auto applySettings = [&config, speech, tracker, routeClient]() {
        speech->setQueuePath(config->speechQueuePath());
        tracker->setScheduler(fnav::nav::AnnouncementScheduler(config->announceThresholds(),
                                                               config->kilometerCutoff()));
        tracker->setAdvanceRadius(config->advanceRadius());
        tracker->setVoiceEnabled(config->voiceEnabled());
        routeClient->setBaseUrl(config->routingBaseUrl());
        routeClient->setProfile(config->routingProfile());
        routeClient->setTimeoutMs(config->routingTimeoutMs());
    };
    applySettings();

    QObject::connect(routeClient, &fnav::RouteClient::routeReady, tracker,
                     [tracker](quint64, const fnav::nav::Route& route) {
        tracker->setRoute(route);
    });

    // --- IPC server for the maps UI ---
    auto ipcServer = new fnav::IpcServer(&app);
    ipcServer->setConfig(config.get(), configPath);
    ipcServer->setTracker(tracker);
    ipcServer->setRouteClient(routeClient);
    QObject::connect(ipcServer, &fnav::IpcServer::configChanged, &app,
                     [applySettings](const QString& path) {
        qInfo() << "Config: changed" << path;
        applySettings();
    });

    if (!ipcServer->start(config->ipcSocketPath())) {
        qCritical() << "IPC: cannot listen on" << config->ipcSocketPath();
        return 1;
    }

    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(qApp, [](){ QCoreApplication::quit(); }, Qt::QueuedConnection);
    });
    signal(SIGTERM, [](int) {
        QMetaObject::invokeMethod(qApp, [](){ QCoreApplication::quit(); }, Qt::QueuedConnection);
    });

    int ret = app.exec();

    // Sockets first; the server holds raw pointers to the tracker and client
    ipcServer->stop();
    tracker->stop();

    return ret;
}
