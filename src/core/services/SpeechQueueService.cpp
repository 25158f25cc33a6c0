#include "SpeechQueueService.hpp"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <boost/log/trivial.hpp>

namespace fnav {

SpeechQueueService::SpeechQueueService(const QString& queuePath, QObject* parent)
    : QObject(parent)
    , queuePath_(queuePath.isEmpty() ? defaultQueuePath() : queuePath)
{
}

void SpeechQueueService::setQueuePath(const QString& queuePath)
{
    const QString path = queuePath.isEmpty() ? defaultQueuePath() : queuePath;
    if (path == queuePath_) return;
    queuePath_ = path;
    BOOST_LOG_TRIVIAL(info) << "[SpeechQueueService] Queue moved to " << queuePath_.toStdString();
}

QString SpeechQueueService::defaultQueuePath()
{
    return QDir::homePath() + "/.local/state/flick/speak_queue";
}

void SpeechQueueService::requestSpeech(const QString& text)
{
    // The daemon speaks line by line, so one announcement must be one line
    QString line = text;
    line.replace(QLatin1Char('\r'), QLatin1Char(' '));
    line.replace(QLatin1Char('\n'), QLatin1Char(' '));
    line = line.trimmed();
    if (line.isEmpty())
        return;

    QDir().mkpath(QFileInfo(queuePath_).absolutePath());

    QFile file(queuePath_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        BOOST_LOG_TRIVIAL(warning) << "[SpeechQueueService] Cannot open " << queuePath_.toStdString()
                                   << ": " << file.errorString().toStdString();
        return;
    }

    const QByteArray data = line.toUtf8() + '\n';
    if (file.write(data) != data.size()) {
        BOOST_LOG_TRIVIAL(warning) << "[SpeechQueueService] Short write to " << queuePath_.toStdString()
                                   << ": " << file.errorString().toStdString();
        return;
    }

    BOOST_LOG_TRIVIAL(debug) << "[SpeechQueueService] Queued: " << line.toStdString();
    emit speechQueued(line);
}

} // namespace fnav
