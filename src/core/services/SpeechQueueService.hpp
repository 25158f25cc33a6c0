#pragma once

#include "ISpeechService.hpp"
#include <QObject>
#include <QString>

namespace fnav {

/// Hands announcements to the shell's speech daemon.
///
/// The daemon polls the queue file, speaks every line with espeak-ng and
/// truncates the file; new text interrupts whatever is being spoken. We
/// only ever append whole lines.
class SpeechQueueService : public QObject, public ISpeechService {
    Q_OBJECT
public:
    /// An empty path selects defaultQueuePath().
    explicit SpeechQueueService(const QString& queuePath = {}, QObject* parent = nullptr);

    void requestSpeech(const QString& text) override;

    QString queuePath() const { return queuePath_; }
    /// Takes effect with the next request; an empty path selects defaultQueuePath().
    void setQueuePath(const QString& queuePath);

    /// ~/.local/state/flick/speak_queue
    static QString defaultQueuePath();

signals:
    void speechQueued(const QString& text);

private:
    QString queuePath_;
};

} // namespace fnav
