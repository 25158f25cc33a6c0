#pragma once

#include <QList>
#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace fnav {

class YamlConfig {
public:
    YamlConfig();

    /// Deep-merges the file over the built-in defaults.
    /// Throws YAML::Exception on unreadable or malformed files.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    // Routing service
    QString routingBaseUrl() const;
    QString routingProfile() const;
    int routingTimeoutMs() const;

    // Guidance
    double advanceRadius() const;
    QList<int> announceThresholds() const;
    int kilometerCutoff() const;

    // Voice
    bool voiceEnabled() const;
    void setVoiceEnabled(bool v);
    /// Empty means the shell's default speak queue.
    QString speechQueuePath() const;

    // IPC
    QString ipcSocketPath() const;

    // Generic dot-path access (e.g. "routing.timeout_ms"). Writes must hit a
    // scalar leaf of the defaults and match its type.
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;  // single source of truth

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace fnav
