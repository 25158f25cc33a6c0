#include "core/YamlConfig.hpp"
#include <QHash>
#include <QStringList>
#include <boost/log/trivial.hpp>
#include <cmath>
#include <fstream>
#include <limits>

namespace fnav {

namespace {

// Overlay the user's file onto the defaults. Maps merge key by key, anything
// else in the file replaces the default wholesale. Keys the defaults do not
// know are kept so a newer file survives an older binary, but are reported.
YAML::Node overlayOnDefaults(const YAML::Node& defaults, const YAML::Node& file,
                             const std::string& path = {})
{
    if (!file.IsDefined() || file.IsNull())
        return YAML::Clone(defaults);
    if (!defaults.IsMap() || !file.IsMap())
        return YAML::Clone(file);

    YAML::Node merged = YAML::Clone(defaults);
    for (auto it = file.begin(); it != file.end(); ++it) {
        const auto key = it->first.as<std::string>();
        const auto keyPath = path.empty() ? key : path + "." + key;
        if (merged[key]) {
            merged[key] = overlayOnDefaults(merged[key], it->second, keyPath);
        } else {
            BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Unknown key '" << keyPath << "'";
            merged[key] = YAML::Clone(it->second);
        }
    }
    return merged;
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["routing"]["base_url"] = "https://router.project-osrm.org";
    root_["routing"]["profile"] = "driving";
    root_["routing"]["timeout_ms"] = 15000;

    root_["navigation"]["advance_radius_m"] = 30;
    root_["navigation"]["announce_thresholds_m"] = YAML::Node(YAML::NodeType::Sequence);
    for (int t : {500, 200, 100, 50})
        root_["navigation"]["announce_thresholds_m"].push_back(t);
    root_["navigation"]["kilometer_cutoff_m"] = 500;

    root_["voice"]["enabled"] = true;
    root_["voice"]["queue_path"] = "";

    root_["ipc"]["socket_path"] = "/tmp/flick-nav.sock";
}

void YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = overlayOnDefaults(defaults, loaded);
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

// --- Routing ---

QString YamlConfig::routingBaseUrl() const
{
    return QString::fromStdString(
        root_["routing"]["base_url"].as<std::string>("https://router.project-osrm.org"));
}

QString YamlConfig::routingProfile() const
{
    return QString::fromStdString(root_["routing"]["profile"].as<std::string>("driving"));
}

int YamlConfig::routingTimeoutMs() const
{
    return root_["routing"]["timeout_ms"].as<int>(15000);
}

// --- Guidance ---

double YamlConfig::advanceRadius() const
{
    return root_["navigation"]["advance_radius_m"].as<double>(30.0);
}

QList<int> YamlConfig::announceThresholds() const
{
    QList<int> result;
    auto node = root_["navigation"]["announce_thresholds_m"];
    if (node && node.IsSequence()) {
        for (const auto& t : node)
            result.append(t.as<int>(0));
    }
    return result;
}

int YamlConfig::kilometerCutoff() const
{
    return root_["navigation"]["kilometer_cutoff_m"].as<int>(500);
}

// --- Voice ---

bool YamlConfig::voiceEnabled() const
{
    return root_["voice"]["enabled"].as<bool>(true);
}

void YamlConfig::setVoiceEnabled(bool v)
{
    root_["voice"]["enabled"] = v;
}

QString YamlConfig::speechQueuePath() const
{
    return QString::fromStdString(root_["voice"]["queue_path"].as<std::string>(""));
}

// --- IPC ---

QString YamlConfig::ipcSocketPath() const
{
    return QString::fromStdString(root_["ipc"]["socket_path"].as<std::string>("/tmp/flick-nav.sock"));
}

// --- Generic dot-path access ---

namespace {

// Value type of the typed leaves; every other leaf holds a string.
// Sequences list the type of their elements.
QMetaType::Type leafType(const QString& dottedKey)
{
    static const QHash<QString, QMetaType::Type> types = {
        {QStringLiteral("routing.timeout_ms"), QMetaType::Int},
        {QStringLiteral("navigation.advance_radius_m"), QMetaType::Double},
        {QStringLiteral("navigation.announce_thresholds_m"), QMetaType::Int},
        {QStringLiteral("navigation.kilometer_cutoff_m"), QMetaType::Int},
        {QStringLiteral("voice.enabled"), QMetaType::Bool},
    };
    return types.value(dottedKey, QMetaType::QString);
}

bool lookup(const YAML::Node& root, const QString& dottedKey, YAML::Node& out)
{
    YAML::Node node;
    node.reset(root);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return false;
        const YAML::Node& parent = node;  // const operator[] never inserts
        node.reset(parent[part.toStdString()]);
        if (!node.IsDefined()) return false;
    }
    out.reset(node);
    return true;
}

template <typename T>
QVariant decodeAs(const YAML::Node& node)
{
    T value;
    if (!YAML::convert<T>::decode(node, value)) return {};
    return QVariant::fromValue(value);
}

QVariant readScalar(const YAML::Node& node, QMetaType::Type type)
{
    if (!node.IsScalar()) return {};

    switch (type) {
    case QMetaType::Bool:
        return decodeAs<bool>(node);
    case QMetaType::Int:
        return decodeAs<int>(node);
    case QMetaType::Double:
        return decodeAs<double>(node);
    default:
        return QString::fromStdString(node.Scalar());
    }
}

bool isNumber(const QVariant& value)
{
    switch (value.typeId()) {
    case QMetaType::Int:
    case QMetaType::UInt:
    case QMetaType::LongLong:
    case QMetaType::ULongLong:
    case QMetaType::Float:
    case QMetaType::Double:
        return true;
    default:
        return false;
    }
}

// Converts an incoming value to the leaf's type; invalid if it does not fit
QVariant coerce(const QVariant& value, QMetaType::Type type)
{
    switch (type) {
    case QMetaType::Bool:
        return value.typeId() == QMetaType::Bool ? value : QVariant();
    case QMetaType::Int: {
        if (!isNumber(value)) return {};
        const double d = value.toDouble();
        if (!std::isfinite(d) || std::floor(d) != d
            || d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max())
            return {};
        return static_cast<int>(d);
    }
    case QMetaType::Double: {
        if (!isNumber(value)) return {};
        const double d = value.toDouble();
        return std::isfinite(d) ? QVariant(d) : QVariant();
    }
    default:
        return value.typeId() == QMetaType::QString ? value : QVariant();
    }
}

} // namespace

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node;
    if (!lookup(root_, dottedKey, node) || node.IsNull()) return {};

    const QMetaType::Type type = leafType(dottedKey);
    if (node.IsSequence()) {
        QVariantList list;
        for (const auto& item : node)
            list.append(readScalar(item, type));
        return list;
    }
    return readScalar(node, type);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    // Only scalar leaves of the defaults tree are writable
    YAML::Node defaultLeaf;
    if (!lookup(buildDefaultsNode(), dottedKey, defaultLeaf) || !defaultLeaf.IsScalar())
        return false;

    const QVariant converted = coerce(value, leafType(dottedKey));
    if (!converted.isValid()) {
        BOOST_LOG_TRIVIAL(warning) << "[YamlConfig] Rejected value '" << value.toString().toStdString()
                                   << "' for " << dottedKey.toStdString();
        return false;
    }

    QStringList parts = dottedKey.split('.');
    const std::string leafKey = parts.takeLast().toStdString();

    YAML::Node parent = root_;
    for (const auto& part : parts) {
        if (!parent.IsMap()) return false;
        parent.reset(parent[part.toStdString()]);
    }
    if (!parent.IsMap()) return false;

    switch (converted.typeId()) {
    case QMetaType::Bool:
        parent[leafKey] = converted.toBool();
        break;
    case QMetaType::Int:
        parent[leafKey] = converted.toInt();
        break;
    case QMetaType::Double:
        parent[leafKey] = converted.toDouble();
        break;
    default:
        parent[leafKey] = converted.toString().toStdString();
        break;
    }
    return true;
}

} // namespace fnav
