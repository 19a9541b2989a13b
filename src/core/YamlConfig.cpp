#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include <QDir>
#include <QFileInfo>
#include <QSaveFile>
#include <QStringList>

namespace mdq {

YamlConfig::YamlConfig()
{
    initDefaults();
}

QString YamlConfig::defaultConfigPath()
{
    return QDir::homePath() + "/.mdsync/config.yaml";
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["queue"]["path"] = (QDir::homePath() + "/.mdsync/task-queue.bin").toStdString();
    root_["queue"]["backoff"]["initial_ms"] = 500;
    root_["queue"]["backoff"]["max_ms"] = 8000;
    root_["queue"]["max_retries"] = 5;

    root_["mediator"]["reflect_ack_timeout_ms"] = 20000;

    root_["protocol_log"]["enabled"] = false;
    root_["protocol_log"]["path"] = "/tmp/mdsync-protocol.log";
    root_["protocol_log"]["format"] = "tsv";
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

void YamlConfig::load(const QString& filePath)
{
    initDefaults();
    const YAML::Node defaults = YAML::Clone(root_);

    YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    root_ = mergeYaml(defaults, loaded);
}

bool YamlConfig::save(const QString& filePath) const
{
    QDir().mkpath(QFileInfo(filePath).absolutePath());

    YAML::Emitter out;
    out << root_;

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly))
        return false;
    file.write(out.c_str(), static_cast<qint64>(out.size()));
    file.write("\n");
    return file.commit();
}

// --- Queue ---

QString YamlConfig::queuePath() const
{
    return QString::fromStdString(root_["queue"]["path"].as<std::string>(""));
}

void YamlConfig::setQueuePath(const QString& v)
{
    root_["queue"]["path"] = v.toStdString();
}

int YamlConfig::backoffInitialMs() const
{
    return root_["queue"]["backoff"]["initial_ms"].as<int>(500);
}

void YamlConfig::setBackoffInitialMs(int v)
{
    root_["queue"]["backoff"]["initial_ms"] = v;
}

int YamlConfig::backoffMaxMs() const
{
    return root_["queue"]["backoff"]["max_ms"].as<int>(8000);
}

void YamlConfig::setBackoffMaxMs(int v)
{
    root_["queue"]["backoff"]["max_ms"] = v;
}

int YamlConfig::maxRetries() const
{
    return root_["queue"]["max_retries"].as<int>(5);
}

void YamlConfig::setMaxRetries(int v)
{
    root_["queue"]["max_retries"] = v;
}

// --- Mediator ---

int YamlConfig::reflectAckTimeoutMs() const
{
    return root_["mediator"]["reflect_ack_timeout_ms"].as<int>(20000);
}

void YamlConfig::setReflectAckTimeoutMs(int v)
{
    root_["mediator"]["reflect_ack_timeout_ms"] = v;
}

// --- Protocol log ---

bool YamlConfig::protocolLogEnabled() const
{
    return root_["protocol_log"]["enabled"].as<bool>(false);
}

void YamlConfig::setProtocolLogEnabled(bool v)
{
    root_["protocol_log"]["enabled"] = v;
}

QString YamlConfig::protocolLogPath() const
{
    return QString::fromStdString(
        root_["protocol_log"]["path"].as<std::string>("/tmp/mdsync-protocol.log"));
}

void YamlConfig::setProtocolLogPath(const QString& v)
{
    root_["protocol_log"]["path"] = v.toStdString();
}

QString YamlConfig::protocolLogFormat() const
{
    return QString::fromStdString(root_["protocol_log"]["format"].as<std::string>("tsv"));
}

void YamlConfig::setProtocolLogFormat(const QString& v)
{
    root_["protocol_log"]["format"] = v.toStdString();
}

mdsync::ProtocolLogger::OutputFormat YamlConfig::protocolLogOutputFormat() const
{
    if (protocolLogFormat().compare(QLatin1String("jsonl"), Qt::CaseInsensitive) == 0)
        return mdsync::ProtocolLogger::OutputFormat::Jsonl;
    return mdsync::ProtocolLogger::OutputFormat::Tsv;
}

mdsync::TaskQueueConfig YamlConfig::toTaskQueueConfig() const
{
    mdsync::TaskQueueConfig config;
    config.path = queuePath();
    config.backoffInitialMs = backoffInitialMs();
    config.backoffMaxMs = backoffMaxMs();
    config.maxRetries = maxRetries();
    config.reflectAckTimeoutMs = reflectAckTimeoutMs();
    return config;
}

// --- Dotted access ---

static QVariant scalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());
    if (s == QLatin1String("true")) return QVariant(true);
    if (s == QLatin1String("false")) return QVariant(false);

    bool ok = false;
    const int i = s.toInt(&ok);
    if (ok) return QVariant(i);

    const double d = s.toDouble(&ok);
    if (ok) return QVariant(d);

    return QVariant(s);
}

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const QString& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }
    return scalarToVariant(node);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only scalar leaves that exist in the defaults are writable
    YAML::Node schema = buildDefaultsNode();
    for (const QString& part : parts) {
        if (!schema.IsMap()) return false;
        schema.reset(schema[part.toStdString()]);
        if (!schema.IsDefined()) return false;
    }
    if (!schema.IsScalar()) return false;

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i)
        node.reset(node[parts[i].toStdString()]);

    const std::string leaf = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leaf] = value.toBool();
        break;
    case QMetaType::Int:
    case QMetaType::LongLong:
        node[leaf] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leaf] = value.toDouble();
        break;
    default:
        node[leaf] = value.toString().toStdString();
        break;
    }
    return true;
}

} // namespace mdq
