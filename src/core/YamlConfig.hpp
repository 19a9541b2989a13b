#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

#include <mdsync/Mediator/ProtocolLogger.hpp>
#include <mdsync/Task/TaskQueueConfig.hpp>

namespace mdq {

class YamlConfig {
public:
    YamlConfig();

    /// Merges the file over the defaults. Throws YAML::Exception on a
    /// file that does not exist or does not parse.
    void load(const QString& filePath);
    bool save(const QString& filePath) const;

    // Queue
    QString queuePath() const;
    void setQueuePath(const QString& v);
    int backoffInitialMs() const;
    void setBackoffInitialMs(int v);
    int backoffMaxMs() const;
    void setBackoffMaxMs(int v);
    int maxRetries() const;
    void setMaxRetries(int v);

    // Mediator
    int reflectAckTimeoutMs() const;
    void setReflectAckTimeoutMs(int v);

    // Protocol log
    bool protocolLogEnabled() const;
    void setProtocolLogEnabled(bool v);
    QString protocolLogPath() const;
    void setProtocolLogPath(const QString& v);
    QString protocolLogFormat() const;
    void setProtocolLogFormat(const QString& v);
    mdsync::ProtocolLogger::OutputFormat protocolLogOutputFormat() const;

    // Dotted access (e.g. "queue.backoff.max_ms"). Only keys present in
    // the defaults can be set.
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

    mdsync::TaskQueueConfig toTaskQueueConfig() const;

    static QString defaultConfigPath();

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace mdq
