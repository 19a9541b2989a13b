#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QSaveFile>
#include <QTextStream>
#include <yaml-cpp/yaml.h>

#include "core/YamlConfig.hpp"
#include <mdsync/Frame/ChatServerPayload.hpp>
#include <mdsync/Crypto/EnvelopeCryptor.hpp>
#include <mdsync/Frame/FrameCodec.hpp>
#include <mdsync/Mediator/MediatorMessenger.hpp>
#include <mdsync/Mediator/ProtocolLogger.hpp>
#include <mdsync/Task/TaskCodec.hpp>
#include <mdsync/Transport/ReplayConnection.hpp>

namespace {

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

bool readQueue(const QString& path, QList<mdsync::TaskPtr>& tasks)
{
    QFile file(path);
    if (!file.exists())
        return true;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[Queue] cannot open" << path << ":" << file.errorString();
        return false;
    }

    mdsync::Error error;
    if (!mdsync::TaskCodec::decodeQueue(file.readAll(), tasks, &error)) {
        qWarning() << "[Queue] cannot decode" << path << ":" << error;
        return false;
    }
    return true;
}

int listQueue(const mdq::YamlConfig& config)
{
    QList<mdsync::TaskPtr> tasks;
    if (!readQueue(config.queuePath(), tasks))
        return 1;

    qInfo() << "[Queue]" << tasks.size() << "task(s) in" << config.queuePath();
    int index = 0;
    for (const auto& task : tasks) {
        out() << index++ << '\t'
              << mdsync::taskTypeName(task->type()) << '\t'
              << mdsync::taskStateName(task->state()) << '\t'
              << "retries=" << task->retryCount() << '\t'
              << task->description() << '\n';
    }
    out().flush();
    return 0;
}

int clearQueue(const mdq::YamlConfig& config)
{
    QList<mdsync::TaskPtr> tasks;
    if (!readQueue(config.queuePath(), tasks))
        return 1;

    QSaveFile file(config.queuePath());
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[Queue] cannot write" << config.queuePath() << ":" << file.errorString();
        return 1;
    }
    const QByteArray empty = mdsync::TaskCodec::encodeQueue({});
    if (file.write(empty) != empty.size() || !file.commit()) {
        qWarning() << "[Queue] cannot commit" << config.queuePath() << ":" << file.errorString();
        return 1;
    }

    qInfo() << "[Queue] removed" << tasks.size() << "task(s)";
    return 0;
}

void describeChatServerPayload(const QByteArray& payload)
{
    uint8_t type = 0;
    mdsync::Error error;
    if (!mdsync::ChatServerPayload::payloadType(payload, type, &error)) {
        out() << "  chat server payload: " << error.toString() << '\n';
        return;
    }

    out() << "  chat server payload type: 0x" << QString::number(type, 16) << '\n';
    if (type == mdsync::ChatServerPayloadType::OUTGOING_MESSAGE) {
        mdsync::OutgoingMessageBox box;
        if (mdsync::ChatServerPayload::decodeOutgoingMessage(payload, box, &error)) {
            out() << "  from: " << box.fromIdentity << '\n'
                  << "  to: " << box.toIdentity << '\n'
                  << "  message id: " << QString::number(box.messageId, 16) << '\n'
                  << "  box size: " << box.box.size() << '\n';
        } else {
            out() << "  " << error.toString() << '\n';
        }
    } else if (type == mdsync::ChatServerPayloadType::INCOMING_MESSAGE_ACK) {
        mdsync::IncomingMessageAck ack;
        if (mdsync::ChatServerPayload::decodeIncomingMessageAck(payload, ack, &error)) {
            out() << "  sender: " << ack.senderIdentity << '\n'
                  << "  message id: " << QString::number(ack.messageId, 16) << '\n';
        } else {
            out() << "  " << error.toString() << '\n';
        }
    }
}

int inspectFrame(const QString& hex)
{
    const QByteArray frame = QByteArray::fromHex(hex.toLatin1());

    mdsync::MediatorFrameType type;
    mdsync::Error error;
    if (!mdsync::FrameCodec::frameType(frame, type, &error)) {
        qWarning() << "[Frame]" << error;
        return 1;
    }

    out() << "frame: " << mdsync::frameTypeName(type)
          << " (0x" << QString::number(static_cast<int>(type), 16) << ")"
          << ", " << frame.size() << " bytes\n";

    bool ok = true;
    switch (type) {
    case mdsync::MediatorFrameType::Reflect: {
        mdsync::ReflectFrame reflect;
        ok = mdsync::FrameCodec::decodeReflect(frame, reflect, &error);
        if (ok)
            out() << "  reflect id: " << reflect.reflectId.toHex() << '\n'
                  << "  envelope size: " << reflect.envelopeCiphertext.size() << '\n';
        break;
    }
    case mdsync::MediatorFrameType::ReflectAck: {
        mdsync::ReflectAckFrame ack;
        ok = mdsync::FrameCodec::decodeReflectAck(frame, ack, &error);
        if (ok)
            out() << "  reflect id: " << ack.reflectId.toHex() << '\n'
                  << "  acked at: " << ack.ackedAt.toString(Qt::ISODateWithMs) << '\n';
        break;
    }
    case mdsync::MediatorFrameType::Reflected: {
        mdsync::ReflectedFrame reflected;
        ok = mdsync::FrameCodec::decodeReflected(frame, reflected, &error);
        if (ok)
            out() << "  reflect id: " << reflected.reflectId.toHex() << '\n'
                  << "  reflected at: " << reflected.reflectedAt.toString(Qt::ISODateWithMs) << '\n'
                  << "  envelope size: " << reflected.envelopeCiphertext.size() << '\n';
        break;
    }
    case mdsync::MediatorFrameType::ReflectedAck: {
        QByteArray reflectId;
        ok = mdsync::FrameCodec::decodeReflectedAck(frame, reflectId, &error);
        if (ok)
            out() << "  reflect id: " << reflectId.toHex() << '\n';
        break;
    }
    case mdsync::MediatorFrameType::Proxy: {
        QByteArray payload;
        ok = mdsync::FrameCodec::decodeProxy(frame, payload, &error);
        if (ok)
            describeChatServerPayload(payload);
        break;
    }
    case mdsync::MediatorFrameType::ServerHello:
    case mdsync::MediatorFrameType::ClientHello:
    case mdsync::MediatorFrameType::ServerInfo:
    case mdsync::MediatorFrameType::ReflectionQueueDry:
    case mdsync::MediatorFrameType::RolePromotedToLeader:
    case mdsync::MediatorFrameType::GetDeviceInfo:
    case mdsync::MediatorFrameType::DeviceInfo:
    case mdsync::MediatorFrameType::DropDevice:
    case mdsync::MediatorFrameType::DropDeviceAck:
    case mdsync::MediatorFrameType::SetSharedDeviceData:
    case mdsync::MediatorFrameType::Lock:
    case mdsync::MediatorFrameType::LockAck:
    case mdsync::MediatorFrameType::Unlock:
    case mdsync::MediatorFrameType::UnlockAck:
    case mdsync::MediatorFrameType::Rejected:
    case mdsync::MediatorFrameType::Ended:
        out() << "  payload: " << mdsync::FrameCodec::stripCommonHeader(frame).toHex() << '\n';
        break;
    }
    out().flush();

    if (!ok) {
        qWarning() << "[Frame]" << error;
        return 1;
    }
    return 0;
}

// Feeds a capture (one hex frame per line, '#' comments) through a
// messenger and reports what it routed.
int replayCapture(const mdq::YamlConfig& config, const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "[Replay] cannot open" << path << ":" << file.errorString();
        return 1;
    }

    mdsync::ReplayConnection connection;
    mdsync::EnvelopeCryptor cryptor;
    mdsync::MediatorMessenger messenger(&connection, &cryptor);
    messenger.setReflectAckTimeout(config.reflectAckTimeoutMs());

    mdsync::ProtocolLogger logger;
    if (config.protocolLogEnabled()) {
        logger.setFormat(config.protocolLogOutputFormat());
        if (logger.open(config.protocolLogPath().toStdString()))
            logger.attach(&messenger);
        else
            qWarning() << "[Replay] cannot open protocol log" << config.protocolLogPath();
    }

    int reflected = 0;
    int errors = 0;
    QObject::connect(&messenger, &mdsync::MediatorMessenger::reflectedReceived,
                     [&reflected](const QByteArray& reflectId, const QByteArray&, const QDateTime&) {
                         ++reflected;
                         qInfo() << "[Replay] reflected" << reflectId.toHex();
                     });
    QObject::connect(&messenger, &mdsync::MediatorMessenger::reflectionQueueDry,
                     [] { qInfo() << "[Replay] reflection queue dry"; });
    QObject::connect(&messenger, &mdsync::MediatorMessenger::protocolError,
                     [&errors](const QString& message) {
                         ++errors;
                         qWarning() << "[Replay]" << message;
                     });

    messenger.start();
    connection.simulateLogin();

    int frames = 0;
    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine().trimmed();
        if (line.isEmpty() || line.startsWith('#'))
            continue;
        connection.feedFrame(QByteArray::fromHex(line.toLatin1()));
        ++frames;
    }

    messenger.stop();
    logger.detach();
    logger.close();

    qInfo() << "[Replay]" << frames << "frame(s)," << reflected << "reflected," << errors << "error(s)";
    return errors == 0 ? 0 : 1;
}

int configCommand(mdq::YamlConfig& config, const QString& configPath, const QStringList& args)
{
    if (args.size() == 3 && args[1] == QLatin1String("get")) {
        const QVariant value = config.valueByPath(args[2]);
        if (!value.isValid()) {
            qWarning() << "[Config] no such key:" << args[2];
            return 1;
        }
        out() << value.toString() << '\n';
        out().flush();
        return 0;
    }

    if (args.size() == 4 && args[1] == QLatin1String("set")) {
        // Keep numbers and booleans typed in the YAML file
        QVariant value(args[3]);
        bool isInt = false;
        const int asInt = args[3].toInt(&isInt);
        if (isInt)
            value = asInt;
        else if (args[3] == QLatin1String("true") || args[3] == QLatin1String("false"))
            value = (args[3] == QLatin1String("true"));

        if (!config.setValueByPath(args[2], value)) {
            qWarning() << "[Config] unknown key:" << args[2];
            return 1;
        }
        if (!config.save(configPath)) {
            qWarning() << "[Config] cannot write" << configPath;
            return 1;
        }
        qInfo() << "[Config]" << args[2] << "=" << args[3];
        return 0;
    }

    qWarning() << "[Config] usage: config get <key> | config set <key> <value>";
    return 1;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("mdsync-queue");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Inspect and maintain the multi-device task queue.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "YAML configuration file.", "path",
                                    mdq::YamlConfig::defaultConfigPath());
    parser.addOption(configOption);
    parser.addPositionalArgument("command",
        "list | clear | inspect-frame <hex> | replay <file> | config get <key> | config set <key> <value>");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    const QString configPath = parser.value(configOption);
    mdq::YamlConfig config;
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const YAML::Exception& e) {
            qWarning() << "[Config] cannot load" << configPath << ":" << e.what();
            return 1;
        }
    }

    const QString command = args.first();
    if (command == QLatin1String("list"))
        return listQueue(config);
    if (command == QLatin1String("clear"))
        return clearQueue(config);
    if (command == QLatin1String("inspect-frame") && args.size() == 2)
        return inspectFrame(args[1]);
    if (command == QLatin1String("replay") && args.size() == 2)
        return replayCapture(config, args[1]);
    if (command == QLatin1String("config"))
        return configCommand(config, configPath, args);

    qWarning() << "[Main] unknown command:" << command;
    parser.showHelp(1);
}
