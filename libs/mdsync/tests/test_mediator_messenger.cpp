#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <mdsync/Crypto/EnvelopeCryptor.hpp>
#include <mdsync/Frame/FrameCodec.hpp>
#include <mdsync/Mediator/MediatorMessenger.hpp>
#include <mdsync/Mediator/ProtocolLogger.hpp>
#include <mdsync/Transport/ReplayConnection.hpp>

using namespace mdsync;

namespace {

struct ReflectResult {
    int calls = 0;
    Error error;
    QDateTime ackedAt;

    MediatorMessenger::ReflectCallback callback()
    {
        return [this](const Error& e, const QDateTime& at) {
            ++calls;
            error = e;
            ackedAt = at;
        };
    }
};

proto::d2d::Envelope testEnvelope()
{
    proto::d2d::Envelope envelope;
    envelope.set_device_id(0x0102030405060708ULL);
    envelope.mutable_settings_sync()->mutable_update()->set_send_read_receipts(true);
    return envelope;
}

QStringList readLines(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
        return {};
    return QString::fromUtf8(file.readAll()).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
}

} // namespace

class TestMediatorMessenger : public QObject {
    Q_OBJECT

private:
    ReplayConnection* connection_ = nullptr;
    EnvelopeCryptor* cryptor_ = nullptr;
    MediatorMessenger* messenger_ = nullptr;

    QByteArray lastReflectId()
    {
        const QList<QByteArray> frames = connection_->writtenFrames();
        if (frames.isEmpty())
            return QByteArray();
        ReflectFrame reflect;
        if (!FrameCodec::decodeReflect(frames.last(), reflect))
            return QByteArray();
        return reflect.reflectId;
    }

private slots:
    void init()
    {
        connection_ = new ReplayConnection();
        connection_->simulateLogin();
        cryptor_ = new EnvelopeCryptor();
        cryptor_->setDeviceGroupKeys(DeviceGroupKeys::derive(QByteArray(32, '\x11')));
        messenger_ = new MediatorMessenger(connection_, cryptor_);
        messenger_->start();
    }

    void cleanup()
    {
        delete messenger_;
        delete cryptor_;
        delete connection_;
    }

    void testReflectCompletesOnAck()
    {
        ReflectResult result;
        messenger_->reflect(testEnvelope(), result.callback());

        QCOMPARE(connection_->writtenFrames().size(), 1);
        ReflectFrame reflect;
        QVERIFY(FrameCodec::decodeReflect(connection_->writtenFrames().first(), reflect));
        QCOMPARE(reflect.reflectId.size(), 4);

        proto::d2d::Envelope decrypted;
        QVERIFY(cryptor_->decryptEnvelope(reflect.envelopeCiphertext, decrypted));
        QVERIFY(decrypted.device_id() == 0x0102030405060708ULL);
        QVERIFY(decrypted.settings_sync().update().send_read_receipts());

        QCOMPARE(result.calls, 0);
        QCOMPARE(messenger_->pendingReflectCount(), 1);

        const QDateTime at = QDateTime::fromMSecsSinceEpoch(1700000000000LL, Qt::UTC);
        connection_->feedFrame(FrameCodec::encodeReflectAck(reflect.reflectId, at));
        QCOMPARE(result.calls, 1);
        QVERIFY(result.error.isOk());
        QCOMPARE(result.ackedAt, at);
        QCOMPARE(messenger_->pendingReflectCount(), 0);

        // A repeated ack has nothing left to complete
        connection_->feedFrame(FrameCodec::encodeReflectAck(reflect.reflectId, at));
        QCOMPARE(result.calls, 1);
    }

    void testReflectRequiresLogin()
    {
        connection_->simulateDisconnect();
        ReflectResult result;
        messenger_->reflect(testEnvelope(), result.callback());
        QCOMPARE(result.calls, 1);
        QCOMPARE(result.error.code, ErrorCode::NotConnectedToMediator);
        QVERIFY(connection_->writtenFrames().isEmpty());
    }

    void testReflectWithoutKeys()
    {
        cryptor_->setDeviceGroupKeys(nullptr);
        QVERIFY(!messenger_->isMultiDeviceActive());

        ReflectResult result;
        messenger_->reflect(testEnvelope(), result.callback());
        QCOMPARE(result.calls, 1);
        QCOMPARE(result.error.code, ErrorCode::KeysMissing);
    }

    void testReflectSendFailure()
    {
        connection_->setSendFails(true);
        ReflectResult result;
        messenger_->reflect(testEnvelope(), result.callback());
        QCOMPARE(result.calls, 1);
        QCOMPARE(result.error.code, ErrorCode::SendFailed);
        QCOMPARE(messenger_->pendingReflectCount(), 0);
    }

    void testReflectTimesOut()
    {
        messenger_->setReflectAckTimeout(20);
        ReflectResult result;
        messenger_->reflect(testEnvelope(), result.callback());
        const QByteArray reflectId = lastReflectId();

        QTRY_COMPARE(result.calls, 1);
        QCOMPARE(result.error.code, ErrorCode::ReflectAckTimeout);

        connection_->feedFrame(FrameCodec::encodeReflectAck(reflectId, QDateTime::currentDateTimeUtc()));
        QCOMPARE(result.calls, 1);
    }

    void testDisconnectFailsPendingReflects()
    {
        ReflectResult first;
        ReflectResult second;
        messenger_->reflect(testEnvelope(), first.callback());
        messenger_->reflect(testEnvelope(), second.callback());
        QCOMPARE(messenger_->pendingReflectCount(), 2);

        connection_->simulateDisconnect();
        QCOMPARE(first.calls, 1);
        QCOMPARE(second.calls, 1);
        QCOMPARE(first.error.code, ErrorCode::NotConnectedToMediator);
        QCOMPARE(second.error.code, ErrorCode::NotConnectedToMediator);
        QCOMPARE(messenger_->pendingReflectCount(), 0);
    }

    void testDestructionFailsPendingReflects()
    {
        messenger_->setReflectAckTimeout(20);
        ReflectResult result;
        Error transaction;
        messenger_->reflect(testEnvelope(), result.callback());
        messenger_->beginTransaction(proto::d2d::TransactionScope::SETTINGS_SYNC,
                                     [&](const Error& e) { transaction = e; });

        delete messenger_;
        messenger_ = nullptr;
        QCOMPARE(result.calls, 1);
        QCOMPARE(result.error.code, ErrorCode::NotConnectedToMediator);
        QCOMPARE(transaction.code, ErrorCode::NotConnectedToMediator);

        QTest::qWait(50);
        QCOMPARE(result.calls, 1);
    }

    void testInboundFramesAreRouted()
    {
        QSignalSpy reflected(messenger_, &MediatorMessenger::reflectedReceived);
        QSignalSpy dry(messenger_, &MediatorMessenger::reflectionQueueDry);
        QSignalSpy leader(messenger_, &MediatorMessenger::rolePromotedToLeader);
        QSignalSpy payload(messenger_, &MediatorMessenger::chatServerPayloadReceived);
        QSignalSpy errors(messenger_, &MediatorMessenger::protocolError);

        const QDateTime at = QDateTime::fromMSecsSinceEpoch(1700000000500LL, Qt::UTC);
        connection_->feedFrame(FrameCodec::encodeReflected(QByteArray::fromHex("0a0b0c0d"), at,
                                                           QByteArray("sealed")));
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::ReflectionQueueDry));
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::RolePromotedToLeader));
        connection_->feedFrame(FrameCodec::encodeProxy(QByteArray("chat")));

        QCOMPARE(reflected.count(), 1);
        QCOMPARE(reflected.at(0).at(0).toByteArray(), QByteArray::fromHex("0a0b0c0d"));
        QCOMPARE(reflected.at(0).at(1).toByteArray(), QByteArray("sealed"));
        QCOMPARE(reflected.at(0).at(2).toDateTime(), at);
        QCOMPARE(dry.count(), 1);
        QCOMPARE(leader.count(), 1);
        QCOMPARE(payload.count(), 1);
        QCOMPARE(payload.at(0).at(0).toByteArray(), QByteArray("chat"));
        QCOMPARE(errors.count(), 0);
    }

    void testClientOnlyAndShortFramesAreProtocolErrors()
    {
        QSignalSpy errors(messenger_, &MediatorMessenger::protocolError);
        QSignalSpy reflected(messenger_, &MediatorMessenger::reflectedReceived);

        connection_->feedFrame(FrameCodec::encodeReflect(QByteArray("x"), QByteArray(4, '\1')));
        connection_->feedFrame(QByteArray::fromHex("8200"));
        connection_->feedFrame(QByteArray::fromHex("82000000"));

        QCOMPARE(errors.count(), 3);
        QCOMPARE(reflected.count(), 0);
    }

    void testTransactionLockAndUnlock()
    {
        QList<ErrorCode> results;
        messenger_->beginTransaction(proto::d2d::TransactionScope::CONTACT_SYNC,
                                     [&results](const Error& e) { results.append(e.code); });
        QCOMPARE(connection_->writtenFrames().size(), 1);
        QCOMPARE(quint8(connection_->writtenFrames().last().at(0)), quint8(0x40));

        // Only one transaction step may be outstanding
        messenger_->commitTransaction([&results](const Error& e) { results.append(e.code); });
        QCOMPARE(results.size(), 1);
        QVERIFY(results.first() == ErrorCode::ReflectFailed);

        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::LockAck));
        QCOMPARE(results.size(), 2);
        QVERIFY(results.last() == ErrorCode::None);

        messenger_->commitTransaction([&results](const Error& e) { results.append(e.code); });
        QCOMPARE(connection_->writtenFrames().last(), FrameCodec::encodeCommitTransaction());
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::UnlockAck));
        QCOMPARE(results.size(), 3);
        QVERIFY(results.last() == ErrorCode::None);
    }

    void testTransactionRejected()
    {
        Error result;
        int calls = 0;
        messenger_->beginTransaction(proto::d2d::TransactionScope::GROUP_SYNC,
                                     [&](const Error& e) { ++calls; result = e; });
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::Rejected));
        QCOMPARE(calls, 1);
        QCOMPARE(result.code, ErrorCode::ReflectFailed);
    }

    void testTransactionFailsOnDisconnect()
    {
        Error result;
        messenger_->beginTransaction(proto::d2d::TransactionScope::SETTINGS_SYNC,
                                     [&](const Error& e) { result = e; });
        connection_->simulateDisconnect();
        QCOMPARE(result.code, ErrorCode::NotConnectedToMediator);
    }

    void testStopDetachesFromConnection()
    {
        QSignalSpy dry(messenger_, &MediatorMessenger::reflectionQueueDry);
        messenger_->stop();
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::ReflectionQueueDry));
        QCOMPARE(dry.count(), 0);
    }

    void testProtocolLoggerTsv()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("protocol.log"));

        ProtocolLogger logger;
        QVERIFY(logger.open(path.toStdString()));
        logger.attach(messenger_);

        ReflectResult result;
        messenger_->reflect(testEnvelope(), result.callback());
        connection_->feedFrame(FrameCodec::encodeReflectAck(lastReflectId(),
                                                            QDateTime::currentDateTimeUtc()));
        logger.close();

        const QStringList lines = readLines(path);
        QCOMPARE(lines.size(), 3);
        QVERIFY(lines.at(0).startsWith(QStringLiteral("TIME\tDIR\tFRAME")));
        QVERIFY(lines.at(1).contains(QStringLiteral("\tDevice->Mediator\tREFLECT\t")));
        QVERIFY(lines.at(2).contains(QStringLiteral("\tMediator->Device\tREFLECT_ACK\t16\t")));
    }

    void testProtocolLoggerJsonl()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("protocol.jsonl"));

        ProtocolLogger logger;
        logger.setFormat(ProtocolLogger::OutputFormat::Jsonl);
        QVERIFY(logger.open(path.toStdString()));
        logger.attach(messenger_);

        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::ReflectionQueueDry));
        logger.detach();
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::ReflectionQueueDry));
        logger.close();

        const QStringList lines = readLines(path);
        QCOMPARE(lines.size(), 1);
        QVERIFY(lines.first().contains(QStringLiteral("\"frame_name\":\"REFLECTION_QUEUE_DRY\"")));
        QVERIFY(lines.first().contains(QStringLiteral("\"size\":0")));
        QCOMPARE(ProtocolLogger::frameName(0x7f), std::string("UNKNOWN(0x7f)"));
    }
};

QTEST_MAIN(TestMediatorMessenger)
#include "test_mediator_messenger.moc"
