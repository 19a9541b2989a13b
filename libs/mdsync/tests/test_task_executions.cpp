#include <QtTest/QtTest>
#include <mdsync/Crypto/EnvelopeCryptor.hpp>
#include <mdsync/Frame/ChatServerPayload.hpp>
#include <mdsync/Frame/FrameCodec.hpp>
#include <mdsync/Mediator/MediatorMessenger.hpp>
#include <mdsync/Message/EnvelopeBuilder.hpp>
#include <mdsync/Reflect/ReflectedMessageProcessor.hpp>
#include <mdsync/Task/TaskContext.hpp>
#include <mdsync/Task/TaskDefinitionReceive.hpp>
#include <mdsync/Task/TaskDefinitionSend.hpp>
#include <mdsync/Task/TaskDefinitionSync.hpp>
#include <mdsync/Task/TaskExecution.hpp>
#include <mdsync/Transport/ReplayConnection.hpp>

#include "TestDoubles.hpp"

using namespace mdsync;
using namespace mdsync::test;

namespace {

struct Outcome {
    int calls = 0;
    Error error;

    TaskExecution::Done done()
    {
        return [this](const Error& e) {
            ++calls;
            error = e;
        };
    }
};

} // namespace

class TestTaskExecutions : public QObject {
    Q_OBJECT

private:
    ReplayConnection* connection_ = nullptr;
    EnvelopeCryptor* cryptor_ = nullptr;
    MediatorMessenger* messenger_ = nullptr;
    FakeIdentityStore* identity_ = nullptr;
    InMemoryMessageStore* store_ = nullptr;
    FakeContactCryptor* contactCryptor_ = nullptr;
    ReflectedMessageProcessor* processor_ = nullptr;
    EnvelopeBuilder* builder_ = nullptr;

    TaskContext context() const
    {
        TaskContext context;
        context.messenger = messenger_;
        context.store = store_;
        context.identityStore = identity_;
        context.contactCryptor = contactCryptor_;
        context.processor = processor_;
        context.envelopeBuilder = builder_;
        return context;
    }

    // Decrypts the envelope of the last reflect frame and acknowledges it.
    bool ackLastReflect(proto::d2d::Envelope* envelope = nullptr)
    {
        const QList<QByteArray> frames = connection_->writtenFrames();
        if (frames.isEmpty())
            return false;
        ReflectFrame reflect;
        if (!FrameCodec::decodeReflect(frames.last(), reflect))
            return false;
        if (envelope && !cryptor_->decryptEnvelope(reflect.envelopeCiphertext, *envelope))
            return false;
        connection_->feedFrame(FrameCodec::encodeReflectAck(reflect.reflectId,
                                                            QDateTime::currentDateTimeUtc()));
        return true;
    }

    QByteArray lastProxyPayload() const
    {
        const QList<QByteArray> frames = connection_->writtenFrames();
        QByteArray payload;
        if (frames.isEmpty() || !FrameCodec::decodeProxy(frames.last(), payload))
            return QByteArray();
        return payload;
    }

    static proto::csp::AbstractMessage text(const char* from, const char* to, quint64 id)
    {
        proto::csp::AbstractMessage message;
        message.set_message_id(id);
        message.set_from_identity(from);
        message.set_to_identity(to);
        message.set_date(1700000000000ULL);
        message.mutable_text()->set_text("hello");
        return message;
    }

private slots:
    void init()
    {
        connection_ = new ReplayConnection();
        connection_->simulateLogin();
        cryptor_ = new EnvelopeCryptor();
        cryptor_->setDeviceGroupKeys(DeviceGroupKeys::derive(QByteArray(32, '\x22')));
        messenger_ = new MediatorMessenger(connection_, cryptor_);
        messenger_->start();
        identity_ = new FakeIdentityStore(QStringLiteral("CONTACT1"));
        store_ = new InMemoryMessageStore();
        contactCryptor_ = new FakeContactCryptor();
        processor_ = new ReflectedMessageProcessor(store_, identity_);
        builder_ = new EnvelopeBuilder(identity_);
    }

    void cleanup()
    {
        delete builder_;
        delete processor_;
        delete contactCryptor_;
        delete store_;
        delete identity_;
        delete messenger_;
        delete cryptor_;
        delete connection_;
    }

    void testSendTextReflectsSendsAndMarksSent()
    {
        store_->addContact(QStringLiteral("CONTACT2"));
        auto task = std::make_shared<TaskDefinitionSendAbstractMessage>(
            text("CONTACT1", "CONTACT2", 0x42));

        Outcome outcome;
        task->createExecution(context())->execute(outcome.done());
        QCOMPARE(outcome.calls, 0);

        proto::d2d::Envelope outgoing;
        QVERIFY(ackLastReflect(&outgoing));
        QVERIFY(outgoing.has_outgoing_message());
        QCOMPARE(outgoing.outgoing_message().nonces_size(), 1);
        const QByteArray nonce = task->nonces().value(QStringLiteral("CONTACT2"));
        QCOMPARE(nonce.size(), 24);
        QCOMPARE(QByteArray::fromStdString(outgoing.outgoing_message().nonces(0)), nonce);

        // The box went out before the sent update was reflected
        const QList<QByteArray> frames = connection_->writtenFrames();
        QCOMPARE(frames.size(), 3);
        QByteArray payload;
        QVERIFY(FrameCodec::decodeProxy(frames.at(1), payload));
        OutgoingMessageBox box;
        QVERIFY(ChatServerPayload::decodeOutgoingMessage(payload, box));
        QCOMPARE(box.toIdentity, QString("CONTACT2"));
        QCOMPARE(box.nonce, nonce);
        QVERIFY(box.box.startsWith("CONTACT2:"));
        QCOMPARE(contactCryptor_->calls.size(), 1);

        proto::d2d::Envelope sent;
        QVERIFY(ackLastReflect(&sent));
        QVERIFY(sent.has_outgoing_message_update());
        QCOMPARE(outcome.calls, 1);
        QVERIFY(outcome.error.isOk());
    }

    void testRetriedSendReusesNonce()
    {
        store_->addContact(QStringLiteral("CONTACT2"));
        auto task = std::make_shared<TaskDefinitionSendAbstractMessage>(
            text("CONTACT1", "CONTACT2", 0x43));

        Outcome first;
        task->createExecution(context())->execute(first.done());
        connection_->setSendFails(true);
        QVERIFY(ackLastReflect());
        QCOMPARE(first.calls, 1);
        QCOMPARE(first.error.code, ErrorCode::SendFailed);

        connection_->setSendFails(false);
        Outcome second;
        task->createExecution(context())->execute(second.done());
        QVERIFY(ackLastReflect());
        QVERIFY(ackLastReflect());
        QCOMPARE(second.calls, 1);
        QVERIFY(second.error.isOk());

        QCOMPARE(contactCryptor_->calls.size(), 2);
        QCOMPARE(contactCryptor_->calls.at(0).nonce, contactCryptor_->calls.at(1).nonce);
        QCOMPARE(contactCryptor_->calls.at(0).plaintext, contactCryptor_->calls.at(1).plaintext);
    }

    void testSendWithoutMultiDeviceSkipsReflection()
    {
        cryptor_->setDeviceGroupKeys(nullptr);
        store_->addContact(QStringLiteral("CONTACT2"));
        auto task = std::make_shared<TaskDefinitionSendAbstractMessage>(
            text("CONTACT1", "CONTACT2", 0x44));

        Outcome outcome;
        task->createExecution(context())->execute(outcome.done());
        QCOMPARE(outcome.calls, 1);
        QVERIFY(outcome.error.isOk());
        QCOMPARE(connection_->writtenFrames().size(), 1);
        uint8_t type = 0;
        QVERIFY(ChatServerPayload::payloadType(lastProxyPayload(), type));
        QCOMPARE(type, ChatServerPayloadType::OUTGOING_MESSAGE);
    }

    void testSendToUnknownContactFails()
    {
        auto task = std::make_shared<TaskDefinitionSendAbstractMessage>(
            text("CONTACT1", "STRANGER", 0x45));
        Outcome outcome;
        task->createExecution(context())->execute(outcome.done());
        QCOMPARE(outcome.error.code, ErrorCode::ReceiverNotFound);
        QVERIFY(connection_->writtenFrames().isEmpty());
    }

    void testReceiveMessageReflectsPersistsAndAcks()
    {
        store_->addContact(QStringLiteral("CONTACT2"));
        const QByteArray nonce(24, 'r');
        auto task = std::make_shared<TaskDefinitionReceiveMessage>(
            text("CONTACT2", "CONTACT1", 0x50), nonce, QDateTime::currentDateTimeUtc());

        Outcome outcome;
        task->createExecution(context())->execute(outcome.done());
        proto::d2d::Envelope incoming;
        QVERIFY(ackLastReflect(&incoming));
        QVERIFY(incoming.has_incoming_message());
        QCOMPARE(QByteArray::fromStdString(incoming.incoming_message().nonce()), nonce);

        QCOMPARE(outcome.calls, 1);
        QVERIFY(outcome.error.isOk());
        QCOMPARE(store_->saved.size(), 1);
        QVERIFY(store_->isNonceProcessed(nonce));

        IncomingMessageAck ack;
        QVERIFY(ChatServerPayload::decodeIncomingMessageAck(lastProxyPayload(), ack));
        QCOMPARE(ack.senderIdentity, QString("CONTACT2"));
        QCOMPARE(ack.messageId, quint64(0x50));

        // Delivered again: acknowledged without reprocessing
        connection_->clearWritten();
        Outcome again;
        auto repeat = std::make_shared<TaskDefinitionReceiveMessage>(
            text("CONTACT2", "CONTACT1", 0x50), nonce, QDateTime::currentDateTimeUtc());
        repeat->createExecution(context())->execute(again.done());
        QCOMPARE(again.error.code, ErrorCode::MessageAlreadyProcessed);
        QCOMPARE(connection_->writtenFrames().size(), 1);
        QCOMPARE(store_->saved.size(), 1);
    }

    void testReceiveCallMessageIsNotAcked()
    {
        cryptor_->setDeviceGroupKeys(nullptr);
        store_->addContact(QStringLiteral("CONTACT2"));
        processor_->setCallMessageHandler([](const proto::csp::AbstractMessage&, MessageDirection) {});

        proto::csp::AbstractMessage offer;
        offer.set_message_id(0x51);
        offer.set_from_identity("CONTACT2");
        offer.mutable_call_offer()->set_call_id(9);
        auto task = std::make_shared<TaskDefinitionReceiveMessage>(
            offer, QByteArray(24, 'c'), QDateTime::currentDateTimeUtc());

        Outcome outcome;
        task->createExecution(context())->execute(outcome.done());
        QCOMPARE(outcome.error.code, ErrorCode::DoNotAckIncomingVoIPMessage);
        QVERIFY(connection_->writtenFrames().isEmpty());
    }

    void testReceiveReflectedAppliesAndAcks()
    {
        store_->addContact(QStringLiteral("CONTACT2"));
        proto::d2d::Envelope envelope;
        QVERIFY(builder_->outgoingMessage(text("CONTACT1", "CONTACT2", 0x60),
                                          ConversationContext::contact(QStringLiteral("CONTACT2")),
                                          {}, envelope));
        QByteArray ciphertext;
        QVERIFY(cryptor_->encryptEnvelope(envelope, ciphertext));

        const QByteArray reflectId = QByteArray::fromHex("0a000000");
        auto task = std::make_shared<TaskDefinitionReceiveReflectedMessage>(
            reflectId, ciphertext, QDateTime::currentDateTimeUtc());
        Outcome outcome;
        task->createExecution(context())->execute(outcome.done());

        QVERIFY(outcome.error.isOk());
        QCOMPARE(store_->saved.size(), 1);
        QCOMPARE(connection_->writtenFrames().last(), FrameCodec::encodeReflectedAck(reflectId));
    }

    void testUndecryptableReflectedIsStillAcked()
    {
        const QByteArray reflectId = QByteArray::fromHex("0b000000");
        auto task = std::make_shared<TaskDefinitionReceiveReflectedMessage>(
            reflectId, QByteArray(60, 'x'), QDateTime::currentDateTimeUtc());
        Outcome outcome;
        task->createExecution(context())->execute(outcome.done());

        QCOMPARE(outcome.error.code, ErrorCode::DecryptionFailed);
        QCOMPARE(connection_->writtenFrames().last(), FrameCodec::encodeReflectedAck(reflectId));
    }

    void testSettingsSyncRunsInTransaction()
    {
        proto::sync::Settings settings;
        settings.set_send_typing_indicators(true);
        auto task = std::make_shared<TaskDefinitionSettingsSync>(settings);

        Outcome outcome;
        task->createExecution(context())->execute(outcome.done());
        QCOMPARE(quint8(connection_->writtenFrames().last().at(0)), quint8(0x40));

        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::LockAck));
        proto::d2d::Envelope reflected;
        QVERIFY(ackLastReflect(&reflected));
        QVERIFY(reflected.settings_sync().update().send_typing_indicators());

        QCOMPARE(connection_->writtenFrames().last(), FrameCodec::encodeCommitTransaction());
        QCOMPARE(outcome.calls, 0);
        connection_->feedFrame(FrameCodec::encodeCommonHeader(MediatorFrameType::UnlockAck));
        QCOMPARE(outcome.calls, 1);
        QVERIFY(outcome.error.isOk());
    }

    void testSyncRequiresMultiDevice()
    {
        cryptor_->setDeviceGroupKeys(nullptr);
        auto task = std::make_shared<TaskDefinitionSettingsSync>(proto::sync::Settings());
        Outcome outcome;
        task->createExecution(context())->execute(outcome.done());
        QCOMPARE(outcome.error.code, ErrorCode::MultiDeviceNotRegistered);
        QVERIFY(connection_->writtenFrames().isEmpty());
    }
};

QTEST_MAIN(TestTaskExecutions)
#include "test_task_executions.moc"
