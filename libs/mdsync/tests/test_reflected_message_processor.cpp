#include <QtTest/QtTest>
#include <mdsync/Message/EnvelopeBuilder.hpp>
#include <mdsync/Reflect/ReflectedMessageProcessor.hpp>

#include "TestDoubles.hpp"

using namespace mdsync;
using namespace mdsync::test;

class TestReflectedMessageProcessor : public QObject {
    Q_OBJECT

private:
    static const QString kOwn;
    static const QString kPeer;

    FakeIdentityStore identity_{kOwn};
    EnvelopeBuilder builder_{&identity_};

    GroupIdentity testGroup() const
    {
        GroupIdentity group;
        group.id = 0x55;
        group.creator = kPeer;
        return group;
    }

    proto::csp::AbstractMessage textFrom(const QString& from, const QString& to, quint64 id)
    {
        proto::csp::AbstractMessage message;
        message.set_message_id(id);
        message.set_from_identity(from.toStdString());
        message.set_to_identity(to.toStdString());
        message.set_date(1700000000000ULL);
        message.mutable_text()->set_text("hello");
        return message;
    }

    proto::d2d::Envelope outgoing(const proto::csp::AbstractMessage& message,
                                  const ConversationContext& conversation)
    {
        proto::d2d::Envelope envelope;
        builder_.outgoingMessage(message, conversation, {}, envelope);
        return envelope;
    }

    proto::d2d::Envelope incoming(const proto::csp::AbstractMessage& message,
                                  const QByteArray& nonce = QByteArray(24, 'n'))
    {
        proto::d2d::Envelope envelope;
        builder_.incomingMessage(message, nonce, envelope);
        return envelope;
    }

    static QDateTime now() { return QDateTime::fromMSecsSinceEpoch(1700000005000LL, Qt::UTC); }

private slots:
    void testOutgoingTextIsSaved()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer);
        ReflectedMessageProcessor processor(&store, &identity_);

        Error error = processor.process(
            outgoing(textFrom(kOwn, kPeer, 1), ConversationContext::contact(kPeer)), now());
        QVERIFY2(error.isOk(), qPrintable(error.toString()));
        QCOMPARE(store.saved.size(), 1);
        QVERIFY(store.saved.first().direction == MessageDirection::Outgoing);
        QCOMPARE(store.saved.first().conversation.contactIdentity, kPeer);
    }

    void testDeprecatedGroupImageRejectedAsOutgoing()
    {
        InMemoryMessageStore store;
        store.addGroup(testGroup(), {kOwn, kPeer});
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::csp::AbstractMessage message;
        message.set_message_id(2);
        message.set_from_identity(kOwn.toStdString());
        testGroup().toProto(message.mutable_group());
        message.mutable_group_image()->set_blob_id("blob");

        Error error = processor.process(
            outgoing(message, ConversationContext::forGroup(testGroup())), now());
        QCOMPARE(error.code, ErrorCode::DeprecatedOutgoingType);
        QCOMPARE(store.persistenceCalls(), 0);
    }

    void testDeprecatedImageAcceptedAsIncoming()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer);
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::csp::AbstractMessage message;
        message.set_message_id(3);
        message.set_from_identity(kPeer.toStdString());
        message.mutable_deprecated_image()->set_blob_id("blob");

        Error error = processor.process(incoming(message), now());
        QVERIFY2(error.isOk(), qPrintable(error.toString()));
        QCOMPARE(store.saved.size(), 1);
    }

    void testReceiverNotFound()
    {
        InMemoryMessageStore store;
        ReflectedMessageProcessor processor(&store, &identity_);

        Error error = processor.process(
            outgoing(textFrom(kOwn, kPeer, 4), ConversationContext::contact(kPeer)), now());
        QCOMPARE(error.code, ErrorCode::ReceiverNotFound);
        QCOMPARE(error.category(), ErrorCategory::Resolution);
        QCOMPARE(store.persistenceCalls(), 0);
    }

    void testGroupNotFound()
    {
        InMemoryMessageStore store;
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::csp::AbstractMessage message;
        message.set_message_id(5);
        message.set_from_identity(kOwn.toStdString());
        testGroup().toProto(message.mutable_group());
        message.mutable_group_text()->set_text("hi");

        Error error = processor.process(
            outgoing(message, ConversationContext::forGroup(testGroup())), now());
        QCOMPARE(error.code, ErrorCode::GroupNotFound);
        QCOMPARE(store.persistenceCalls(), 0);
    }

    void testBlockedSenderDiscarded()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer, true);
        ReflectedMessageProcessor processor(&store, &identity_);

        Error error = processor.process(incoming(textFrom(kPeer, kOwn, 6)), now());
        QCOMPARE(error.code, ErrorCode::BlockUnknownContact);
        QCOMPARE(error.category(), ErrorCategory::Discardable);
        QCOMPARE(store.saved.size(), 0);
    }

    void testOutgoingSenderMismatch()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer);
        ReflectedMessageProcessor processor(&store, &identity_);

        Error error = processor.process(
            outgoing(textFrom(QStringLiteral("SOMEONE1"), kPeer, 7),
                     ConversationContext::contact(kPeer)), now());
        QCOMPARE(error.code, ErrorCode::MessageSenderMismatch);
    }

    void testEnvelopeTypeMismatch()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer);
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::d2d::Envelope envelope =
            outgoing(textFrom(kOwn, kPeer, 8), ConversationContext::contact(kPeer));
        envelope.mutable_outgoing_message()->set_type(proto::common::CspE2eMessageType::FILE);

        QCOMPARE(processor.process(envelope, now()).code, ErrorCode::BadMessage);
    }

    void testMalformedBody()
    {
        InMemoryMessageStore store;
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::d2d::Envelope envelope;
        envelope.mutable_outgoing_message()->set_body("\xff\xff\xff");
        QCOMPARE(processor.process(envelope, now()).code, ErrorCode::MalformedMessage);
    }

    void testEmptyEnvelope()
    {
        InMemoryMessageStore store;
        ReflectedMessageProcessor processor(&store, &identity_);
        QCOMPARE(processor.process(proto::d2d::Envelope(), now()).code,
                 ErrorCode::UnknownMessageType);
    }

    void testIncomingNonceProcessedOnce()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer);
        ReflectedMessageProcessor processor(&store, &identity_);

        const QByteArray nonce(24, 'x');
        QVERIFY(processor.process(incoming(textFrom(kPeer, kOwn, 9), nonce), now()).isOk());
        QVERIFY(store.isNonceProcessed(nonce));

        Error again = processor.process(incoming(textFrom(kPeer, kOwn, 9), nonce), now());
        QCOMPARE(again.code, ErrorCode::MessageAlreadyProcessed);
        QCOMPARE(store.saved.size(), 1);
    }

    void testVoipRoutedToHandler()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer);
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::csp::AbstractMessage message;
        message.set_message_id(10);
        message.set_from_identity(kPeer.toStdString());
        message.mutable_call_offer()->set_call_id(77);

        // Without a handler the message is discarded
        QCOMPARE(processor.process(incoming(message, QByteArray(24, 'a')), now()).code,
                 ErrorCode::MessageWontBeProcessed);

        QList<quint64> calls;
        processor.setCallMessageHandler([&calls](const proto::csp::AbstractMessage& m,
                                                 MessageDirection direction) {
            QVERIFY(direction == MessageDirection::Incoming);
            calls.append(m.call_offer().call_id());
        });
        QVERIFY(processor.process(incoming(message, QByteArray(24, 'b')), now()).isOk());
        QCOMPARE(calls, QList<quint64>{77});
        QCOMPARE(store.saved.size(), 0);
    }

    void testOutgoingTypingIndicatorNotProcessed()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer);
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::csp::AbstractMessage message;
        message.set_message_id(11);
        message.set_from_identity(kOwn.toStdString());
        message.mutable_typing_indicator()->set_typing(true);

        QCOMPARE(processor.process(outgoing(message, ConversationContext::contact(kPeer)), now()).code,
                 ErrorCode::MessageWontBeProcessed);
    }

    void testOutgoingSentUpdateIsIdempotent()
    {
        InMemoryMessageStore store;
        const auto conversation = ConversationContext::contact(kPeer);
        store.addMessage(conversation, 12);
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::d2d::Envelope envelope;
        QVERIFY(builder_.outgoingMessageSent(conversation, 12, envelope));

        QVERIFY(processor.process(envelope, now()).isOk());
        QCOMPARE(store.message(conversation, 12).sentAt, now());
        QCOMPARE(store.updateCount, 1);

        QVERIFY(processor.process(envelope, now().addSecs(60)).isOk());
        QCOMPARE(store.message(conversation, 12).sentAt, now());
        QCOMPARE(store.updateCount, 1);

        // Unknown messages are skipped
        QVERIFY(builder_.outgoingMessageSent(conversation, 999, envelope));
        QVERIFY(processor.process(envelope, now()).isOk());
        QCOMPARE(store.updateCount, 1);
    }

    void testIncomingReadUpdate()
    {
        InMemoryMessageStore store;
        const auto conversation = ConversationContext::contact(kPeer);
        store.addMessage(conversation, 13);
        ReflectedMessageProcessor processor(&store, &identity_);

        const QDateTime readAt = QDateTime::fromMSecsSinceEpoch(1700000001000LL, Qt::UTC);
        proto::d2d::Envelope envelope;
        QVERIFY(builder_.incomingMessageRead(conversation, {13}, readAt, envelope));

        QVERIFY(processor.process(envelope, now()).isOk());
        QVERIFY(processor.process(envelope, now()).isOk());
        QCOMPARE(store.message(conversation, 13).readAt, readAt);
        QCOMPARE(store.updateCount, 1);
    }

    void testReactionsAndEdits()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer);
        const auto conversation = ConversationContext::contact(kPeer);
        store.addMessage(conversation, 14);
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::csp::AbstractMessage reaction;
        reaction.set_message_id(15);
        reaction.set_from_identity(kPeer.toStdString());
        reaction.mutable_reaction()->set_message_id(14);
        reaction.mutable_reaction()->set_apply("+1");

        QVERIFY(processor.process(incoming(reaction, QByteArray(24, 'r')), now()).isOk());
        QVERIFY(processor.processIncoming(reaction, now()).isOk());
        QCOMPARE(store.message(conversation, 14).reactions,
                 QSet<QString>{kPeer + QStringLiteral(":+1")});
        QCOMPARE(store.updateCount, 1);

        proto::csp::AbstractMessage edit;
        edit.set_message_id(16);
        edit.set_from_identity(kPeer.toStdString());
        edit.set_date(1700000002000ULL);
        edit.mutable_edit_message()->set_message_id(14);
        edit.mutable_edit_message()->set_text("edited");
        QVERIFY(processor.processIncoming(edit, now()).isOk());
        QCOMPARE(store.message(conversation, 14).text, QString("edited"));

        edit.mutable_edit_message()->set_message_id(404);
        QCOMPARE(processor.processIncoming(edit, now()).code, ErrorCode::MessageToEditNotFound);

        proto::csp::AbstractMessage remove;
        remove.set_message_id(17);
        remove.set_from_identity(kPeer.toStdString());
        remove.mutable_delete_message()->set_message_id(14);
        QVERIFY(processor.processIncoming(remove, now()).isOk());
        QVERIFY(store.message(conversation, 14).deleted);
        QVERIFY(store.message(conversation, 14).reactions.isEmpty());

        remove.mutable_delete_message()->set_message_id(404);
        QCOMPARE(processor.processIncoming(remove, now()).code, ErrorCode::MessageToDeleteNotFound);
    }

    void testFileRequestsBlob()
    {
        InMemoryMessageStore store;
        store.addContact(kPeer);
        FakeBlobLoader blobs;
        ReflectedMessageProcessor processor(&store, &identity_, &blobs);

        proto::csp::AbstractMessage message;
        message.set_message_id(18);
        message.set_from_identity(kPeer.toStdString());
        message.mutable_file()->mutable_blob()->set_id("blob-18");

        QVERIFY(processor.processIncoming(message, now()).isOk());
        QCOMPARE(blobs.requests.size(), 1);
        QCOMPARE(blobs.requests.first().first, QByteArray("blob-18"));
        QCOMPARE(blobs.requests.first().second, quint64(18));
    }

    void testSyncEnvelopesReachStore()
    {
        InMemoryMessageStore store;
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::sync::Contact contact;
        contact.set_identity("NEWCONTA");
        proto::d2d::Envelope envelope;
        QVERIFY(builder_.contactSync(contact, true, envelope));
        QVERIFY(processor.process(envelope, now()).isOk());

        proto::sync::Settings settings;
        QVERIFY(builder_.settingsSync(settings, envelope));
        QVERIFY(processor.process(envelope, now()).isOk());
        QCOMPARE(store.syncCount, 2);

        store.failWrites = true;
        QCOMPARE(processor.process(envelope, now()).code, ErrorCode::PersistenceFailed);
    }

    void testGroupSetupNotResolvedFirst()
    {
        InMemoryMessageStore store;
        ReflectedMessageProcessor processor(&store, &identity_);

        proto::csp::AbstractMessage message;
        message.set_message_id(19);
        message.set_from_identity(kPeer.toStdString());
        testGroup().toProto(message.mutable_group());
        message.mutable_group_setup()->add_members(kOwn.toStdString());

        QVERIFY(processor.processIncoming(message, now()).isOk());
        QCOMPARE(store.controls.size(), 1);
        QVERIFY(store.controls.first().conversation.group == testGroup());
    }
};

const QString TestReflectedMessageProcessor::kOwn = QStringLiteral("OWNIDENT");
const QString TestReflectedMessageProcessor::kPeer = QStringLiteral("PEERIDEN");

QTEST_MAIN(TestReflectedMessageProcessor)
#include "test_reflected_message_processor.moc"
