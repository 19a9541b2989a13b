#include <mdsync/Reflect/ReflectedMessageProcessor.hpp>
#include <mdsync/Message/EnvelopeBuilder.hpp>
#include <mdsync/Message/MessageTypeMapper.hpp>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcReflect, "mdsync.reflect")

namespace mdsync {

namespace {

using Content = proto::csp::AbstractMessage;

QDateTime fromMillis(quint64 millis)
{
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(millis), Qt::UTC);
}

const char* directionName(MessageDirection direction)
{
    switch (direction) {
    case MessageDirection::Incoming: return "incoming";
    case MessageDirection::Outgoing: return "outgoing";
    }
    return "?";
}

QString typeNameOf(const proto::csp::AbstractMessage& message)
{
    return MessageTypeMapper::typeName(MessageTypeMapper::multiDeviceTypeOf(message));
}

} // namespace

ReflectedMessageProcessor::ReflectedMessageProcessor(IMessageStore* store,
                                                     const IIdentityStore* identityStore,
                                                     IBlobLoader* blobLoader)
    : store_(store)
    , identityStore_(identityStore)
    , blobLoader_(blobLoader)
{
}

void ReflectedMessageProcessor::setCallMessageHandler(CallMessageHandler handler)
{
    callMessageHandler_ = std::move(handler);
}

bool ReflectedMessageProcessor::parseMessage(const std::string& body,
                                             proto::csp::AbstractMessage& out, Error* error)
{
    if (!out.ParseFromString(body))
        return fail(error, ErrorCode::MalformedMessage,
                    QStringLiteral("message body of %1 bytes does not parse").arg(body.size()));
    return true;
}

Error ReflectedMessageProcessor::process(const proto::d2d::Envelope& envelope,
                                         const QDateTime& reflectedAt)
{
    using Envelope = proto::d2d::Envelope;

    qCDebug(lcReflect) << "process reflected envelope from device" << envelope.device_id()
                       << "reflected at" << reflectedAt;

    switch (envelope.content_case()) {
    case Envelope::kOutgoingMessage:
        return processOutgoingMessage(envelope.outgoing_message());
    case Envelope::kIncomingMessage:
        return processIncomingMessage(envelope.incoming_message());
    case Envelope::kOutgoingMessageUpdate:
        return processOutgoingMessageUpdate(envelope.outgoing_message_update(), reflectedAt);
    case Envelope::kIncomingMessageUpdate:
        return processIncomingMessageUpdate(envelope.incoming_message_update());
    case Envelope::kUserProfileSync:
        if (!store_->applyUserProfileSync(envelope.user_profile_sync()))
            return Error(ErrorCode::PersistenceFailed, QStringLiteral("user profile sync"));
        return Error();
    case Envelope::kContactSync:
        if (!store_->applyContactSync(envelope.contact_sync()))
            return Error(ErrorCode::PersistenceFailed, QStringLiteral("contact sync"));
        return Error();
    case Envelope::kGroupSync:
        if (!store_->applyGroupSync(envelope.group_sync()))
            return Error(ErrorCode::PersistenceFailed, QStringLiteral("group sync"));
        return Error();
    case Envelope::kSettingsSync:
        if (!store_->applySettingsSync(envelope.settings_sync()))
            return Error(ErrorCode::PersistenceFailed, QStringLiteral("settings sync"));
        return Error();
    case Envelope::kMdmParameterSync:
        if (!store_->applyMdmParameterSync(envelope.mdm_parameter_sync()))
            return Error(ErrorCode::PersistenceFailed, QStringLiteral("MDM parameter sync"));
        return Error();
    case Envelope::CONTENT_NOT_SET:
        break;
    }

    qCWarning(lcReflect) << "envelope without content";
    return Error(ErrorCode::UnknownMessageType, QStringLiteral("envelope without content"));
}

Error ReflectedMessageProcessor::processIncoming(const proto::csp::AbstractMessage& message,
                                                 const QDateTime& receivedAt)
{
    qCDebug(lcReflect) << "process incoming" << typeNameOf(message)
                       << QString::number(message.message_id(), 16) << "received at" << receivedAt;
    return dispatch(message, incomingConversation(message), MessageDirection::Incoming);
}

Error ReflectedMessageProcessor::processOutgoingMessage(const proto::d2d::OutgoingMessage& outgoing)
{
    Error error;
    proto::csp::AbstractMessage message;
    if (!parseMessage(outgoing.body(), message, &error))
        return error;

    if (MessageTypeMapper::multiDeviceTypeOf(message) != outgoing.type()) {
        return Error(ErrorCode::BadMessage,
                     QStringLiteral("envelope type %1 does not match body %2")
                         .arg(MessageTypeMapper::typeName(outgoing.type()), typeNameOf(message)));
    }

    if (identityStore_ && !message.from_identity().empty()
        && QString::fromStdString(message.from_identity()) != identityStore_->identity()) {
        return Error(ErrorCode::MessageSenderMismatch,
                     QStringLiteral("outgoing message from %1")
                         .arg(QString::fromStdString(message.from_identity())));
    }

    return dispatch(message, EnvelopeBuilder::conversationFrom(outgoing.conversation()),
                    MessageDirection::Outgoing);
}

Error ReflectedMessageProcessor::processIncomingMessage(const proto::d2d::IncomingMessage& incoming)
{
    Error error;
    proto::csp::AbstractMessage message;
    if (!parseMessage(incoming.body(), message, &error))
        return error;

    if (MessageTypeMapper::multiDeviceTypeOf(message) != incoming.type()) {
        return Error(ErrorCode::BadMessage,
                     QStringLiteral("envelope type %1 does not match body %2")
                         .arg(MessageTypeMapper::typeName(incoming.type()), typeNameOf(message)));
    }

    if (incoming.sender_identity() != message.from_identity()) {
        return Error(ErrorCode::MessageSenderMismatch,
                     QStringLiteral("envelope sender %1, message sender %2")
                         .arg(QString::fromStdString(incoming.sender_identity()),
                              QString::fromStdString(message.from_identity())));
    }

    const QByteArray nonce = QByteArray::fromStdString(incoming.nonce());
    if (!nonce.isEmpty() && store_->isNonceProcessed(nonce))
        return Error(ErrorCode::MessageAlreadyProcessed,
                     QStringLiteral("nonce %1").arg(QString::fromLatin1(nonce.toHex())));

    error = dispatch(message, incomingConversation(message), MessageDirection::Incoming);
    if (!nonce.isEmpty() && error.category() != ErrorCategory::Transient)
        store_->markNonceProcessed(nonce);
    return error;
}

Error ReflectedMessageProcessor::processOutgoingMessageUpdate(
    const proto::d2d::OutgoingMessageUpdate& update, const QDateTime& reflectedAt)
{
    using Update = proto::d2d::OutgoingMessageUpdate::Update;

    for (const Update& entry : update.updates()) {
        const ConversationContext conversation =
            EnvelopeBuilder::conversationFrom(entry.conversation());

        switch (entry.update_case()) {
        case Update::kSent: {
            StoredMessageState state;
            if (!store_->findMessage(conversation, entry.message_id(), &state)) {
                qCDebug(lcReflect) << "sent update for unknown message"
                                   << QString::number(entry.message_id(), 16);
                break;
            }
            if (state.sentAt.isValid())
                break;
            state.sentAt = reflectedAt;
            if (!store_->updateMessage(conversation, entry.message_id(), state))
                return Error(ErrorCode::PersistenceFailed, QStringLiteral("mark sent"));
            break;
        }
        case Update::UPDATE_NOT_SET:
            return Error(ErrorCode::BadMessage, QStringLiteral("outgoing message update without action"));
        }
    }
    return Error();
}

Error ReflectedMessageProcessor::processIncomingMessageUpdate(
    const proto::d2d::IncomingMessageUpdate& update)
{
    using Update = proto::d2d::IncomingMessageUpdate::Update;

    for (const Update& entry : update.updates()) {
        const ConversationContext conversation =
            EnvelopeBuilder::conversationFrom(entry.conversation());

        switch (entry.update_case()) {
        case Update::kRead: {
            StoredMessageState state;
            if (!store_->findMessage(conversation, entry.message_id(), &state)) {
                qCDebug(lcReflect) << "read update for unknown message"
                                   << QString::number(entry.message_id(), 16);
                break;
            }
            if (state.readAt.isValid())
                break;
            state.readAt = fromMillis(entry.read().at());
            if (!store_->updateMessage(conversation, entry.message_id(), state))
                return Error(ErrorCode::PersistenceFailed, QStringLiteral("mark read"));
            break;
        }
        case Update::UPDATE_NOT_SET:
            return Error(ErrorCode::BadMessage, QStringLiteral("incoming message update without action"));
        }
    }
    return Error();
}

ConversationContext ReflectedMessageProcessor::incomingConversation(
    const proto::csp::AbstractMessage& message) const
{
    if (MessageTypeMapper::isGroupMessage(message))
        return ConversationContext::forGroup(GroupIdentity::fromProto(message.group()));
    return ConversationContext::contact(QString::fromStdString(message.from_identity()));
}

Error ReflectedMessageProcessor::dispatch(const proto::csp::AbstractMessage& message,
                                          const ConversationContext& conversation,
                                          MessageDirection direction)
{
    const QString sender = QString::fromStdString(message.from_identity());

    switch (message.content_case()) {
    case Content::kText:
    case Content::kLocation:
    case Content::kPollSetup:
    case Content::kGroupText:
    case Content::kGroupLocation:
    case Content::kGroupPollSetup:
        return saveContent(message, conversation, direction);

    case Content::kFile: {
        Error error = saveContent(message, conversation, direction);
        if (error.isOk())
            requestBlob(message.file().blob(), conversation, message.message_id());
        return error;
    }
    case Content::kGroupFile: {
        Error error = saveContent(message, conversation, direction);
        if (error.isOk())
            requestBlob(message.group_file().blob(), conversation, message.message_id());
        return error;
    }

    case Content::kDeprecatedImage:
    case Content::kDeprecatedVideo:
    case Content::kDeprecatedAudio:
    case Content::kGroupImage:
    case Content::kGroupVideo:
    case Content::kGroupAudio:
        return rejectDeprecated(message, conversation, direction);

    case Content::kPollVote:
    case Content::kGroupPollVote:
    case Content::kContactDeleteProfilePicture:
    case Content::kContactRequestProfilePicture:
    case Content::kGroupName:
    case Content::kGroupLeave:
    case Content::kGroupDeleteProfilePicture:
    case Content::kGroupSyncRequest:
    case Content::kGroupCallStart:
        return applyControl(message, conversation, direction);

    case Content::kContactSetProfilePicture: {
        Error error = applyControl(message, conversation, direction);
        if (error.isOk())
            requestBlob(message.contact_set_profile_picture().blob(), conversation,
                        message.message_id());
        return error;
    }
    case Content::kGroupSetProfilePicture: {
        Error error = applyControl(message, conversation, direction);
        if (error.isOk())
            requestBlob(message.group_set_profile_picture().blob(), conversation,
                        message.message_id());
        return error;
    }

    case Content::kGroupSetup:
        // A setup may create the group, so it is not resolved first.
        if (!store_->applyControlMessage(message, conversation, direction))
            return Error(ErrorCode::PersistenceFailed, QStringLiteral("group setup"));
        return Error();

    case Content::kTypingIndicator:
        if (direction == MessageDirection::Outgoing)
            return Error(ErrorCode::MessageWontBeProcessed, QStringLiteral("outgoing typing indicator"));
        return applyControl(message, conversation, direction);

    case Content::kEmpty:
        return Error(ErrorCode::MessageWontBeProcessed, QStringLiteral("empty message"));

    case Content::kDeliveryReceipt:
    case Content::kGroupDeliveryReceipt: {
        Error error = resolve(message, conversation, direction);
        if (!error.isOk())
            return error;
        return applyDeliveryReceipt(message.has_delivery_receipt() ? message.delivery_receipt()
                                                                   : message.group_delivery_receipt(),
                                    conversation);
    }

    case Content::kEditMessage:
    case Content::kGroupEditMessage: {
        Error error = resolve(message, conversation, direction);
        if (!error.isOk())
            return error;
        return applyEdit(message.has_edit_message() ? message.edit_message()
                                                    : message.group_edit_message(),
                         message.date(), conversation);
    }

    case Content::kDeleteMessage:
    case Content::kGroupDeleteMessage: {
        Error error = resolve(message, conversation, direction);
        if (!error.isOk())
            return error;
        return applyDelete(message.has_delete_message() ? message.delete_message()
                                                        : message.group_delete_message(),
                           conversation);
    }

    case Content::kReaction:
    case Content::kGroupReaction: {
        Error error = resolve(message, conversation, direction);
        if (!error.isOk())
            return error;
        return applyReaction(message.has_reaction() ? message.reaction() : message.group_reaction(),
                             sender, conversation);
    }

    case Content::kCallOffer:
    case Content::kCallAnswer:
    case Content::kCallIceCandidate:
    case Content::kCallHangup:
    case Content::kCallRinging:
        return routeCallMessage(message, direction);

    case Content::CONTENT_NOT_SET:
        break;
    }

    qCCritical(lcReflect) << "no handler for" << directionName(direction) << "message"
                          << QString::number(message.message_id(), 16)
                          << "with content case" << static_cast<int>(message.content_case());
    return Error(ErrorCode::UnknownMessageType,
                 QStringLiteral("content case %1").arg(static_cast<int>(message.content_case())));
}

Error ReflectedMessageProcessor::resolve(const proto::csp::AbstractMessage& message,
                                         const ConversationContext& conversation,
                                         MessageDirection direction) const
{
    if (MessageTypeMapper::isGroupMessage(message)) {
        if (!conversation.isGroup())
            return Error(ErrorCode::BadMessage, QStringLiteral("group message without group"));
        if (!store_->findGroup(conversation.group))
            return Error(ErrorCode::GroupNotFound,
                         QStringLiteral("group %1 of %2")
                             .arg(QString::number(conversation.group.id, 16),
                                  conversation.group.creator));
        return Error();
    }

    ContactRecord contact;
    if (conversation.contactIdentity.isEmpty()
        || !store_->findContact(conversation.contactIdentity, &contact)) {
        return Error(ErrorCode::ReceiverNotFound,
                     QStringLiteral("contact '%1'").arg(conversation.contactIdentity));
    }
    if (direction == MessageDirection::Incoming && contact.blocked)
        return Error(ErrorCode::BlockUnknownContact,
                     QStringLiteral("contact %1 is blocked").arg(contact.identity));
    return Error();
}

Error ReflectedMessageProcessor::saveContent(const proto::csp::AbstractMessage& message,
                                             const ConversationContext& conversation,
                                             MessageDirection direction)
{
    Error error = resolve(message, conversation, direction);
    if (!error.isOk())
        return error;

    if (!store_->save(message, conversation, direction))
        return Error(ErrorCode::PersistenceFailed,
                     QStringLiteral("save %1").arg(typeNameOf(message)));

    qCDebug(lcReflect) << "saved" << directionName(direction) << typeNameOf(message)
                       << QString::number(message.message_id(), 16);
    return Error();
}

Error ReflectedMessageProcessor::applyControl(const proto::csp::AbstractMessage& message,
                                              const ConversationContext& conversation,
                                              MessageDirection direction)
{
    Error error = resolve(message, conversation, direction);
    if (!error.isOk())
        return error;

    if (!store_->applyControlMessage(message, conversation, direction))
        return Error(ErrorCode::PersistenceFailed,
                     QStringLiteral("apply %1").arg(typeNameOf(message)));
    return Error();
}

Error ReflectedMessageProcessor::rejectDeprecated(const proto::csp::AbstractMessage& message,
                                                  const ConversationContext& conversation,
                                                  MessageDirection direction)
{
    if (direction == MessageDirection::Outgoing) {
        qCWarning(lcReflect) << typeNameOf(message) << "is deprecated as outgoing message";
        return Error(ErrorCode::DeprecatedOutgoingType,
                     QStringLiteral("%1 not supported as outgoing message").arg(typeNameOf(message)));
    }
    return saveContent(message, conversation, direction);
}

Error ReflectedMessageProcessor::routeCallMessage(const proto::csp::AbstractMessage& message,
                                                  MessageDirection direction)
{
    if (!callMessageHandler_) {
        qCWarning(lcReflect) << "no call handler for" << typeNameOf(message);
        return Error(ErrorCode::MessageWontBeProcessed, QStringLiteral("no call handler"));
    }
    callMessageHandler_(message, direction);
    return Error();
}

Error ReflectedMessageProcessor::applyDeliveryReceipt(const proto::csp::DeliveryReceipt& receipt,
                                                      const ConversationContext& conversation)
{
    for (quint64 messageId : receipt.message_ids()) {
        StoredMessageState state;
        if (!store_->findMessage(conversation, messageId, &state)) {
            qCDebug(lcReflect) << "delivery receipt for unknown message"
                               << QString::number(messageId, 16);
            continue;
        }
        if (state.deliveryStatus == receipt.status())
            continue;
        state.deliveryStatus = receipt.status();
        if (!store_->updateMessage(conversation, messageId, state))
            return Error(ErrorCode::PersistenceFailed, QStringLiteral("delivery receipt"));
    }
    return Error();
}

Error ReflectedMessageProcessor::applyEdit(const proto::csp::EditMessage& edit, quint64 editedAtMs,
                                           const ConversationContext& conversation)
{
    StoredMessageState state;
    if (!store_->findMessage(conversation, edit.message_id(), &state))
        return Error(ErrorCode::MessageToEditNotFound,
                     QStringLiteral("message %1").arg(QString::number(edit.message_id(), 16)));

    const QString text = QString::fromStdString(edit.text());
    const QDateTime editedAt = fromMillis(editedAtMs);
    if (state.deleted || (state.text == text && state.lastEditedAt == editedAt))
        return Error();

    state.text = text;
    state.lastEditedAt = editedAt;
    if (!store_->updateMessage(conversation, edit.message_id(), state))
        return Error(ErrorCode::PersistenceFailed, QStringLiteral("edit"));
    return Error();
}

Error ReflectedMessageProcessor::applyDelete(const proto::csp::DeleteMessage& remove,
                                             const ConversationContext& conversation)
{
    StoredMessageState state;
    if (!store_->findMessage(conversation, remove.message_id(), &state))
        return Error(ErrorCode::MessageToDeleteNotFound,
                     QStringLiteral("message %1").arg(QString::number(remove.message_id(), 16)));

    if (state.deleted)
        return Error();

    state.deleted = true;
    state.text.clear();
    state.reactions.clear();
    if (!store_->updateMessage(conversation, remove.message_id(), state))
        return Error(ErrorCode::PersistenceFailed, QStringLiteral("delete"));
    return Error();
}

Error ReflectedMessageProcessor::applyReaction(const proto::csp::Reaction& reaction,
                                               const QString& sender,
                                               const ConversationContext& conversation)
{
    StoredMessageState state;
    if (!store_->findMessage(conversation, reaction.message_id(), &state))
        return Error(ErrorCode::ReactionTargetNotFound,
                     QStringLiteral("message %1").arg(QString::number(reaction.message_id(), 16)));

    switch (reaction.action_case()) {
    case proto::csp::Reaction::kApply: {
        const QString key = sender + QLatin1Char(':') + QString::fromStdString(reaction.apply());
        if (state.reactions.contains(key))
            return Error();
        state.reactions.insert(key);
        break;
    }
    case proto::csp::Reaction::kWithdraw: {
        const QString key = sender + QLatin1Char(':') + QString::fromStdString(reaction.withdraw());
        if (!state.reactions.remove(key))
            return Error();
        break;
    }
    case proto::csp::Reaction::ACTION_NOT_SET:
        return Error(ErrorCode::BadMessage, QStringLiteral("reaction without action"));
    }

    if (!store_->updateMessage(conversation, reaction.message_id(), state))
        return Error(ErrorCode::PersistenceFailed, QStringLiteral("reaction"));
    return Error();
}

void ReflectedMessageProcessor::requestBlob(const proto::common::Blob& blob,
                                            const ConversationContext& conversation,
                                            quint64 messageId)
{
    if (!blobLoader_ || blob.id().empty())
        return;
    blobLoader_->requestDownload(blob, conversation, messageId);
}

} // namespace mdsync
