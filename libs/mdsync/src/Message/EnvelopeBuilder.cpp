#include <mdsync/Message/EnvelopeBuilder.hpp>
#include <mdsync/Message/MessageTypeMapper.hpp>
#include <mdsync/Version.hpp>

namespace mdsync {

EnvelopeBuilder::EnvelopeBuilder(const IIdentityStore* identityStore, RandomSource random)
    : identityStore_(identityStore)
    , random_(std::move(random))
{
}

bool EnvelopeBuilder::stamp(proto::d2d::Envelope& envelope, Error* error) const
{
    QByteArray lengthByte;
    if (!randomBytes(random_, 1, lengthByte, error))
        return false;

    int paddingLength = static_cast<uint8_t>(lengthByte[0]) % (ENVELOPE_MAX_PADDING + 1);
    envelope.set_padding(std::string(static_cast<size_t>(paddingLength), '\0'));
    if (identityStore_)
        envelope.set_device_id(identityStore_->deviceId());
    return true;
}

void EnvelopeBuilder::conversationId(const ConversationContext& conversation,
                                     proto::d2d::ConversationId* out)
{
    if (conversation.isGroup())
        conversation.group.toProto(out->mutable_group());
    else
        out->set_contact(conversation.contactIdentity.toStdString());
}

ConversationContext EnvelopeBuilder::conversationFrom(const proto::d2d::ConversationId& id)
{
    if (id.has_group())
        return ConversationContext::forGroup(GroupIdentity::fromProto(id.group()));
    return ConversationContext::contact(QString::fromStdString(id.contact()));
}

QByteArray EnvelopeBuilder::serializeMessage(const proto::csp::AbstractMessage& message)
{
    QByteArray body(static_cast<int>(message.ByteSizeLong()), '\0');
    message.SerializeToArray(body.data(), body.size());
    return body;
}

bool EnvelopeBuilder::outgoingMessage(const proto::csp::AbstractMessage& message,
                                      const ConversationContext& conversation,
                                      const QList<QByteArray>& nonces,
                                      proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    auto* outgoing = envelope.mutable_outgoing_message();
    conversationId(conversation, outgoing->mutable_conversation());
    outgoing->set_message_id(message.message_id());
    outgoing->set_created_at(message.date());
    outgoing->set_type(MessageTypeMapper::multiDeviceTypeOf(message));
    QByteArray body = serializeMessage(message);
    outgoing->set_body(body.constData(), body.size());
    for (const QByteArray& nonce : nonces)
        outgoing->add_nonces(nonce.constData(), nonce.size());

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::outgoingMessageSent(const ConversationContext& conversation,
                                          quint64 messageId,
                                          proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    auto* update = envelope.mutable_outgoing_message_update()->add_updates();
    conversationId(conversation, update->mutable_conversation());
    update->set_message_id(messageId);
    update->mutable_sent();

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::incomingMessage(const proto::csp::AbstractMessage& message,
                                      const QByteArray& nonce,
                                      proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    auto* incoming = envelope.mutable_incoming_message();
    incoming->set_sender_identity(message.from_identity());
    incoming->set_message_id(message.message_id());
    incoming->set_created_at(message.date());
    incoming->set_type(MessageTypeMapper::multiDeviceTypeOf(message));
    QByteArray body = serializeMessage(message);
    incoming->set_body(body.constData(), body.size());
    incoming->set_nonce(nonce.constData(), nonce.size());

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::incomingMessage(const proto::d2d::IncomingMessage& incoming,
                                      proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    *envelope.mutable_incoming_message() = incoming;

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::incomingMessageRead(const ConversationContext& conversation,
                                          const QList<quint64>& messageIds,
                                          const QDateTime& readAt,
                                          proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    auto* updates = envelope.mutable_incoming_message_update();
    for (quint64 messageId : messageIds) {
        auto* update = updates->add_updates();
        conversationId(conversation, update->mutable_conversation());
        update->set_message_id(messageId);
        update->mutable_read()->set_at(static_cast<quint64>(readAt.toMSecsSinceEpoch()));
    }

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::contactSync(const proto::sync::Contact& contact, bool create,
                                  proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    if (create)
        *envelope.mutable_contact_sync()->mutable_create() = contact;
    else
        *envelope.mutable_contact_sync()->mutable_update() = contact;

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::groupSync(const proto::sync::Group& group, bool create,
                                proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    if (create)
        *envelope.mutable_group_sync()->mutable_create() = group;
    else
        *envelope.mutable_group_sync()->mutable_update() = group;

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::groupSyncRemove(const GroupIdentity& group,
                                      proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    group.toProto(envelope.mutable_group_sync()->mutable_remove()->mutable_group_identity());

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::settingsSync(const proto::sync::Settings& settings,
                                   proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    *envelope.mutable_settings_sync()->mutable_update() = settings;

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::userProfileSync(const proto::sync::UserProfile& profile,
                                      proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    *envelope.mutable_user_profile_sync()->mutable_update() = profile;

    out.Swap(&envelope);
    return true;
}

bool EnvelopeBuilder::mdmParameterSync(const proto::sync::MdmParameters& parameters,
                                       proto::d2d::Envelope& out, Error* error) const
{
    proto::d2d::Envelope envelope;
    if (!stamp(envelope, error))
        return false;

    *envelope.mutable_mdm_parameter_sync()->mutable_update() = parameters;

    out.Swap(&envelope);
    return true;
}

} // namespace mdsync
