#pragma once

#include <mdsync/Error.hpp>
#include <mdsync/Crypto/RandomSource.hpp>
#include <mdsync/Store/IIdentityStore.hpp>
#include <mdsync/Store/IMessageStore.hpp>

#include <QList>

#include "mdsync/csp.pb.h"
#include "mdsync/d2d.pb.h"
#include "mdsync/sync.pb.h"

namespace mdsync {

/// Builds the envelopes this device reflects. Every envelope is stamped with
/// the sending device ID and 0 to 16 bytes of random padding.
class EnvelopeBuilder {
public:
    explicit EnvelopeBuilder(const IIdentityStore* identityStore,
                             RandomSource random = systemRandomSource());

    bool outgoingMessage(const proto::csp::AbstractMessage& message,
                         const ConversationContext& conversation,
                         const QList<QByteArray>& nonces,
                         proto::d2d::Envelope& out, Error* error = nullptr) const;
    bool outgoingMessageSent(const ConversationContext& conversation, quint64 messageId,
                             proto::d2d::Envelope& out, Error* error = nullptr) const;
    bool incomingMessage(const proto::csp::AbstractMessage& message, const QByteArray& nonce,
                         proto::d2d::Envelope& out, Error* error = nullptr) const;
    bool incomingMessage(const proto::d2d::IncomingMessage& incoming,
                         proto::d2d::Envelope& out, Error* error = nullptr) const;
    bool incomingMessageRead(const ConversationContext& conversation,
                             const QList<quint64>& messageIds, const QDateTime& readAt,
                             proto::d2d::Envelope& out, Error* error = nullptr) const;

    bool contactSync(const proto::sync::Contact& contact, bool create,
                     proto::d2d::Envelope& out, Error* error = nullptr) const;
    bool groupSync(const proto::sync::Group& group, bool create,
                   proto::d2d::Envelope& out, Error* error = nullptr) const;
    bool groupSyncRemove(const GroupIdentity& group,
                         proto::d2d::Envelope& out, Error* error = nullptr) const;
    bool settingsSync(const proto::sync::Settings& settings,
                      proto::d2d::Envelope& out, Error* error = nullptr) const;
    bool userProfileSync(const proto::sync::UserProfile& profile,
                         proto::d2d::Envelope& out, Error* error = nullptr) const;
    bool mdmParameterSync(const proto::sync::MdmParameters& parameters,
                          proto::d2d::Envelope& out, Error* error = nullptr) const;

    static void conversationId(const ConversationContext& conversation,
                               proto::d2d::ConversationId* out);
    static ConversationContext conversationFrom(const proto::d2d::ConversationId& id);
    static QByteArray serializeMessage(const proto::csp::AbstractMessage& message);

private:
    bool stamp(proto::d2d::Envelope& envelope, Error* error) const;

    const IIdentityStore* identityStore_;
    RandomSource random_;
};

} // namespace mdsync
