#pragma once

#include <mdsync/Error.hpp>
#include <mdsync/Store/IBlobLoader.hpp>
#include <mdsync/Store/IIdentityStore.hpp>
#include <mdsync/Store/IMessageStore.hpp>

#include <QDateTime>
#include <functional>

#include "mdsync/csp.pb.h"
#include "mdsync/d2d.pb.h"

namespace mdsync {

/// Applies decrypted envelopes to the local store. Dispatch is over the
/// abstract message content case and is exhaustive; a content case without
/// a handler fails the build.
class ReflectedMessageProcessor {
public:
    using CallMessageHandler =
        std::function<void(const proto::csp::AbstractMessage& message, MessageDirection direction)>;

    ReflectedMessageProcessor(IMessageStore* store, const IIdentityStore* identityStore,
                              IBlobLoader* blobLoader = nullptr);

    void setCallMessageHandler(CallMessageHandler handler);

    Error process(const proto::d2d::Envelope& envelope, const QDateTime& reflectedAt);

    /// Persists a message received from the chat server. Nonce bookkeeping
    /// is the caller's.
    Error processIncoming(const proto::csp::AbstractMessage& message, const QDateTime& receivedAt);

private:
    Error processOutgoingMessage(const proto::d2d::OutgoingMessage& outgoing);
    Error processIncomingMessage(const proto::d2d::IncomingMessage& incoming);
    Error processOutgoingMessageUpdate(const proto::d2d::OutgoingMessageUpdate& update,
                                       const QDateTime& reflectedAt);
    Error processIncomingMessageUpdate(const proto::d2d::IncomingMessageUpdate& update);

    Error dispatch(const proto::csp::AbstractMessage& message,
                   const ConversationContext& conversation, MessageDirection direction);

    Error resolve(const proto::csp::AbstractMessage& message,
                  const ConversationContext& conversation, MessageDirection direction) const;
    Error saveContent(const proto::csp::AbstractMessage& message,
                      const ConversationContext& conversation, MessageDirection direction);
    Error applyControl(const proto::csp::AbstractMessage& message,
                       const ConversationContext& conversation, MessageDirection direction);
    Error rejectDeprecated(const proto::csp::AbstractMessage& message,
                           const ConversationContext& conversation, MessageDirection direction);
    Error routeCallMessage(const proto::csp::AbstractMessage& message,
                           MessageDirection direction);

    Error applyDeliveryReceipt(const proto::csp::DeliveryReceipt& receipt,
                               const ConversationContext& conversation);
    Error applyEdit(const proto::csp::EditMessage& edit, quint64 editedAtMs,
                    const ConversationContext& conversation);
    Error applyDelete(const proto::csp::DeleteMessage& remove,
                      const ConversationContext& conversation);
    Error applyReaction(const proto::csp::Reaction& reaction, const QString& sender,
                        const ConversationContext& conversation);

    void requestBlob(const proto::common::Blob& blob, const ConversationContext& conversation,
                     quint64 messageId);

    ConversationContext incomingConversation(const proto::csp::AbstractMessage& message) const;
    static bool parseMessage(const std::string& body, proto::csp::AbstractMessage& out,
                             Error* error);

    IMessageStore* store_;
    const IIdentityStore* identityStore_;
    IBlobLoader* blobLoader_;
    CallMessageHandler callMessageHandler_;
};

} // namespace mdsync
