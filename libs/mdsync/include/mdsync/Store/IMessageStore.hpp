#pragma once

#include <mdsync/Message/GroupIdentity.hpp>

#include <QDateTime>
#include <QSet>
#include <QString>
#include <QStringList>

#include "mdsync/csp.pb.h"
#include "mdsync/d2d.pb.h"

namespace mdsync {

enum class MessageDirection {
    Incoming,
    Outgoing
};

struct ContactRecord {
    QString identity;
    bool blocked = false;
};

struct GroupRecord {
    GroupIdentity identity;
    QString name;
    QStringList members;
};

/// Either a contact or a group conversation.
struct ConversationContext {
    QString contactIdentity;
    GroupIdentity group;

    bool isGroup() const { return group.isValid(); }

    static ConversationContext contact(const QString& identity)
    {
        ConversationContext c;
        c.contactIdentity = identity;
        return c;
    }
    static ConversationContext forGroup(const GroupIdentity& identity)
    {
        ConversationContext c;
        c.group = identity;
        return c;
    }
};

/// Mutable state of a persisted message that reflected updates touch.
struct StoredMessageState {
    int deliveryStatus = 0;
    QDateTime sentAt;
    QDateTime readAt;
    QString text;
    QDateTime lastEditedAt;
    bool deleted = false;
    QSet<QString> reactions;
};

/// Local persistence consumed by the engine. Implementations live outside
/// the library; the engine never assumes anything about the schema.
class IMessageStore {
public:
    virtual ~IMessageStore() = default;

    virtual bool findContact(const QString& identity, ContactRecord* out = nullptr) const = 0;
    virtual bool findGroup(const GroupIdentity& group, GroupRecord* out = nullptr) const = 0;

    /// Persists a displayable message. Returns false when storage failed.
    virtual bool save(const proto::csp::AbstractMessage& message,
                      const ConversationContext& conversation,
                      MessageDirection direction) = 0;

    /// Applies a non-displayable control message (profile pictures, group
    /// setup/name/leave, typing indicators).
    virtual bool applyControlMessage(const proto::csp::AbstractMessage& message,
                                     const ConversationContext& conversation,
                                     MessageDirection direction) = 0;

    virtual bool findMessage(const ConversationContext& conversation, quint64 messageId,
                             StoredMessageState* out) const = 0;
    virtual bool updateMessage(const ConversationContext& conversation, quint64 messageId,
                               const StoredMessageState& state) = 0;

    virtual bool applyContactSync(const proto::d2d::ContactSync& sync) = 0;
    virtual bool applyGroupSync(const proto::d2d::GroupSync& sync) = 0;
    virtual bool applySettingsSync(const proto::d2d::SettingsSync& sync) = 0;
    virtual bool applyUserProfileSync(const proto::d2d::UserProfileSync& sync) = 0;
    virtual bool applyMdmParameterSync(const proto::d2d::MdmParameterSync& sync) = 0;

    virtual bool isNonceProcessed(const QByteArray& nonce) const = 0;
    virtual void markNonceProcessed(const QByteArray& nonce) = 0;
};

} // namespace mdsync
