#pragma once

#include <mdsync/Message/GroupIdentity.hpp>
#include <mdsync/Store/IMessageStore.hpp>
#include <mdsync/Task/TaskDefinition.hpp>

#include <QList>
#include <QStringList>

#include "mdsync/csp.pb.h"

namespace mdsync {

/// Receiver of a send task: one contact, or a group with an optional subset
/// of members (empty toMembers means every member).
struct SendTarget {
    QString fromIdentity;
    QString receiverIdentity;
    GroupIdentity group;
    QStringList toMembers;
    quint64 messageId = 0;

    bool isGroup() const { return group.isValid(); }
    ConversationContext conversation() const;

    static SendTarget fromProto(const proto::task::SendTarget& target);
    void toProto(proto::task::SendTarget* target) const;
};

/// Common base of tasks that box one abstract message per recipient and
/// send it through the chat server.
class TaskDefinitionSend : public TaskDefinition {
public:
    const SendTarget& target() const { return target_; }
    const QString& fromIdentity() const { return target_.fromIdentity; }
    const QString& receiverIdentity() const { return target_.receiverIdentity; }
    const GroupIdentity& group() const { return target_.group; }
    const QStringList& toMembers() const { return target_.toMembers; }
    quint64 messageId() const { return target_.messageId; }

    virtual bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const = 0;

    /// Identities the message is boxed for, never including ownIdentity.
    virtual bool resolveRecipients(const IMessageStore& store, const QString& ownIdentity,
                                   QStringList& out, Error* error = nullptr) const;

    QString description() const override;
    std::shared_ptr<TaskExecution> createExecution(const TaskContext& context) override;

protected:
    explicit TaskDefinitionSend(SendTarget target)
        : TaskDefinition(TaskType::Persistent, true)
        , target_(std::move(target)) {}

    virtual const char* name() const = 0;

    /// Identities, group and message ID from the target.
    void fillHeader(proto::csp::AbstractMessage& message) const;

    SendTarget target_;
};

/// Text, location, contact profile picture, typing indicator and empty
/// messages built by the caller.
class TaskDefinitionSendAbstractMessage : public TaskDefinitionSend {
public:
    explicit TaskDefinitionSendAbstractMessage(const proto::csp::AbstractMessage& message);

    const proto::csp::AbstractMessage& message() const { return message_; }

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;
    QString description() const override;

protected:
    const char* name() const override { return "TaskDefinitionSendAbstractMessage"; }

private:
    proto::csp::AbstractMessage message_;
};

class TaskDefinitionSendBallotVote : public TaskDefinitionSend {
public:
    TaskDefinitionSendBallotVote(SendTarget target, const proto::csp::PollVote& vote);

    const proto::csp::PollVote& vote() const { return vote_; }

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSendBallotVote"; }

private:
    proto::csp::PollVote vote_;
};

class TaskDefinitionSendDeliveryReceipts : public TaskDefinitionSend {
public:
    TaskDefinitionSendDeliveryReceipts(SendTarget target,
                                       proto::csp::DeliveryReceipt::Status status,
                                       QList<quint64> receiptMessageIds,
                                       QList<quint64> receiptReadDates = {},
                                       QStringList excludeFromSending = {});

    proto::csp::DeliveryReceipt::Status status() const { return status_; }
    const QList<quint64>& receiptMessageIds() const { return receiptMessageIds_; }
    const QList<quint64>& receiptReadDates() const { return receiptReadDates_; }
    const QStringList& excludeFromSending() const { return excludeFromSending_; }

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    bool resolveRecipients(const IMessageStore& store, const QString& ownIdentity,
                           QStringList& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSendDeliveryReceipts"; }

private:
    proto::csp::DeliveryReceipt::Status status_;
    QList<quint64> receiptMessageIds_;
    QList<quint64> receiptReadDates_;
    QStringList excludeFromSending_;
};

class TaskDefinitionSendGroupCreate : public TaskDefinitionSend {
public:
    TaskDefinitionSendGroupCreate(SendTarget target, QStringList members);

    const QStringList& members() const { return members_; }

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    /// The group may not be stored yet; recipients come from the task.
    bool resolveRecipients(const IMessageStore& store, const QString& ownIdentity,
                           QStringList& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSendGroupCreate"; }

private:
    QStringList members_;
};

class TaskDefinitionSendGroupRename : public TaskDefinitionSend {
public:
    TaskDefinitionSendGroupRename(SendTarget target, QString name);

    const QString& groupName() const { return name_; }

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSendGroupRename"; }

private:
    QString name_;
};

class TaskDefinitionSendGroupSetPhoto : public TaskDefinitionSend {
public:
    TaskDefinitionSendGroupSetPhoto(SendTarget target, const proto::common::Blob& blob,
                                    quint32 size);

    const proto::common::Blob& blob() const { return blob_; }
    quint32 size() const { return size_; }

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSendGroupSetPhoto"; }

private:
    proto::common::Blob blob_;
    quint32 size_;
};

class TaskDefinitionSendGroupDeletePhoto : public TaskDefinitionSend {
public:
    explicit TaskDefinitionSendGroupDeletePhoto(SendTarget target)
        : TaskDefinitionSend(std::move(target)) {}

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSendGroupDeletePhoto"; }
};

class TaskDefinitionSendGroupLeave : public TaskDefinitionSend {
public:
    TaskDefinitionSendGroupLeave(SendTarget target, QStringList hiddenContacts = {});

    const QStringList& hiddenContacts() const { return hiddenContacts_; }

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSendGroupLeave"; }

private:
    QStringList hiddenContacts_;
};

/// Dissolves a group this identity created: a setup with no members.
class TaskDefinitionGroupDissolve : public TaskDefinitionSend {
public:
    explicit TaskDefinitionGroupDissolve(SendTarget target)
        : TaskDefinitionSend(std::move(target)) {}

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionGroupDissolve"; }
};

class TaskDefinitionSendDeleteEditMessage : public TaskDefinitionSend {
public:
    TaskDefinitionSendDeleteEditMessage(SendTarget target, const proto::csp::DeleteMessage& remove);
    TaskDefinitionSendDeleteEditMessage(SendTarget target, const proto::csp::EditMessage& edit);

    bool isEdit() const { return isEdit_; }
    const proto::csp::DeleteMessage& deleteMessage() const { return remove_; }
    const proto::csp::EditMessage& editMessage() const { return edit_; }

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSendDeleteEditMessage"; }

private:
    bool isEdit_;
    proto::csp::DeleteMessage remove_;
    proto::csp::EditMessage edit_;
};

class TaskDefinitionSendReaction : public TaskDefinitionSend {
public:
    TaskDefinitionSendReaction(SendTarget target, const proto::csp::Reaction& reaction);

    const proto::csp::Reaction& reaction() const { return reaction_; }

    bool buildMessage(proto::csp::AbstractMessage& out, Error* error = nullptr) const override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

protected:
    const char* name() const override { return "TaskDefinitionSendReaction"; }

private:
    proto::csp::Reaction reaction_;
};

/// Sends an empty message to each contact so forward security sessions
/// advance.
class TaskDefinitionRunForwardSecurityRefreshSteps : public TaskDefinition {
public:
    explicit TaskDefinitionRunForwardSecurityRefreshSteps(QStringList contactIdentities);

    const QStringList& contactIdentities() const { return contactIdentities_; }

    QString description() const override;
    std::shared_ptr<TaskExecution> createExecution(const TaskContext& context) override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

private:
    QStringList contactIdentities_;
};

} // namespace mdsync
