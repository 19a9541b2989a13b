#include <mdsync/Task/TaskDefinitionSend.hpp>
#include <mdsync/Task/TaskExecutionSend.hpp>
#include <mdsync/Message/MessageTypeMapper.hpp>

namespace mdsync {

namespace {

bool requireGroup(const SendTarget& target, const char* name, Error* error)
{
    if (target.isGroup())
        return true;
    return fail(error, ErrorCode::BadMessage,
                QStringLiteral("%1 without group").arg(QLatin1String(name)));
}

QStringList toStringList(const google::protobuf::RepeatedPtrField<std::string>& values)
{
    QStringList out;
    out.reserve(values.size());
    for (const std::string& value : values)
        out.append(QString::fromStdString(value));
    return out;
}

void appendAll(const QStringList& values, google::protobuf::RepeatedPtrField<std::string>* out)
{
    for (const QString& value : values)
        out->Add(value.toStdString());
}

void withoutOwnIdentity(QStringList& members, const QString& ownIdentity)
{
    members.removeAll(ownIdentity);
    members.removeDuplicates();
}

} // namespace

ConversationContext SendTarget::conversation() const
{
    if (isGroup())
        return ConversationContext::forGroup(group);
    return ConversationContext::contact(receiverIdentity);
}

SendTarget SendTarget::fromProto(const proto::task::SendTarget& target)
{
    SendTarget out;
    out.fromIdentity = QString::fromStdString(target.from_identity());
    out.receiverIdentity = QString::fromStdString(target.receiver_identity());
    if (target.has_group())
        out.group = GroupIdentity::fromProto(target.group());
    out.toMembers = toStringList(target.to_members());
    out.messageId = target.message_id();
    return out;
}

void SendTarget::toProto(proto::task::SendTarget* target) const
{
    target->set_from_identity(fromIdentity.toStdString());
    target->set_receiver_identity(receiverIdentity.toStdString());
    if (isGroup())
        group.toProto(target->mutable_group());
    appendAll(toMembers, target->mutable_to_members());
    target->set_message_id(messageId);
}

// TaskDefinitionSend

QString TaskDefinitionSend::description() const
{
    return QStringLiteral("<%1 %2>")
        .arg(QLatin1String(name()), QString::number(target_.messageId, 16));
}

std::shared_ptr<TaskExecution> TaskDefinitionSend::createExecution(const TaskContext& context)
{
    return std::make_shared<TaskExecutionSend>(self<TaskDefinitionSend>(), context);
}

bool TaskDefinitionSend::resolveRecipients(const IMessageStore& store, const QString& ownIdentity,
                                           QStringList& out, Error* error) const
{
    QStringList members;
    if (target_.isGroup()) {
        GroupRecord record;
        if (!store.findGroup(target_.group, &record)) {
            return fail(error, ErrorCode::GroupNotFound,
                        QStringLiteral("group %1 of %2")
                            .arg(QString::number(target_.group.id, 16), target_.group.creator));
        }
        members = target_.toMembers.isEmpty() ? record.members : target_.toMembers;
    } else {
        if (target_.receiverIdentity.isEmpty() || !store.findContact(target_.receiverIdentity)) {
            return fail(error, ErrorCode::ReceiverNotFound,
                        QStringLiteral("contact '%1'").arg(target_.receiverIdentity));
        }
        members.append(target_.receiverIdentity);
    }

    withoutOwnIdentity(members, ownIdentity);
    out = members;
    return true;
}

void TaskDefinitionSend::fillHeader(proto::csp::AbstractMessage& message) const
{
    message.set_message_id(target_.messageId);
    message.set_from_identity(target_.fromIdentity.toStdString());
    if (target_.isGroup())
        target_.group.toProto(message.mutable_group());
    else
        message.set_to_identity(target_.receiverIdentity.toStdString());
    message.set_date(createdAtMs());
}

// TaskDefinitionSendAbstractMessage

namespace {

SendTarget targetOf(const proto::csp::AbstractMessage& message)
{
    SendTarget target;
    target.fromIdentity = QString::fromStdString(message.from_identity());
    target.receiverIdentity = QString::fromStdString(message.to_identity());
    if (message.has_group())
        target.group = GroupIdentity::fromProto(message.group());
    target.messageId = message.message_id();
    return target;
}

} // namespace

TaskDefinitionSendAbstractMessage::TaskDefinitionSendAbstractMessage(
    const proto::csp::AbstractMessage& message)
    : TaskDefinitionSend(targetOf(message))
    , message_(message)
{
}

bool TaskDefinitionSendAbstractMessage::buildMessage(proto::csp::AbstractMessage& out,
                                                     Error* error) const
{
    if (message_.content_case() == proto::csp::AbstractMessage::CONTENT_NOT_SET)
        return fail(error, ErrorCode::BadMessage, QStringLiteral("message without content"));
    out = message_;
    return true;
}

void TaskDefinitionSendAbstractMessage::encodeDefinition(proto::task::TaskRecord& record) const
{
    *record.mutable_send_abstract_message()->mutable_message() = message_;
}

QString TaskDefinitionSendAbstractMessage::description() const
{
    return QStringLiteral("<%1 %2 %3>")
        .arg(QLatin1String(name()),
             MessageTypeMapper::typeName(MessageTypeMapper::multiDeviceTypeOf(message_)),
             QString::number(target_.messageId, 16));
}

// TaskDefinitionSendBallotVote

TaskDefinitionSendBallotVote::TaskDefinitionSendBallotVote(SendTarget target,
                                                           const proto::csp::PollVote& vote)
    : TaskDefinitionSend(std::move(target))
    , vote_(vote)
{
}

bool TaskDefinitionSendBallotVote::buildMessage(proto::csp::AbstractMessage& out, Error*) const
{
    proto::csp::AbstractMessage message;
    fillHeader(message);
    if (target_.isGroup())
        *message.mutable_group_poll_vote() = vote_;
    else
        *message.mutable_poll_vote() = vote_;
    out.Swap(&message);
    return true;
}

void TaskDefinitionSendBallotVote::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_send_ballot_vote();
    target_.toProto(definition->mutable_target());
    *definition->mutable_vote() = vote_;
}

// TaskDefinitionSendDeliveryReceipts

TaskDefinitionSendDeliveryReceipts::TaskDefinitionSendDeliveryReceipts(
    SendTarget target, proto::csp::DeliveryReceipt::Status status,
    QList<quint64> receiptMessageIds, QList<quint64> receiptReadDates,
    QStringList excludeFromSending)
    : TaskDefinitionSend(std::move(target))
    , status_(status)
    , receiptMessageIds_(std::move(receiptMessageIds))
    , receiptReadDates_(std::move(receiptReadDates))
    , excludeFromSending_(std::move(excludeFromSending))
{
}

bool TaskDefinitionSendDeliveryReceipts::buildMessage(proto::csp::AbstractMessage& out,
                                                      Error* error) const
{
    if (receiptMessageIds_.isEmpty())
        return fail(error, ErrorCode::BadMessage, QStringLiteral("delivery receipt without messages"));

    proto::csp::AbstractMessage message;
    fillHeader(message);
    auto* receipt = target_.isGroup() ? message.mutable_group_delivery_receipt()
                                      : message.mutable_delivery_receipt();
    receipt->set_status(status_);
    for (quint64 id : receiptMessageIds_)
        receipt->add_message_ids(id);
    out.Swap(&message);
    return true;
}

bool TaskDefinitionSendDeliveryReceipts::resolveRecipients(const IMessageStore& store,
                                                           const QString& ownIdentity,
                                                           QStringList& out, Error* error) const
{
    QStringList members;
    if (!TaskDefinitionSend::resolveRecipients(store, ownIdentity, members, error))
        return false;
    for (const QString& excluded : excludeFromSending_)
        members.removeAll(excluded);
    out = members;
    return true;
}

void TaskDefinitionSendDeliveryReceipts::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_send_delivery_receipts();
    target_.toProto(definition->mutable_target());
    definition->set_status(status_);
    for (quint64 id : receiptMessageIds_)
        definition->add_receipt_message_ids(id);
    for (quint64 date : receiptReadDates_)
        definition->add_receipt_read_dates(date);
    appendAll(excludeFromSending_, definition->mutable_exclude_from_sending());
}

// TaskDefinitionSendGroupCreate

TaskDefinitionSendGroupCreate::TaskDefinitionSendGroupCreate(SendTarget target, QStringList members)
    : TaskDefinitionSend(std::move(target))
    , members_(std::move(members))
{
}

bool TaskDefinitionSendGroupCreate::buildMessage(proto::csp::AbstractMessage& out,
                                                 Error* error) const
{
    if (!requireGroup(target_, name(), error))
        return false;

    proto::csp::AbstractMessage message;
    fillHeader(message);
    appendAll(members_, message.mutable_group_setup()->mutable_members());
    out.Swap(&message);
    return true;
}

bool TaskDefinitionSendGroupCreate::resolveRecipients(const IMessageStore&,
                                                      const QString& ownIdentity,
                                                      QStringList& out, Error*) const
{
    QStringList members = target_.toMembers.isEmpty() ? members_ : target_.toMembers;
    withoutOwnIdentity(members, ownIdentity);
    out = members;
    return true;
}

void TaskDefinitionSendGroupCreate::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_send_group_create();
    target_.toProto(definition->mutable_target());
    appendAll(members_, definition->mutable_members());
}

// TaskDefinitionSendGroupRename

TaskDefinitionSendGroupRename::TaskDefinitionSendGroupRename(SendTarget target, QString name)
    : TaskDefinitionSend(std::move(target))
    , name_(std::move(name))
{
}

bool TaskDefinitionSendGroupRename::buildMessage(proto::csp::AbstractMessage& out,
                                                 Error* error) const
{
    if (!requireGroup(target_, name(), error))
        return false;

    proto::csp::AbstractMessage message;
    fillHeader(message);
    message.mutable_group_name()->set_name(name_.toStdString());
    out.Swap(&message);
    return true;
}

void TaskDefinitionSendGroupRename::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_send_group_rename();
    target_.toProto(definition->mutable_target());
    definition->set_name(name_.toStdString());
}

// TaskDefinitionSendGroupSetPhoto

TaskDefinitionSendGroupSetPhoto::TaskDefinitionSendGroupSetPhoto(SendTarget target,
                                                                 const proto::common::Blob& blob,
                                                                 quint32 size)
    : TaskDefinitionSend(std::move(target))
    , blob_(blob)
    , size_(size)
{
}

bool TaskDefinitionSendGroupSetPhoto::buildMessage(proto::csp::AbstractMessage& out,
                                                   Error* error) const
{
    if (!requireGroup(target_, name(), error))
        return false;

    proto::csp::AbstractMessage message;
    fillHeader(message);
    auto* picture = message.mutable_group_set_profile_picture();
    *picture->mutable_blob() = blob_;
    picture->set_size(size_);
    out.Swap(&message);
    return true;
}

void TaskDefinitionSendGroupSetPhoto::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_send_group_set_photo();
    target_.toProto(definition->mutable_target());
    *definition->mutable_blob() = blob_;
    definition->set_size(size_);
}

// TaskDefinitionSendGroupDeletePhoto

bool TaskDefinitionSendGroupDeletePhoto::buildMessage(proto::csp::AbstractMessage& out,
                                                      Error* error) const
{
    if (!requireGroup(target_, name(), error))
        return false;

    proto::csp::AbstractMessage message;
    fillHeader(message);
    message.mutable_group_delete_profile_picture();
    out.Swap(&message);
    return true;
}

void TaskDefinitionSendGroupDeletePhoto::encodeDefinition(proto::task::TaskRecord& record) const
{
    target_.toProto(record.mutable_send_group_delete_photo()->mutable_target());
}

// TaskDefinitionSendGroupLeave

TaskDefinitionSendGroupLeave::TaskDefinitionSendGroupLeave(SendTarget target,
                                                           QStringList hiddenContacts)
    : TaskDefinitionSend(std::move(target))
    , hiddenContacts_(std::move(hiddenContacts))
{
}

bool TaskDefinitionSendGroupLeave::buildMessage(proto::csp::AbstractMessage& out,
                                                Error* error) const
{
    if (!requireGroup(target_, name(), error))
        return false;

    proto::csp::AbstractMessage message;
    fillHeader(message);
    message.mutable_group_leave();
    out.Swap(&message);
    return true;
}

void TaskDefinitionSendGroupLeave::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_send_group_leave();
    target_.toProto(definition->mutable_target());
    appendAll(hiddenContacts_, definition->mutable_hidden_contacts());
}

// TaskDefinitionGroupDissolve

bool TaskDefinitionGroupDissolve::buildMessage(proto::csp::AbstractMessage& out,
                                               Error* error) const
{
    if (!requireGroup(target_, name(), error))
        return false;

    proto::csp::AbstractMessage message;
    fillHeader(message);
    message.mutable_group_setup();
    out.Swap(&message);
    return true;
}

void TaskDefinitionGroupDissolve::encodeDefinition(proto::task::TaskRecord& record) const
{
    target_.toProto(record.mutable_group_dissolve()->mutable_target());
}

// TaskDefinitionSendDeleteEditMessage

TaskDefinitionSendDeleteEditMessage::TaskDefinitionSendDeleteEditMessage(
    SendTarget target, const proto::csp::DeleteMessage& remove)
    : TaskDefinitionSend(std::move(target))
    , isEdit_(false)
    , remove_(remove)
{
}

TaskDefinitionSendDeleteEditMessage::TaskDefinitionSendDeleteEditMessage(
    SendTarget target, const proto::csp::EditMessage& edit)
    : TaskDefinitionSend(std::move(target))
    , isEdit_(true)
    , edit_(edit)
{
}

bool TaskDefinitionSendDeleteEditMessage::buildMessage(proto::csp::AbstractMessage& out,
                                                       Error*) const
{
    proto::csp::AbstractMessage message;
    fillHeader(message);
    if (isEdit_) {
        *(target_.isGroup() ? message.mutable_group_edit_message()
                            : message.mutable_edit_message()) = edit_;
    } else {
        *(target_.isGroup() ? message.mutable_group_delete_message()
                            : message.mutable_delete_message()) = remove_;
    }
    out.Swap(&message);
    return true;
}

void TaskDefinitionSendDeleteEditMessage::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_send_delete_edit_message();
    target_.toProto(definition->mutable_target());
    if (isEdit_)
        *definition->mutable_edit() = edit_;
    else
        *definition->mutable_remove() = remove_;
}

// TaskDefinitionSendReaction

TaskDefinitionSendReaction::TaskDefinitionSendReaction(SendTarget target,
                                                       const proto::csp::Reaction& reaction)
    : TaskDefinitionSend(std::move(target))
    , reaction_(reaction)
{
}

bool TaskDefinitionSendReaction::buildMessage(proto::csp::AbstractMessage& out,
                                              Error* error) const
{
    if (reaction_.action_case() == proto::csp::Reaction::ACTION_NOT_SET)
        return fail(error, ErrorCode::BadMessage, QStringLiteral("reaction without action"));

    proto::csp::AbstractMessage message;
    fillHeader(message);
    *(target_.isGroup() ? message.mutable_group_reaction() : message.mutable_reaction()) = reaction_;
    out.Swap(&message);
    return true;
}

void TaskDefinitionSendReaction::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_send_reaction();
    target_.toProto(definition->mutable_target());
    *definition->mutable_reaction() = reaction_;
}

// TaskDefinitionRunForwardSecurityRefreshSteps

TaskDefinitionRunForwardSecurityRefreshSteps::TaskDefinitionRunForwardSecurityRefreshSteps(
    QStringList contactIdentities)
    : TaskDefinition(TaskType::Persistent, true)
    , contactIdentities_(std::move(contactIdentities))
{
}

QString TaskDefinitionRunForwardSecurityRefreshSteps::description() const
{
    return QStringLiteral("<TaskDefinitionRunForwardSecurityRefreshSteps %1 contacts>")
        .arg(contactIdentities_.size());
}

std::shared_ptr<TaskExecution> TaskDefinitionRunForwardSecurityRefreshSteps::createExecution(
    const TaskContext& context)
{
    return std::make_shared<TaskExecutionForwardSecurityRefresh>(
        self<TaskDefinitionRunForwardSecurityRefreshSteps>(), context);
}

void TaskDefinitionRunForwardSecurityRefreshSteps::encodeDefinition(
    proto::task::TaskRecord& record) const
{
    appendAll(contactIdentities_,
              record.mutable_forward_security_refresh()->mutable_contact_identities());
}

} // namespace mdsync
