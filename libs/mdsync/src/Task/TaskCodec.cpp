#include <mdsync/Task/TaskCodec.hpp>
#include <mdsync/Task/TaskDefinitionReceive.hpp>
#include <mdsync/Task/TaskDefinitionSend.hpp>
#include <mdsync/Task/TaskDefinitionSync.hpp>
#include <mdsync/Version.hpp>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTaskQueue)

namespace mdsync {

namespace {

using Record = proto::task::TaskRecord;

Record::Type toProto(TaskType type)
{
    switch (type) {
    case TaskType::Persistent: return Record::PERSISTENT;
    case TaskType::Volatile: return Record::VOLATILE;
    case TaskType::DropOnDisconnect: return Record::DROP_ON_DISCONNECT;
    }
    return Record::PERSISTENT;
}

TaskType fromProto(Record::Type type)
{
    switch (type) {
    case Record::VOLATILE: return TaskType::Volatile;
    case Record::DROP_ON_DISCONNECT: return TaskType::DropOnDisconnect;
    default: return TaskType::Persistent;
    }
}

Record::State toProto(TaskState state)
{
    switch (state) {
    case TaskState::Pending: return Record::PENDING;
    case TaskState::Executing: return Record::EXECUTING;
    case TaskState::Interrupted: return Record::INTERRUPTED;
    case TaskState::Done: return Record::DONE;
    }
    return Record::PENDING;
}

TaskState fromProto(Record::State state)
{
    switch (state) {
    case Record::EXECUTING: return TaskState::Executing;
    case Record::INTERRUPTED: return TaskState::Interrupted;
    case Record::DONE: return TaskState::Done;
    default: return TaskState::Pending;
    }
}

QStringList toStringList(const google::protobuf::RepeatedPtrField<std::string>& values)
{
    QStringList out;
    for (const std::string& value : values)
        out.append(QString::fromStdString(value));
    return out;
}

QList<quint64> toIdList(const google::protobuf::RepeatedField<uint64_t>& values)
{
    QList<quint64> out;
    for (uint64_t value : values)
        out.append(value);
    return out;
}

QDateTime fromMillis(quint64 millis)
{
    if (millis == 0)
        return QDateTime();
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(millis), Qt::UTC);
}

QByteArray bytes(const std::string& value)
{
    return QByteArray(value.data(), static_cast<int>(value.size()));
}

TaskPtr decodeDefinition(const Record& record)
{
    switch (record.definition_case()) {
    case Record::kSendAbstractMessage:
        return std::make_shared<TaskDefinitionSendAbstractMessage>(
            record.send_abstract_message().message());
    case Record::kSendBallotVote: {
        const auto& d = record.send_ballot_vote();
        return std::make_shared<TaskDefinitionSendBallotVote>(SendTarget::fromProto(d.target()),
                                                              d.vote());
    }
    case Record::kSendDeliveryReceipts: {
        const auto& d = record.send_delivery_receipts();
        return std::make_shared<TaskDefinitionSendDeliveryReceipts>(
            SendTarget::fromProto(d.target()), d.status(), toIdList(d.receipt_message_ids()),
            toIdList(d.receipt_read_dates()), toStringList(d.exclude_from_sending()));
    }
    case Record::kSendGroupCreate: {
        const auto& d = record.send_group_create();
        return std::make_shared<TaskDefinitionSendGroupCreate>(SendTarget::fromProto(d.target()),
                                                               toStringList(d.members()));
    }
    case Record::kSendGroupRename: {
        const auto& d = record.send_group_rename();
        return std::make_shared<TaskDefinitionSendGroupRename>(SendTarget::fromProto(d.target()),
                                                               QString::fromStdString(d.name()));
    }
    case Record::kSendGroupSetPhoto: {
        const auto& d = record.send_group_set_photo();
        return std::make_shared<TaskDefinitionSendGroupSetPhoto>(SendTarget::fromProto(d.target()),
                                                                 d.blob(), d.size());
    }
    case Record::kSendGroupDeletePhoto:
        return std::make_shared<TaskDefinitionSendGroupDeletePhoto>(
            SendTarget::fromProto(record.send_group_delete_photo().target()));
    case Record::kSendGroupLeave: {
        const auto& d = record.send_group_leave();
        return std::make_shared<TaskDefinitionSendGroupLeave>(SendTarget::fromProto(d.target()),
                                                              toStringList(d.hidden_contacts()));
    }
    case Record::kGroupDissolve:
        return std::make_shared<TaskDefinitionGroupDissolve>(
            SendTarget::fromProto(record.group_dissolve().target()));
    case Record::kSendDeleteEditMessage: {
        const auto& d = record.send_delete_edit_message();
        if (d.has_edit())
            return std::make_shared<TaskDefinitionSendDeleteEditMessage>(
                SendTarget::fromProto(d.target()), d.edit());
        if (d.has_remove())
            return std::make_shared<TaskDefinitionSendDeleteEditMessage>(
                SendTarget::fromProto(d.target()), d.remove());
        return nullptr;
    }
    case Record::kSendReaction: {
        const auto& d = record.send_reaction();
        return std::make_shared<TaskDefinitionSendReaction>(SendTarget::fromProto(d.target()),
                                                            d.reaction());
    }
    case Record::kProfileSync:
        return std::make_shared<TaskDefinitionProfileSync>(record.profile_sync().profile());
    case Record::kSettingsSync:
        return std::make_shared<TaskDefinitionSettingsSync>(record.settings_sync().settings());
    case Record::kUpdateContactSync: {
        const auto& contacts = record.update_contact_sync().contacts();
        return std::make_shared<TaskDefinitionUpdateContactSync>(
            std::vector<proto::sync::Contact>(contacts.begin(), contacts.end()));
    }
    case Record::kMdmParameterSync:
        return std::make_shared<TaskDefinitionMdmParameterSync>(
            record.mdm_parameter_sync().parameters());
    case Record::kReceiveMessage: {
        const auto& d = record.receive_message();
        return std::make_shared<TaskDefinitionReceiveMessage>(d.message(), bytes(d.nonce()),
                                                              fromMillis(d.received_at()));
    }
    case Record::kReceiveReflectedMessage: {
        const auto& d = record.receive_reflected_message();
        return std::make_shared<TaskDefinitionReceiveReflectedMessage>(
            bytes(d.reflect_id()), bytes(d.envelope_ciphertext()), fromMillis(d.reflected_at()));
    }
    case Record::kReflectIncomingMessage:
        return std::make_shared<TaskDefinitionReflectIncomingMessage>(
            record.reflect_incoming_message().incoming());
    case Record::kForwardSecurityRefresh:
        return std::make_shared<TaskDefinitionRunForwardSecurityRefreshSteps>(
            toStringList(record.forward_security_refresh().contact_identities()));
    case Record::DEFINITION_NOT_SET:
        break;
    }
    return nullptr;
}

} // namespace

void TaskCodec::encode(const TaskDefinition& task, proto::task::TaskRecord& record)
{
    record.Clear();
    record.set_type(toProto(task.type()));
    record.set_state(toProto(task.state()));
    record.set_retry(task.retry());
    record.set_retry_count(static_cast<uint32_t>(task.retryCount()));

    auto* nonces = record.mutable_nonces();
    for (auto it = task.nonces().constBegin(); it != task.nonces().constEnd(); ++it)
        (*nonces)[it.key().toStdString()] = it.value().toStdString();

    task.encodeDefinition(record);
}

TaskPtr TaskCodec::decode(const proto::task::TaskRecord& record, Error* error)
{
    TaskPtr task = decodeDefinition(record);
    if (!task) {
        fail(error, ErrorCode::MalformedMessage,
             QStringLiteral("task record with definition case %1")
                 .arg(static_cast<int>(record.definition_case())));
        return nullptr;
    }

    task->setType(fromProto(record.type()));
    task->setState(fromProto(record.state()));
    task->setRetry(record.retry());
    task->setRetryCount(static_cast<int>(record.retry_count()));
    // record.nonces() is deliberately not restored.
    return task;
}

QByteArray TaskCodec::encodeTask(const TaskDefinition& task)
{
    proto::task::TaskRecord record;
    encode(task, record);
    return QByteArray::fromStdString(record.SerializeAsString());
}

TaskPtr TaskCodec::decodeTask(const QByteArray& data, Error* error)
{
    proto::task::TaskRecord record;
    if (!record.ParseFromArray(data.constData(), data.size())) {
        fail(error, ErrorCode::MalformedMessage, QStringLiteral("task record does not parse"));
        return nullptr;
    }
    return decode(record, error);
}

QByteArray TaskCodec::encodeQueue(const QList<TaskPtr>& tasks)
{
    proto::task::TaskQueueSnapshot snapshot;
    snapshot.set_version(TASK_QUEUE_SNAPSHOT_VERSION);
    for (const TaskPtr& task : tasks) {
        if (task->type() != TaskType::Persistent)
            continue;
        encode(*task, *snapshot.add_tasks());
    }
    return QByteArray::fromStdString(snapshot.SerializeAsString());
}

bool TaskCodec::decodeQueue(const QByteArray& data, QList<TaskPtr>& out, Error* error)
{
    proto::task::TaskQueueSnapshot snapshot;
    if (!snapshot.ParseFromArray(data.constData(), data.size()))
        return fail(error, ErrorCode::MalformedMessage, QStringLiteral("task queue does not parse"));
    if (snapshot.version() != TASK_QUEUE_SNAPSHOT_VERSION)
        return fail(error, ErrorCode::MalformedMessage,
                    QStringLiteral("task queue version %1, expected %2")
                        .arg(snapshot.version()).arg(TASK_QUEUE_SNAPSHOT_VERSION));

    QList<TaskPtr> tasks;
    for (const proto::task::TaskRecord& record : snapshot.tasks()) {
        Error recordError;
        TaskPtr task = decode(record, &recordError);
        if (!task) {
            qCWarning(lcTaskQueue) << "skipping persisted task:" << recordError;
            continue;
        }
        tasks.append(task);
    }
    out = tasks;
    return true;
}

} // namespace mdsync
