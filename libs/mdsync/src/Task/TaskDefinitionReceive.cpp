#include <mdsync/Task/TaskDefinitionReceive.hpp>
#include <mdsync/Task/TaskExecutionReceive.hpp>
#include <mdsync/Message/MessageTypeMapper.hpp>

namespace mdsync {

namespace {

quint64 toMillis(const QDateTime& at)
{
    return at.isValid() ? static_cast<quint64>(at.toMSecsSinceEpoch()) : 0;
}

} // namespace

// TaskDefinitionReceiveMessage

TaskDefinitionReceiveMessage::TaskDefinitionReceiveMessage(
    const proto::csp::AbstractMessage& message, QByteArray nonce, QDateTime receivedAt)
    : TaskDefinition(TaskType::DropOnDisconnect, false)
    , message_(message)
    , nonce_(std::move(nonce))
    , receivedAt_(std::move(receivedAt))
{
}

QString TaskDefinitionReceiveMessage::description() const
{
    return QStringLiteral("<TaskDefinitionReceiveMessage %1 %2 from %3>")
        .arg(MessageTypeMapper::typeName(MessageTypeMapper::multiDeviceTypeOf(message_)),
             QString::number(message_.message_id(), 16),
             QString::fromStdString(message_.from_identity()));
}

std::shared_ptr<TaskExecution> TaskDefinitionReceiveMessage::createExecution(
    const TaskContext& context)
{
    return std::make_shared<TaskExecutionReceiveMessage>(self<TaskDefinitionReceiveMessage>(),
                                                         context);
}

void TaskDefinitionReceiveMessage::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_receive_message();
    *definition->mutable_message() = message_;
    definition->set_nonce(nonce_.constData(), nonce_.size());
    definition->set_received_at(toMillis(receivedAt_));
}

// TaskDefinitionReceiveReflectedMessage

TaskDefinitionReceiveReflectedMessage::TaskDefinitionReceiveReflectedMessage(
    QByteArray reflectId, QByteArray envelopeCiphertext, QDateTime reflectedAt)
    : TaskDefinition(TaskType::DropOnDisconnect, false)
    , reflectId_(std::move(reflectId))
    , envelopeCiphertext_(std::move(envelopeCiphertext))
    , reflectedAt_(std::move(reflectedAt))
{
}

QString TaskDefinitionReceiveReflectedMessage::description() const
{
    return QStringLiteral("<TaskDefinitionReceiveReflectedMessage %1>")
        .arg(QString::fromLatin1(reflectId_.toHex()));
}

std::shared_ptr<TaskExecution> TaskDefinitionReceiveReflectedMessage::createExecution(
    const TaskContext& context)
{
    return std::make_shared<TaskExecutionReceiveReflected>(
        self<TaskDefinitionReceiveReflectedMessage>(), context);
}

void TaskDefinitionReceiveReflectedMessage::encodeDefinition(proto::task::TaskRecord& record) const
{
    auto* definition = record.mutable_receive_reflected_message();
    definition->set_reflect_id(reflectId_.constData(), reflectId_.size());
    definition->set_envelope_ciphertext(envelopeCiphertext_.constData(),
                                        envelopeCiphertext_.size());
    definition->set_reflected_at(toMillis(reflectedAt_));
}

// TaskDefinitionReflectIncomingMessage

TaskDefinitionReflectIncomingMessage::TaskDefinitionReflectIncomingMessage(
    const proto::d2d::IncomingMessage& incoming)
    : TaskDefinition(TaskType::DropOnDisconnect, false)
    , incoming_(incoming)
{
}

QString TaskDefinitionReflectIncomingMessage::description() const
{
    return QStringLiteral("<TaskDefinitionReflectIncomingMessage %1 %2 from %3>")
        .arg(MessageTypeMapper::typeName(incoming_.type()),
             QString::number(incoming_.message_id(), 16),
             QString::fromStdString(incoming_.sender_identity()));
}

std::shared_ptr<TaskExecution> TaskDefinitionReflectIncomingMessage::createExecution(
    const TaskContext& context)
{
    return std::make_shared<TaskExecutionReflectIncoming>(
        self<TaskDefinitionReflectIncomingMessage>(), context);
}

void TaskDefinitionReflectIncomingMessage::encodeDefinition(proto::task::TaskRecord& record) const
{
    *record.mutable_reflect_incoming_message()->mutable_incoming() = incoming_;
}

} // namespace mdsync
