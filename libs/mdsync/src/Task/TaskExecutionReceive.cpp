#include <mdsync/Task/TaskExecutionReceive.hpp>
#include <mdsync/Frame/ChatServerPayload.hpp>
#include <mdsync/Mediator/MediatorMessenger.hpp>
#include <mdsync/Message/EnvelopeBuilder.hpp>
#include <mdsync/Message/MessageTypeMapper.hpp>
#include <mdsync/Reflect/ReflectedMessageProcessor.hpp>
#include <mdsync/Store/IMessageStore.hpp>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTaskQueue)

namespace mdsync {

namespace {

bool isCallMessage(const proto::csp::AbstractMessage& message)
{
    switch (message.content_case()) {
    case proto::csp::AbstractMessage::kCallOffer:
    case proto::csp::AbstractMessage::kCallAnswer:
    case proto::csp::AbstractMessage::kCallIceCandidate:
    case proto::csp::AbstractMessage::kCallHangup:
    case proto::csp::AbstractMessage::kCallRinging:
        return true;
    default:
        return false;
    }
}

} // namespace

// TaskExecutionReceiveMessage

TaskExecutionReceiveMessage::TaskExecutionReceiveMessage(
    std::shared_ptr<TaskDefinitionReceiveMessage> task, TaskContext context)
    : task_(std::move(task))
    , context_(std::move(context))
{
}

void TaskExecutionReceiveMessage::execute(Done done)
{
    done_ = std::move(done);

    if (!context_.messenger || !context_.store || !context_.processor
        || !context_.envelopeBuilder) {
        finish(Error(ErrorCode::ExecutionFailed, QStringLiteral("receive without collaborators")));
        return;
    }

    const QByteArray& nonce = task_->nonce();
    if (!nonce.isEmpty() && context_.store->isNonceProcessed(nonce)) {
        acknowledge(Error(ErrorCode::MessageAlreadyProcessed,
                          QStringLiteral("nonce %1").arg(QString::fromLatin1(nonce.toHex()))));
        return;
    }

    const proto::csp::AbstractMessage& message = task_->message();
    if (!context_.reflectionPolicy.shouldReflect(MessageTypeMapper::multiDeviceTypeOf(message),
                                                 context_.messenger->isMultiDeviceActive())) {
        persist();
        return;
    }

    Error error;
    proto::d2d::Envelope envelope;
    if (!context_.envelopeBuilder->incomingMessage(message, nonce, envelope, &error)) {
        finish(error);
        return;
    }

    auto self = shared_from_this();
    context_.messenger->reflect(envelope, [this, self](const Error& error, const QDateTime&) {
        if (!error.isOk()) {
            finish(error);
            return;
        }
        persist();
    });
}

void TaskExecutionReceiveMessage::persist()
{
    const proto::csp::AbstractMessage& message = task_->message();
    Error error = context_.processor->processIncoming(message, task_->receivedAt());
    if (error.category() == ErrorCategory::Transient) {
        finish(error);
        return;
    }

    if (!task_->nonce().isEmpty())
        context_.store->markNonceProcessed(task_->nonce());

    if (isCallMessage(message) && error.isOk()) {
        finish(Error(ErrorCode::DoNotAckIncomingVoIPMessage));
        return;
    }
    acknowledge(error);
}

void TaskExecutionReceiveMessage::acknowledge(const Error& outcome)
{
    IncomingMessageAck ack;
    ack.senderIdentity = QString::fromStdString(task_->message().from_identity());
    ack.messageId = task_->message().message_id();

    if (!context_.messenger->sendChatServerPayload(ChatServerPayload::encodeIncomingMessageAck(ack))) {
        finish(Error(ErrorCode::SendFailed, QStringLiteral("incoming message ack not sent")));
        return;
    }
    finish(outcome);
}

void TaskExecutionReceiveMessage::finish(const Error& error)
{
    if (!done_)
        return;
    Done done = std::move(done_);
    done_ = nullptr;
    done(error);
}

// TaskExecutionReceiveReflected

TaskExecutionReceiveReflected::TaskExecutionReceiveReflected(
    std::shared_ptr<TaskDefinitionReceiveReflectedMessage> task, TaskContext context)
    : task_(std::move(task))
    , context_(std::move(context))
{
}

void TaskExecutionReceiveReflected::execute(Done done)
{
    if (!context_.messenger || !context_.processor) {
        done(Error(ErrorCode::ExecutionFailed, QStringLiteral("receive without collaborators")));
        return;
    }

    Error error;
    proto::d2d::Envelope envelope;
    if (context_.messenger->cryptor()->decryptEnvelope(task_->envelopeCiphertext(), envelope, &error))
        error = context_.processor->process(envelope, task_->reflectedAt());
    else
        qCWarning(lcTaskQueue) << task_->description() << "not decrypted:" << error;

    if (error.category() != ErrorCategory::Transient
        && !context_.messenger->sendReflectedAck(task_->reflectId())) {
        done(Error(ErrorCode::SendFailed, QStringLiteral("reflected-ack not sent")));
        return;
    }
    done(error);
}

// TaskExecutionReflectIncoming

TaskExecutionReflectIncoming::TaskExecutionReflectIncoming(
    std::shared_ptr<TaskDefinitionReflectIncomingMessage> task, TaskContext context)
    : task_(std::move(task))
    , context_(std::move(context))
{
}

void TaskExecutionReflectIncoming::execute(Done done)
{
    if (!context_.messenger || !context_.envelopeBuilder) {
        done(Error(ErrorCode::ExecutionFailed, QStringLiteral("reflect without collaborators")));
        return;
    }
    if (!context_.messenger->isMultiDeviceActive()) {
        done(Error(ErrorCode::MultiDeviceNotRegistered));
        return;
    }

    Error error;
    proto::d2d::Envelope envelope;
    if (!context_.envelopeBuilder->incomingMessage(task_->incoming(), envelope, &error)) {
        done(error);
        return;
    }

    auto self = shared_from_this();
    context_.messenger->reflect(envelope, [self, done](const Error& error, const QDateTime&) {
        done(error);
    });
}

} // namespace mdsync
