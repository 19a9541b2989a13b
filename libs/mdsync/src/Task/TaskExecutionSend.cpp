#include <mdsync/Task/TaskExecutionSend.hpp>
#include <mdsync/Crypto/IContactCryptor.hpp>
#include <mdsync/Frame/ChatServerPayload.hpp>
#include <mdsync/Mediator/MediatorMessenger.hpp>
#include <mdsync/Message/EnvelopeBuilder.hpp>
#include <mdsync/Message/MessageTypeMapper.hpp>
#include <mdsync/Store/IIdentityStore.hpp>
#include <mdsync/Store/IMessageStore.hpp>
#include <QLoggingCategory>
#include <QtEndian>

Q_DECLARE_LOGGING_CATEGORY(lcTaskQueue)

namespace mdsync {

bool sendMessageBox(const TaskContext& context, const proto::csp::AbstractMessage& message,
                    const QString& recipient, const QByteArray& nonce, Error* error)
{
    OutgoingMessageBox outgoing;
    if (!context.contactCryptor->box(EnvelopeBuilder::serializeMessage(message), recipient, nonce,
                                     outgoing.box, error))
        return false;

    outgoing.fromIdentity = QString::fromStdString(message.from_identity());
    outgoing.toIdentity = recipient;
    outgoing.messageId = message.message_id();
    outgoing.createdAt = QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(message.date()), Qt::UTC);
    outgoing.flags = static_cast<uint8_t>(message.flags());
    outgoing.nonce = nonce;

    if (!context.messenger->sendChatServerPayload(ChatServerPayload::encodeOutgoingMessage(outgoing)))
        return fail(error, ErrorCode::SendFailed,
                    QStringLiteral("message %1 to %2 not sent")
                        .arg(QString::number(message.message_id(), 16), recipient));
    return true;
}

// TaskExecutionSend

TaskExecutionSend::TaskExecutionSend(std::shared_ptr<TaskDefinitionSend> task, TaskContext context)
    : task_(std::move(task))
    , context_(std::move(context))
{
}

void TaskExecutionSend::execute(Done done)
{
    done_ = std::move(done);

    if (!context_.messenger || !context_.store || !context_.contactCryptor
        || !context_.envelopeBuilder) {
        finish(Error(ErrorCode::ExecutionFailed, QStringLiteral("send without collaborators")));
        return;
    }

    Error error;
    if (!task_->buildMessage(message_, &error)) {
        finish(error);
        return;
    }

    const QString ownIdentity = context_.identityStore ? context_.identityStore->identity()
                                                       : task_->fromIdentity();
    if (!task_->resolveRecipients(*context_.store, ownIdentity, recipients_, &error)) {
        finish(error);
        return;
    }

    reflect_ = context_.reflectionPolicy.shouldReflect(MessageTypeMapper::multiDeviceTypeOf(message_),
                                                       context_.messenger->isMultiDeviceActive());
    if (!reflect_) {
        sendToRecipients();
        return;
    }

    QList<QByteArray> nonces;
    for (const QString& recipient : recipients_) {
        QByteArray nonce;
        if (!task_->nonceFor(recipient, context_.random, nonce, &error)) {
            finish(error);
            return;
        }
        nonces.append(nonce);
    }

    proto::d2d::Envelope envelope;
    if (!context_.envelopeBuilder->outgoingMessage(message_, task_->target().conversation(), nonces,
                                                   envelope, &error)) {
        finish(error);
        return;
    }

    auto self = shared_from_this();
    context_.messenger->reflect(envelope, [this, self](const Error& error, const QDateTime&) {
        if (!error.isOk()) {
            finish(error);
            return;
        }
        sendToRecipients();
    });
}

void TaskExecutionSend::sendToRecipients()
{
    Error error;
    for (const QString& recipient : recipients_) {
        QByteArray nonce;
        if (!task_->nonceFor(recipient, context_.random, nonce, &error)
            || !sendMessageBox(context_, message_, recipient, nonce, &error)) {
            finish(error);
            return;
        }
    }

    qCDebug(lcTaskQueue) << task_->description() << "sent to" << recipients_.size() << "recipients";

    if (!reflect_) {
        finish(Error());
        return;
    }
    reflectSent();
}

void TaskExecutionSend::reflectSent()
{
    Error error;
    proto::d2d::Envelope envelope;
    if (!context_.envelopeBuilder->outgoingMessageSent(task_->target().conversation(),
                                                       message_.message_id(), envelope, &error)) {
        finish(error);
        return;
    }

    auto self = shared_from_this();
    context_.messenger->reflect(envelope, [this, self](const Error& error, const QDateTime&) {
        finish(error);
    });
}

void TaskExecutionSend::finish(const Error& error)
{
    if (!done_)
        return;
    Done done = std::move(done_);
    done_ = nullptr;
    done(error);
}

// TaskExecutionForwardSecurityRefresh

TaskExecutionForwardSecurityRefresh::TaskExecutionForwardSecurityRefresh(
    std::shared_ptr<TaskDefinitionRunForwardSecurityRefreshSteps> task, TaskContext context)
    : task_(std::move(task))
    , context_(std::move(context))
{
}

void TaskExecutionForwardSecurityRefresh::execute(Done done)
{
    if (!context_.messenger || !context_.store || !context_.contactCryptor) {
        done(Error(ErrorCode::ExecutionFailed, QStringLiteral("refresh without collaborators")));
        return;
    }

    const QString ownIdentity = context_.identityStore ? context_.identityStore->identity()
                                                       : QString();
    Error error;
    for (const QString& contact : task_->contactIdentities()) {
        if (!context_.store->findContact(contact)) {
            qCWarning(lcTaskQueue) << "forward security refresh: unknown contact" << contact;
            continue;
        }

        QByteArray nonce;
        if (!task_->nonceFor(contact, context_.random, nonce, &error)) {
            done(error);
            return;
        }

        // The message ID is taken from the nonce so a retry boxes the same bytes.
        proto::csp::AbstractMessage message;
        message.set_message_id(qFromLittleEndian<quint64>(
            reinterpret_cast<const uchar*>(nonce.constData())));
        message.set_from_identity(ownIdentity.toStdString());
        message.set_to_identity(contact.toStdString());
        message.set_date(task_->createdAtMs());
        message.mutable_empty();

        if (!sendMessageBox(context_, message, contact, nonce, &error)) {
            done(error);
            return;
        }
    }
    done(Error());
}

} // namespace mdsync
