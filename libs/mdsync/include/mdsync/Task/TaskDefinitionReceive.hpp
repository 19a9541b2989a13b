#pragma once

#include <mdsync/Task/TaskDefinition.hpp>

#include <QByteArray>
#include <QDateTime>

#include "mdsync/csp.pb.h"
#include "mdsync/d2d.pb.h"

namespace mdsync {

/// A message delivered by the chat server, not yet persisted or acked.
class TaskDefinitionReceiveMessage : public TaskDefinition {
public:
    TaskDefinitionReceiveMessage(const proto::csp::AbstractMessage& message,
                                 QByteArray nonce, QDateTime receivedAt);

    const proto::csp::AbstractMessage& message() const { return message_; }
    const QByteArray& nonce() const { return nonce_; }
    const QDateTime& receivedAt() const { return receivedAt_; }

    QString description() const override;
    std::shared_ptr<TaskExecution> createExecution(const TaskContext& context) override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

private:
    proto::csp::AbstractMessage message_;
    QByteArray nonce_;
    QDateTime receivedAt_;
};

/// An envelope another device of the group reflected.
class TaskDefinitionReceiveReflectedMessage : public TaskDefinition {
public:
    TaskDefinitionReceiveReflectedMessage(QByteArray reflectId, QByteArray envelopeCiphertext,
                                          QDateTime reflectedAt);

    const QByteArray& reflectId() const { return reflectId_; }
    const QByteArray& envelopeCiphertext() const { return envelopeCiphertext_; }
    const QDateTime& reflectedAt() const { return reflectedAt_; }

    QString description() const override;
    std::shared_ptr<TaskExecution> createExecution(const TaskContext& context) override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

private:
    QByteArray reflectId_;
    QByteArray envelopeCiphertext_;
    QDateTime reflectedAt_;
};

/// Reflects an incoming message that was processed outside the queue.
class TaskDefinitionReflectIncomingMessage : public TaskDefinition {
public:
    explicit TaskDefinitionReflectIncomingMessage(const proto::d2d::IncomingMessage& incoming);

    const proto::d2d::IncomingMessage& incoming() const { return incoming_; }

    QString description() const override;
    std::shared_ptr<TaskExecution> createExecution(const TaskContext& context) override;
    void encodeDefinition(proto::task::TaskRecord& record) const override;

private:
    proto::d2d::IncomingMessage incoming_;
};

} // namespace mdsync
