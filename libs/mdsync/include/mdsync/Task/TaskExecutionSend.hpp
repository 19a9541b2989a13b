#pragma once

#include <mdsync/Task/TaskContext.hpp>
#include <mdsync/Task/TaskDefinitionSend.hpp>
#include <mdsync/Task/TaskExecution.hpp>

#include <QStringList>

#include "mdsync/csp.pb.h"

namespace mdsync {

/// Reflects the outgoing message (when multi-device is active and the type
/// is reflectable), boxes it once per recipient with the task's nonce for
/// that recipient, then reflects the sent update.
class TaskExecutionSend : public TaskExecution {
public:
    TaskExecutionSend(std::shared_ptr<TaskDefinitionSend> task, TaskContext context);

    void execute(Done done) override;

private:
    void sendToRecipients();
    void reflectSent();
    void finish(const Error& error);

    std::shared_ptr<TaskDefinitionSend> task_;
    TaskContext context_;
    Done done_;
    proto::csp::AbstractMessage message_;
    QStringList recipients_;
    bool reflect_ = false;
};

class TaskExecutionForwardSecurityRefresh : public TaskExecution {
public:
    TaskExecutionForwardSecurityRefresh(
        std::shared_ptr<TaskDefinitionRunForwardSecurityRefreshSteps> task, TaskContext context);

    void execute(Done done) override;

private:
    std::shared_ptr<TaskDefinitionRunForwardSecurityRefreshSteps> task_;
    TaskContext context_;
};

/// Boxes message for recipient and hands it to the chat server through a
/// proxy frame.
bool sendMessageBox(const TaskContext& context, const proto::csp::AbstractMessage& message,
                    const QString& recipient, const QByteArray& nonce, Error* error = nullptr);

} // namespace mdsync
