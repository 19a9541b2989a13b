#pragma once

#include <mdsync/Task/TaskContext.hpp>
#include <mdsync/Task/TaskDefinitionReceive.hpp>
#include <mdsync/Task/TaskExecution.hpp>

namespace mdsync {

/// Nonce guard, reflect, persist, record nonce, ack to the chat server.
class TaskExecutionReceiveMessage : public TaskExecution {
public:
    TaskExecutionReceiveMessage(std::shared_ptr<TaskDefinitionReceiveMessage> task,
                                TaskContext context);

    void execute(Done done) override;

private:
    void persist();
    void acknowledge(const Error& outcome);
    void finish(const Error& error);

    std::shared_ptr<TaskDefinitionReceiveMessage> task_;
    TaskContext context_;
    Done done_;
};

/// Decrypt, process, then send the reflected-ack unless the outcome is
/// transient.
class TaskExecutionReceiveReflected : public TaskExecution {
public:
    TaskExecutionReceiveReflected(std::shared_ptr<TaskDefinitionReceiveReflectedMessage> task,
                                  TaskContext context);

    void execute(Done done) override;

private:
    std::shared_ptr<TaskDefinitionReceiveReflectedMessage> task_;
    TaskContext context_;
};

class TaskExecutionReflectIncoming : public TaskExecution {
public:
    TaskExecutionReflectIncoming(std::shared_ptr<TaskDefinitionReflectIncomingMessage> task,
                                 TaskContext context);

    void execute(Done done) override;

private:
    std::shared_ptr<TaskDefinitionReflectIncomingMessage> task_;
    TaskContext context_;
};

} // namespace mdsync
