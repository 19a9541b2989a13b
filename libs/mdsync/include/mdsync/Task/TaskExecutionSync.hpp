#pragma once

#include <mdsync/Task/TaskContext.hpp>
#include <mdsync/Task/TaskDefinitionSync.hpp>
#include <mdsync/Task/TaskExecution.hpp>

#include <vector>

namespace mdsync {

/// begin transaction, reflect each envelope and await its ack, commit.
class TaskExecutionSync : public TaskExecution {
public:
    TaskExecutionSync(std::shared_ptr<TaskDefinitionSync> task, TaskContext context);

    void execute(Done done) override;

private:
    void reflectNext(size_t index);
    void abort(const Error& error);
    void finish(const Error& error);

    std::shared_ptr<TaskDefinitionSync> task_;
    TaskContext context_;
    Done done_;
    std::vector<proto::d2d::Envelope> envelopes_;
};

} // namespace mdsync
