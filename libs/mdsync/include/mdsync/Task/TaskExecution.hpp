#pragma once

#include <mdsync/Error.hpp>

#include <functional>
#include <memory>

namespace mdsync {

/// One run of a task. execute() may finish synchronously or later from a
/// callback; either way done is called exactly once. Executions keep
/// themselves alive across asynchronous steps through shared_from_this().
class TaskExecution : public std::enable_shared_from_this<TaskExecution> {
public:
    using Done = std::function<void(const Error& error)>;

    virtual ~TaskExecution() = default;

    virtual void execute(Done done) = 0;
};

} // namespace mdsync
