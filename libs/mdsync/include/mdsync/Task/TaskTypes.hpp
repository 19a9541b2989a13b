#pragma once

namespace mdsync {

enum class TaskType {
    Persistent,       // survives restarts
    Volatile,         // kept across disconnects, lost on restart
    DropOnDisconnect  // dropped by interrupt()
};

enum class TaskState {
    Pending,
    Executing,
    Interrupted,
    Done
};

const char* taskTypeName(TaskType type);
const char* taskStateName(TaskState state);

} // namespace mdsync
