#pragma once

#include <mdsync/Error.hpp>
#include <mdsync/Task/TaskDefinition.hpp>

#include <QByteArray>
#include <QList>

#include "mdsync/task.pb.h"

namespace mdsync {

/// Serialized form of task definitions. Decoding never restores the nonce
/// map: a task read back from storage draws fresh nonces for every
/// recipient.
class TaskCodec {
public:
    static void encode(const TaskDefinition& task, proto::task::TaskRecord& record);
    static TaskPtr decode(const proto::task::TaskRecord& record, Error* error = nullptr);

    static QByteArray encodeTask(const TaskDefinition& task);
    static TaskPtr decodeTask(const QByteArray& data, Error* error = nullptr);

    /// Writes the persistent tasks of the list, in order.
    static QByteArray encodeQueue(const QList<TaskPtr>& tasks);
    static bool decodeQueue(const QByteArray& data, QList<TaskPtr>& out, Error* error = nullptr);
};

} // namespace mdsync
