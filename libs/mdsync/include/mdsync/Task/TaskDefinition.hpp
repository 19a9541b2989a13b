#pragma once

#include <mdsync/Error.hpp>
#include <mdsync/Crypto/RandomSource.hpp>
#include <mdsync/Task/TaskTypes.hpp>

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QString>
#include <memory>

#include "mdsync/task.pb.h"

namespace mdsync {

struct TaskContext;
class TaskExecution;

/// Base of every queued protocol action. Instances are always owned by a
/// std::shared_ptr so executions can keep their task alive.
class TaskDefinition : public std::enable_shared_from_this<TaskDefinition> {
public:
    virtual ~TaskDefinition() = default;

    TaskDefinition(const TaskDefinition&) = delete;
    TaskDefinition& operator=(const TaskDefinition&) = delete;

    virtual QString description() const = 0;
    virtual std::shared_ptr<TaskExecution> createExecution(const TaskContext& context) = 0;

    /// Fills the variant part of the record (the definition oneof).
    virtual void encodeDefinition(proto::task::TaskRecord& record) const = 0;

    TaskType type() const { return type_; }
    void setType(TaskType type) { type_ = type; }

    TaskState state() const { return state_; }
    void setState(TaskState state) { state_ = state; }

    bool retry() const { return retry_; }
    void setRetry(bool retry) { retry_ = retry; }

    int retryCount() const { return retryCount_; }
    void setRetryCount(int count) { retryCount_ = count; }

    /// Creation time of this instance, used as the date of messages it
    /// builds so a retry boxes identical plaintext under the same nonce.
    quint64 createdAtMs() const { return createdAtMs_; }

    bool isDropped() const { return dropped_; }
    void setDropped(bool dropped) { dropped_ = dropped; }

    /// Nonce used towards identity. Generated on first use and then fixed
    /// for the lifetime of this instance, so a retried send never boxes the
    /// same message under a different nonce.
    bool nonceFor(const QString& identity, const RandomSource& random,
                  QByteArray& out, Error* error = nullptr);
    /// Returns false and keeps the recorded nonce if identity already has one.
    bool recordNonce(const QString& identity, const QByteArray& nonce);
    const QHash<QString, QByteArray>& nonces() const { return nonces_; }
    void clearNonces() { nonces_.clear(); }

protected:
    TaskDefinition(TaskType type, bool retry)
        : type_(type)
        , retry_(retry)
        , createdAtMs_(static_cast<quint64>(QDateTime::currentMSecsSinceEpoch())) {}

    template <typename T>
    std::shared_ptr<T> self()
    {
        return std::static_pointer_cast<T>(shared_from_this());
    }

private:
    TaskType type_;
    TaskState state_ = TaskState::Pending;
    bool retry_;
    int retryCount_ = 0;
    quint64 createdAtMs_;
    bool dropped_ = false;
    QHash<QString, QByteArray> nonces_;
};

using TaskPtr = std::shared_ptr<TaskDefinition>;

} // namespace mdsync
