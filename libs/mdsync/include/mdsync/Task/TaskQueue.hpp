#pragma once

#include <mdsync/Error.hpp>
#include <mdsync/Task/TaskContext.hpp>
#include <mdsync/Task/TaskDefinition.hpp>
#include <mdsync/Task/TaskExecution.hpp>
#include <mdsync/Task/TaskQueueConfig.hpp>
#include <mdsync/Transport/IConnection.hpp>

#include <QList>
#include <QMutex>
#include <QObject>
#include <QTimer>
#include <functional>

namespace mdsync {

/// Ordered, single-flight execution of task definitions.
///
/// enqueue() may be called from any thread. spool(), interrupt() and clear()
/// are marshalled to the thread the queue lives in; interrupt() and clear()
/// block the caller until they have taken effect. Task state is only
/// changed on the queue's thread, and the persisted snapshot is written
/// there. load() and save() belong to that thread too. Every enqueued
/// task's completion handler runs exactly once, on the queue's thread.
class TaskQueue : public QObject {
    Q_OBJECT

public:
    using CompletionHandler = std::function<void(const TaskDefinition& task, const Error& error)>;
    using ExecutionFactory = std::function<std::shared_ptr<TaskExecution>(TaskDefinition& task)>;

    TaskQueue(IConnection* connection, TaskContext context,
              TaskQueueConfig config = TaskQueueConfig(), QObject* parent = nullptr);
    ~TaskQueue() override;

    /// Replaces TaskDefinition::createExecution; used by tests.
    void setExecutionFactory(ExecutionFactory factory);
    const TaskQueueConfig& config() const { return config_; }

    void enqueue(TaskPtr task, CompletionHandler completion = CompletionHandler());
    void spool();
    void interrupt();
    void clear();

    /// Restores persisted tasks ahead of anything already queued. Tasks that
    /// were executing when written come back interrupted.
    bool load(Error* error = nullptr);
    bool save(Error* error = nullptr);

    QList<TaskPtr> list() const;
    int count() const;
    bool isSpooling() const { return spooling_; }

signals:
    void taskCompleted(const QString& description, bool success);
    void backoffScheduled(int delayMs);

private:
    struct Entry {
        TaskPtr task;
        CompletionHandler completion;
    };

    void executeNext();
    void onExecutionFinished(quint64 executionId, const Error& error);
    void dispose(const TaskPtr& task, const Error& error);
    bool canRetry(const TaskDefinition& task) const;
    int backoffDelay(int attempt) const;

    void removeAndComplete(const TaskPtr& task, const Error& error);
    void complete(Entry& entry, const Error& error);
    bool persistLocked(Error* error = nullptr);

    IConnection* connection_;
    TaskContext context_;
    TaskQueueConfig config_;
    ExecutionFactory executionFactory_;

    mutable QMutex mutex_;
    QList<Entry> entries_;

    bool spooling_ = false;
    quint64 nextExecutionId_ = 0;
    quint64 currentExecutionId_ = 0;
    TaskPtr currentTask_;
    std::shared_ptr<TaskExecution> currentExecution_;
    QTimer backoffTimer_;
};

} // namespace mdsync
