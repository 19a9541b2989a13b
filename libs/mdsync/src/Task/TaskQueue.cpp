#include <mdsync/Task/TaskQueue.hpp>
#include <mdsync/Task/TaskCodec.hpp>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QPointer>
#include <QSaveFile>
#include <QThread>

Q_LOGGING_CATEGORY(lcTaskQueue, "mdsync.taskqueue")

namespace mdsync {

TaskQueue::TaskQueue(IConnection* connection, TaskContext context, TaskQueueConfig config,
                     QObject* parent)
    : QObject(parent)
    , connection_(connection)
    , context_(std::move(context))
    , config_(std::move(config))
{
    backoffTimer_.setSingleShot(true);
    connect(&backoffTimer_, &QTimer::timeout, this, &TaskQueue::executeNext);
}

TaskQueue::~TaskQueue()
{
    backoffTimer_.stop();
}

void TaskQueue::setExecutionFactory(ExecutionFactory factory)
{
    executionFactory_ = std::move(factory);
}

void TaskQueue::enqueue(TaskPtr task, CompletionHandler completion)
{
    if (!task)
        return;

    const bool persistent = task->type() == TaskType::Persistent;
    qCDebug(lcTaskQueue).noquote() << task->description() << "enqueued as"
                                   << taskTypeName(task->type());
    {
        QMutexLocker lock(&mutex_);
        entries_.append(Entry{std::move(task), std::move(completion)});
    }

    if (!persistent)
        return;

    // Task state is only written on the queue's thread, so the snapshot
    // that reads it is taken there as well.
    if (QThread::currentThread() == thread()) {
        QMutexLocker lock(&mutex_);
        persistLocked();
    } else {
        QMetaObject::invokeMethod(this, [this]() {
            QMutexLocker lock(&mutex_);
            persistLocked();
        }, Qt::QueuedConnection);
    }
}

void TaskQueue::spool()
{
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this]() { spool(); }, Qt::QueuedConnection);
        return;
    }

    if (spooling_) {
        if (currentTask_)
            qCDebug(lcTaskQueue).noquote()
                << QStringLiteral("%1 is still running").arg(currentTask_->description());
        return;
    }

    spooling_ = true;
    executeNext();
}

void TaskQueue::executeNext()
{
    if (!spooling_ || currentTask_)
        return;

    if (!connection_->isLoggedIn()) {
        qCInfo(lcTaskQueue) << "Task queue spool interrupt, because not logged in to server";
        spooling_ = false;
        return;
    }

    TaskPtr task;
    for (;;) {
        {
            QMutexLocker lock(&mutex_);
            if (entries_.isEmpty()) {
                spooling_ = false;
                return;
            }
            task = entries_.first().task;
        }

        if (task->state() == TaskState::Interrupted && task->isDropped()) {
            qCInfo(lcTaskQueue).noquote()
                << QStringLiteral("%1 state 'interrupted' was dropped. Don't execute")
                       .arg(task->description());
            removeAndComplete(task, Error(ErrorCode::TaskDropped));
            continue;
        }
        break;
    }

    task->setState(TaskState::Executing);
    if (task->type() == TaskType::Persistent) {
        QMutexLocker lock(&mutex_);
        persistLocked();
    }

    const quint64 executionId = ++nextExecutionId_;
    currentExecutionId_ = executionId;
    currentTask_ = task;

    std::shared_ptr<TaskExecution> execution =
        executionFactory_ ? executionFactory_(*task) : task->createExecution(context_);
    if (!execution) {
        onExecutionFinished(executionId,
                            Error(ErrorCode::ExecutionFailed, QStringLiteral("no execution")));
        return;
    }
    currentExecution_ = execution;

    qCDebug(lcTaskQueue).noquote() << task->description() << "executing";

    // Results are always delivered through the event loop, so an execution
    // that finishes synchronously does not re-enter the queue.
    QPointer<TaskQueue> guard(this);
    execution->execute([guard, executionId](const Error& error) {
        if (!guard)
            return;
        QMetaObject::invokeMethod(guard.data(), [guard, executionId, error]() {
            if (guard)
                guard->onExecutionFinished(executionId, error);
        }, Qt::QueuedConnection);
    });
}

void TaskQueue::onExecutionFinished(quint64 executionId, const Error& error)
{
    if (executionId != currentExecutionId_) {
        qCDebug(lcTaskQueue) << "ignoring result of stale execution" << executionId;
        return;
    }

    TaskPtr task = std::move(currentTask_);
    currentTask_.reset();
    currentExecutionId_ = 0;
    currentExecution_.reset();

    if (task->isDropped()) {
        qCInfo(lcTaskQueue).noquote() << QStringLiteral("%1 dropped").arg(task->description());
        removeAndComplete(task, Error(ErrorCode::TaskDropped));
        executeNext();
        return;
    }

    if (task->state() == TaskState::Interrupted && !error.isOk()) {
        // Interrupted under way; resumed by the next spool.
        qCInfo(lcTaskQueue).noquote() << task->description() << "interrupted:" << error.toString();
        spooling_ = false;
        QMutexLocker lock(&mutex_);
        persistLocked();
        return;
    }

    dispose(task, error);
}

void TaskQueue::dispose(const TaskPtr& task, const Error& error)
{
    const QString description = task->description();

    auto done = [&](const Error& outcome) {
        qCInfo(lcTaskQueue).noquote() << QStringLiteral("%1 done").arg(description);
        removeAndComplete(task, outcome);
        executeNext();
    };
    auto failed = [&]() {
        qCWarning(lcTaskQueue).noquote()
            << QStringLiteral("%1 failed and marked as dropped:").arg(description) << error.toString();
        removeAndComplete(task, error);
        executeNext();
    };
    auto retryNow = [&]() {
        qCInfo(lcTaskQueue).noquote()
            << QStringLiteral("Retry of %1 after execution failing:").arg(description) << error.toString();
        task->setRetryCount(task->retryCount() + 1);
        task->setState(TaskState::Pending);
        {
            QMutexLocker lock(&mutex_);
            persistLocked();
        }
        // Through the timer so interrupt() and clear() can cancel it.
        backoffTimer_.start(0);
    };

    switch (error.category()) {
    case ErrorCategory::None:
        done(Error());
        return;

    case ErrorCategory::Discardable:
        qCInfo(lcTaskQueue).noquote() << "discard incoming message:" << error.toString();
        done(Error());
        return;

    case ErrorCategory::Resolution:
    case ErrorCategory::Deprecated:
        failed();
        return;

    case ErrorCategory::Transient: {
        if (!connection_->isLoggedIn()) {
            task->setState(TaskState::Pending);
            qCInfo(lcTaskQueue) << "Task queue spool interrupt, because not logged in to server";
            spooling_ = false;
            QMutexLocker lock(&mutex_);
            persistLocked();
            return;
        }
        if (!canRetry(*task)) {
            failed();
            return;
        }
        task->setRetryCount(task->retryCount() + 1);
        task->setState(TaskState::Pending);
        {
            QMutexLocker lock(&mutex_);
            persistLocked();
        }
        const int delay = backoffDelay(task->retryCount());
        qCInfo(lcTaskQueue).noquote()
            << QStringLiteral("Waiting %1 seconds before execute next task")
                   .arg(delay / 1000.0, 0, 'f', 1);
        emit backoffScheduled(delay);
        backoffTimer_.start(delay);
        return;
    }

    case ErrorCategory::Task:
        if (error.code == ErrorCode::DoNotAckIncomingVoIPMessage) {
            done(Error());
            return;
        }
        if (error.code == ErrorCode::MultiDeviceNotRegistered) {
            qCInfo(lcTaskQueue).noquote() << "discard incoming message:" << error.toString();
            done(Error());
            return;
        }
        if (error.code == ErrorCode::TaskDropped) {
            failed();
            return;
        }
        if (canRetry(*task))
            retryNow();
        else
            failed();
        return;

    case ErrorCategory::Structural:
    case ErrorCategory::Cryptographic:
        if (canRetry(*task))
            retryNow();
        else
            failed();
        return;
    }
}

bool TaskQueue::canRetry(const TaskDefinition& task) const
{
    return task.retry() && task.retryCount() < config_.maxRetries;
}

int TaskQueue::backoffDelay(int attempt) const
{
    qint64 delay = config_.backoffInitialMs;
    for (int i = 1; i < attempt && delay < config_.backoffMaxMs; ++i)
        delay *= 2;
    return static_cast<int>(qMin<qint64>(delay, config_.backoffMaxMs));
}

void TaskQueue::interrupt()
{
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this]() { interrupt(); }, Qt::BlockingQueuedConnection);
        return;
    }

    backoffTimer_.stop();

    QList<Entry> dropped;
    {
        QMutexLocker lock(&mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            const TaskPtr& task = it->task;
            if (task == currentTask_) {
                task->setState(TaskState::Interrupted);
                if (task->type() == TaskType::DropOnDisconnect) {
                    task->setDropped(true);
                    qCInfo(lcTaskQueue).noquote()
                        << QStringLiteral("%1 interrupted and marked as dropped").arg(task->description());
                }
                ++it;
                continue;
            }
            if (task->type() == TaskType::DropOnDisconnect) {
                qCInfo(lcTaskQueue).noquote() << QStringLiteral("%1 dropped").arg(task->description());
                dropped.append(std::move(*it));
                it = entries_.erase(it);
                continue;
            }
            ++it;
        }
        persistLocked();
    }

    // An in-flight execution keeps the lane busy until it reports back.
    if (!currentTask_)
        spooling_ = false;

    for (Entry& entry : dropped)
        complete(entry, Error(ErrorCode::TaskDropped));
}

void TaskQueue::clear()
{
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(this, [this]() { clear(); }, Qt::BlockingQueuedConnection);
        return;
    }

    backoffTimer_.stop();

    QList<Entry> removed;
    {
        QMutexLocker lock(&mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->task == currentTask_) {
                it->task->setState(TaskState::Interrupted);
                it->task->setDropped(true);
                ++it;
                continue;
            }
            removed.append(std::move(*it));
            it = entries_.erase(it);
        }
        persistLocked();
    }

    if (!currentTask_)
        spooling_ = false;

    for (Entry& entry : removed)
        complete(entry, Error(ErrorCode::TaskDropped));
}

void TaskQueue::removeAndComplete(const TaskPtr& task, const Error& error)
{
    Entry entry;
    {
        QMutexLocker lock(&mutex_);
        for (int i = 0; i < entries_.size(); ++i) {
            if (entries_.at(i).task == task) {
                entry = entries_.takeAt(i);
                break;
            }
        }
        persistLocked();
    }

    if (!entry.task)
        return;

    qCDebug(lcTaskQueue).noquote() << QStringLiteral("%1 removed from queue").arg(task->description());
    complete(entry, error);
}

void TaskQueue::complete(Entry& entry, const Error& error)
{
    entry.task->setState(TaskState::Done);
    emit taskCompleted(entry.task->description(), error.isOk());

    if (!entry.completion)
        return;
    CompletionHandler completion = std::move(entry.completion);
    entry.completion = nullptr;
    completion(*entry.task, error);
}

bool TaskQueue::load(Error* error)
{
    if (config_.path.isEmpty())
        return true;

    QFile file(config_.path);
    if (!file.exists())
        return true;
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(error, ErrorCode::PersistenceFailed,
                    QStringLiteral("cannot read %1: %2").arg(config_.path, file.errorString()));
    }

    QList<TaskPtr> tasks;
    if (!TaskCodec::decodeQueue(file.readAll(), tasks, error))
        return false;

    QMutexLocker lock(&mutex_);
    for (int i = tasks.size() - 1; i >= 0; --i) {
        const TaskPtr& task = tasks.at(i);
        if (task->state() == TaskState::Executing)
            task->setState(TaskState::Interrupted);
        entries_.prepend(Entry{task, CompletionHandler()});
    }

    qCInfo(lcTaskQueue) << "loaded" << tasks.size() << "tasks from" << config_.path;
    return true;
}

bool TaskQueue::save(Error* error)
{
    QMutexLocker lock(&mutex_);
    return persistLocked(error);
}

bool TaskQueue::persistLocked(Error* error)
{
    if (config_.path.isEmpty())
        return true;

    QList<TaskPtr> tasks;
    tasks.reserve(entries_.size());
    for (const Entry& entry : entries_)
        tasks.append(entry.task);
    const QByteArray data = TaskCodec::encodeQueue(tasks);

    QDir().mkpath(QFileInfo(config_.path).absolutePath());
    QSaveFile file(config_.path);
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcTaskQueue) << "cannot write" << config_.path << file.errorString();
        return fail(error, ErrorCode::PersistenceFailed, file.errorString());
    }
    if (file.write(data) != data.size() || !file.commit()) {
        qCWarning(lcTaskQueue) << "cannot write" << config_.path << file.errorString();
        return fail(error, ErrorCode::PersistenceFailed, file.errorString());
    }
    return true;
}

QList<TaskPtr> TaskQueue::list() const
{
    QMutexLocker lock(&mutex_);
    QList<TaskPtr> tasks;
    tasks.reserve(entries_.size());
    for (const Entry& entry : entries_)
        tasks.append(entry.task);
    return tasks;
}

int TaskQueue::count() const
{
    QMutexLocker lock(&mutex_);
    return entries_.size();
}

} // namespace mdsync
