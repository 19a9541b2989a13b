#include <mdsync/Task/TaskExecutionSync.hpp>
#include <mdsync/Mediator/MediatorMessenger.hpp>
#include <mdsync/Message/EnvelopeBuilder.hpp>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTaskQueue)

namespace mdsync {

TaskExecutionSync::TaskExecutionSync(std::shared_ptr<TaskDefinitionSync> task, TaskContext context)
    : task_(std::move(task))
    , context_(std::move(context))
{
}

void TaskExecutionSync::execute(Done done)
{
    done_ = std::move(done);

    if (!context_.messenger || !context_.envelopeBuilder) {
        finish(Error(ErrorCode::ExecutionFailed, QStringLiteral("sync without collaborators")));
        return;
    }
    if (!context_.messenger->isMultiDeviceActive()) {
        finish(Error(ErrorCode::MultiDeviceNotRegistered));
        return;
    }

    Error error;
    if (!task_->buildEnvelopes(*context_.envelopeBuilder, envelopes_, &error)) {
        finish(error);
        return;
    }

    auto self = shared_from_this();
    context_.messenger->beginTransaction(task_->scope(), [this, self](const Error& error) {
        if (!error.isOk()) {
            finish(error);
            return;
        }
        reflectNext(0);
    });
}

void TaskExecutionSync::reflectNext(size_t index)
{
    auto self = shared_from_this();

    if (index >= envelopes_.size()) {
        context_.messenger->commitTransaction([this, self](const Error& error) {
            finish(error);
        });
        return;
    }

    context_.messenger->reflect(envelopes_[index],
                                [this, self, index](const Error& error, const QDateTime&) {
        if (!error.isOk()) {
            abort(error);
            return;
        }
        reflectNext(index + 1);
    });
}

void TaskExecutionSync::abort(const Error& error)
{
    qCWarning(lcTaskQueue) << task_->description() << "reflect failed, ending transaction:" << error;

    auto self = shared_from_this();
    context_.messenger->commitTransaction([this, self, error](const Error& commitError) {
        if (!commitError.isOk())
            qCDebug(lcTaskQueue) << "commit after failed reflect:" << commitError;
        finish(error);
    });
}

void TaskExecutionSync::finish(const Error& error)
{
    if (!done_)
        return;
    Done done = std::move(done_);
    done_ = nullptr;
    done(error);
}

} // namespace mdsync
