#include <mdsync/Task/TaskDefinition.hpp>
#include <mdsync/Version.hpp>

namespace mdsync {

const char* taskTypeName(TaskType type)
{
    switch (type) {
    case TaskType::Persistent: return "persistent";
    case TaskType::Volatile: return "volatile";
    case TaskType::DropOnDisconnect: return "dropOnDisconnect";
    }
    return "?";
}

const char* taskStateName(TaskState state)
{
    switch (state) {
    case TaskState::Pending: return "pending";
    case TaskState::Executing: return "executing";
    case TaskState::Interrupted: return "interrupted";
    case TaskState::Done: return "done";
    }
    return "?";
}

bool TaskDefinition::nonceFor(const QString& identity, const RandomSource& random,
                              QByteArray& out, Error* error)
{
    auto it = nonces_.constFind(identity);
    if (it != nonces_.constEnd()) {
        out = it.value();
        return true;
    }

    QByteArray nonce;
    if (!randomBytes(random, ENVELOPE_NONCE_LENGTH, nonce, error))
        return false;
    nonces_.insert(identity, nonce);
    out = nonce;
    return true;
}

bool TaskDefinition::recordNonce(const QString& identity, const QByteArray& nonce)
{
    if (nonces_.contains(identity))
        return false;
    nonces_.insert(identity, nonce);
    return true;
}

} // namespace mdsync
