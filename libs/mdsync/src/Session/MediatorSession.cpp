#include <mdsync/Session/MediatorSession.hpp>
#include <mdsync/Task/TaskDefinitionReceive.hpp>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcSession, "mdsync.session")

namespace mdsync {

const char* sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Idle: return "Idle";
    case SessionState::Connecting: return "Connecting";
    case SessionState::Active: return "Active";
    case SessionState::Disconnected: return "Disconnected";
    }
    return "?";
}

MediatorSession::MediatorSession(IConnection* connection, MediatorMessenger* messenger,
                                 TaskQueue* queue, QObject* parent)
    : QObject(parent)
    , connection_(connection)
    , messenger_(messenger)
    , queue_(queue)
{
    connect(connection_, &IConnection::loggedIn, this, &MediatorSession::onLoggedIn);
    connect(connection_, &IConnection::disconnected, this, &MediatorSession::onDisconnected);
    connect(connection_, &IConnection::error, this, &MediatorSession::onConnectionError);

    connect(messenger_, &MediatorMessenger::reflectedReceived,
            this, &MediatorSession::onReflectedReceived);
    connect(messenger_, &MediatorMessenger::reflectionQueueDry,
            this, &MediatorSession::onReflectionQueueDry);
    connect(messenger_, &MediatorMessenger::rolePromotedToLeader,
            this, &MediatorSession::rolePromotedToLeader);
    connect(messenger_, &MediatorMessenger::protocolError,
            this, &MediatorSession::onProtocolError);
}

MediatorSession::~MediatorSession()
{
    stop();
}

void MediatorSession::start()
{
    if (state_ != SessionState::Idle && state_ != SessionState::Disconnected)
        return;

    messenger_->start();
    setState(SessionState::Connecting);

    if (connection_->isLoggedIn()) {
        // Already logged in, advance immediately
        onLoggedIn();
    }
}

void MediatorSession::stop()
{
    if (state_ == SessionState::Idle || state_ == SessionState::Disconnected)
        return;

    messenger_->stop();
    queue_->interrupt();
    setState(SessionState::Disconnected);
}

SessionState MediatorSession::state() const
{
    return state_;
}

MediatorMessenger* MediatorSession::messenger() const
{
    return messenger_;
}

TaskQueue* MediatorSession::taskQueue() const
{
    return queue_;
}

void MediatorSession::setState(SessionState newState)
{
    if (state_ == newState)
        return;
    qCInfo(lcSession) << "state" << sessionStateName(state_) << "->" << sessionStateName(newState);
    state_ = newState;
    emit stateChanged(newState);
}

void MediatorSession::onLoggedIn()
{
    if (state_ == SessionState::Idle)
        return;

    setState(SessionState::Active);
    queue_->spool();
}

void MediatorSession::onDisconnected()
{
    if (state_ == SessionState::Idle)
        return;

    queue_->interrupt();
    setState(SessionState::Disconnected);
}

void MediatorSession::onConnectionError(const QString& message)
{
    qCWarning(lcSession) << "connection error:" << message;
}

void MediatorSession::onReflectedReceived(const QByteArray& reflectId,
                                          const QByteArray& envelopeCiphertext,
                                          const QDateTime& reflectedAt)
{
    if (state_ != SessionState::Active) {
        qCWarning(lcSession) << "reflected" << reflectId.toHex() << "outside an active session";
        return;
    }

    queue_->enqueue(std::make_shared<TaskDefinitionReceiveReflectedMessage>(
        reflectId, envelopeCiphertext, reflectedAt));
    queue_->spool();
}

void MediatorSession::onReflectionQueueDry()
{
    qCInfo(lcSession) << "reflection queue dry," << queue_->count() << "tasks queued";
    emit reflectionQueueDry();
}

void MediatorSession::onProtocolError(const QString& message)
{
    qCWarning(lcSession) << "protocol error:" << message;
}

} // namespace mdsync
