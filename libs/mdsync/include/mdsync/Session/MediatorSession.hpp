#pragma once

#include <QObject>
#include <QByteArray>
#include <QDateTime>

#include <mdsync/Mediator/MediatorMessenger.hpp>
#include <mdsync/Session/SessionState.hpp>
#include <mdsync/Task/TaskQueue.hpp>
#include <mdsync/Transport/IConnection.hpp>

namespace mdsync {

/// Wires a mediator connection to its task queue: login spools the queue,
/// a lost connection interrupts it, and reflected envelopes become
/// receive tasks.
class MediatorSession : public QObject {
    Q_OBJECT
public:
    MediatorSession(IConnection* connection, MediatorMessenger* messenger, TaskQueue* queue,
                    QObject* parent = nullptr);
    ~MediatorSession() override;

    void start();
    void stop();

    SessionState state() const;
    MediatorMessenger* messenger() const;
    TaskQueue* taskQueue() const;

signals:
    void stateChanged(mdsync::SessionState newState);
    void reflectionQueueDry();
    void rolePromotedToLeader();

private:
    void setState(SessionState newState);

    void onLoggedIn();
    void onDisconnected();
    void onConnectionError(const QString& message);
    void onReflectedReceived(const QByteArray& reflectId, const QByteArray& envelopeCiphertext,
                             const QDateTime& reflectedAt);
    void onReflectionQueueDry();
    void onProtocolError(const QString& message);

    IConnection* connection_;
    MediatorMessenger* messenger_;
    TaskQueue* queue_;
    SessionState state_ = SessionState::Idle;
};

} // namespace mdsync
