#pragma once

#include <mdsync/Error.hpp>
#include <mdsync/Crypto/EnvelopeCryptor.hpp>
#include <mdsync/Frame/FrameCodec.hpp>
#include <mdsync/Transport/IConnection.hpp>

#include <QObject>
#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QTimer>
#include <functional>

#include "mdsync/d2d.pb.h"

namespace mdsync {

/// Speaks the mediator protocol over an IConnection: reflects envelopes and
/// matches their acks, routes inbound frames and drives transactions.
class MediatorMessenger : public QObject {
    Q_OBJECT

public:
    using ReflectCallback = std::function<void(const Error& error, const QDateTime& ackedAt)>;
    using TransactionCallback = std::function<void(const Error& error)>;

    MediatorMessenger(IConnection* connection, EnvelopeCryptor* cryptor,
                      QObject* parent = nullptr);
    ~MediatorMessenger() override;

    void start();
    void stop();

    void setReflectAckTimeout(int timeoutMs);
    int reflectAckTimeout() const;

    bool isLoggedIn() const;
    bool isMultiDeviceActive() const;
    EnvelopeCryptor* cryptor() const;

    /// Encrypts and reflects the envelope. The callback runs exactly once:
    /// on reflect-ack, on timeout, on disconnect or on a local failure.
    void reflect(const proto::d2d::Envelope& envelope, ReflectCallback callback);
    bool sendReflectedAck(const QByteArray& reflectId);
    bool sendChatServerPayload(const QByteArray& payload);

    void beginTransaction(proto::d2d::TransactionScope::Scope scope,
                          TransactionCallback callback);
    void commitTransaction(TransactionCallback callback);

    int pendingReflectCount() const;

signals:
    void frameReceived(quint8 frameType, const QByteArray& frame);
    void frameSent(quint8 frameType, const QByteArray& frame);
    void reflectedReceived(const QByteArray& reflectId,
                           const QByteArray& envelopeCiphertext,
                           const QDateTime& reflectedAt);
    void reflectionQueueDry();
    void rolePromotedToLeader();
    void chatServerPayloadReceived(const QByteArray& payload);
    void protocolError(const QString& message);

private:
    struct PendingReflect {
        ReflectCallback callback;
        QTimer* timer = nullptr; // child of the messenger
    };

    void onFrameReceived(const QByteArray& frame);
    void onDisconnected();
    void failPending(const Error& error);
    void completeReflect(const QByteArray& reflectId, const Error& error,
                         const QDateTime& ackedAt);
    void completeTransaction(MediatorFrameType ackType, const Error& error);
    bool write(MediatorFrameType type, const QByteArray& frame);

    IConnection* connection_;
    EnvelopeCryptor* cryptor_;
    int reflectAckTimeoutMs_ = 20000;

    QHash<QByteArray, PendingReflect> pendingReflects_;
    TransactionCallback pendingTransaction_;
    MediatorFrameType pendingTransactionAck_ = MediatorFrameType::LockAck;
    QTimer transactionTimer_;
};

} // namespace mdsync
