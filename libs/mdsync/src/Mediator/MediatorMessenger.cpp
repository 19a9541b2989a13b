#include <mdsync/Mediator/MediatorMessenger.hpp>
#include <mdsync/Version.hpp>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(lcMessenger, "mdsync.messenger")

namespace mdsync {

MediatorMessenger::MediatorMessenger(IConnection* connection, EnvelopeCryptor* cryptor,
                                     QObject* parent)
    : QObject(parent)
    , connection_(connection)
    , cryptor_(cryptor)
{
    transactionTimer_.setSingleShot(true);
    connect(&transactionTimer_, &QTimer::timeout, this, [this]() {
        completeTransaction(pendingTransactionAck_,
                            Error(ErrorCode::ReflectAckTimeout,
                                  QStringLiteral("no %1 from mediator")
                                      .arg(QLatin1String(frameTypeName(pendingTransactionAck_)))));
    });
}

MediatorMessenger::~MediatorMessenger()
{
    failPending(Error(ErrorCode::NotConnectedToMediator, QStringLiteral("messenger destroyed")));
}

void MediatorMessenger::start()
{
    connect(connection_, &IConnection::frameReceived,
            this, &MediatorMessenger::onFrameReceived);
    connect(connection_, &IConnection::disconnected,
            this, &MediatorMessenger::onDisconnected);
}

void MediatorMessenger::stop()
{
    disconnect(connection_, &IConnection::frameReceived,
               this, &MediatorMessenger::onFrameReceived);
    disconnect(connection_, &IConnection::disconnected,
               this, &MediatorMessenger::onDisconnected);
}

void MediatorMessenger::setReflectAckTimeout(int timeoutMs)
{
    reflectAckTimeoutMs_ = timeoutMs;
}

int MediatorMessenger::reflectAckTimeout() const
{
    return reflectAckTimeoutMs_;
}

bool MediatorMessenger::isLoggedIn() const
{
    return connection_->isLoggedIn();
}

bool MediatorMessenger::isMultiDeviceActive() const
{
    return cryptor_->hasKeys();
}

EnvelopeCryptor* MediatorMessenger::cryptor() const
{
    return cryptor_;
}

int MediatorMessenger::pendingReflectCount() const
{
    return pendingReflects_.size();
}

bool MediatorMessenger::write(MediatorFrameType type, const QByteArray& frame)
{
    if (!connection_->send(frame)) {
        qCWarning(lcMessenger) << "failed to send" << frameTypeName(type) << "frame";
        return false;
    }
    emit frameSent(static_cast<quint8>(type), frame);
    return true;
}

void MediatorMessenger::reflect(const proto::d2d::Envelope& envelope, ReflectCallback callback)
{
    if (!connection_->isLoggedIn()) {
        callback(Error(ErrorCode::NotConnectedToMediator), QDateTime());
        return;
    }

    Error error;
    QByteArray ciphertext;
    if (!cryptor_->encryptEnvelope(envelope, ciphertext, &error)) {
        callback(error, QDateTime());
        return;
    }

    QByteArray reflectId;
    do {
        if (!cryptor_->generateReflectId(reflectId, &error)) {
            callback(error, QDateTime());
            return;
        }
    } while (pendingReflects_.contains(reflectId));

    if (!write(MediatorFrameType::Reflect, FrameCodec::encodeReflect(ciphertext, reflectId))) {
        callback(Error(ErrorCode::SendFailed, QStringLiteral("reflect frame not sent")),
                 QDateTime());
        return;
    }

    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, reflectId]() {
        completeReflect(reflectId,
                        Error(ErrorCode::ReflectAckTimeout,
                              QStringLiteral("reflect %1 not acknowledged")
                                  .arg(QString::fromLatin1(reflectId.toHex()))),
                        QDateTime());
    });
    pendingReflects_.insert(reflectId, PendingReflect{std::move(callback), timer});
    timer->start(reflectAckTimeoutMs_);

    qCDebug(lcMessenger) << "reflect" << reflectId.toHex() << "sent,"
                         << ciphertext.size() << "bytes";
}

bool MediatorMessenger::sendReflectedAck(const QByteArray& reflectId)
{
    return write(MediatorFrameType::ReflectedAck, FrameCodec::encodeReflectedAck(reflectId));
}

bool MediatorMessenger::sendChatServerPayload(const QByteArray& payload)
{
    return write(MediatorFrameType::Proxy, FrameCodec::encodeProxy(payload));
}

void MediatorMessenger::beginTransaction(proto::d2d::TransactionScope::Scope scope,
                                         TransactionCallback callback)
{
    if (pendingTransaction_) {
        callback(Error(ErrorCode::ReflectFailed, QStringLiteral("transaction already pending")));
        return;
    }

    Error error;
    QByteArray encryptedScope;
    if (!cryptor_->encryptTransactionScope(scope, encryptedScope, &error)) {
        callback(error);
        return;
    }

    if (!write(MediatorFrameType::Lock,
               FrameCodec::encodeBeginTransaction(encryptedScope, TRANSACTION_TTL_SECONDS))) {
        callback(Error(ErrorCode::SendFailed, QStringLiteral("lock frame not sent")));
        return;
    }

    pendingTransaction_ = std::move(callback);
    pendingTransactionAck_ = MediatorFrameType::LockAck;
    transactionTimer_.start(reflectAckTimeoutMs_);
}

void MediatorMessenger::commitTransaction(TransactionCallback callback)
{
    if (pendingTransaction_) {
        callback(Error(ErrorCode::ReflectFailed, QStringLiteral("transaction already pending")));
        return;
    }

    if (!write(MediatorFrameType::Unlock, FrameCodec::encodeCommitTransaction())) {
        callback(Error(ErrorCode::SendFailed, QStringLiteral("unlock frame not sent")));
        return;
    }

    pendingTransaction_ = std::move(callback);
    pendingTransactionAck_ = MediatorFrameType::UnlockAck;
    transactionTimer_.start(reflectAckTimeoutMs_);
}

void MediatorMessenger::completeReflect(const QByteArray& reflectId, const Error& error,
                                        const QDateTime& ackedAt)
{
    auto it = pendingReflects_.find(reflectId);
    if (it == pendingReflects_.end()) {
        qCWarning(lcMessenger) << "reflect-ack for unknown reflect ID" << reflectId.toHex();
        return;
    }

    PendingReflect pending = it.value();
    pendingReflects_.erase(it);
    pending.timer->stop();
    pending.timer->deleteLater();

    if (!error.isOk())
        qCWarning(lcMessenger) << "reflect" << reflectId.toHex() << "failed:" << error;

    pending.callback(error, ackedAt);
}

void MediatorMessenger::completeTransaction(MediatorFrameType ackType, const Error& error)
{
    if (!pendingTransaction_ || ackType != pendingTransactionAck_) {
        qCWarning(lcMessenger) << "unexpected" << frameTypeName(ackType);
        return;
    }

    transactionTimer_.stop();
    TransactionCallback callback = std::move(pendingTransaction_);
    pendingTransaction_ = nullptr;
    callback(error);
}

void MediatorMessenger::onDisconnected()
{
    failPending(Error(ErrorCode::NotConnectedToMediator, QStringLiteral("connection lost")));
}

void MediatorMessenger::failPending(const Error& error)
{
    transactionTimer_.stop();

    QHash<QByteArray, PendingReflect> pending;
    pending.swap(pendingReflects_);
    for (auto it = pending.begin(); it != pending.end(); ++it) {
        it->timer->stop();
        it->timer->deleteLater();
        it->callback(error, QDateTime());
    }

    if (pendingTransaction_) {
        TransactionCallback callback = std::move(pendingTransaction_);
        pendingTransaction_ = nullptr;
        callback(error);
    }
}

void MediatorMessenger::onFrameReceived(const QByteArray& frame)
{
    Error error;
    MediatorFrameType type;
    if (!FrameCodec::frameType(frame, type, &error)) {
        qCWarning(lcMessenger) << "dropping frame:" << error;
        emit protocolError(error.toString());
        return;
    }

    emit frameReceived(static_cast<quint8>(type), frame);

    switch (type) {
    case MediatorFrameType::Proxy: {
        QByteArray payload;
        if (FrameCodec::decodeProxy(frame, payload, &error))
            emit chatServerPayloadReceived(payload);
        break;
    }
    case MediatorFrameType::ReflectAck: {
        ReflectAckFrame ack;
        if (!FrameCodec::decodeReflectAck(frame, ack, &error))
            break;
        completeReflect(ack.reflectId, Error(), ack.ackedAt);
        return;
    }
    case MediatorFrameType::Reflected: {
        ReflectedFrame reflected;
        if (!FrameCodec::decodeReflected(frame, reflected, &error))
            break;
        emit reflectedReceived(reflected.reflectId, reflected.envelopeCiphertext,
                               reflected.reflectedAt);
        return;
    }
    case MediatorFrameType::ReflectionQueueDry:
        qCInfo(lcMessenger) << "reflection queue dry";
        emit reflectionQueueDry();
        return;
    case MediatorFrameType::RolePromotedToLeader:
        qCInfo(lcMessenger) << "role promoted to leader";
        emit rolePromotedToLeader();
        return;
    case MediatorFrameType::LockAck:
    case MediatorFrameType::UnlockAck:
        completeTransaction(type, Error());
        return;
    case MediatorFrameType::Rejected:
        completeTransaction(pendingTransactionAck_,
                            Error(ErrorCode::ReflectFailed, QStringLiteral("transaction rejected")));
        return;
    case MediatorFrameType::Ended:
        completeTransaction(pendingTransactionAck_,
                            Error(ErrorCode::ReflectFailed, QStringLiteral("transaction ended")));
        return;
    case MediatorFrameType::ServerHello:
    case MediatorFrameType::ServerInfo:
    case MediatorFrameType::DeviceInfo:
    case MediatorFrameType::DropDeviceAck:
        // Handled by the connection during login and by device management.
        qCDebug(lcMessenger) << "ignoring" << frameTypeName(type);
        return;
    case MediatorFrameType::ClientHello:
    case MediatorFrameType::GetDeviceInfo:
    case MediatorFrameType::DropDevice:
    case MediatorFrameType::SetSharedDeviceData:
    case MediatorFrameType::Lock:
    case MediatorFrameType::Unlock:
    case MediatorFrameType::Reflect:
    case MediatorFrameType::ReflectedAck:
        error = Error(ErrorCode::UnexpectedFrameType,
                      QStringLiteral("%1 is client-to-server only")
                          .arg(QLatin1String(frameTypeName(type))));
        break;
    }

    if (!error.isOk()) {
        qCWarning(lcMessenger) << "dropping" << frameTypeName(type) << "frame:" << error;
        emit protocolError(error.toString());
    }
}

} // namespace mdsync
