#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>

namespace mdsync {

/// Connection to the mediator server. Framing below mediator frames
/// (TLS, WebSocket) is the implementation's concern.
class IConnection : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IConnection() override = default;

    /// Returns false when the frame could not be handed to the transport.
    virtual bool send(const QByteArray& frame) = 0;
    virtual bool isLoggedIn() const = 0;

signals:
    void frameReceived(const QByteArray& frame);
    void loggedIn();
    void disconnected();
    void error(const QString& message);
};

} // namespace mdsync
