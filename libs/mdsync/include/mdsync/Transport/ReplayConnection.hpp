#pragma once

#include <mdsync/Transport/IConnection.hpp>
#include <QList>

namespace mdsync {

class ReplayConnection : public IConnection {
    Q_OBJECT
public:
    explicit ReplayConnection(QObject* parent = nullptr);
    ~ReplayConnection() override;

    // IConnection interface
    bool send(const QByteArray& frame) override;
    bool isLoggedIn() const override;

    // Test API
    void feedFrame(const QByteArray& frame);
    void simulateLogin();
    void simulateDisconnect();
    void setSendFails(bool fails);
    QList<QByteArray> writtenFrames() const;
    void clearWritten();

private:
    bool loggedIn_ = false;
    bool sendFails_ = false;
    QList<QByteArray> written_;
};

} // namespace mdsync
