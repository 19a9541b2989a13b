#include <mdsync/Transport/ReplayConnection.hpp>

namespace mdsync {

ReplayConnection::ReplayConnection(QObject* parent)
    : IConnection(parent)
{
}

ReplayConnection::~ReplayConnection() = default;

bool ReplayConnection::send(const QByteArray& frame)
{
    if (!loggedIn_ || sendFails_)
        return false;
    written_.append(frame);
    return true;
}

bool ReplayConnection::isLoggedIn() const
{
    return loggedIn_;
}

void ReplayConnection::feedFrame(const QByteArray& frame)
{
    emit frameReceived(frame);
}

void ReplayConnection::simulateLogin()
{
    loggedIn_ = true;
    emit loggedIn();
}

void ReplayConnection::simulateDisconnect()
{
    loggedIn_ = false;
    emit disconnected();
}

void ReplayConnection::setSendFails(bool fails)
{
    sendFails_ = fails;
}

QList<QByteArray> ReplayConnection::writtenFrames() const
{
    return written_;
}

void ReplayConnection::clearWritten()
{
    written_.clear();
}

} // namespace mdsync
