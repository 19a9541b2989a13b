#pragma once

#include <mdsync/Error.hpp>

#include <QByteArray>
#include <QString>

namespace mdsync {

/// End-to-end encryption towards a single contact. The engine supplies the
/// nonce so that a retried send reuses the nonce recorded in its task.
class IContactCryptor {
public:
    virtual ~IContactCryptor() = default;

    virtual bool box(const QByteArray& plaintext, const QString& receiverIdentity,
                     const QByteArray& nonce, QByteArray& out, Error* error = nullptr) = 0;
};

} // namespace mdsync
