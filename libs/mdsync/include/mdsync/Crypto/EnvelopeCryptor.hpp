#pragma once

#include <mdsync/Error.hpp>
#include <mdsync/Crypto/DeviceGroupKeys.hpp>
#include <mdsync/Crypto/RandomSource.hpp>

#include <QByteArray>
#include <memory>

#include "mdsync/d2d.pb.h"

namespace mdsync {

/// Authenticated symmetric encryption of envelopes with the device group
/// keys. Output layout is nonce ++ ciphertext ++ tag, with a fresh random
/// 24-byte nonce per call (AES-256-GCM).
class EnvelopeCryptor {
public:
    explicit EnvelopeCryptor(RandomSource random = systemRandomSource());

    EnvelopeCryptor(const EnvelopeCryptor&) = delete;
    EnvelopeCryptor& operator=(const EnvelopeCryptor&) = delete;

    void setDeviceGroupKeys(std::shared_ptr<const DeviceGroupKeys> keys);
    std::shared_ptr<const DeviceGroupKeys> deviceGroupKeys() const;
    bool hasKeys() const;

    bool encrypt(const QByteArray& plaintext, const QByteArray& key,
                 QByteArray& out, Error* error = nullptr) const;
    bool decrypt(const QByteArray& noncePrefixedCiphertext, const QByteArray& key,
                 QByteArray& out, Error* error = nullptr) const;

    bool encryptEnvelope(const proto::d2d::Envelope& envelope,
                         QByteArray& out, Error* error = nullptr) const;
    bool decryptEnvelope(const QByteArray& noncePrefixedCiphertext,
                         proto::d2d::Envelope& out, Error* error = nullptr) const;

    bool encryptTransactionScope(proto::d2d::TransactionScope::Scope scope,
                                 QByteArray& out, Error* error = nullptr) const;

    bool generateNonce(QByteArray& out, Error* error = nullptr) const;
    bool generateReflectId(QByteArray& out, Error* error = nullptr) const;

    const RandomSource& randomSource() const { return random_; }

private:
    RandomSource random_;
    std::shared_ptr<const DeviceGroupKeys> keys_;
};

} // namespace mdsync
