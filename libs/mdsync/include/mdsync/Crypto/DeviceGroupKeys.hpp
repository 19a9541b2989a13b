#pragma once

#include <mdsync/Error.hpp>

#include <QByteArray>
#include <memory>

namespace mdsync {

/// Symmetric keys shared by every device of one identity. Built once at
/// multi-device activation and never modified afterwards.
class DeviceGroupKeys {
public:
    DeviceGroupKeys(const QByteArray& reflectKey,
                    const QByteArray& deviceInfoKey,
                    const QByteArray& transactionScopeKey);

    /// Derives the key set from the 32-byte device group key using
    /// HKDF-SHA256. Returns nullptr on failure.
    static std::shared_ptr<const DeviceGroupKeys> derive(const QByteArray& deviceGroupKey,
                                                         Error* error = nullptr);

    const QByteArray& reflectKey() const { return reflectKey_; }
    const QByteArray& deviceInfoKey() const { return deviceInfoKey_; }
    const QByteArray& transactionScopeKey() const { return transactionScopeKey_; }

private:
    QByteArray reflectKey_;
    QByteArray deviceInfoKey_;
    QByteArray transactionScopeKey_;
};

} // namespace mdsync
