#pragma once

#include <QString>

namespace mdsync {

class IIdentityStore {
public:
    virtual ~IIdentityStore() = default;

    virtual QString identity() const = 0;
    virtual quint64 deviceId() const = 0;
};

} // namespace mdsync
