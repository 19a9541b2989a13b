#pragma once

#include <mdsync/Message/MessageTypeMapper.hpp>

namespace mdsync {

class ReflectionPolicy {
public:
    /// Message categories mirrored to the other devices of the group.
    bool isReflectable(MultiDeviceType type) const;
    bool shouldReflect(MultiDeviceType type, bool multiDeviceActive) const;
};

} // namespace mdsync
