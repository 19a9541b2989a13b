#pragma once

#include <cstdint>

namespace mdsync {

enum class MediatorFrameType : uint8_t {
    Proxy                = 0x00,
    ServerHello          = 0x10,
    ClientHello          = 0x11,
    ServerInfo           = 0x12,
    ReflectionQueueDry   = 0x20,
    RolePromotedToLeader = 0x21,
    GetDeviceInfo        = 0x30,
    DeviceInfo           = 0x31,
    DropDevice           = 0x32,
    DropDeviceAck        = 0x33,
    SetSharedDeviceData  = 0x34,
    Lock                 = 0x40,
    LockAck              = 0x41,
    Unlock               = 0x42,
    UnlockAck            = 0x43,
    Rejected             = 0x44,
    Ended                = 0x45,
    Reflect              = 0x80,
    ReflectAck           = 0x81,
    Reflected            = 0x82,
    ReflectedAck         = 0x83
};

bool isKnownFrameType(uint8_t value);
const char* frameTypeName(MediatorFrameType type);

} // namespace mdsync
