#include <mdsync/Frame/MediatorFrameType.hpp>

namespace mdsync {

bool isKnownFrameType(uint8_t value)
{
    switch (static_cast<MediatorFrameType>(value)) {
    case MediatorFrameType::Proxy:
    case MediatorFrameType::ServerHello:
    case MediatorFrameType::ClientHello:
    case MediatorFrameType::ServerInfo:
    case MediatorFrameType::ReflectionQueueDry:
    case MediatorFrameType::RolePromotedToLeader:
    case MediatorFrameType::GetDeviceInfo:
    case MediatorFrameType::DeviceInfo:
    case MediatorFrameType::DropDevice:
    case MediatorFrameType::DropDeviceAck:
    case MediatorFrameType::SetSharedDeviceData:
    case MediatorFrameType::Lock:
    case MediatorFrameType::LockAck:
    case MediatorFrameType::Unlock:
    case MediatorFrameType::UnlockAck:
    case MediatorFrameType::Rejected:
    case MediatorFrameType::Ended:
    case MediatorFrameType::Reflect:
    case MediatorFrameType::ReflectAck:
    case MediatorFrameType::Reflected:
    case MediatorFrameType::ReflectedAck:
        return true;
    }
    return false;
}

const char* frameTypeName(MediatorFrameType type)
{
    switch (type) {
    case MediatorFrameType::Proxy: return "PROXY";
    case MediatorFrameType::ServerHello: return "SERVER_HELLO";
    case MediatorFrameType::ClientHello: return "CLIENT_HELLO";
    case MediatorFrameType::ServerInfo: return "SERVER_INFO";
    case MediatorFrameType::ReflectionQueueDry: return "REFLECTION_QUEUE_DRY";
    case MediatorFrameType::RolePromotedToLeader: return "ROLE_PROMOTED_TO_LEADER";
    case MediatorFrameType::GetDeviceInfo: return "GET_DEVICE_INFO";
    case MediatorFrameType::DeviceInfo: return "DEVICE_INFO";
    case MediatorFrameType::DropDevice: return "DROP_DEVICE";
    case MediatorFrameType::DropDeviceAck: return "DROP_DEVICE_ACK";
    case MediatorFrameType::SetSharedDeviceData: return "SET_SHARED_DEVICE_DATA";
    case MediatorFrameType::Lock: return "LOCK";
    case MediatorFrameType::LockAck: return "LOCK_ACK";
    case MediatorFrameType::Unlock: return "UNLOCK";
    case MediatorFrameType::UnlockAck: return "UNLOCK_ACK";
    case MediatorFrameType::Rejected: return "REJECTED";
    case MediatorFrameType::Ended: return "ENDED";
    case MediatorFrameType::Reflect: return "REFLECT";
    case MediatorFrameType::ReflectAck: return "REFLECT_ACK";
    case MediatorFrameType::Reflected: return "REFLECTED";
    case MediatorFrameType::ReflectedAck: return "REFLECTED_ACK";
    }
    return "UNKNOWN";
}

} // namespace mdsync
