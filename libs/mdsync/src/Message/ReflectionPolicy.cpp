#include <mdsync/Message/ReflectionPolicy.hpp>

namespace mdsync {

using Type = proto::common::CspE2eMessageType;

bool ReflectionPolicy::isReflectable(MultiDeviceType type) const
{
    switch (type) {
    case Type::DEPRECATED_AUDIO:
    case Type::DELIVERY_RECEIPT:
    case Type::FILE:
    case Type::DEPRECATED_IMAGE:
    case Type::GROUP_AUDIO:
    case Type::GROUP_SETUP:
    case Type::GROUP_DELETE_PROFILE_PICTURE:
    case Type::GROUP_DELIVERY_RECEIPT:
    case Type::GROUP_FILE:
    case Type::GROUP_IMAGE:
    case Type::GROUP_LEAVE:
    case Type::GROUP_LOCATION:
    case Type::GROUP_POLL_SETUP:
    case Type::GROUP_POLL_VOTE:
    case Type::GROUP_NAME:
    case Type::GROUP_SET_PROFILE_PICTURE:
    case Type::GROUP_TEXT:
    case Type::GROUP_VIDEO:
    case Type::LOCATION:
    case Type::POLL_SETUP:
    case Type::POLL_VOTE:
    case Type::TEXT:
    case Type::DEPRECATED_VIDEO:
    case Type::CALL_OFFER:
    case Type::CALL_ANSWER:
    case Type::CALL_ICE_CANDIDATE:
    case Type::CALL_HANGUP:
    case Type::CALL_RINGING:
    case Type::CONTACT_SET_PROFILE_PICTURE:
    case Type::CONTACT_DELETE_PROFILE_PICTURE:
    case Type::CONTACT_REQUEST_PROFILE_PICTURE:
    case Type::DELETE_MESSAGE:
    case Type::GROUP_DELETE_MESSAGE:
    case Type::EDIT_MESSAGE:
    case Type::GROUP_EDIT_MESSAGE:
    case Type::GROUP_CALL_START:
    case Type::REACTION:
    case Type::GROUP_REACTION:
        return true;

    // Ephemeral or local-only
    case Type::TYPING_INDICATOR:
    case Type::EMPTY:
    case Type::GROUP_SYNC_REQUEST:
    case Type::FORWARD_SECURITY_ENVELOPE:
    case Type::WEB_SESSION_RESUME:
    case Type::GROUP_JOIN_REQUEST:
    case Type::GROUP_JOIN_RESPONSE:
    case Type::INVALID_TYPE:
    default:
        return false;
    }
}

bool ReflectionPolicy::shouldReflect(MultiDeviceType type, bool multiDeviceActive) const
{
    if (!multiDeviceActive) {
        return false;
    }
    return isReflectable(type);
}

} // namespace mdsync
