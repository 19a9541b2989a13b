#include <mdsync/Message/MessageTypeMapper.hpp>
#include <mdsync/Message/LegacyMessageType.hpp>

namespace mdsync {

using Type = proto::common::CspE2eMessageType;
using Content = proto::csp::AbstractMessage;

MultiDeviceType MessageTypeMapper::legacyTypeToMultiDeviceType(int legacyType)
{
    switch (legacyType) {
    case LegacyMessageType::AUDIO: return Type::DEPRECATED_AUDIO;
    case LegacyMessageType::BALLOT_CREATE: return Type::POLL_SETUP;
    case LegacyMessageType::BALLOT_VOTE: return Type::POLL_VOTE;
    case LegacyMessageType::DELIVERY_RECEIPT: return Type::DELIVERY_RECEIPT;
    case LegacyMessageType::FILE: return Type::FILE;
    case LegacyMessageType::GROUP_AUDIO: return Type::GROUP_AUDIO;
    case LegacyMessageType::GROUP_BALLOT_CREATE: return Type::GROUP_POLL_SETUP;
    case LegacyMessageType::GROUP_BALLOT_VOTE: return Type::GROUP_POLL_VOTE;
    case LegacyMessageType::GROUP_CREATE: return Type::GROUP_SETUP;
    case LegacyMessageType::GROUP_DELETE_PHOTO: return Type::GROUP_DELETE_PROFILE_PICTURE;
    case LegacyMessageType::GROUP_DELIVERY_RECEIPT: return Type::GROUP_DELIVERY_RECEIPT;
    case LegacyMessageType::GROUP_FILE: return Type::GROUP_FILE;
    case LegacyMessageType::GROUP_IMAGE: return Type::GROUP_IMAGE;
    case LegacyMessageType::GROUP_LEAVE: return Type::GROUP_LEAVE;
    case LegacyMessageType::GROUP_LOCATION: return Type::GROUP_LOCATION;
    case LegacyMessageType::GROUP_RENAME: return Type::GROUP_NAME;
    case LegacyMessageType::GROUP_REQUEST_SYNC: return Type::GROUP_SYNC_REQUEST;
    case LegacyMessageType::GROUP_SET_PHOTO: return Type::GROUP_SET_PROFILE_PICTURE;
    case LegacyMessageType::GROUP_TEXT: return Type::GROUP_TEXT;
    case LegacyMessageType::GROUP_VIDEO: return Type::GROUP_VIDEO;
    case LegacyMessageType::GROUP_CALL_START: return Type::GROUP_CALL_START;
    case LegacyMessageType::IMAGE: return Type::DEPRECATED_IMAGE;
    case LegacyMessageType::LOCATION: return Type::LOCATION;
    case LegacyMessageType::TEXT: return Type::TEXT;
    case LegacyMessageType::VIDEO: return Type::DEPRECATED_VIDEO;
    case LegacyMessageType::VOIP_CALL_OFFER: return Type::CALL_OFFER;
    case LegacyMessageType::VOIP_CALL_ANSWER: return Type::CALL_ANSWER;
    case LegacyMessageType::VOIP_CALL_ICECANDIDATE: return Type::CALL_ICE_CANDIDATE;
    case LegacyMessageType::VOIP_CALL_HANGUP: return Type::CALL_HANGUP;
    case LegacyMessageType::VOIP_CALL_RINGING: return Type::CALL_RINGING;
    case LegacyMessageType::CONTACT_SET_PHOTO: return Type::CONTACT_SET_PROFILE_PICTURE;
    case LegacyMessageType::CONTACT_DELETE_PHOTO: return Type::CONTACT_DELETE_PROFILE_PICTURE;
    case LegacyMessageType::CONTACT_REQUEST_PHOTO: return Type::CONTACT_REQUEST_PROFILE_PICTURE;
    case LegacyMessageType::TYPING_INDICATOR: return Type::TYPING_INDICATOR;
    case LegacyMessageType::EMPTY: return Type::EMPTY;
    case LegacyMessageType::EDIT: return Type::EDIT_MESSAGE;
    case LegacyMessageType::DELETE: return Type::DELETE_MESSAGE;
    case LegacyMessageType::GROUP_EDIT: return Type::GROUP_EDIT_MESSAGE;
    case LegacyMessageType::GROUP_DELETE: return Type::GROUP_DELETE_MESSAGE;
    case LegacyMessageType::REACTION: return Type::REACTION;
    case LegacyMessageType::GROUP_REACTION: return Type::GROUP_REACTION;
    default:
        return Type::INVALID_TYPE;
    }
}

bool MessageTypeMapper::multiDeviceTypeToLegacyType(MultiDeviceType type, int& legacyType,
                                                    Error* error)
{
    int legacy = 0;
    switch (type) {
    case Type::DEPRECATED_AUDIO: legacy = LegacyMessageType::AUDIO; break;
    case Type::POLL_SETUP: legacy = LegacyMessageType::BALLOT_CREATE; break;
    case Type::POLL_VOTE: legacy = LegacyMessageType::BALLOT_VOTE; break;
    case Type::DELIVERY_RECEIPT: legacy = LegacyMessageType::DELIVERY_RECEIPT; break;
    case Type::FILE: legacy = LegacyMessageType::FILE; break;
    case Type::GROUP_AUDIO: legacy = LegacyMessageType::GROUP_AUDIO; break;
    case Type::GROUP_POLL_SETUP: legacy = LegacyMessageType::GROUP_BALLOT_CREATE; break;
    case Type::GROUP_POLL_VOTE: legacy = LegacyMessageType::GROUP_BALLOT_VOTE; break;
    case Type::GROUP_SETUP: legacy = LegacyMessageType::GROUP_CREATE; break;
    case Type::GROUP_DELETE_PROFILE_PICTURE: legacy = LegacyMessageType::GROUP_DELETE_PHOTO; break;
    case Type::GROUP_DELIVERY_RECEIPT: legacy = LegacyMessageType::GROUP_DELIVERY_RECEIPT; break;
    case Type::GROUP_FILE: legacy = LegacyMessageType::GROUP_FILE; break;
    case Type::GROUP_IMAGE: legacy = LegacyMessageType::GROUP_IMAGE; break;
    case Type::GROUP_LEAVE: legacy = LegacyMessageType::GROUP_LEAVE; break;
    case Type::GROUP_LOCATION: legacy = LegacyMessageType::GROUP_LOCATION; break;
    case Type::GROUP_NAME: legacy = LegacyMessageType::GROUP_RENAME; break;
    case Type::GROUP_SYNC_REQUEST: legacy = LegacyMessageType::GROUP_REQUEST_SYNC; break;
    case Type::GROUP_SET_PROFILE_PICTURE: legacy = LegacyMessageType::GROUP_SET_PHOTO; break;
    case Type::GROUP_TEXT: legacy = LegacyMessageType::GROUP_TEXT; break;
    case Type::GROUP_VIDEO: legacy = LegacyMessageType::GROUP_VIDEO; break;
    case Type::GROUP_CALL_START: legacy = LegacyMessageType::GROUP_CALL_START; break;
    case Type::DEPRECATED_IMAGE: legacy = LegacyMessageType::IMAGE; break;
    case Type::LOCATION: legacy = LegacyMessageType::LOCATION; break;
    case Type::TEXT: legacy = LegacyMessageType::TEXT; break;
    case Type::DEPRECATED_VIDEO: legacy = LegacyMessageType::VIDEO; break;
    case Type::CALL_OFFER: legacy = LegacyMessageType::VOIP_CALL_OFFER; break;
    case Type::CALL_ANSWER: legacy = LegacyMessageType::VOIP_CALL_ANSWER; break;
    case Type::CALL_ICE_CANDIDATE: legacy = LegacyMessageType::VOIP_CALL_ICECANDIDATE; break;
    case Type::CALL_HANGUP: legacy = LegacyMessageType::VOIP_CALL_HANGUP; break;
    case Type::CALL_RINGING: legacy = LegacyMessageType::VOIP_CALL_RINGING; break;
    case Type::CONTACT_SET_PROFILE_PICTURE: legacy = LegacyMessageType::CONTACT_SET_PHOTO; break;
    case Type::CONTACT_DELETE_PROFILE_PICTURE: legacy = LegacyMessageType::CONTACT_DELETE_PHOTO; break;
    case Type::CONTACT_REQUEST_PROFILE_PICTURE: legacy = LegacyMessageType::CONTACT_REQUEST_PHOTO; break;
    case Type::TYPING_INDICATOR: legacy = LegacyMessageType::TYPING_INDICATOR; break;
    case Type::EMPTY: legacy = LegacyMessageType::EMPTY; break;
    case Type::EDIT_MESSAGE: legacy = LegacyMessageType::EDIT; break;
    case Type::DELETE_MESSAGE: legacy = LegacyMessageType::DELETE; break;
    case Type::GROUP_EDIT_MESSAGE: legacy = LegacyMessageType::GROUP_EDIT; break;
    case Type::GROUP_DELETE_MESSAGE: legacy = LegacyMessageType::GROUP_DELETE; break;
    case Type::REACTION: legacy = LegacyMessageType::REACTION; break;
    case Type::GROUP_REACTION: legacy = LegacyMessageType::GROUP_REACTION; break;

    case Type::FORWARD_SECURITY_ENVELOPE:
    case Type::WEB_SESSION_RESUME:
    case Type::GROUP_JOIN_REQUEST:
    case Type::GROUP_JOIN_RESPONSE:
    case Type::INVALID_TYPE:
    default:
        return fail(error, ErrorCode::NoLegacyType,
                    QStringLiteral("no legacy type for %1").arg(typeName(type)));
    }
    legacyType = legacy;
    return true;
}

int MessageTypeMapper::legacyTypeOf(const proto::csp::AbstractMessage& message)
{
    switch (message.content_case()) {
    case Content::kText: return LegacyMessageType::TEXT;
    case Content::kDeprecatedImage: return LegacyMessageType::IMAGE;
    case Content::kDeprecatedVideo: return LegacyMessageType::VIDEO;
    case Content::kDeprecatedAudio: return LegacyMessageType::AUDIO;
    case Content::kLocation: return LegacyMessageType::LOCATION;
    case Content::kFile: return LegacyMessageType::FILE;
    case Content::kPollSetup: return LegacyMessageType::BALLOT_CREATE;
    case Content::kPollVote: return LegacyMessageType::BALLOT_VOTE;
    case Content::kContactSetProfilePicture: return LegacyMessageType::CONTACT_SET_PHOTO;
    case Content::kContactDeleteProfilePicture: return LegacyMessageType::CONTACT_DELETE_PHOTO;
    case Content::kContactRequestProfilePicture: return LegacyMessageType::CONTACT_REQUEST_PHOTO;
    case Content::kDeliveryReceipt: return LegacyMessageType::DELIVERY_RECEIPT;
    case Content::kTypingIndicator: return LegacyMessageType::TYPING_INDICATOR;
    case Content::kEditMessage: return LegacyMessageType::EDIT;
    case Content::kDeleteMessage: return LegacyMessageType::DELETE;
    case Content::kReaction: return LegacyMessageType::REACTION;
    case Content::kCallOffer: return LegacyMessageType::VOIP_CALL_OFFER;
    case Content::kCallAnswer: return LegacyMessageType::VOIP_CALL_ANSWER;
    case Content::kCallIceCandidate: return LegacyMessageType::VOIP_CALL_ICECANDIDATE;
    case Content::kCallHangup: return LegacyMessageType::VOIP_CALL_HANGUP;
    case Content::kCallRinging: return LegacyMessageType::VOIP_CALL_RINGING;
    case Content::kEmpty: return LegacyMessageType::EMPTY;
    case Content::kGroupText: return LegacyMessageType::GROUP_TEXT;
    case Content::kGroupLocation: return LegacyMessageType::GROUP_LOCATION;
    case Content::kGroupImage: return LegacyMessageType::GROUP_IMAGE;
    case Content::kGroupVideo: return LegacyMessageType::GROUP_VIDEO;
    case Content::kGroupAudio: return LegacyMessageType::GROUP_AUDIO;
    case Content::kGroupFile: return LegacyMessageType::GROUP_FILE;
    case Content::kGroupSetup: return LegacyMessageType::GROUP_CREATE;
    case Content::kGroupName: return LegacyMessageType::GROUP_RENAME;
    case Content::kGroupLeave: return LegacyMessageType::GROUP_LEAVE;
    case Content::kGroupSetProfilePicture: return LegacyMessageType::GROUP_SET_PHOTO;
    case Content::kGroupDeleteProfilePicture: return LegacyMessageType::GROUP_DELETE_PHOTO;
    case Content::kGroupSyncRequest: return LegacyMessageType::GROUP_REQUEST_SYNC;
    case Content::kGroupPollSetup: return LegacyMessageType::GROUP_BALLOT_CREATE;
    case Content::kGroupPollVote: return LegacyMessageType::GROUP_BALLOT_VOTE;
    case Content::kGroupDeliveryReceipt: return LegacyMessageType::GROUP_DELIVERY_RECEIPT;
    case Content::kGroupEditMessage: return LegacyMessageType::GROUP_EDIT;
    case Content::kGroupDeleteMessage: return LegacyMessageType::GROUP_DELETE;
    case Content::kGroupReaction: return LegacyMessageType::GROUP_REACTION;
    case Content::kGroupCallStart: return LegacyMessageType::GROUP_CALL_START;
    case Content::CONTENT_NOT_SET: return 0;
    }
    return 0;
}

MultiDeviceType MessageTypeMapper::multiDeviceTypeOf(const proto::csp::AbstractMessage& message)
{
    return legacyTypeToMultiDeviceType(legacyTypeOf(message));
}

bool MessageTypeMapper::isGroupMessage(const proto::csp::AbstractMessage& message)
{
    int legacy = legacyTypeOf(message);
    return (legacy >= LegacyMessageType::GROUP_TEXT && legacy <= LegacyMessageType::GROUP_DELETE_PHOTO)
        || legacy == LegacyMessageType::GROUP_DELIVERY_RECEIPT
        || legacy == LegacyMessageType::GROUP_REACTION
        || legacy == LegacyMessageType::GROUP_EDIT
        || legacy == LegacyMessageType::GROUP_DELETE;
}

QString MessageTypeMapper::typeName(MultiDeviceType type)
{
    const std::string& name = Type::Enum_Name(type);
    if (name.empty())
        return QStringLiteral("UNKNOWN(%1)").arg(static_cast<int>(type));
    return QString::fromStdString(name);
}

} // namespace mdsync
