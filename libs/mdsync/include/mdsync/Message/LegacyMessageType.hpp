#pragma once
#include <cstdint>

namespace mdsync {

/// Legacy end-to-end message type codes, as carried in the first byte of a
/// decrypted chat message.
namespace LegacyMessageType {
    constexpr int TEXT                    = 0x01;
    constexpr int IMAGE                   = 0x02;
    constexpr int LOCATION                = 0x10;
    constexpr int VIDEO                   = 0x13;
    constexpr int AUDIO                   = 0x14;
    constexpr int BALLOT_CREATE           = 0x15;
    constexpr int BALLOT_VOTE             = 0x16;
    constexpr int FILE                    = 0x17;
    constexpr int CONTACT_SET_PHOTO       = 0x18;
    constexpr int CONTACT_DELETE_PHOTO    = 0x19;
    constexpr int CONTACT_REQUEST_PHOTO   = 0x1a;
    constexpr int GROUP_TEXT              = 0x41;
    constexpr int GROUP_LOCATION          = 0x42;
    constexpr int GROUP_IMAGE             = 0x43;
    constexpr int GROUP_VIDEO             = 0x44;
    constexpr int GROUP_AUDIO             = 0x45;
    constexpr int GROUP_FILE              = 0x46;
    constexpr int GROUP_CREATE            = 0x4a;
    constexpr int GROUP_RENAME            = 0x4b;
    constexpr int GROUP_LEAVE             = 0x4c;
    constexpr int GROUP_CALL_START        = 0x4f;
    constexpr int GROUP_SET_PHOTO         = 0x50;
    constexpr int GROUP_REQUEST_SYNC      = 0x51;
    constexpr int GROUP_BALLOT_CREATE     = 0x52;
    constexpr int GROUP_BALLOT_VOTE       = 0x53;
    constexpr int GROUP_DELETE_PHOTO      = 0x54;
    constexpr int VOIP_CALL_OFFER         = 0x60;
    constexpr int VOIP_CALL_ANSWER        = 0x61;
    constexpr int VOIP_CALL_ICECANDIDATE  = 0x62;
    constexpr int VOIP_CALL_HANGUP        = 0x63;
    constexpr int VOIP_CALL_RINGING       = 0x64;
    constexpr int DELIVERY_RECEIPT        = 0x80;
    constexpr int GROUP_DELIVERY_RECEIPT  = 0x81;
    constexpr int REACTION                = 0x82;
    constexpr int GROUP_REACTION          = 0x83;
    constexpr int TYPING_INDICATOR        = 0x90;
    constexpr int EDIT                    = 0x91;
    constexpr int DELETE                  = 0x92;
    constexpr int GROUP_EDIT              = 0x93;
    constexpr int GROUP_DELETE            = 0x94;
    constexpr int FORWARD_SECURITY        = 0xa0;
    constexpr int EMPTY                   = 0xfc;
    constexpr int AUTH_TOKEN              = 0xff;
}

} // namespace mdsync
