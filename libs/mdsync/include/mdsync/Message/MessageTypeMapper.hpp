#pragma once

#include <mdsync/Error.hpp>

#include "mdsync/common.pb.h"
#include "mdsync/csp.pb.h"

namespace mdsync {

using MultiDeviceType = proto::common::CspE2eMessageType::Enum;

/// Mapping between legacy message type codes and the multi-device message
/// type enumeration. The table is a wire contract: a new legacy code needs
/// a forward entry, an inverse entry where one exists, and a decision in
/// ReflectionPolicy.
class MessageTypeMapper {
public:
    /// Total. Unknown codes map to INVALID_TYPE.
    static MultiDeviceType legacyTypeToMultiDeviceType(int legacyType);

    /// Partial. Fails with NoLegacyType for forward security envelopes,
    /// web session resume, group join messages and INVALID_TYPE.
    static bool multiDeviceTypeToLegacyType(MultiDeviceType type, int& legacyType,
                                            Error* error = nullptr);

    /// Legacy code of the message content, 0 when no content is set.
    static int legacyTypeOf(const proto::csp::AbstractMessage& message);
    static MultiDeviceType multiDeviceTypeOf(const proto::csp::AbstractMessage& message);

    static bool isGroupMessage(const proto::csp::AbstractMessage& message);
    static QString typeName(MultiDeviceType type);
};

} // namespace mdsync
