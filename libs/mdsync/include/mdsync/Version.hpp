#pragma once
#include <cstdint>

namespace mdsync {

constexpr int MEDIATOR_COMMON_HEADER_LENGTH = 4;
constexpr int MEDIATOR_PAYLOAD_HEADER_LENGTH = 4;
constexpr uint8_t MEDIATOR_PAYLOAD_HEADER = 0x08;
constexpr int MEDIATOR_REFLECT_ID_LENGTH = 4;
constexpr int MEDIATOR_TIMESTAMP_LENGTH = 8;

constexpr int ENVELOPE_NONCE_LENGTH = 24;
constexpr int ENVELOPE_KEY_LENGTH = 32;
constexpr int ENVELOPE_TAG_LENGTH = 16;
constexpr int ENVELOPE_MAX_PADDING = 16;

constexpr int IDENTITY_LENGTH = 8;

constexpr uint32_t TASK_QUEUE_SNAPSHOT_VERSION = 1;
constexpr uint32_t TRANSACTION_TTL_SECONDS = 0;

} // namespace mdsync
