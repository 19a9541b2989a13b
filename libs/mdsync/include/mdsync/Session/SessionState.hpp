#pragma once

namespace mdsync {

enum class SessionState {
    Idle,
    Connecting,
    Active,
    Disconnected
};

const char* sessionStateName(SessionState state);

} // namespace mdsync
