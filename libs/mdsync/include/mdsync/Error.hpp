#pragma once

#include <QString>
#include <QDebug>

namespace mdsync {

enum class ErrorCode {
    None,

    // Structural
    FrameTooShort,
    InvalidHeaderLength,
    UnexpectedFrameType,
    MalformedEnvelope,
    MalformedMessage,

    // Cryptographic
    KeysMissing,
    NonceGenerationFailed,
    EncryptionFailed,
    DecryptionFailed,

    // Protocol/state, discardable
    MessageAlreadyProcessed,
    MessageNonceReuse,
    UnknownMessageType,
    MessageSenderMismatch,
    BadMessage,
    BlockUnknownContact,
    MessageToEditNotFound,
    MessageToDeleteNotFound,
    ReactionTargetNotFound,
    MessageWontBeProcessed,
    NoLegacyType,

    // Resolution
    ReceiverNotFound,
    GroupNotFound,
    ConversationNotFound,

    // Transport/session
    NotLoggedIn,
    NotConnectedToMediator,
    ReflectFailed,
    ReflectAckTimeout,
    SendFailed,

    // Deprecated-type
    DeprecatedOutgoingType,

    // Task outcomes
    TaskDropped,
    DoNotAckIncomingVoIPMessage,
    MultiDeviceNotRegistered,
    ExecutionFailed,
    PersistenceFailed
};

enum class ErrorCategory {
    None,
    Structural,
    Cryptographic,
    Discardable,
    Resolution,
    Transient,
    Deprecated,
    Task
};

ErrorCategory errorCategory(ErrorCode code);
const char* errorCodeName(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::None;
    QString message;

    Error() = default;
    Error(ErrorCode c, const QString& msg = QString())
        : code(c), message(msg) {}

    bool isOk() const { return code == ErrorCode::None; }
    ErrorCategory category() const { return errorCategory(code); }
    QString toString() const;

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

// Fills *out when the caller asked for details. Always returns false so
// decoders can write `return fail(error, ...)`.
inline bool fail(Error* out, ErrorCode code, const QString& message = QString())
{
    if (out)
        *out = Error(code, message);
    return false;
}

QDebug operator<<(QDebug debug, const Error& error);

} // namespace mdsync
