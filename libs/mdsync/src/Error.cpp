#include <mdsync/Error.hpp>

namespace mdsync {

ErrorCategory errorCategory(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return ErrorCategory::None;

    case ErrorCode::FrameTooShort:
    case ErrorCode::InvalidHeaderLength:
    case ErrorCode::UnexpectedFrameType:
    case ErrorCode::MalformedEnvelope:
    case ErrorCode::MalformedMessage:
        return ErrorCategory::Structural;

    case ErrorCode::KeysMissing:
    case ErrorCode::NonceGenerationFailed:
    case ErrorCode::EncryptionFailed:
    case ErrorCode::DecryptionFailed:
        return ErrorCategory::Cryptographic;

    case ErrorCode::MessageAlreadyProcessed:
    case ErrorCode::MessageNonceReuse:
    case ErrorCode::UnknownMessageType:
    case ErrorCode::MessageSenderMismatch:
    case ErrorCode::BadMessage:
    case ErrorCode::BlockUnknownContact:
    case ErrorCode::MessageToEditNotFound:
    case ErrorCode::MessageToDeleteNotFound:
    case ErrorCode::ReactionTargetNotFound:
    case ErrorCode::MessageWontBeProcessed:
    case ErrorCode::NoLegacyType:
        return ErrorCategory::Discardable;

    case ErrorCode::ReceiverNotFound:
    case ErrorCode::GroupNotFound:
    case ErrorCode::ConversationNotFound:
        return ErrorCategory::Resolution;

    case ErrorCode::NotLoggedIn:
    case ErrorCode::NotConnectedToMediator:
    case ErrorCode::ReflectFailed:
    case ErrorCode::ReflectAckTimeout:
    case ErrorCode::SendFailed:
        return ErrorCategory::Transient;

    case ErrorCode::DeprecatedOutgoingType:
        return ErrorCategory::Deprecated;

    case ErrorCode::TaskDropped:
    case ErrorCode::DoNotAckIncomingVoIPMessage:
    case ErrorCode::MultiDeviceNotRegistered:
    case ErrorCode::ExecutionFailed:
    case ErrorCode::PersistenceFailed:
        return ErrorCategory::Task;
    }
    return ErrorCategory::Task;
}

const char* errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::FrameTooShort: return "FrameTooShort";
    case ErrorCode::InvalidHeaderLength: return "InvalidHeaderLength";
    case ErrorCode::UnexpectedFrameType: return "UnexpectedFrameType";
    case ErrorCode::MalformedEnvelope: return "MalformedEnvelope";
    case ErrorCode::MalformedMessage: return "MalformedMessage";
    case ErrorCode::KeysMissing: return "KeysMissing";
    case ErrorCode::NonceGenerationFailed: return "NonceGenerationFailed";
    case ErrorCode::EncryptionFailed: return "EncryptionFailed";
    case ErrorCode::DecryptionFailed: return "DecryptionFailed";
    case ErrorCode::MessageAlreadyProcessed: return "MessageAlreadyProcessed";
    case ErrorCode::MessageNonceReuse: return "MessageNonceReuse";
    case ErrorCode::UnknownMessageType: return "UnknownMessageType";
    case ErrorCode::MessageSenderMismatch: return "MessageSenderMismatch";
    case ErrorCode::BadMessage: return "BadMessage";
    case ErrorCode::BlockUnknownContact: return "BlockUnknownContact";
    case ErrorCode::MessageToEditNotFound: return "MessageToEditNotFound";
    case ErrorCode::MessageToDeleteNotFound: return "MessageToDeleteNotFound";
    case ErrorCode::ReactionTargetNotFound: return "ReactionTargetNotFound";
    case ErrorCode::MessageWontBeProcessed: return "MessageWontBeProcessed";
    case ErrorCode::NoLegacyType: return "NoLegacyType";
    case ErrorCode::ReceiverNotFound: return "ReceiverNotFound";
    case ErrorCode::GroupNotFound: return "GroupNotFound";
    case ErrorCode::ConversationNotFound: return "ConversationNotFound";
    case ErrorCode::NotLoggedIn: return "NotLoggedIn";
    case ErrorCode::NotConnectedToMediator: return "NotConnectedToMediator";
    case ErrorCode::ReflectFailed: return "ReflectFailed";
    case ErrorCode::ReflectAckTimeout: return "ReflectAckTimeout";
    case ErrorCode::SendFailed: return "SendFailed";
    case ErrorCode::DeprecatedOutgoingType: return "DeprecatedOutgoingType";
    case ErrorCode::TaskDropped: return "TaskDropped";
    case ErrorCode::DoNotAckIncomingVoIPMessage: return "DoNotAckIncomingVoIPMessage";
    case ErrorCode::MultiDeviceNotRegistered: return "MultiDeviceNotRegistered";
    case ErrorCode::ExecutionFailed: return "ExecutionFailed";
    case ErrorCode::PersistenceFailed: return "PersistenceFailed";
    }
    return "Unknown";
}

QString Error::toString() const
{
    if (message.isEmpty())
        return QString::fromLatin1(errorCodeName(code));
    return QStringLiteral("%1: %2").arg(QString::fromLatin1(errorCodeName(code)), message);
}

QDebug operator<<(QDebug debug, const Error& error)
{
    QDebugStateSaver saver(debug);
    debug.noquote() << error.toString();
    return debug;
}

} // namespace mdsync
