#include <mdsync/Frame/ChatServerPayload.hpp>
#include <mdsync/Version.hpp>
#include <QtEndian>

namespace mdsync {

namespace {

constexpr int CONTAINER_HEADER_LENGTH = 4;
// sender, receiver, message id, date, flags, reserved, metadata length
constexpr int MESSAGE_HEADER_LENGTH = IDENTITY_LENGTH * 2 + 8 + 4 + 1 + 1 + 2;

QByteArray containerHeader(uint8_t type)
{
    QByteArray header(CONTAINER_HEADER_LENGTH, '\0');
    header[0] = static_cast<char>(type);
    return header;
}

QByteArray identityBytes(const QString& identity)
{
    QByteArray bytes = identity.toLatin1().left(IDENTITY_LENGTH);
    if (bytes.size() < IDENTITY_LENGTH)
        bytes.append(QByteArray(IDENTITY_LENGTH - bytes.size(), ' '));
    return bytes;
}

QString identityFrom(const QByteArray& data, int offset)
{
    return QString::fromLatin1(data.mid(offset, IDENTITY_LENGTH)).trimmed();
}

template <typename T>
void appendLE(QByteArray& out, T value)
{
    T le = qToLittleEndian(value);
    out.append(reinterpret_cast<const char*>(&le), sizeof(le));
}

template <typename T>
T readLE(const QByteArray& data, int offset)
{
    return qFromLittleEndian<T>(reinterpret_cast<const uchar*>(data.constData() + offset));
}

bool expectContainer(const QByteArray& payload, uint8_t type, int minimumBody, Error* error)
{
    if (payload.size() < CONTAINER_HEADER_LENGTH + minimumBody) {
        return fail(error, ErrorCode::FrameTooShort,
                    QStringLiteral("chat server payload of %1 bytes, need %2")
                        .arg(payload.size()).arg(CONTAINER_HEADER_LENGTH + minimumBody));
    }
    if (static_cast<uint8_t>(payload[0]) != type) {
        return fail(error, ErrorCode::UnexpectedFrameType,
                    QStringLiteral("chat server payload type 0x%1")
                        .arg(static_cast<uint8_t>(payload[0]), 2, 16, QLatin1Char('0')));
    }
    return true;
}

} // namespace

QByteArray ChatServerPayload::encodeOutgoingMessage(const OutgoingMessageBox& message)
{
    QByteArray payload = containerHeader(ChatServerPayloadType::OUTGOING_MESSAGE);
    payload.reserve(CONTAINER_HEADER_LENGTH + MESSAGE_HEADER_LENGTH
                    + message.nonce.size() + message.box.size());
    payload.append(identityBytes(message.fromIdentity));
    payload.append(identityBytes(message.toIdentity));
    appendLE<quint64>(payload, message.messageId);
    appendLE<quint32>(payload, static_cast<quint32>(message.createdAt.toSecsSinceEpoch()));
    payload.append(static_cast<char>(message.flags));
    payload.append('\0');
    appendLE<quint16>(payload, 0); // no metadata
    payload.append(message.nonce);
    payload.append(message.box);
    return payload;
}

QByteArray ChatServerPayload::encodeIncomingMessageAck(const IncomingMessageAck& ack)
{
    QByteArray payload = containerHeader(ChatServerPayloadType::INCOMING_MESSAGE_ACK);
    payload.append(identityBytes(ack.senderIdentity));
    appendLE<quint64>(payload, ack.messageId);
    return payload;
}

bool ChatServerPayload::payloadType(const QByteArray& payload, uint8_t& type, Error* error)
{
    if (payload.size() < CONTAINER_HEADER_LENGTH) {
        return fail(error, ErrorCode::FrameTooShort,
                    QStringLiteral("chat server payload of %1 bytes").arg(payload.size()));
    }
    type = static_cast<uint8_t>(payload[0]);
    return true;
}

bool ChatServerPayload::decodeOutgoingMessage(const QByteArray& payload, OutgoingMessageBox& out,
                                              Error* error)
{
    if (!expectContainer(payload, ChatServerPayloadType::OUTGOING_MESSAGE,
                         MESSAGE_HEADER_LENGTH + ENVELOPE_NONCE_LENGTH, error)) {
        return false;
    }

    int offset = CONTAINER_HEADER_LENGTH;
    OutgoingMessageBox message;
    message.fromIdentity = identityFrom(payload, offset);
    offset += IDENTITY_LENGTH;
    message.toIdentity = identityFrom(payload, offset);
    offset += IDENTITY_LENGTH;
    message.messageId = readLE<quint64>(payload, offset);
    offset += 8;
    message.createdAt = QDateTime::fromSecsSinceEpoch(readLE<quint32>(payload, offset), Qt::UTC);
    offset += 4;
    message.flags = static_cast<uint8_t>(payload[offset]);
    offset += 2;
    int metadataLength = readLE<quint16>(payload, offset);
    offset += 2 + metadataLength;

    if (payload.size() < offset + ENVELOPE_NONCE_LENGTH) {
        return fail(error, ErrorCode::InvalidHeaderLength,
                    QStringLiteral("metadata length %1 exceeds payload").arg(metadataLength));
    }
    message.nonce = payload.mid(offset, ENVELOPE_NONCE_LENGTH);
    message.box = payload.mid(offset + ENVELOPE_NONCE_LENGTH);

    out = message;
    return true;
}

bool ChatServerPayload::decodeIncomingMessageAck(const QByteArray& payload, IncomingMessageAck& out,
                                                 Error* error)
{
    if (!expectContainer(payload, ChatServerPayloadType::INCOMING_MESSAGE_ACK,
                         IDENTITY_LENGTH + 8, error)) {
        return false;
    }
    out.senderIdentity = identityFrom(payload, CONTAINER_HEADER_LENGTH);
    out.messageId = readLE<quint64>(payload, CONTAINER_HEADER_LENGTH + IDENTITY_LENGTH);
    return true;
}

} // namespace mdsync
