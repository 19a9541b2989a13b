#include <mdsync/Frame/FrameCodec.hpp>
#include <mdsync/Version.hpp>
#include <QtEndian>
#include <QLoggingCategory>

#include "mdsync/d2d.pb.h"

Q_LOGGING_CATEGORY(lcFrameCodec, "mdsync.frame")

namespace mdsync {

namespace {

// Offsets within the payload, i.e. after the common header.
constexpr int REFLECT_ID_OFFSET = 4;
constexpr int TIMESTAMP_OFFSET = REFLECT_ID_OFFSET + MEDIATOR_REFLECT_ID_LENGTH;
constexpr int TIMESTAMP_PAYLOAD_LENGTH = TIMESTAMP_OFFSET + MEDIATOR_TIMESTAMP_LENGTH;

void appendUInt64LE(QByteArray& out, quint64 value)
{
    quint64 le = qToLittleEndian(value);
    out.append(reinterpret_cast<const char*>(&le), sizeof(le));
}

quint64 readUInt64LE(const QByteArray& data, int offset)
{
    return qFromLittleEndian<quint64>(
        reinterpret_cast<const uchar*>(data.constData() + offset));
}

QDateTime fromMillis(quint64 millis)
{
    return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(millis), Qt::UTC);
}

quint64 toMillis(const QDateTime& at)
{
    return static_cast<quint64>(at.toMSecsSinceEpoch());
}

bool expectType(const QByteArray& frame, MediatorFrameType expected, Error* error)
{
    if (frame.size() < MEDIATOR_COMMON_HEADER_LENGTH) {
        return fail(error, ErrorCode::FrameTooShort,
                    QStringLiteral("frame of %1 bytes has no common header").arg(frame.size()));
    }
    auto type = static_cast<MediatorFrameType>(static_cast<uint8_t>(frame[0]));
    if (type != expected) {
        return fail(error, ErrorCode::UnexpectedFrameType,
                    QStringLiteral("expected %1, got 0x%2")
                        .arg(QLatin1String(frameTypeName(expected)))
                        .arg(static_cast<uint8_t>(frame[0]), 2, 16, QLatin1Char('0')));
    }
    return true;
}

} // namespace

bool FrameCodec::isMediatorFrame(const QByteArray& frame)
{
    if (frame.size() < MEDIATOR_COMMON_HEADER_LENGTH)
        return false;
    if (static_cast<uint8_t>(frame[0]) == static_cast<uint8_t>(MediatorFrameType::Proxy))
        return false;
    for (int i = 1; i < MEDIATOR_COMMON_HEADER_LENGTH; ++i) {
        if (frame[i] != '\0')
            return false;
    }
    return true;
}

bool FrameCodec::frameType(const QByteArray& frame, MediatorFrameType& type, Error* error)
{
    if (frame.size() < MEDIATOR_COMMON_HEADER_LENGTH) {
        return fail(error, ErrorCode::FrameTooShort,
                    QStringLiteral("frame of %1 bytes has no common header").arg(frame.size()));
    }
    uint8_t value = static_cast<uint8_t>(frame[0]);
    if (!isKnownFrameType(value)) {
        return fail(error, ErrorCode::UnexpectedFrameType,
                    QStringLiteral("unknown frame type 0x%1").arg(value, 2, 16, QLatin1Char('0')));
    }
    type = static_cast<MediatorFrameType>(value);
    return true;
}

QByteArray FrameCodec::encodeCommonHeader(MediatorFrameType type)
{
    QByteArray header(MEDIATOR_COMMON_HEADER_LENGTH, '\0');
    header[0] = static_cast<char>(type);
    return header;
}

QByteArray FrameCodec::encodePayloadHeader()
{
    QByteArray header(MEDIATOR_PAYLOAD_HEADER_LENGTH, '\0');
    header[0] = static_cast<char>(MEDIATOR_PAYLOAD_HEADER);
    return header;
}

QByteArray FrameCodec::encodeReflect(const QByteArray& envelopeCiphertext,
                                     const QByteArray& reflectId)
{
    QByteArray frame;
    frame.reserve(MEDIATOR_COMMON_HEADER_LENGTH + MEDIATOR_PAYLOAD_HEADER_LENGTH
                  + reflectId.size() + envelopeCiphertext.size());
    frame.append(encodeCommonHeader(MediatorFrameType::Reflect));
    frame.append(encodePayloadHeader());
    frame.append(reflectId);
    frame.append(envelopeCiphertext);
    return frame;
}

QByteArray FrameCodec::encodeReflectedAck(const QByteArray& reflectId)
{
    QByteArray frame;
    frame.reserve(MEDIATOR_COMMON_HEADER_LENGTH + MEDIATOR_PAYLOAD_HEADER_LENGTH
                  + reflectId.size());
    frame.append(encodeCommonHeader(MediatorFrameType::ReflectedAck));
    frame.append(encodePayloadHeader());
    frame.append(reflectId);
    return frame;
}

QByteArray FrameCodec::encodeProxy(const QByteArray& chatServerPayload)
{
    QByteArray frame = encodeCommonHeader(MediatorFrameType::Proxy);
    frame.append(chatServerPayload);
    return frame;
}

QByteArray FrameCodec::stripCommonHeader(const QByteArray& frame)
{
    if (frame.size() < MEDIATOR_COMMON_HEADER_LENGTH)
        return QByteArray();
    return frame.mid(MEDIATOR_COMMON_HEADER_LENGTH);
}

QByteArray FrameCodec::encodeBeginTransaction(const QByteArray& encryptedScope,
                                              uint32_t ttlSeconds)
{
    proto::d2d::BeginTransaction begin;
    begin.set_encrypted_scope(encryptedScope.constData(), encryptedScope.size());
    begin.set_ttl(ttlSeconds);

    QByteArray body(static_cast<int>(begin.ByteSizeLong()), '\0');
    begin.SerializeToArray(body.data(), body.size());

    QByteArray frame = encodeCommonHeader(MediatorFrameType::Lock);
    frame.append(body);
    return frame;
}

QByteArray FrameCodec::encodeCommitTransaction()
{
    return encodeCommonHeader(MediatorFrameType::Unlock);
}

bool FrameCodec::decodeReflected(const QByteArray& frame, ReflectedFrame& out, Error* error)
{
    if (!expectType(frame, MediatorFrameType::Reflected, error))
        return false;

    QByteArray payload = frame.mid(MEDIATOR_COMMON_HEADER_LENGTH);
    if (payload.size() < TIMESTAMP_PAYLOAD_LENGTH) {
        return fail(error, ErrorCode::FrameTooShort,
                    QStringLiteral("reflected payload of %1 bytes, need %2")
                        .arg(payload.size()).arg(TIMESTAMP_PAYLOAD_LENGTH));
    }

    int headerLength = static_cast<uint8_t>(payload[0]);
    if (headerLength < TIMESTAMP_PAYLOAD_LENGTH || headerLength > payload.size()) {
        return fail(error, ErrorCode::InvalidHeaderLength,
                    QStringLiteral("reflected header length %1 for payload of %2 bytes")
                        .arg(headerLength).arg(payload.size()));
    }

    out.reflectId = payload.mid(REFLECT_ID_OFFSET, MEDIATOR_REFLECT_ID_LENGTH);
    out.reflectedAt = fromMillis(readUInt64LE(payload, TIMESTAMP_OFFSET));
    out.envelopeCiphertext = payload.mid(headerLength);
    return true;
}

bool FrameCodec::decodeReflectAck(const QByteArray& frame, ReflectAckFrame& out, Error* error)
{
    if (!expectType(frame, MediatorFrameType::ReflectAck, error))
        return false;

    QByteArray payload = frame.mid(MEDIATOR_COMMON_HEADER_LENGTH);
    if (payload.size() < TIMESTAMP_PAYLOAD_LENGTH) {
        return fail(error, ErrorCode::FrameTooShort,
                    QStringLiteral("reflect-ack payload of %1 bytes, need %2")
                        .arg(payload.size()).arg(TIMESTAMP_PAYLOAD_LENGTH));
    }

    out.reflectId = payload.mid(REFLECT_ID_OFFSET, MEDIATOR_REFLECT_ID_LENGTH);
    out.ackedAt = fromMillis(readUInt64LE(payload, TIMESTAMP_OFFSET));
    return true;
}

bool FrameCodec::decodeProxy(const QByteArray& frame, QByteArray& chatServerPayload, Error* error)
{
    if (!expectType(frame, MediatorFrameType::Proxy, error))
        return false;
    chatServerPayload = stripCommonHeader(frame);
    return true;
}

bool FrameCodec::decodeReflect(const QByteArray& frame, ReflectFrame& out, Error* error)
{
    if (!expectType(frame, MediatorFrameType::Reflect, error))
        return false;

    QByteArray payload = frame.mid(MEDIATOR_COMMON_HEADER_LENGTH);
    constexpr int minimum = MEDIATOR_PAYLOAD_HEADER_LENGTH + MEDIATOR_REFLECT_ID_LENGTH;
    if (payload.size() < minimum) {
        return fail(error, ErrorCode::FrameTooShort,
                    QStringLiteral("reflect payload of %1 bytes, need %2")
                        .arg(payload.size()).arg(minimum));
    }

    int headerLength = static_cast<uint8_t>(payload[0]);
    if (headerLength < minimum || headerLength > payload.size()) {
        return fail(error, ErrorCode::InvalidHeaderLength,
                    QStringLiteral("reflect header length %1").arg(headerLength));
    }

    out.reflectId = payload.mid(REFLECT_ID_OFFSET, MEDIATOR_REFLECT_ID_LENGTH);
    out.envelopeCiphertext = payload.mid(headerLength);
    return true;
}

bool FrameCodec::decodeReflectedAck(const QByteArray& frame, QByteArray& reflectId, Error* error)
{
    if (!expectType(frame, MediatorFrameType::ReflectedAck, error))
        return false;

    QByteArray payload = frame.mid(MEDIATOR_COMMON_HEADER_LENGTH);
    constexpr int minimum = MEDIATOR_PAYLOAD_HEADER_LENGTH + MEDIATOR_REFLECT_ID_LENGTH;
    if (payload.size() < minimum) {
        return fail(error, ErrorCode::FrameTooShort,
                    QStringLiteral("reflected-ack payload of %1 bytes, need %2")
                        .arg(payload.size()).arg(minimum));
    }

    reflectId = payload.mid(REFLECT_ID_OFFSET, MEDIATOR_REFLECT_ID_LENGTH);
    return true;
}

QByteArray FrameCodec::encodeReflectAck(const QByteArray& reflectId, const QDateTime& ackedAt)
{
    QByteArray frame = encodeCommonHeader(MediatorFrameType::ReflectAck);
    frame.append(QByteArray(REFLECT_ID_OFFSET, '\0'));
    frame.append(reflectId);
    appendUInt64LE(frame, toMillis(ackedAt));
    return frame;
}

QByteArray FrameCodec::encodeReflected(const QByteArray& reflectId,
                                       const QDateTime& reflectedAt,
                                       const QByteArray& envelopeCiphertext)
{
    QByteArray frame = encodeCommonHeader(MediatorFrameType::Reflected);

    // header length, reserved, 2 bytes of flags
    QByteArray payloadHeader(REFLECT_ID_OFFSET, '\0');
    payloadHeader[0] = static_cast<char>(TIMESTAMP_PAYLOAD_LENGTH);
    frame.append(payloadHeader);
    frame.append(reflectId);
    appendUInt64LE(frame, toMillis(reflectedAt));
    frame.append(envelopeCiphertext);

    qCDebug(lcFrameCodec) << "encoded reflected frame," << frame.size() << "bytes";
    return frame;
}

} // namespace mdsync
