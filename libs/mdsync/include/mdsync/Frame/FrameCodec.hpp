#pragma once

#include <mdsync/Error.hpp>
#include <mdsync/Frame/MediatorFrameType.hpp>

#include <QByteArray>
#include <QDateTime>

namespace mdsync {

struct ReflectFrame {
    QByteArray reflectId;
    QByteArray envelopeCiphertext;
};

struct ReflectedFrame {
    QByteArray reflectId;
    QByteArray envelopeCiphertext;
    QDateTime reflectedAt;
};

struct ReflectAckFrame {
    QByteArray reflectId;
    QDateTime ackedAt;
};

/// Encodes and decodes mediator frames. All multi-byte integers are
/// little-endian. Decoders never return partial results: on failure the
/// output is untouched and *error names the reason.
class FrameCodec {
public:
    static bool isMediatorFrame(const QByteArray& frame);
    static bool frameType(const QByteArray& frame, MediatorFrameType& type,
                          Error* error = nullptr);

    static QByteArray encodeCommonHeader(MediatorFrameType type);
    static QByteArray encodePayloadHeader();

    static QByteArray encodeReflect(const QByteArray& envelopeCiphertext,
                                    const QByteArray& reflectId);
    static QByteArray encodeReflectedAck(const QByteArray& reflectId);
    static QByteArray encodeProxy(const QByteArray& chatServerPayload);
    /// Everything after the 4-byte common header, empty for short frames.
    static QByteArray stripCommonHeader(const QByteArray& frame);
    static QByteArray encodeBeginTransaction(const QByteArray& encryptedScope,
                                             uint32_t ttlSeconds);
    static QByteArray encodeCommitTransaction();

    static bool decodeReflected(const QByteArray& frame, ReflectedFrame& out,
                                Error* error = nullptr);
    static bool decodeReflectAck(const QByteArray& frame, ReflectAckFrame& out,
                                 Error* error = nullptr);
    static bool decodeProxy(const QByteArray& frame, QByteArray& chatServerPayload,
                            Error* error = nullptr);

    // Mediator side of the exchange, used by the replay connection and the
    // frame inspector.
    static bool decodeReflect(const QByteArray& frame, ReflectFrame& out,
                              Error* error = nullptr);
    static bool decodeReflectedAck(const QByteArray& frame, QByteArray& reflectId,
                                   Error* error = nullptr);
    static QByteArray encodeReflectAck(const QByteArray& reflectId,
                                       const QDateTime& ackedAt);
    static QByteArray encodeReflected(const QByteArray& reflectId,
                                      const QDateTime& reflectedAt,
                                      const QByteArray& envelopeCiphertext);
};

} // namespace mdsync
