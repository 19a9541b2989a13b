#pragma once

#include <mdsync/Error.hpp>

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <cstdint>

namespace mdsync {

// Chat server payload container types carried inside proxy frames.
namespace ChatServerPayloadType {
    constexpr uint8_t OUTGOING_MESSAGE     = 0x01;
    constexpr uint8_t INCOMING_MESSAGE     = 0x02;
    constexpr uint8_t OUTGOING_MESSAGE_ACK = 0x81;
    constexpr uint8_t INCOMING_MESSAGE_ACK = 0x82;
}

struct OutgoingMessageBox {
    QString fromIdentity;
    QString toIdentity;
    quint64 messageId = 0;
    QDateTime createdAt;
    uint8_t flags = 0;
    QByteArray nonce;
    QByteArray box;
};

struct IncomingMessageAck {
    QString senderIdentity;
    quint64 messageId = 0;
};

class ChatServerPayload {
public:
    static QByteArray encodeOutgoingMessage(const OutgoingMessageBox& message);
    static QByteArray encodeIncomingMessageAck(const IncomingMessageAck& ack);

    static bool payloadType(const QByteArray& payload, uint8_t& type,
                            Error* error = nullptr);
    static bool decodeOutgoingMessage(const QByteArray& payload, OutgoingMessageBox& out,
                                      Error* error = nullptr);
    static bool decodeIncomingMessageAck(const QByteArray& payload, IncomingMessageAck& out,
                                         Error* error = nullptr);
};

} // namespace mdsync
