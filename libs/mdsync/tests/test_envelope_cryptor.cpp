#include <QtTest/QtTest>
#include <mdsync/Crypto/DeviceGroupKeys.hpp>
#include <mdsync/Crypto/EnvelopeCryptor.hpp>
#include <mdsync/Version.hpp>

using namespace mdsync;

class TestEnvelopeCryptor : public QObject {
    Q_OBJECT

private:
    static std::shared_ptr<const DeviceGroupKeys> testKeys()
    {
        return DeviceGroupKeys::derive(QByteArray(32, '\x42'));
    }

    static proto::d2d::Envelope sampleEnvelope()
    {
        proto::d2d::Envelope envelope;
        envelope.set_device_id(0x1122334455667788ULL);
        envelope.set_padding(std::string(5, '\0'));
        auto* incoming = envelope.mutable_incoming_message();
        incoming->set_sender_identity("ECHOECHO");
        incoming->set_message_id(7);
        incoming->set_body("body");
        return envelope;
    }

private slots:
    void testDeriveKeys()
    {
        auto keys = testKeys();
        QVERIFY(keys);
        QCOMPARE(keys->reflectKey().size(), ENVELOPE_KEY_LENGTH);
        QCOMPARE(keys->deviceInfoKey().size(), ENVELOPE_KEY_LENGTH);
        QCOMPARE(keys->transactionScopeKey().size(), ENVELOPE_KEY_LENGTH);
        QVERIFY(keys->reflectKey() != keys->deviceInfoKey());
        QVERIFY(keys->reflectKey() != keys->transactionScopeKey());

        // Deterministic for the same device group key
        auto again = testKeys();
        QCOMPARE(again->reflectKey(), keys->reflectKey());

        Error error;
        QVERIFY(!DeviceGroupKeys::derive(QByteArray(16, '\x01'), &error));
        QCOMPARE(error.code, ErrorCode::KeysMissing);
    }

    void testEnvelopeRoundTrip()
    {
        EnvelopeCryptor cryptor;
        cryptor.setDeviceGroupKeys(testKeys());

        QByteArray ciphertext;
        QVERIFY(cryptor.encryptEnvelope(sampleEnvelope(), ciphertext));

        proto::d2d::Envelope decrypted;
        Error error;
        QVERIFY(cryptor.decryptEnvelope(ciphertext, decrypted, &error));
        QVERIFY(error.isOk());
        QVERIFY(decrypted.device_id() == sampleEnvelope().device_id());
        QCOMPARE(decrypted.content_case(), proto::d2d::Envelope::kIncomingMessage);
        QCOMPARE(QString::fromStdString(decrypted.incoming_message().sender_identity()),
                 QString("ECHOECHO"));
    }

    void testOutputLayout()
    {
        // Counting random source: nonce bytes are 0,1,2,...
        unsigned char next = 0;
        EnvelopeCryptor cryptor([&next](unsigned char* buffer, int length) {
            for (int i = 0; i < length; ++i)
                buffer[i] = next++;
            return true;
        });

        QByteArray key(ENVELOPE_KEY_LENGTH, '\x07');
        QByteArray out;
        QVERIFY(cryptor.encrypt(QByteArray("hello"), key, out));
        QCOMPARE(out.size(), ENVELOPE_NONCE_LENGTH + 5 + ENVELOPE_TAG_LENGTH);
        QCOMPARE(static_cast<uint8_t>(out[0]), uint8_t(0));
        QCOMPARE(static_cast<uint8_t>(out[ENVELOPE_NONCE_LENGTH - 1]),
                 uint8_t(ENVELOPE_NONCE_LENGTH - 1));

        QByteArray plain;
        QVERIFY(cryptor.decrypt(out, key, plain));
        QCOMPARE(plain, QByteArray("hello"));
    }

    void testFreshNoncePerCall()
    {
        EnvelopeCryptor cryptor;
        QByteArray key(ENVELOPE_KEY_LENGTH, '\x07');
        QByteArray a, b;
        QVERIFY(cryptor.encrypt(QByteArray("same"), key, a));
        QVERIFY(cryptor.encrypt(QByteArray("same"), key, b));
        QVERIFY(a.left(ENVELOPE_NONCE_LENGTH) != b.left(ENVELOPE_NONCE_LENGTH));
        QVERIFY(a != b);
    }

    void testTamperedCiphertextFails()
    {
        EnvelopeCryptor cryptor;
        cryptor.setDeviceGroupKeys(testKeys());

        QByteArray ciphertext;
        QVERIFY(cryptor.encryptEnvelope(sampleEnvelope(), ciphertext));
        ciphertext[ENVELOPE_NONCE_LENGTH + 1] = static_cast<char>(ciphertext[ENVELOPE_NONCE_LENGTH + 1] ^ 0x01);

        proto::d2d::Envelope decrypted;
        decrypted.set_device_id(99);
        Error error;
        QVERIFY(!cryptor.decryptEnvelope(ciphertext, decrypted, &error));
        QCOMPARE(error.code, ErrorCode::DecryptionFailed);
        QVERIFY(decrypted.device_id() == 99);
    }

    void testWrongKeyFails()
    {
        EnvelopeCryptor sender;
        sender.setDeviceGroupKeys(testKeys());
        EnvelopeCryptor receiver;
        receiver.setDeviceGroupKeys(DeviceGroupKeys::derive(QByteArray(32, '\x43')));

        QByteArray ciphertext;
        QVERIFY(sender.encryptEnvelope(sampleEnvelope(), ciphertext));

        proto::d2d::Envelope decrypted;
        Error error;
        QVERIFY(!receiver.decryptEnvelope(ciphertext, decrypted, &error));
        QCOMPARE(error.code, ErrorCode::DecryptionFailed);
    }

    void testTruncatedCiphertext()
    {
        EnvelopeCryptor cryptor;
        QByteArray plain;
        Error error;
        QVERIFY(!cryptor.decrypt(QByteArray(ENVELOPE_NONCE_LENGTH + ENVELOPE_TAG_LENGTH - 1, 'x'),
                                 QByteArray(ENVELOPE_KEY_LENGTH, '\x07'), plain, &error));
        QCOMPARE(error.code, ErrorCode::DecryptionFailed);
    }

    void testMissingKeys()
    {
        EnvelopeCryptor cryptor;
        QVERIFY(!cryptor.hasKeys());

        QByteArray out;
        Error error;
        QVERIFY(!cryptor.encryptEnvelope(sampleEnvelope(), out, &error));
        QCOMPARE(error.code, ErrorCode::KeysMissing);

        QVERIFY(!cryptor.encryptTransactionScope(proto::d2d::TransactionScope::CONTACT_SYNC,
                                                 out, &error));
        QCOMPARE(error.code, ErrorCode::KeysMissing);
    }

    void testRandomFailureIsHardError()
    {
        EnvelopeCryptor cryptor([](unsigned char*, int) { return false; });
        cryptor.setDeviceGroupKeys(testKeys());

        QByteArray out("untouched");
        Error error;
        QVERIFY(!cryptor.encryptEnvelope(sampleEnvelope(), out, &error));
        QCOMPARE(error.code, ErrorCode::NonceGenerationFailed);
        QCOMPARE(out, QByteArray("untouched"));

        QVERIFY(!cryptor.generateReflectId(out, &error));
        QCOMPARE(error.code, ErrorCode::NonceGenerationFailed);
    }

    void testTransactionScopeUsesScopeKey()
    {
        auto keys = testKeys();
        EnvelopeCryptor cryptor;
        cryptor.setDeviceGroupKeys(keys);

        QByteArray encrypted;
        QVERIFY(cryptor.encryptTransactionScope(proto::d2d::TransactionScope::GROUP_SYNC, encrypted));

        QByteArray plain;
        QVERIFY(!cryptor.decrypt(encrypted, keys->reflectKey(), plain));
        QVERIFY(cryptor.decrypt(encrypted, keys->transactionScopeKey(), plain));

        proto::d2d::TransactionScope scope;
        QVERIFY(scope.ParseFromArray(plain.constData(), plain.size()));
        QCOMPARE(scope.scope(), proto::d2d::TransactionScope::GROUP_SYNC);
    }
};

QTEST_MAIN(TestEnvelopeCryptor)
#include "test_envelope_cryptor.moc"
