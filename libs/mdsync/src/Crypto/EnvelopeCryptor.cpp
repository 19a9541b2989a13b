#include <mdsync/Crypto/EnvelopeCryptor.hpp>
#include <mdsync/Version.hpp>
#include <QLoggingCategory>

#include <openssl/evp.h>
#include <openssl/err.h>

Q_LOGGING_CATEGORY(lcCrypto, "mdsync.crypto")

namespace mdsync {

namespace {

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

QString sslErrorString()
{
    unsigned long code = ERR_get_error();
    return code ? QString::fromLatin1(ERR_error_string(code, nullptr))
                : QStringLiteral("unknown OpenSSL error");
}

const unsigned char* bytes(const QByteArray& data)
{
    return reinterpret_cast<const unsigned char*>(data.constData());
}

unsigned char* bytes(QByteArray& data)
{
    return reinterpret_cast<unsigned char*>(data.data());
}

bool initCipher(EVP_CIPHER_CTX* ctx, bool encrypt, const QByteArray& key, const QByteArray& nonce)
{
    const EVP_CIPHER* cipher = EVP_aes_256_gcm();
    int ok = encrypt ? EVP_EncryptInit_ex(ctx, cipher, nullptr, nullptr, nullptr)
                     : EVP_DecryptInit_ex(ctx, cipher, nullptr, nullptr, nullptr);
    if (ok != 1)
        return false;
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, nonce.size(), nullptr) != 1)
        return false;
    return encrypt ? EVP_EncryptInit_ex(ctx, nullptr, nullptr, bytes(key), bytes(nonce)) == 1
                   : EVP_DecryptInit_ex(ctx, nullptr, nullptr, bytes(key), bytes(nonce)) == 1;
}

} // namespace

EnvelopeCryptor::EnvelopeCryptor(RandomSource random)
    : random_(std::move(random))
{
}

void EnvelopeCryptor::setDeviceGroupKeys(std::shared_ptr<const DeviceGroupKeys> keys)
{
    keys_ = std::move(keys);
}

std::shared_ptr<const DeviceGroupKeys> EnvelopeCryptor::deviceGroupKeys() const
{
    return keys_;
}

bool EnvelopeCryptor::hasKeys() const
{
    return keys_ != nullptr;
}

bool EnvelopeCryptor::generateNonce(QByteArray& out, Error* error) const
{
    return randomBytes(random_, ENVELOPE_NONCE_LENGTH, out, error);
}

bool EnvelopeCryptor::generateReflectId(QByteArray& out, Error* error) const
{
    return randomBytes(random_, MEDIATOR_REFLECT_ID_LENGTH, out, error);
}

bool EnvelopeCryptor::encrypt(const QByteArray& plaintext, const QByteArray& key,
                              QByteArray& out, Error* error) const
{
    if (key.size() != ENVELOPE_KEY_LENGTH) {
        return fail(error, ErrorCode::EncryptionFailed,
                    QStringLiteral("key has %1 bytes").arg(key.size()));
    }

    QByteArray nonce;
    if (!generateNonce(nonce, error)) {
        qCWarning(lcCrypto) << "nonce generation failed, refusing to encrypt";
        return false;
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx || !initCipher(ctx.get(), true, key, nonce))
        return fail(error, ErrorCode::EncryptionFailed, sslErrorString());

    QByteArray ciphertext(plaintext.size(), '\0');
    int len = 0;
    if (!plaintext.isEmpty()
        && EVP_EncryptUpdate(ctx.get(), bytes(ciphertext), &len,
                             bytes(plaintext), plaintext.size()) != 1) {
        return fail(error, ErrorCode::EncryptionFailed, sslErrorString());
    }
    int finalLen = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), bytes(ciphertext) + len, &finalLen) != 1)
        return fail(error, ErrorCode::EncryptionFailed, sslErrorString());
    ciphertext.resize(len + finalLen);

    QByteArray tag(ENVELOPE_TAG_LENGTH, '\0');
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, tag.size(), tag.data()) != 1)
        return fail(error, ErrorCode::EncryptionFailed, sslErrorString());

    out.clear();
    out.reserve(nonce.size() + ciphertext.size() + tag.size());
    out.append(nonce);
    out.append(ciphertext);
    out.append(tag);
    return true;
}

bool EnvelopeCryptor::decrypt(const QByteArray& noncePrefixedCiphertext, const QByteArray& key,
                              QByteArray& out, Error* error) const
{
    if (key.size() != ENVELOPE_KEY_LENGTH) {
        return fail(error, ErrorCode::DecryptionFailed,
                    QStringLiteral("key has %1 bytes").arg(key.size()));
    }
    if (noncePrefixedCiphertext.size() < ENVELOPE_NONCE_LENGTH + ENVELOPE_TAG_LENGTH) {
        return fail(error, ErrorCode::DecryptionFailed,
                    QStringLiteral("ciphertext of %1 bytes is shorter than nonce and tag")
                        .arg(noncePrefixedCiphertext.size()));
    }

    QByteArray nonce = noncePrefixedCiphertext.left(ENVELOPE_NONCE_LENGTH);
    QByteArray tag = noncePrefixedCiphertext.right(ENVELOPE_TAG_LENGTH);
    QByteArray ciphertext = noncePrefixedCiphertext.mid(
        ENVELOPE_NONCE_LENGTH,
        noncePrefixedCiphertext.size() - ENVELOPE_NONCE_LENGTH - ENVELOPE_TAG_LENGTH);

    CipherContext ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx || !initCipher(ctx.get(), false, key, nonce))
        return fail(error, ErrorCode::DecryptionFailed, sslErrorString());

    QByteArray plaintext(ciphertext.size(), '\0');
    int len = 0;
    if (!ciphertext.isEmpty()
        && EVP_DecryptUpdate(ctx.get(), bytes(plaintext), &len,
                             bytes(ciphertext), ciphertext.size()) != 1) {
        return fail(error, ErrorCode::DecryptionFailed, sslErrorString());
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, tag.size(), tag.data()) != 1)
        return fail(error, ErrorCode::DecryptionFailed, sslErrorString());

    int finalLen = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), bytes(plaintext) + len, &finalLen) != 1) {
        ERR_clear_error();
        return fail(error, ErrorCode::DecryptionFailed, QStringLiteral("authentication failed"));
    }
    plaintext.resize(len + finalLen);
    out = plaintext;
    return true;
}

bool EnvelopeCryptor::encryptEnvelope(const proto::d2d::Envelope& envelope,
                                      QByteArray& out, Error* error) const
{
    if (!keys_) {
        return fail(error, ErrorCode::KeysMissing,
                    QStringLiteral("multi-device not activated"));
    }

    QByteArray plaintext(static_cast<int>(envelope.ByteSizeLong()), '\0');
    if (!envelope.SerializeToArray(plaintext.data(), plaintext.size()))
        return fail(error, ErrorCode::MalformedEnvelope, QStringLiteral("envelope serialization"));

    return encrypt(plaintext, keys_->reflectKey(), out, error);
}

bool EnvelopeCryptor::decryptEnvelope(const QByteArray& noncePrefixedCiphertext,
                                      proto::d2d::Envelope& out, Error* error) const
{
    if (!keys_) {
        return fail(error, ErrorCode::KeysMissing,
                    QStringLiteral("multi-device not activated"));
    }

    QByteArray plaintext;
    if (!decrypt(noncePrefixedCiphertext, keys_->reflectKey(), plaintext, error))
        return false;

    proto::d2d::Envelope envelope;
    if (!envelope.ParseFromArray(plaintext.constData(), plaintext.size()))
        return fail(error, ErrorCode::MalformedEnvelope, QStringLiteral("envelope does not parse"));

    out.Swap(&envelope);
    return true;
}

bool EnvelopeCryptor::encryptTransactionScope(proto::d2d::TransactionScope::Scope scope,
                                              QByteArray& out, Error* error) const
{
    if (!keys_) {
        return fail(error, ErrorCode::KeysMissing,
                    QStringLiteral("multi-device not activated"));
    }

    proto::d2d::TransactionScope message;
    message.set_scope(scope);
    QByteArray plaintext(static_cast<int>(message.ByteSizeLong()), '\0');
    message.SerializeToArray(plaintext.data(), plaintext.size());

    return encrypt(plaintext, keys_->transactionScopeKey(), out, error);
}

} // namespace mdsync
