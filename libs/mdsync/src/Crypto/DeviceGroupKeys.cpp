#include <mdsync/Crypto/DeviceGroupKeys.hpp>
#include <mdsync/Version.hpp>

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

namespace mdsync {

namespace {

const char KDF_INFO[] = "3ma-mdev";

bool hkdf(const QByteArray& key, const QByteArray& salt, QByteArray& out, Error* error)
{
    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, "HKDF", nullptr);
    if (!kdf)
        return fail(error, ErrorCode::EncryptionFailed, QStringLiteral("HKDF unavailable"));

    EVP_KDF_CTX* ctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);
    if (!ctx)
        return fail(error, ErrorCode::EncryptionFailed, QStringLiteral("HKDF context"));

    QByteArray keyCopy = key;
    QByteArray saltCopy = salt;
    QByteArray info(KDF_INFO);

    OSSL_PARAM params[5];
    OSSL_PARAM* p = params;
    *p++ = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST,
                                            const_cast<char*>("SHA256"), 0);
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_KEY,
                                             keyCopy.data(), keyCopy.size());
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT,
                                             saltCopy.data(), saltCopy.size());
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_INFO,
                                             info.data(), info.size());
    *p = OSSL_PARAM_construct_end();

    QByteArray derived(ENVELOPE_KEY_LENGTH, '\0');
    int rc = EVP_KDF_derive(ctx, reinterpret_cast<unsigned char*>(derived.data()),
                            derived.size(), params);
    EVP_KDF_CTX_free(ctx);

    if (rc <= 0) {
        return fail(error, ErrorCode::EncryptionFailed,
                    QString::fromLatin1(ERR_error_string(ERR_get_error(), nullptr)));
    }
    out = derived;
    return true;
}

} // namespace

DeviceGroupKeys::DeviceGroupKeys(const QByteArray& reflectKey,
                                 const QByteArray& deviceInfoKey,
                                 const QByteArray& transactionScopeKey)
    : reflectKey_(reflectKey)
    , deviceInfoKey_(deviceInfoKey)
    , transactionScopeKey_(transactionScopeKey)
{
}

std::shared_ptr<const DeviceGroupKeys> DeviceGroupKeys::derive(const QByteArray& deviceGroupKey,
                                                               Error* error)
{
    if (deviceGroupKey.size() != ENVELOPE_KEY_LENGTH) {
        fail(error, ErrorCode::KeysMissing,
             QStringLiteral("device group key has %1 bytes").arg(deviceGroupKey.size()));
        return nullptr;
    }

    QByteArray reflect, deviceInfo, transactionScope;
    if (!hkdf(deviceGroupKey, QByteArrayLiteral("r"), reflect, error)
        || !hkdf(deviceGroupKey, QByteArrayLiteral("di"), deviceInfo, error)
        || !hkdf(deviceGroupKey, QByteArrayLiteral("ts"), transactionScope, error)) {
        return nullptr;
    }
    return std::make_shared<const DeviceGroupKeys>(reflect, deviceInfo, transactionScope);
}

} // namespace mdsync
