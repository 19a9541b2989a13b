#include <mdsync/Crypto/RandomSource.hpp>

#include <openssl/rand.h>
#include <openssl/err.h>

namespace mdsync {

RandomSource systemRandomSource()
{
    return [](unsigned char* buffer, int length) {
        return RAND_bytes(buffer, length) == 1;
    };
}

bool randomBytes(const RandomSource& source, int length, QByteArray& out, Error* error)
{
    if (!source)
        return fail(error, ErrorCode::NonceGenerationFailed, QStringLiteral("no random source"));

    QByteArray bytes(length, '\0');
    if (!source(reinterpret_cast<unsigned char*>(bytes.data()), length)) {
        unsigned long sslError = ERR_get_error();
        return fail(error, ErrorCode::NonceGenerationFailed,
                    sslError ? QString::fromLatin1(ERR_error_string(sslError, nullptr))
                             : QStringLiteral("random source failed"));
    }
    out = bytes;
    return true;
}

} // namespace mdsync
