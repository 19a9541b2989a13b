#pragma once

#include <mdsync/Error.hpp>

#include <QByteArray>
#include <functional>

namespace mdsync {

/// Fills buffer with length random bytes. Returns false when the source
/// could not deliver; callers treat that as a hard error.
using RandomSource = std::function<bool(unsigned char* buffer, int length)>;

RandomSource systemRandomSource();

bool randomBytes(const RandomSource& source, int length, QByteArray& out,
                 Error* error = nullptr);

} // namespace mdsync
