/**
 * Inscribe - gzip compression gate built on zlib.
 */
#pragma once

#include "inscribe/types.hpp"

namespace inscribe::compression
{

    Bytes gzip_compress(ByteView input);

    // Throws InscribeError(InvalidPayload) on a corrupt or truncated stream.
    Bytes gzip_decompress(ByteView input);

    bool has_gzip_magic(ByteView input) noexcept;

} // namespace inscribe::compression
