#include "inscribe/compression.hpp"

#include <array>
#include <limits>
#include <string>

#include <zlib.h>

#include "inscribe/error_codes.hpp"

namespace inscribe::compression
{

    namespace
    {
        // 15 window bits plus 16 selects the gzip wrapper.
        constexpr int kGzipWindowBits = 15 + 16;
        constexpr int kMemoryLevel = 8;
        constexpr std::size_t kBufferSize = 16 * 1024;

        void check_input_size(ByteView input)
        {
            if (input.size() > std::numeric_limits<uInt>::max())
            {
                throw InscribeError(ErrorCode::InvalidInput, "Input too large for a single zlib pass");
            }
        }
    } // namespace

    Bytes gzip_compress(ByteView input)
    {
        check_input_size(input);
        z_stream stream{};
        if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemoryLevel,
                         Z_DEFAULT_STRATEGY) != Z_OK)
        {
            throw InscribeError(ErrorCode::InternalError, "deflateInit2 failed");
        }

        stream.next_in = const_cast<Bytef *>(input.data());
        stream.avail_in = static_cast<uInt>(input.size());

        Bytes output;
        std::array<std::uint8_t, kBufferSize> buffer{};
        int status = Z_OK;
        do
        {
            stream.next_out = buffer.data();
            stream.avail_out = static_cast<uInt>(buffer.size());
            status = deflate(&stream, Z_FINISH);
            if (status == Z_STREAM_ERROR)
            {
                deflateEnd(&stream);
                throw InscribeError(ErrorCode::InternalError, "deflate failed");
            }
            output.insert(output.end(), buffer.begin(), buffer.begin() + (buffer.size() - stream.avail_out));
        } while (status != Z_STREAM_END);

        deflateEnd(&stream);
        return output;
    }

    Bytes gzip_decompress(ByteView input)
    {
        check_input_size(input);
        z_stream stream{};
        if (inflateInit2(&stream, kGzipWindowBits) != Z_OK)
        {
            throw InscribeError(ErrorCode::InternalError, "inflateInit2 failed");
        }

        stream.next_in = const_cast<Bytef *>(input.data());
        stream.avail_in = static_cast<uInt>(input.size());

        Bytes output;
        std::array<std::uint8_t, kBufferSize> buffer{};
        int status = Z_OK;
        while (status != Z_STREAM_END)
        {
            stream.next_out = buffer.data();
            stream.avail_out = static_cast<uInt>(buffer.size());
            status = inflate(&stream, Z_NO_FLUSH);
            if (status != Z_OK && status != Z_STREAM_END)
            {
                const std::string reason = stream.msg ? stream.msg : "truncated stream";
                inflateEnd(&stream);
                throw InscribeError(ErrorCode::InvalidPayload, "gzip decompression failed: " + reason);
            }
            output.insert(output.end(), buffer.begin(), buffer.begin() + (buffer.size() - stream.avail_out));
            if (status == Z_OK && stream.avail_in == 0 && stream.avail_out != 0)
            {
                inflateEnd(&stream);
                throw InscribeError(ErrorCode::InvalidPayload, "gzip decompression failed: truncated stream");
            }
        }

        inflateEnd(&stream);
        return output;
    }

    bool has_gzip_magic(ByteView input) noexcept
    {
        return input.size() >= 2 && input[0] == 0x1F && input[1] == 0x8B;
    }

} // namespace inscribe::compression
