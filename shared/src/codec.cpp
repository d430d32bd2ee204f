#include "inscribe/codec.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <string>

#include <spdlog/spdlog.h>

#include "inscribe/compression.hpp"
#include "inscribe/crypto.hpp"
#include "inscribe/encoding/base64.hpp"
#include "inscribe/error_codes.hpp"

namespace inscribe::codec
{

    namespace
    {

        struct MethodMapping
        {
            EncodingMethod method;
            std::string_view label;
        };

        constexpr std::array<MethodMapping, 3> kMethodMappings{{
            {EncodingMethod::Raw, "raw"},
            {EncodingMethod::Gzip, "gzip"},
            {EncodingMethod::Base64Text, "base64"},
        }};

        // Old writers flagged compressed streams with a bare 0x01 byte.
        constexpr std::uint8_t kLegacyCompressionFlag = 0x01;
        constexpr std::size_t kLegacySampleSize = 100;

        Bytes with_envelope(Envelope envelope, ByteView body)
        {
            Bytes stream;
            stream.reserve(body.size() + 1);
            stream.push_back(static_cast<std::uint8_t>(envelope));
            stream.insert(stream.end(), body.begin(), body.end());
            return stream;
        }

        std::optional<Envelope> envelope_of(ByteView stream)
        {
            if (stream.empty())
            {
                return std::nullopt;
            }
            switch (stream[0])
            {
            case static_cast<std::uint8_t>(Envelope::Raw):
                return Envelope::Raw;
            case static_cast<std::uint8_t>(Envelope::Gzip):
                return Envelope::Gzip;
            case static_cast<std::uint8_t>(Envelope::Base64Text):
                return Envelope::Base64Text;
            default:
                return std::nullopt;
            }
        }

        std::string_view as_text(ByteView bytes)
        {
            return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
        }

        DecodedPayload decode_legacy(ByteView stream)
        {
            DecodedPayload result{};
            result.data.assign(stream.begin(), stream.end());

            const auto first = result.data.front();
            if (first >= 'A' || first == '/' || first == '+')
            {
                const auto sample = ByteView(result.data).first(std::min(result.data.size(), kLegacySampleSize));
                if (encoding::looks_like_base64(as_text(sample)) && encoding::looks_like_base64(as_text(result.data)))
                {
                    if (auto decoded = encoding::decode_base64(as_text(result.data)); decoded && !decoded->empty())
                    {
                        result.data = std::move(*decoded);
                        result.text_decoded = true;
                    }
                }
            }

            const auto view = ByteView(result.data);
            std::optional<ByteView> gzip_body;
            if (view.size() > 1 && view[0] == kLegacyCompressionFlag && compression::has_gzip_magic(view.subspan(1)))
            {
                gzip_body = view.subspan(1);
            }
            else if (compression::has_gzip_magic(view))
            {
                gzip_body = view;
            }
            if (gzip_body)
            {
                try
                {
                    result.data = compression::gzip_decompress(*gzip_body);
                    result.decompressed = true;
                }
                catch (const InscribeError &ex)
                {
                    spdlog::warn("Legacy stream looked compressed but did not inflate, keeping raw bytes: {}",
                                 ex.what());
                }
            }
            return result;
        }

    } // namespace

    std::string_view to_string(EncodingMethod method) noexcept
    {
        for (const auto &mapping : kMethodMappings)
        {
            if (mapping.method == method)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<EncodingMethod> encoding_method_from_int(std::uint8_t value) noexcept
    {
        for (const auto &mapping : kMethodMappings)
        {
            if (static_cast<std::uint8_t>(mapping.method) == value)
            {
                return mapping.method;
            }
        }
        return std::nullopt;
    }

    EncodedPayload encode(ByteView payload, const EncodeOptions &options)
    {
        if (payload.empty())
        {
            throw InscribeError(ErrorCode::InvalidInput, "Refusing to encode an empty payload");
        }
        if (options.chunk_size == 0 || options.chunk_size > options.max_chunk_size)
        {
            throw InscribeError(ErrorCode::InvalidInput,
                                "Chunk size " + std::to_string(options.chunk_size) + " outside 1.." +
                                    std::to_string(options.max_chunk_size));
        }

        EncodedPayload result{};
        result.original_size = payload.size();

        if (options.compress && payload.size() > options.compression_threshold)
        {
            auto compressed = compression::gzip_compress(payload);
            if (compressed.size() < payload.size())
            {
                result.stream = with_envelope(Envelope::Gzip, compressed);
                result.method = EncodingMethod::Gzip;
                result.compressed = true;
            }
            else
            {
                spdlog::debug("Compression skipped: {} -> {} bytes gives no gain", payload.size(), compressed.size());
            }
        }
        if (!result.compressed)
        {
            result.stream = with_envelope(Envelope::Raw, payload);
        }

        if (options.text_safe)
        {
            const auto text = encoding::encode_base64(result.stream);
            const auto text_bytes = ByteView(reinterpret_cast<const std::uint8_t *>(text.data()), text.size());
            result.stream = with_envelope(Envelope::Base64Text, text_bytes);
            result.method = EncodingMethod::Base64Text;
        }

        result.encoded_size = result.stream.size();
        result.digest = crypto::sha256(result.stream);
        result.chunks = split_chunks(result.stream, options.chunk_size, options.max_chunk_size);
        return result;
    }

    std::size_t chunk_count_for(std::size_t length, std::size_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw InscribeError(ErrorCode::InvalidInput, "Chunk size must be positive");
        }
        return (length + chunk_size - 1) / chunk_size;
    }

    std::vector<Chunk> split_chunks(ByteView stream, std::size_t chunk_size, std::size_t max_chunk_size)
    {
        if (stream.empty())
        {
            throw InscribeError(ErrorCode::InvalidInput, "Cannot chunk an empty stream");
        }
        if (chunk_size == 0 || chunk_size > max_chunk_size)
        {
            throw InscribeError(ErrorCode::InvalidInput,
                                "Chunk size " + std::to_string(chunk_size) + " exceeds maximum " +
                                    std::to_string(max_chunk_size));
        }
        const auto count = chunk_count_for(stream.size(), chunk_size);
        if (count > std::numeric_limits<std::uint32_t>::max())
        {
            throw InscribeError(ErrorCode::InvalidInput, "Payload needs more chunks than a session can declare");
        }

        std::vector<Chunk> chunks;
        chunks.reserve(count);
        for (std::size_t offset = 0; offset < stream.size(); offset += chunk_size)
        {
            const auto length = std::min(chunk_size, stream.size() - offset);
            const auto piece = stream.subspan(offset, length);
            chunks.push_back(Chunk{
                .index = static_cast<std::uint32_t>(chunks.size()),
                .data = Bytes(piece.begin(), piece.end()),
            });
        }
        return chunks;
    }

    DecodedPayload decode(ByteView stream, const DecodeOptions &options)
    {
        if (stream.empty())
        {
            throw InscribeError(ErrorCode::InvalidPayload, "Cannot decode an empty stream");
        }

        auto envelope = envelope_of(stream);
        if (!envelope)
        {
            if (options.legacy_detection)
            {
                return decode_legacy(stream);
            }
            DecodedPayload untouched{};
            untouched.data.assign(stream.begin(), stream.end());
            return untouched;
        }

        DecodedPayload result{};
        result.envelope_present = true;
        Bytes inner;
        auto body = stream.subspan(1);

        if (*envelope == Envelope::Base64Text)
        {
            auto decoded = encoding::decode_base64(as_text(body));
            if (!decoded)
            {
                throw InscribeError(ErrorCode::InvalidPayload, "Text envelope does not hold valid base64");
            }
            inner = std::move(*decoded);
            result.text_decoded = true;
            envelope = envelope_of(inner);
            if (!envelope || *envelope == Envelope::Base64Text)
            {
                throw InscribeError(ErrorCode::InvalidPayload, "Text envelope wraps an unknown stream");
            }
            body = ByteView(inner).subspan(1);
        }

        if (*envelope == Envelope::Gzip)
        {
            result.data = compression::gzip_decompress(body);
            result.decompressed = true;
        }
        else
        {
            result.data.assign(body.begin(), body.end());
        }
        return result;
    }

} // namespace inscribe::codec
