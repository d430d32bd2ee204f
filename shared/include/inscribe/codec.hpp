/**
 * Inscribe - Payload encoding: envelope tagging, optional compression,
 * content digest and fixed-size chunking. Pure data transforms, no I/O.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "inscribe/types.hpp"

namespace inscribe::codec
{

    inline constexpr std::size_t kDefaultChunkSize = 675;
    inline constexpr std::size_t kMaxChunkSize = 900;
    inline constexpr std::size_t kCompressionThreshold = 50;

    // Per-chunk method tag carried in the chunk instruction.
    enum class EncodingMethod : std::uint8_t
    {
        Raw = 0,
        Gzip = 1,
        Base64Text = 2
    };

    std::string_view to_string(EncodingMethod method) noexcept;
    std::optional<EncodingMethod> encoding_method_from_int(std::uint8_t value) noexcept;

    // Leading byte of every encoded stream. These values are never the first
    // byte of anything the encoder writes without an envelope.
    enum class Envelope : std::uint8_t
    {
        Raw = 0xF0,
        Gzip = 0xF1,
        Base64Text = 0xF2
    };

    struct EncodeOptions
    {
        std::size_t chunk_size{kDefaultChunkSize};
        std::size_t max_chunk_size{kMaxChunkSize};
        bool compress{false};
        std::size_t compression_threshold{kCompressionThreshold};
        bool text_safe{false};
    };

    struct Chunk
    {
        std::uint32_t index{};
        Bytes data;
    };

    struct EncodedPayload
    {
        Bytes stream;
        std::vector<Chunk> chunks;
        Digest digest{};
        EncodingMethod method{EncodingMethod::Raw};
        bool compressed{};
        std::size_t original_size{};
        std::size_t encoded_size{};
    };

    EncodedPayload encode(ByteView payload, const EncodeOptions &options = {});

    std::size_t chunk_count_for(std::size_t length, std::size_t chunk_size);

    std::vector<Chunk> split_chunks(ByteView stream, std::size_t chunk_size, std::size_t max_chunk_size = kMaxChunkSize);

    struct DecodeOptions
    {
        // Sniff untagged streams the way the previous tooling wrote them.
        bool legacy_detection{false};
    };

    struct DecodedPayload
    {
        Bytes data;
        bool envelope_present{};
        bool text_decoded{};
        bool decompressed{};
    };

    DecodedPayload decode(ByteView stream, const DecodeOptions &options = {});

} // namespace inscribe::codec
