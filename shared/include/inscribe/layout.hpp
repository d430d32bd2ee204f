/**
 * Inscribe - Fixed binary layouts of the session account and of the
 * instructions the storage program understands. All integers little-endian.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "inscribe/types.hpp"

namespace inscribe::layout
{

    inline constexpr std::uint8_t kInitStorageDiscriminator = 0x01;
    inline constexpr std::uint8_t kCreateSessionDiscriminator = 0x02;
    inline constexpr std::uint8_t kPostChunkDiscriminator = 0x04;
    inline constexpr std::uint8_t kFinalizeDiscriminator = 0x05;

    // owner(32) | session_id(16) | total_chunks(4) | digest(32) | status(1)
    inline constexpr std::size_t kSessionAccountSize = kPublicKeySize + kSessionIdSize + 4 + kDigestSize + 1;

    // discriminator(1) | session_id(16) | chunk_index(4) | method(1)
    inline constexpr std::size_t kChunkHeaderSize = 1 + kSessionIdSize + 4 + 1;

    enum class SessionStatus : std::uint8_t
    {
        Active = 0,
        Finalized = 1
    };

    std::string_view to_string(SessionStatus status) noexcept;
    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept;

    struct SessionAccount
    {
        PublicKey owner{};
        SessionId session_id{};
        std::uint32_t total_chunks{};
        Digest digest{};
        SessionStatus status{SessionStatus::Active};
    };

    Bytes encode_session_account(const SessionAccount &account);

    // Throws InscribeError(InvalidPayload) for short data or an unknown status.
    SessionAccount decode_session_account(ByteView data);

    struct ChunkInstruction
    {
        SessionId session_id{};
        std::uint32_t chunk_index{};
        std::uint8_t method{};
        Bytes data;
    };

    Bytes encode_chunk_instruction(const ChunkInstruction &instruction);

    // nullopt when the data is not a chunk instruction.
    std::optional<ChunkInstruction> parse_chunk_instruction(ByteView data);

    Bytes encode_create_session(const SessionId &session_id, std::uint32_t total_chunks, const Digest &digest);

    Bytes encode_init_storage();

    Bytes encode_finalize(const SessionId &session_id);

} // namespace inscribe::layout
