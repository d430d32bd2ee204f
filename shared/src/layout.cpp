#include "inscribe/layout.hpp"

#include <algorithm>
#include <array>
#include <string>

#include "inscribe/error_codes.hpp"

namespace inscribe::layout
{

    namespace
    {

        struct StatusMapping
        {
            SessionStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 2> kStatusMappings{{
            {SessionStatus::Active, "active"},
            {SessionStatus::Finalized, "finalized"},
        }};

        void write_u32_le(Bytes &out, std::uint32_t value)
        {
            out.push_back(static_cast<std::uint8_t>(value & 0xFF));
            out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
            out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
            out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
        }

        std::uint32_t read_u32_le(ByteView in)
        {
            return static_cast<std::uint32_t>(in[0]) | (static_cast<std::uint32_t>(in[1]) << 8) |
                   (static_cast<std::uint32_t>(in[2]) << 16) | (static_cast<std::uint32_t>(in[3]) << 24);
        }

        template <std::size_t N>
        void append(Bytes &out, const std::array<std::uint8_t, N> &field)
        {
            out.insert(out.end(), field.begin(), field.end());
        }

        template <std::size_t N>
        std::array<std::uint8_t, N> take(ByteView in)
        {
            std::array<std::uint8_t, N> field{};
            std::copy_n(in.begin(), N, field.begin());
            return field;
        }

    } // namespace

    std::string_view to_string(SessionStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<SessionStatus> session_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    Bytes encode_session_account(const SessionAccount &account)
    {
        Bytes out;
        out.reserve(kSessionAccountSize);
        append(out, account.owner);
        append(out, account.session_id);
        write_u32_le(out, account.total_chunks);
        append(out, account.digest);
        out.push_back(static_cast<std::uint8_t>(account.status));
        return out;
    }

    SessionAccount decode_session_account(ByteView data)
    {
        if (data.size() < kSessionAccountSize)
        {
            throw InscribeError(ErrorCode::InvalidPayload,
                                "Session account holds " + std::to_string(data.size()) + " bytes, expected " +
                                    std::to_string(kSessionAccountSize));
        }
        SessionAccount account{};
        std::size_t offset = 0;
        account.owner = take<kPublicKeySize>(data.subspan(offset));
        offset += kPublicKeySize;
        account.session_id = take<kSessionIdSize>(data.subspan(offset));
        offset += kSessionIdSize;
        account.total_chunks = read_u32_le(data.subspan(offset));
        offset += 4;
        account.digest = take<kDigestSize>(data.subspan(offset));
        offset += kDigestSize;
        const auto status = data[offset];
        if (status > static_cast<std::uint8_t>(SessionStatus::Finalized))
        {
            throw InscribeError(ErrorCode::InvalidPayload, "Unknown session status " + std::to_string(status));
        }
        account.status = static_cast<SessionStatus>(status);
        return account;
    }

    Bytes encode_chunk_instruction(const ChunkInstruction &instruction)
    {
        Bytes out;
        out.reserve(kChunkHeaderSize + instruction.data.size());
        out.push_back(kPostChunkDiscriminator);
        append(out, instruction.session_id);
        write_u32_le(out, instruction.chunk_index);
        out.push_back(instruction.method);
        out.insert(out.end(), instruction.data.begin(), instruction.data.end());
        return out;
    }

    std::optional<ChunkInstruction> parse_chunk_instruction(ByteView data)
    {
        if (data.size() < kChunkHeaderSize || data[0] != kPostChunkDiscriminator)
        {
            return std::nullopt;
        }
        ChunkInstruction instruction{};
        std::size_t offset = 1;
        instruction.session_id = take<kSessionIdSize>(data.subspan(offset));
        offset += kSessionIdSize;
        instruction.chunk_index = read_u32_le(data.subspan(offset));
        offset += 4;
        instruction.method = data[offset];
        offset += 1;
        const auto payload = data.subspan(offset);
        instruction.data.assign(payload.begin(), payload.end());
        return instruction;
    }

    Bytes encode_create_session(const SessionId &session_id, std::uint32_t total_chunks, const Digest &digest)
    {
        Bytes out;
        out.reserve(1 + kSessionIdSize + 4 + kDigestSize);
        out.push_back(kCreateSessionDiscriminator);
        append(out, session_id);
        write_u32_le(out, total_chunks);
        append(out, digest);
        return out;
    }

    Bytes encode_init_storage()
    {
        return Bytes{kInitStorageDiscriminator};
    }

    Bytes encode_finalize(const SessionId &session_id)
    {
        Bytes out;
        out.reserve(1 + kSessionIdSize);
        out.push_back(kFinalizeDiscriminator);
        append(out, session_id);
        return out;
    }

} // namespace inscribe::layout
