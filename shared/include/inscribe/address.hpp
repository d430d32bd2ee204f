/**
 * Inscribe - Ledger addresses: base58 text forms and program-derived
 * addresses for sessions and per-owner storage.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "inscribe/types.hpp"

namespace inscribe::address
{

    inline constexpr std::string_view kDefaultProgramId = "4jB7tZybufNfgs8HRj9DiSCMYfEqb8jWkxKcnZnA1vBt";
    inline constexpr std::string_view kSystemProgramId = "11111111111111111111111111111111";

    inline constexpr std::string_view kSessionSeed = "pinocchio_session";
    inline constexpr std::string_view kStorageSeed = "hybrid_storage";

    std::string to_base58(const PublicKey &key);
    std::string to_base58(const Signature &signature);

    // Both throw InscribeError(InvalidInput) on malformed text.
    PublicKey parse_public_key(std::string_view text);
    Signature parse_signature(std::string_view text);

    struct ProgramAddress
    {
        PublicKey address{};
        std::uint8_t bump{};
    };

    std::optional<PublicKey> create_program_address(const std::vector<ByteView> &seeds, const PublicKey &program_id);

    ProgramAddress find_program_address(const std::vector<ByteView> &seeds, const PublicKey &program_id);

    ProgramAddress derive_session_address(const PublicKey &owner, const SessionId &session_id,
                                          const PublicKey &program_id);

    ProgramAddress derive_storage_address(const PublicKey &owner, const PublicKey &program_id);

} // namespace inscribe::address
