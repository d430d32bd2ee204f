#include "inscribe/address.hpp"

#include <algorithm>

#include "inscribe/crypto.hpp"
#include "inscribe/encoding/base58.hpp"
#include "inscribe/error_codes.hpp"

namespace inscribe::address
{

    namespace
    {
        constexpr std::size_t kMaxSeeds = 16;
        constexpr std::size_t kMaxSeedLength = 32;
        constexpr std::string_view kDerivationTag = "ProgramDerivedAddress";

        ByteView as_bytes(std::string_view text)
        {
            return {reinterpret_cast<const std::uint8_t *>(text.data()), text.size()};
        }

        template <std::size_t N>
        std::array<std::uint8_t, N> parse_fixed(std::string_view text, std::string_view what)
        {
            auto decoded = encoding::decode_base58(text);
            if (!decoded || decoded->size() != N)
            {
                throw InscribeError(ErrorCode::InvalidInput,
                                    "Invalid " + std::string(what) + ": '" + std::string(text) + "'");
            }
            std::array<std::uint8_t, N> result{};
            std::copy(decoded->begin(), decoded->end(), result.begin());
            return result;
        }
    } // namespace

    std::string to_base58(const PublicKey &key)
    {
        return encoding::encode_base58(key);
    }

    std::string to_base58(const Signature &signature)
    {
        return encoding::encode_base58(signature);
    }

    PublicKey parse_public_key(std::string_view text)
    {
        return parse_fixed<kPublicKeySize>(text, "public key");
    }

    Signature parse_signature(std::string_view text)
    {
        return parse_fixed<kSignatureSize>(text, "signature");
    }

    std::optional<PublicKey> create_program_address(const std::vector<ByteView> &seeds, const PublicKey &program_id)
    {
        if (seeds.size() > kMaxSeeds)
        {
            throw InscribeError(ErrorCode::InvalidInput, "Too many address seeds");
        }
        Bytes preimage;
        for (const auto &seed : seeds)
        {
            if (seed.size() > kMaxSeedLength)
            {
                throw InscribeError(ErrorCode::InvalidInput, "Address seed longer than 32 bytes");
            }
            preimage.insert(preimage.end(), seed.begin(), seed.end());
        }
        preimage.insert(preimage.end(), program_id.begin(), program_id.end());
        const auto tag = as_bytes(kDerivationTag);
        preimage.insert(preimage.end(), tag.begin(), tag.end());

        const auto hash = crypto::sha256(preimage);
        PublicKey candidate{};
        std::copy(hash.begin(), hash.end(), candidate.begin());
        if (crypto::is_on_curve(candidate))
        {
            return std::nullopt;
        }
        return candidate;
    }

    ProgramAddress find_program_address(const std::vector<ByteView> &seeds, const PublicKey &program_id)
    {
        for (int bump = 255; bump >= 0; --bump)
        {
            const std::uint8_t bump_seed[1] = {static_cast<std::uint8_t>(bump)};
            auto with_bump = seeds;
            with_bump.emplace_back(bump_seed, 1);
            if (auto address = create_program_address(with_bump, program_id))
            {
                return ProgramAddress{.address = *address, .bump = static_cast<std::uint8_t>(bump)};
            }
        }
        throw InscribeError(ErrorCode::InternalError, "No viable bump seed for program address");
    }

    ProgramAddress derive_session_address(const PublicKey &owner, const SessionId &session_id,
                                          const PublicKey &program_id)
    {
        return find_program_address({as_bytes(kSessionSeed), ByteView(owner), ByteView(session_id)}, program_id);
    }

    ProgramAddress derive_storage_address(const PublicKey &owner, const PublicKey &program_id)
    {
        return find_program_address({as_bytes(kStorageSeed), ByteView(owner)}, program_id);
    }

} // namespace inscribe::address
