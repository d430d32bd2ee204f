#include "inscribe/crypto.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

#include "inscribe/error_codes.hpp"

namespace inscribe::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        void ensure_initialized_once()
        {
            std::call_once(sodium_once_flag(), []()
                           { throw_if_sodium_init_failed(sodium_init()); });
        }

        // Field elements mod 2^255 - 19 in five 51-bit limbs.
        using u128 = unsigned __int128;

        struct FieldElement
        {
            std::uint64_t limb[5];
        };

        constexpr std::uint64_t kMask51 = (std::uint64_t{1} << 51) - 1;

        // d = -121665 / 121666, little-endian.
        constexpr std::array<std::uint8_t, 32> kEdwardsD = {
            0xa3, 0x78, 0x59, 0x13, 0xca, 0x4d, 0xeb, 0x75, 0xab, 0xd8, 0x41, 0x41, 0x4d, 0x0a, 0x70, 0x00,
            0x98, 0xe8, 0x79, 0x77, 0x79, 0x40, 0xc7, 0x8c, 0x73, 0xfe, 0x6f, 0x2b, 0xee, 0x6c, 0x03, 0x52};

        // p - 2 and (p - 1) / 2, little-endian.
        constexpr std::array<std::uint8_t, 32> kInvertExponent = {
            0xeb, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
            0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f};
        constexpr std::array<std::uint8_t, 32> kLegendreExponent = {
            0xf6, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
            0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x3f};

        std::uint64_t load_u64_le(const std::uint8_t *in)
        {
            std::uint64_t value = 0;
            for (int i = 7; i >= 0; --i)
            {
                value = (value << 8) | in[i];
            }
            return value;
        }

        FieldElement fe_from_bytes(const std::uint8_t *in)
        {
            return FieldElement{{
                load_u64_le(in) & kMask51,
                (load_u64_le(in + 6) >> 3) & kMask51,
                (load_u64_le(in + 12) >> 6) & kMask51,
                (load_u64_le(in + 19) >> 1) & kMask51,
                (load_u64_le(in + 24) >> 12) & kMask51,
            }};
        }

        FieldElement fe_one()
        {
            return FieldElement{{1, 0, 0, 0, 0}};
        }

        void fe_carry(FieldElement &h)
        {
            for (int i = 0; i < 4; ++i)
            {
                h.limb[i + 1] += h.limb[i] >> 51;
                h.limb[i] &= kMask51;
            }
            h.limb[0] += 19 * (h.limb[4] >> 51);
            h.limb[4] &= kMask51;
        }

        FieldElement fe_add(const FieldElement &a, const FieldElement &b)
        {
            FieldElement h{};
            for (int i = 0; i < 5; ++i)
            {
                h.limb[i] = a.limb[i] + b.limb[i];
            }
            fe_carry(h);
            return h;
        }

        FieldElement fe_sub(const FieldElement &a, const FieldElement &b)
        {
            // a + 2p - b keeps every limb positive.
            FieldElement h{};
            h.limb[0] = a.limb[0] + 0xFFFFFFFFFFFDAULL - b.limb[0];
            for (int i = 1; i < 5; ++i)
            {
                h.limb[i] = a.limb[i] + 0xFFFFFFFFFFFFEULL - b.limb[i];
            }
            fe_carry(h);
            return h;
        }

        FieldElement fe_mul(const FieldElement &a, const FieldElement &b)
        {
            const std::uint64_t b1_19 = b.limb[1] * 19;
            const std::uint64_t b2_19 = b.limb[2] * 19;
            const std::uint64_t b3_19 = b.limb[3] * 19;
            const std::uint64_t b4_19 = b.limb[4] * 19;

            u128 t[5];
            t[0] = (u128)a.limb[0] * b.limb[0] + (u128)a.limb[1] * b4_19 + (u128)a.limb[2] * b3_19 +
                   (u128)a.limb[3] * b2_19 + (u128)a.limb[4] * b1_19;
            t[1] = (u128)a.limb[0] * b.limb[1] + (u128)a.limb[1] * b.limb[0] + (u128)a.limb[2] * b4_19 +
                   (u128)a.limb[3] * b3_19 + (u128)a.limb[4] * b2_19;
            t[2] = (u128)a.limb[0] * b.limb[2] + (u128)a.limb[1] * b.limb[1] + (u128)a.limb[2] * b.limb[0] +
                   (u128)a.limb[3] * b4_19 + (u128)a.limb[4] * b3_19;
            t[3] = (u128)a.limb[0] * b.limb[3] + (u128)a.limb[1] * b.limb[2] + (u128)a.limb[2] * b.limb[1] +
                   (u128)a.limb[3] * b.limb[0] + (u128)a.limb[4] * b4_19;
            t[4] = (u128)a.limb[0] * b.limb[4] + (u128)a.limb[1] * b.limb[3] + (u128)a.limb[2] * b.limb[2] +
                   (u128)a.limb[3] * b.limb[1] + (u128)a.limb[4] * b.limb[0];

            FieldElement h{};
            for (int i = 0; i < 4; ++i)
            {
                t[i + 1] += t[i] >> 51;
                h.limb[i] = static_cast<std::uint64_t>(t[i]) & kMask51;
            }
            h.limb[4] = static_cast<std::uint64_t>(t[4]) & kMask51;
            h.limb[0] += 19 * static_cast<std::uint64_t>(t[4] >> 51);
            fe_carry(h);
            return h;
        }

        FieldElement fe_pow(const FieldElement &base, const std::array<std::uint8_t, 32> &exponent)
        {
            auto result = fe_one();
            for (int bit = 255; bit >= 0; --bit)
            {
                result = fe_mul(result, result);
                if ((exponent[static_cast<std::size_t>(bit / 8)] >> (bit % 8)) & 1)
                {
                    result = fe_mul(result, base);
                }
            }
            return result;
        }

        // Fully reduced little-endian limbs, so equality is limbwise.
        FieldElement fe_canonical(FieldElement h)
        {
            fe_carry(h);
            fe_carry(h);
            h.limb[0] += 19;
            fe_carry(h);
            h.limb[0] += (std::uint64_t{1} << 51) - 19;
            for (int i = 1; i < 5; ++i)
            {
                h.limb[i] += (std::uint64_t{1} << 51) - 1;
            }
            for (int i = 0; i < 4; ++i)
            {
                h.limb[i + 1] += h.limb[i] >> 51;
                h.limb[i] &= kMask51;
            }
            h.limb[4] &= kMask51;
            return h;
        }

        bool fe_equals_small(const FieldElement &h, std::uint64_t value)
        {
            const auto canonical = fe_canonical(h);
            return canonical.limb[0] == value && canonical.limb[1] == 0 && canonical.limb[2] == 0 &&
                   canonical.limb[3] == 0 && canonical.limb[4] == 0;
        }

        int hex_value(char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            if (ch >= 'a' && ch <= 'f')
            {
                return ch - 'a' + 10;
            }
            if (ch >= 'A' && ch <= 'F')
            {
                return ch - 'A' + 10;
            }
            return -1;
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    Digest sha256(ByteView data)
    {
        ensure_initialized_once();
        Digest digest{};
        if (crypto_hash_sha256(digest.data(), data.data(), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return digest;
    }

    std::string to_hex(ByteView data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = data[i];
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

    Bytes from_hex(std::string_view text)
    {
        if (text.size() % 2 != 0)
        {
            throw InscribeError(ErrorCode::InvalidPayload, "Hex string has odd length");
        }
        Bytes result;
        result.reserve(text.size() / 2);
        for (std::size_t i = 0; i < text.size(); i += 2)
        {
            const int high = hex_value(text[i]);
            const int low = hex_value(text[i + 1]);
            if (high < 0 || low < 0)
            {
                throw InscribeError(ErrorCode::InvalidPayload, "Invalid hex digit");
            }
            result.push_back(static_cast<std::uint8_t>((high << 4) | low));
        }
        return result;
    }

    SessionId random_session_id()
    {
        ensure_initialized_once();
        SessionId id{};
        randombytes_buf(id.data(), id.size());
        return id;
    }

    Keypair generate_keypair()
    {
        ensure_initialized_once();
        Keypair keypair{};
        if (crypto_sign_ed25519_keypair(keypair.public_key.data(), keypair.secret_key.data()) != 0)
        {
            throw std::runtime_error("crypto_sign_ed25519_keypair failed");
        }
        return keypair;
    }

    Keypair keypair_from_secret(ByteView secret)
    {
        ensure_initialized_once();
        if (secret.size() != kSecretKeySize)
        {
            throw InscribeError(ErrorCode::InvalidInput,
                                "Keypair must be " + std::to_string(kSecretKeySize) + " bytes, got " +
                                    std::to_string(secret.size()));
        }
        Keypair keypair{};
        std::copy(secret.begin(), secret.end(), keypair.secret_key.begin());
        if (crypto_sign_ed25519_sk_to_pk(keypair.public_key.data(), keypair.secret_key.data()) != 0)
        {
            throw std::runtime_error("crypto_sign_ed25519_sk_to_pk failed");
        }
        return keypair;
    }

    Signature sign(const Keypair &keypair, ByteView message)
    {
        ensure_initialized_once();
        Signature signature{};
        if (crypto_sign_ed25519_detached(signature.data(), nullptr, message.data(), message.size(),
                                         keypair.secret_key.data()) != 0)
        {
            throw std::runtime_error("crypto_sign_ed25519_detached failed");
        }
        return signature;
    }

    bool verify(const PublicKey &public_key, ByteView message, const Signature &signature)
    {
        ensure_initialized_once();
        return crypto_sign_ed25519_verify_detached(signature.data(), message.data(), message.size(),
                                                   public_key.data()) == 0;
    }

    bool is_on_curve(const PublicKey &point)
    {
        // Decompression test only: crypto_core_ed25519_is_valid_point also
        // rejects points outside the main subgroup, which address derivation
        // must still treat as on-curve.
        const auto y = fe_from_bytes(point.data());
        const auto d = fe_from_bytes(kEdwardsD.data());
        const auto y2 = fe_mul(y, y);
        const auto u = fe_sub(y2, fe_one());
        const auto v = fe_add(fe_mul(d, y2), fe_one());
        const auto x2 = fe_mul(u, fe_pow(v, kInvertExponent));
        const auto legendre = fe_pow(x2, kLegendreExponent);
        return fe_equals_small(legendre, 0) || fe_equals_small(legendre, 1);
    }

} // namespace inscribe::crypto
