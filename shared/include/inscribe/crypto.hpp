/**
 * Inscribe - Crypto helpers built on libsodium.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "inscribe/types.hpp"

namespace inscribe::crypto
{

    inline constexpr std::size_t kSecretKeySize = 64;

    struct Keypair
    {
        PublicKey public_key{};
        std::array<std::uint8_t, kSecretKeySize> secret_key{};
    };

    void ensure_sodium_init();

    Digest sha256(ByteView data);

    std::string to_hex(ByteView data);

    Bytes from_hex(std::string_view text);

    SessionId random_session_id();

    Keypair generate_keypair();

    // Accepts the 64-byte secret key layout (seed followed by public key).
    Keypair keypair_from_secret(ByteView secret);

    Signature sign(const Keypair &keypair, ByteView message);

    bool verify(const PublicKey &public_key, ByteView message, const Signature &signature);

    bool is_on_curve(const PublicKey &point);

} // namespace inscribe::crypto
