/**
 * Inscribe - Byte containers shared by every layer.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace inscribe
{

    using Bytes = std::vector<std::uint8_t>;
    using ByteView = std::span<const std::uint8_t>;

    inline constexpr std::size_t kSessionIdSize = 16;
    inline constexpr std::size_t kDigestSize = 32;
    inline constexpr std::size_t kPublicKeySize = 32;
    inline constexpr std::size_t kSignatureSize = 64;

    using SessionId = std::array<std::uint8_t, kSessionIdSize>;
    using Digest = std::array<std::uint8_t, kDigestSize>;
    using PublicKey = std::array<std::uint8_t, kPublicKeySize>;
    using Signature = std::array<std::uint8_t, kSignatureSize>;

} // namespace inscribe
