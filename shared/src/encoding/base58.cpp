#include "inscribe/encoding/base58.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

namespace inscribe::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

        consteval auto make_decode_table()
        {
            std::array<int8_t, 256> table{};
            table.fill(-1);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int8_t>(i);
            }
            return table;
        }

        constexpr auto kDecodeTable = make_decode_table();

    } // namespace

    std::string encode_base58(ByteView data)
    {
        const auto leading_zeros = static_cast<std::size_t>(
            std::find_if(data.begin(), data.end(), [](std::uint8_t b)
                         { return b != 0; }) -
            data.begin());

        // Base-58 digits, least significant first.
        std::vector<std::uint8_t> digits;
        digits.reserve(data.size() * 138 / 100 + 1);
        for (std::size_t i = leading_zeros; i < data.size(); ++i)
        {
            std::uint32_t carry = data[i];
            for (auto &digit : digits)
            {
                carry += static_cast<std::uint32_t>(digit) << 8;
                digit = static_cast<std::uint8_t>(carry % 58);
                carry /= 58;
            }
            while (carry > 0)
            {
                digits.push_back(static_cast<std::uint8_t>(carry % 58));
                carry /= 58;
            }
        }

        std::string output(leading_zeros, kAlphabet[0]);
        output.reserve(leading_zeros + digits.size());
        for (auto it = digits.rbegin(); it != digits.rend(); ++it)
        {
            output.push_back(kAlphabet[*it]);
        }
        return output;
    }

    std::optional<Bytes> decode_base58(std::string_view input)
    {
        std::size_t leading_ones = 0;
        while (leading_ones < input.size() && input[leading_ones] == kAlphabet[0])
        {
            ++leading_ones;
        }

        // Base-256 bytes, least significant first.
        std::vector<std::uint8_t> bytes;
        bytes.reserve(input.size() * 733 / 1000 + 1);
        for (std::size_t i = leading_ones; i < input.size(); ++i)
        {
            const int value = kDecodeTable[static_cast<unsigned char>(input[i])];
            if (value < 0)
            {
                return std::nullopt;
            }
            std::uint32_t carry = static_cast<std::uint32_t>(value);
            for (auto &byte : bytes)
            {
                carry += static_cast<std::uint32_t>(byte) * 58;
                byte = static_cast<std::uint8_t>(carry & 0xFF);
                carry >>= 8;
            }
            while (carry > 0)
            {
                bytes.push_back(static_cast<std::uint8_t>(carry & 0xFF));
                carry >>= 8;
            }
        }

        Bytes output(leading_ones, 0);
        output.insert(output.end(), bytes.rbegin(), bytes.rend());
        return output;
    }

} // namespace inscribe::encoding
