#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "inscribe/types.hpp"

namespace inscribe::encoding
{

    std::string encode_base58(ByteView data);

    std::optional<Bytes> decode_base58(std::string_view input);

} // namespace inscribe::encoding
