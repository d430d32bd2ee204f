#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "inscribe/types.hpp"

namespace inscribe::encoding
{

    std::string encode_base64(ByteView data);

    // Whitespace is skipped; any other character outside the alphabet fails.
    std::optional<Bytes> decode_base64(std::string_view input);

    bool looks_like_base64(std::string_view input);

} // namespace inscribe::encoding
