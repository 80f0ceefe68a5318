#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace vidyeet::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    std::string encode_base64(std::string_view text);

} // namespace vidyeet::encoding
