#include "vidyeet/encoding/base64.hpp"

#include <cstdint>

namespace vidyeet::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::uint32_t buffer = 0;
        int pending_bits = 0;

        for (const auto byte : data)
        {
            buffer = (buffer << 8u) | static_cast<std::uint32_t>(byte);
            pending_bits += 8;
            while (pending_bits >= 6)
            {
                pending_bits -= 6;
                output.push_back(kAlphabet[(buffer >> pending_bits) & 0x3Fu]);
            }
        }

        if (pending_bits > 0)
        {
            output.push_back(kAlphabet[(buffer << (6 - pending_bits)) & 0x3Fu]);
        }

        while (output.size() % 4 != 0)
        {
            output.push_back('=');
        }

        return output;
    }

    std::string encode_base64(std::string_view text)
    {
        return encode_base64(std::as_bytes(std::span(text.data(), text.size())));
    }

} // namespace vidyeet::encoding
