#include "pandrive/encoding/base64.hpp"

#include <cstdint>
#include <string_view>

namespace pandrive::encoding
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
        int bits_collected = 0;

        for (const auto byte : data)
        {
            buffer = (buffer << 8u) | static_cast<std::uint32_t>(byte);
            bits_collected += 8;
            while (bits_collected >= 6)
            {
                bits_collected -= 6;
                output.push_back(kAlphabet[(buffer >> bits_collected) & 0x3Fu]);
            }
        }

        if (bits_collected > 0)
        {
            buffer <<= (6 - bits_collected);
            output.push_back(kAlphabet[buffer & 0x3Fu]);
        }

        while (output.size() % 4 != 0)
        {
            output.push_back('=');
        }

        return output;
    }

} // namespace pandrive::encoding
