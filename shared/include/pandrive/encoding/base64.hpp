#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace pandrive::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

} // namespace pandrive::encoding
