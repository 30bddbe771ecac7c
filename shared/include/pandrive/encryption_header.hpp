/**
 * PanDrive - Header stored in front of every encrypted remote object.
 *
 * Layout (64 bytes):
 *   0  magic "PDRVENC1"
 *   8  cipher kind
 *   9  reserved (7 bytes)
 *  16  salt (16 bytes)
 *  32  nonce / IV (16 bytes)
 *  48  plaintext size, big endian u64
 *  56  reserved (8 bytes)
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "pandrive/cipher.hpp"

namespace pandrive::cipher
{

    inline constexpr std::size_t kHeaderSize = 64;
    inline constexpr std::string_view kHeaderMagic = "PDRVENC1";

    struct EncryptionHeader
    {
        CipherKind kind{CipherKind::None};
        Salt salt{};
        Nonce nonce{};
        std::uint64_t plaintext_size{};
    };

    // Fresh random salt and nonce.
    EncryptionHeader new_header(CipherKind kind, std::uint64_t plaintext_size);

    std::array<std::byte, kHeaderSize> encode_header(const EncryptionHeader &header);

    // std::nullopt when `data` does not start with the magic. Throws
    // EncryptionHeaderError when the magic is present but the header is unusable.
    std::optional<EncryptionHeader> parse_header(std::span<const std::byte> data);

    // Throws EncryptionHeaderError if an object of `object_size` bytes cannot
    // hold the body announced by `header`.
    void validate_object_size(const EncryptionHeader &header, std::uint64_t object_size);

    // Size of the remote object for a plaintext file; no header for CipherKind::None.
    std::uint64_t encrypted_object_size(CipherKind kind, std::uint64_t plaintext_size) noexcept;

    CipherSpec cipher_for(const EncryptionHeader &header, std::string_view password);

} // namespace pandrive::cipher
