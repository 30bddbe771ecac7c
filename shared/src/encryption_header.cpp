#include "pandrive/encryption_header.hpp"

#include <algorithm>
#include <string>

#include "pandrive/crypto.hpp"
#include "pandrive/errors.hpp"

namespace pandrive::cipher
{

    namespace
    {
        constexpr std::size_t kKindOffset = 8;
        constexpr std::size_t kSaltOffset = 16;
        constexpr std::size_t kNonceOffset = 32;
        constexpr std::size_t kSizeOffset = 48;

        void write_u64_be(std::uint64_t value, std::span<std::byte> buffer)
        {
            for (std::size_t i = 0; i < 8; ++i)
            {
                buffer[i] = static_cast<std::byte>((value >> (56 - 8 * i)) & 0xFF);
            }
        }

        std::uint64_t read_u64_be(std::span<const std::byte> buffer)
        {
            std::uint64_t value = 0;
            for (std::size_t i = 0; i < 8; ++i)
            {
                value = (value << 8) | static_cast<std::uint64_t>(buffer[i]);
            }
            return value;
        }
    } // namespace

    EncryptionHeader new_header(CipherKind kind, std::uint64_t plaintext_size)
    {
        EncryptionHeader header{.kind = kind, .plaintext_size = plaintext_size};
        const auto salt = crypto::random_bytes(kSaltSize);
        const auto nonce = crypto::random_bytes(kNonceSize);
        std::copy(salt.begin(), salt.end(), header.salt.begin());
        std::copy(nonce.begin(), nonce.end(), header.nonce.begin());
        return header;
    }

    std::array<std::byte, kHeaderSize> encode_header(const EncryptionHeader &header)
    {
        std::array<std::byte, kHeaderSize> out{};
        std::transform(kHeaderMagic.begin(), kHeaderMagic.end(), out.begin(), [](char ch)
                       { return static_cast<std::byte>(ch); });
        out[kKindOffset] = static_cast<std::byte>(header.kind);
        std::copy(header.salt.begin(), header.salt.end(), out.begin() + kSaltOffset);
        std::copy(header.nonce.begin(), header.nonce.end(), out.begin() + kNonceOffset);
        write_u64_be(header.plaintext_size, std::span(out).subspan(kSizeOffset, 8));
        return out;
    }

    std::optional<EncryptionHeader> parse_header(std::span<const std::byte> data)
    {
        if (data.size() < kHeaderSize)
        {
            return std::nullopt;
        }
        for (std::size_t i = 0; i < kHeaderMagic.size(); ++i)
        {
            if (data[i] != static_cast<std::byte>(kHeaderMagic[i]))
            {
                return std::nullopt;
            }
        }
        const auto kind_value = static_cast<std::uint8_t>(data[kKindOffset]);
        const auto kind = static_cast<CipherKind>(kind_value);
        if (kind != CipherKind::Substitution && kind != CipherKind::ChaCha20 && kind != CipherKind::Aes256Cbc)
        {
            throw EncryptionHeaderError("Unsupported cipher tag " + std::to_string(kind_value) +
                                        " in encryption header");
        }

        EncryptionHeader header;
        header.kind = kind;
        std::copy_n(data.begin() + kSaltOffset, kSaltSize, header.salt.begin());
        std::copy_n(data.begin() + kNonceOffset, kNonceSize, header.nonce.begin());
        header.plaintext_size = read_u64_be(data.subspan(kSizeOffset, 8));
        return header;
    }

    void validate_object_size(const EncryptionHeader &header, std::uint64_t object_size)
    {
        const auto expected = encrypted_object_size(header.kind, header.plaintext_size);
        if (object_size != expected)
        {
            throw EncryptionHeaderError("Encrypted object holds " + std::to_string(object_size) + " bytes, header of " +
                                        std::string(to_string(header.kind)) + " announces " +
                                        std::to_string(expected));
        }
    }

    std::uint64_t encrypted_object_size(CipherKind kind, std::uint64_t plaintext_size) noexcept
    {
        if (kind == CipherKind::None)
        {
            return plaintext_size;
        }
        return kHeaderSize + ciphertext_size(kind, plaintext_size);
    }

    CipherSpec cipher_for(const EncryptionHeader &header, std::string_view password)
    {
        return make_cipher(header.kind, password, header.salt, header.nonce);
    }

} // namespace pandrive::cipher
