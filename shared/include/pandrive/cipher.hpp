/**
 * PanDrive - Stream cipher family used for transparent encryption at rest.
 *
 * Every cipher can decrypt an arbitrary plaintext range without reading the
 * object from its start:
 *  - Substitution is stateless per byte.
 *  - ChaCha20 seeks the keystream to block offset / 64 and skips offset % 64.
 *  - AES-256-CBC fetches the ciphertext block preceding the range, decrypts it
 *    and throws its output away, so the next block chains correctly.
 *
 * Decryption never validates anything; a wrong key yields garbage of the
 * right length.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "pandrive/range_source.hpp"

namespace pandrive::cipher
{

    enum class CipherKind : std::uint8_t
    {
        None = 0,
        Substitution = 1,
        ChaCha20 = 2,
        Aes256Cbc = 3
    };

    std::string_view to_string(CipherKind kind) noexcept;
    std::optional<CipherKind> cipher_kind_from_string(std::string_view value) noexcept;

    inline constexpr std::size_t kKeySize = 32;
    inline constexpr std::size_t kSaltSize = 16;
    inline constexpr std::size_t kNonceSize = 16;
    inline constexpr std::size_t kAesBlockSize = 16;
    inline constexpr std::size_t kChaChaBlockSize = 64;

    using Key = std::array<std::byte, kKeySize>;
    using Salt = std::array<std::byte, kSaltSize>;
    using Nonce = std::array<std::byte, kNonceSize>;

    struct NoCipher
    {
    };

    struct SubstitutionCipher
    {
        std::array<std::uint8_t, 256> table{};
        std::array<std::uint8_t, 256> inverse{};
    };

    struct ChaCha20Cipher
    {
        Key key{};
        std::array<std::byte, 8> nonce{};
    };

    struct Aes256CbcCipher
    {
        Key key{};
        std::array<std::byte, kAesBlockSize> iv{};
    };

    using CipherSpec = std::variant<NoCipher, SubstitutionCipher, ChaCha20Cipher, Aes256CbcCipher>;

    CipherKind kind_of(const CipherSpec &spec) noexcept;

    Key derive_key(std::string_view password, const Salt &salt);

    SubstitutionCipher make_substitution(const Key &key);

    // Builds the spec of `kind` from a password and the per-object salt and nonce.
    // ChaCha20 uses the first 8 nonce bytes, AES-256-CBC all 16 as its IV.
    CipherSpec make_cipher(CipherKind kind, std::string_view password, const Salt &salt, const Nonce &nonce);

    // Size of the ciphertext body produced for `plaintext_size` bytes.
    std::uint64_t ciphertext_size(CipherKind kind, std::uint64_t plaintext_size) noexcept;

    // XORs `data` with the ChaCha20 keystream starting at byte `position`.
    std::vector<std::byte> chacha20_xor_at(const ChaCha20Cipher &cipher, std::uint64_t position,
                                           std::span<const std::byte> data);

    class Encryptor
    {
    public:
        explicit Encryptor(const CipherSpec &spec);
        ~Encryptor();
        Encryptor(Encryptor &&) noexcept;
        Encryptor &operator=(Encryptor &&) noexcept;

        std::vector<std::byte> update(std::span<const std::byte> plaintext);

        // Flushes padding (AES-256-CBC); further updates are rejected.
        std::vector<std::byte> finalize();

    private:
        struct State;
        std::unique_ptr<State> state_;
    };

    struct CiphertextRange
    {
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    // Streaming decryption of the plaintext range [offset, offset + length).
    // Feed it ciphertext_range() of the body, in order, in blocks of any size.
    class RangeDecryptor
    {
    public:
        RangeDecryptor(const CipherSpec &spec, std::uint64_t offset, std::uint64_t length);
        ~RangeDecryptor();
        RangeDecryptor(RangeDecryptor &&) noexcept;
        RangeDecryptor &operator=(RangeDecryptor &&) noexcept;

        CiphertextRange ciphertext_range() const noexcept;

        std::vector<std::byte> update(std::span<const std::byte> ciphertext);

        std::uint64_t produced() const noexcept;

    private:
        struct State;
        std::unique_ptr<State> state_;
    };

    std::vector<std::byte> encrypt(const CipherSpec &spec, std::span<const std::byte> plaintext);

    std::vector<std::byte> decrypt_range(const CipherSpec &spec, RangeSource &ciphertext, std::uint64_t offset,
                                         std::uint64_t length);

} // namespace pandrive::cipher
