#include <algorithm>
#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "fakes.hpp"
#include "pandrive/cipher.hpp"
#include "pandrive/encryption_header.hpp"
#include "pandrive/range_source.hpp"

using namespace pandrive;
using namespace pandrive::cipher;
using pandrive::testing::make_bytes;

namespace
{

    constexpr CipherKind kAllCiphers[] = {CipherKind::Substitution, CipherKind::ChaCha20, CipherKind::Aes256Cbc};

    CipherSpec spec_for(CipherKind kind, const std::string &password = "correct horse")
    {
        const auto header = new_header(kind, 0);
        return cipher_for(header, password);
    }

    std::vector<std::byte> slice(const std::vector<std::byte> &data, std::size_t offset, std::size_t length)
    {
        return std::vector<std::byte>(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                      data.begin() + static_cast<std::ptrdiff_t>(offset + length));
    }

    void test_labels()
    {
        assert(to_string(CipherKind::Substitution) == "simple");
        assert(to_string(CipherKind::Aes256Cbc) == "aes256cbc");
        assert(cipher_kind_from_string("chacha20") == CipherKind::ChaCha20);
        assert(cipher_kind_from_string("none") == CipherKind::None);
        assert(!cipher_kind_from_string("rot13"));
    }

    void test_full_round_trips()
    {
        for (const auto kind : kAllCiphers)
        {
            const auto spec = spec_for(kind);
            assert(kind_of(spec) == kind);
            for (const std::size_t size : {std::size_t{0}, std::size_t{1}, std::size_t{1000}})
            {
                const auto plain = make_bytes(size, static_cast<unsigned>(size) + 3);
                const auto sealed = encrypt(spec, plain);
                assert(sealed.size() == ciphertext_size(kind, size));

                MemoryRangeSource source(sealed);
                assert(decrypt_range(spec, source, 0, size) == plain);
            }
        }
    }

    void test_streaming_encryptor_matches_one_shot()
    {
        const auto plain = make_bytes(777);
        for (const auto kind : kAllCiphers)
        {
            const auto spec = spec_for(kind);
            Encryptor encryptor(spec);
            std::vector<std::byte> streamed;
            for (std::size_t offset = 0; offset < plain.size(); offset += 100)
            {
                const auto length = std::min<std::size_t>(100, plain.size() - offset);
                const auto out = encryptor.update(std::span(plain).subspan(offset, length));
                streamed.insert(streamed.end(), out.begin(), out.end());
            }
            const auto tail = encryptor.finalize();
            streamed.insert(streamed.end(), tail.begin(), tail.end());
            assert(streamed == encrypt(spec, plain));
        }
    }

    // Any plaintext range decrypts from its own ciphertext range alone.
    void test_range_equivalence()
    {
        const auto plain = make_bytes(1000, 11);
        const std::size_t ranges[][2] = {{0, 1}, {1, 15}, {15, 2}, {16, 16}, {17, 100}, {63, 2}, {64, 64},
                                         {100, 500}, {511, 489}, {999, 1}, {0, 1000}};
        for (const auto kind : kAllCiphers)
        {
            const auto spec = spec_for(kind);
            const auto sealed = encrypt(spec, plain);
            MemoryRangeSource source(sealed);
            for (const auto &range : ranges)
            {
                assert(decrypt_range(spec, source, range[0], range[1]) == slice(plain, range[0], range[1]));
            }
        }
    }

    void test_aes_range_reads_preceding_block()
    {
        const auto spec = spec_for(CipherKind::Aes256Cbc);
        RangeDecryptor aligned(spec, 32, 16);
        assert(aligned.ciphertext_range().offset == 16);
        assert(aligned.ciphertext_range().length == 32);

        RangeDecryptor unaligned(spec, 37, 10);
        assert(unaligned.ciphertext_range().offset == 16);
        assert(unaligned.ciphertext_range().length == 32);

        RangeDecryptor leading(spec, 3, 5);
        assert(leading.ciphertext_range().offset == 0);
        assert(leading.ciphertext_range().length == 16);

        // Stream ciphers read exactly the requested bytes.
        RangeDecryptor chacha(spec_for(CipherKind::ChaCha20), 37, 10);
        assert(chacha.ciphertext_range().offset == 37);
        assert(chacha.ciphertext_range().length == 10);
    }

    void test_decryptor_accepts_any_block_split()
    {
        const auto plain = make_bytes(300, 5);
        for (const auto kind : kAllCiphers)
        {
            const auto spec = spec_for(kind);
            const auto sealed = encrypt(spec, plain);
            RangeDecryptor decryptor(spec, 70, 150);
            const auto range = decryptor.ciphertext_range();
            std::vector<std::byte> out;
            for (std::uint64_t at = range.offset; at < range.offset + range.length; at += 7)
            {
                const auto length = std::min<std::uint64_t>(7, range.offset + range.length - at);
                const auto part = decryptor.update(std::span(sealed).subspan(static_cast<std::size_t>(at),
                                                                             static_cast<std::size_t>(length)));
                out.insert(out.end(), part.begin(), part.end());
            }
            assert(decryptor.produced() == 150);
            assert(out == slice(plain, 70, 150));
        }
    }

    void test_wrong_key_yields_garbage()
    {
        const auto plain = make_bytes(256, 9);
        auto header = new_header(CipherKind::Aes256Cbc, plain.size());
        const auto right = cipher_for(header, "right");
        const auto wrong = cipher_for(header, "wrong");
        const auto sealed = encrypt(right, plain);
        MemoryRangeSource source(sealed);

        for (const auto kind : kAllCiphers)
        {
            header.kind = kind;
            const auto sealed_kind = encrypt(cipher_for(header, "right"), plain);
            MemoryRangeSource kind_source(sealed_kind);
            const auto garbage = decrypt_range(cipher_for(header, "wrong"), kind_source, 0, plain.size());
            assert(garbage.size() == plain.size());
            assert(garbage != plain);
        }
        assert(decrypt_range(wrong, source, 10, 20).size() == 20);
    }

    void test_key_derivation_depends_on_salt()
    {
        Salt first{};
        Salt second{};
        second[0] = std::byte{1};
        assert(derive_key("password", first) == derive_key("password", first));
        assert(derive_key("password", first) != derive_key("password", second));
        assert(derive_key("password", first) != derive_key("Password", first));

        const auto table = make_substitution(derive_key("password", first));
        for (std::size_t value = 0; value < 256; ++value)
        {
            assert(table.inverse[table.table[value]] == value);
        }
    }

    void test_chacha_keystream_offsets()
    {
        const auto spec = std::get<ChaCha20Cipher>(spec_for(CipherKind::ChaCha20));
        const auto data = make_bytes(200, 2);
        const auto whole = chacha20_xor_at(spec, 0, data);
        const auto tail = chacha20_xor_at(spec, 65, std::span(data).subspan(65));
        assert(tail == slice(whole, 65, 135));
        assert(chacha20_xor_at(spec, 0, whole) == data);
    }

} // namespace

void run_cipher_component_tests()
{
    test_labels();
    test_full_round_trips();
    test_streaming_encryptor_matches_one_shot();
    test_range_equivalence();
    test_aes_range_reads_preceding_block();
    test_decryptor_accepts_any_block_split();
    test_wrong_key_yields_garbage();
    test_key_derivation_depends_on_salt();
    test_chacha_keystream_offsets();
}
