#include "pandrive/cipher.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <openssl/evp.h>
#include <sodium.h>

#include "pandrive/crypto.hpp"

namespace pandrive::cipher
{

    namespace
    {

        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;

        struct KindMapping
        {
            CipherKind kind;
            std::string_view label;
        };

        constexpr std::array<KindMapping, 4> kKindMappings{{
            {CipherKind::None, "none"},
            {CipherKind::Substitution, "simple"},
            {CipherKind::ChaCha20, "chacha20"},
            {CipherKind::Aes256Cbc, "aes256cbc"},
        }};

        const unsigned char *as_uchar(const std::byte *data)
        {
            return reinterpret_cast<const unsigned char *>(data);
        }

        unsigned char *as_uchar(std::byte *data)
        {
            return reinterpret_cast<unsigned char *>(data);
        }

        class EvpContext
        {
        public:
            EvpContext()
                : ctx_(EVP_CIPHER_CTX_new())
            {
                if (!ctx_)
                {
                    throw std::runtime_error("Failed to create cipher context");
                }
            }

            ~EvpContext()
            {
                EVP_CIPHER_CTX_free(ctx_);
            }

            EvpContext(const EvpContext &) = delete;
            EvpContext &operator=(const EvpContext &) = delete;

            EVP_CIPHER_CTX *get() { return ctx_; }

        private:
            EVP_CIPHER_CTX *ctx_;
        };

        std::vector<std::byte> substitute(const std::array<std::uint8_t, 256> &table, std::span<const std::byte> data)
        {
            std::vector<std::byte> out(data.size());
            std::transform(data.begin(), data.end(), out.begin(), [&](std::byte value)
                           { return static_cast<std::byte>(table[static_cast<std::uint8_t>(value)]); });
            return out;
        }

        std::vector<std::byte> evp_update(EvpContext &context, std::span<const std::byte> input, bool encrypting)
        {
            std::vector<std::byte> out(input.size() + kAesBlockSize);
            int written = 0;
            const int status = encrypting
                                   ? EVP_EncryptUpdate(context.get(), as_uchar(out.data()), &written,
                                                       as_uchar(input.data()), static_cast<int>(input.size()))
                                   : EVP_DecryptUpdate(context.get(), as_uchar(out.data()), &written,
                                                       as_uchar(input.data()), static_cast<int>(input.size()));
            if (status != 1)
            {
                throw std::runtime_error(encrypting ? "EVP_EncryptUpdate failed" : "EVP_DecryptUpdate failed");
            }
            out.resize(static_cast<std::size_t>(written));
            return out;
        }

    } // namespace

    std::string_view to_string(CipherKind kind) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<CipherKind> cipher_kind_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kKindMappings)
        {
            if (mapping.label == value)
            {
                return mapping.kind;
            }
        }
        return std::nullopt;
    }

    CipherKind kind_of(const CipherSpec &spec) noexcept
    {
        return std::visit(overloaded{
                              [](const NoCipher &)
                              { return CipherKind::None; },
                              [](const SubstitutionCipher &)
                              { return CipherKind::Substitution; },
                              [](const ChaCha20Cipher &)
                              { return CipherKind::ChaCha20; },
                              [](const Aes256CbcCipher &)
                              { return CipherKind::Aes256Cbc; },
                          },
                          spec);
    }

    Key derive_key(std::string_view password, const Salt &salt)
    {
        crypto::ensure_sodium_init();
        Key key{};
        if (crypto_generichash(as_uchar(key.data()), key.size(),
                               reinterpret_cast<const unsigned char *>(password.data()), password.size(),
                               as_uchar(salt.data()), salt.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash failed");
        }
        return key;
    }

    SubstitutionCipher make_substitution(const Key &key)
    {
        crypto::ensure_sodium_init();
        std::array<unsigned char, 255 * 4> randomness{};
        std::array<unsigned char, crypto_stream_chacha20_NONCEBYTES> zero_nonce{};
        crypto_stream_chacha20(randomness.data(), randomness.size(), zero_nonce.data(), as_uchar(key.data()));

        SubstitutionCipher cipher;
        for (std::size_t i = 0; i < cipher.table.size(); ++i)
        {
            cipher.table[i] = static_cast<std::uint8_t>(i);
        }
        // Fisher-Yates driven by the keystream.
        for (std::size_t i = 255, r = 0; i > 0; --i, r += 4)
        {
            const std::uint32_t sample = (static_cast<std::uint32_t>(randomness[r]) << 24) |
                                         (static_cast<std::uint32_t>(randomness[r + 1]) << 16) |
                                         (static_cast<std::uint32_t>(randomness[r + 2]) << 8) |
                                         static_cast<std::uint32_t>(randomness[r + 3]);
            const auto j = static_cast<std::size_t>(sample % (i + 1));
            std::swap(cipher.table[i], cipher.table[j]);
        }
        for (std::size_t i = 0; i < cipher.table.size(); ++i)
        {
            cipher.inverse[cipher.table[i]] = static_cast<std::uint8_t>(i);
        }
        return cipher;
    }

    CipherSpec make_cipher(CipherKind kind, std::string_view password, const Salt &salt, const Nonce &nonce)
    {
        switch (kind)
        {
        case CipherKind::None:
            return NoCipher{};
        case CipherKind::Substitution:
            return make_substitution(derive_key(password, salt));
        case CipherKind::ChaCha20:
        {
            ChaCha20Cipher cipher;
            cipher.key = derive_key(password, salt);
            std::copy_n(nonce.begin(), cipher.nonce.size(), cipher.nonce.begin());
            return cipher;
        }
        case CipherKind::Aes256Cbc:
        {
            Aes256CbcCipher cipher;
            cipher.key = derive_key(password, salt);
            std::copy_n(nonce.begin(), cipher.iv.size(), cipher.iv.begin());
            return cipher;
        }
        }
        throw std::invalid_argument("Unknown cipher kind " + std::to_string(static_cast<int>(kind)));
    }

    std::uint64_t ciphertext_size(CipherKind kind, std::uint64_t plaintext_size) noexcept
    {
        if (kind == CipherKind::Aes256Cbc)
        {
            return (plaintext_size / kAesBlockSize + 1) * kAesBlockSize;
        }
        return plaintext_size;
    }

    std::vector<std::byte> chacha20_xor_at(const ChaCha20Cipher &cipher, std::uint64_t position,
                                           std::span<const std::byte> data)
    {
        crypto::ensure_sodium_init();
        std::vector<std::byte> out(data.size());
        if (data.empty())
        {
            return out;
        }
        const std::uint64_t block = position / kChaChaBlockSize;
        const auto skip = static_cast<std::size_t>(position % kChaChaBlockSize);
        std::size_t done = 0;
        if (skip != 0)
        {
            std::array<unsigned char, kChaChaBlockSize> partial{};
            const auto head = std::min(kChaChaBlockSize - skip, data.size());
            std::memcpy(partial.data() + skip, data.data(), head);
            crypto_stream_chacha20_xor_ic(partial.data(), partial.data(), partial.size(),
                                          as_uchar(cipher.nonce.data()), block, as_uchar(cipher.key.data()));
            std::memcpy(out.data(), partial.data() + skip, head);
            done = head;
        }
        if (done < data.size())
        {
            const std::uint64_t next_block = skip != 0 ? block + 1 : block;
            crypto_stream_chacha20_xor_ic(as_uchar(out.data() + done), as_uchar(data.data() + done),
                                          data.size() - done, as_uchar(cipher.nonce.data()), next_block,
                                          as_uchar(cipher.key.data()));
        }
        return out;
    }

    struct Encryptor::State
    {
        CipherSpec spec;
        std::uint64_t position{0};
        std::unique_ptr<EvpContext> evp;
        bool finalized{false};
    };

    Encryptor::Encryptor(const CipherSpec &spec)
        : state_(std::make_unique<State>())
    {
        state_->spec = spec;
        if (const auto *aes = std::get_if<Aes256CbcCipher>(&state_->spec))
        {
            state_->evp = std::make_unique<EvpContext>();
            if (EVP_EncryptInit_ex(state_->evp->get(), EVP_aes_256_cbc(), nullptr, as_uchar(aes->key.data()),
                                   as_uchar(aes->iv.data())) != 1)
            {
                throw std::runtime_error("Failed to initialize AES-256-CBC encryption");
            }
        }
    }

    Encryptor::~Encryptor() = default;
    Encryptor::Encryptor(Encryptor &&) noexcept = default;
    Encryptor &Encryptor::operator=(Encryptor &&) noexcept = default;

    std::vector<std::byte> Encryptor::update(std::span<const std::byte> plaintext)
    {
        if (state_->finalized)
        {
            throw std::logic_error("Encryptor already finalized");
        }
        return std::visit(overloaded{
                              [&](const NoCipher &)
                              { return std::vector<std::byte>(plaintext.begin(), plaintext.end()); },
                              [&](const SubstitutionCipher &cipher)
                              { return substitute(cipher.table, plaintext); },
                              [&](const ChaCha20Cipher &cipher)
                              {
                                  auto out = chacha20_xor_at(cipher, state_->position, plaintext);
                                  state_->position += plaintext.size();
                                  return out;
                              },
                              [&](const Aes256CbcCipher &)
                              { return evp_update(*state_->evp, plaintext, true); },
                          },
                          state_->spec);
    }

    std::vector<std::byte> Encryptor::finalize()
    {
        if (state_->finalized)
        {
            return {};
        }
        state_->finalized = true;
        if (!state_->evp)
        {
            return {};
        }
        std::vector<std::byte> out(kAesBlockSize);
        int written = 0;
        if (EVP_EncryptFinal_ex(state_->evp->get(), as_uchar(out.data()), &written) != 1)
        {
            throw std::runtime_error("EVP_EncryptFinal_ex failed");
        }
        out.resize(static_cast<std::size_t>(written));
        return out;
    }

    struct RangeDecryptor::State
    {
        CipherSpec spec;
        CiphertextRange range;
        std::uint64_t discard{0};
        std::uint64_t remaining{0};
        std::uint64_t produced{0};
        std::uint64_t position{0};
        std::unique_ptr<EvpContext> evp;
    };

    RangeDecryptor::RangeDecryptor(const CipherSpec &spec, std::uint64_t offset, std::uint64_t length)
        : state_(std::make_unique<State>())
    {
        state_->spec = spec;
        state_->remaining = length;
        state_->range = CiphertextRange{.offset = offset, .length = length};
        state_->position = offset;

        const auto *aes = std::get_if<Aes256CbcCipher>(&state_->spec);
        if (!aes || length == 0)
        {
            return;
        }

        const std::uint64_t first_block = offset / kAesBlockSize;
        const std::uint64_t end_aligned = (offset + length + kAesBlockSize - 1) / kAesBlockSize * kAesBlockSize;
        std::array<std::byte, kAesBlockSize> iv = aes->iv;
        if (first_block == 0)
        {
            state_->range.offset = 0;
            state_->discard = offset;
        }
        else
        {
            // The preceding block is decrypted with a throwaway IV; only its
            // ciphertext matters, as the chaining input of the first wanted block.
            iv.fill(std::byte{0});
            state_->range.offset = (first_block - 1) * kAesBlockSize;
            state_->discard = kAesBlockSize + offset % kAesBlockSize;
        }
        state_->range.length = end_aligned - state_->range.offset;

        state_->evp = std::make_unique<EvpContext>();
        if (EVP_DecryptInit_ex(state_->evp->get(), EVP_aes_256_cbc(), nullptr, as_uchar(aes->key.data()),
                               as_uchar(iv.data())) != 1)
        {
            throw std::runtime_error("Failed to initialize AES-256-CBC decryption");
        }
        EVP_CIPHER_CTX_set_padding(state_->evp->get(), 0);
    }

    RangeDecryptor::~RangeDecryptor() = default;
    RangeDecryptor::RangeDecryptor(RangeDecryptor &&) noexcept = default;
    RangeDecryptor &RangeDecryptor::operator=(RangeDecryptor &&) noexcept = default;

    CiphertextRange RangeDecryptor::ciphertext_range() const noexcept
    {
        return state_->range;
    }

    std::uint64_t RangeDecryptor::produced() const noexcept
    {
        return state_->produced;
    }

    std::vector<std::byte> RangeDecryptor::update(std::span<const std::byte> ciphertext)
    {
        auto plain = std::visit(overloaded{
                                    [&](const NoCipher &)
                                    { return std::vector<std::byte>(ciphertext.begin(), ciphertext.end()); },
                                    [&](const SubstitutionCipher &cipher)
                                    { return substitute(cipher.inverse, ciphertext); },
                                    [&](const ChaCha20Cipher &cipher)
                                    {
                                        auto out = chacha20_xor_at(cipher, state_->position, ciphertext);
                                        state_->position += ciphertext.size();
                                        return out;
                                    },
                                    [&](const Aes256CbcCipher &)
                                    {
                                        if (!state_->evp)
                                        {
                                            return std::vector<std::byte>{};
                                        }
                                        return evp_update(*state_->evp, ciphertext, false);
                                    },
                                },
                                state_->spec);

        std::size_t begin = 0;
        if (state_->discard > 0)
        {
            begin = static_cast<std::size_t>(std::min<std::uint64_t>(state_->discard, plain.size()));
            state_->discard -= begin;
        }
        const auto available = plain.size() - begin;
        const auto take = static_cast<std::size_t>(std::min<std::uint64_t>(available, state_->remaining));
        state_->remaining -= take;
        state_->produced += take;
        if (begin == 0 && take == plain.size())
        {
            return plain;
        }
        return std::vector<std::byte>(plain.begin() + static_cast<std::ptrdiff_t>(begin),
                                      plain.begin() + static_cast<std::ptrdiff_t>(begin + take));
    }

    std::vector<std::byte> encrypt(const CipherSpec &spec, std::span<const std::byte> plaintext)
    {
        Encryptor encryptor(spec);
        auto out = encryptor.update(plaintext);
        const auto tail = encryptor.finalize();
        out.insert(out.end(), tail.begin(), tail.end());
        return out;
    }

    std::vector<std::byte> decrypt_range(const CipherSpec &spec, RangeSource &ciphertext, std::uint64_t offset,
                                         std::uint64_t length)
    {
        RangeDecryptor decryptor(spec, offset, length);
        const auto range = decryptor.ciphertext_range();
        std::vector<std::byte> result;
        result.reserve(static_cast<std::size_t>(length));
        if (range.length == 0)
        {
            return result;
        }
        ciphertext.stream_range(range.offset, range.length, [&](std::span<const std::byte> block)
                                {
            const auto plain = decryptor.update(block);
            result.insert(result.end(), plain.begin(), plain.end()); });
        return result;
    }

} // namespace pandrive::cipher
