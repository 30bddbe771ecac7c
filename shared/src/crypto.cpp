#include "pandrive/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>

#include <openssl/evp.h>
#include <sodium.h>

#include "pandrive/encoding/base64.hpp"

namespace pandrive::crypto
{

    namespace
    {

        void throw_if_sodium_init_failed(int status)
        {
            if (status < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            }
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

        std::string digest_hex(const EVP_MD *md, std::span<const std::byte> data)
        {
            std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
            unsigned int length = 0;
            if (EVP_Digest(data.data(), data.size(), digest.data(), &length, md, nullptr) != 1)
            {
                throw std::runtime_error("EVP_Digest failed");
            }
            return to_hex(std::as_bytes(std::span(digest.data(), length)));
        }

        EVP_MD_CTX *as_context(void *context)
        {
            return static_cast<EVP_MD_CTX *>(context);
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       { throw_if_sodium_init_failed(sodium_init()); });
    }

    std::string to_hex(std::span<const std::byte> data)
    {
        static constexpr char kHexDigits[] = "0123456789abcdef";
        std::string result;
        result.resize(data.size() * 2);
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto byte = static_cast<unsigned char>(data[i]);
            result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
            result[2 * i + 1] = kHexDigits[byte & 0x0F];
        }
        return result;
    }

    std::string sha1_bytes(std::span<const std::byte> data)
    {
        return digest_hex(EVP_sha1(), data);
    }

    std::string sha1_stream(std::istream &input)
    {
        Sha1 hasher;
        std::vector<char> buffer(64 * 1024);
        while (input)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                hasher.update(std::as_bytes(std::span(buffer.data(), read_count)));
            }
        }
        return hasher.hex_digest();
    }

    std::string sha1_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        return sha1_stream(file);
    }

    std::string md5_hex(std::string_view text)
    {
        return digest_hex(EVP_md5(), std::as_bytes(std::span(text.data(), text.size())));
    }

    std::string pre_hash_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for hashing: " + path.string());
        }
        std::vector<char> buffer(kPreHashSize);
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read_count = static_cast<std::size_t>(file.gcount());
        return sha1_bytes(std::as_bytes(std::span(buffer.data(), read_count)));
    }

    std::string proof_code(const std::filesystem::path &path, std::uint64_t size, std::string_view access_token)
    {
        if (size == 0)
        {
            return {};
        }
        const auto key_md5 = md5_hex(access_token);
        const auto offset = std::stoull(key_md5.substr(0, 16), nullptr, 16) % size;

        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw std::runtime_error("Failed to open file for proof code: " + path.string());
        }
        file.seekg(static_cast<std::streamoff>(offset));
        std::array<char, 8> buffer{};
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read_count = static_cast<std::size_t>(file.gcount());
        return encoding::encode_base64(std::as_bytes(std::span(buffer.data(), read_count)));
    }

    std::vector<std::byte> random_bytes(std::size_t count)
    {
        ensure_sodium_init();
        std::vector<std::byte> bytes(count);
        randombytes_buf(bytes.data(), bytes.size());
        return bytes;
    }

    Sha1::Sha1()
        : context_(EVP_MD_CTX_new())
    {
        if (!context_ || EVP_DigestInit_ex(as_context(context_), EVP_sha1(), nullptr) != 1)
        {
            EVP_MD_CTX_free(as_context(context_));
            throw std::runtime_error("EVP_DigestInit_ex failed");
        }
    }

    Sha1::~Sha1()
    {
        EVP_MD_CTX_free(as_context(context_));
    }

    void Sha1::update(std::span<const std::byte> data)
    {
        if (data.empty())
        {
            return;
        }
        if (EVP_DigestUpdate(as_context(context_), data.data(), data.size()) != 1)
        {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    std::string Sha1::hex_digest()
    {
        std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(as_context(context_), digest.data(), &length) != 1)
        {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return to_hex(std::as_bytes(std::span(digest.data(), length)));
    }

} // namespace pandrive::crypto
