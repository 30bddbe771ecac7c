/**
 * PanDrive - Hashing and fingerprint helpers.
 *
 * Content fingerprints are SHA-1 hex digests because that is what the remote
 * drive stores and compares for rapid upload.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pandrive::crypto
{

    // Number of leading bytes covered by the pre-hash sent in a rapid upload probe.
    inline constexpr std::size_t kPreHashSize = 1024;

    void ensure_sodium_init();

    std::string to_hex(std::span<const std::byte> data);

    std::string sha1_bytes(std::span<const std::byte> data);

    std::string sha1_stream(std::istream &input);

    std::string sha1_file(const std::filesystem::path &path);

    std::string md5_hex(std::string_view text);

    // SHA-1 of the first kPreHashSize bytes of the file.
    std::string pre_hash_file(const std::filesystem::path &path);

    // Proof of possession: 8 bytes read at md5(access_token)[0:16] mod size,
    // base64-encoded. Empty for an empty file.
    std::string proof_code(const std::filesystem::path &path, std::uint64_t size, std::string_view access_token);

    std::vector<std::byte> random_bytes(std::size_t count);

    // Incremental SHA-1, used where the hashed bytes are produced on the fly.
    class Sha1
    {
    public:
        Sha1();
        ~Sha1();
        Sha1(const Sha1 &) = delete;
        Sha1 &operator=(const Sha1 &) = delete;

        void update(std::span<const std::byte> data);
        std::string hex_digest();

    private:
        void *context_;
    };

} // namespace pandrive::crypto
