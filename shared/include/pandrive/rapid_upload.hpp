/**
 * PanDrive - Registering a file by fingerprint without sending its bytes.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "pandrive/cipher.hpp"
#include "pandrive/drive_api.hpp"

namespace pandrive
{

    class RapidUploadNegotiator
    {
    public:
        RapidUploadNegotiator(DriveApi &api, std::string access_token);

        // Only plaintext uploads of at least 1 KiB are offered to the remote.
        static bool eligible(std::uint64_t size, cipher::CipherKind cipher) noexcept;

        // Two-step negotiation: a probe with the SHA-1 of the first KiB, then
        // the full SHA-1 and proof code if the probe matched. Returns the
        // session of the registered file; any rejection or failure throws
        // RapidUploadError.
        UploadSession negotiate(const std::filesystem::path &local_path, const UploadSessionRequest &request);

        // Session opened by the probe, still usable for a regular upload.
        const std::optional<UploadSession> &prepared_session() const noexcept { return prepared_; }

    private:
        DriveApi &api_;
        std::string access_token_;
        std::optional<UploadSession> prepared_;
    };

} // namespace pandrive
