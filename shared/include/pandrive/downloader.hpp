/**
 * PanDrive - Concurrent chunked download of one remote object into one file.
 *
 * The partial local file is the only resume state: pause, cancel and failure
 * all truncate it to the end of the contiguous prefix of finished chunks, so
 * its size is always a safe restart offset.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "pandrive/chunk_plan.hpp"
#include "pandrive/drive_api.hpp"
#include "pandrive/http.hpp"
#include "pandrive/transfer.hpp"

namespace pandrive
{

    inline constexpr std::uint32_t kDefaultConcurrency = 5;
    inline constexpr std::uint32_t kMaxConcurrency = 10;

    struct DownloadOptions
    {
        std::uint32_t concurrency{kDefaultConcurrency};
        std::uint64_t chunk_size{kDefaultChunkSize};
        bool resume{true};
        // Without a password an encrypted object is copied as is.
        std::optional<std::string> password{};
        RetryPolicy retry{};
        bool verify{true};
    };

    struct DownloadTask
    {
        RemoteHandle source;
        // File name under the destination directory.
        std::string name;
        std::string task_id{};
    };

    std::uint32_t clamp_concurrency(std::uint32_t requested) noexcept;

    class Downloader
    {
    public:
        Downloader(http::Transport &transport, DriveApi &api, DownloadOptions options);

        // Never throws for transfer failures: they come back as a Failed
        // result holding a DownloadError.
        TransferResult download(const DownloadTask &task, const std::filesystem::path &destination,
                                TransferControl &control, EventChannel *events = nullptr,
                                RateCounter *rate = nullptr);

        const DownloadOptions &options() const noexcept { return options_; }

    private:
        http::Transport &transport_;
        DriveApi &api_;
        DownloadOptions options_;
    };

} // namespace pandrive
