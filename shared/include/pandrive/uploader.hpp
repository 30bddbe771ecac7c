/**
 * PanDrive - Sequential part upload of local files, optionally encrypted.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "pandrive/chunk_plan.hpp"
#include "pandrive/cipher.hpp"
#include "pandrive/drive_api.hpp"
#include "pandrive/http.hpp"
#include "pandrive/transfer.hpp"

namespace pandrive
{

    struct UploadOptions
    {
        std::uint32_t max_workers{4};
        std::uint64_t part_size{kDefaultPartSize};
        cipher::CipherKind cipher{cipher::CipherKind::None};
        std::string password{};
        bool ignore_existing{false};
        bool rapid_upload{true};
        // Replace an existing remote file instead of refusing the name.
        bool overwrite{false};
        // Key of the rapid upload proof code.
        std::string access_token{};
        RetryPolicy retry{};
    };

    struct UploadTask
    {
        std::filesystem::path local_path;
        std::string remote_path;
        std::string task_id{};
    };

    class Uploader
    {
    public:
        Uploader(http::Transport &transport, DriveApi &api, UploadOptions options);

        // Failures come back as a Failed result holding an UploadError.
        TransferResult upload(const UploadTask &task, TransferControl &control, EventChannel *events = nullptr,
                              RateCounter *rate = nullptr);

        // Files run in parallel on max_workers threads; results are in task
        // order and one file's failure never stops the others.
        BatchResult upload_batch(const std::vector<UploadTask> &tasks, TransferControl &control,
                                 EventChannel *events = nullptr, RateCounter *rate = nullptr);

        const UploadOptions &options() const noexcept { return options_; }

    private:
        struct Attempt;

        void upload_parts(Attempt &attempt);

        http::Transport &transport_;
        DriveApi &api_;
        UploadOptions options_;
    };

} // namespace pandrive
