/**
 * PanDrive - Entry points of the transfer engine.
 *
 * Every operation starts in the background and returns a handle: events
 * stream through the channel (closed after the final event), the result
 * arrives through the future, and the control pauses, resumes or cancels.
 */
#pragma once

#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "pandrive/downloader.hpp"
#include "pandrive/drive_api.hpp"
#include "pandrive/http.hpp"
#include "pandrive/sync_planner.hpp"
#include "pandrive/transfer.hpp"
#include "pandrive/uploader.hpp"

namespace pandrive
{

    struct TransferHandle
    {
        std::shared_ptr<EventChannel> events;
        std::future<TransferResult> result;
        std::shared_ptr<TransferControl> control;
    };

    struct BatchHandle
    {
        std::shared_ptr<EventChannel> events;
        std::future<BatchResult> result;
        std::shared_ptr<TransferControl> control;
    };

    struct SyncOptions
    {
        UploadOptions upload{};
    };

    struct SyncHandle
    {
        SyncPlan plan;
        std::shared_ptr<EventChannel> events;
        std::future<BatchResult> result;
        std::shared_ptr<TransferControl> control;
    };

    // The transport and API must outlive every handle the engine returns.
    class Engine
    {
    public:
        Engine(http::Transport &transport, DriveApi &api);

        TransferHandle download(const DownloadTask &task, const std::filesystem::path &local_dir,
                                DownloadOptions options = {});

        BatchHandle upload(std::vector<UploadTask> tasks, UploadOptions options = {});

        // Plans synchronously (the remote directory is created if needed),
        // then executes the plan in the background.
        SyncHandle sync(const std::filesystem::path &local_dir, const std::string &remote_dir,
                        SyncOptions options = {});

        const RateCounter &rate() const noexcept { return *rate_; }

    private:
        http::Transport &transport_;
        DriveApi &api_;
        std::shared_ptr<RateCounter> rate_;
    };

} // namespace pandrive
