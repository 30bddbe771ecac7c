#include "pandrive/engine.hpp"

#include <spdlog/spdlog.h>

namespace pandrive
{

    Engine::Engine(http::Transport &transport, DriveApi &api)
        : transport_(transport),
          api_(api),
          rate_(std::make_shared<RateCounter>())
    {
    }

    TransferHandle Engine::download(const DownloadTask &task, const std::filesystem::path &local_dir,
                                    DownloadOptions options)
    {
        TransferHandle handle;
        handle.events = std::make_shared<EventChannel>();
        handle.control = std::make_shared<TransferControl>();
        const auto destination = local_dir / (task.name.empty() ? task.source.file_id : task.name);
        handle.result = std::async(std::launch::async,
                                   [this, task, destination, options = std::move(options), events = handle.events,
                                    control = handle.control, rate = rate_]
                                   {
                                       Downloader downloader(transport_, api_, options);
                                       auto result = downloader.download(task, destination, *control, events.get(),
                                                                         rate.get());
                                       events->close();
                                       return result;
                                   });
        return handle;
    }

    BatchHandle Engine::upload(std::vector<UploadTask> tasks, UploadOptions options)
    {
        BatchHandle handle;
        handle.events = std::make_shared<EventChannel>();
        handle.control = std::make_shared<TransferControl>();
        handle.result = std::async(std::launch::async,
                                   [this, tasks = std::move(tasks), options = std::move(options),
                                    events = handle.events, control = handle.control, rate = rate_]
                                   {
                                       Uploader uploader(transport_, api_, options);
                                       auto result = uploader.upload_batch(tasks, *control, events.get(), rate.get());
                                       events->close();
                                       return result;
                                   });
        return handle;
    }

    SyncHandle Engine::sync(const std::filesystem::path &local_dir, const std::string &remote_dir,
                            SyncOptions options)
    {
        api_.ensure_directory(remote_dir);
        const auto local = scan_local(local_dir);
        const auto remote = api_.list_tree(remote_dir);

        SyncHandle handle;
        handle.plan = plan_sync(local, remote, options.upload.cipher);
        spdlog::info("Sync plan for {} -> {}: {} items", local_dir.string(), remote_dir, handle.plan.size());
        handle.events = std::make_shared<EventChannel>();
        handle.control = std::make_shared<TransferControl>();

        auto upload_options = std::move(options.upload);
        upload_options.ignore_existing = false;
        upload_options.overwrite = true;
        handle.result = std::async(std::launch::async,
                                   [this, plan = handle.plan, remote_dir, upload_options = std::move(upload_options),
                                    events = handle.events, control = handle.control, rate = rate_]
                                   {
                                       Uploader uploader(transport_, api_, upload_options);
                                       auto result = run_sync(plan, remote_dir, uploader, api_, *control, events.get(),
                                                              rate.get());
                                       events->close();
                                       return result;
                                   });
        return handle;
    }

} // namespace pandrive
