#include "pandrive/sync_planner.hpp"

#include <algorithm>
#include <array>
#include <map>

#include <spdlog/spdlog.h>

#include "pandrive/encryption_header.hpp"
#include "pandrive/errors.hpp"

namespace pandrive
{

    namespace
    {

        struct SyncActionMapping
        {
            SyncAction action;
            std::string_view label;
        };

        constexpr std::array<SyncActionMapping, 2> kSyncActionMappings{{
            {SyncAction::Upload, "upload"},
            {SyncAction::DeleteRemote, "delete"},
        }};

        TransferResult delete_remote(const SyncItem &item, DriveApi &api, TransferControl &control,
                                     EventChannel *events)
        {
            ProgressReporter progress(item.relative_path, item.remote->path, 0, events, nullptr);
            if (control.cancelled())
            {
                progress.finish(TransferState::Paused);
                return progress.result(TransferState::Paused);
            }
            try
            {
                api.remove(item.remote->file_id);
                spdlog::info("Removed remote {}", item.remote->path);
                progress.finish(TransferState::Completed);
                return progress.result(TransferState::Completed);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Removing remote {} failed: {}", item.remote->path, ex.what());
                progress.finish(TransferState::Failed, ex.what());
                return progress.result(TransferState::Failed, std::current_exception());
            }
        }

    } // namespace

    std::string_view to_string(SyncAction action) noexcept
    {
        for (const auto &mapping : kSyncActionMappings)
        {
            if (mapping.action == action)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::vector<LocalEntry> scan_local(const std::filesystem::path &root)
    {
        if (!std::filesystem::is_directory(root))
        {
            throw Error(ErrorCode::NotFound, "Not a directory: " + root.string());
        }
        std::vector<LocalEntry> entries;
        for (auto it = std::filesystem::recursive_directory_iterator(root);
             it != std::filesystem::recursive_directory_iterator(); ++it)
        {
            if (!it->is_regular_file())
            {
                continue;
            }
            LocalEntry entry;
            entry.path = it->path();
            entry.relative_path = it->path().lexically_relative(root).generic_string();
            entry.size = it->file_size();
            entry.mtime = to_unix_time(it->last_write_time());
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    SyncPlan plan_sync(const std::vector<LocalEntry> &local, const std::vector<RemoteEntry> &remote,
                       cipher::CipherKind cipher)
    {
        std::map<std::string, const RemoteEntry *> remote_by_path;
        for (const auto &entry : remote)
        {
            if (!entry.is_directory)
            {
                remote_by_path.emplace(entry.path, &entry);
            }
        }

        SyncPlan plan;
        std::map<std::string, bool> seen;
        for (const auto &entry : local)
        {
            seen[entry.relative_path] = true;
            const auto found = remote_by_path.find(entry.relative_path);
            if (found == remote_by_path.end())
            {
                plan.push_back(SyncItem{SyncAction::Upload, entry.relative_path, entry, std::nullopt, "missing remotely"});
                continue;
            }
            const auto &counterpart = *found->second;
            const auto expected_size = cipher::encrypted_object_size(cipher, entry.size);
            if (counterpart.size != expected_size)
            {
                plan.push_back(SyncItem{SyncAction::Upload, entry.relative_path, entry, counterpart, "size differs"});
            }
            else if (counterpart.mtime != entry.mtime)
            {
                plan.push_back(SyncItem{SyncAction::Upload, entry.relative_path, entry, counterpart, "mtime differs"});
            }
        }
        for (const auto &[path, entry] : remote_by_path)
        {
            if (!seen.contains(path))
            {
                plan.push_back(SyncItem{SyncAction::DeleteRemote, path, std::nullopt, *entry, "missing locally"});
            }
        }

        std::sort(plan.begin(), plan.end(), [](const SyncItem &lhs, const SyncItem &rhs)
                  { return lhs.relative_path < rhs.relative_path; });
        return plan;
    }

    std::string join_remote(std::string_view directory, std::string_view relative)
    {
        std::string joined(directory);
        while (!joined.empty() && joined.back() == '/')
        {
            joined.pop_back();
        }
        joined += '/';
        joined += relative;
        return joined;
    }

    BatchResult run_sync(const SyncPlan &plan, const std::string &remote_root, Uploader &uploader, DriveApi &api,
                         TransferControl &control, EventChannel *events, RateCounter *rate)
    {
        std::vector<UploadTask> uploads;
        std::vector<std::size_t> upload_slots;
        BatchResult result;
        result.files.resize(plan.size());

        for (std::size_t index = 0; index < plan.size(); ++index)
        {
            const auto &item = plan[index];
            if (item.action == SyncAction::Upload)
            {
                uploads.push_back(UploadTask{item.local->path, join_remote(remote_root, item.relative_path),
                                             item.relative_path});
                upload_slots.push_back(index);
            }
        }

        auto uploaded = uploader.upload_batch(uploads, control, events, rate);
        for (std::size_t slot = 0; slot < upload_slots.size(); ++slot)
        {
            result.files[upload_slots[slot]] = std::move(uploaded.files[slot]);
        }

        for (std::size_t index = 0; index < plan.size(); ++index)
        {
            if (plan[index].action == SyncAction::DeleteRemote)
            {
                result.files[index] = delete_remote(plan[index], api, control, events);
            }
        }
        spdlog::info("Sync to {}: {} of {} items succeeded", remote_root,
                     result.count(TransferState::Completed) + result.count(TransferState::Skipped), plan.size());
        return result;
    }

} // namespace pandrive
