/**
 * PanDrive - One-way sync of a local directory into a remote directory.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pandrive/cipher.hpp"
#include "pandrive/drive_api.hpp"
#include "pandrive/transfer.hpp"
#include "pandrive/uploader.hpp"

namespace pandrive
{

    struct LocalEntry
    {
        // Relative to the synced root, '/' separated.
        std::string relative_path;
        std::filesystem::path path;
        std::uint64_t size{};
        std::int64_t mtime{};
    };

    enum class SyncAction : std::uint8_t
    {
        Upload,
        DeleteRemote
    };

    std::string_view to_string(SyncAction action) noexcept;

    struct SyncItem
    {
        SyncAction action{SyncAction::Upload};
        std::string relative_path;
        std::optional<LocalEntry> local{};
        std::optional<RemoteEntry> remote{};
        std::string reason{};
    };

    using SyncPlan = std::vector<SyncItem>;

    // Regular files below `root`, depth first.
    std::vector<LocalEntry> scan_local(const std::filesystem::path &root);

    // Upload for a local file that is missing remotely or differs in mtime
    // (seconds) or size; delete for a remote file without a local
    // counterpart. Sizes are compared after encryption. Sorted by path.
    SyncPlan plan_sync(const std::vector<LocalEntry> &local, const std::vector<RemoteEntry> &remote,
                       cipher::CipherKind cipher);

    std::string join_remote(std::string_view directory, std::string_view relative);

    // Executes every item independently: uploads through the batch uploader,
    // deletes through DriveApi::remove. Results follow the plan order.
    BatchResult run_sync(const SyncPlan &plan, const std::string &remote_root, Uploader &uploader, DriveApi &api,
                         TransferControl &control, EventChannel *events = nullptr, RateCounter *rate = nullptr);

} // namespace pandrive
