/**
 * PanDrive - Metadata API consumed by the transfer engine.
 *
 * Implementations talk to the remote drive; the engine only relies on the
 * operations below and never on how credentials are obtained.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pandrive/http.hpp"
#include "pandrive/protocol.hpp"

namespace pandrive
{

    // A remote object addressed for download. download_url is a pre-signed,
    // time-limited URL; an empty one is fetched before the first request.
    struct RemoteHandle
    {
        std::string file_id;
        std::string drive_id{};
        std::uint64_t size{};
        std::string download_url{};
        std::optional<std::int64_t> expires_at{};
        std::optional<std::string> content_hash{};
        // Sent with every range request, e.g. a Referer the download host checks.
        http::Headers request_headers{};
    };

    struct RemoteEntry
    {
        std::string file_id;
        // Absolute for get_remote_tree_entry, relative to the listed
        // directory for list_tree.
        std::string path;
        std::uint64_t size{};
        std::int64_t mtime{};
        std::optional<std::string> fingerprint{};
        bool is_directory{};
    };

    RemoteHandle handle_for(const RemoteEntry &entry);

    struct UploadSessionRequest
    {
        std::string remote_path;
        std::uint64_t size{};
        std::uint32_t part_count{};
        std::string pre_hash{};
        std::string content_hash{};
        std::string proof_code{};
        std::optional<std::int64_t> local_modified_at{};
        bool overwrite{};
    };

    struct UploadSession
    {
        std::string file_id;
        std::string upload_id{};
        std::string remote_path{};
        std::uint32_t part_count{};
        bool rapid_upload{};
        bool pre_hash_matched{};
        std::vector<protocol::PartInfo> parts{};
    };

    class DriveApi
    {
    public:
        virtual ~DriveApi() = default;

        virtual protocol::DownloadUrl get_download_url(const std::string &file_id) = 0;

        // Headers the download host expects on range requests.
        virtual http::Headers download_headers() const { return {}; }

        virtual UploadSession create_upload_session(const UploadSessionRequest &request) = 0;

        // Fresh URLs for every part of an open session.
        virtual std::vector<protocol::PartInfo> refresh_upload_urls(const UploadSession &session) = 0;

        // Parts the remote already acknowledged. Throws if the session
        // cannot be resumed.
        virtual std::vector<protocol::PartInfo> list_uploaded_parts(const UploadSession &session) = 0;

        virtual protocol::RemoteFile complete_upload(const UploadSession &session) = 0;

        virtual std::optional<RemoteEntry> get_remote_tree_entry(const std::string &path) = 0;

        // Every file below remote_dir, recursively; directories are omitted.
        virtual std::vector<RemoteEntry> list_tree(const std::string &remote_dir) = 0;

        virtual RemoteEntry ensure_directory(const std::string &path) = 0;

        virtual void remove(const std::string &file_id) = 0;
    };

} // namespace pandrive
