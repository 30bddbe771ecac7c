#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pandrive/drive_api.hpp"
#include "pandrive/http.hpp"

namespace pandrive::client
{

    // Credentials of one drive account, handed explicitly to every binding.
    struct SessionContext
    {
        std::string api_base;
        std::string access_token;
        std::string drive_id;
    };

    // DriveApi over the Aliyun-style JSON REST endpoints.
    class HttpDriveApi : public DriveApi
    {
    public:
        HttpDriveApi(http::Transport &transport, SessionContext context);

        protocol::DownloadUrl get_download_url(const std::string &file_id) override;
        http::Headers download_headers() const override;
        UploadSession create_upload_session(const UploadSessionRequest &request) override;
        std::vector<protocol::PartInfo> refresh_upload_urls(const UploadSession &session) override;
        std::vector<protocol::PartInfo> list_uploaded_parts(const UploadSession &session) override;
        protocol::RemoteFile complete_upload(const UploadSession &session) override;
        std::optional<RemoteEntry> get_remote_tree_entry(const std::string &path) override;
        std::vector<RemoteEntry> list_tree(const std::string &remote_dir) override;
        RemoteEntry ensure_directory(const std::string &path) override;
        void remove(const std::string &file_id) override;

        const SessionContext &context() const noexcept { return context_; }

    private:
        // POSTs `body` to `endpoint`; a non-2xx answer throws RemoteApiError
        // unless its status is listed in `accepted`.
        http::Response post(const std::string &endpoint, const nlohmann::json &body,
                            std::initializer_list<int> accepted = {});
        std::optional<protocol::RemoteFile> file_by_path(const std::string &path);
        std::vector<protocol::RemoteFile> list_children(const std::string &parent_file_id);

        http::Transport &transport_;
        SessionContext context_;
    };

    std::string normalize_remote(const std::string &path);

} // namespace pandrive::client
