#include "pandrive/client/http_drive_api.hpp"

#include <algorithm>
#include <deque>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "pandrive/errors.hpp"

namespace pandrive::client
{

    namespace
    {

        constexpr auto kRootId = "root";
        constexpr int kListLimit = 200;
        // The download host rejects range requests without it (403).
        constexpr auto kDownloadReferer = "https://www.aliyundrive.com/";

        RemoteEntry to_entry(const protocol::RemoteFile &file, std::string path)
        {
            RemoteEntry entry;
            entry.file_id = file.file_id;
            entry.path = std::move(path);
            entry.size = file.size;
            entry.mtime = file.local_modified_at.value_or(file.updated_at);
            entry.fingerprint = file.content_hash;
            entry.is_directory = file.type == protocol::EntryType::Folder;
            return entry;
        }

        std::string parent_of(const std::string &path)
        {
            const auto slash = path.rfind('/');
            return slash == 0 || slash == std::string::npos ? "/" : path.substr(0, slash);
        }

        std::string name_of(const std::string &path)
        {
            const auto slash = path.rfind('/');
            return slash == std::string::npos ? path : path.substr(slash + 1);
        }

        nlohmann::json part_numbers(std::uint32_t count)
        {
            auto parts = nlohmann::json::array();
            for (std::uint32_t number = 1; number <= count; ++number)
            {
                parts.push_back({{"part_number", number}});
            }
            return parts;
        }

    } // namespace

    std::string normalize_remote(const std::string &path)
    {
        auto normal = std::filesystem::path("/" + path).lexically_normal().generic_string();
        while (normal.size() > 1 && normal.back() == '/')
        {
            normal.pop_back();
        }
        return normal;
    }

    HttpDriveApi::HttpDriveApi(http::Transport &transport, SessionContext context)
        : transport_(transport),
          context_(std::move(context))
    {
        while (!context_.api_base.empty() && context_.api_base.back() == '/')
        {
            context_.api_base.pop_back();
        }
    }

    http::Response HttpDriveApi::post(const std::string &endpoint, const nlohmann::json &body,
                                      std::initializer_list<int> accepted)
    {
        http::Request request;
        request.method = "POST";
        request.url = context_.api_base + "/" + endpoint;
        request.headers = {
            {"Authorization", "Bearer " + context_.access_token},
            {"Content-Type", "application/json"},
            {"Accept", "application/json"},
        };
        request.body = body.dump();
        auto response = transport_.send(request);
        spdlog::debug("POST {} -> {}", endpoint, response.status);
        if (response.ok() || std::find(accepted.begin(), accepted.end(), response.status) != accepted.end())
        {
            return response;
        }
        protocol::ApiError error;
        try
        {
            error = nlohmann::json::parse(response.body).get<protocol::ApiError>();
        }
        catch (const nlohmann::json::exception &)
        {
            error.message = response.body.substr(0, 200);
        }
        throw RemoteApiError(response.status, error.code,
                             endpoint + " failed with HTTP " + std::to_string(response.status) + " " + error.code +
                                 ": " + error.message);
    }

    protocol::DownloadUrl HttpDriveApi::get_download_url(const std::string &file_id)
    {
        const auto response = post("v2/file/get_download_url", {
                                                                   {"drive_id", context_.drive_id},
                                                                   {"file_id", file_id},
                                                               });
        return nlohmann::json::parse(response.body).get<protocol::DownloadUrl>();
    }

    http::Headers HttpDriveApi::download_headers() const
    {
        return {{"Referer", kDownloadReferer}};
    }

    UploadSession HttpDriveApi::create_upload_session(const UploadSessionRequest &request)
    {
        const auto remote_path = normalize_remote(request.remote_path);
        const auto parent = ensure_directory(parent_of(remote_path));

        protocol::CreateFileRequest create;
        create.drive_id = context_.drive_id;
        create.parent_file_id = parent.file_id;
        create.name = name_of(remote_path);
        create.size = request.size;
        create.part_count = request.part_count;
        create.pre_hash = request.pre_hash;
        create.content_hash = request.content_hash;
        create.proof_code = request.proof_code;
        create.local_modified_at = request.local_modified_at;
        create.check_name_mode = request.overwrite ? "overwrite" : "refuse";

        // A matching pre-hash is answered with 409 PreHashMatched.
        const auto response = post("adrive/v2/file/createWithFolders", create, {409});
        const auto body = nlohmann::json::parse(response.body);
        if (response.status == 409 && body.value("code", std::string{}) != "PreHashMatched")
        {
            throw RemoteApiError(409, body.value("code", std::string{}), body.value("message", std::string{}));
        }
        const auto created = body.get<protocol::CreateFileResponse>();

        UploadSession session;
        session.file_id = created.file_id;
        session.upload_id = created.upload_id;
        session.remote_path = remote_path;
        session.part_count = request.part_count;
        session.rapid_upload = created.rapid_upload;
        session.pre_hash_matched = response.status == 409 || !created.pre_hash.empty();
        session.parts = created.parts;
        return session;
    }

    std::vector<protocol::PartInfo> HttpDriveApi::refresh_upload_urls(const UploadSession &session)
    {
        const auto response = post("v2/file/get_upload_url", {
                                                                 {"drive_id", context_.drive_id},
                                                                 {"file_id", session.file_id},
                                                                 {"upload_id", session.upload_id},
                                                                 {"part_info_list", part_numbers(session.part_count)},
                                                             });
        return nlohmann::json::parse(response.body).value("part_info_list", std::vector<protocol::PartInfo>{});
    }

    std::vector<protocol::PartInfo> HttpDriveApi::list_uploaded_parts(const UploadSession &session)
    {
        const auto response = post("v2/file/list_uploaded_parts", {
                                                                      {"drive_id", context_.drive_id},
                                                                      {"file_id", session.file_id},
                                                                      {"upload_id", session.upload_id},
                                                                      {"part_number_marker", 0},
                                                                  });
        return nlohmann::json::parse(response.body).value("uploaded_parts", std::vector<protocol::PartInfo>{});
    }

    protocol::RemoteFile HttpDriveApi::complete_upload(const UploadSession &session)
    {
        const auto response = post("v2/file/complete", {
                                                           {"drive_id", context_.drive_id},
                                                           {"file_id", session.file_id},
                                                           {"upload_id", session.upload_id},
                                                       });
        return nlohmann::json::parse(response.body).get<protocol::RemoteFile>();
    }

    std::optional<protocol::RemoteFile> HttpDriveApi::file_by_path(const std::string &path)
    {
        const auto response = post("v2/file/get_by_path",
                                   {
                                       {"drive_id", context_.drive_id},
                                       {"file_path", path},
                                   },
                                   {404});
        if (response.status == 404)
        {
            return std::nullopt;
        }
        return nlohmann::json::parse(response.body).get<protocol::RemoteFile>();
    }

    std::optional<RemoteEntry> HttpDriveApi::get_remote_tree_entry(const std::string &path)
    {
        const auto normal = normalize_remote(path);
        if (normal == "/")
        {
            RemoteEntry root;
            root.file_id = kRootId;
            root.path = "/";
            root.is_directory = true;
            return root;
        }
        const auto file = file_by_path(normal);
        if (!file)
        {
            return std::nullopt;
        }
        return to_entry(*file, normal);
    }

    std::vector<protocol::RemoteFile> HttpDriveApi::list_children(const std::string &parent_file_id)
    {
        std::vector<protocol::RemoteFile> children;
        std::string marker;
        do
        {
            nlohmann::json body = {
                {"drive_id", context_.drive_id},
                {"parent_file_id", parent_file_id},
                {"limit", kListLimit},
                {"order_by", "name"},
                {"order_direction", "ASC"},
            };
            if (!marker.empty())
            {
                body["marker"] = marker;
            }
            const auto page = nlohmann::json::parse(post("adrive/v3/file/list", body).body).get<protocol::FileListPage>();
            children.insert(children.end(), page.items.begin(), page.items.end());
            marker = page.next_marker;
        } while (!marker.empty());
        return children;
    }

    std::vector<RemoteEntry> HttpDriveApi::list_tree(const std::string &remote_dir)
    {
        const auto root = get_remote_tree_entry(remote_dir);
        if (!root)
        {
            throw RemoteApiError(404, "NotFound.File", "Remote directory " + remote_dir + " does not exist");
        }
        if (!root->is_directory)
        {
            throw Error(ErrorCode::InvalidArgument, remote_dir + " is not a directory");
        }

        std::vector<RemoteEntry> entries;
        std::deque<std::pair<std::string, std::string>> pending{{root->file_id, ""}};
        while (!pending.empty())
        {
            const auto [folder_id, prefix] = pending.front();
            pending.pop_front();
            for (const auto &child : list_children(folder_id))
            {
                const auto relative = prefix.empty() ? child.name : prefix + "/" + child.name;
                if (child.type == protocol::EntryType::Folder)
                {
                    pending.emplace_back(child.file_id, relative);
                }
                else
                {
                    entries.push_back(to_entry(child, relative));
                }
            }
        }
        return entries;
    }

    RemoteEntry HttpDriveApi::ensure_directory(const std::string &path)
    {
        const auto normal = normalize_remote(path);
        if (auto existing = get_remote_tree_entry(normal))
        {
            if (!existing->is_directory)
            {
                throw Error(ErrorCode::AlreadyExists, normal + " exists and is not a directory");
            }
            return *existing;
        }

        const auto parent = ensure_directory(parent_of(normal));
        const auto response = post("adrive/v2/file/createWithFolders", {
                                                                            {"drive_id", context_.drive_id},
                                                                            {"parent_file_id", parent.file_id},
                                                                            {"name", name_of(normal)},
                                                                            {"type", "folder"},
                                                                            {"check_name_mode", "refuse"},
                                                                        });
        const auto body = nlohmann::json::parse(response.body);
        spdlog::info("Created remote directory {}", normal);

        RemoteEntry entry;
        entry.file_id = body.at("file_id").get<std::string>();
        entry.path = normal;
        entry.is_directory = true;
        return entry;
    }

    void HttpDriveApi::remove(const std::string &file_id)
    {
        post("v2/recyclebin/trash", {
                                        {"drive_id", context_.drive_id},
                                        {"file_id", file_id},
                                    });
    }

} // namespace pandrive::client
