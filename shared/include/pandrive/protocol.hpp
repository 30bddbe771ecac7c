/**
 * PanDrive - JSON schema of the remote drive REST payloads.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace pandrive::protocol
{

    // Seconds since the epoch from an ISO 8601 UTC timestamp such as
    // "2024-05-01T10:00:00.000Z". Throws std::invalid_argument on other input.
    std::int64_t iso8601_to_epoch(std::string_view text);
    std::string epoch_to_iso8601(std::int64_t epoch);

    enum class EntryType : std::uint8_t
    {
        File,
        Folder
    };

    std::string_view to_string(EntryType type) noexcept;
    std::optional<EntryType> entry_type_from_string(std::string_view value) noexcept;

    struct DownloadUrl
    {
        std::string url;
        std::optional<std::int64_t> expires_at{};
        std::uint64_t size{};
    };

    void to_json(nlohmann::json &json, const DownloadUrl &value);
    void from_json(const nlohmann::json &json, DownloadUrl &value);

    struct PartInfo
    {
        std::uint32_t part_number{};
        std::string upload_url{};
        std::optional<std::uint64_t> part_size{};
        std::optional<std::string> etag{};
    };

    void to_json(nlohmann::json &json, const PartInfo &part);
    void from_json(const nlohmann::json &json, PartInfo &part);

    // Body of createWithFolders. An empty pre_hash, content_hash or
    // proof_code is sent as an empty string, as the remote expects.
    struct CreateFileRequest
    {
        std::string drive_id;
        std::string parent_file_id;
        std::string name;
        std::uint64_t size{};
        std::uint32_t part_count{};
        std::string pre_hash{};
        std::string content_hash{};
        std::string proof_code{};
        std::optional<std::int64_t> local_modified_at{};
        std::string check_name_mode{"refuse"};
    };

    void to_json(nlohmann::json &json, const CreateFileRequest &request);
    void from_json(const nlohmann::json &json, CreateFileRequest &request);

    struct CreateFileResponse
    {
        std::string file_id;
        std::string upload_id{};
        bool rapid_upload{};
        bool exist{};
        // The remote echoes the pre-hash only when a file with the same
        // leading kilobyte is known.
        std::string pre_hash{};
        std::vector<PartInfo> parts{};
    };

    void to_json(nlohmann::json &json, const CreateFileResponse &response);
    void from_json(const nlohmann::json &json, CreateFileResponse &response);

    struct RemoteFile
    {
        std::string file_id;
        std::string parent_file_id{};
        std::string name;
        EntryType type{EntryType::File};
        std::uint64_t size{};
        std::optional<std::string> content_hash{};
        std::int64_t updated_at{};
        // Modification time of the uploaded local file, when it was recorded.
        std::optional<std::int64_t> local_modified_at{};
    };

    void to_json(nlohmann::json &json, const RemoteFile &file);
    void from_json(const nlohmann::json &json, RemoteFile &file);

    struct FileListPage
    {
        std::vector<RemoteFile> items;
        std::string next_marker{};
    };

    void to_json(nlohmann::json &json, const FileListPage &page);
    void from_json(const nlohmann::json &json, FileListPage &page);

    // Error body of a non-2xx response: {"code": "...", "message": "..."}.
    struct ApiError
    {
        std::string code;
        std::string message{};
    };

    void to_json(nlohmann::json &json, const ApiError &error);
    void from_json(const nlohmann::json &json, ApiError &error);

} // namespace pandrive::protocol
