#include "pandrive/protocol.hpp"

#include <array>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace pandrive::protocol
{

    namespace
    {

        struct EntryTypeMapping
        {
            EntryType type;
            std::string_view label;
        };

        constexpr std::array<EntryTypeMapping, 2> kEntryTypeMappings{{
            {EntryType::File, "file"},
            {EntryType::Folder, "folder"},
        }};

        std::optional<std::int64_t> optional_time(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && it->is_string() && !it->get<std::string>().empty())
            {
                return iso8601_to_epoch(it->get<std::string>());
            }
            return std::nullopt;
        }

        // Days since 1970-01-01 of a proleptic Gregorian civil date.
        std::int64_t days_from_civil(std::int64_t year, unsigned month, unsigned day)
        {
            year -= month <= 2 ? 1 : 0;
            const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
            const auto yoe = static_cast<unsigned>(year - era * 400);
            const unsigned doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
            const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
            return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
        }

    } // namespace

    std::int64_t iso8601_to_epoch(std::string_view text)
    {
        int year = 0;
        unsigned month = 0;
        unsigned day = 0;
        unsigned hour = 0;
        unsigned minute = 0;
        unsigned second = 0;
        const std::string copy(text);
        if (std::sscanf(copy.c_str(), "%4d-%2u-%2uT%2u:%2u:%2u", &year, &month, &day, &hour, &minute, &second) != 6 ||
            month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
        {
            throw std::invalid_argument("Invalid ISO 8601 timestamp: " + copy);
        }
        return days_from_civil(year, month, day) * 86400 + hour * 3600 + minute * 60 + second;
    }

    std::string epoch_to_iso8601(std::int64_t epoch)
    {
        const auto seconds = static_cast<std::time_t>(epoch);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        std::array<char, 32> buffer{};
        std::strftime(buffer.data(), buffer.size(), "%Y-%m-%dT%H:%M:%S.000Z", &utc);
        return buffer.data();
    }

    std::string_view to_string(EntryType type) noexcept
    {
        for (const auto &mapping : kEntryTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<EntryType> entry_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kEntryTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const DownloadUrl &value)
    {
        json = {
            {"url", value.url},
            {"size", value.size},
        };
        if (value.expires_at)
        {
            json["expiration"] = epoch_to_iso8601(*value.expires_at);
        }
    }

    void from_json(const nlohmann::json &json, DownloadUrl &value)
    {
        value.url = json.at("url").get<std::string>();
        value.size = json.value("size", 0ULL);
        value.expires_at = optional_time(json, "expiration");
    }

    void to_json(nlohmann::json &json, const PartInfo &part)
    {
        json = {
            {"part_number", part.part_number},
        };
        if (!part.upload_url.empty())
        {
            json["upload_url"] = part.upload_url;
        }
        if (part.part_size)
        {
            json["part_size"] = *part.part_size;
        }
        if (part.etag)
        {
            json["etag"] = *part.etag;
        }
    }

    void from_json(const nlohmann::json &json, PartInfo &part)
    {
        part.part_number = json.at("part_number").get<std::uint32_t>();
        part.upload_url = json.value("upload_url", std::string{});
        if (auto it = json.find("part_size"); it != json.end() && it->is_number())
        {
            part.part_size = it->get<std::uint64_t>();
        }
        else
        {
            part.part_size.reset();
        }
        if (auto it = json.find("etag"); it != json.end() && it->is_string())
        {
            part.etag = it->get<std::string>();
        }
        else
        {
            part.etag.reset();
        }
    }

    void to_json(nlohmann::json &json, const CreateFileRequest &request)
    {
        auto parts = nlohmann::json::array();
        for (std::uint32_t number = 1; number <= request.part_count; ++number)
        {
            parts.push_back({{"part_number", number}});
        }
        json = {
            {"drive_id", request.drive_id},
            {"parent_file_id", request.parent_file_id},
            {"name", request.name},
            {"type", "file"},
            {"check_name_mode", request.check_name_mode},
            {"size", request.size},
            {"part_info_list", parts},
            {"pre_hash", request.pre_hash},
            {"content_hash", request.content_hash},
            {"content_hash_name", "sha1"},
            {"proof_code", request.proof_code},
            {"proof_version", "v1"},
        };
        if (request.local_modified_at)
        {
            json["local_modified_at"] = epoch_to_iso8601(*request.local_modified_at);
        }
    }

    void from_json(const nlohmann::json &json, CreateFileRequest &request)
    {
        request.drive_id = json.at("drive_id").get<std::string>();
        request.parent_file_id = json.at("parent_file_id").get<std::string>();
        request.name = json.at("name").get<std::string>();
        request.size = json.value("size", 0ULL);
        request.part_count = static_cast<std::uint32_t>(json.value("part_info_list", nlohmann::json::array()).size());
        request.pre_hash = json.value("pre_hash", std::string{});
        request.content_hash = json.value("content_hash", std::string{});
        request.proof_code = json.value("proof_code", std::string{});
        request.check_name_mode = json.value("check_name_mode", std::string{"refuse"});
        request.local_modified_at = optional_time(json, "local_modified_at");
    }

    void to_json(nlohmann::json &json, const CreateFileResponse &response)
    {
        json = {
            {"file_id", response.file_id},
            {"upload_id", response.upload_id},
            {"rapid_upload", response.rapid_upload},
            {"exist", response.exist},
            {"part_info_list", response.parts},
        };
        if (!response.pre_hash.empty())
        {
            json["pre_hash"] = response.pre_hash;
        }
    }

    void from_json(const nlohmann::json &json, CreateFileResponse &response)
    {
        response.file_id = json.value("file_id", std::string{});
        response.upload_id = json.value("upload_id", std::string{});
        response.rapid_upload = json.value("rapid_upload", false);
        response.exist = json.value("exist", false);
        response.pre_hash = json.value("pre_hash", std::string{});
        response.parts = json.value("part_info_list", std::vector<PartInfo>{});
    }

    void to_json(nlohmann::json &json, const RemoteFile &file)
    {
        json = {
            {"file_id", file.file_id},
            {"parent_file_id", file.parent_file_id},
            {"name", file.name},
            {"type", to_string(file.type)},
            {"size", file.size},
            {"updated_at", epoch_to_iso8601(file.updated_at)},
        };
        if (file.content_hash)
        {
            json["content_hash"] = *file.content_hash;
        }
        if (file.local_modified_at)
        {
            json["local_modified_at"] = epoch_to_iso8601(*file.local_modified_at);
        }
    }

    void from_json(const nlohmann::json &json, RemoteFile &file)
    {
        file.file_id = json.at("file_id").get<std::string>();
        file.parent_file_id = json.value("parent_file_id", std::string{});
        file.name = json.value("name", std::string{});
        const auto type_label = json.value("type", std::string{"file"});
        const auto type = entry_type_from_string(type_label);
        if (!type)
        {
            throw std::runtime_error("Unknown entry type: " + type_label);
        }
        file.type = *type;
        file.size = json.value("size", 0ULL);
        if (auto it = json.find("content_hash"); it != json.end() && it->is_string())
        {
            file.content_hash = it->get<std::string>();
        }
        else
        {
            file.content_hash.reset();
        }
        file.updated_at = optional_time(json, "updated_at").value_or(0);
        file.local_modified_at = optional_time(json, "local_modified_at");
    }

    void to_json(nlohmann::json &json, const FileListPage &page)
    {
        json = {
            {"items", page.items},
            {"next_marker", page.next_marker},
        };
    }

    void from_json(const nlohmann::json &json, FileListPage &page)
    {
        page.items = json.value("items", std::vector<RemoteFile>{});
        page.next_marker = json.value("next_marker", std::string{});
    }

    void to_json(nlohmann::json &json, const ApiError &error)
    {
        json = {
            {"code", error.code},
            {"message", error.message},
        };
    }

    void from_json(const nlohmann::json &json, ApiError &error)
    {
        error.code = json.value("code", std::string{});
        error.message = json.value("message", std::string{});
    }

} // namespace pandrive::protocol
