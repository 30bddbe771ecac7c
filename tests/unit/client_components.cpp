#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "pandrive/client/config.hpp"
#include "pandrive/client/http_drive_api.hpp"
#include "pandrive/errors.hpp"

using namespace pandrive;
using namespace pandrive::client;

namespace
{

    // Answers every request through `handler` and keeps a copy of it.
    class ScriptedTransport : public http::Transport
    {
    public:
        using Handler = std::function<http::Response(const std::string &endpoint, const nlohmann::json &body)>;

        explicit ScriptedTransport(Handler handler)
            : handler_(std::move(handler))
        {
        }

        http::Response send(const http::Request &request) override
        {
            requests.push_back(request);
            const auto endpoint = request.url.substr(std::string("https://api.test/").size());
            return handler_(endpoint, nlohmann::json::parse(request.body));
        }

        http::Response stream(const http::Request &request, const ByteSink &) override
        {
            return send(request);
        }

        std::vector<http::Request> requests;

    private:
        Handler handler_;
    };

    http::Response json_response(int status, const nlohmann::json &body)
    {
        return http::Response{.status = status, .headers = {}, .body = body.dump()};
    }

    std::string header_of(const http::Request &request, const std::string &name)
    {
        for (const auto &[key, value] : request.headers)
        {
            if (key == name)
            {
                return value;
            }
        }
        return {};
    }

    SessionContext test_context()
    {
        return SessionContext{.api_base = "https://api.test/", .access_token = "tok", .drive_id = "drv"};
    }

    void test_parse_size()
    {
        assert(parse_size("4096") == 4096);
        assert(parse_size("2K") == 2048);
        assert(parse_size("50M") == 50ULL * 1024 * 1024);
        assert(parse_size("1g") == 1024ULL * 1024 * 1024);

        for (const auto *bad : {"", "M", "12X", "-5"})
        {
            bool caught = false;
            try
            {
                (void)parse_size(bad);
            }
            catch (const std::runtime_error &)
            {
                caught = true;
            }
            assert(caught);
        }
    }

    void test_config_json()
    {
        ClientConfig config;
        apply_config_json(config, nlohmann::json::parse(R"({
            "access_token": "from-file",
            "drive_id": "d-1",
            "concurrency": 7,
            "chunk_size": "8M",
            "part_size": 1048576,
            "cipher": "chacha20",
            "log": "/tmp/pandrive.log"
        })"));
        assert(config.access_token == "from-file");
        assert(config.drive_id == "d-1");
        assert(config.concurrency == 7);
        assert(config.chunk_size == 8ULL * 1024 * 1024);
        assert(config.part_size == 1048576);
        assert(config.cipher == cipher::CipherKind::ChaCha20);
        assert(config.log_path == std::filesystem::path("/tmp/pandrive.log"));
        assert(config.max_workers == 4);
        assert(config.api_base == "https://api.aliyundrive.com");

        bool caught = false;
        try
        {
            apply_config_json(config, nlohmann::json::array());
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    ClientConfig parse(std::vector<std::string> words)
    {
        words.insert(words.begin(), "pandrive");
        std::vector<char *> argv;
        for (auto &word : words)
        {
            argv.push_back(word.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    void test_parse_arguments()
    {
        const auto home = std::filesystem::temp_directory_path() / "pandrive_config_home";
        std::filesystem::remove_all(home);
        std::filesystem::create_directories(home);
        ::setenv("HOME", home.c_str(), 1);
        ::unsetenv("PANDRIVE_ACCESS_TOKEN");
        ::unsetenv("PANDRIVE_PASSWORD");
        ::setenv("PANDRIVE_DRIVE_ID", "env-drive", 1);

        const auto config_path = home / "custom.json";
        {
            std::ofstream out(config_path);
            out << R"({"access_token": "file-token", "drive_id": "file-drive", "max_retries": 9})";
        }

        const auto config = parse({"--config", config_path.string(), "--token", "flag-token", "--concurrency", "8",
                                   "-v", "download", "/a.bin", "--no-resume"});
        assert(config.access_token == "flag-token");
        assert(config.drive_id == "env-drive");
        assert(config.max_retries == 9);
        assert(config.concurrency == 8);
        assert(config.verbose);
        assert((config.command == std::vector<std::string>{"download", "/a.bin", "--no-resume"}));

        // Without --config the file under $HOME is picked up.
        std::filesystem::create_directories(home / ".pandrive");
        std::filesystem::copy_file(config_path, home / ".pandrive" / "config.json");
        const auto defaults = parse({});
        assert(defaults.access_token == "file-token");
        assert(defaults.command.empty());

        const auto encrypted = parse({"--cipher", "aes256cbc", "--password", "pw", "--part-size", "1M"});
        assert(encrypted.cipher == cipher::CipherKind::Aes256Cbc);
        assert(encrypted.password == std::optional<std::string>("pw"));
        assert(encrypted.part_size == 1024 * 1024);

        const std::vector<std::vector<std::string>> invalid{
            {"--bogus"},
            {"--cipher", "chacha20"},
            {"--cipher", "rot13", "--password", "pw"},
            {"--token"},
        };
        for (const auto &words : invalid)
        {
            bool caught = false;
            try
            {
                (void)parse(words);
            }
            catch (const std::runtime_error &)
            {
                caught = true;
            }
            assert(caught);
        }

        ::unsetenv("PANDRIVE_DRIVE_ID");
        std::filesystem::remove_all(home);
    }

    void test_normalize_remote()
    {
        assert(normalize_remote("a//b/") == "/a/b");
        assert(normalize_remote("/") == "/");
        assert(normalize_remote("/x/./y") == "/x/y");
    }

    void test_download_url_and_errors()
    {
        ScriptedTransport transport([](const std::string &endpoint, const nlohmann::json &body)
                                    {
            if (endpoint == "v2/file/get_download_url" && body.at("file_id") == "f1")
            {
                return json_response(200, {{"url", "https://dl.test/f1"},
                                           {"expiration", "2024-05-01T10:00:00.000Z"},
                                           {"size", 42}});
            }
            return json_response(403, {{"code", "AccessTokenInvalid"}, {"message", "token expired"}}); });
        HttpDriveApi api(transport, test_context());

        const auto url = api.get_download_url("f1");
        assert(url.url == "https://dl.test/f1");
        assert(url.size == 42);
        assert(url.expires_at == std::optional<std::int64_t>(1714557600));

        const auto &sent = transport.requests.front();
        assert(sent.method == "POST");
        assert(sent.url == "https://api.test/v2/file/get_download_url");
        assert(header_of(sent, "Authorization") == "Bearer tok");

        // Range reads against the download host carry its Referer.
        const auto download = api.download_headers();
        assert(download.size() == 1);
        assert(download.front().first == "Referer");
        assert(download.front().second == "https://www.aliyundrive.com/");
        assert(nlohmann::json::parse(sent.body).at("drive_id") == "drv");

        bool caught = false;
        try
        {
            (void)api.get_download_url("f2");
        }
        catch (const RemoteApiError &ex)
        {
            caught = ex.status() == 403 && ex.remote_code() == "AccessTokenInvalid";
        }
        assert(caught);
    }

    void test_create_upload_session()
    {
        std::vector<nlohmann::json> creates;
        ScriptedTransport transport([&](const std::string &endpoint, const nlohmann::json &body)
                                    {
            if (endpoint == "v2/file/get_by_path")
            {
                if (body.at("file_path") == "/docs")
                {
                    return json_response(200, {{"file_id", "d1"}, {"name", "docs"}, {"type", "folder"}});
                }
                return json_response(404, {{"code", "NotFound.File"}});
            }
            if (endpoint == "adrive/v2/file/createWithFolders")
            {
                creates.push_back(body);
                if (!body.at("pre_hash").get<std::string>().empty())
                {
                    return json_response(409, {{"code", "PreHashMatched"}, {"file_id", "f9"}, {"upload_id", "u9"}});
                }
                if (!body.at("content_hash").get<std::string>().empty())
                {
                    return json_response(200, {{"file_id", "f9"}, {"rapid_upload", true}});
                }
                return json_response(200, {{"file_id", "f9"},
                                           {"upload_id", "u9"},
                                           {"part_info_list", {{{"part_number", 1}, {"upload_url", "https://up.test/1"}},
                                                               {{"part_number", 2}, {"upload_url", "https://up.test/2"}}}}});
            }
            return json_response(400, {{"code", "Unexpected"}}); });
        HttpDriveApi api(transport, test_context());

        UploadSessionRequest request{.remote_path = "docs/a.bin", .size = 2048, .part_count = 2, .pre_hash = "ph"};
        const auto probe = api.create_upload_session(request);
        assert(probe.pre_hash_matched);
        assert(!probe.rapid_upload);
        assert(probe.remote_path == "/docs/a.bin");
        assert(creates.back().at("parent_file_id") == "d1");
        assert(creates.back().at("name") == "a.bin");
        assert(creates.back().at("check_name_mode") == "refuse");

        request.pre_hash.clear();
        request.content_hash = "ch";
        request.proof_code = "pc";
        request.overwrite = true;
        const auto rapid = api.create_upload_session(request);
        assert(rapid.rapid_upload);
        assert(creates.back().at("check_name_mode") == "overwrite");
        assert(creates.back().at("proof_code") == "pc");

        request.content_hash.clear();
        const auto regular = api.create_upload_session(request);
        assert(!regular.pre_hash_matched);
        assert(regular.upload_id == "u9");
        assert(regular.parts.size() == 2);
        assert(regular.parts[1].upload_url == "https://up.test/2");
    }

    void test_tree_listing_and_directories()
    {
        std::vector<std::string> created_folders;
        ScriptedTransport transport([&](const std::string &endpoint, const nlohmann::json &body)
                                    {
            if (endpoint == "v2/file/get_by_path")
            {
                if (body.at("file_path") == "/backup")
                {
                    return json_response(200, {{"file_id", "b"}, {"name", "backup"}, {"type", "folder"}});
                }
                if (body.at("file_path") == "/backup/x.txt")
                {
                    return json_response(200, {{"file_id", "x"}, {"name", "x.txt"}, {"type", "file"}, {"size", 3}});
                }
                return json_response(404, {{"code", "NotFound.File"}});
            }
            if (endpoint == "adrive/v3/file/list")
            {
                const auto parent = body.at("parent_file_id").get<std::string>();
                if (parent == "b" && !body.contains("marker"))
                {
                    return json_response(200, {{"items", {{{"file_id", "x"}, {"name", "x.txt"}, {"type", "file"}, {"size", 3},
                                                           {"local_modified_at", "1970-01-01T00:01:40.000Z"}},
                                                          {{"file_id", "s"}, {"name", "sub"}, {"type", "folder"}}}},
                                               {"next_marker", "page2"}});
                }
                if (parent == "b")
                {
                    assert(body.at("marker") == "page2");
                    return json_response(200, {{"items", {{{"file_id", "y"}, {"name", "y.txt"}, {"type", "file"}, {"size", 5},
                                                           {"updated_at", "1970-01-01T00:00:50.000Z"}}}},
                                               {"next_marker", ""}});
                }
                return json_response(200, {{"items", {{{"file_id", "z"}, {"name", "z.txt"}, {"type", "file"}, {"size", 7},
                                                       {"content_hash", "ZZ"}}}}});
            }
            if (endpoint == "adrive/v2/file/createWithFolders")
            {
                created_folders.push_back(body.at("name").get<std::string>() + "@" +
                                          body.at("parent_file_id").get<std::string>());
                return json_response(201, {{"file_id", "new-" + body.at("name").get<std::string>()}});
            }
            if (endpoint == "v2/recyclebin/trash")
            {
                return json_response(202, nlohmann::json::object());
            }
            return json_response(400, {{"code", "Unexpected"}}); });
        HttpDriveApi api(transport, test_context());

        const auto root = api.get_remote_tree_entry("/");
        assert(root && root->file_id == "root" && root->is_directory);
        assert(transport.requests.empty());
        assert(!api.get_remote_tree_entry("/nothing"));
        const auto file = api.get_remote_tree_entry("/backup/x.txt");
        assert(file && !file->is_directory && file->size == 3);

        const auto entries = api.list_tree("/backup/");
        assert(entries.size() == 3);
        assert(entries[0].path == "x.txt" && entries[0].mtime == 100);
        assert(entries[1].path == "y.txt" && entries[1].mtime == 50);
        assert(entries[2].path == "sub/z.txt" && entries[2].fingerprint == std::optional<std::string>("ZZ"));

        const auto existing = api.ensure_directory("/backup");
        assert(existing.file_id == "b");
        assert(created_folders.empty());

        const auto nested = api.ensure_directory("/new/deeper");
        assert(nested.file_id == "new-deeper");
        assert((created_folders == std::vector<std::string>{"new@root", "deeper@new-new"}));

        bool caught = false;
        try
        {
            (void)api.ensure_directory("/backup/x.txt");
        }
        catch (const Error &ex)
        {
            caught = ex.code() == ErrorCode::AlreadyExists;
        }
        assert(caught);

        api.remove("x");
        assert(transport.requests.back().url == "https://api.test/v2/recyclebin/trash");
    }

} // namespace

void run_client_component_tests()
{
    test_parse_size();
    test_config_json();
    test_parse_arguments();
    test_normalize_remote();
    test_download_url_and_errors();
    test_create_upload_session();
    test_tree_listing_and_directories();
}
