#include "pandrive/client/config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

namespace pandrive::client
{

    namespace
    {

        cipher::CipherKind parse_cipher(const std::string &value)
        {
            const auto kind = cipher::cipher_kind_from_string(value);
            if (!kind)
            {
                throw std::runtime_error("Unknown cipher: " + value + " (expected none, simple, chacha20 or aes256cbc)");
            }
            return *kind;
        }

        std::uint64_t size_value(const nlohmann::json &value)
        {
            if (value.is_string())
            {
                return parse_size(value.get<std::string>());
            }
            return value.get<std::uint64_t>();
        }

    } // namespace

    std::uint64_t parse_size(std::string_view text)
    {
        if (text.empty())
        {
            throw std::runtime_error("Empty size");
        }
        std::uint64_t multiplier = 1;
        auto digits = text;
        switch (std::toupper(static_cast<unsigned char>(text.back())))
        {
        case 'K':
            multiplier = 1024ULL;
            break;
        case 'M':
            multiplier = 1024ULL * 1024;
            break;
        case 'G':
            multiplier = 1024ULL * 1024 * 1024;
            break;
        default:
            break;
        }
        if (multiplier != 1)
        {
            digits.remove_suffix(1);
        }
        if (digits.empty() || digits.find_first_not_of("0123456789") != std::string_view::npos)
        {
            throw std::runtime_error("Invalid size: " + std::string(text));
        }
        return std::stoull(std::string(digits)) * multiplier;
    }

    std::filesystem::path default_config_path()
    {
        const char *home = std::getenv("HOME");
        const std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::current_path();
        return base / ".pandrive" / "config.json";
    }

    void apply_config_json(ClientConfig &config, const nlohmann::json &json)
    {
        if (!json.is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object");
        }
        config.api_base = json.value("api_base", config.api_base);
        config.access_token = json.value("access_token", config.access_token);
        config.drive_id = json.value("drive_id", config.drive_id);
        config.concurrency = json.value("concurrency", config.concurrency);
        config.max_workers = json.value("max_workers", config.max_workers);
        config.max_retries = json.value("max_retries", config.max_retries);
        config.connect_timeout_ms = json.value("connect_timeout_ms", config.connect_timeout_ms);
        config.idle_timeout_ms = json.value("idle_timeout_ms", config.idle_timeout_ms);
        if (auto it = json.find("chunk_size"); it != json.end())
        {
            config.chunk_size = size_value(*it);
        }
        if (auto it = json.find("part_size"); it != json.end())
        {
            config.part_size = size_value(*it);
        }
        if (auto it = json.find("cipher"); it != json.end())
        {
            config.cipher = parse_cipher(it->get<std::string>());
        }
        if (auto it = json.find("log"); it != json.end() && it->is_string())
        {
            config.log_path = std::filesystem::path(it->get<std::string>());
        }
    }

    void apply_environment(ClientConfig &config)
    {
        if (const char *token = std::getenv("PANDRIVE_ACCESS_TOKEN"); token && *token)
        {
            config.access_token = token;
        }
        if (const char *drive = std::getenv("PANDRIVE_DRIVE_ID"); drive && *drive)
        {
            config.drive_id = drive;
        }
        if (const char *password = std::getenv("PANDRIVE_PASSWORD"); password && *password)
        {
            config.password = password;
        }
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        ClientConfig config;

        std::optional<std::filesystem::path> config_path;
        for (int index = 1; index + 1 < argc; ++index)
        {
            if (std::string(argv[index]) == "--config")
            {
                config_path = std::filesystem::path(argv[index + 1]);
            }
        }
        if (!config_path && std::filesystem::is_regular_file(default_config_path()))
        {
            config_path = default_config_path();
        }
        if (config_path)
        {
            std::ifstream input(*config_path);
            if (!input)
            {
                throw std::runtime_error("Cannot read config file " + config_path->string());
            }
            try
            {
                apply_config_json(config, nlohmann::json::parse(input));
            }
            catch (const nlohmann::json::exception &ex)
            {
                throw std::runtime_error("Invalid config file " + config_path->string() + ": " + ex.what());
            }
        }
        apply_environment(config);

        int index = 1;
        auto value_of = [&](const std::string &flag) -> std::string
        {
            if (index >= argc)
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return argv[index++];
        };

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                value_of(arg);
            }
            else if (arg == "--api-base")
            {
                config.api_base = value_of(arg);
            }
            else if (arg == "--token")
            {
                config.access_token = value_of(arg);
            }
            else if (arg == "--drive-id")
            {
                config.drive_id = value_of(arg);
            }
            else if (arg == "--concurrency")
            {
                config.concurrency = static_cast<std::uint32_t>(std::stoul(value_of(arg)));
            }
            else if (arg == "--chunk-size")
            {
                config.chunk_size = parse_size(value_of(arg));
            }
            else if (arg == "--part-size")
            {
                config.part_size = parse_size(value_of(arg));
            }
            else if (arg == "--workers")
            {
                config.max_workers = static_cast<std::uint32_t>(std::stoul(value_of(arg)));
            }
            else if (arg == "--retries")
            {
                config.max_retries = static_cast<std::uint32_t>(std::stoul(value_of(arg)));
            }
            else if (arg == "--cipher")
            {
                config.cipher = parse_cipher(value_of(arg));
            }
            else if (arg == "--password")
            {
                config.password = value_of(arg);
            }
            else if (arg == "--log")
            {
                config.log_path = std::filesystem::path(value_of(arg));
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.verbose = true;
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.command.assign(argv + index - 1, argv + argc);
                break;
            }
        }

        if (config.cipher != cipher::CipherKind::None && !config.password)
        {
            throw std::runtime_error("--cipher " + std::string(cipher::to_string(config.cipher)) +
                                     " requires a password (--password or PANDRIVE_PASSWORD)");
        }
        return config;
    }

} // namespace pandrive::client
