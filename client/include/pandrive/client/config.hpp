#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "pandrive/chunk_plan.hpp"
#include "pandrive/cipher.hpp"
#include "pandrive/downloader.hpp"

namespace pandrive::client
{

    struct ClientConfig
    {
        std::string api_base{"https://api.aliyundrive.com"};
        std::string access_token;
        std::string drive_id;
        std::uint32_t concurrency{kDefaultConcurrency};
        std::uint64_t chunk_size{kDefaultChunkSize};
        std::uint64_t part_size{kDefaultPartSize};
        std::uint32_t max_workers{4};
        std::uint32_t max_retries{3};
        std::uint64_t connect_timeout_ms{10000};
        std::uint64_t idle_timeout_ms{30000};
        cipher::CipherKind cipher{cipher::CipherKind::None};
        std::optional<std::string> password;
        std::optional<std::filesystem::path> log_path;
        bool verbose{false};
        // Command words after the options; empty means interactive mode.
        std::vector<std::string> command;
    };

    // "50M", "1g", "4096": K, M and G are binary multiples.
    std::uint64_t parse_size(std::string_view text);

    std::filesystem::path default_config_path();

    // Keys absent from `json` keep their current value.
    void apply_config_json(ClientConfig &config, const nlohmann::json &json);

    // PANDRIVE_ACCESS_TOKEN, PANDRIVE_DRIVE_ID and PANDRIVE_PASSWORD.
    void apply_environment(ClientConfig &config);

    // Precedence: defaults, config file (--config or the default path if it
    // exists), environment, command-line flags.
    ClientConfig parse_arguments(int argc, char *argv[]);

} // namespace pandrive::client
