#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "pandrive/client/config.hpp"
#include "pandrive/client/http_drive_api.hpp"
#include "pandrive/client/logger.hpp"
#include "pandrive/engine.hpp"
#include "pandrive/http.hpp"

namespace pandrive::client
{

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, Logger logger);

        // One-shot when the configuration carries a command, interactive
        // otherwise. Returns the process exit code.
        int run();

    private:
        void interactive_shell();
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_download(const std::vector<std::string> &args);
        bool handle_upload(const std::vector<std::string> &args);
        bool handle_sync(const std::vector<std::string> &args);

        DownloadOptions download_options() const;
        UploadOptions upload_options() const;
        RetryPolicy retry_policy() const;

        // Prints progress until the channel closes.
        void watch(EventChannel &events);
        void report(const TransferResult &result);

        void print_help() const;

        ClientConfig config_;
        Logger logger_;
        std::unique_ptr<http::AsioHttpTransport> transport_;
        std::unique_ptr<HttpDriveApi> api_;
        std::unique_ptr<Engine> engine_;
        bool last_command_failed_{false};
    };

} // namespace pandrive::client
