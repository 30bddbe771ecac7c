#include "pandrive/client/session.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

#include "pandrive/errors.hpp"
#include "pandrive/version.hpp"

namespace pandrive::client
{

    namespace
    {

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        std::vector<std::string> split_tokens(const std::string &input)
        {
            std::vector<std::string> tokens;
            std::istringstream iss(input);
            std::string token;
            while (iss >> token)
            {
                tokens.push_back(token);
            }
            return tokens;
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

    } // namespace

    ClientSession::ClientSession(ClientConfig config, Logger logger)
        : config_(std::move(config)),
          logger_(std::move(logger))
    {
        http::Timeouts timeouts;
        timeouts.connect = std::chrono::milliseconds(config_.connect_timeout_ms);
        timeouts.idle = std::chrono::milliseconds(config_.idle_timeout_ms);
        transport_ = std::make_unique<http::AsioHttpTransport>(timeouts, "pandrive/" + std::string(kVersion));
        api_ = std::make_unique<HttpDriveApi>(*transport_, SessionContext{
                                                               .api_base = config_.api_base,
                                                               .access_token = config_.access_token,
                                                               .drive_id = config_.drive_id,
                                                           });
        engine_ = std::make_unique<Engine>(*transport_, *api_);
    }

    int ClientSession::run()
    {
        try
        {
            if (config_.access_token.empty() || config_.drive_id.empty())
            {
                throw std::runtime_error("Access token and drive id are required (config file, environment or flags)");
            }
            if (!config_.command.empty())
            {
                const auto command = to_upper(config_.command.front());
                const std::vector<std::string> args(config_.command.begin() + 1, config_.command.end());
                logger_.log("cmd", command);
                if (!dispatch(command, args))
                {
                    std::cout << "ERROR: unsupported_command" << std::endl;
                    return 2;
                }
                return last_command_failed_ ? 1 : 0;
            }
            interactive_shell();
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger_.log("error", "fatal: ", ex.what());
            return 1;
        }
        return 0;
    }

    void ClientSession::interactive_shell()
    {
        while (true)
        {
            std::cout << "pandrive> " << std::flush;
            std::string line;
            if (!std::getline(std::cin, line))
            {
                std::cout << std::endl;
                break;
            }
            line = trim(line);
            if (line.empty())
            {
                continue;
            }
            logger_.log("cmd", line);

            const auto tokens = split_tokens(line);
            const auto command = to_upper(tokens[0]);
            const std::vector<std::string> args(tokens.begin() + 1, tokens.end());

            if (command == "EXIT" || command == "QUIT")
            {
                std::cout << "OK" << std::endl;
                break;
            }

            try
            {
                if (!dispatch(command, args))
                {
                    std::cout << "ERROR: unsupported_command" << std::endl;
                }
            }
            catch (const Error &ex)
            {
                std::cout << "ERROR: " << to_string(ex.code()) << std::endl;
                std::cout << ex.what() << std::endl;
                logger_.log("error", "command failed: ", ex.what());
            }
            catch (const std::exception &ex)
            {
                std::cout << "ERROR: internal_error" << std::endl;
                std::cout << ex.what() << std::endl;
                logger_.log("error", "command failed: ", ex.what());
            }
        }
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "HELP")
        {
            print_help();
            return true;
        }
        if (command == "DOWNLOAD")
        {
            return handle_download(args);
        }
        if (command == "UPLOAD")
        {
            return handle_upload(args);
        }
        if (command == "SYNC")
        {
            return handle_sync(args);
        }
        return false;
    }

    RetryPolicy ClientSession::retry_policy() const
    {
        RetryPolicy retry;
        retry.max_retries = config_.max_retries;
        return retry;
    }

    DownloadOptions ClientSession::download_options() const
    {
        DownloadOptions options;
        options.concurrency = config_.concurrency;
        options.chunk_size = config_.chunk_size;
        options.password = config_.password;
        options.retry = retry_policy();
        return options;
    }

    UploadOptions ClientSession::upload_options() const
    {
        UploadOptions options;
        options.max_workers = config_.max_workers;
        options.part_size = config_.part_size;
        options.cipher = config_.cipher;
        options.password = config_.password.value_or("");
        options.access_token = config_.access_token;
        options.retry = retry_policy();
        return options;
    }

    void ClientSession::print_help() const
    {
        std::cout << "pandrive " << kVersion << std::endl;
        std::cout << "Available commands:" << std::endl;
        std::cout << "  HELP                                  Show this help" << std::endl;
        std::cout << "  EXIT                                  Leave the shell" << std::endl;
        std::cout << "  DOWNLOAD <remote> [localdir]          Download a file (resumes a partial one)" << std::endl;
        std::cout << "           [--no-resume]" << std::endl;
        std::cout << "  UPLOAD <local>... <remotedir>         Upload files or directories" << std::endl;
        std::cout << "           [--ignore-existing] [--overwrite] [--no-rapid]" << std::endl;
        std::cout << "  SYNC <localdir> <remotedir>           Mirror a local directory remotely" << std::endl;
        std::cout << "\nFlags:\n";
        std::cout << "  --config <file>           JSON config (default ~/.pandrive/config.json)\n";
        std::cout << "  --api-base <url>          REST API base URL\n";
        std::cout << "  --token <token>           Access token (or PANDRIVE_ACCESS_TOKEN)\n";
        std::cout << "  --drive-id <id>           Drive id (or PANDRIVE_DRIVE_ID)\n";
        std::cout << "  --concurrency <n>         Parallel download chunks (1-10)\n";
        std::cout << "  --chunk-size <size>       Download chunk size, e.g. 50M\n";
        std::cout << "  --part-size <size>        Upload part size, e.g. 80M\n";
        std::cout << "  --workers <n>             Files uploaded in parallel\n";
        std::cout << "  --retries <n>             Retries per request, part and file\n";
        std::cout << "  --cipher <kind>           none, simple, chacha20 or aes256cbc\n";
        std::cout << "  --password <password>     Encryption password (or PANDRIVE_PASSWORD)\n";
        std::cout << "  --log <file>              Append logs to file\n";
        std::cout << "  --verbose                 Debug logging\n";
    }

} // namespace pandrive::client
