#include "pandrive/client/session.hpp"

#include <algorithm>
#include <iomanip>
#include <iterator>
#include <iostream>
#include <sstream>

#include "pandrive/errors.hpp"

namespace pandrive::client
{

    namespace
    {

        std::string human_size(std::uint64_t bytes)
        {
            static constexpr const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
            double value = static_cast<double>(bytes);
            std::size_t unit = 0;
            while (value >= 1024.0 && unit + 1 < std::size(kUnits))
            {
                value /= 1024.0;
                ++unit;
            }
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << ' ' << kUnits[unit];
            return oss.str();
        }

        // Splits "--flag" words from positional arguments.
        std::vector<std::string> take_flags(const std::vector<std::string> &args, std::vector<std::string> &positional)
        {
            std::vector<std::string> flags;
            for (const auto &arg : args)
            {
                if (arg.rfind("--", 0) == 0)
                {
                    flags.push_back(arg);
                }
                else
                {
                    positional.push_back(arg);
                }
            }
            return flags;
        }

        bool has_flag(const std::vector<std::string> &flags, const std::string &flag)
        {
            return std::find(flags.begin(), flags.end(), flag) != flags.end();
        }

    } // namespace

    bool ClientSession::handle_download(const std::vector<std::string> &args)
    {
        std::vector<std::string> positional;
        const auto flags = take_flags(args, positional);
        if (positional.empty() || positional.size() > 2)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: DOWNLOAD <remote> [localdir] [--no-resume]" << std::endl;
            return true;
        }
        const auto remote_path = normalize_remote(positional[0]);
        const std::filesystem::path local_dir = positional.size() == 2 ? positional[1] : ".";

        const auto entry = api_->get_remote_tree_entry(remote_path);
        if (!entry || entry->is_directory)
        {
            std::cout << "ERROR: " << to_string(ErrorCode::NotFound) << std::endl;
            std::cout << remote_path << " is not a remote file" << std::endl;
            last_command_failed_ = true;
            return true;
        }

        auto options = download_options();
        options.resume = !has_flag(flags, "--no-resume");
        DownloadTask task;
        task.source = handle_for(*entry);
        task.source.drive_id = config_.drive_id;
        task.name = std::filesystem::path(remote_path).filename().string();
        task.task_id = remote_path;
        logger_.log("download", remote_path, " -> ", (local_dir / task.name).string());

        auto handle = engine_->download(task, local_dir, options);
        watch(*handle.events);
        report(handle.result.get());
        return true;
    }

    bool ClientSession::handle_upload(const std::vector<std::string> &args)
    {
        std::vector<std::string> positional;
        const auto flags = take_flags(args, positional);
        if (positional.size() < 2)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: UPLOAD <local>... <remotedir> [--ignore-existing] [--overwrite] [--no-rapid]"
                      << std::endl;
            return true;
        }
        const auto remote_dir = normalize_remote(positional.back());
        positional.pop_back();

        std::vector<UploadTask> tasks;
        for (const auto &item : positional)
        {
            const std::filesystem::path local(item);
            if (std::filesystem::is_directory(local))
            {
                const auto base = local.lexically_normal().filename().empty() ? local.lexically_normal().parent_path().filename()
                                                                             : local.lexically_normal().filename();
                for (const auto &entry : scan_local(local))
                {
                    tasks.push_back(UploadTask{entry.path, join_remote(remote_dir, (base / entry.relative_path).generic_string())});
                }
            }
            else if (std::filesystem::is_regular_file(local))
            {
                tasks.push_back(UploadTask{local, join_remote(remote_dir, local.filename().string())});
            }
            else
            {
                std::cout << "ERROR: " << to_string(ErrorCode::NotFound) << std::endl;
                std::cout << item << " does not exist" << std::endl;
                last_command_failed_ = true;
                return true;
            }
        }

        auto options = upload_options();
        options.ignore_existing = has_flag(flags, "--ignore-existing");
        options.overwrite = has_flag(flags, "--overwrite");
        options.rapid_upload = !has_flag(flags, "--no-rapid");
        logger_.log("upload", tasks.size(), " files -> ", remote_dir);

        auto handle = engine_->upload(std::move(tasks), options);
        watch(*handle.events);
        for (const auto &file : handle.result.get().files)
        {
            report(file);
        }
        return true;
    }

    bool ClientSession::handle_sync(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            std::cout << "ERROR: invalid_usage" << std::endl;
            std::cout << "Usage: SYNC <localdir> <remotedir>" << std::endl;
            return true;
        }
        const std::filesystem::path local_dir(args[0]);
        const auto remote_dir = normalize_remote(args[1]);

        SyncOptions options;
        options.upload = upload_options();
        auto handle = engine_->sync(local_dir, remote_dir, options);
        for (const auto &item : handle.plan)
        {
            std::cout << (item.action == SyncAction::Upload ? "[UP ] " : "[DEL] ") << item.relative_path << "  ("
                      << item.reason << ")" << std::endl;
        }
        logger_.log("sync", local_dir.string(), " -> ", remote_dir, " items=", handle.plan.size());

        watch(*handle.events);
        const auto result = handle.result.get();
        for (const auto &file : result.files)
        {
            report(file);
        }
        std::cout << "Sync: " << result.count(TransferState::Completed) << " done, "
                  << result.count(TransferState::Failed) << " failed" << std::endl;
        return true;
    }

    void ClientSession::watch(EventChannel &events)
    {
        while (auto event = events.pop())
        {
            if (is_terminal(event->state))
            {
                std::cout << '\r' << event->path << ": " << to_string(event->state) << std::string(20, ' ')
                          << std::endl;
                continue;
            }
            std::cout << '\r' << event->path << ": " << human_size(event->bytes_done) << " / "
                      << human_size(event->bytes_total) << std::flush;
        }
    }

    void ClientSession::report(const TransferResult &result)
    {
        switch (result.state)
        {
        case TransferState::Completed:
            std::cout << "OK " << result.path << (result.rapid_upload ? " (rapid upload)" : "") << std::endl;
            break;
        case TransferState::Skipped:
            std::cout << "SKIPPED " << result.path << " (exists remotely)" << std::endl;
            break;
        case TransferState::Paused:
            std::cout << "PAUSED " << result.path << " at " << human_size(result.bytes_done) << std::endl;
            break;
        default:
            last_command_failed_ = true;
            std::cout << "ERROR: " << to_string(code_of(result.error)) << std::endl;
            std::cout << result.path << ": " << describe(result.error) << std::endl;
            logger_.log("error", result.path, ": ", describe(result.error));
            break;
        }
    }

} // namespace pandrive::client
