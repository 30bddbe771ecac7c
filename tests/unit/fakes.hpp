#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "pandrive/crypto.hpp"
#include "pandrive/drive_api.hpp"
#include "pandrive/errors.hpp"
#include "pandrive/http.hpp"

namespace pandrive::testing
{

    inline std::vector<std::byte> make_bytes(std::size_t size, unsigned seed = 7)
    {
        std::vector<std::byte> data(size);
        unsigned state = seed;
        for (auto &byte : data)
        {
            state = state * 1103515245u + 12345u;
            byte = static_cast<std::byte>((state >> 16) & 0xFF);
        }
        return data;
    }

    inline std::string as_string(std::span<const std::byte> data)
    {
        return std::string(reinterpret_cast<const char *>(data.data()), data.size());
    }

    inline std::vector<std::byte> as_bytes_vector(const std::string &text)
    {
        const auto bytes = std::as_bytes(std::span(text.data(), text.size()));
        return std::vector<std::byte>(bytes.begin(), bytes.end());
    }

    // In-memory HTTP: GETs with a Range header are served from `objects`,
    // PUT bodies are recorded in `uploads`. Faults are injected per test.
    class FakeTransport : public http::Transport
    {
    public:
        http::Response send(const http::Request &request) override
        {
            enter(request);
            Leave leave{*this};
            std::lock_guard lock(mutex_);
            if (request.method == "PUT")
            {
                ++put_count;
                if (failing_puts > 0)
                {
                    --failing_puts;
                    return http::Response{.status = 500, .headers = {}, .body = "InternalError"};
                }
                uploads[request.url] = request.body;
                return http::Response{.status = 200, .headers = {}, .body = ""};
            }
            return http::Response{.status = 405, .headers = {}, .body = ""};
        }

        http::Response stream(const http::Request &request, const ByteSink &sink) override
        {
            enter(request);
            Leave leave{*this};

            std::vector<std::byte> object;
            std::uint64_t cut_at = 0;
            bool reset_after_cut = false;
            {
                std::lock_guard lock(mutex_);
                ++get_count;
                requested_urls.push_back(request.url);
                last_get_headers = request.headers;
                if (expired_urls.contains(request.url))
                {
                    return http::Response{.status = 403, .headers = {}, .body = "AccessDenied"};
                }
                for (const auto &required : required_headers)
                {
                    if (std::find(request.headers.begin(), request.headers.end(), required) == request.headers.end())
                    {
                        return http::Response{.status = 403, .headers = {}, .body = "AccessDenied"};
                    }
                }
                const auto found = objects.find(request.url);
                if (found == objects.end())
                {
                    return http::Response{.status = 404, .headers = {}, .body = "NotFound"};
                }
                object = found->second;
                if (resets_remaining > 0)
                {
                    --resets_remaining;
                    reset_after_cut = true;
                    cut_at = 1;
                }
                else if (short_reads_remaining > 0)
                {
                    --short_reads_remaining;
                    cut_at = 1;
                }
            }

            std::uint64_t first = 0;
            std::uint64_t last = object.size() - 1;
            for (const auto &[name, value] : request.headers)
            {
                if (name == "Range")
                {
                    const auto dash = value.find('-');
                    first = std::stoull(value.substr(6, dash - 6));
                    last = std::stoull(value.substr(dash + 1));
                }
            }
            if (first >= object.size())
            {
                return http::Response{.status = 416, .headers = {}, .body = ""};
            }
            last = std::min<std::uint64_t>(last, object.size() - 1);
            const auto length = last - first + 1;
            {
                std::lock_guard lock(mutex_);
                ranges.emplace_back(first, length);
            }

            // A cut delivers the first half of the range, then breaks off.
            const auto deliver = cut_at ? length / 2 : length;
            std::uint64_t sent = 0;
            while (sent < deliver)
            {
                const auto take = std::min<std::uint64_t>(block_size, deliver - sent);
                sink(std::span<const std::byte>(object.data() + first + sent, static_cast<std::size_t>(take)));
                sent += take;
                if (latency.count() > 0)
                {
                    std::this_thread::sleep_for(latency);
                }
            }
            if (reset_after_cut)
            {
                throw TransportError(ErrorCode::ConnectionReset, "connection reset by fake peer");
            }
            return http::Response{.status = 206, .headers = {}, .body = ""};
        }

        void serve(const std::string &url, std::vector<std::byte> data)
        {
            std::lock_guard lock(mutex_);
            objects[url] = std::move(data);
        }

        std::string upload_body(const std::string &url)
        {
            std::lock_guard lock(mutex_);
            const auto found = uploads.find(url);
            return found == uploads.end() ? std::string{} : found->second;
        }

        std::mutex mutex_;
        std::map<std::string, std::vector<std::byte>> objects;
        std::map<std::string, std::string> uploads;
        std::set<std::string> expired_urls;
        std::vector<std::string> requested_urls;
        std::vector<std::pair<std::uint64_t, std::uint64_t>> ranges;
        // GETs lacking any of these are refused with 403.
        http::Headers required_headers;
        http::Headers last_get_headers;

        std::uint32_t resets_remaining{0};
        std::uint32_t short_reads_remaining{0};
        std::uint32_t failing_puts{0};
        std::uint64_t block_size{4096};
        std::chrono::milliseconds latency{0};
        // Runs before every request; may throw to simulate a network error.
        std::function<void(const http::Request &)> on_request;

        std::atomic<int> in_flight{0};
        std::atomic<int> max_in_flight{0};
        std::atomic<int> get_count{0};
        std::atomic<int> put_count{0};

    private:
        struct Leave
        {
            FakeTransport &owner;
            ~Leave() { --owner.in_flight; }
        };

        void enter(const http::Request &request)
        {
            const auto now = ++in_flight;
            auto seen = max_in_flight.load();
            while (now > seen && !max_in_flight.compare_exchange_weak(seen, now))
            {
            }
            if (on_request)
            {
                try
                {
                    on_request(request);
                }
                catch (...)
                {
                    --in_flight;
                    throw;
                }
            }
        }
    };

    // In-memory drive. Download URLs and part URLs point into the
    // FakeTransport; every refresh hands out a new URL generation.
    class FakeDrive : public DriveApi
    {
    public:
        struct StoredFile
        {
            std::string file_id;
            std::vector<std::byte> content;
            std::int64_t mtime{};
            std::string content_hash;
        };

        explicit FakeDrive(FakeTransport &transport)
            : transport_(transport)
        {
        }

        // Stores a file and serves its current download URL.
        StoredFile &put_file(const std::string &path, std::vector<std::byte> content, std::int64_t mtime = 0)
        {
            std::lock_guard lock(mutex_);
            auto &file = files[path];
            file.file_id = "file-" + std::to_string(++next_id_);
            file.content_hash = crypto::sha1_bytes(content);
            file.content = std::move(content);
            file.mtime = mtime;
            return file;
        }

        std::string download_url_for(const std::string &file_id, std::uint32_t generation) const
        {
            return "https://fake.drive/dl/" + file_id + "/" + std::to_string(generation);
        }

        RemoteHandle handle(const std::string &path)
        {
            std::lock_guard lock(mutex_);
            const auto &file = files.at(path);
            RemoteHandle handle;
            handle.file_id = file.file_id;
            handle.size = file.content.size();
            handle.content_hash = file.content_hash;
            return handle;
        }

        http::Headers download_headers() const override
        {
            return extra_download_headers;
        }

        protocol::DownloadUrl get_download_url(const std::string &file_id) override
        {
            std::lock_guard lock(mutex_);
            ++download_url_requests;
            for (const auto &[path, file] : files)
            {
                if (file.file_id == file_id)
                {
                    const auto url = download_url_for(file_id, ++url_generation_);
                    transport_.serve(url, file.content);
                    return protocol::DownloadUrl{.url = url, .expires_at = std::nullopt, .size = file.content.size()};
                }
            }
            throw RemoteApiError(404, "NotFound.File", "no such file " + file_id);
        }

        UploadSession create_upload_session(const UploadSessionRequest &request) override
        {
            std::lock_guard lock(mutex_);
            ++create_requests;
            if (files.contains(request.remote_path) && !request.overwrite)
            {
                throw RemoteApiError(409, "AlreadyExist.File", request.remote_path + " exists");
            }
            UploadSession session;
            session.remote_path = request.remote_path;
            session.part_count = request.part_count;
            session.file_id = "file-" + std::to_string(++next_id_);

            if (!request.pre_hash.empty())
            {
                ++pre_hash_probes;
                session.pre_hash_matched = known_pre_hashes.contains(request.pre_hash);
            }
            if (!request.content_hash.empty() && rapid_enabled)
            {
                ++rapid_attempts;
                const auto known = known_contents.find(request.content_hash);
                if (known != known_contents.end() && !request.proof_code.empty())
                {
                    session.rapid_upload = true;
                    auto &file = files[request.remote_path];
                    file.file_id = session.file_id;
                    file.content = known->second;
                    file.content_hash = request.content_hash;
                    file.mtime = request.local_modified_at.value_or(0);
                    return session;
                }
            }

            session.upload_id = "upload-" + std::to_string(++next_id_);
            session.parts = part_urls(session);
            pending_mtime_[session.upload_id] = request.local_modified_at.value_or(0);
            return session;
        }

        std::vector<protocol::PartInfo> refresh_upload_urls(const UploadSession &session) override
        {
            std::lock_guard lock(mutex_);
            ++upload_url_refreshes;
            return part_urls(session);
        }

        std::vector<protocol::PartInfo> list_uploaded_parts(const UploadSession &session) override
        {
            std::lock_guard lock(mutex_);
            ++list_parts_requests;
            std::vector<protocol::PartInfo> parts;
            for (std::uint32_t number = 1; number <= session.part_count; ++number)
            {
                if (latest_part(session, number))
                {
                    parts.push_back(protocol::PartInfo{.part_number = number});
                }
            }
            return parts;
        }

        protocol::RemoteFile complete_upload(const UploadSession &session) override
        {
            std::lock_guard lock(mutex_);
            ++complete_requests;
            std::string assembled;
            for (std::uint32_t number = 1; number <= session.part_count; ++number)
            {
                const auto part = latest_part(session, number);
                if (!part)
                {
                    throw RemoteApiError(400, "PartNotUploaded", "part " + std::to_string(number) + " missing");
                }
                assembled += *part;
            }
            auto &file = files[session.remote_path];
            file.file_id = session.file_id;
            file.content = as_bytes_vector(assembled);
            file.content_hash = reported_hash_override.value_or(crypto::sha1_bytes(file.content));
            file.mtime = pending_mtime_[session.upload_id];

            protocol::RemoteFile remote;
            remote.file_id = file.file_id;
            remote.name = session.remote_path;
            remote.size = file.content.size();
            remote.content_hash = file.content_hash;
            return remote;
        }

        std::optional<RemoteEntry> get_remote_tree_entry(const std::string &path) override
        {
            std::lock_guard lock(mutex_);
            const auto found = files.find(path);
            if (found == files.end())
            {
                if (directories.contains(path))
                {
                    return RemoteEntry{.file_id = "dir:" + path, .path = path, .is_directory = true};
                }
                return std::nullopt;
            }
            return entry_of(found->first, found->second);
        }

        std::vector<RemoteEntry> list_tree(const std::string &remote_dir) override
        {
            std::lock_guard lock(mutex_);
            const auto prefix = remote_dir + "/";
            std::vector<RemoteEntry> entries;
            for (const auto &[path, file] : files)
            {
                if (path.rfind(prefix, 0) == 0)
                {
                    entries.push_back(entry_of(path.substr(prefix.size()), file));
                }
            }
            return entries;
        }

        RemoteEntry ensure_directory(const std::string &path) override
        {
            std::lock_guard lock(mutex_);
            directories.insert(path);
            return RemoteEntry{.file_id = "dir:" + path, .path = path, .is_directory = true};
        }

        void remove(const std::string &file_id) override
        {
            std::lock_guard lock(mutex_);
            for (auto it = files.begin(); it != files.end(); ++it)
            {
                if (it->second.file_id == file_id)
                {
                    removed.push_back(it->first);
                    files.erase(it);
                    return;
                }
            }
            throw RemoteApiError(404, "NotFound.File", "no such file " + file_id);
        }

        // Content the remote can register by fingerprint.
        void know_content(const std::vector<std::byte> &content)
        {
            std::lock_guard lock(mutex_);
            const auto pre = std::span(content).first(std::min<std::size_t>(content.size(), crypto::kPreHashSize));
            known_pre_hashes.insert(crypto::sha1_bytes(pre));
            known_contents[crypto::sha1_bytes(content)] = content;
        }

        std::map<std::string, StoredFile> files;
        std::set<std::string> directories;
        std::vector<std::string> removed;
        std::set<std::string> known_pre_hashes;
        std::map<std::string, std::vector<std::byte>> known_contents;
        bool rapid_enabled{true};
        std::optional<std::string> reported_hash_override;

        http::Headers extra_download_headers;
        int download_url_requests{0};
        int create_requests{0};
        int pre_hash_probes{0};
        int rapid_attempts{0};
        int upload_url_refreshes{0};
        int list_parts_requests{0};
        int complete_requests{0};

    private:
        std::string part_url(const UploadSession &session, std::uint32_t number, std::uint32_t generation) const
        {
            return "https://fake.drive/up/" + session.upload_id + "/" + std::to_string(number) + "/" +
                   std::to_string(generation);
        }

        std::vector<protocol::PartInfo> part_urls(const UploadSession &session)
        {
            const auto generation = ++url_generation_;
            part_generation_[session.upload_id] = generation;
            std::vector<protocol::PartInfo> parts;
            for (std::uint32_t number = 1; number <= session.part_count; ++number)
            {
                parts.push_back(protocol::PartInfo{.part_number = number,
                                                   .upload_url = part_url(session, number, generation)});
            }
            return parts;
        }

        std::optional<std::string> latest_part(const UploadSession &session, std::uint32_t number)
        {
            const auto newest = part_generation_[session.upload_id];
            for (auto generation = newest; generation > 0; --generation)
            {
                const auto url = part_url(session, number, generation);
                std::lock_guard lock(transport_.mutex_);
                if (const auto found = transport_.uploads.find(url); found != transport_.uploads.end())
                {
                    return found->second;
                }
            }
            return std::nullopt;
        }

        RemoteEntry entry_of(const std::string &path, const StoredFile &file) const
        {
            return RemoteEntry{
                .file_id = file.file_id,
                .path = path,
                .size = file.content.size(),
                .mtime = file.mtime,
                .fingerprint = file.content_hash,
                .is_directory = false,
            };
        }

        FakeTransport &transport_;
        std::mutex mutex_;
        std::uint32_t next_id_{0};
        std::uint32_t url_generation_{0};
        std::map<std::string, std::uint32_t> part_generation_;
        std::map<std::string, std::int64_t> pending_mtime_;
    };

} // namespace pandrive::testing
