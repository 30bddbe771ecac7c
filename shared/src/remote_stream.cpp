#include "pandrive/remote_stream.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "pandrive/errors.hpp"

namespace pandrive
{

    namespace
    {

        std::int64_t now_epoch()
        {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        [[noreturn]] void throw_status(const http::Response &response, const RemoteHandle &handle)
        {
            const auto message = "Range request for " + handle.file_id + " failed with HTTP " +
                                 std::to_string(response.status);
            if (response.status == 404)
            {
                throw DownloadError(ErrorCode::NotFound, handle.file_id, message,
                                    std::make_exception_ptr(RemoteApiError(response.status, "NotFound", message)));
            }
            if (response.status == 416)
            {
                throw DownloadError(ErrorCode::InvalidArgument, handle.file_id, message,
                                    std::make_exception_ptr(RemoteApiError(response.status, "InvalidRange", message)));
            }
            throw DownloadError(ErrorCode::RemoteError, handle.file_id, message,
                                std::make_exception_ptr(RemoteApiError(response.status, "", message)));
        }

    } // namespace

    RemoteHandle handle_for(const RemoteEntry &entry)
    {
        RemoteHandle handle;
        handle.file_id = entry.file_id;
        handle.size = entry.size;
        handle.content_hash = entry.fingerprint;
        return handle;
    }

    RemoteStream::RemoteStream(http::Transport &transport, RemoteHandle handle, UrlRefresher refresher,
                               RetryPolicy retry, std::size_t block_size)
        : transport_(transport),
          handle_(std::move(handle)),
          refresher_(std::move(refresher)),
          retry_(retry),
          block_size_(std::max<std::size_t>(block_size, 1))
    {
    }

    std::uint64_t RemoteStream::size() const
    {
        return handle_.size;
    }

    void RemoteStream::resolve()
    {
        bool needed = false;
        {
            std::lock_guard lock(url_mutex_);
            needed = !resolved_ && refresher_ && (handle_.size == 0 || handle_.download_url.empty());
            resolved_ = true;
        }
        if (needed)
        {
            refresh_url();
        }
    }

    RemoteHandle RemoteStream::handle() const
    {
        std::lock_guard lock(url_mutex_);
        return handle_;
    }

    bool RemoteStream::url_expired() const
    {
        return handle_.download_url.empty() || (handle_.expires_at && *handle_.expires_at <= now_epoch());
    }

    void RemoteStream::refresh_url()
    {
        if (!refresher_)
        {
            throw Error(ErrorCode::UrlExpired, "Download URL of " + handle_.file_id + " expired and cannot be refreshed");
        }
        auto fresh = refresher_();
        std::lock_guard lock(url_mutex_);
        handle_.download_url = std::move(fresh.url);
        handle_.expires_at = fresh.expires_at;
        if (fresh.size != 0)
        {
            handle_.size = fresh.size;
        }
        spdlog::debug("Refreshed download URL of {}", handle_.file_id);
    }

    void RemoteStream::stream_range(std::uint64_t offset, std::uint64_t length, const ByteSink &sink)
    {
        if (length == 0)
        {
            return;
        }
        std::uint64_t delivered = 0;
        std::uint32_t failures = 0;
        std::exception_ptr last_error;

        auto give_up_or_wait = [&](std::exception_ptr error)
        {
            last_error = std::move(error);
            if (++failures > retry_.max_retries)
            {
                throw DownloadError(ErrorCode::RetriesExhausted, handle_.file_id,
                                    "Range " + std::to_string(offset) + "+" + std::to_string(length) + " of " +
                                        handle_.file_id + " failed after " + std::to_string(failures) +
                                        " attempts: " + describe(last_error),
                                    last_error);
            }
            spdlog::warn("Range read of {} failed ({}), retry {}/{}", handle_.file_id, describe(last_error), failures,
                         retry_.max_retries);
            std::this_thread::sleep_for(retry_.delay);
        };

        while (delivered < length)
        {
            const auto start = offset + delivered;
            const auto remaining = length - delivered;
            http::Request request;
            try
            {
                bool expired = false;
                {
                    std::lock_guard lock(url_mutex_);
                    expired = url_expired();
                }
                if (expired)
                {
                    refresh_url();
                }
                {
                    std::lock_guard lock(url_mutex_);
                    request.url = handle_.download_url;
                    request.headers = handle_.request_headers;
                }
            }
            catch (const DownloadError &)
            {
                throw;
            }
            catch (const std::exception &)
            {
                give_up_or_wait(std::current_exception());
                continue;
            }
            request.headers.emplace_back("Range", http::range_header(start, remaining));
            request.require_partial = true;

            std::uint64_t received = 0;
            std::exception_ptr sink_error;
            try
            {
                const auto response = transport_.stream(request, [&](std::span<const std::byte> block)
                                                        {
                                                            const auto take = std::min<std::uint64_t>(block.size(), remaining - received);
                                                            if (take == 0)
                                                            {
                                                                return;
                                                            }
                                                            try
                                                            {
                                                                sink(block.first(static_cast<std::size_t>(take)));
                                                            }
                                                            catch (...)
                                                            {
                                                                sink_error = std::current_exception();
                                                                throw;
                                                            }
                                                            received += take;
                                                            delivered += take; });
                if (response.status == 403)
                {
                    spdlog::debug("Download URL of {} rejected with 403, treating it as expired", handle_.file_id);
                    {
                        std::lock_guard lock(url_mutex_);
                        handle_.download_url.clear();
                    }
                    give_up_or_wait(std::make_exception_ptr(
                        Error(ErrorCode::UrlExpired, "Download URL of " + handle_.file_id + " expired")));
                    continue;
                }
                if (response.status == 200)
                {
                    throw TransportError(ErrorCode::ProtocolError, "Server ignored the range request");
                }
                if (response.status >= 400 && response.status < 500)
                {
                    throw_status(response, handle_);
                }
                if (!response.ok())
                {
                    throw RemoteApiError(response.status, "", "HTTP " + std::to_string(response.status));
                }
                if (received < remaining)
                {
                    throw TransportError(ErrorCode::IncompleteRead,
                                         "Range response ended after " + std::to_string(received) + " of " +
                                             std::to_string(remaining) + " bytes");
                }
            }
            catch (const DownloadError &)
            {
                throw;
            }
            catch (const std::exception &)
            {
                // Sink failures are local and never retried.
                if (sink_error)
                {
                    std::rethrow_exception(sink_error);
                }
                give_up_or_wait(std::current_exception());
            }
        }
    }

    std::vector<std::byte> RemoteStream::read(std::size_t count)
    {
        resolve();
        std::vector<std::byte> result;
        result.reserve(count);
        while (result.size() < count && position_ < handle_.size)
        {
            const auto buffer_end = buffer_offset_ + buffer_.size();
            if (position_ < buffer_offset_ || position_ >= buffer_end)
            {
                const auto length = std::min<std::uint64_t>(block_size_, handle_.size - position_);
                buffer_.clear();
                buffer_ = read_range(position_, length);
                buffer_offset_ = position_;
                continue;
            }
            const auto skip = static_cast<std::size_t>(position_ - buffer_offset_);
            const auto take = std::min(count - result.size(), buffer_.size() - skip);
            result.insert(result.end(), buffer_.begin() + static_cast<std::ptrdiff_t>(skip),
                          buffer_.begin() + static_cast<std::ptrdiff_t>(skip + take));
            position_ += take;
        }
        return result;
    }

    void RemoteStream::seek(std::uint64_t offset)
    {
        resolve();
        position_ = std::min(offset, handle_.size);
    }

} // namespace pandrive
