/**
 * PanDrive - Range-addressable reader over a pre-signed download URL.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <vector>

#include "pandrive/drive_api.hpp"
#include "pandrive/http.hpp"
#include "pandrive/range_source.hpp"
#include "pandrive/transfer.hpp"

namespace pandrive
{

    // Produces a fresh download URL for the stream's file.
    using UrlRefresher = std::function<protocol::DownloadUrl()>;

    inline constexpr std::size_t kDefaultReadBlock = 1024 * 1024;

    // Delivers byte ranges of one remote object. A failed request is retried
    // from the first byte not yet handed to the sink; an expired URL (403 or
    // a passed expires_at) is replaced through the refresher first. Nothing
    // is written to disk.
    class RemoteStream : public RangeSource
    {
    public:
        RemoteStream(http::Transport &transport, RemoteHandle handle, UrlRefresher refresher, RetryPolicy retry = {},
                     std::size_t block_size = kDefaultReadBlock);

        std::uint64_t size() const override;

        // Fetches a download URL, and the object size with it, when the handle
        // carries no URL or no size. Called before the size is trusted.
        void resolve();

        // Throws DownloadError once the retry budget is spent, immediately for
        // 404, 416 and other client errors.
        void stream_range(std::uint64_t offset, std::uint64_t length, const ByteSink &sink) override;

        // Sequential reads through a block buffer. Returns fewer bytes only at
        // the end of the object.
        std::vector<std::byte> read(std::size_t count);
        void seek(std::uint64_t offset);
        std::uint64_t tell() const noexcept { return position_; }

        RemoteHandle handle() const;

    private:
        void refresh_url();
        bool url_expired() const;

        http::Transport &transport_;
        RemoteHandle handle_;
        UrlRefresher refresher_;
        RetryPolicy retry_;
        std::size_t block_size_;
        mutable std::mutex url_mutex_;

        std::vector<std::byte> buffer_;
        std::uint64_t buffer_offset_{0};
        std::uint64_t position_{0};
        bool resolved_{false};
    };

} // namespace pandrive
