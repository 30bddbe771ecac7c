#include "pandrive/downloader.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <fstream>
#include <mutex>

#include <spdlog/spdlog.h>

#include "pandrive/cipher.hpp"
#include "pandrive/crypto.hpp"
#include "pandrive/encryption_header.hpp"
#include "pandrive/errors.hpp"
#include "pandrive/remote_stream.hpp"

namespace pandrive
{

    namespace
    {

        struct ObjectLayout
        {
            cipher::CipherSpec spec{cipher::NoCipher{}};
            std::uint64_t body_offset{0};
            std::uint64_t plaintext_size{0};
            bool encrypted{false};
        };

        ObjectLayout inspect(RemoteStream &probe, const std::optional<std::string> &password)
        {
            probe.resolve();
            ObjectLayout layout;
            layout.plaintext_size = probe.size();
            if (probe.size() < cipher::kHeaderSize)
            {
                return layout;
            }
            const auto head = probe.read_range(0, cipher::kHeaderSize);
            const auto header = cipher::parse_header(head);
            if (!header)
            {
                return layout;
            }
            if (!password)
            {
                spdlog::warn("{} is encrypted ({}) but no password was given, copying it raw",
                             probe.handle().file_id, cipher::to_string(header->kind));
                return layout;
            }
            cipher::validate_object_size(*header, probe.size());
            layout.spec = cipher::cipher_for(*header, *password);
            layout.body_offset = cipher::kHeaderSize;
            layout.plaintext_size = header->plaintext_size;
            layout.encrypted = true;
            return layout;
        }

        std::exception_ptr as_download_error(std::exception_ptr error, const std::string &path)
        {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const DownloadError &)
            {
                return error;
            }
            catch (const std::exception &ex)
            {
                return std::make_exception_ptr(DownloadError(code_of(error), path, ex.what(), error));
            }
        }

        void truncate_to(const std::filesystem::path &path, std::uint64_t size)
        {
            std::error_code ec;
            std::filesystem::resize_file(path, size, ec);
            if (ec)
            {
                throw Error(ErrorCode::FileIo, "Cannot truncate " + path.string() + ": " + ec.message());
            }
        }

        struct PassContext
        {
            http::Transport &transport;
            const UrlRefresher &refresher;
            const RemoteHandle &handle;
            const RetryPolicy &retry;
            const ObjectLayout &layout;
            const std::filesystem::path &destination;
            ProgressReporter &progress;
            TransferControl &control;
            std::uint32_t concurrency;
            std::uint64_t chunk_size;
        };

        struct PassOutcome
        {
            std::uint64_t watermark{0};
            std::exception_ptr error{};
        };

        void fetch_chunk(PassContext &context, const Chunk &chunk)
        {
            RemoteStream stream(context.transport, context.handle, context.refresher, context.retry);
            OffsetRangeSource body(stream, context.layout.body_offset);
            cipher::RangeDecryptor decryptor(context.layout.spec, chunk.offset, chunk.length);
            const auto range = decryptor.ciphertext_range();

            std::fstream out(context.destination, std::ios::in | std::ios::out | std::ios::binary);
            if (!out)
            {
                throw Error(ErrorCode::FileIo, "Cannot open " + context.destination.string() + " for writing");
            }
            out.seekp(static_cast<std::streamoff>(chunk.offset));

            body.stream_range(range.offset, range.length, [&](std::span<const std::byte> block)
                              {
                                  const auto plain = decryptor.update(block);
                                  if (plain.empty())
                                  {
                                      return;
                                  }
                                  out.write(reinterpret_cast<const char *>(plain.data()),
                                            static_cast<std::streamsize>(plain.size()));
                                  if (!out)
                                  {
                                      throw Error(ErrorCode::FileIo, "Write to " + context.destination.string() + " failed");
                                  }
                                  context.progress.add(plain.size()); });

            if (decryptor.produced() != chunk.length)
            {
                throw TransportError(ErrorCode::IncompleteRead,
                                     "Chunk at " + std::to_string(chunk.offset) + " produced " +
                                         std::to_string(decryptor.produced()) + " of " + std::to_string(chunk.length) +
                                         " bytes");
            }
            out.flush();
            if (!out)
            {
                throw Error(ErrorCode::FileIo, "Flush of " + context.destination.string() + " failed");
            }
            spdlog::debug("Chunk [{}, {}) of {} done", chunk.offset, chunk.end(), context.handle.file_id);
        }

        // Runs the chunks of [begin, plaintext_size) with at most
        // `concurrency` in flight. Stops scheduling on the first error or
        // when a pause or cancel is requested; in-flight chunks finish.
        PassOutcome run_pass(PassContext &context, std::uint64_t begin)
        {
            const auto plan = make_plan(begin, context.layout.plaintext_size, context.chunk_size);
            std::vector<bool> done(plan.size(), false);
            std::mutex mutex;
            std::condition_variable slot_free;
            std::uint32_t in_flight = 0;
            PassOutcome outcome;

            {
                asio::thread_pool pool(context.concurrency);
                for (std::size_t index = 0; index < plan.size(); ++index)
                {
                    std::unique_lock lock(mutex);
                    slot_free.wait(lock, [&]
                                   { return in_flight < context.concurrency; });
                    if (outcome.error || context.control.stop_requested())
                    {
                        break;
                    }
                    ++in_flight;
                    lock.unlock();

                    asio::post(pool, [&, index]
                               {
                                   std::exception_ptr error;
                                   try
                                   {
                                       fetch_chunk(context, plan[index]);
                                   }
                                   catch (const std::exception &)
                                   {
                                       error = std::current_exception();
                                   }
                                   std::lock_guard guard(mutex);
                                   if (error && !outcome.error)
                                   {
                                       outcome.error = error;
                                   }
                                   done[index] = !error;
                                   --in_flight;
                                   slot_free.notify_all(); });
                }
                pool.join();
            }

            outcome.watermark = begin;
            for (std::size_t index = 0; index < plan.size() && done[index]; ++index)
            {
                outcome.watermark = plan[index].end();
            }
            return outcome;
        }

    } // namespace

    std::uint32_t clamp_concurrency(std::uint32_t requested) noexcept
    {
        return std::clamp<std::uint32_t>(requested, 1, kMaxConcurrency);
    }

    Downloader::Downloader(http::Transport &transport, DriveApi &api, DownloadOptions options)
        : transport_(transport),
          api_(api),
          options_(std::move(options))
    {
        options_.concurrency = clamp_concurrency(options_.concurrency);
        if (options_.chunk_size == 0)
        {
            options_.chunk_size = kDefaultChunkSize;
        }
    }

    TransferResult Downloader::download(const DownloadTask &task, const std::filesystem::path &destination,
                                        TransferControl &control, EventChannel *events, RateCounter *rate)
    {
        const auto task_id = task.task_id.empty() ? task.source.file_id : task.task_id;
        const auto path = destination.string();
        const auto file_id = task.source.file_id;
        const UrlRefresher refresher = [this, file_id]
        { return api_.get_download_url(file_id); };

        ObjectLayout layout;
        RemoteHandle handle;
        std::uint64_t offset = 0;
        try
        {
            auto source = task.source;
            if (source.request_headers.empty())
            {
                source.request_headers = api_.download_headers();
            }
            RemoteStream probe(transport_, source, refresher, options_.retry);
            layout = inspect(probe, options_.password);
            handle = probe.handle();

            if (destination.has_parent_path())
            {
                std::filesystem::create_directories(destination.parent_path());
            }
            if (options_.resume && std::filesystem::is_regular_file(destination))
            {
                offset = std::filesystem::file_size(destination);
                if (offset > layout.plaintext_size)
                {
                    throw DownloadError(ErrorCode::ResumeStateInvalid, path,
                                        "Local file is larger (" + std::to_string(offset) + ") than the remote object (" +
                                            std::to_string(layout.plaintext_size) + ")");
                }
            }
            else
            {
                std::ofstream create(destination, std::ios::binary | std::ios::trunc);
                if (!create)
                {
                    throw Error(ErrorCode::FileIo, "Cannot create " + path);
                }
            }
        }
        catch (const std::exception &)
        {
            auto error = as_download_error(std::current_exception(), path);
            ProgressReporter failed(task_id, path, task.source.size, events, rate);
            failed.finish(TransferState::Failed, describe(error));
            spdlog::error("Download of {} failed: {}", path, describe(error));
            return failed.result(TransferState::Failed, error);
        }

        ProgressReporter progress(task_id, path, layout.plaintext_size, events, rate);
        progress.start(offset);
        if (offset > 0)
        {
            spdlog::info("Resuming {} at {} of {} bytes", path, offset, layout.plaintext_size);
        }

        PassContext context{
            .transport = transport_,
            .refresher = refresher,
            .handle = handle,
            .retry = options_.retry,
            .layout = layout,
            .destination = destination,
            .progress = progress,
            .control = control,
            .concurrency = options_.concurrency,
            .chunk_size = options_.chunk_size,
        };

        try
        {
            while (true)
            {
                const auto outcome = run_pass(context, offset);
                if (outcome.error)
                {
                    truncate_to(destination, outcome.watermark);
                    progress.rewind(outcome.watermark);
                    auto error = as_download_error(outcome.error, path);
                    spdlog::error("Download of {} failed at {} bytes: {}", path, outcome.watermark, describe(error));
                    progress.finish(TransferState::Failed, describe(error));
                    return progress.result(TransferState::Failed, error);
                }
                if (outcome.watermark >= layout.plaintext_size)
                {
                    break;
                }

                truncate_to(destination, outcome.watermark);
                progress.rewind(outcome.watermark);
                progress.finish(TransferState::Paused);
                spdlog::info("Download of {} paused at {} bytes", path, outcome.watermark);
                if (control.cancelled() || !control.wait_if_paused())
                {
                    return progress.result(TransferState::Paused);
                }
                offset = std::filesystem::file_size(destination);
                progress.start(offset);
            }

            if (options_.verify && !layout.encrypted && handle.content_hash)
            {
                auto expected = *handle.content_hash;
                std::transform(expected.begin(), expected.end(), expected.begin(), [](unsigned char ch)
                               { return static_cast<char>(std::tolower(ch)); });
                const auto actual = crypto::sha1_file(destination);
                if (actual != expected)
                {
                    throw DownloadError(ErrorCode::ChecksumMismatch, path,
                                        "SHA-1 mismatch: local " + actual + ", remote " + expected);
                }
            }
        }
        catch (const std::exception &)
        {
            auto error = as_download_error(std::current_exception(), path);
            spdlog::error("Download of {} failed: {}", path, describe(error));
            progress.finish(TransferState::Failed, describe(error));
            return progress.result(TransferState::Failed, error);
        }

        spdlog::info("Downloaded {} ({} bytes)", path, layout.plaintext_size);
        progress.finish(TransferState::Completed);
        return progress.result(TransferState::Completed);
    }

} // namespace pandrive
