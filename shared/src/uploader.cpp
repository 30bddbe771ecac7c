#include "pandrive/uploader.hpp"

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <set>
#include <thread>

#include <spdlog/spdlog.h>

#include "pandrive/crypto.hpp"
#include "pandrive/encryption_header.hpp"
#include "pandrive/errors.hpp"
#include "pandrive/rapid_upload.hpp"

namespace pandrive
{

    namespace
    {

        constexpr std::size_t kReadBlock = 1024 * 1024;

        // Remote object bytes of a local file: the encryption header, if
        // any, followed by the ciphertext, produced as they are read.
        class ObjectReader
        {
        public:
            ObjectReader(const std::filesystem::path &path, const std::optional<cipher::EncryptionHeader> &header,
                         const cipher::CipherSpec &spec)
                : input_(path, std::ios::binary),
                  encryptor_(spec)
            {
                if (!input_)
                {
                    throw Error(ErrorCode::FileIo, "Cannot open " + path.string());
                }
                if (header)
                {
                    const auto encoded = cipher::encode_header(*header);
                    append(encoded);
                }
            }

            std::string read(std::size_t count)
            {
                std::vector<char> block(kReadBlock);
                while (pending_.size() < count && !finished_)
                {
                    input_.read(block.data(), static_cast<std::streamsize>(block.size()));
                    const auto got = static_cast<std::size_t>(input_.gcount());
                    if (got > 0)
                    {
                        append(encryptor_.update(std::as_bytes(std::span(block.data(), got))));
                    }
                    if (input_.eof())
                    {
                        append(encryptor_.finalize());
                        finished_ = true;
                    }
                    else if (!input_)
                    {
                        throw Error(ErrorCode::FileIo, "Read failed while uploading");
                    }
                }
                const auto take = std::min(count, pending_.size());
                auto out = pending_.substr(0, take);
                pending_.erase(0, take);
                return out;
            }

        private:
            void append(std::span<const std::byte> data)
            {
                pending_.append(reinterpret_cast<const char *>(data.data()), data.size());
            }

            std::ifstream input_;
            cipher::Encryptor encryptor_;
            std::string pending_;
            bool finished_{false};
        };

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        std::exception_ptr as_upload_error(std::exception_ptr error, const std::string &path)
        {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const UploadError &)
            {
                return error;
            }
            catch (const std::exception &ex)
            {
                return std::make_exception_ptr(UploadError(code_of(error), path, ex.what(), error));
            }
        }

        bool is_cancellation(const std::exception_ptr &error)
        {
            return code_of(error) == ErrorCode::Cancelled;
        }

    } // namespace

    struct Uploader::Attempt
    {
        const UploadTask &task;
        std::string path;
        UploadSessionRequest request;
        std::optional<cipher::EncryptionHeader> header;
        cipher::CipherSpec spec;
        ChunkPlan plan;
        std::optional<UploadSession> session;
        bool resume_session{false};
        ProgressReporter &progress;
        TransferControl &control;
    };

    Uploader::Uploader(http::Transport &transport, DriveApi &api, UploadOptions options)
        : transport_(transport),
          api_(api),
          options_(std::move(options))
    {
        options_.max_workers = std::max<std::uint32_t>(options_.max_workers, 1);
        if (options_.part_size == 0)
        {
            options_.part_size = kDefaultPartSize;
        }
    }

    TransferResult Uploader::upload(const UploadTask &task, TransferControl &control, EventChannel *events,
                                    RateCounter *rate)
    {
        const auto task_id = task.task_id.empty() ? task.remote_path : task.task_id;
        const auto path = task.local_path.string();

        std::uint64_t size = 0;
        std::uint64_t object_size = 0;
        UploadSessionRequest request;
        std::optional<cipher::EncryptionHeader> header;
        cipher::CipherSpec spec{cipher::NoCipher{}};
        try
        {
            if (options_.ignore_existing && api_.get_remote_tree_entry(task.remote_path))
            {
                spdlog::info("{} already exists, skipping {}", task.remote_path, path);
                ProgressReporter skipped(task_id, path, 0, events, rate);
                skipped.finish(TransferState::Skipped);
                return skipped.result(TransferState::Skipped);
            }
            if (!std::filesystem::is_regular_file(task.local_path))
            {
                throw UploadError(ErrorCode::NotFound, path, "Not a regular file: " + path);
            }
            size = std::filesystem::file_size(task.local_path);
            object_size = cipher::encrypted_object_size(options_.cipher, size);
            if (options_.cipher != cipher::CipherKind::None)
            {
                header = cipher::new_header(options_.cipher, size);
                spec = cipher::cipher_for(*header, options_.password);
            }
            request.remote_path = task.remote_path;
            request.size = object_size;
            request.local_modified_at = to_unix_time(std::filesystem::last_write_time(task.local_path));
            request.overwrite = options_.overwrite;
        }
        catch (const std::exception &)
        {
            auto error = as_upload_error(std::current_exception(), path);
            spdlog::error("Upload of {} failed: {}", path, describe(error));
            ProgressReporter failed(task_id, path, size, events, rate);
            failed.finish(TransferState::Failed, describe(error));
            return failed.result(TransferState::Failed, error);
        }

        ProgressReporter progress(task_id, path, object_size, events, rate);
        progress.start(0);

        Attempt attempt{
            .task = task,
            .path = path,
            .request = request,
            .header = header,
            .spec = spec,
            .plan = make_part_plan(object_size, options_.part_size),
            .session = std::nullopt,
            .resume_session = false,
            .progress = progress,
            .control = control,
        };
        attempt.request.part_count = static_cast<std::uint32_t>(attempt.plan.size());

        if (options_.rapid_upload && RapidUploadNegotiator::eligible(size, options_.cipher))
        {
            RapidUploadNegotiator negotiator(api_, options_.access_token);
            try
            {
                negotiator.negotiate(task.local_path, attempt.request);
                progress.add(object_size);
                progress.finish(TransferState::Completed);
                auto result = progress.result(TransferState::Completed);
                result.rapid_upload = true;
                return result;
            }
            catch (const RapidUploadError &ex)
            {
                spdlog::debug("Rapid upload of {} not possible: {}", path, ex.what());
                attempt.session = negotiator.prepared_session();
            }
        }

        for (std::uint32_t round = 0;; ++round)
        {
            try
            {
                upload_parts(attempt);
                break;
            }
            catch (const std::exception &)
            {
                auto error = std::current_exception();
                if (is_cancellation(error))
                {
                    spdlog::info("Upload of {} stopped", path);
                    progress.finish(TransferState::Paused);
                    return progress.result(TransferState::Paused);
                }
                if (round >= options_.retry.max_retries)
                {
                    error = as_upload_error(error, path);
                    spdlog::error("Upload of {} failed: {}", path, describe(error));
                    progress.finish(TransferState::Failed, describe(error));
                    return progress.result(TransferState::Failed, error);
                }
                spdlog::warn("Upload of {} failed ({}), retry {}/{}", path, describe(error), round + 1,
                             options_.retry.max_retries);
                attempt.resume_session = attempt.session.has_value();
                std::this_thread::sleep_for(options_.retry.delay);
            }
        }

        spdlog::info("Uploaded {} to {} ({} bytes)", path, task.remote_path, object_size);
        progress.finish(TransferState::Completed);
        return progress.result(TransferState::Completed);
    }

    void Uploader::upload_parts(Attempt &attempt)
    {
        std::set<std::uint32_t> acknowledged;
        if (attempt.session && attempt.resume_session)
        {
            try
            {
                for (const auto &part : api_.list_uploaded_parts(*attempt.session))
                {
                    acknowledged.insert(part.part_number);
                }
                spdlog::debug("Resuming upload of {} with {} acknowledged parts", attempt.path, acknowledged.size());
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Upload session of {} cannot be resumed ({}), opening a new one", attempt.path, ex.what());
                attempt.session.reset();
            }
        }
        if (!attempt.session)
        {
            attempt.session = api_.create_upload_session(attempt.request);
        }
        auto &session = *attempt.session;
        if (session.rapid_upload)
        {
            attempt.progress.add(attempt.request.size - std::min(attempt.progress.done(), attempt.request.size));
            return;
        }
        if (session.parts.size() < attempt.plan.size())
        {
            session.parts = api_.refresh_upload_urls(session);
            if (session.parts.size() < attempt.plan.size())
            {
                throw Error(ErrorCode::ProtocolError, "Upload session has " + std::to_string(session.parts.size()) +
                                                          " part URLs for " + std::to_string(attempt.plan.size()) +
                                                          " parts");
            }
        }

        ObjectReader reader(attempt.task.local_path, attempt.header, attempt.spec);
        crypto::Sha1 hasher;
        auto counted = attempt.progress.done();
        std::uint64_t position = 0;

        for (std::size_t index = 0; index < attempt.plan.size(); ++index)
        {
            if (!attempt.control.wait_if_paused())
            {
                throw Error(ErrorCode::Cancelled, "Upload cancelled");
            }
            const auto &part = attempt.plan[index];
            const auto number = static_cast<std::uint32_t>(index + 1);

            http::Request request;
            request.method = "PUT";
            request.body = reader.read(static_cast<std::size_t>(part.length));
            if (request.body.size() != part.length)
            {
                throw Error(ErrorCode::FileIo, attempt.path + " changed during upload");
            }
            hasher.update(std::as_bytes(std::span(request.body.data(), request.body.size())));

            if (!acknowledged.contains(number))
            {
                for (std::uint32_t failures = 0;;)
                {
                    try
                    {
                        const auto url = std::find_if(session.parts.begin(), session.parts.end(),
                                                      [number](const protocol::PartInfo &info)
                                                      { return info.part_number == number; });
                        if (url == session.parts.end())
                        {
                            throw Error(ErrorCode::ProtocolError, "No upload URL for part " + std::to_string(number));
                        }
                        request.url = url->upload_url;
                        const auto response = transport_.send(request);
                        if (response.ok() ||
                            (response.status == 409 && response.body.find("PartAlreadyExist") != std::string::npos))
                        {
                            break;
                        }
                        throw RemoteApiError(response.status, "", "Part " + std::to_string(number) +
                                                                      " rejected with HTTP " +
                                                                      std::to_string(response.status));
                    }
                    catch (const std::exception &ex)
                    {
                        if (++failures > options_.retry.max_retries)
                        {
                            throw UploadError(ErrorCode::PartUploadFailed, attempt.path,
                                              "Part " + std::to_string(number) + " failed after " +
                                                  std::to_string(failures) + " attempts: " + ex.what(),
                                              std::current_exception());
                        }
                        spdlog::warn("Part {} of {} failed ({}), retry {}/{}", number, attempt.path, ex.what(),
                                     failures, options_.retry.max_retries);
                        std::this_thread::sleep_for(options_.retry.delay);
                        if (!attempt.control.wait_if_paused())
                        {
                            throw Error(ErrorCode::Cancelled, "Upload cancelled");
                        }
                        session.parts = api_.refresh_upload_urls(session);
                    }
                }
            }

            position += part.length;
            if (position > counted)
            {
                attempt.progress.add(position - counted);
                counted = position;
            }
        }

        const auto file = api_.complete_upload(session);
        const auto local_hash = hasher.hex_digest();
        if (file.content_hash && lowercase(*file.content_hash) != local_hash)
        {
            throw UploadError(ErrorCode::ChecksumMismatch, attempt.path,
                              "SHA-1 mismatch: local " + local_hash + ", remote " + *file.content_hash);
        }
    }

    BatchResult Uploader::upload_batch(const std::vector<UploadTask> &tasks, TransferControl &control,
                                       EventChannel *events, RateCounter *rate)
    {
        BatchResult batch;
        batch.files.resize(tasks.size());
        {
            asio::thread_pool pool(std::min<std::size_t>(options_.max_workers, std::max<std::size_t>(tasks.size(), 1)));
            for (std::size_t index = 0; index < tasks.size(); ++index)
            {
                asio::post(pool, [&, index]
                           { batch.files[index] = upload(tasks[index], control, events, rate); });
            }
            pool.join();
        }
        spdlog::info("Batch upload: {} completed, {} skipped, {} failed, {} paused",
                     batch.count(TransferState::Completed), batch.count(TransferState::Skipped),
                     batch.count(TransferState::Failed), batch.count(TransferState::Paused));
        return batch;
    }

} // namespace pandrive
