#include "pandrive/rapid_upload.hpp"

#include <spdlog/spdlog.h>

#include "pandrive/crypto.hpp"
#include "pandrive/errors.hpp"

namespace pandrive
{

    RapidUploadNegotiator::RapidUploadNegotiator(DriveApi &api, std::string access_token)
        : api_(api),
          access_token_(std::move(access_token))
    {
    }

    bool RapidUploadNegotiator::eligible(std::uint64_t size, cipher::CipherKind cipher) noexcept
    {
        return cipher == cipher::CipherKind::None && size >= crypto::kPreHashSize;
    }

    UploadSession RapidUploadNegotiator::negotiate(const std::filesystem::path &local_path,
                                                   const UploadSessionRequest &request)
    {
        const auto path = local_path.string();
        prepared_.reset();
        try
        {
            auto probe = request;
            probe.pre_hash = crypto::pre_hash_file(local_path);
            probe.content_hash.clear();
            probe.proof_code.clear();
            auto prepared = api_.create_upload_session(probe);
            if (prepared.rapid_upload)
            {
                return prepared;
            }
            prepared_ = prepared;
            if (!prepared.pre_hash_matched)
            {
                throw RapidUploadError(ErrorCode::RapidUploadRejected, path, "No remote file shares the pre-hash");
            }

            auto full = request;
            full.pre_hash.clear();
            full.content_hash = crypto::sha1_file(local_path);
            full.proof_code = crypto::proof_code(local_path, request.size, access_token_);
            auto registered = api_.create_upload_session(full);
            if (!registered.rapid_upload)
            {
                throw RapidUploadError(ErrorCode::RapidUploadRejected, path, "Remote refused the content hash");
            }
            spdlog::info("Rapid upload of {} to {} succeeded", path, request.remote_path);
            return registered;
        }
        catch (const RapidUploadError &)
        {
            throw;
        }
        catch (const std::exception &ex)
        {
            throw RapidUploadError(code_of(std::current_exception()), path,
                                   std::string("Rapid upload failed: ") + ex.what(), std::current_exception());
        }
    }

} // namespace pandrive
