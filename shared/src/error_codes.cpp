#include "pandrive/error_codes.hpp"

#include <array>

namespace pandrive
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 20> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::UrlExpired, "url_expired"},
            {ErrorCode::RetriesExhausted, "retries_exhausted"},
            {ErrorCode::IncompleteRead, "incomplete_read"},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch"},
            {ErrorCode::ResumeStateInvalid, "resume_state_invalid"},
            {ErrorCode::PartUploadFailed, "part_upload_failed"},
            {ErrorCode::SessionExpired, "session_expired"},
            {ErrorCode::RapidUploadRejected, "rapid_upload_rejected"},
            {ErrorCode::EncryptionHeaderInvalid, "encryption_header_invalid"},
            {ErrorCode::ConnectionReset, "connection_reset"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::RemoteError, "remote_error"},
            {ErrorCode::FileIo, "file_io"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

} // namespace pandrive
