/**
 * PanDrive - Error codes shared by the transfer engine and the client.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace pandrive
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        NotFound = 2,
        AlreadyExists = 3,
        UrlExpired = 4,
        RetriesExhausted = 5,
        IncompleteRead = 6,
        ChecksumMismatch = 7,
        ResumeStateInvalid = 8,
        PartUploadFailed = 9,
        SessionExpired = 10,
        RapidUploadRejected = 11,
        EncryptionHeaderInvalid = 12,
        ConnectionReset = 13,
        Timeout = 14,
        ProtocolError = 15,
        RemoteError = 16,
        FileIo = 17,
        Cancelled = 18,
        InternalError = 19
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

} // namespace pandrive
