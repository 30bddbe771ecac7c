/**
 * PanDrive - Exception taxonomy of the transfer engine.
 *
 * Transient failures (TransportError, some RemoteApiError statuses) are retried
 * by the component that issued the request; once a RetryPolicy is exhausted the
 * last cause is wrapped into a DownloadError or UploadError and propagated.
 * RapidUploadError never leaves the uploader.
 */
#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "pandrive/error_codes.hpp"

namespace pandrive
{

    class Error : public std::runtime_error
    {
    public:
        Error(ErrorCode code, const std::string &message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

    class TransportError : public Error
    {
    public:
        using Error::Error;
    };

    class RemoteApiError : public Error
    {
    public:
        RemoteApiError(int status, std::string remote_code, const std::string &message);

        int status() const noexcept { return status_; }
        const std::string &remote_code() const noexcept { return remote_code_; }

    private:
        int status_;
        std::string remote_code_;
    };

    // Raised for a header that claims to be ours but cannot be used. A wrong
    // password is never reported here.
    class EncryptionHeaderError : public Error
    {
    public:
        explicit EncryptionHeaderError(const std::string &message);
    };

    class TransferError : public Error
    {
    public:
        TransferError(ErrorCode code, std::string path, const std::string &message,
                      std::exception_ptr cause = nullptr);

        const std::string &path() const noexcept { return path_; }
        std::exception_ptr cause() const noexcept { return cause_; }

    private:
        std::string path_;
        std::exception_ptr cause_;
    };

    class DownloadError : public TransferError
    {
    public:
        using TransferError::TransferError;
    };

    class UploadError : public TransferError
    {
    public:
        using TransferError::TransferError;
    };

    class RapidUploadError : public TransferError
    {
    public:
        using TransferError::TransferError;
    };

    // Message of the exception held by `error`, or "unknown error".
    std::string describe(std::exception_ptr error);

    // Code carried by a pandrive::Error inside `error`, InternalError otherwise.
    ErrorCode code_of(std::exception_ptr error);

} // namespace pandrive
