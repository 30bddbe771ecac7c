#include "pandrive/errors.hpp"

#include <utility>

namespace pandrive
{

    Error::Error(ErrorCode code, const std::string &message)
        : std::runtime_error(message),
          code_(code)
    {
    }

    RemoteApiError::RemoteApiError(int status, std::string remote_code, const std::string &message)
        : Error(ErrorCode::RemoteError, message),
          status_(status),
          remote_code_(std::move(remote_code))
    {
    }

    EncryptionHeaderError::EncryptionHeaderError(const std::string &message)
        : Error(ErrorCode::EncryptionHeaderInvalid, message)
    {
    }

    TransferError::TransferError(ErrorCode code, std::string path, const std::string &message,
                                 std::exception_ptr cause)
        : Error(code, message),
          path_(std::move(path)),
          cause_(std::move(cause))
    {
    }

    std::string describe(std::exception_ptr error)
    {
        if (!error)
        {
            return "unknown error";
        }
        try
        {
            std::rethrow_exception(error);
        }
        catch (const std::exception &ex)
        {
            return ex.what();
        }
        catch (...)
        {
            return "unknown error";
        }
    }

    ErrorCode code_of(std::exception_ptr error)
    {
        if (!error)
        {
            return ErrorCode::InternalError;
        }
        try
        {
            std::rethrow_exception(error);
        }
        catch (const Error &ex)
        {
            return ex.code();
        }
        catch (...)
        {
            return ErrorCode::InternalError;
        }
    }

} // namespace pandrive
