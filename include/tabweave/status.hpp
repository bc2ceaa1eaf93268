#pragma once

#include <string>
#include <string_view>

namespace tabweave
{

enum class ErrorCode : int
{
    Ok                = 0,
    InvalidWindow     = 1,
    NotFound          = 2,
    ResourceExhausted = 3,
    NoSuchSurface     = 4,
    TransferFailed    = 5,
    InvalidArgument   = 6,
    Unsupported       = 7,
};

const char* error_code_name(ErrorCode code);

// Result of an orchestration operation.  A TransferFailed status keeps the
// error that triggered the rollback in `cause`.
struct Status
{
    ErrorCode   code  = ErrorCode::Ok;
    std::string message;
    ErrorCode   cause = ErrorCode::Ok;

    bool ok() const { return code == ErrorCode::Ok; }
    explicit operator bool() const { return ok(); }

    static Status success() { return {}; }
    static Status error(ErrorCode code, std::string message)
    {
        return Status{code, std::move(message), ErrorCode::Ok};
    }
    static Status transfer_failed(const Status& original)
    {
        return Status{ErrorCode::TransferFailed, original.message, original.code};
    }

    // "NotFound: tab 7 is unknown"
    std::string to_string() const;
};

}   // namespace tabweave
