#include <tabweave/status.hpp>

namespace tabweave
{

const char* error_code_name(ErrorCode code)
{
    switch (code)
    {
        case ErrorCode::Ok:
            return "Ok";
        case ErrorCode::InvalidWindow:
            return "InvalidWindow";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::ResourceExhausted:
            return "ResourceExhausted";
        case ErrorCode::NoSuchSurface:
            return "NoSuchSurface";
        case ErrorCode::TransferFailed:
            return "TransferFailed";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::Unsupported:
            return "Unsupported";
    }
    return "Unknown";
}

std::string Status::to_string() const
{
    if (ok())
        return "Ok";
    std::string out = error_code_name(code);
    if (cause != ErrorCode::Ok)
    {
        out += " (cause: ";
        out += error_code_name(cause);
        out += ")";
    }
    if (!message.empty())
    {
        out += ": ";
        out += message;
    }
    return out;
}

}   // namespace tabweave
