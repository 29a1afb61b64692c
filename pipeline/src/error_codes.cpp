#include "renderxfer/error_codes.hpp"

#include <array>

namespace renderxfer
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::FileIo, "file_io"},
            {ErrorCode::HttpStatus, "http_status"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::Network, "network"},
            {ErrorCode::RemoteStore, "remote_store"},
            {ErrorCode::MissingUploadId, "missing_upload_id"},
            {ErrorCode::PartLimitExceeded, "part_limit_exceeded"},
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

} // namespace renderxfer
