/**
 * renderxfer - Error codes shared by the pipeline, its backends and the worker.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace renderxfer
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        FileIo = 2,
        HttpStatus = 3,
        Timeout = 4,
        Network = 5,
        RemoteStore = 6,
        MissingUploadId = 7,
        PartLimitExceeded = 8,
        Cancelled = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

} // namespace renderxfer
