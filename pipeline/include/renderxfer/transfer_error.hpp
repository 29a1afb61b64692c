/**
 * renderxfer - Exception type raised by every transfer operation.
 */
#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "renderxfer/error_codes.hpp"

namespace renderxfer
{

    class TransferError : public std::runtime_error
    {
    public:
        TransferError(ErrorCode code, const std::string &message, std::optional<long> http_status = std::nullopt);

        ErrorCode code() const noexcept { return code_; }

        // Set only for ErrorCode::HttpStatus.
        std::optional<long> http_status() const noexcept { return http_status_; }

    private:
        ErrorCode code_;
        std::optional<long> http_status_;
    };

} // namespace renderxfer
