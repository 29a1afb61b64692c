#include "renderxfer/transfer_error.hpp"

namespace renderxfer
{

    TransferError::TransferError(ErrorCode code, const std::string &message, std::optional<long> http_status)
        : std::runtime_error(message),
          code_(code),
          http_status_(http_status)
    {
    }

} // namespace renderxfer
