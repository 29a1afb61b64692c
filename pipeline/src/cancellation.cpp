#include "renderxfer/cancellation.hpp"

#include "renderxfer/transfer_error.hpp"

namespace renderxfer
{

    void CancellationToken::throw_if_cancelled() const
    {
        if (cancelled())
        {
            throw TransferError(ErrorCode::Cancelled, "Transfer cancelled");
        }
    }

} // namespace renderxfer
