/**
 * renderxfer - Cooperative cancellation flag shared between a signal handler and a transfer.
 */
#pragma once

#include <atomic>

namespace renderxfer
{

    class CancellationToken
    {
    public:
        void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

        bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

        // Throws TransferError(ErrorCode::Cancelled) once cancel() has been called.
        void throw_if_cancelled() const;

    private:
        std::atomic<bool> cancelled_{false};
    };

} // namespace renderxfer
