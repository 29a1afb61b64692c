#pragma once

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <functional>
#include <thread>

#include "renderxfer/cancellation.hpp"

namespace renderxfer::worker
{

    // Turns SIGINT/SIGTERM into a cancellation request for the running transfer.
    // A repeated signal calls on_repeat; without one the default disposition is
    // restored and the signal re-raised, so a second Ctrl-C ends the process.
    class SignalWatcher
    {
    public:
        SignalWatcher(CancellationToken &token, std::function<void(int signal)> on_signal,
                      std::function<void(int signal)> on_repeat = {});
        ~SignalWatcher();

        SignalWatcher(const SignalWatcher &) = delete;
        SignalWatcher &operator=(const SignalWatcher &) = delete;

    private:
        void arm();
        void handle_signal(int signal);

        CancellationToken &token_;
        std::function<void(int)> on_signal_;
        std::function<void(int)> on_repeat_;
        int received_{0};
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::thread thread_;
    };

} // namespace renderxfer::worker
