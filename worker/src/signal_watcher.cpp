#include "renderxfer/worker/signal_watcher.hpp"

#include <csignal>
#include <utility>

namespace renderxfer::worker
{

    SignalWatcher::SignalWatcher(CancellationToken &token, std::function<void(int signal)> on_signal,
                                 std::function<void(int signal)> on_repeat)
        : token_(token),
          on_signal_(std::move(on_signal)),
          on_repeat_(std::move(on_repeat)),
          signals_(io_context_)
    {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        arm();
        thread_ = std::thread([this]
                              { io_context_.run(); });
    }

    SignalWatcher::~SignalWatcher()
    {
        std::error_code ec;
        signals_.cancel(ec);
        io_context_.stop();
        if (thread_.joinable())
        {
            thread_.join();
        }
    }

    void SignalWatcher::arm()
    {
        signals_.async_wait([this](const std::error_code &ec, int signal)
                            {
        if (!ec) {
            handle_signal(signal);
        } });
    }

    void SignalWatcher::handle_signal(int signal)
    {
        if (++received_ == 1)
        {
            token_.cancel();
            if (on_signal_)
            {
                on_signal_(signal);
            }
            arm();
            return;
        }

        if (on_repeat_)
        {
            on_repeat_(signal);
            arm();
            return;
        }
        // Clearing the set hands the signal back to its default action.
        std::error_code ec;
        signals_.clear(ec);
        std::raise(signal);
    }

} // namespace renderxfer::worker
