#pragma once

#include <ostream>

#include "renderxfer/cancellation.hpp"
#include "renderxfer/http_client.hpp"
#include "renderxfer/object_store.hpp"
#include "renderxfer/worker/config.hpp"
#include "renderxfer/worker/logger.hpp"

namespace renderxfer::worker
{

    struct CommandContext
    {
        ObjectStore &store;
        HttpClient &http;
        const CancellationToken &cancel;
        Logger &logger;
        std::ostream &out;
    };

    // Runs config.command; failures propagate as exceptions.
    void run_command(const WorkerConfig &config, const CommandContext &context);

} // namespace renderxfer::worker
