#include <cstdlib>
#include <iostream>
#include <string>

#include "renderxfer/backends/curl_http_client.hpp"
#include "renderxfer/backends/s3_object_store.hpp"
#include "renderxfer/cancellation.hpp"
#include "renderxfer/transfer_error.hpp"
#include "renderxfer/version.hpp"
#include "renderxfer/worker/commands.hpp"
#include "renderxfer/worker/config.hpp"
#include "renderxfer/worker/logger.hpp"
#include "renderxfer/worker/signal_watcher.hpp"

int main(int argc, char *argv[])
{
    using namespace renderxfer;
    using namespace renderxfer::worker;

    WorkerConfig config;
    try
    {
        config = parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << '\n'
                  << usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (config.command == Command::Help)
    {
        std::cout << "renderxfer worker " << version() << '\n'
                  << usage(argv[0]);
        return EXIT_SUCCESS;
    }

    Logger logger(config.log_path);
    try
    {
        backends::AwsApiGuard aws;
        backends::CurlGlobalGuard curl;
        backends::S3ObjectStore store(config.s3);
        backends::CurlHttpClient http("renderxfer/" + std::string(version()));

        CancellationToken cancel;
        SignalWatcher watcher(cancel, [&logger](int signal)
                              { logger.event("cancellation_received", {{"signal", signal}}); });

        logger.event("start", {{"version", version()}, {"args", config.positional}});
        run_command(config, CommandContext{
                                .store = store,
                                .http = http,
                                .cancel = cancel,
                                .logger = logger,
                                .out = std::cout,
                            });
    }
    catch (const TransferError &ex)
    {
        logger.error("failed", ex.what());
        std::cerr << "ERROR: " << to_string(ex.code()) << '\n'
                  << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        logger.error("failed", ex.what());
        std::cerr << "ERROR: " << to_string(ErrorCode::InternalError) << '\n'
                  << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
