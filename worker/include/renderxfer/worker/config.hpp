#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "renderxfer/backends/s3_object_store.hpp"
#include "renderxfer/part_plan.hpp"

namespace renderxfer::worker
{

    enum class Command
    {
        Help,
        FetchStore,
        FetchUrl,
        Upload
    };

    struct WorkerConfig
    {
        Command command{Command::Help};
        std::vector<std::string> positional;

        std::optional<std::filesystem::path> log_path;
        backends::S3Settings s3;
        std::string bucket;
        std::string asset_bucket;
        UploadPolicy policy;
        std::chrono::seconds header_timeout{30};
        bool digest{false};

        std::string content_type{"video/mp4"};
        std::optional<std::string> title;
        std::optional<std::string> content_disposition;
        bool skip_existing{false};
        std::chrono::seconds url_expiry{std::chrono::hours{24}};
    };

    using EnvLookup = std::function<std::optional<std::string>(const std::string &name)>;

    WorkerConfig parse_arguments(const std::vector<std::string> &args, const EnvLookup &env);

    WorkerConfig parse_arguments(int argc, char *argv[]);

    std::string usage(const std::string &program_name);

} // namespace renderxfer::worker
