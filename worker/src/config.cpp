#include "renderxfer/worker/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace renderxfer::worker
{

    namespace
    {

        std::optional<std::string> system_env(const std::string &name)
        {
            if (const char *value = std::getenv(name.c_str()))
            {
                return std::string(value);
            }
            return std::nullopt;
        }

        std::string require_value(const std::vector<std::string> &args, std::size_t &index, const std::string &flag)
        {
            if (index >= args.size())
            {
                throw std::runtime_error(flag + " requires a value");
            }
            return args[index++];
        }

        std::uint64_t parse_positive(const std::string &value, const std::string &flag)
        {
            try
            {
                std::size_t consumed = 0;
                const auto parsed = std::stoull(value, &consumed);
                if (consumed != value.size() || parsed == 0)
                {
                    throw std::invalid_argument(value);
                }
                return parsed;
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(flag + " expects a positive integer, got '" + value + "'");
            }
        }

        Command command_from_string(const std::string &value)
        {
            if (value == "fetch-store")
            {
                return Command::FetchStore;
            }
            if (value == "fetch-url")
            {
                return Command::FetchUrl;
            }
            if (value == "upload")
            {
                return Command::Upload;
            }
            if (value == "help")
            {
                return Command::Help;
            }
            throw std::runtime_error("Unknown command: " + value);
        }

        void apply_environment(WorkerConfig &config, const EnvLookup &env)
        {
            if (auto value = env("R2_ENDPOINT"))
            {
                config.s3.endpoint = *value;
            }
            if (auto value = env("R2_REGION"))
            {
                config.s3.region = *value;
            }
            if (auto value = env("R2_ACCESS_KEY_ID"))
            {
                config.s3.access_key_id = *value;
            }
            if (auto value = env("R2_SECRET_ACCESS_KEY"))
            {
                config.s3.secret_access_key = *value;
            }
            if (auto value = env("R2_BUCKET_NAME"))
            {
                config.bucket = *value;
            }
            if (auto value = env("ASSET_STORAGE_BUCKET"))
            {
                config.asset_bucket = *value;
            }
        }

        void check_positional(const WorkerConfig &config)
        {
            switch (config.command)
            {
            case Command::Help:
                return;
            case Command::FetchStore:
                if (config.positional.size() != 2)
                {
                    throw std::runtime_error("Usage: fetch-store <object-path> <local-path>");
                }
                if (config.asset_bucket.empty())
                {
                    throw std::runtime_error("fetch-store needs --asset-bucket or ASSET_STORAGE_BUCKET");
                }
                return;
            case Command::FetchUrl:
                if (config.positional.size() != 2)
                {
                    throw std::runtime_error("Usage: fetch-url <url> <local-path>");
                }
                return;
            case Command::Upload:
                if (config.positional.size() != 2)
                {
                    throw std::runtime_error("Usage: upload <local-path> <key>");
                }
                if (config.bucket.empty())
                {
                    throw std::runtime_error("upload needs --bucket or R2_BUCKET_NAME");
                }
                if (config.title && config.content_disposition)
                {
                    throw std::runtime_error("--title and --content-disposition are mutually exclusive");
                }
                return;
            }
        }

    } // namespace

    WorkerConfig parse_arguments(const std::vector<std::string> &args, const EnvLookup &env)
    {
        WorkerConfig config;
        apply_environment(config, env);

        bool have_command = false;
        std::size_t index = 0;
        while (index < args.size())
        {
            const std::string arg = args[index++];
            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value(args, index, arg));
            }
            else if (arg == "--endpoint")
            {
                config.s3.endpoint = require_value(args, index, arg);
            }
            else if (arg == "--region")
            {
                config.s3.region = require_value(args, index, arg);
            }
            else if (arg == "--bucket")
            {
                config.bucket = require_value(args, index, arg);
            }
            else if (arg == "--asset-bucket")
            {
                config.asset_bucket = require_value(args, index, arg);
            }
            else if (arg == "--threshold")
            {
                config.policy.threshold = parse_positive(require_value(args, index, arg), arg);
            }
            else if (arg == "--part-size")
            {
                config.policy.part_size = parse_positive(require_value(args, index, arg), arg);
            }
            else if (arg == "--header-timeout")
            {
                config.header_timeout =
                    std::chrono::seconds(static_cast<long long>(parse_positive(require_value(args, index, arg), arg)));
            }
            else if (arg == "--digest")
            {
                config.digest = true;
            }
            else if (arg == "--content-type")
            {
                config.content_type = require_value(args, index, arg);
            }
            else if (arg == "--title")
            {
                config.title = require_value(args, index, arg);
            }
            else if (arg == "--content-disposition")
            {
                config.content_disposition = require_value(args, index, arg);
            }
            else if (arg == "--skip-existing")
            {
                config.skip_existing = true;
            }
            else if (arg == "--url-expiry")
            {
                config.url_expiry =
                    std::chrono::seconds(static_cast<long long>(parse_positive(require_value(args, index, arg), arg)));
            }
            else if (arg == "--help" || arg == "-h")
            {
                config.command = Command::Help;
                config.positional.clear();
                return config;
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (!have_command)
            {
                config.command = command_from_string(arg);
                have_command = true;
            }
            else
            {
                config.positional.push_back(arg);
            }
        }

        if (!have_command)
        {
            throw std::runtime_error("Missing command");
        }
        check_positional(config);
        return config;
    }

    WorkerConfig parse_arguments(int argc, char *argv[])
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        return parse_arguments(args, &system_env);
    }

    std::string usage(const std::string &program_name)
    {
        return "Usage: " + program_name +
               " [options] <command> <args>\n"
               "Commands:\n"
               "  fetch-store <object-path> <local-path>\n"
               "  fetch-url <url> <local-path>\n"
               "  upload <local-path> <key>\n"
               "Options:\n"
               "  --endpoint <url> --region <name> --bucket <name> --asset-bucket <name>\n"
               "  --log <file> --threshold <bytes> --part-size <bytes> --header-timeout <seconds> --digest\n"
               "  --content-type <type> --title <title> | --content-disposition <value>\n"
               "  --skip-existing --url-expiry <seconds>\n"
               "Environment: R2_ENDPOINT R2_REGION R2_ACCESS_KEY_ID R2_SECRET_ACCESS_KEY R2_BUCKET_NAME "
               "ASSET_STORAGE_BUCKET\n";
    }

} // namespace renderxfer::worker
