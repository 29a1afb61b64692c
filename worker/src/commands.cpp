#include "renderxfer/worker/commands.hpp"

#include <filesystem>
#include <string>
#include <system_error>

#include "renderxfer/content_disposition.hpp"
#include "renderxfer/digest.hpp"
#include "renderxfer/downloader.hpp"
#include "renderxfer/transfer_error.hpp"
#include "renderxfer/uploader.hpp"

namespace renderxfer::worker
{

    namespace
    {

        std::uint64_t local_file_size(const std::filesystem::path &path)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                throw TransferError(ErrorCode::FileIo, "Not a regular file: " + path.string());
            }
            const auto size = std::filesystem::file_size(path, ec);
            if (ec)
            {
                throw TransferError(ErrorCode::FileIo, "Cannot stat " + path.string() + ": " + ec.message());
            }
            return size;
        }

        nlohmann::json describe_local(const WorkerConfig &config, const std::filesystem::path &path)
        {
            nlohmann::json metadata{{"path", path.string()}, {"sizeBytes", local_file_size(path)}};
            if (config.digest)
            {
                metadata["blake2b"] = digest::hash_file(path);
            }
            return metadata;
        }

        Downloader make_downloader(const WorkerConfig &config, const CommandContext &context)
        {
            return Downloader(context.store, config.asset_bucket, context.http,
                              DownloadOptions{.header_timeout = config.header_timeout});
        }

        void fetch_store(const WorkerConfig &config, const CommandContext &context)
        {
            const auto &object_path = config.positional.at(0);
            const std::filesystem::path local_path(config.positional.at(1));

            context.logger.event("download_start", {{"source", "store"}, {"objectPath", object_path}});
            make_downloader(config, context).download_from_store(object_path, local_path);
            context.logger.event("download_complete", describe_local(config, local_path));
            context.out << "OK" << std::endl;
        }

        void fetch_url(const WorkerConfig &config, const CommandContext &context)
        {
            const auto &url = config.positional.at(0);
            const std::filesystem::path local_path(config.positional.at(1));

            context.logger.event("download_start", {{"source", "url"}, {"url", url}});
            make_downloader(config, context).download_from_url(url, local_path, &context.cancel);
            context.logger.event("download_complete", describe_local(config, local_path));
            context.out << "OK" << std::endl;
        }

        std::string resolve_disposition(const WorkerConfig &config, const std::filesystem::path &local_path)
        {
            if (config.content_disposition)
            {
                return *config.content_disposition;
            }
            if (config.title)
            {
                return make_attachment_disposition(*config.title, local_path.extension().string());
            }
            return {};
        }

        void upload(const WorkerConfig &config, const CommandContext &context)
        {
            const std::filesystem::path local_path(config.positional.at(0));
            const ObjectRef target{.bucket = config.bucket, .key = config.positional.at(1)};

            if (config.skip_existing && context.store.object_exists(target))
            {
                context.logger.event("idempotency_skip", {{"key", target.key}});
                context.out << context.store.presign_get(target, config.url_expiry) << std::endl;
                return;
            }

            auto metadata = describe_local(config, local_path);
            metadata["key"] = target.key;
            context.logger.event("upload_start", metadata);

            Uploader uploader(context.store, context.logger.sink(), config.policy);
            const UploadSpec spec{
                .bucket = target.bucket,
                .key = target.key,
                .file_path = local_path,
                .file_size = metadata.at("sizeBytes").get<std::uint64_t>(),
                .content_type = config.content_type,
                .content_disposition = resolve_disposition(config, local_path),
            };
            const auto strategy = uploader.upload(spec, &context.cancel);

            context.logger.event("upload_complete", {{"key", target.key},
                                                     {"sizeBytes", spec.file_size},
                                                     {"strategy", to_string(strategy)}});
            context.out << context.store.presign_get(target, config.url_expiry) << std::endl;
        }

    } // namespace

    void run_command(const WorkerConfig &config, const CommandContext &context)
    {
        switch (config.command)
        {
        case Command::FetchStore:
            fetch_store(config, context);
            return;
        case Command::FetchUrl:
            fetch_url(config, context);
            return;
        case Command::Upload:
            upload(config, context);
            return;
        case Command::Help:
            break;
        }
        throw TransferError(ErrorCode::InvalidArgument, "No command to run");
    }

} // namespace renderxfer::worker
