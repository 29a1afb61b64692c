#include "renderxfer/downloader.hpp"

#include <fstream>
#include <optional>
#include <utility>

#include "renderxfer/transfer_error.hpp"

namespace renderxfer
{

    namespace
    {

        std::ofstream open_destination(const std::filesystem::path &local_path)
        {
            std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw TransferError(ErrorCode::FileIo, "Could not open download target: " + local_path.string());
            }
            return out;
        }

        void finish_destination(std::ofstream &out, const std::filesystem::path &local_path)
        {
            out.flush();
            out.close();
            if (!out)
            {
                throw TransferError(ErrorCode::FileIo, "Failed to write download target: " + local_path.string());
            }
        }

    } // namespace

    Downloader::Downloader(ObjectStore &store, std::string asset_bucket, HttpClient &http, DownloadOptions options)
        : store_(store),
          asset_bucket_(std::move(asset_bucket)),
          http_(http),
          options_(options)
    {
    }

    void Downloader::download_from_store(const std::string &object_path, const std::filesystem::path &local_path)
    {
        if (object_path.empty())
        {
            throw TransferError(ErrorCode::InvalidArgument, "Object path must not be empty");
        }
        auto out = open_destination(local_path);
        store_.get_object(ObjectRef{.bucket = asset_bucket_, .key = object_path}, out);
        finish_destination(out, local_path);
    }

    void Downloader::download_from_url(const std::string &url, const std::filesystem::path &local_path,
                                       const CancellationToken *cancel)
    {
        if (url.empty())
        {
            throw TransferError(ErrorCode::InvalidArgument, "URL must not be empty");
        }

        std::optional<std::ofstream> out;
        const HttpGetRequest request{.url = url, .header_timeout = options_.header_timeout, .cancel = cancel};

        http_.get(
            request,
            [&](const HttpResponseHead &head)
            {
                if (head.status < 200 || head.status >= 300 || !head.has_body)
                {
                    throw TransferError(ErrorCode::HttpStatus,
                                        "Failed to download " + url + ": HTTP " + std::to_string(head.status),
                                        head.status);
                }
                out.emplace(open_destination(local_path));
            },
            [&](std::span<const std::byte> chunk)
            {
                out->write(reinterpret_cast<const char *>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
                if (!*out)
                {
                    throw TransferError(ErrorCode::FileIo, "Failed to write download target: " + local_path.string());
                }
            });

        if (!out)
        {
            throw TransferError(ErrorCode::Network, "Download of " + url + " ended without a response");
        }
        finish_destination(*out, local_path);
    }

} // namespace renderxfer
