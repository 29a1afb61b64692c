/**
 * renderxfer - Streaming retrieval of input assets into local files.
 */
#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "renderxfer/http_client.hpp"
#include "renderxfer/object_store.hpp"

namespace renderxfer
{

    class CancellationToken;

    struct DownloadOptions
    {
        // Applies to download_from_url only.
        std::chrono::milliseconds header_timeout{std::chrono::seconds{30}};
    };

    /**
     * Copies remote bytes into a local file without buffering the whole object.
     *
     * On failure the destination may be left partially written; the caller owns the
     * working directory and its cleanup.
     */
    class Downloader
    {
    public:
        Downloader(ObjectStore &store, std::string asset_bucket, HttpClient &http, DownloadOptions options = {});

        void download_from_store(const std::string &object_path, const std::filesystem::path &local_path);

        // Fails with ErrorCode::HttpStatus before opening local_path when the response is
        // not 2xx or carries no body.
        void download_from_url(const std::string &url, const std::filesystem::path &local_path,
                               const CancellationToken *cancel = nullptr);

    private:
        ObjectStore &store_;
        std::string asset_bucket_;
        HttpClient &http_;
        DownloadOptions options_;
    };

} // namespace renderxfer
