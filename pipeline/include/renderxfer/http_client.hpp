/**
 * renderxfer - Minimal streaming HTTP GET seam used by the URL downloader.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>

namespace renderxfer
{

    class CancellationToken;

    struct HttpResponseHead
    {
        long status{};
        bool has_body{};
        std::optional<std::uint64_t> content_length;
    };

    struct HttpGetRequest
    {
        std::string url;
        // Bounds connection setup and the response headers, not the body transfer.
        std::chrono::milliseconds header_timeout{std::chrono::seconds{30}};
        const CancellationToken *cancel{nullptr};
    };

    class HttpClient
    {
    public:
        using HeadHandler = std::function<void(const HttpResponseHead &head)>;
        using BodyHandler = std::function<void(std::span<const std::byte> chunk)>;

        virtual ~HttpClient() = default;

        // on_head runs exactly once, before any on_body call. An exception thrown by
        // either handler stops the transfer and propagates out of get().
        virtual void get(const HttpGetRequest &request, const HeadHandler &on_head, const BodyHandler &on_body) = 0;
    };

    // False for statuses that never carry a body (1xx, 204, 205, 304).
    bool status_carries_body(long status) noexcept;

} // namespace renderxfer
