#include "renderxfer/backends/curl_http_client.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <string_view>
#include <utility>

#include <curl/curl.h>

#include "renderxfer/cancellation.hpp"
#include "renderxfer/transfer_error.hpp"

namespace renderxfer::backends
{

    namespace
    {

        struct TransferContext
        {
            CURL *handle{nullptr};
            const HttpClient::HeadHandler &on_head;
            const HttpClient::BodyHandler &on_body;
            const CancellationToken *cancel{nullptr};
            std::chrono::steady_clock::time_point started{std::chrono::steady_clock::now()};
            std::chrono::milliseconds header_timeout{};
            bool location_seen{false};
            bool head_delivered{false};
            bool timed_out{false};
            bool cancelled{false};
            std::exception_ptr error;
        };

        bool starts_with_ci(std::string_view line, std::string_view prefix)
        {
            if (line.size() < prefix.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < prefix.size(); ++i)
            {
                const auto a = static_cast<char>(line[i] | 0x20);
                const auto b = static_cast<char>(prefix[i] | 0x20);
                if (a != b)
                {
                    return false;
                }
            }
            return true;
        }

        HttpResponseHead read_head(CURL *handle)
        {
            long status = 0;
            curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
            curl_off_t length = -1;
            curl_easy_getinfo(handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);

            HttpResponseHead head{.status = status, .has_body = status_carries_body(status)};
            if (length >= 0)
            {
                head.content_length = static_cast<std::uint64_t>(length);
            }
            return head;
        }

        bool deliver_head(TransferContext &ctx)
        {
            ctx.head_delivered = true;
            try
            {
                ctx.on_head(read_head(ctx.handle));
                return true;
            }
            catch (...)
            {
                ctx.error = std::current_exception();
                return false;
            }
        }

        std::size_t header_callback(char *buffer, std::size_t size, std::size_t nitems, void *userdata)
        {
            auto &ctx = *static_cast<TransferContext *>(userdata);
            const auto total = size * nitems;
            const std::string_view line(buffer, total);

            if (starts_with_ci(line, "HTTP/"))
            {
                ctx.location_seen = false;
                return total;
            }
            if (starts_with_ci(line, "location:"))
            {
                ctx.location_seen = true;
                return total;
            }
            if (line != "\r\n" && line != "\n")
            {
                return total;
            }

            long status = 0;
            curl_easy_getinfo(ctx.handle, CURLINFO_RESPONSE_CODE, &status);
            // Interim responses and followed redirects have header blocks of their own.
            if (status < 200 || (status >= 300 && status < 400 && ctx.location_seen))
            {
                return total;
            }
            if (!ctx.head_delivered && !deliver_head(ctx))
            {
                return 0;
            }
            return total;
        }

        std::size_t write_callback(char *buffer, std::size_t size, std::size_t nmemb, void *userdata)
        {
            auto &ctx = *static_cast<TransferContext *>(userdata);
            const auto total = size * nmemb;
            if (!ctx.head_delivered && !deliver_head(ctx))
            {
                return 0;
            }
            try
            {
                ctx.on_body(std::as_bytes(std::span(buffer, total)));
            }
            catch (...)
            {
                ctx.error = std::current_exception();
                return 0;
            }
            return total;
        }

        int progress_callback(void *userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/,
                              curl_off_t /*ulnow*/)
        {
            auto &ctx = *static_cast<TransferContext *>(userdata);
            if (ctx.cancel && ctx.cancel->cancelled())
            {
                ctx.cancelled = true;
                return 1;
            }
            if (!ctx.head_delivered && std::chrono::steady_clock::now() - ctx.started > ctx.header_timeout)
            {
                ctx.timed_out = true;
                return 1;
            }
            return 0;
        }

    } // namespace

    CurlGlobalGuard::CurlGlobalGuard()
    {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw TransferError(ErrorCode::InternalError, "curl_global_init failed");
        }
    }

    CurlGlobalGuard::~CurlGlobalGuard()
    {
        curl_global_cleanup();
    }

    CurlHttpClient::CurlHttpClient(std::string user_agent)
        : user_agent_(std::move(user_agent))
    {
    }

    void CurlHttpClient::get(const HttpGetRequest &request, const HeadHandler &on_head, const BodyHandler &on_body)
    {
        std::unique_ptr<CURL, void (*)(CURL *)> handle(curl_easy_init(), &curl_easy_cleanup);
        if (!handle)
        {
            throw TransferError(ErrorCode::InternalError, "curl_easy_init failed");
        }

        TransferContext ctx{
            .handle = handle.get(),
            .on_head = on_head,
            .on_body = on_body,
            .cancel = request.cancel,
            .header_timeout = request.header_timeout,
        };
        char error_buffer[CURL_ERROR_SIZE] = {};

        CURL *curl = handle.get();
        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.header_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, &progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        const auto result = curl_easy_perform(curl);

        if (ctx.error)
        {
            std::rethrow_exception(ctx.error);
        }
        if (ctx.cancelled)
        {
            throw TransferError(ErrorCode::Cancelled, "Download of " + request.url + " cancelled");
        }
        if (ctx.timed_out || result == CURLE_OPERATION_TIMEDOUT)
        {
            throw TransferError(ErrorCode::Timeout, "Timed out waiting for response headers from " + request.url);
        }
        if (result != CURLE_OK)
        {
            const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(result);
            throw TransferError(ErrorCode::Network, "GET " + request.url + " failed: " + detail);
        }
        if (!ctx.head_delivered)
        {
            on_head(read_head(curl));
        }
    }

} // namespace renderxfer::backends
