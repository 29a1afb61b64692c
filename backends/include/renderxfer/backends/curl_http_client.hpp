/**
 * renderxfer - HttpClient implemented with libcurl's easy interface.
 */
#pragma once

#include <string>

#include "renderxfer/http_client.hpp"

namespace renderxfer::backends
{

    // curl_global_init / curl_global_cleanup for the lifetime of the process.
    class CurlGlobalGuard
    {
    public:
        CurlGlobalGuard();
        ~CurlGlobalGuard();

        CurlGlobalGuard(const CurlGlobalGuard &) = delete;
        CurlGlobalGuard &operator=(const CurlGlobalGuard &) = delete;
    };

    class CurlHttpClient : public HttpClient
    {
    public:
        explicit CurlHttpClient(std::string user_agent);

        // Follows redirects. The header timeout is enforced until the final response's
        // header block has been received; the body may take as long as it takes.
        void get(const HttpGetRequest &request, const HeadHandler &on_head, const BodyHandler &on_body) override;

    private:
        std::string user_agent_;
    };

} // namespace renderxfer::backends
