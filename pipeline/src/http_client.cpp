#include "renderxfer/http_client.hpp"

namespace renderxfer
{

    bool status_carries_body(long status) noexcept
    {
        return status >= 200 && status != 204 && status != 205 && status != 304;
    }

} // namespace renderxfer
