/**
 * renderxfer - Content-Disposition helpers for rendered output.
 */
#pragma once

#include <string>
#include <string_view>

namespace renderxfer
{

    // Percent-encodes every byte outside A-Z a-z 0-9 - _ . ! ~ * ' ( )
    std::string percent_encode(std::string_view value);

    // attachment; filename="<percent-encoded title><extension>"
    std::string make_attachment_disposition(std::string_view title, std::string_view extension);

} // namespace renderxfer
