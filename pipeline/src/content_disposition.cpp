#include "renderxfer/content_disposition.hpp"

#include <cctype>

namespace renderxfer
{

    namespace
    {

        bool is_unreserved(unsigned char c)
        {
            if (std::isalnum(c))
            {
                return true;
            }
            switch (c)
            {
            case '-':
            case '_':
            case '.':
            case '!':
            case '~':
            case '*':
            case '\'':
            case '(':
            case ')':
                return true;
            default:
                return false;
            }
        }

    } // namespace

    std::string percent_encode(std::string_view value)
    {
        static constexpr char kHexDigits[] = "0123456789ABCDEF";
        std::string result;
        result.reserve(value.size());
        for (const auto ch : value)
        {
            const auto byte = static_cast<unsigned char>(ch);
            if (is_unreserved(byte))
            {
                result.push_back(ch);
                continue;
            }
            result.push_back('%');
            result.push_back(kHexDigits[(byte >> 4) & 0x0F]);
            result.push_back(kHexDigits[byte & 0x0F]);
        }
        return result;
    }

    std::string make_attachment_disposition(std::string_view title, std::string_view extension)
    {
        std::string result = "attachment; filename=\"";
        result += percent_encode(title);
        result += extension;
        result += '"';
        return result;
    }

} // namespace renderxfer
