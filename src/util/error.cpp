#include "util/error.hpp"

#include <cstring>

namespace bluest
{

const char *errc_name(Errc c)
{
    switch (c)
    {
        case Errc::ok:
            return "ok";
        case Errc::permission_denied:
            return "permission_denied";
        case Errc::invalid_mask:
            return "invalid_mask";
        case Errc::already_exists:
            return "already_exists";
        case Errc::driver_failure:
            return "driver_failure";
        case Errc::malformed_advertisement:
            return "malformed_advertisement";
        case Errc::not_connected:
            return "not_connected";
        case Errc::not_found:
            return "not_found";
    }
    return "?";
}

std::string to_string(const Error &e)
{
    std::string s = errc_name(e.code);
    if (!e.message.empty())
        s += ": " + e.message;
    if (e.sys != 0)
        s += std::string(" (") + std::strerror(-e.sys) + ")";
    return s;
}

}  // namespace bluest
