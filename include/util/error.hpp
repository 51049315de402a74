#pragma once
#include <string>
#include <utility>

namespace bluest
{

enum class Errc
{
    ok = 0,
    permission_denied,        // scan/connect needs elevated privilege
    invalid_mask,             // feature mask is not a single bit
    already_exists,           // second manager, duplicate node tag
    driver_failure,           // any other fault of the radio stack
    malformed_advertisement,  // payload of one peer is not in the expected format
    not_connected,
    not_found,
};

struct Error
{
    Errc        code{Errc::ok};
    int         sys{0};  // negative errno from the driver, 0 if none
    std::string message;

    explicit operator bool() const { return code != Errc::ok; }
};

const char *errc_name(Errc c);

inline Error make_error(Errc code, std::string message, int sys = 0)
{
    return Error{code, sys, std::move(message)};
}

// Fill an optional out-parameter. Returns false so callers can `return set_error(...)`.
inline bool set_error(Error *out, Errc code, std::string message, int sys = 0)
{
    if (out)
        *out = Error{code, sys, std::move(message)};
    return false;
}

inline bool set_error(Error *out, const Error &e)
{
    if (out)
        *out = e;
    return false;
}

std::string to_string(const Error &e);

}  // namespace bluest
