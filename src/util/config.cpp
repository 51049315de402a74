#include "util/config.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

#include "util/constants.hpp"
#include "util/log.hpp"

namespace bluest
{

bool parse_uint_in_range(const char *s, unsigned long lo, unsigned long hi, unsigned long &out)
{
    if (!s || !*s || *s == '-' || *s == '+')
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s, &p, 10);
    if (!p || *p != '\0' || v < lo || v > hi)
        return false;
    out = v;
    return true;
}

Config load_config_from_env()
{
    Config cfg;
    cfg.adapter          = std::string(constants::DEFAULT_ADAPTER);
    cfg.scan_timeout_s   = constants::SCAN_TIMEOUT_DEFAULT_S;
    cfg.listener_threads = constants::LISTENER_THREADS;

    if (const char *d = std::getenv("BLUEST_DRIVER"); d && *d)
    {
        if (std::strcmp(d, "bluez") == 0 || std::strcmp(d, "sim") == 0)
            cfg.driver = d;
        else
            LOG_WARN("Ignoring unknown BLUEST_DRIVER='%s' (expect bluez|sim)", d);
    }
    if (const char *a = std::getenv("BLUEST_ADAPTER"); a && *a)
        cfg.adapter = a;

    if (const char *e = std::getenv("BLUEST_SCAN_TIMEOUT"))
    {
        unsigned long v = 0;
        if (parse_uint_in_range(e, 1, 3600, v))
            cfg.scan_timeout_s = static_cast<int>(v);
        else
            LOG_WARN("Ignoring invalid BLUEST_SCAN_TIMEOUT='%s' (expect 1..3600)", e);
    }
    if (const char *e = std::getenv("BLUEST_LISTENER_THREADS"))
    {
        unsigned long v = 0;
        if (parse_uint_in_range(e, 1, 64, v))
            cfg.listener_threads = static_cast<std::size_t>(v);
        else
            LOG_WARN("Ignoring invalid BLUEST_LISTENER_THREADS='%s' (expect 1..64)", e);
    }
    return cfg;
}

}  // namespace bluest
