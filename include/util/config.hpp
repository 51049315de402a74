#pragma once
#include <cstddef>
#include <string>

namespace bluest
{

// Process configuration, read from BLUEST_* environment variables.
struct Config
{
    std::string driver           = "bluez";  // "bluez" | "sim"
    std::string adapter          = "hci0";
    int         scan_timeout_s   = 10;
    std::size_t listener_threads = 5;
};

Config load_config_from_env();

// Parse an unsigned decimal in [lo, hi]. Returns false (and leaves out alone) otherwise.
bool parse_uint_in_range(const char *s, unsigned long lo, unsigned long hi, unsigned long &out);

}  // namespace bluest
