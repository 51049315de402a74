#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace constants
{
// Scan defaults
inline constexpr int                       SCAN_TIMEOUT_DEFAULT_S = 10;
inline constexpr std::chrono::milliseconds SCAN_SLICE{1000};  // one driver process() call
inline constexpr std::size_t               LISTENER_THREADS = 5;

// BlueZ
inline constexpr std::string_view DEFAULT_ADAPTER = "hci0";
inline constexpr std::uint64_t    BUS_CALL_TIMEOUT_USEC = 25'000'000;  // Device1.Connect can be slow

// BlueST feature characteristics: "<mask as %08x>" + FEATURE_UUID_SUFFIX
inline constexpr std::string_view FEATURE_UUID_SUFFIX = "-0001-11e1-ac36-0002a5d5c51b";

// Shown with every permission_denied coming out of a scan
inline constexpr std::string_view PRIVILEGE_HINT =
    "Bluetooth scanning requires root privilege, so please run the program with \"sudo\".";

}  // namespace constants
