#pragma once

namespace exitc
{
inline constexpr int ok          = 0;
inline constexpr int bad_args    = 2;
inline constexpr int no_device   = 3;
inline constexpr int no_perm     = 4;
inline constexpr int driver_fail = 5;
}  // namespace exitc
