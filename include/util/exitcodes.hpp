#pragma once

namespace exitc
{
constexpr int ok        = 0;
constexpr int failed    = 1;  // daemon answered ERR
constexpr int bad_args  = 2;
constexpr int no_server = 3;
}  // namespace exitc
