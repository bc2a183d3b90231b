#pragma once

namespace exitc
{
constexpr int ok             = 0;
constexpr int bad_args       = 2;
constexpr int connect_failed = 3;
constexpr int op_failed      = 4;
}  // namespace exitc
