#pragma once

namespace exitc
{
inline constexpr int ok              = 0;
inline constexpr int bad_args        = 2;
inline constexpr int no_server       = 3;
inline constexpr int io_error        = 4;
inline constexpr int finalize_failed = 5;
inline constexpr int not_ready       = 6;  // chunkctl health while tasks are loading
}  // namespace exitc
