/**
 * @file vxs_util.h
 * @brief VoxStream Core - Clock and identifier helpers
 */

#ifndef VOXSTREAM_CORE_UTIL_H
#define VOXSTREAM_CORE_UTIL_H

#include <chrono>
#include <cstdint>
#include <string>

namespace voxstream {

using Clock = std::chrono::steady_clock;

/** Monotonic clock in milliseconds. */
int64_t now_ms();

/** Milliseconds elapsed since start, with sub-millisecond precision. */
double elapsed_ms(Clock::time_point start);

/** Random identifier: prefix followed by 16 hex digits. */
std::string generate_id(const std::string& prefix);

}  // namespace voxstream

#endif  // VOXSTREAM_CORE_UTIL_H
