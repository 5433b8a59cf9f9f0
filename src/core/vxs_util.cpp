/**
 * @file vxs_util.cpp
 * @brief VoxStream Core - Clock and identifier helpers
 */

#include "voxstream/core/vxs_util.h"

#include <iomanip>
#include <random>
#include <sstream>

namespace voxstream {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               Clock::now().time_since_epoch())
        .count();
}

double elapsed_ms(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

std::string generate_id(const std::string& prefix) {
    thread_local std::random_device rd;
    thread_local std::mt19937_64 gen(rd());
    thread_local std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream ss;
    ss << prefix << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return ss.str();
}

}  // namespace voxstream
