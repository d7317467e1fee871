#pragma once

#include <chrono>
#include <cstdint>

namespace hc {

inline std::uint64_t unixMillis() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // namespace hc
