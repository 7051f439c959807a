#ifndef REVSCOPE_DATE_TIME_H
#define REVSCOPE_DATE_TIME_H

#include <chrono>

namespace revscope {
    using revision_clock = std::chrono::system_clock;
    // Microsecond precision keeps dates past 2262 representable.
    using revision_time_t = std::chrono::time_point<revision_clock, std::chrono::microseconds>;

    inline revision_time_t revision_now() noexcept {
        return std::chrono::time_point_cast<std::chrono::microseconds>(revision_clock::now());
    }
} // namespace revscope

#endif  // REVSCOPE_DATE_TIME_H
