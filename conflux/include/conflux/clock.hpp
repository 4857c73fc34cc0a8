#ifndef CONFLUX_CLOCK_HPP
#define CONFLUX_CLOCK_HPP

#include <conflux/types.hpp>
#include <chrono>
#include <memory>

namespace conflux {

/**
 * Source of wall-clock time for reservation ages, deadlines and branch timestamps.
 */
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual TimePoint now() const = 0;
};

class SystemTimeSource : public TimeSource {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }
};

inline std::shared_ptr<TimeSource> default_time_source() {
    static std::shared_ptr<TimeSource> instance = std::make_shared<SystemTimeSource>();
    return instance;
}

inline double minutes_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::ratio<60>>(to - from).count();
}

inline std::int64_t to_epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace conflux

#endif // CONFLUX_CLOCK_HPP
