#ifndef TVD_UTILS_TIMING_MANAGER_HPP
#define TVD_UTILS_TIMING_MANAGER_HPP

#include <string>
#include <map>
#include <chrono>
#include <ctime>
#include <ostream>

namespace TVD {
namespace Utils {

struct TimingData {
    double wall_time = 0.0;
    double cpu_time = 0.0;
    long long call_count = 0;
    bool running = false;
};

class TimingManager {
public:
    static TimingManager& get_instance();

    void start_timer(const std::string& name);
    void stop_timer(const std::string& name);
    void print_timings(std::ostream& os) const;

    // Returns a default TimingData for events that were never started
    TimingData get_timing(const std::string& name) const;
    void reset();

    TimingManager(const TimingManager&) = delete;
    void operator=(const TimingManager&) = delete;

private:
    TimingManager() = default;
    ~TimingManager() = default;

    std::map<std::string, TimingData> timings_;
    std::map<std::string, std::chrono::high_resolution_clock::time_point> wall_starts_;
    std::map<std::string, clock_t> cpu_starts_;
};

} // namespace Utils
} // namespace TVD

#endif // TVD_UTILS_TIMING_MANAGER_HPP
