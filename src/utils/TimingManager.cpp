#include "TimingManager.hpp"
#include <iomanip>

namespace TVD {
namespace Utils {

TimingManager& TimingManager::get_instance() {
    static TimingManager instance;
    return instance;
}

void TimingManager::start_timer(const std::string& name) {
    if (!timings_[name].running) {
        wall_starts_[name] = std::chrono::high_resolution_clock::now();
        cpu_starts_[name] = clock();
        timings_[name].running = true;
    }
}

void TimingManager::stop_timer(const std::string& name) {
    if (timings_[name].running) {
        auto wall_end = std::chrono::high_resolution_clock::now();
        auto cpu_end = clock();

        std::chrono::duration<double> wall_duration = wall_end - wall_starts_[name];
        double cpu_duration = static_cast<double>(cpu_end - cpu_starts_[name]) / CLOCKS_PER_SEC;

        timings_[name].wall_time += wall_duration.count();
        timings_[name].cpu_time += cpu_duration;
        timings_[name].call_count++;
        timings_[name].running = false;
    }
}

TimingData TimingManager::get_timing(const std::string& name) const {
    auto it = timings_.find(name);
    if (it == timings_.end()) {
        return TimingData{};
    }
    return it->second;
}

void TimingManager::reset() {
    timings_.clear();
    wall_starts_.clear();
    cpu_starts_.clear();
}

void TimingManager::print_timings(std::ostream& os) const {
    os << "\n TIMINGS (event,running,calls,cpu,wall)\n";
    for (const auto& pair : timings_) {
        const auto& data = pair.second;
        os << "      " << std::left << std::setw(28) << pair.first
           << (data.running ? 'T' : 'F')
           << std::right << std::setw(10) << data.call_count
           << std::fixed << std::setprecision(4)
           << std::setw(15) << data.cpu_time
           << std::setw(15) << data.wall_time << '\n';
    }
    os.flush();
}

} // namespace Utils
} // namespace TVD
