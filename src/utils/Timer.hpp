#ifndef TVD_UTILS_TIMER_HPP
#define TVD_UTILS_TIMER_HPP

#include <string>
#include "TimingManager.hpp"

namespace TVD {
namespace Utils {

// Scoped timer: starts the named event on construction, stops it on destruction.
class Timer {
public:
    explicit Timer(const std::string& name);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

private:
    std::string name_;
};

} // namespace Utils
} // namespace TVD

#endif // TVD_UTILS_TIMER_HPP
