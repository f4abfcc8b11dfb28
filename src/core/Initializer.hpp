#ifndef TVD_CORE_INITIALIZER_HPP
#define TVD_CORE_INITIALIZER_HPP

#include <string>

#include "Grid.hpp"
#include "utils/ConfigurationManager.hpp"

namespace TVD {
namespace Core {

// Fills the advected scalar at nodes and the advection velocity at links from
// the "initial_conditions" block of the configuration.
class Initializer {
public:
    Initializer(const Utils::ConfigurationManager& config, Grid& grid, std::string scalar_name);

    void initialize_state() const;
    void initialize_scalar() const;
    void initialize_velocity() const;

private:
    const Utils::ConfigurationManager& config_;
    Grid& grid_;
    std::string scalar_name_;
};

} // namespace Core
} // namespace TVD

#endif // TVD_CORE_INITIALIZER_HPP
