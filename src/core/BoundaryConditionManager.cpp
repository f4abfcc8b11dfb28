#include "core/BoundaryConditionManager.hpp"

#include <iostream>
#include <stdexcept>

namespace TVD {
namespace Core {

BoundaryConditionManager::BoundaryConditionManager(EdgeBoundaryType right_bc, EdgeBoundaryType top_bc,
                                                   EdgeBoundaryType left_bc, EdgeBoundaryType bottom_bc)
    : right_bc_(right_bc), top_bc_(top_bc), left_bc_(left_bc), bottom_bc_(bottom_bc) {}

BoundaryConditionManager::BoundaryConditionManager(const Utils::ConfigurationManager& config) {
    EdgeBoundaryType default_bc = EdgeBoundaryType::FIXED_VALUE;
    if (config.has_key("boundary_conditions.default")) {
        default_bc = string_to_bc_type(config.get_value<std::string>("boundary_conditions.default"));
    }

    auto read_edge = [&](const std::string& edge_name) {
        const std::string key = "boundary_conditions." + edge_name;
        if (config.has_key(key)) {
            return string_to_bc_type(config.get_value<std::string>(key));
        }
        return default_bc;
    };

    right_bc_ = read_edge("right");
    top_bc_ = read_edge("top");
    left_bc_ = read_edge("left");
    bottom_bc_ = read_edge("bottom");
}

EdgeBoundaryType BoundaryConditionManager::string_to_bc_type(const std::string& bc_string) {
    if (bc_string == "FIXED_VALUE") return EdgeBoundaryType::FIXED_VALUE;
    if (bc_string == "CLOSED") return EdgeBoundaryType::CLOSED;
    throw std::runtime_error("Unknown boundary condition type: " + bc_string);
}

EdgeBoundaryType BoundaryConditionManager::get_bc(GridEdge edge) const {
    switch (edge) {
        case GridEdge::RIGHT: return right_bc_;
        case GridEdge::TOP: return top_bc_;
        case GridEdge::LEFT: return left_bc_;
        case GridEdge::BOTTOM: return bottom_bc_;
    }
    return EdgeBoundaryType::FIXED_VALUE;
}

void BoundaryConditionManager::apply(Grid& grid) const {
    grid.set_closed_boundaries_at_grid_edges(right_bc_ == EdgeBoundaryType::CLOSED,
                                             top_bc_ == EdgeBoundaryType::CLOSED,
                                             left_bc_ == EdgeBoundaryType::CLOSED,
                                             bottom_bc_ == EdgeBoundaryType::CLOSED);
    std::cout << "Boundary conditions applied: " << grid.number_of_core_nodes() << " core nodes, "
              << grid.number_of_active_links() << " active links." << std::endl;
}

} // namespace Core
} // namespace TVD
