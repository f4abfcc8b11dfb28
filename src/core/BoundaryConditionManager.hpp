#ifndef TVD_CORE_BOUNDARYCONDITIONMANAGER_HPP
#define TVD_CORE_BOUNDARYCONDITIONMANAGER_HPP

#include "core/Grid.hpp"
#include "utils/ConfigurationManager.hpp"

namespace TVD {
namespace Core {

enum class EdgeBoundaryType {
    FIXED_VALUE,    // Open edge, values held by the caller
    CLOSED          // No flux through links attached to the edge
};

class BoundaryConditionManager {
public:
    explicit BoundaryConditionManager(EdgeBoundaryType right_bc = EdgeBoundaryType::FIXED_VALUE,
                                      EdgeBoundaryType top_bc = EdgeBoundaryType::FIXED_VALUE,
                                      EdgeBoundaryType left_bc = EdgeBoundaryType::FIXED_VALUE,
                                      EdgeBoundaryType bottom_bc = EdgeBoundaryType::FIXED_VALUE);

    // Reads boundary_conditions.{right,top,left,bottom}, falling back to
    // boundary_conditions.default and then to FIXED_VALUE.
    explicit BoundaryConditionManager(const Utils::ConfigurationManager& config);

    void apply(Grid& grid) const;

    EdgeBoundaryType get_bc(GridEdge edge) const;

    static EdgeBoundaryType string_to_bc_type(const std::string& bc_string);

private:
    EdgeBoundaryType right_bc_;
    EdgeBoundaryType top_bc_;
    EdgeBoundaryType left_bc_;
    EdgeBoundaryType bottom_bc_;
};

} // namespace Core
} // namespace TVD

#endif // TVD_CORE_BOUNDARYCONDITIONMANAGER_HPP
