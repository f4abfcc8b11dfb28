// AdvectionSolverTVD advances a scalar at grid nodes with a total variation
// diminishing finite-volume scheme. Face values on links blend a first-order
// upwind value and a second-order Lax-Wendroff value with the van Leer limiter,
// so that sharp fronts are transported without spurious over- or undershoots.
//
// The grid must hold the link field "advection__velocity". The advected scalar
// is either a node field of the grid, given by name, or any view with one value
// per node. The link field "advection__flux" is created if missing and
// overwritten on active links at every evaluation.
//
// No CFL check is made; the caller picks a stable dt.

#ifndef TVD_ADVECTION_ADVECTION_SOLVER_TVD_HPP
#define TVD_ADVECTION_ADVECTION_SOLVER_TVD_HPP

#include <string>

#include "core/Grid.hpp"

namespace TVD {
namespace Advection {

class AdvectionSolverTVD {
public:
    AdvectionSolverTVD(Core::Grid& grid, std::string field_to_advect,
                       bool advection_direction_is_steady = false);
    AdvectionSolverTVD(Core::Grid& grid, Core::Grid::RealView values_at_node,
                       bool advection_direction_is_steady = false);

    AdvectionSolverTVD(const AdvectionSolverTVD&) = delete;
    AdvectionSolverTVD& operator=(const AdvectionSolverTVD&) = delete;

    // Rate of change of the advected field at every node. Fills
    // advection__flux on active links as a side effect. The returned view is
    // owned by the solver and reused by the next call.
    const Core::Grid::RealView& calc_rate_of_change_at_nodes(double dt);

    // s[core] += roc[core] * dt
    void update(double dt);
    void run_one_step(double dt);

    // Empty when the solver was built from a view
    const std::string& field_to_advect() const { return field_to_advect_; }
    const Core::Grid::RealView& values_at_node() const { return values_; }
    bool advection_direction_is_steady() const { return advection_direction_is_steady_; }
    const Core::Grid::IndexView& upwind_link_at_link() const { return upwind_link_at_link_; }
    const Core::Grid::RealView& flux_at_link() const;

private:
    AdvectionSolverTVD(Core::Grid& grid, std::string field_to_advect, Core::Grid::RealView values_at_node,
                       bool advection_direction_is_steady);

    void update_upwind_links();

    Core::Grid& grid_;
    std::string field_to_advect_;
    Core::Grid::RealView values_;
    bool advection_direction_is_steady_;
    int upwind_status_version_ = -1;

    Core::Grid::IndexView upwind_link_at_link_;
    Core::Grid::RealView low_face_value_;
    Core::Grid::RealView high_face_value_;
    Core::Grid::RealView courant_;
    Core::Grid::RealView ratio_;
    Core::Grid::RealView psi_;
    Core::Grid::RealView rate_of_change_;
};

} // namespace Advection
} // namespace TVD

#endif // TVD_ADVECTION_ADVECTION_SOLVER_TVD_HPP
