#include "AdvectionSolverTVD.hpp"
#include "FluxLimiter.hpp"
#include "UpwindLinks.hpp"
#include "utils/Timer.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace TVD {
namespace Advection {

namespace {
const std::string VELOCITY_FIELD = "advection__velocity";
const std::string FLUX_FIELD = "advection__flux";

Core::Grid::RealView node_field_values(const Core::Grid& grid, const std::string& name) {
    if (!grid.has_field_at_node(name)) {
        throw std::runtime_error("AdvectionSolverTVD: field '" + name + "' not found at node.");
    }
    return grid.at_node(name).get_device_data();
}
}

AdvectionSolverTVD::AdvectionSolverTVD(Core::Grid& grid, std::string field_to_advect,
                                       bool advection_direction_is_steady)
    : AdvectionSolverTVD(grid, field_to_advect, node_field_values(grid, field_to_advect),
                         advection_direction_is_steady) {}

AdvectionSolverTVD::AdvectionSolverTVD(Core::Grid& grid, Core::Grid::RealView values_at_node,
                                       bool advection_direction_is_steady)
    : AdvectionSolverTVD(grid, std::string(), std::move(values_at_node), advection_direction_is_steady) {}

AdvectionSolverTVD::AdvectionSolverTVD(Core::Grid& grid, std::string field_to_advect,
                                       Core::Grid::RealView values_at_node, bool advection_direction_is_steady)
    : grid_(grid),
      field_to_advect_(std::move(field_to_advect)),
      values_(std::move(values_at_node)),
      advection_direction_is_steady_(advection_direction_is_steady),
      upwind_link_at_link_("upwind_link_at_link", grid.number_of_links()),
      low_face_value_("low_face_value", grid.number_of_links()),
      high_face_value_("high_face_value", grid.number_of_links()),
      courant_("courant", grid.number_of_links()),
      ratio_("ratio", grid.number_of_links()),
      psi_("psi", grid.number_of_links()),
      rate_of_change_("rate_of_change", grid.number_of_nodes()) {

    if (!grid_.has_field_at_link(VELOCITY_FIELD)) {
        throw std::runtime_error("AdvectionSolverTVD: field '" + VELOCITY_FIELD + "' not found at link.");
    }
    if (static_cast<int>(values_.extent(0)) != grid_.number_of_nodes()) {
        throw std::runtime_error("AdvectionSolverTVD: advected values have " + std::to_string(values_.extent(0)) +
                                 " entries, grid has " + std::to_string(grid_.number_of_nodes()) + " nodes.");
    }
    if (!grid_.has_field_at_link(FLUX_FIELD)) {
        grid_.add_field_at_link(FLUX_FIELD);
    }

    if (advection_direction_is_steady_) {
        update_upwind_links();
    }
}

void AdvectionSolverTVD::update_upwind_links() {
    const auto& u = grid_.at_link(VELOCITY_FIELD).get_device_data();
    find_upwind_link_at_link(grid_, make_velocity_spec(u), upwind_link_at_link_);
    upwind_status_version_ = grid_.status_version();
}

const Core::Grid::RealView& AdvectionSolverTVD::flux_at_link() const {
    return grid_.at_link(FLUX_FIELD).get_device_data();
}

const Core::Grid::RealView& AdvectionSolverTVD::calc_rate_of_change_at_nodes(double dt) {
    Utils::Timer timer("tvd_rate_of_change");

    // A steady map still goes stale when node statuses change
    if (!advection_direction_is_steady_ || upwind_status_version_ != grid_.status_version()) {
        update_upwind_links();
    }

    const auto& s = values_;
    const auto& u = grid_.at_link(VELOCITY_FIELD).get_device_data();
    auto& flux = grid_.at_link(FLUX_FIELD).get_mutable_device_data();

    grid_.map_node_to_link_linear_upwind(s, u, low_face_value_);

    const auto& length = grid_.length_of_link();
    auto courant = courant_;
    Kokkos::parallel_for("link_courant_number", Kokkos::RangePolicy<>(0, grid_.number_of_links()),
        KOKKOS_LAMBDA(const int l) {
            courant(l) = dt * u(l) / length(l);
        }
    );
    Kokkos::fence();
    grid_.map_node_to_link_lax_wendroff(s, courant_, high_face_value_);

    upwind_to_local_grad_ratio(grid_, s, upwind_link_at_link_, ratio_);
    apply_flux_lim_vanleer(ratio_, psi_);

    const auto& active_links = grid_.active_links();
    auto low = low_face_value_;
    auto high = high_face_value_;
    auto psi = psi_;
    Kokkos::parallel_for("tvd_flux_at_active_links", Kokkos::RangePolicy<>(0, grid_.number_of_active_links()),
        KOKKOS_LAMBDA(const int i) {
            const int l = active_links(i);
            const double face_value = psi(l) * high(l) + (1.0 - psi(l)) * low(l);
            flux(l) = u(l) * face_value;
        }
    );
    Kokkos::fence();

    grid_.calc_flux_div_at_node(flux, rate_of_change_);

    auto roc = rate_of_change_;
    Kokkos::parallel_for("negate_flux_divergence", Kokkos::RangePolicy<>(0, grid_.number_of_nodes()),
        KOKKOS_LAMBDA(const int n) {
            roc(n) = -roc(n);
        }
    );
    Kokkos::fence();
    return rate_of_change_;
}

void AdvectionSolverTVD::update(double dt) {
    const auto& roc = calc_rate_of_change_at_nodes(dt);

    Utils::Timer timer("tvd_update");
    auto s = values_;
    const auto& core_nodes = grid_.core_nodes();
    Kokkos::parallel_for("tvd_update_core_nodes", Kokkos::RangePolicy<>(0, grid_.number_of_core_nodes()),
        KOKKOS_LAMBDA(const int i) {
            const int n = core_nodes(i);
            s(n) += roc(n) * dt;
        }
    );
    Kokkos::fence();
}

void AdvectionSolverTVD::run_one_step(double dt) {
    update(dt);
}

} // namespace Advection
} // namespace TVD
