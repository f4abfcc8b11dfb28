#include "FluxLimiter.hpp"

#include <stdexcept>
#include <string>

namespace TVD {
namespace Advection {

void upwind_to_local_grad_ratio(const Core::Grid& grid, const Core::Grid::RealView& values_at_node,
                                const Core::Grid::IndexView& upwind_links,
                                const Core::Grid::RealView& out_ratio) {
    const int nlinks = grid.number_of_links();
    if (static_cast<int>(values_at_node.extent(0)) != grid.number_of_nodes() ||
        static_cast<int>(upwind_links.extent(0)) != nlinks ||
        static_cast<int>(out_ratio.extent(0)) != nlinks) {
        throw std::runtime_error("Size mismatch for gradient ratio inputs on a grid with " +
                                 std::to_string(grid.number_of_nodes()) + " nodes and " +
                                 std::to_string(nlinks) + " links");
    }

    const auto& tail = grid.node_at_link_tail();
    const auto& head = grid.node_at_link_head();
    auto s = values_at_node;
    auto upwind = upwind_links;
    auto r = out_ratio;

    Kokkos::parallel_for("upwind_to_local_grad_ratio", Kokkos::RangePolicy<>(0, nlinks),
        KOKKOS_LAMBDA(const int l) {
            const int u = upwind(l);
            if (u == -1) {
                r(l) = 1.0;
                return;
            }
            const double local_diff = s(head(l)) - s(tail(l));
            const double upwind_diff = s(head(u)) - s(tail(u));
            r(l) = guarded_ratio(upwind_diff, local_diff);
        }
    );
    Kokkos::fence();
}

void apply_flux_lim_vanleer(const Core::Grid::RealView& ratio, const Core::Grid::RealView& out_psi) {
    if (ratio.extent(0) != out_psi.extent(0)) {
        throw std::runtime_error("Size mismatch for flux limiter output");
    }
    auto r = ratio;
    auto psi = out_psi;
    Kokkos::parallel_for("flux_lim_vanleer", Kokkos::RangePolicy<>(0, static_cast<int>(r.extent(0))),
        KOKKOS_LAMBDA(const int l) {
            psi(l) = flux_lim_vanleer(r(l));
        }
    );
    Kokkos::fence();
}

} // namespace Advection
} // namespace TVD
