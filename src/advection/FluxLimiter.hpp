// Smoothness ratio and van Leer flux limiter.

#ifndef TVD_ADVECTION_FLUX_LIMITER_HPP
#define TVD_ADVECTION_FLUX_LIMITER_HPP

#include <Kokkos_Core.hpp>

#include "core/Grid.hpp"

namespace TVD {
namespace Advection {

// Ratio reported when the local difference vanishes but the upwind one does not
constexpr double LARGE_RATIO = 1.0e30;

// psi(r) = (r + |r|) / (1 + |r|)
KOKKOS_INLINE_FUNCTION
double flux_lim_vanleer(double r) {
    const double abs_r = Kokkos::abs(r);
    return (r + abs_r) / (1.0 + abs_r);
}

KOKKOS_INLINE_FUNCTION
double guarded_ratio(double upwind_diff, double local_diff) {
    if (local_diff != 0.0) return upwind_diff / local_diff;
    return (upwind_diff != 0.0) ? LARGE_RATIO : 0.0;
}

// r = (s[head(U)] - s[tail(U)]) / (s[head(L)] - s[tail(L)]) with U the upwind
// link of L. Links without an upwind link get r = 1.
void upwind_to_local_grad_ratio(const Core::Grid& grid, const Core::Grid::RealView& values_at_node,
                                const Core::Grid::IndexView& upwind_links,
                                const Core::Grid::RealView& out_ratio);

void apply_flux_lim_vanleer(const Core::Grid::RealView& ratio, const Core::Grid::RealView& out_psi);

} // namespace Advection
} // namespace TVD

#endif // TVD_ADVECTION_FLUX_LIMITER_HPP
