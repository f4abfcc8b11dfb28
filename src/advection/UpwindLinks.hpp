// Upwind link resolution.
// For every link, find the parallel active link that lies upstream of it for
// the current flow direction. Positive velocity means flow from tail to head,
// so the upstream neighbour is the tail-wise parallel link (column 0 of
// Grid::parallel_links_at_link); negative velocity uses the head-wise one
// (column 1). Links with no valid upstream link get -1.

#ifndef TVD_ADVECTION_UPWIND_LINKS_HPP
#define TVD_ADVECTION_UPWIND_LINKS_HPP

#include <Kokkos_Core.hpp>
#include <variant>

#include "core/Grid.hpp"

namespace TVD {
namespace Advection {

// Same velocity sign on every link
struct UniformPositive {};
struct UniformNegative {};

// Velocity value per link
struct PerLink {
    Kokkos::View<const double*> values;
};

using VelocitySpec = std::variant<UniformPositive, UniformNegative, PerLink>;

// v >= 0 gives UniformPositive
VelocitySpec make_velocity_spec(double velocity);
VelocitySpec make_velocity_spec(const Kokkos::View<const double*>& velocity_at_link);

void find_upwind_link_at_link(const Core::Grid& grid, const VelocitySpec& velocity,
                              const Core::Grid::IndexView& out_upwind_links);

Core::Grid::IndexView find_upwind_link_at_link(const Core::Grid& grid, const VelocitySpec& velocity);

} // namespace Advection
} // namespace TVD

#endif // TVD_ADVECTION_UPWIND_LINKS_HPP
