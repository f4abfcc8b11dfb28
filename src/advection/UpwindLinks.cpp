#include "UpwindLinks.hpp"

#include <stdexcept>
#include <string>

namespace TVD {
namespace Advection {

VelocitySpec make_velocity_spec(double velocity) {
    if (velocity >= 0.0) return UniformPositive{};
    return UniformNegative{};
}

VelocitySpec make_velocity_spec(const Kokkos::View<const double*>& velocity_at_link) {
    return PerLink{velocity_at_link};
}

void find_upwind_link_at_link(const Core::Grid& grid, const VelocitySpec& velocity,
                              const Core::Grid::IndexView& out_upwind_links) {
    const int nlinks = grid.number_of_links();
    if (static_cast<int>(out_upwind_links.extent(0)) != nlinks) {
        throw std::runtime_error("Size mismatch for upwind links: expected " + std::to_string(nlinks) +
                                 ", got " + std::to_string(out_upwind_links.extent(0)));
    }

    const auto& pll = grid.parallel_links_at_link().get_device_data();
    auto upwind = out_upwind_links;

    if (std::holds_alternative<UniformPositive>(velocity)) {
        Kokkos::parallel_for("upwind_links_positive", Kokkos::RangePolicy<>(0, nlinks),
            KOKKOS_LAMBDA(const int l) {
                upwind(l) = pll(l, 0);
            }
        );
    }
    else if (std::holds_alternative<UniformNegative>(velocity)) {
        Kokkos::parallel_for("upwind_links_negative", Kokkos::RangePolicy<>(0, nlinks),
            KOKKOS_LAMBDA(const int l) {
                upwind(l) = pll(l, 1);
            }
        );
    }
    else if (const auto* per_link = std::get_if<PerLink>(&velocity)) {
        auto u = per_link->values;
        if (static_cast<int>(u.extent(0)) != nlinks) {
            throw std::runtime_error("Size mismatch for link velocity: expected " + std::to_string(nlinks) +
                                     ", got " + std::to_string(u.extent(0)));
        }
        Kokkos::parallel_for("upwind_links_per_link", Kokkos::RangePolicy<>(0, nlinks),
            KOKKOS_LAMBDA(const int l) {
                upwind(l) = (u(l) < 0.0) ? pll(l, 1) : pll(l, 0);
            }
        );
    }
    Kokkos::fence();
}

Core::Grid::IndexView find_upwind_link_at_link(const Core::Grid& grid, const VelocitySpec& velocity) {
    Core::Grid::IndexView upwind("upwind_link_at_link", grid.number_of_links());
    find_upwind_link_at_link(grid, velocity, upwind);
    return upwind;
}

} // namespace Advection
} // namespace TVD
