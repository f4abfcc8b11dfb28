#include "Initializer.hpp"

#include <Kokkos_Core.hpp>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace TVD {
namespace Core {

Initializer::Initializer(const Utils::ConfigurationManager& config, Grid& grid, std::string scalar_name)
    : config_(config), grid_(grid), scalar_name_(std::move(scalar_name)) {
    if (!grid_.has_field_at_node(scalar_name_)) {
        throw std::runtime_error("Initializer: field '" + scalar_name_ + "' not found at node.");
    }
    if (!grid_.has_field_at_link("advection__velocity")) {
        throw std::runtime_error("Initializer: field 'advection__velocity' not found at link.");
    }
}

void Initializer::initialize_state() const {
    initialize_scalar();
    initialize_velocity();
}

void Initializer::initialize_scalar() const {
    const std::string prefix = "initial_conditions.scalar.";
    const std::string shape = config_.get_value<std::string>(prefix + "shape", "uniform");

    auto& scalar = grid_.at_node(scalar_name_).get_mutable_device_data();
    const auto& x = grid_.x_of_node();
    const auto& y = grid_.y_of_node();
    const int nnodes = grid_.number_of_nodes();

    if (shape == "gaussian") {
        const double amplitude = config_.get_value<double>(prefix + "amplitude", 1.0);
        const double background = config_.get_value<double>(prefix + "background", 0.0);
        const double x0 = config_.get_value<double>(prefix + "x0");
        const double y0 = config_.get_value<double>(prefix + "y0");
        const double width = config_.get_value<double>(prefix + "width");
        if (width <= 0.0) {
            throw std::runtime_error("Initializer: gaussian width must be positive.");
        }
        Kokkos::parallel_for("init_gaussian", Kokkos::RangePolicy<>(0, nnodes),
            KOKKOS_LAMBDA(const int n) {
                const double rx = x(n) - x0;
                const double ry = y(n) - y0;
                scalar(n) = background + amplitude * Kokkos::exp(-(rx*rx + ry*ry) / (2.0 * width * width));
            }
        );
    }
    else if (shape == "step") {
        const double value = config_.get_value<double>(prefix + "value", 1.0);
        const double background = config_.get_value<double>(prefix + "background", 0.0);
        const double xmin = config_.get_value<double>(prefix + "xmin");
        const double xmax = config_.get_value<double>(prefix + "xmax");
        const double ymin = config_.get_value<double>(prefix + "ymin");
        const double ymax = config_.get_value<double>(prefix + "ymax");
        Kokkos::parallel_for("init_step", Kokkos::RangePolicy<>(0, nnodes),
            KOKKOS_LAMBDA(const int n) {
                const bool inside = x(n) >= xmin && x(n) <= xmax && y(n) >= ymin && y(n) <= ymax;
                scalar(n) = inside ? value : background;
            }
        );
    }
    else if (shape == "uniform") {
        grid_.at_node(scalar_name_).fill(config_.get_value<double>(prefix + "value", 0.0));
    }
    else {
        throw std::runtime_error("Initializer: unknown scalar shape '" + shape + "'.");
    }
    Kokkos::fence();
    std::cout << "Initialized '" << scalar_name_ << "' with shape '" << shape << "'." << std::endl;
}

void Initializer::initialize_velocity() const {
    const double vx = config_.get_value<double>("initial_conditions.velocity.vx", 0.0);
    const double vy = config_.get_value<double>("initial_conditions.velocity.vy", 0.0);

    auto& u = grid_.at_link("advection__velocity").get_mutable_device_data();
    const auto& x = grid_.x_of_node();
    const auto& y = grid_.y_of_node();
    const auto& tail = grid_.node_at_link_tail();
    const auto& head = grid_.node_at_link_head();
    const auto& length = grid_.length_of_link();

    Kokkos::parallel_for("init_link_velocity", Kokkos::RangePolicy<>(0, grid_.number_of_links()),
        KOKKOS_LAMBDA(const int l) {
            const double ex = (x(head(l)) - x(tail(l))) / length(l);
            const double ey = (y(head(l)) - y(tail(l))) / length(l);
            u(l) = vx * ex + vy * ey;
        }
    );
    Kokkos::fence();
    std::cout << "Initialized link velocity from (vx, vy) = (" << vx << ", " << vy << ")." << std::endl;
}

} // namespace Core
} // namespace TVD
