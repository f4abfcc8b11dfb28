#include "Model.hpp"

#include <Kokkos_Core.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

#include "core/GridFactory.hpp"
#include "core/Initializer.hpp"
#include "utils/Timer.hpp"

namespace TVD {
namespace Driver {

Model::Model(const Utils::ConfigurationManager& config)
    : config_(config),
      field_name_(config.get_value<std::string>("advection.field_name", "advected__quantity")),
      grid_(Core::create_grid(config)),
      bc_manager_(config)
{
    bc_manager_.apply(*grid_);
    grid_->add_field_at_node(field_name_);
    grid_->add_field_at_link("advection__velocity");
    grid_->print_info();
}

void Model::init() {
    std::cout << "\n=== Initializing TVD Advection Model ===" << std::endl;

    std::cout << "Loading Initial Conditions..." << std::endl;
    Core::Initializer initializer(config_, *grid_, field_name_);
    initializer.initialize_state();

    // Built after the velocity is known, so a steady direction map is correct.
    solver_ = std::make_unique<Advection::AdvectionSolverTVD>(
        *grid_, field_name_, config_.get_value<bool>("advection.advection_direction_is_steady", false));

    std::cout << "=== Model Initialization Complete ===\n" << std::endl;
}

double Model::compute_time_step() const {
    if (config_.has_key("simulation.dt")) {
        const double dt = config_.get_value<double>("simulation.dt");
        if (dt <= 0.0) {
            throw std::runtime_error("simulation.dt must be positive.");
        }
        return dt;
    }

    const double courant_number = config_.get_value<double>("simulation.courant_number", 0.2);
    const auto& u = grid_->at_link("advection__velocity").get_device_data();
    const auto& active_links = grid_->active_links();
    double max_speed = 0.0;
    Kokkos::parallel_reduce("max_active_link_speed", Kokkos::RangePolicy<>(0, grid_->number_of_active_links()),
        KOKKOS_LAMBDA(const int i, double& local_max) {
            const double speed = Kokkos::abs(u(active_links(i)));
            if (speed > local_max) local_max = speed;
        }, Kokkos::Max<double>(max_speed));

    if (max_speed <= 0.0) {
        throw std::runtime_error("Cannot derive a time step from a zero velocity field; set simulation.dt.");
    }
    return courant_number * grid_->min_length_of_active_link() / max_speed;
}

void Model::run_step(double dt) {
    if (!solver_) {
        throw std::runtime_error("Model::run_step called before Model::init.");
    }
    solver_->run_one_step(dt);
    current_time_ += dt;
    ++step_count_;
}

void Model::run() {
    if (!solver_) {
        throw std::runtime_error("Model::run called before Model::init.");
    }
    const double total_time = config_.get_value<double>("simulation.total_time");
    if (total_time <= 0.0) {
        throw std::runtime_error("simulation.total_time must be positive.");
    }
    const int log_interval = config_.get_value<int>("simulation.log_interval", 10);
    const double max_dt = compute_time_step();
    // Equal steps no longer than max_dt that end exactly on total_time
    const int n_steps = std::max(1, static_cast<int>(std::ceil(total_time / max_dt * (1.0 - 1.0e-12))));
    const double dt = total_time / n_steps;
    std::cout << "Time step: " << dt << ", steps: " << n_steps << ", total time: " << total_time << std::endl;

    log_progress();
    for (int step = 0; step < n_steps; ++step) {
        run_step(dt);
        if (log_interval > 0 && step_count_ % log_interval == 0) {
            log_progress();
        }
    }
    log_progress();
}

void Model::log_progress() const {
    const auto& s = grid_->at_node(field_name_).get_device_data();
    double min_value = 0.0;
    double max_value = 0.0;
    Kokkos::parallel_reduce("field_min", Kokkos::RangePolicy<>(0, grid_->number_of_nodes()),
        KOKKOS_LAMBDA(const int n, double& local_min) {
            if (s(n) < local_min) local_min = s(n);
        }, Kokkos::Min<double>(min_value));
    Kokkos::parallel_reduce("field_max", Kokkos::RangePolicy<>(0, grid_->number_of_nodes()),
        KOKKOS_LAMBDA(const int n, double& local_max) {
            if (s(n) > local_max) local_max = s(n);
        }, Kokkos::Max<double>(max_value));
    const double mass = grid_->integrate_at_core_nodes(s);

    std::cout << "step " << step_count_ << ", t = " << current_time_
              << ", min = " << min_value << ", max = " << max_value
              << ", mass = " << mass << std::endl;
}

void Model::finalize() {
    solver_.reset();
    std::cout << "Simulation finished after " << step_count_ << " steps." << std::endl;
}

}
}
