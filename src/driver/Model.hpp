#pragma once
#include <memory>
#include <string>

#include "advection/AdvectionSolverTVD.hpp"
#include "core/BoundaryConditionManager.hpp"
#include "core/Grid.hpp"
#include "utils/ConfigurationManager.hpp"

namespace TVD {
namespace Driver {

class Model {
public:
    explicit Model(const Utils::ConfigurationManager& config);

    void init();
    void run_step(double dt);
    void run();
    void finalize();

    // simulation.dt if given, otherwise
    // simulation.courant_number * min active link length / max |u|
    double compute_time_step() const;

    void log_progress() const;

    Core::Grid& grid() { return *grid_; }
    const Advection::AdvectionSolverTVD& solver() const { return *solver_; }
    size_t step_count() const { return step_count_; }
    double current_time() const { return current_time_; }

private:
    const Utils::ConfigurationManager& config_;
    std::string field_name_;

    std::unique_ptr<Core::Grid> grid_;
    Core::BoundaryConditionManager bc_manager_;
    std::unique_ptr<Advection::AdvectionSolverTVD> solver_;

    size_t step_count_ = 0;
    double current_time_ = 0.0;
};

}
}
