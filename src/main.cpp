#include <Kokkos_Core.hpp>
#include <exception>
#include <iostream>

#include "driver/Model.hpp"
#include "utils/ConfigurationManager.hpp"
#include "utils/Timer.hpp"
#include "utils/TimingManager.hpp"

int main(int argc, char *argv[]) {
    int status = 0;
    Kokkos::initialize(argc, argv);
    {
        TVD::Utils::Timer total_timer("total tvd_advection");
        try {
            TVD::Utils::TimingManager::get_instance().start_timer("initialize");
            std::cout << "TVD Advection Simulation Started." << std::endl;

            // Load configuration file
            std::string config_file_path = "../rundata/input_configs/default_config.json";
            if (argc > 1) {
                config_file_path = argv[1]; // Allow command line override
            }

            TVD::Utils::ConfigurationManager config(config_file_path);
            config.print_config();

            TVD::Driver::Model model(config);
            model.init();
            TVD::Utils::TimingManager::get_instance().stop_timer("initialize");

            {
                TVD::Utils::Timer run_timer("run");
                model.run();
            }
            model.finalize();
        }
        catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            status = 1;
        }
    }
    TVD::Utils::TimingManager::get_instance().print_timings(std::cout);
    Kokkos::finalize();
    return status;
}
