#include "core/GridFactory.hpp"
#include "core/HexGrid.hpp"
#include "core/RasterGrid.hpp"

#include <iostream>
#include <stdexcept>

namespace TVD {
namespace Core {

std::unique_ptr<Grid> create_grid(const Utils::ConfigurationManager& config) {
    std::unique_ptr<Grid> grid;
    try {
        const std::string type = config.get_value<std::string>("grid.type", "raster");
        const int nrows = config.get_value<int>("grid.nrows");
        const int ncols = config.get_value<int>("grid.ncols");

        if (type == "raster") {
            const double dx = config.get_value<double>("grid.dx", 1.0);
            const double dy = config.get_value<double>("grid.dy", dx);
            grid = std::make_unique<RasterGrid>(nrows, ncols, dx, dy);
        }
        else if (type == "hex") {
            const double spacing = config.get_value<double>("grid.spacing", 1.0);
            grid = std::make_unique<HexGrid>(nrows, ncols, spacing);
        }
        else {
            throw std::runtime_error("Unknown grid type: " + type);
        }
    }
    catch (const std::exception& e) {
        throw std::runtime_error("Grid creation failed: " + std::string(e.what()));
    }

    std::cout << "Grid initialized successfully." << std::endl;
    return grid;
}

} // namespace Core
} // namespace TVD
