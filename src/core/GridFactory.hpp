#ifndef TVD_CORE_GRID_FACTORY_HPP
#define TVD_CORE_GRID_FACTORY_HPP

#include <memory>

#include "core/Grid.hpp"
#include "utils/ConfigurationManager.hpp"

namespace TVD {
namespace Core {

// Build the grid described by the "grid" block of the configuration:
//   grid.type    "raster" | "hex"
//   grid.nrows, grid.ncols
//   grid.dx, grid.dy (raster), grid.spacing (hex)
std::unique_ptr<Grid> create_grid(const Utils::ConfigurationManager& config);

} // namespace Core
} // namespace TVD

#endif // TVD_CORE_GRID_FACTORY_HPP
