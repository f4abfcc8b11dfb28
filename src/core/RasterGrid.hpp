// RasterGrid: rectilinear grid of nrows x ncols nodes.
//
// Node id = row * ncols + col. Links point from left to right and from bottom
// to top, and are numbered row by row: the ncols-1 horizontal links of row r
// come first, followed by the ncols vertical links joining row r to row r+1.
// For a 3x4 grid:
//
//   *-14-*-15-*-16-*
//   |    |    |    |
//   10  11   12   13
//   |    |    |    |
//   *--7-*--8-*--9-*
//   |    |    |    |
//   3    4    5    6
//   |    |    |    |
//   *--0-*--1-*--2-*

#ifndef TVD_CORE_RASTER_GRID_HPP
#define TVD_CORE_RASTER_GRID_HPP

#include "Grid.hpp"

namespace TVD {
namespace Core {

class RasterGrid : public Grid {
public:
    RasterGrid(int nrows, int ncols, double dx = 1.0, double dy = 1.0);

    std::string type_name() const override { return "Raster"; }

    int node_at(int row, int col) const { return row * ncols_ + col; }

    std::vector<int> nodes_at_edge(GridEdge edge) const override;

private:
    static GridTopology build_topology(int nrows, int ncols, double dx, double dy);

    int nrows_;
    int ncols_;
};

} // namespace Core
} // namespace TVD

#endif // TVD_CORE_RASTER_GRID_HPP
