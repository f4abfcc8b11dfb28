// HexGrid: hexagonal grid with horizontal rows of nodes in a rectangular
// layout. Odd rows are shifted right by half a spacing, so every interior node
// has six neighbours at distance `spacing`. Links point rightward along rows
// and upward between rows, and are numbered by link midpoint (y, then x).

#ifndef TVD_CORE_HEX_GRID_HPP
#define TVD_CORE_HEX_GRID_HPP

#include "Grid.hpp"

namespace TVD {
namespace Core {

class HexGrid : public Grid {
public:
    HexGrid(int nrows, int ncols, double spacing = 1.0);

    std::string type_name() const override { return "Hex"; }

    int node_at(int row, int col) const { return row * ncols_ + col; }

    std::vector<int> nodes_at_edge(GridEdge edge) const override;

private:
    static GridTopology build_topology(int nrows, int ncols, double spacing);

    int nrows_;
    int ncols_;
};

} // namespace Core
} // namespace TVD

#endif // TVD_CORE_HEX_GRID_HPP
