#include "RasterGrid.hpp"

#include <stdexcept>

namespace TVD {
namespace Core {

GridTopology RasterGrid::build_topology(int nrows, int ncols, double dx, double dy) {
    if (nrows < 2 || ncols < 2) {
        throw std::runtime_error("Raster grid needs at least 2 rows and 2 columns, got " +
                                 std::to_string(nrows) + "x" + std::to_string(ncols) + ".");
    }
    if (dx <= 0.0 || dy <= 0.0) {
        throw std::runtime_error("Raster grid spacing must be positive.");
    }

    GridTopology topo;
    const int n_nodes = nrows * ncols;
    topo.x_of_node.resize(n_nodes);
    topo.y_of_node.resize(n_nodes);
    topo.area_of_cell_at_node.assign(n_nodes, 0.0);
    topo.status_at_node.assign(n_nodes, NodeStatus::CORE);

    auto is_perimeter = [nrows, ncols](int row, int col) {
        return row == 0 || col == 0 || row == nrows - 1 || col == ncols - 1;
    };

    for (int row = 0; row < nrows; ++row) {
        for (int col = 0; col < ncols; ++col) {
            const int node = row * ncols + col;
            topo.x_of_node[node] = col * dx;
            topo.y_of_node[node] = row * dy;
            if (is_perimeter(row, col)) {
                topo.status_at_node[node] = NodeStatus::FIXED_VALUE;
            }
            else {
                topo.area_of_cell_at_node[node] = dx * dy;
            }
        }
    }

    for (int row = 0; row < nrows; ++row) {
        for (int col = 0; col < ncols - 1; ++col) {
            topo.node_at_link_tail.push_back(row * ncols + col);
            topo.node_at_link_head.push_back(row * ncols + col + 1);
            // A link crosses a face only if one of its nodes owns a cell
            const bool has_face = !is_perimeter(row, col) || !is_perimeter(row, col + 1);
            topo.width_of_face_at_link.push_back(has_face ? dy : 0.0);
        }
        if (row == nrows - 1) break;
        for (int col = 0; col < ncols; ++col) {
            topo.node_at_link_tail.push_back(row * ncols + col);
            topo.node_at_link_head.push_back((row + 1) * ncols + col);
            const bool has_face = !is_perimeter(row, col) || !is_perimeter(row + 1, col);
            topo.width_of_face_at_link.push_back(has_face ? dx : 0.0);
        }
    }
    return topo;
}

RasterGrid::RasterGrid(int nrows, int ncols, double dx, double dy)
    : Grid(build_topology(nrows, ncols, dx, dy)), nrows_(nrows), ncols_(ncols) {}

std::vector<int> RasterGrid::nodes_at_edge(GridEdge edge) const {
    std::vector<int> nodes;
    switch (edge) {
        case GridEdge::RIGHT:
            for (int row = 0; row < nrows_; ++row) nodes.push_back(node_at(row, ncols_ - 1));
            break;
        case GridEdge::TOP:
            for (int col = 0; col < ncols_; ++col) nodes.push_back(node_at(nrows_ - 1, col));
            break;
        case GridEdge::LEFT:
            for (int row = 0; row < nrows_; ++row) nodes.push_back(node_at(row, 0));
            break;
        case GridEdge::BOTTOM:
            for (int col = 0; col < ncols_; ++col) nodes.push_back(node_at(0, col));
            break;
    }
    return nodes;
}

} // namespace Core
} // namespace TVD
