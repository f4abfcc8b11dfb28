#include "HexGrid.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <tuple>

namespace TVD {
namespace Core {

namespace {

struct LinkCandidate {
    int y_key;   // 2*row for links along a row, 2*row+1 for links between rows
    int x_key;   // sum of the end node x positions in half spacings
    int tail;
    int head;
};

} // namespace

GridTopology HexGrid::build_topology(int nrows, int ncols, double spacing) {
    if (nrows < 3 || ncols < 2) {
        throw std::runtime_error("Hex grid needs at least 3 rows and 2 columns, got " +
                                 std::to_string(nrows) + "x" + std::to_string(ncols) + ".");
    }
    if (spacing <= 0.0) {
        throw std::runtime_error("Hex grid spacing must be positive.");
    }

    const double row_height = 0.5 * std::sqrt(3.0) * spacing;
    const double cell_area = 0.5 * std::sqrt(3.0) * spacing * spacing;
    const double face_width = spacing / std::sqrt(3.0);

    auto is_perimeter = [nrows, ncols](int row, int col) {
        return row == 0 || col == 0 || row == nrows - 1 || col == ncols - 1;
    };
    // x position in units of half a spacing
    auto half_x = [](int row, int col) { return 2 * col + (row % 2); };

    GridTopology topo;
    const int n_nodes = nrows * ncols;
    topo.x_of_node.resize(n_nodes);
    topo.y_of_node.resize(n_nodes);
    topo.area_of_cell_at_node.assign(n_nodes, 0.0);
    topo.status_at_node.assign(n_nodes, NodeStatus::CORE);

    for (int row = 0; row < nrows; ++row) {
        for (int col = 0; col < ncols; ++col) {
            const int node = row * ncols + col;
            topo.x_of_node[node] = 0.5 * spacing * half_x(row, col);
            topo.y_of_node[node] = row * row_height;
            if (is_perimeter(row, col)) {
                topo.status_at_node[node] = NodeStatus::FIXED_VALUE;
            }
            else {
                topo.area_of_cell_at_node[node] = cell_area;
            }
        }
    }

    std::vector<LinkCandidate> links;
    auto add_link = [&](int y_key, int tail_row, int tail_col, int head_row, int head_col) {
        links.push_back({y_key,
                         half_x(tail_row, tail_col) + half_x(head_row, head_col),
                         tail_row * ncols + tail_col,
                         head_row * ncols + head_col});
    };

    for (int row = 0; row < nrows; ++row) {
        for (int col = 0; col < ncols - 1; ++col) {
            add_link(2 * row, row, col, row, col + 1);
        }
        if (row == nrows - 1) continue;

        // Upper-left and upper-right neighbours depend on the row shift
        const int left_col_offset = (row % 2 == 0) ? -1 : 0;
        for (int col = 0; col < ncols; ++col) {
            const int up_left = col + left_col_offset;
            const int up_right = up_left + 1;
            if (up_left >= 0) add_link(2 * row + 1, row, col, row + 1, up_left);
            if (up_right < ncols) add_link(2 * row + 1, row, col, row + 1, up_right);
        }
    }

    std::sort(links.begin(), links.end(), [](const LinkCandidate& a, const LinkCandidate& b) {
        return std::tie(a.y_key, a.x_key) < std::tie(b.y_key, b.x_key);
    });

    for (const auto& link : links) {
        topo.node_at_link_tail.push_back(link.tail);
        topo.node_at_link_head.push_back(link.head);
        const bool has_face = !is_perimeter(link.tail / ncols, link.tail % ncols) ||
                              !is_perimeter(link.head / ncols, link.head % ncols);
        topo.width_of_face_at_link.push_back(has_face ? face_width : 0.0);
    }
    return topo;
}

HexGrid::HexGrid(int nrows, int ncols, double spacing)
    : Grid(build_topology(nrows, ncols, spacing)), nrows_(nrows), ncols_(ncols) {}

std::vector<int> HexGrid::nodes_at_edge(GridEdge edge) const {
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
