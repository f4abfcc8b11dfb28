// Grid class defines the node/link topology of a regular 2D grid.
// Nodes are the points where scalars live, links are the directed edges
// (tail -> head) joining adjacent nodes. Topology arrays are built once on
// the host and mirrored into Kokkos::Views for device kernels. The class also
// owns the named fields defined on its nodes and links, and provides the
// node-to-link interpolation and flux divergence operators used by the
// advection schemes.

#ifndef TVD_CORE_GRID_HPP
#define TVD_CORE_GRID_HPP

#include <Kokkos_Core.hpp>
#include <memory>
#include <string>
#include <vector>

#include "Field.hpp"
#include "State.hpp"

namespace TVD {
namespace Core {

// Boundary status codes of a node
enum class NodeStatus : int {
    CORE = 0,         // Interior node, updated by the solvers
    FIXED_VALUE = 1,  // Open boundary, value controlled from outside
    CLOSED = 4        // No flux crosses links attached to this node
};

enum class GridEdge {
    RIGHT,
    TOP,
    LEFT,
    BOTTOM
};

// Host-side description of a grid, filled by the concrete grid types.
struct GridTopology {
    std::vector<double> x_of_node;
    std::vector<double> y_of_node;
    std::vector<int> node_at_link_tail;
    std::vector<int> node_at_link_head;
    std::vector<double> area_of_cell_at_node;   // 0 where the node has no cell
    std::vector<double> width_of_face_at_link;  // 0 where the link crosses no face
    std::vector<NodeStatus> status_at_node;
};

class Grid {
public:
    using RealView = Kokkos::View<double*>;
    using IndexView = Kokkos::View<int*>;

    explicit Grid(const GridTopology& topology);
    virtual ~Grid() = default;

    // Explicitly delete copy constructor and copy assignment operator
    // This prevents accidental copying of the topology Views and fields.
    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;

    virtual std::string type_name() const = 0;

    // print grid info (for debugging)
    void print_info() const;

    // --- Sizes ---
    int number_of_nodes() const { return number_of_nodes_; }
    int number_of_links() const { return number_of_links_; }
    int number_of_core_nodes() const { return static_cast<int>(core_nodes_.extent(0)); }
    int number_of_active_links() const { return static_cast<int>(active_links_.extent(0)); }

    // --- Device topology ---
    const RealView& x_of_node() const { return x_of_node_; }
    const RealView& y_of_node() const { return y_of_node_; }
    const IndexView& node_at_link_tail() const { return node_at_link_tail_; }
    const IndexView& node_at_link_head() const { return node_at_link_head_; }
    const RealView& length_of_link() const { return length_of_link_; }
    const RealView& width_of_face_at_link() const { return width_of_face_at_link_; }
    const RealView& area_of_cell_at_node() const { return area_of_cell_at_node_; }
    const IndexView& status_at_node() const { return status_at_node_; }
    const IndexView& active_links() const { return active_links_; }
    const IndexView& core_nodes() const { return core_nodes_; }
    const IndexView& link_is_active() const { return link_is_active_; }

    // CSR adjacency: links_at_node()(offset_of_links_at_node()(n) ... offset(n+1)-1)
    // with link_dirs_at_node() = +1 when the link leaves the node, -1 when it enters.
    const IndexView& offset_of_links_at_node() const { return offset_of_links_at_node_; }
    const IndexView& links_at_node() const { return links_at_node_; }
    const IndexView& link_dirs_at_node() const { return link_dirs_at_node_; }

    // --- Host topology ---
    int node_at_link_tail_host(int link) const { return node_at_link_tail_host_(link); }
    int node_at_link_head_host(int link) const { return node_at_link_head_host_(link); }
    NodeStatus status_at_node_host(int node) const { return static_cast<NodeStatus>(status_at_node_host_(node)); }
    std::vector<int> active_links_host() const;
    std::vector<int> core_nodes_host() const;

    // Change boundary status; active links and the parallel link table are rebuilt.
    void set_status_at_node(const std::vector<int>& nodes, NodeStatus status);

    // Incremented every time the active links are rebuilt
    int status_version() const { return status_version_; }

    // Perimeter nodes along one edge of the grid
    virtual std::vector<int> nodes_at_edge(GridEdge edge) const = 0;

    // Close the perimeter nodes of the selected edges, open the others
    void set_closed_boundaries_at_grid_edges(bool right_is_closed, bool top_is_closed,
                                             bool left_is_closed, bool bottom_is_closed);

    // Tail-wise (column 0) and head-wise (column 1) parallel active link of every
    // link, or -1. Built on first use and kept until the node status changes.
    const Field<2, int>& parallel_links_at_link() const;

    // --- Field registry ---
    Field<1>& add_field_at_node(const std::string& name) { return state_.add_field(FieldLocation::NODE, name); }
    Field<1>& add_field_at_link(const std::string& name) { return state_.add_field(FieldLocation::LINK, name); }
    Field<1>& at_node(const std::string& name) { return state_.get_field(FieldLocation::NODE, name); }
    Field<1>& at_link(const std::string& name) { return state_.get_field(FieldLocation::LINK, name); }
    const Field<1>& at_node(const std::string& name) const { return state_.get_field(FieldLocation::NODE, name); }
    const Field<1>& at_link(const std::string& name) const { return state_.get_field(FieldLocation::LINK, name); }
    bool has_field_at_node(const std::string& name) const { return state_.has_field(FieldLocation::NODE, name); }
    bool has_field_at_link(const std::string& name) const { return state_.has_field(FieldLocation::LINK, name); }

    // --- Operators ---

    // Value of the tail node where velocity > 0, of the head node otherwise.
    void map_node_to_link_linear_upwind(const RealView& values_at_node, const RealView& velocity_at_link,
                                        const RealView& out_at_link) const;

    // 0.5 * ((1 + c) * tail + (1 - c) * head) with c the signed link Courant number.
    void map_node_to_link_lax_wendroff(const RealView& values_at_node, const RealView& courant_at_link,
                                       const RealView& out_at_link) const;

    // head - tail
    void calc_diff_at_link(const RealView& values_at_node, const RealView& out_at_link) const;

    // (head - tail) / link length
    void calc_grad_at_link(const RealView& values_at_node, const RealView& out_at_link) const;

    // Net outflow through the faces of the active links of each cell divided by
    // the cell area. Nodes without a cell get 0. Inactive links are not read.
    void calc_flux_div_at_node(const RealView& flux_at_link, const RealView& out_at_node) const;

    // Sum of value * cell area over core nodes
    double integrate_at_core_nodes(const RealView& values_at_node) const;

    // Shortest active link, used for Courant-number based time steps
    double min_length_of_active_link() const;

protected:
    static bool same_direction(double ax, double ay, double bx, double by);

private:
    void update_active_links();
    void build_parallel_links() const;
    void check_extent(const RealView& view, int expected, const std::string& what) const;

    int number_of_nodes_;
    int number_of_links_;

    RealView x_of_node_;
    RealView y_of_node_;
    IndexView node_at_link_tail_;
    IndexView node_at_link_head_;
    RealView length_of_link_;
    RealView width_of_face_at_link_;
    RealView area_of_cell_at_node_;
    IndexView status_at_node_;
    IndexView link_is_active_;
    IndexView active_links_;
    IndexView core_nodes_;
    IndexView offset_of_links_at_node_;
    IndexView links_at_node_;
    IndexView link_dirs_at_node_;

    RealView::HostMirror x_of_node_host_;
    RealView::HostMirror y_of_node_host_;
    IndexView::HostMirror node_at_link_tail_host_;
    IndexView::HostMirror node_at_link_head_host_;
    IndexView::HostMirror status_at_node_host_;
    IndexView::HostMirror link_is_active_host_;
    IndexView::HostMirror offset_of_links_at_node_host_;
    IndexView::HostMirror links_at_node_host_;
    IndexView::HostMirror link_dirs_at_node_host_;

    int status_version_ = 0;
    mutable std::unique_ptr<Field<2, int>> parallel_links_ = nullptr;

    State state_;
};

} // namespace Core
} // namespace TVD

#endif // TVD_CORE_GRID_HPP
