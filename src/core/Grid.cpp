#include "Grid.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace TVD {
namespace Core {

Grid::Grid(const GridTopology& topology)
    : number_of_nodes_(static_cast<int>(topology.x_of_node.size())),
      number_of_links_(static_cast<int>(topology.node_at_link_tail.size())),
      x_of_node_("x_of_node", topology.x_of_node.size()),
      y_of_node_("y_of_node", topology.y_of_node.size()),
      node_at_link_tail_("node_at_link_tail", topology.node_at_link_tail.size()),
      node_at_link_head_("node_at_link_head", topology.node_at_link_head.size()),
      length_of_link_("length_of_link", topology.node_at_link_tail.size()),
      width_of_face_at_link_("width_of_face_at_link", topology.width_of_face_at_link.size()),
      area_of_cell_at_node_("area_of_cell_at_node", topology.area_of_cell_at_node.size()),
      status_at_node_("status_at_node", topology.status_at_node.size()),
      link_is_active_("link_is_active", topology.node_at_link_tail.size()),
      offset_of_links_at_node_("offset_of_links_at_node", topology.x_of_node.size() + 1),
      links_at_node_("links_at_node", 2 * topology.node_at_link_tail.size()),
      link_dirs_at_node_("link_dirs_at_node", 2 * topology.node_at_link_tail.size()),
      state_(static_cast<int>(topology.x_of_node.size()), static_cast<int>(topology.node_at_link_tail.size()))
{
    try {
        if (number_of_nodes_ == 0) {
            throw std::runtime_error("Grid must contain at least one node.");
        }
        if (topology.y_of_node.size() != topology.x_of_node.size() ||
            topology.area_of_cell_at_node.size() != topology.x_of_node.size() ||
            topology.status_at_node.size() != topology.x_of_node.size()) {
            throw std::runtime_error("Node arrays have inconsistent lengths.");
        }
        if (topology.node_at_link_head.size() != topology.node_at_link_tail.size() ||
            topology.width_of_face_at_link.size() != topology.node_at_link_tail.size()) {
            throw std::runtime_error("Link arrays have inconsistent lengths.");
        }

        x_of_node_host_ = Kokkos::create_mirror_view(x_of_node_);
        y_of_node_host_ = Kokkos::create_mirror_view(y_of_node_);
        node_at_link_tail_host_ = Kokkos::create_mirror_view(node_at_link_tail_);
        node_at_link_head_host_ = Kokkos::create_mirror_view(node_at_link_head_);
        status_at_node_host_ = Kokkos::create_mirror_view(status_at_node_);
        offset_of_links_at_node_host_ = Kokkos::create_mirror_view(offset_of_links_at_node_);
        links_at_node_host_ = Kokkos::create_mirror_view(links_at_node_);
        link_dirs_at_node_host_ = Kokkos::create_mirror_view(link_dirs_at_node_);
        auto length_host = Kokkos::create_mirror_view(length_of_link_);
        auto width_host = Kokkos::create_mirror_view(width_of_face_at_link_);
        auto area_host = Kokkos::create_mirror_view(area_of_cell_at_node_);

        for (int n = 0; n < number_of_nodes_; ++n) {
            x_of_node_host_(n) = topology.x_of_node[n];
            y_of_node_host_(n) = topology.y_of_node[n];
            area_host(n) = topology.area_of_cell_at_node[n];
            status_at_node_host_(n) = static_cast<int>(topology.status_at_node[n]);
        }

        std::vector<int> count(number_of_nodes_, 0);
        for (int l = 0; l < number_of_links_; ++l) {
            const int tail = topology.node_at_link_tail[l];
            const int head = topology.node_at_link_head[l];
            if (tail < 0 || tail >= number_of_nodes_ || head < 0 || head >= number_of_nodes_ || tail == head) {
                throw std::runtime_error("Link " + std::to_string(l) + " has invalid end nodes.");
            }
            node_at_link_tail_host_(l) = tail;
            node_at_link_head_host_(l) = head;
            width_host(l) = topology.width_of_face_at_link[l];
            length_host(l) = std::hypot(topology.x_of_node[head] - topology.x_of_node[tail],
                                        topology.y_of_node[head] - topology.y_of_node[tail]);
            count[tail]++;
            count[head]++;
        }

        // CSR layout of the links attached to each node
        offset_of_links_at_node_host_(0) = 0;
        for (int n = 0; n < number_of_nodes_; ++n) {
            offset_of_links_at_node_host_(n + 1) = offset_of_links_at_node_host_(n) + count[n];
        }
        std::vector<int> fill(number_of_nodes_, 0);
        for (int l = 0; l < number_of_links_; ++l) {
            const int tail = node_at_link_tail_host_(l);
            const int head = node_at_link_head_host_(l);
            const int tail_slot = offset_of_links_at_node_host_(tail) + fill[tail]++;
            links_at_node_host_(tail_slot) = l;
            link_dirs_at_node_host_(tail_slot) = 1;
            const int head_slot = offset_of_links_at_node_host_(head) + fill[head]++;
            links_at_node_host_(head_slot) = l;
            link_dirs_at_node_host_(head_slot) = -1;
        }

        Kokkos::deep_copy(x_of_node_, x_of_node_host_);
        Kokkos::deep_copy(y_of_node_, y_of_node_host_);
        Kokkos::deep_copy(node_at_link_tail_, node_at_link_tail_host_);
        Kokkos::deep_copy(node_at_link_head_, node_at_link_head_host_);
        Kokkos::deep_copy(length_of_link_, length_host);
        Kokkos::deep_copy(width_of_face_at_link_, width_host);
        Kokkos::deep_copy(area_of_cell_at_node_, area_host);
        Kokkos::deep_copy(status_at_node_, status_at_node_host_);
        Kokkos::deep_copy(offset_of_links_at_node_, offset_of_links_at_node_host_);
        Kokkos::deep_copy(links_at_node_, links_at_node_host_);
        Kokkos::deep_copy(link_dirs_at_node_, link_dirs_at_node_host_);
        Kokkos::fence();
    }
    catch (const std::exception& e) {
        throw std::runtime_error("Grid initialization failed: " + std::string(e.what()));
    }

    update_active_links();
}

void Grid::update_active_links() {
    link_is_active_host_ = Kokkos::create_mirror_view(link_is_active_);

    std::vector<int> active;
    for (int l = 0; l < number_of_links_; ++l) {
        const auto tail_status = static_cast<NodeStatus>(status_at_node_host_(node_at_link_tail_host_(l)));
        const auto head_status = static_cast<NodeStatus>(status_at_node_host_(node_at_link_head_host_(l)));
        const bool is_active = tail_status != NodeStatus::CLOSED && head_status != NodeStatus::CLOSED &&
                               (tail_status == NodeStatus::CORE || head_status == NodeStatus::CORE);
        link_is_active_host_(l) = is_active ? 1 : 0;
        if (is_active) active.push_back(l);
    }

    std::vector<int> core;
    for (int n = 0; n < number_of_nodes_; ++n) {
        if (static_cast<NodeStatus>(status_at_node_host_(n)) == NodeStatus::CORE) core.push_back(n);
    }

    active_links_ = IndexView("active_links", active.size());
    core_nodes_ = IndexView("core_nodes", core.size());
    auto active_host = Kokkos::create_mirror_view(active_links_);
    auto core_host = Kokkos::create_mirror_view(core_nodes_);
    for (size_t i = 0; i < active.size(); ++i) active_host(i) = active[i];
    for (size_t i = 0; i < core.size(); ++i) core_host(i) = core[i];

    Kokkos::deep_copy(link_is_active_, link_is_active_host_);
    Kokkos::deep_copy(active_links_, active_host);
    Kokkos::deep_copy(core_nodes_, core_host);
    Kokkos::fence();

    parallel_links_.reset();
    ++status_version_;
}

void Grid::set_status_at_node(const std::vector<int>& nodes, NodeStatus status) {
    // Check every node first so a bad id leaves the status untouched
    for (int node : nodes) {
        if (node < 0 || node >= number_of_nodes_) {
            throw std::runtime_error("Cannot set status of node " + std::to_string(node) +
                                     ": grid has " + std::to_string(number_of_nodes_) + " nodes.");
        }
    }
    for (int node : nodes) {
        status_at_node_host_(node) = static_cast<int>(status);
    }
    Kokkos::deep_copy(status_at_node_, status_at_node_host_);
    update_active_links();
}

void Grid::set_closed_boundaries_at_grid_edges(bool right_is_closed, bool top_is_closed,
                                               bool left_is_closed, bool bottom_is_closed) {
    const std::pair<GridEdge, bool> edges[] = {
        {GridEdge::RIGHT, right_is_closed},
        {GridEdge::TOP, top_is_closed},
        {GridEdge::LEFT, left_is_closed},
        {GridEdge::BOTTOM, bottom_is_closed},
    };
    // Open edges first so that a corner shared with a closed edge ends up closed
    for (const auto& edge : edges) {
        if (!edge.second) set_status_at_node(nodes_at_edge(edge.first), NodeStatus::FIXED_VALUE);
    }
    for (const auto& edge : edges) {
        if (edge.second) set_status_at_node(nodes_at_edge(edge.first), NodeStatus::CLOSED);
    }
}

std::vector<int> Grid::active_links_host() const {
    auto host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), active_links_);
    return std::vector<int>(host.data(), host.data() + host.extent(0));
}

std::vector<int> Grid::core_nodes_host() const {
    auto host = Kokkos::create_mirror_view_and_copy(Kokkos::HostSpace(), core_nodes_);
    return std::vector<int>(host.data(), host.data() + host.extent(0));
}

bool Grid::same_direction(double ax, double ay, double bx, double by) {
    const double norm = std::hypot(ax, ay) * std::hypot(bx, by);
    if (norm == 0.0) return false;
    return (ax * bx + ay * by) / norm > 1.0 - 1.0e-9;
}

const Field<2, int>& Grid::parallel_links_at_link() const {
    if (!parallel_links_) {
        build_parallel_links();
    }
    return *parallel_links_;
}

void Grid::build_parallel_links() const {
    auto table = std::make_unique<Field<2, int>>("parallel_links_at_link", std::array<int, 2>{number_of_links_, 2});
    auto host = table->get_host_data();
    Kokkos::deep_copy(host, -1);

    for (int link = 0; link < number_of_links_; ++link) {
        if (!link_is_active_host_(link)) continue;

        const int tail = node_at_link_tail_host_(link);
        const int head = node_at_link_head_host_(link);
        const double dx = x_of_node_host_(head) - x_of_node_host_(tail);
        const double dy = y_of_node_host_(head) - y_of_node_host_(tail);

        // Tail-wise neighbour: same orientation, its head is our tail
        for (int k = offset_of_links_at_node_host_(tail); k < offset_of_links_at_node_host_(tail + 1); ++k) {
            const int other = links_at_node_host_(k);
            if (other == link || node_at_link_head_host_(other) != tail || !link_is_active_host_(other)) continue;
            const int other_tail = node_at_link_tail_host_(other);
            if (same_direction(dx, dy, x_of_node_host_(tail) - x_of_node_host_(other_tail),
                               y_of_node_host_(tail) - y_of_node_host_(other_tail))) {
                host(link, 0) = other;
            }
        }

        // Head-wise neighbour: same orientation, its tail is our head
        for (int k = offset_of_links_at_node_host_(head); k < offset_of_links_at_node_host_(head + 1); ++k) {
            const int other = links_at_node_host_(k);
            if (other == link || node_at_link_tail_host_(other) != head || !link_is_active_host_(other)) continue;
            const int other_head = node_at_link_head_host_(other);
            if (same_direction(dx, dy, x_of_node_host_(other_head) - x_of_node_host_(head),
                               y_of_node_host_(other_head) - y_of_node_host_(head))) {
                host(link, 1) = other;
            }
        }
    }

    table->update_device_from_host(host);
    parallel_links_ = std::move(table);
}

void Grid::check_extent(const RealView& view, int expected, const std::string& what) const {
    if (static_cast<int>(view.extent(0)) != expected) {
        throw std::runtime_error("Size mismatch for " + what + ": expected " + std::to_string(expected) +
                                 " values, got " + std::to_string(view.extent(0)) + ".");
    }
}

void Grid::map_node_to_link_linear_upwind(const RealView& values_at_node, const RealView& velocity_at_link,
                                          const RealView& out_at_link) const {
    check_extent(values_at_node, number_of_nodes_, "values at node");
    check_extent(velocity_at_link, number_of_links_, "velocity at link");
    check_extent(out_at_link, number_of_links_, "output at link");

    auto tail = node_at_link_tail_;
    auto head = node_at_link_head_;
    Kokkos::parallel_for("map_node_to_link_linear_upwind", Kokkos::RangePolicy<>(0, number_of_links_),
        KOKKOS_LAMBDA(const int l) {
            out_at_link(l) = velocity_at_link(l) > 0.0 ? values_at_node(tail(l)) : values_at_node(head(l));
        }
    );
}

void Grid::map_node_to_link_lax_wendroff(const RealView& values_at_node, const RealView& courant_at_link,
                                         const RealView& out_at_link) const {
    check_extent(values_at_node, number_of_nodes_, "values at node");
    check_extent(courant_at_link, number_of_links_, "Courant number at link");
    check_extent(out_at_link, number_of_links_, "output at link");

    auto tail = node_at_link_tail_;
    auto head = node_at_link_head_;
    Kokkos::parallel_for("map_node_to_link_lax_wendroff", Kokkos::RangePolicy<>(0, number_of_links_),
        KOKKOS_LAMBDA(const int l) {
            const double c = courant_at_link(l);
            out_at_link(l) = 0.5 * ((1.0 + c) * values_at_node(tail(l)) + (1.0 - c) * values_at_node(head(l)));
        }
    );
}

void Grid::calc_diff_at_link(const RealView& values_at_node, const RealView& out_at_link) const {
    check_extent(values_at_node, number_of_nodes_, "values at node");
    check_extent(out_at_link, number_of_links_, "output at link");

    auto tail = node_at_link_tail_;
    auto head = node_at_link_head_;
    Kokkos::parallel_for("calc_diff_at_link", Kokkos::RangePolicy<>(0, number_of_links_),
        KOKKOS_LAMBDA(const int l) {
            out_at_link(l) = values_at_node(head(l)) - values_at_node(tail(l));
        }
    );
}

void Grid::calc_grad_at_link(const RealView& values_at_node, const RealView& out_at_link) const {
    calc_diff_at_link(values_at_node, out_at_link);

    auto length = length_of_link_;
    Kokkos::parallel_for("calc_grad_at_link", Kokkos::RangePolicy<>(0, number_of_links_),
        KOKKOS_LAMBDA(const int l) {
            out_at_link(l) /= length(l);
        }
    );
}

void Grid::calc_flux_div_at_node(const RealView& flux_at_link, const RealView& out_at_node) const {
    check_extent(flux_at_link, number_of_links_, "flux at link");
    check_extent(out_at_node, number_of_nodes_, "output at node");

    auto offset = offset_of_links_at_node_;
    auto links = links_at_node_;
    auto dirs = link_dirs_at_node_;
    auto is_active = link_is_active_;
    auto width = width_of_face_at_link_;
    auto area = area_of_cell_at_node_;
    Kokkos::parallel_for("calc_flux_div_at_node", Kokkos::RangePolicy<>(0, number_of_nodes_),
        KOKKOS_LAMBDA(const int n) {
            if (area(n) <= 0.0) {
                out_at_node(n) = 0.0;
                return;
            }
            double net_outflow = 0.0;
            for (int k = offset(n); k < offset(n + 1); ++k) {
                const int l = links(k);
                if (is_active(l)) {
                    net_outflow += dirs(k) * flux_at_link(l) * width(l);
                }
            }
            out_at_node(n) = net_outflow / area(n);
        }
    );
}

double Grid::integrate_at_core_nodes(const RealView& values_at_node) const {
    check_extent(values_at_node, number_of_nodes_, "values at node");

    auto core = core_nodes_;
    auto area = area_of_cell_at_node_;
    double total = 0.0;
    Kokkos::parallel_reduce("integrate_at_core_nodes", Kokkos::RangePolicy<>(0, number_of_core_nodes()),
        KOKKOS_LAMBDA(const int i, double& update_sum) {
            const int n = core(i);
            update_sum += values_at_node(n) * area(n);
        }, total);
    return total;
}

double Grid::min_length_of_active_link() const {
    auto active = active_links_;
    auto length = length_of_link_;
    double min_length = std::numeric_limits<double>::max();
    Kokkos::parallel_reduce("min_length_of_active_link", Kokkos::RangePolicy<>(0, number_of_active_links()),
        KOKKOS_LAMBDA(const int i, double& local_min) {
            const double value = length(active(i));
            if (value < local_min) local_min = value;
        }, Kokkos::Min<double>(min_length));
    return min_length;
}

void Grid::print_info() const {
    std::cout << type_name() << " grid info:" << std::endl;
    std::cout << "  Nodes: " << number_of_nodes_ << " (core: " << number_of_core_nodes() << ")" << std::endl;
    std::cout << "  Links: " << number_of_links_ << " (active: " << number_of_active_links() << ")" << std::endl;
    std::cout << "------------------------------------" << std::endl;
}

} // namespace Core
} // namespace TVD
