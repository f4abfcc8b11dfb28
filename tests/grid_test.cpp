#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "../src/core/BoundaryConditionManager.hpp"
#include "../src/core/GridFactory.hpp"
#include "../src/core/HexGrid.hpp"
#include "../src/core/RasterGrid.hpp"
#include "TestHelpers.hpp"

using TVD::Testing::copy_to_view;
using TVD::Testing::to_vector;

class RasterGridTest : public ::testing::Test {
protected:
    // 3 rows x 4 columns, only nodes 5 and 6 are core
    TVD::Core::RasterGrid grid{3, 4};
};

TEST_F(RasterGridTest, NumberingFollowsRowMajorLayout) {
    EXPECT_EQ(grid.number_of_nodes(), 12);
    EXPECT_EQ(grid.number_of_links(), 17);

    // Horizontal link 7 joins nodes 4 and 5, vertical link 11 joins 5 and 9
    EXPECT_EQ(grid.node_at_link_tail_host(7), 4);
    EXPECT_EQ(grid.node_at_link_head_host(7), 5);
    EXPECT_EQ(grid.node_at_link_tail_host(11), 5);
    EXPECT_EQ(grid.node_at_link_head_host(11), 9);
    EXPECT_EQ(grid.node_at_link_tail_host(16), 10);
    EXPECT_EQ(grid.node_at_link_head_host(16), 11);

    auto x = to_vector(grid.x_of_node());
    auto y = to_vector(grid.y_of_node());
    EXPECT_DOUBLE_EQ(x[6], 2.0);
    EXPECT_DOUBLE_EQ(y[6], 1.0);
}

TEST_F(RasterGridTest, CoreNodesAndActiveLinks) {
    EXPECT_EQ(grid.core_nodes_host(), (std::vector<int>{5, 6}));
    EXPECT_EQ(grid.active_links_host(), (std::vector<int>{4, 5, 7, 8, 9, 11, 12}));
    EXPECT_EQ(grid.status_at_node_host(0), TVD::Core::NodeStatus::FIXED_VALUE);
    EXPECT_EQ(grid.status_at_node_host(5), TVD::Core::NodeStatus::CORE);
}

TEST_F(RasterGridTest, CellsAndFaces) {
    auto area = to_vector(grid.area_of_cell_at_node());
    auto width = to_vector(grid.width_of_face_at_link());
    EXPECT_DOUBLE_EQ(area[0], 0.0);
    EXPECT_DOUBLE_EQ(area[5], 1.0);
    // Links between two perimeter nodes have no face
    EXPECT_DOUBLE_EQ(width[0], 0.0);
    EXPECT_DOUBLE_EQ(width[3], 0.0);
    EXPECT_DOUBLE_EQ(width[7], 1.0);
    EXPECT_DOUBLE_EQ(width[11], 1.0);
}

TEST_F(RasterGridTest, ParallelLinksAtLink) {
    auto pll = grid.parallel_links_at_link().get_host_data();
    ASSERT_EQ(pll.extent(0), 17);
    ASSERT_EQ(pll.extent(1), 2);

    const std::vector<int> active = {4, 5, 7, 8, 9, 11, 12};
    const std::vector<int> tail_wise = {-1, -1, -1, 7, 8, 4, 5};
    const std::vector<int> head_wise = {11, 12, 8, 9, -1, -1, -1};
    for (size_t i = 0; i < active.size(); ++i) {
        EXPECT_EQ(pll(active[i], 0), tail_wise[i]) << "link " << active[i];
        EXPECT_EQ(pll(active[i], 1), head_wise[i]) << "link " << active[i];
    }
    // Inactive links have no parallel links
    EXPECT_EQ(pll(0, 0), -1);
    EXPECT_EQ(pll(0, 1), -1);
    EXPECT_EQ(pll(16, 0), -1);
}

TEST_F(RasterGridTest, ParallelLinksAreCachedUntilStatusChanges) {
    const auto* first = &grid.parallel_links_at_link();
    EXPECT_EQ(first, &grid.parallel_links_at_link());

    // Closing node 9 deactivates link 11, so link 4 loses its head-wise neighbour
    grid.set_status_at_node({9}, TVD::Core::NodeStatus::CLOSED);
    auto pll = grid.parallel_links_at_link().get_host_data();
    EXPECT_EQ(pll(4, 1), -1);
    EXPECT_EQ(pll(11, 0), -1);
    EXPECT_EQ(grid.active_links_host(), (std::vector<int>{4, 5, 7, 8, 9, 12}));
}

TEST_F(RasterGridTest, InvalidNodeLeavesStatusUntouched) {
    const int version = grid.status_version();
    EXPECT_THROW(grid.set_status_at_node({5, 99}, TVD::Core::NodeStatus::CLOSED), std::runtime_error);
    EXPECT_EQ(grid.status_at_node_host(5), TVD::Core::NodeStatus::CORE);
    EXPECT_EQ(grid.core_nodes_host(), (std::vector<int>{5, 6}));
    EXPECT_EQ(grid.active_links_host(), (std::vector<int>{4, 5, 7, 8, 9, 11, 12}));
    EXPECT_EQ(grid.status_version(), version);
}

TEST_F(RasterGridTest, ClosedEdges) {
    grid.set_closed_boundaries_at_grid_edges(true, false, true, false);
    EXPECT_EQ(grid.status_at_node_host(4), TVD::Core::NodeStatus::CLOSED);
    EXPECT_EQ(grid.status_at_node_host(7), TVD::Core::NodeStatus::CLOSED);
    EXPECT_EQ(grid.status_at_node_host(1), TVD::Core::NodeStatus::FIXED_VALUE);
    EXPECT_EQ(grid.active_links_host(), (std::vector<int>{4, 5, 8, 11, 12}));

    // Reopening restores the default status
    grid.set_closed_boundaries_at_grid_edges(false, false, false, false);
    EXPECT_EQ(grid.status_at_node_host(4), TVD::Core::NodeStatus::FIXED_VALUE);
    EXPECT_EQ(grid.number_of_active_links(), 7);
}

TEST_F(RasterGridTest, NodeToLinkMappings) {
    TVD::Core::Grid::RealView s("s", 12);
    TVD::Core::Grid::RealView u("u", 17);
    TVD::Core::Grid::RealView c("c", 17);
    TVD::Core::Grid::RealView out("out", 17);

    std::vector<double> s_host(12);
    for (int n = 0; n < 12; ++n) s_host[n] = 10.0 * n;
    copy_to_view(s_host, s);
    std::vector<double> u_host(17, 1.0);
    u_host[7] = -1.0;
    u_host[8] = 0.0;
    copy_to_view(u_host, u);

    grid.map_node_to_link_linear_upwind(s, u, out);
    auto upwind = to_vector(out);
    EXPECT_DOUBLE_EQ(upwind[4], 10.0);  // tail of 1 -> 5
    EXPECT_DOUBLE_EQ(upwind[7], 50.0);  // negative: head of 4 -> 5
    EXPECT_DOUBLE_EQ(upwind[8], 60.0);  // zero velocity takes the head value

    Kokkos::deep_copy(c, 0.5);
    grid.map_node_to_link_lax_wendroff(s, c, out);
    auto lw = to_vector(out);
    EXPECT_DOUBLE_EQ(lw[8], 0.5 * (1.5 * 50.0 + 0.5 * 60.0));

    grid.calc_grad_at_link(s, out);
    auto grad = to_vector(out);
    EXPECT_DOUBLE_EQ(grad[8], 10.0);
    EXPECT_DOUBLE_EQ(grad[11], 40.0);

    TVD::Core::Grid::RealView wrong("wrong", 5);
    EXPECT_THROW(grid.map_node_to_link_linear_upwind(wrong, u, out), std::runtime_error);
}

TEST_F(RasterGridTest, FluxDivergenceUsesActiveLinksOnly) {
    TVD::Core::Grid::RealView flux("flux", 17);
    TVD::Core::Grid::RealView div("div", 12);

    // Uniform flux on every link has zero divergence
    Kokkos::deep_copy(flux, 1.0);
    grid.calc_flux_div_at_node(flux, div);
    auto uniform = to_vector(div);
    for (int n = 0; n < 12; ++n) EXPECT_DOUBLE_EQ(uniform[n], 0.0) << "node " << n;

    // Flux from node 5 to node 6 only
    std::vector<double> f(17, 0.0);
    f[8] = 2.0;
    f[0] = 100.0;  // inactive, must be ignored
    copy_to_view(f, flux);
    grid.calc_flux_div_at_node(flux, div);
    auto single = to_vector(div);
    EXPECT_DOUBLE_EQ(single[5], 2.0);
    EXPECT_DOUBLE_EQ(single[6], -2.0);
    EXPECT_DOUBLE_EQ(single[1], 0.0);
}

TEST_F(RasterGridTest, FieldRegistry) {
    auto& s = grid.add_field_at_node("surface__elevation");
    EXPECT_EQ(s.size(), 12);
    auto& u = grid.add_field_at_link("advection__velocity");
    EXPECT_EQ(u.size(), 17);
    EXPECT_TRUE(grid.has_field_at_node("surface__elevation"));
    EXPECT_FALSE(grid.has_field_at_link("surface__elevation"));
    EXPECT_THROW(grid.at_link("surface__elevation"), std::runtime_error);
    EXPECT_THROW(grid.add_field_at_node("surface__elevation"), std::runtime_error);
}

TEST_F(RasterGridTest, IntegrateAtCoreNodes) {
    TVD::Core::Grid::RealView s("s", 12);
    Kokkos::deep_copy(s, 3.0);
    EXPECT_DOUBLE_EQ(grid.integrate_at_core_nodes(s), 6.0);
    EXPECT_DOUBLE_EQ(grid.min_length_of_active_link(), 1.0);
}

TEST(RasterGridConstruction, RejectsInvalidShapes) {
    EXPECT_THROW(TVD::Core::RasterGrid(1, 4), std::runtime_error);
    EXPECT_THROW(TVD::Core::RasterGrid(3, 4, 0.0, 1.0), std::runtime_error);
}

TEST(RasterGridConstruction, AnisotropicSpacing) {
    TVD::Core::RasterGrid grid(4, 5, 2.0, 0.5);
    auto length = to_vector(grid.length_of_link());
    auto width = to_vector(grid.width_of_face_at_link());
    auto area = to_vector(grid.area_of_cell_at_node());
    // Links 0-3 are horizontal in row 0, links 4-8 vertical from row 0, links 9-12 horizontal in row 1
    EXPECT_DOUBLE_EQ(length[10], 2.0);
    EXPECT_DOUBLE_EQ(width[10], 0.5);
    EXPECT_DOUBLE_EQ(length[6], 0.5);
    EXPECT_DOUBLE_EQ(width[6], 2.0);
    EXPECT_DOUBLE_EQ(area[grid.node_at(1, 1)], 1.0);
}

TEST(HexGridTest, CountsAndGeometry) {
    const int nrows = 5;
    const int ncols = 6;
    TVD::Core::HexGrid grid(nrows, ncols, 2.0);
    EXPECT_EQ(grid.number_of_nodes(), nrows * ncols);
    EXPECT_EQ(grid.number_of_links(), nrows * (ncols - 1) + (nrows - 1) * (2 * ncols - 1));
    EXPECT_EQ(grid.number_of_core_nodes(), (nrows - 2) * (ncols - 2));

    auto length = to_vector(grid.length_of_link());
    for (double value : length) EXPECT_NEAR(value, 2.0, 1e-12);

    auto area = to_vector(grid.area_of_cell_at_node());
    EXPECT_NEAR(area[grid.node_at(2, 2)], 0.5 * std::sqrt(3.0) * 4.0, 1e-12);
    EXPECT_DOUBLE_EQ(area[grid.node_at(0, 2)], 0.0);

    // Every interior node has six links
    auto offset = to_vector(grid.offset_of_links_at_node());
    const int node = grid.node_at(2, 2);
    EXPECT_EQ(offset[node + 1] - offset[node], 6);
}

TEST(HexGridTest, ParallelLinksShareOrientation) {
    TVD::Core::HexGrid grid(6, 7);
    auto pll = grid.parallel_links_at_link().get_host_data();
    auto is_active = to_vector(grid.link_is_active());
    auto x = to_vector(grid.x_of_node());
    auto y = to_vector(grid.y_of_node());

    int found = 0;
    for (int l = 0; l < grid.number_of_links(); ++l) {
        const int tail = grid.node_at_link_tail_host(l);
        const int head = grid.node_at_link_head_host(l);
        const double dx = x[head] - x[tail];
        const double dy = y[head] - y[tail];
        for (int col = 0; col < 2; ++col) {
            const int other = pll(l, col);
            if (other == -1) continue;
            ++found;
            EXPECT_TRUE(is_active[l]);
            EXPECT_TRUE(is_active[other]);
            if (col == 0) EXPECT_EQ(grid.node_at_link_head_host(other), tail);
            else EXPECT_EQ(grid.node_at_link_tail_host(other), head);
            const int ot = grid.node_at_link_tail_host(other);
            const int oh = grid.node_at_link_head_host(other);
            EXPECT_NEAR(x[oh] - x[ot], dx, 1e-12);
            EXPECT_NEAR(y[oh] - y[ot], dy, 1e-12);
        }
    }
    EXPECT_GT(found, 0);
}

TEST(HexGridTest, ClosedEdges) {
    TVD::Core::HexGrid grid(5, 5);
    const int before = grid.number_of_active_links();
    grid.set_closed_boundaries_at_grid_edges(false, true, false, true);
    EXPECT_EQ(grid.status_at_node_host(grid.node_at(4, 2)), TVD::Core::NodeStatus::CLOSED);
    EXPECT_EQ(grid.status_at_node_host(grid.node_at(0, 2)), TVD::Core::NodeStatus::CLOSED);
    EXPECT_LT(grid.number_of_active_links(), before);
}

TEST(GridFactoryTest, BuildsConfiguredGrid) {
    nlohmann::json raster_cfg = {{"grid", {{"type", "raster"}, {"nrows", 4}, {"ncols", 5}, {"dx", 2.0}}}};
    TVD::Utils::ConfigurationManager raster_config(raster_cfg);
    auto raster = TVD::Core::create_grid(raster_config);
    EXPECT_EQ(raster->type_name(), "Raster");
    EXPECT_EQ(raster->number_of_nodes(), 20);

    nlohmann::json hex_cfg = {{"grid", {{"type", "hex"}, {"nrows", 4}, {"ncols", 5}}}};
    TVD::Utils::ConfigurationManager hex_config(hex_cfg);
    auto hex = TVD::Core::create_grid(hex_config);
    EXPECT_EQ(hex->type_name(), "Hex");

    nlohmann::json bad_cfg = {{"grid", {{"type", "voronoi"}, {"nrows", 4}, {"ncols", 5}}}};
    TVD::Utils::ConfigurationManager bad_config(bad_cfg);
    EXPECT_THROW(TVD::Core::create_grid(bad_config), std::runtime_error);
}

TEST(BoundaryConditionManagerTest, AppliesConfiguredEdges) {
    nlohmann::json cfg = {{"boundary_conditions", {{"top", "CLOSED"}, {"bottom", "CLOSED"}}}};
    TVD::Utils::ConfigurationManager config(cfg);
    TVD::Core::BoundaryConditionManager bc_manager(config);
    EXPECT_EQ(bc_manager.get_bc(TVD::Core::GridEdge::TOP), TVD::Core::EdgeBoundaryType::CLOSED);
    EXPECT_EQ(bc_manager.get_bc(TVD::Core::GridEdge::LEFT), TVD::Core::EdgeBoundaryType::FIXED_VALUE);

    TVD::Core::RasterGrid grid(3, 4);
    bc_manager.apply(grid);
    EXPECT_EQ(grid.status_at_node_host(1), TVD::Core::NodeStatus::CLOSED);
    EXPECT_EQ(grid.status_at_node_host(9), TVD::Core::NodeStatus::CLOSED);
    EXPECT_EQ(grid.status_at_node_host(4), TVD::Core::NodeStatus::FIXED_VALUE);
    EXPECT_EQ(grid.active_links_host(), (std::vector<int>{7, 8, 9}));
}

TEST(BoundaryConditionManagerTest, RejectsUnknownType) {
    nlohmann::json cfg = {{"boundary_conditions", {{"left", "PERIODIC"}}}};
    TVD::Utils::ConfigurationManager config(cfg);
    EXPECT_THROW(TVD::Core::BoundaryConditionManager bc_manager(config), std::runtime_error);
}

int main(int argc, char** argv) {
    Kokkos::initialize(argc, argv);

    ::testing::InitGoogleTest(&argc, argv);

    int result = RUN_ALL_TESTS();

    Kokkos::finalize();

    return result;
}
