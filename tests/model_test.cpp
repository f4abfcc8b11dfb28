#include <gtest/gtest.h>
#include <Kokkos_Core.hpp>
#include <cmath>
#include <vector>

#include "../src/core/Initializer.hpp"
#include "../src/core/RasterGrid.hpp"
#include "../src/driver/Model.hpp"
#include "TestHelpers.hpp"

using TVD::Testing::to_vector;

namespace {

nlohmann::json base_config() {
    return {
        {"grid", {{"type", "raster"}, {"nrows", 5}, {"ncols", 12}, {"dx", 1.0}}},
        {"boundary_conditions", {{"top", "CLOSED"}, {"bottom", "CLOSED"}}},
        {"advection", {{"field_name", "tracer"}, {"advection_direction_is_steady", true}}},
        {"initial_conditions", {
            {"scalar", {{"shape", "step"}, {"value", 2.0}, {"background", 0.5},
                        {"xmin", 2.0}, {"xmax", 4.0}, {"ymin", 0.0}, {"ymax", 4.0}}},
            {"velocity", {{"vx", 1.0}, {"vy", 0.0}}}
        }},
        {"simulation", {{"total_time", 2.0}, {"courant_number", 0.2}, {"log_interval", 0}}}
    };
}

} // namespace

TEST(InitializerTest, ShapesAndVelocityProjection) {
    nlohmann::json data = {
        {"initial_conditions", {
            {"scalar", {{"shape", "gaussian"}, {"amplitude", 2.0}, {"x0", 1.0}, {"y0", 1.0}, {"width", 1.0}}},
            {"velocity", {{"vx", 3.0}, {"vy", -2.0}}}
        }}
    };
    TVD::Utils::ConfigurationManager config(data);
    TVD::Core::RasterGrid grid(3, 4);
    grid.add_field_at_node("tracer");
    grid.add_field_at_link("advection__velocity");

    TVD::Core::Initializer initializer(config, grid, "tracer");
    initializer.initialize_state();

    auto s = to_vector(grid.at_node("tracer").get_device_data());
    EXPECT_DOUBLE_EQ(s[5], 2.0);                        // peak at (1, 1)
    EXPECT_NEAR(s[6], 2.0 * std::exp(-0.5), 1e-14);     // one unit away

    auto u = to_vector(grid.at_link("advection__velocity").get_device_data());
    EXPECT_DOUBLE_EQ(u[7], 3.0);    // horizontal
    EXPECT_DOUBLE_EQ(u[11], -2.0);  // vertical
}

TEST(InitializerTest, UniformAndStepShapes) {
    TVD::Core::RasterGrid grid(3, 4);
    grid.add_field_at_node("tracer");
    grid.add_field_at_link("advection__velocity");

    TVD::Utils::ConfigurationManager uniform_config(nlohmann::json{
        {"initial_conditions", {{"scalar", {{"shape", "uniform"}, {"value", 4.5}}}}}});
    TVD::Core::Initializer(uniform_config, grid, "tracer").initialize_scalar();
    for (double value : to_vector(grid.at_node("tracer").get_device_data())) EXPECT_DOUBLE_EQ(value, 4.5);

    TVD::Utils::ConfigurationManager step_config(nlohmann::json{
        {"initial_conditions", {{"scalar", {{"shape", "step"}, {"value", 1.0}, {"background", -1.0},
                                            {"xmin", 1.0}, {"xmax", 2.0}, {"ymin", 0.0}, {"ymax", 0.0}}}}}});
    TVD::Core::Initializer(step_config, grid, "tracer").initialize_scalar();
    auto s = to_vector(grid.at_node("tracer").get_device_data());
    EXPECT_DOUBLE_EQ(s[0], -1.0);
    EXPECT_DOUBLE_EQ(s[1], 1.0);
    EXPECT_DOUBLE_EQ(s[2], 1.0);
    EXPECT_DOUBLE_EQ(s[5], -1.0);
}

TEST(InitializerTest, RejectsUnknownShapeAndMissingFields) {
    TVD::Core::RasterGrid grid(3, 4);
    TVD::Utils::ConfigurationManager config(nlohmann::json{
        {"initial_conditions", {{"scalar", {{"shape", "spiral"}}}}}});

    EXPECT_THROW(TVD::Core::Initializer missing(config, grid, "tracer"), std::runtime_error);

    grid.add_field_at_node("tracer");
    grid.add_field_at_link("advection__velocity");
    TVD::Core::Initializer initializer(config, grid, "tracer");
    EXPECT_THROW(initializer.initialize_scalar(), std::runtime_error);
}

TEST(ModelTest, TimeStepFromCourantNumber) {
    TVD::Utils::ConfigurationManager config(base_config());
    TVD::Driver::Model model(config);
    model.init();
    EXPECT_DOUBLE_EQ(model.compute_time_step(), 0.2);
}

TEST(ModelTest, ExplicitTimeStepWins) {
    auto data = base_config();
    data["simulation"]["dt"] = 0.05;
    TVD::Utils::ConfigurationManager config(data);
    TVD::Driver::Model model(config);
    model.init();
    EXPECT_DOUBLE_EQ(model.compute_time_step(), 0.05);
}

TEST(ModelTest, RunReachesTotalTimeAndConservesInteriorBounds) {
    TVD::Utils::ConfigurationManager config(base_config());
    TVD::Driver::Model model(config);
    EXPECT_THROW(model.run(), std::runtime_error);

    model.init();
    EXPECT_TRUE(model.solver().advection_direction_is_steady());
    model.run();
    EXPECT_EQ(model.step_count(), 10u);
    EXPECT_NEAR(model.current_time(), 2.0, 1e-12);

    auto s = to_vector(model.grid().at_node("tracer").get_device_data());
    for (double value : s) {
        EXPECT_GE(value, 0.5 - 1e-12);
        EXPECT_LE(value, 2.0 + 1e-12);
    }
    model.finalize();
}

TEST(ModelTest, ZeroVelocityNeedsExplicitTimeStep) {
    auto data = base_config();
    data["initial_conditions"]["velocity"]["vx"] = 0.0;
    TVD::Utils::ConfigurationManager config(data);
    TVD::Driver::Model model(config);
    model.init();
    EXPECT_THROW(model.compute_time_step(), std::runtime_error);
}

int main(int argc, char** argv) {
    Kokkos::initialize(argc, argv);

    ::testing::InitGoogleTest(&argc, argv);

    int result = RUN_ALL_TESTS();

    Kokkos::finalize();

    return result;
}
