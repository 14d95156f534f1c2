#include <vector>

#include <gtest/gtest.h>

#include <dendrite/conductance.hpp>
#include <dendrite/dendexcept.hpp>
#include <dendrite/math.hpp>
#include <dendrite/morph_index.hpp>
#include <dendrite/morphology.hpp>

#include "common.hpp"

using namespace dend;
using vvec = std::vector<fvm_value_type>;

namespace {
cable_conductances conductances_of(const std::vector<cell_description>& cells) {
    morph_index index(cells);
    return build_conductances(index, flatten_geometry(cells));
}
}

TEST(conductance, half_compartment) {
    // 100 Ω·cm over 10 µm of radius 1 µm: 100·5/π in units of 10 kΩ.
    EXPECT_DOUBLE_EQ(half_compartment_resistance(1., 10., 100.), 500./math::pi<double>);
    EXPECT_DOUBLE_EQ(half_compartment_resistance(2., 10., 100.), 125./math::pi<double>);
}

TEST(conductance, uniform_chain) {
    cell_description cell;
    cell.parents = {-1};
    cell.ncomp = {3};
    cell.radius = vvec(3, 1.);
    cell.length = vvec(3, 10.);
    cell.axial_resistivity = vvec(3, 100.);
    cell.capacitance = vvec(3, 0.01);

    auto D = conductances_of({cell});
    ASSERT_EQ(D.size(), 3u);

    const double pi = math::pi<double>;
    const double g = 100/(2*half_compartment_resistance(1., 10., 100.)); // 0.1π µS

    EXPECT_TRUE(testing::seq_almost_eq<double>(D.coupling_fwd, vvec{0., g, g}));
    EXPECT_TRUE(testing::seq_almost_eq<double>(D.coupling_bwd, vvec{0., g, g}));
    EXPECT_TRUE(testing::seq_almost_eq<double>(D.summed_coupling, vvec{g, 2*g, g}));
    EXPECT_TRUE(testing::seq_almost_eq<double>(D.area, vvec(3, 20*pi)));
    EXPECT_TRUE(testing::seq_almost_eq<double>(D.capacitance, vvec(3, 0.01*(20*pi))));
    EXPECT_TRUE(D.degenerate_compartments.empty());
}

TEST(conductance, branch_point) {
    //    0
    //   / \.
    //  1   2
    cell_description cell;
    cell.parents = {-1, 0, 0};
    cell.ncomp = {2, 1, 1};
    cell.radius = {1., 1., 1., 2.};
    cell.length = vvec(4, 10.);
    cell.axial_resistivity = vvec(4, 100.);

    morph_index index({cell});
    auto D = build_conductances(index, flatten_geometry({cell}));

    const double g11 = 100/(2*half_compartment_resistance(1., 10., 100.));
    const double g12 = 100/(half_compartment_resistance(1., 10., 100.) + half_compartment_resistance(2., 10., 100.));

    // Both child branches couple to compartment 1, the end of branch 0.
    EXPECT_DOUBLE_EQ(D.branch_fwd(index, 1), g11);
    EXPECT_DOUBLE_EQ(D.branch_bwd(index, 1), g11);
    EXPECT_DOUBLE_EQ(D.branch_fwd(index, 2), g12);
    EXPECT_DOUBLE_EQ(D.branch_bwd(index, 2), g12);
    EXPECT_DOUBLE_EQ(D.branch_fwd(index, 0), 0.);

    EXPECT_DOUBLE_EQ(D.summed_coupling[0], g11);
    EXPECT_DOUBLE_EQ(D.summed_coupling[1], g11 + g11 + g12);
    EXPECT_DOUBLE_EQ(D.summed_coupling[2], g11);
    EXPECT_DOUBLE_EQ(D.summed_coupling[3], g12);
}

TEST(conductance, defaults) {
    cell_description cell;
    cell.parents = {-1};
    cell.ncomp = {2};

    auto geom = flatten_geometry({cell});
    using defaults = cable_parameter_defaults;
    EXPECT_TRUE(testing::seq_eq(geom.radius, vvec(2, defaults::radius)));
    EXPECT_TRUE(testing::seq_eq(geom.length, vvec(2, defaults::length)));
    EXPECT_TRUE(testing::seq_eq(geom.axial_resistivity, vvec(2, defaults::axial_resistivity)));
    EXPECT_TRUE(testing::seq_eq(geom.capacitance, vvec(2, defaults::capacitance)));
}

TEST(conductance, multiple_cells) {
    // Cells are not coupled to each other.
    cell_description cell;
    cell.parents = {-1};
    cell.ncomp = {2};

    auto D = conductances_of({cell, cell});
    ASSERT_EQ(D.size(), 4u);
    EXPECT_EQ(D.coupling_fwd[2], 0.);
    EXPECT_EQ(D.coupling_bwd[2], 0.);
    EXPECT_DOUBLE_EQ(D.summed_coupling[1], D.summed_coupling[2]);
    EXPECT_DOUBLE_EQ(D.coupling_fwd[1], D.coupling_fwd[3]);
}

TEST(conductance, degenerate) {
    cell_description cell;
    cell.parents = {-1};
    cell.ncomp = {3};
    cell.radius = {1., 0., 1.};

    auto D = conductances_of({cell});
    EXPECT_TRUE(testing::seq_eq(D.degenerate_compartments, std::vector<fvm_index_type>{1}));
    EXPECT_EQ(D.area[1], 0.);
    EXPECT_EQ(D.capacitance[1], 0.);
    EXPECT_EQ(D.coupling_fwd[1], 0.);
    EXPECT_EQ(D.coupling_fwd[2], 0.);
    EXPECT_EQ(D.summed_coupling[0], 0.);
    EXPECT_EQ(D.summed_coupling[1], 0.);
    EXPECT_GT(D.area[0], 0.);

    cell.radius = {1., 1., 1.};
    cell.axial_resistivity = {35.4, -1., 35.4};
    D = conductances_of({cell});
    EXPECT_TRUE(testing::seq_eq(D.degenerate_compartments, std::vector<fvm_index_type>{1}));
}

TEST(conductance, bad_geometry) {
    cell_description cell;
    cell.parents = {-1, 0};
    cell.ncomp = {2, 2};
    cell.radius = vvec(3, 1.);

    EXPECT_THROW(flatten_geometry({cell}), bad_geometry_size);

    try {
        cell_description ok;
        ok.parents = {-1};
        ok.ncomp = {1};
        flatten_geometry({ok, cell});
        FAIL() << "expected bad_geometry_size";
    }
    catch (bad_geometry_size& e) {
        EXPECT_EQ(e.cell, 1u);
        EXPECT_EQ(e.size, 3u);
        EXPECT_EQ(e.expected, 4u);
    }
}
