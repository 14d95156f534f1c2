#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <dendrite/cable_model.hpp>
#include <dendrite/conductance.hpp>
#include <dendrite/dendexcept.hpp>
#include <dendrite/math.hpp>
#include <dendrite/network.hpp>
#include <dendrite/state.hpp>
#include <dendrite/stimulus.hpp>

#include "common.hpp"
#include "reference_solvers.hpp"

using namespace dend;
using vvec = std::vector<fvm_value_type>;
using iarray = std::vector<fvm_index_type>;

namespace {
cell_description make_cell(iarray parents, std::vector<fvm_size_type> ncomp) {
    cell_description c;
    c.parents = std::move(parents);
    c.ncomp = std::move(ncomp);
    return c;
}

cell_description uniform_cell(iarray parents, std::vector<fvm_size_type> ncomp, double radius, double length, double ra) {
    auto c = make_cell(std::move(parents), std::move(ncomp));
    const auto n = c.num_compartments();
    c.radius = vvec(n, radius);
    c.length = vvec(n, length);
    c.axial_resistivity = vvec(n, ra);
    c.capacitance = vvec(n, 0.01);
    return c;
}

network_description single_cell(cell_description cell) {
    network_description net;
    net.cells = {std::move(cell)};
    return net;
}
} // anonymous namespace

TEST(cable_model, construct) {
    auto net = single_cell(make_cell({-1, 0, 0}, {2, 3, 1}));
    net.insert_everywhere("pas");
    net.channels.push_back({"hh", {0, 1}});
    net.synapses.push_back({"graded_syn", {{0, 5}, {5, 0}}});

    cable_model model(net);
    EXPECT_EQ(model.num_compartments(), 6u);
    EXPECT_EQ(model.index().num_branches(), 3u);
    EXPECT_EQ(model.conductances().size(), 6u);

    auto layout = model.state_layout();
    std::map<std::string, std::size_t> expected = {
        {"voltage", 6}, {"hh_m", 6}, {"hh_h", 6}, {"hh_n", 6}, {"graded_syn_s", 2}
    };
    EXPECT_EQ(layout, expected);

    auto state = model.initial_state(-65.);
    EXPECT_EQ(state.size(), 5u);
    for (const auto& [key, size]: expected) {
        ASSERT_TRUE(state.count(key)) << key;
        EXPECT_EQ(state.at(key).size(), size);
    }
    EXPECT_TRUE(testing::seq_eq(state.at(voltage_key), vvec(6, -65.)));

    // Density states away from the mechanism hold the state's default value.
    EXPECT_EQ(state.at("hh_m")[5], 0.05);
    EXPECT_NEAR(state.at("hh_m")[0], 0.0529, 1e-4);
}

TEST(cable_model, initial_state_per_compartment) {
    auto net = single_cell(make_cell({-1}, {3}));
    net.insert_everywhere("hh");
    cable_model model(net);

    auto state = model.initial_state(vvec{-65., -40., -65.});
    EXPECT_TRUE(testing::seq_eq(state.at(voltage_key), vvec{-65., -40., -65.}));
    EXPECT_EQ(state.at("hh_m")[0], state.at("hh_m")[2]);
    EXPECT_GT(state.at("hh_m")[1], state.at("hh_m")[0]);

    EXPECT_THROW(model.initial_state(vvec{-65., -65.}), bad_state_shape);
    EXPECT_THROW(model.initial_state(vvec{-65., std::nan(""), -65.}), non_finite_state);
}

// A uniform voltage with no currents is a fixed point.
TEST(cable_model, steady_state) {
    {
        auto cell = make_cell({-1, 0, 0, 1, 1}, {3, 2, 2, 1, 4});
        cell.radius = {1., 0.9, 0.8, 0.7, 0.6, 0.5, 0.4, 0.3, 0.2, 1.1, 1.2, 1.3};
        cable_model model(single_cell(cell));

        auto state = model.initial_state(-65.);
        auto final = model.integrate(state, 0.025, {}, 100);
        EXPECT_TRUE(testing::seq_near_relative(final.at(voltage_key), vvec(12, -65.), 1e-12));
    }
    {
        // pas at its reversal potential
        auto net = single_cell(make_cell({-1, 0, 0}, {2, 2, 2}));
        net.insert_everywhere(mechanism_desc("pas").set("e", -65.));
        cable_model model(net);

        auto final = model.integrate(model.initial_state(-65.), 0.025, {}, 100);
        EXPECT_TRUE(testing::seq_near_relative(final.at(voltage_key), vvec(6, -65.), 1e-12));
    }
}

// Four compartments, coupled by g, current I into compartment 0 for one step.
TEST(cable_model, four_compartments) {
    auto cell = uniform_cell({-1}, {4}, 1., 10., 100.);
    cable_model model(single_cell(cell));

    const double dt = 0.025;
    const double I = 0.1;
    const double g = 100/(2*half_compartment_resistance(1., 10., 100.));
    const double c = (1e-3/dt)*(0.01*math::area_cylinder(10., 1.));

    const auto& D = model.conductances();
    EXPECT_DOUBLE_EQ(D.coupling_fwd[1], g);
    EXPECT_DOUBLE_EQ(D.coupling_fwd[3], g);

    testing::dense_matrix A = {
        {c+g,   -g,    0.,    0.},
        {-g,    c+2*g, -g,    0.},
        {0.,    -g,    c+2*g, -g},
        {0.,    0.,    -g,    c+g},
    };
    auto expected = testing::dense_solve(A, {I, 0., 0., 0.});

    stimulus stim;
    stim.add(0, I);
    auto next = model.step(model.initial_state(0.), dt, stim);
    EXPECT_TRUE(testing::seq_near_relative(next.at(voltage_key), expected, 1e-12));

    // Current spreads away from the injection site.
    const auto& v = next.at(voltage_key);
    EXPECT_GT(v[0], v[1]);
    EXPECT_GT(v[1], v[2]);
    EXPECT_GT(v[2], v[3]);
    EXPECT_GT(v[3], 0.);
}

// A root of two compartments with two identical child branches of two compartments.
TEST(cable_model, fan_out_symmetry) {
    auto net = single_cell(uniform_cell({-1, 0, 0}, {2, 2, 2}, 0.5, 20., 100.));
    net.insert_everywhere("pas");
    cable_model model(net);

    // branch 1: compartments 2, 3; branch 2: compartments 4, 5
    auto run = [&](fvm_index_type site) {
        stimulus_schedule sched;
        sched.add_constant(site, 0.05, 40);
        return model.integrate(model.initial_state(-65.), 0.025, sched, 40).at(voltage_key);
    };

    auto v1 = run(3);
    auto v2 = run(5);

    EXPECT_TRUE(testing::near_relative(v1[0], v2[0], 1e-12));
    EXPECT_TRUE(testing::near_relative(v1[1], v2[1], 1e-12));
    EXPECT_TRUE(testing::near_relative(v1[2], v2[4], 1e-12));
    EXPECT_TRUE(testing::near_relative(v1[3], v2[5], 1e-12));
    EXPECT_TRUE(testing::near_relative(v1[4], v2[2], 1e-12));
    EXPECT_TRUE(testing::near_relative(v1[5], v2[3], 1e-12));

    // The stimulated leaf is the most depolarized.
    EXPECT_EQ(std::max_element(v1.begin(), v1.end()) - v1.begin(), 3);

    // Injection at the root treats both children alike.
    auto v0 = run(0);
    EXPECT_TRUE(testing::near_relative(v0[2], v0[4], 1e-12));
    EXPECT_TRUE(testing::near_relative(v0[3], v0[5], 1e-12));
}

// The synapse changes the postsynaptic compartment only.
TEST(cable_model, synapse_isolation) {
    network_description plain;
    plain.cells = {make_cell({-1}, {1}), make_cell({-1}, {1})};
    plain.insert_everywhere("pas");

    auto with_syn = plain;
    with_syn.synapses.push_back({mechanism_desc("graded_syn").set("gsyn", 0.01).set("vth", -70.), {{0, 1}}});

    cable_model m0(plain), m1(with_syn);
    auto s0 = m0.initial_state(-65.);
    auto s1 = m1.initial_state(-65.);

    const double s = s1.at("graded_syn_s")[0];
    EXPECT_GT(s, 0.5);

    auto t0 = m0.linearize(s0);
    auto t1 = m1.linearize(s1);
    EXPECT_EQ(t1.voltage_term[0], t0.voltage_term[0]);
    EXPECT_EQ(t1.constant_term[0], t0.constant_term[0]);
    EXPECT_DOUBLE_EQ(t1.voltage_term[1], t0.voltage_term[1] + 0.01*s);

    for (int i = 0; i<20; ++i) {
        s0 = m0.step(s0, 0.025);
        s1 = m1.step(s1, 0.025);
        EXPECT_EQ(s1.at(voltage_key)[0], s0.at(voltage_key)[0]);
    }
    // esyn = 0 mV depolarizes the postsynaptic compartment.
    EXPECT_GT(s1.at(voltage_key)[1], s0.at(voltage_key)[1]);
}

// Synapses onto the same compartment add.
TEST(cable_model, synapse_accumulation) {
    network_description one;
    one.cells = {make_cell({-1}, {1}), make_cell({-1}, {1})};
    one.synapses.push_back({"graded_syn", {{0, 1}}});

    auto two = one;
    two.synapses[0].connections.push_back({0, 1});

    auto three = one;
    three.synapses.push_back({mechanism_desc("graded_syn").rename("syn2"), {{0, 1}}});

    auto term = [](const network_description& net) {
        cable_model model(net);
        return model.linearize(model.initial_state(-40.)).voltage_term;
    };

    auto t1 = term(one);
    EXPECT_EQ(t1[0], 0.);
    EXPECT_GT(t1[1], 0.);
    EXPECT_DOUBLE_EQ(term(two)[1], 2*t1[1]);
    EXPECT_DOUBLE_EQ(term(three)[1], 2*t1[1]);
}

// States are advanced first, then currents are linearised with the advanced
// states and the voltage from before the step.
TEST(cable_model, step_order) {
    auto net = single_cell(make_cell({-1}, {1}));
    net.insert_everywhere("hh");
    cable_model model(net);

    const double dt = 0.05;
    auto state = model.initial_state(-65.);
    state.at(voltage_key)[0] = -50.;

    auto advanced = model.advance_states(state, dt);
    EXPECT_EQ(advanced.at(voltage_key), state.at(voltage_key));
    EXPECT_NE(advanced.at("hh_m")[0], state.at("hh_m")[0]);

    auto terms = model.linearize(advanced);
    const double gc = (1e-3/dt)*model.conductances().capacitance[0];
    const double v = -50.;
    const double expected = (gc*v - terms.constant_term[0])/(gc + terms.voltage_term[0]);

    auto next = model.step(state, dt);
    EXPECT_DOUBLE_EQ(next.at(voltage_key)[0], expected);
    for (auto key: {"hh_m", "hh_h", "hh_n"}) {
        EXPECT_EQ(next.at(key), advanced.at(key)) << key;
    }
}

TEST(cable_model, insertions) {
    auto net = single_cell(uniform_cell({-1}, {4}, 1., 10., 100.));
    net.channels.push_back({mechanism_desc("pas").set("g", 0.001), {0, 1}});
    net.channels.push_back({mechanism_desc("pas").set("g", 0.002), {1, 2}});
    net.channels.push_back({mechanism_desc("pas").set("g", vvec{0.004}).rename("leak"), {3}});
    net.channels.push_back({"hh", {0}});
    cable_model model(net);

    auto state = model.initial_state(-65.);
    auto terms = model.linearize(state);

    // Insertions of the same alias merge; later ones take precedence.
    const double w = 1e-3*model.conductances().area[0];
    EXPECT_GT(terms.voltage_term[0], 10*0.001*w);
    EXPECT_DOUBLE_EQ(terms.voltage_term[1], 10*0.002*w);
    EXPECT_DOUBLE_EQ(terms.voltage_term[2], 10*0.002*w);
    EXPECT_DOUBLE_EQ(terms.voltage_term[3], 10*0.004*w);

    // hh state entries away from compartment 0 are carried along.
    auto next = model.step(state, 0.025);
    EXPECT_EQ(next.at("hh_m")[3], state.at("hh_m")[3]);
}

TEST(cable_model, integrate) {
    auto net = single_cell(make_cell({-1, 0, 0}, {2, 2, 2}));
    net.insert_everywhere("hh");
    cable_model model(net);

    stimulus_schedule sched;
    sched.add_constant(3, 0.05, 40);

    auto state = model.initial_state(-65.);
    auto expected = state;
    for (std::size_t k = 0; k<100; ++k) {
        expected = model.step(expected, 0.025, sched.at(k));
    }

    std::size_t calls = 0;
    double vmax = -100;
    auto final = model.integrate(state, 0.025, sched, 100,
        [&](std::size_t step, const state_map& s) {
            EXPECT_EQ(step, calls+1);
            ++calls;
            vmax = std::max(vmax, s.at(voltage_key)[3]);
        });

    EXPECT_EQ(calls, 100u);
    for (const auto& [key, values]: expected) {
        EXPECT_TRUE(testing::seq_eq(final.at(key), values)) << key;
    }
    EXPECT_GT(vmax, -65.);
}

TEST(cable_model, action_potential) {
    auto net = single_cell(make_cell({-1}, {1}));
    net.insert_everywhere("hh");
    cable_model model(net);

    stimulus_schedule sched;
    sched.add_constant(0, 0.05, 80);

    double vmax = -100;
    model.integrate(model.initial_state(-65.), 0.025, sched, 800,
        [&](std::size_t, const state_map& s) { vmax = std::max(vmax, s.at(voltage_key)[0]); });
    EXPECT_GT(vmax, 20.);
}

TEST(cable_model, deterministic) {
    auto net = single_cell(make_cell({-1, 0, 0, 0, 1, 1}, {3, 2, 2, 2, 1, 1}));
    net.insert_everywhere("hh");
    net.synapses.push_back({"graded_syn", {{0, 10}, {10, 3}}});
    cable_model model(net);

    stimulus stim;
    stim.add(4, 0.02);
    auto state = model.initial_state(-60.);
    auto a = model.step(state, 0.025, stim);
    auto b = model.step(state, 0.025, stim);
    for (const auto& [key, values]: a) {
        EXPECT_TRUE(testing::seq_eq(values, b.at(key))) << key;
    }
}

// Steps on independent states can run concurrently on one model.
TEST(cable_model, concurrent_steps) {
    auto net = single_cell(make_cell({-1, 0, 0}, {4, 4, 4}));
    net.insert_everywhere("hh");
    const cable_model model(net);

    const int nrun = 4;
    auto run = [&](int k) {
        stimulus_schedule sched;
        sched.add_constant(k, 0.01*(k+1), 50);
        return model.integrate(model.initial_state(-65.), 0.025, sched, 50).at(voltage_key);
    };

    std::vector<vvec> serial, parallel(nrun);
    for (int k = 0; k<nrun; ++k) serial.push_back(run(k));

    std::vector<std::thread> threads;
    for (int k = 0; k<nrun; ++k) {
        threads.emplace_back([&, k]() { parallel[k] = run(k); });
    }
    for (auto& t: threads) t.join();

    for (int k = 0; k<nrun; ++k) {
        EXPECT_TRUE(testing::seq_eq(parallel[k], serial[k]));
    }
}

TEST(cable_model, invalid_description) {
    auto base = single_cell(make_cell({-1, 0, 0}, {1, 1, 2}));

    auto with_channel = [&](density_insertion ins) {
        auto net = base;
        net.channels.push_back(std::move(ins));
        return net;
    };
    auto with_synapse = [&](synapse_group group) {
        auto net = base;
        net.synapses.push_back(std::move(group));
        return net;
    };

    {
        auto net = base;
        net.max_num_kids = 2147483648u;
        EXPECT_THROW(cable_model{net}, bad_max_num_kids);
    }

    EXPECT_THROW(cable_model(with_channel({"nax", {0}})), no_such_mechanism);
    EXPECT_THROW(cable_model(with_channel({"graded_syn", {0}})), invalid_mechanism_kind);
    EXPECT_THROW(cable_model(with_synapse({"hh", {{0, 1}}})), invalid_mechanism_kind);

    EXPECT_THROW(cable_model(with_channel({mechanism_desc("pas").set("gbar", 1.), {0}})), no_such_parameter);
    EXPECT_THROW(cable_model(with_channel({mechanism_desc("pas").set("gbar", vvec{1.}), {0}})), no_such_parameter);
    EXPECT_THROW(cable_model(with_channel({mechanism_desc("pas").set("g", -1.), {0}})), invalid_parameter_value);
    EXPECT_THROW(cable_model(with_channel({mechanism_desc("pas").set("g", vvec{0.1, -0.1}), {0, 1}})), invalid_parameter_value);
    EXPECT_THROW(cable_model(with_channel({mechanism_desc("pas").set("g", vvec{0.1}), {0, 1}})), invalid_parameter_value);
    EXPECT_THROW(cable_model(with_synapse({mechanism_desc("graded_syn").set("delta", 0.), {{0, 1}}})), invalid_parameter_value);

    EXPECT_THROW(cable_model(with_channel({"pas", {4}})), bad_compartment_index);
    EXPECT_THROW(cable_model(with_channel({"pas", {-1}})), bad_compartment_index);
    EXPECT_THROW(cable_model(with_synapse({"graded_syn", {{0, 7}}})), bad_compartment_index);
    EXPECT_THROW(cable_model(with_synapse({"graded_syn", {{-1, 0}}})), bad_compartment_index);

    {
        auto net = with_channel({"pas", {0}});
        net.channels.push_back({mechanism_desc("hh").rename("pas"), {1}});
        EXPECT_THROW(cable_model{net}, duplicate_mechanism);
    }
    {
        auto net = with_channel({"hh", {0}});
        net.synapses.push_back({mechanism_desc("graded_syn").rename("hh"), {{0, 1}}});
        EXPECT_THROW(cable_model{net}, duplicate_mechanism);
    }
    {
        auto net = with_synapse({"graded_syn", {{0, 1}}});
        net.synapses.push_back({"graded_syn", {{1, 0}}});
        EXPECT_THROW(cable_model{net}, duplicate_mechanism);
    }
    {
        // Aliases may share a prefix.
        auto net = with_channel({"hh", {0}});
        net.channels.push_back({mechanism_desc("hh").rename("hh_m"), {1}});
        EXPECT_NO_THROW(cable_model{net});
    }
    {
        auto net = base;
        net.max_num_kids = 1;
        EXPECT_THROW(cable_model{net}, too_many_children);
    }
    {
        auto net = base;
        net.cells.push_back(make_cell({-1, 0, 2}, {1, 1, 1}));
        EXPECT_THROW(cable_model{net}, topology_error);
    }
}

TEST(cable_model, invalid_state) {
    auto net = single_cell(make_cell({-1}, {3}));
    net.insert_everywhere("hh");
    cable_model model(net);
    const auto state = model.initial_state(-65.);

    EXPECT_THROW(model.step(state, 0.), bad_time_step);
    EXPECT_THROW(model.step(state, -0.025), bad_time_step);
    EXPECT_THROW(model.step(state, std::nan("")), bad_time_step);
    EXPECT_THROW(model.step(state, std::numeric_limits<double>::infinity()), bad_time_step);
    EXPECT_THROW(model.advance_states(state, 0.), bad_time_step);

    {
        auto s = state;
        s.erase(voltage_key);
        EXPECT_THROW(model.step(s, 0.025), missing_state);
        EXPECT_THROW(model.linearize(s), missing_state);
    }
    {
        auto s = state;
        s.erase("hh_n");
        EXPECT_THROW(model.step(s, 0.025), missing_state);
    }
    {
        auto s = state;
        s["pas_g"] = vvec(3, 0.);
        EXPECT_THROW(model.step(s, 0.025), unexpected_state);
    }
    {
        auto s = state;
        s.at("hh_m").push_back(0.);
        try {
            model.step(s, 0.025);
            FAIL() << "expected bad_state_shape";
        }
        catch (bad_state_shape& e) {
            EXPECT_EQ(e.key, "hh_m");
            EXPECT_EQ(e.size, 4u);
            EXPECT_EQ(e.expected, 3u);
        }
    }
    {
        auto s = state;
        s.at(voltage_key)[1] = std::nan("");
        EXPECT_THROW(model.step(s, 0.025), non_finite_state);
    }
    {
        auto s = state;
        s.at("hh_h")[2] = std::nan("");
        try {
            model.step(s, 0.025);
            FAIL() << "expected non_finite_state";
        }
        catch (non_finite_state& e) {
            EXPECT_EQ(e.key, "hh_h");
            EXPECT_EQ(e.index, 2);
        }
    }
    {
        stimulus stim;
        stim.add(3, 0.1);
        EXPECT_THROW(model.step(state, 0.025, stim), bad_compartment_index);

        stimulus_schedule sched;
        sched.add_constant(-1, 0.1, 1);
        EXPECT_THROW(model.integrate(state, 0.025, sched, 1), bad_compartment_index);
    }
}

TEST(cable_model, singular) {
    auto cell = make_cell({-1}, {2});
    cell.radius = {0., 0.};
    cable_model model(single_cell(cell));
    EXPECT_TRUE(testing::seq_eq(model.conductances().degenerate_compartments, iarray{0, 1}));

    EXPECT_THROW(model.step(model.initial_state(-65.), 0.025), singular_system);
}
