#include <vector>

#include <gtest/gtest.h>

#include <dendrite/stimulus.hpp>

#include "common.hpp"

using namespace dend;
using vvec = std::vector<fvm_value_type>;
using iarray = std::vector<fvm_index_type>;

TEST(stimulus, add) {
    stimulus s;
    EXPECT_TRUE(s.empty());

    s.add(3, 0.1);
    s.add(1, -0.2);
    s.add(3, 0.05);
    EXPECT_EQ(s.size(), 3u);
    EXPECT_TRUE(testing::seq_eq(s.compartments, iarray{3, 1, 3}));
    EXPECT_TRUE(testing::seq_eq(s.current, vvec{0.1, -0.2, 0.05}));
}

TEST(stimulus, schedule) {
    stimulus_schedule sched;
    EXPECT_EQ(sched.num_steps(), 0u);
    EXPECT_TRUE(sched.at(0).empty());

    sched.add(2, {1., 2., 3.});
    sched.add_constant(5, 0.5, 2);
    EXPECT_EQ(sched.num_steps(), 3u);
    EXPECT_EQ(sched.traces().size(), 2u);

    auto s0 = sched.at(0);
    EXPECT_TRUE(testing::seq_eq(s0.compartments, iarray{2, 5}));
    EXPECT_TRUE(testing::seq_eq(s0.current, vvec{1., 0.5}));

    // Traces contribute nothing past their end.
    auto s2 = sched.at(2);
    EXPECT_TRUE(testing::seq_eq(s2.compartments, iarray{2}));
    EXPECT_TRUE(testing::seq_eq(s2.current, vvec{3.}));

    EXPECT_TRUE(sched.at(3).empty());
    EXPECT_TRUE(sched.at(1000).empty());
}

TEST(stimulus, schedule_same_compartment) {
    stimulus_schedule sched;
    sched.add(1, {1., 1.});
    sched.add(1, {0.5});

    auto s = sched.at(0);
    EXPECT_EQ(s.size(), 2u);
    EXPECT_TRUE(testing::seq_eq(s.compartments, iarray{1, 1}));
    EXPECT_EQ(sched.at(1).size(), 1u);
}
