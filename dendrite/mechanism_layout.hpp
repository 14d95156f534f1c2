#pragma once

#include <string>
#include <vector>

#include <dendrite/common_types.hpp>
#include <dendrite/conductance.hpp>
#include <dendrite/mechanism.hpp>
#include <dendrite/mechcat.hpp>
#include <dendrite/network.hpp>
#include <dendrite/state.hpp>

namespace dend {

// Post-discretization data for the instances of one mechanism placed under one
// alias.
struct mechanism_layout {
    using value_type = fvm_value_type;
    using index_type = fvm_index_type;

    mechanism_ptr mech;
    std::string alias;

    // Compartment into which each instance injects current.
    std::vector<index_type> cv;

    // Compartment whose voltage an instance reads as v_pre: the presynaptic
    // compartment for synapses, cv otherwise.
    std::vector<index_type> peer_cv;

    // Position of each instance in the state vectors of the mechanism.
    std::vector<index_type> state_index;

    // Scale from mechanism terms to [µS] and [nA]: 1e-3 times the membrane area
    // [µm²] for density mechanisms, 1 for point mechanisms.
    std::vector<value_type> weight;

    // Parameter values, one vector per mechanism parameter, one entry per instance.
    std::vector<std::vector<value_type>> param_values;

    // Key in the state map of each mechanism state.
    std::vector<std::string> state_keys;

    // Length of each state vector: the number of compartments for density
    // mechanisms, the number of connections for synapses.
    fvm_size_type state_size = 0;

    fvm_size_type width() const { return cv.size(); }
};

// Resolve the channel insertions and synapse groups of a network against the
// catalogue. Density insertions with the same alias are merged into one layout.
//
// Throws a configuration_error for unknown mechanisms or parameters, parameter
// values out of bounds, compartment indices out of range, mechanisms placed as
// the wrong kind, and colliding aliases or state keys.
std::vector<mechanism_layout> layout_mechanisms(
    const network_description& desc,
    const cable_conductances& D,
    const mechanism_catalogue& catalogue);

// Batched operations over all instances of a layout. Voltages are indexed by
// compartment; states are read from and written to the layout's entries in the
// state map, which must be present with the right size.

void init_mechanism(const mechanism_layout& m, const std::vector<fvm_value_type>& v, state_map& state);

void advance_mechanism(const mechanism_layout& m, fvm_value_type dt, const std::vector<fvm_value_type>& v, const state_map& in, state_map& out);

// Per instance terms, weighted: voltage_term [µS], constant_term [nA].
void linearize_mechanism(
    const mechanism_layout& m,
    const std::vector<fvm_value_type>& v,
    const state_map& state,
    std::vector<fvm_value_type>& voltage_term,
    std::vector<fvm_value_type>& constant_term);

} // namespace dend
