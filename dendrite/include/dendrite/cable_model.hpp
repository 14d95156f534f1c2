#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <dendrite/common_types.hpp>
#include <dendrite/conductance.hpp>
#include <dendrite/mechcat.hpp>
#include <dendrite/morph_index.hpp>
#include <dendrite/morphology.hpp>
#include <dendrite/network.hpp>
#include <dendrite/state.hpp>
#include <dendrite/stimulus.hpp>

namespace dend {

// Linearised membrane current per compartment, I ≈ voltage_term·V + constant_term,
// summed over all mechanisms acting on the compartment. Outward current is positive.
struct linear_terms {
    std::vector<fvm_value_type> voltage_term;   // [µS]
    std::vector<fvm_value_type> constant_term;  // [nA]
};

// Called after each step of cable_model::integrate with the number of steps
// taken so far and the state after the step.
using step_callback = std::function<void(std::size_t step, const state_map& state)>;

// cable_model_state comprises the private implementation of cable_model.
class cable_model_state;

// The discretised cable equation of a network of cells, with the mechanisms
// placed on it.
//
// The model holds no simulation state: every operation takes the state to
// operate on and returns a new one, and the model is not modified after
// construction. Operations on independent states may run concurrently.
class cable_model {
public:
    // Throws topology_error or configuration_error if the description is
    // not valid.
    explicit cable_model(const network_description& desc, const mechanism_catalogue& catalogue = global_default_catalogue());

    cable_model(const cable_model&) = delete;
    cable_model(cable_model&&);
    cable_model& operator=(cable_model&&);
    ~cable_model();

    const morph_index& index() const;
    const cable_conductances& conductances() const;

    fvm_size_type num_compartments() const;

    // Names of the entries of a state, with their lengths.
    std::map<std::string, std::size_t> state_layout() const;

    // Uniform voltage [mV], with mechanism states at their initial values for
    // that voltage.
    state_map initial_state(fvm_value_type v_init = cable_parameter_defaults::init_voltage) const;

    // Voltage [mV] per compartment, with mechanism states at their initial
    // values for those voltages.
    state_map initial_state(const std::vector<fvm_value_type>& v_init) const;

    // Mechanism states advanced by dt [ms] at the voltage of `state`, which is
    // carried over unchanged.
    state_map advance_states(const state_map& state, fvm_value_type dt) const;

    // Linearised membrane current at the voltage and mechanism states of `state`.
    // Synapse terms are attributed to the postsynaptic compartment.
    linear_terms linearize(const state_map& state) const;

    // One backward Euler step of length dt [ms] with injected current `stim`.
    //
    // Mechanism states are advanced first; currents are then linearised with
    // the advanced mechanism states and the voltage before the step.
    //
    // Throws bad_time_step, missing_state, unexpected_state or bad_state_shape
    // for bad arguments, and a numerical_error if the solution is not finite.
    state_map step(const state_map& state, fvm_value_type dt, const stimulus& stim = {}) const;

    // n_steps calls to step, with the stimulus of step k taken from schedule.at(k).
    // The callback, if any, is called after every step.
    state_map integrate(
        state_map state,
        fvm_value_type dt,
        const stimulus_schedule& schedule,
        std::size_t n_steps,
        const step_callback& callback = {}) const;

private:
    std::unique_ptr<cable_model_state> impl_;
};

} // namespace dend
