#pragma once

#include <dendrite/mechanism.hpp>

namespace dend {

// Passive leak current.
mechanism_ptr make_pas_mechanism();

// Hodgkin-Huxley sodium, potassium and leak currents of the squid giant axon.
mechanism_ptr make_hh_mechanism();

// Graded chemical synapse: conductance gated by the presynaptic voltage.
mechanism_ptr make_graded_syn_mechanism();

} // namespace dend
