#pragma once

#include <map>
#include <string>
#include <vector>

#include <dendrite/common_types.hpp>

namespace dend {

// The full state of a model: membrane voltage plus the state variables of
// every mechanism, keyed by name.
//
// The "voltage" entry has one value per compartment in global order. A density
// mechanism state "<alias>_<state>" also has one value per compartment; entries
// at compartments without the mechanism are carried along unchanged. A synapse
// state has one value per connection of its group.
using state_map = std::map<std::string, std::vector<fvm_value_type>>;

inline const std::string voltage_key = "voltage";

inline std::string state_key(const std::string& alias, const std::string& state) {
    return alias + "_" + state;
}

} // namespace dend
