#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include <dendrite/common_types.hpp>
#include <dendrite/morph_index.hpp>
#include <dendrite/morphology.hpp>

namespace dend {

// A mechanism selected by catalogue name, with parameter settings.
//
// The alias names the mechanism's entries in the state vector, as
// "<alias>_<state>"; it defaults to the mechanism name. Parameters not set here
// take the mechanism's defaults. `instance_params` hold one value per placed
// instance and take precedence over `params`.
struct mechanism_desc {
    std::string name;
    std::string alias;
    std::map<std::string, fvm_value_type> params;
    std::map<std::string, std::vector<fvm_value_type>> instance_params;

    mechanism_desc() = default;
    mechanism_desc(std::string name): name(std::move(name)) {}
    mechanism_desc(const char* name): name(name) {}

    mechanism_desc& set(const std::string& key, fvm_value_type value) {
        params[key] = value;
        return *this;
    }

    mechanism_desc& set(const std::string& key, std::vector<fvm_value_type> values) {
        instance_params[key] = std::move(values);
        return *this;
    }

    mechanism_desc& rename(std::string new_alias) {
        alias = std::move(new_alias);
        return *this;
    }

    const std::string& prefix() const {
        return alias.empty()? name: alias;
    }
};

// A density mechanism inserted on a set of compartments (global indices).
struct density_insertion {
    mechanism_desc mech;
    std::vector<fvm_index_type> compartments;
};

// A point-to-point connection between two compartments (global indices).
// The synapse reads the voltage of `pre` and injects current into `post`.
struct connection {
    fvm_index_type pre;
    fvm_index_type post;
};

// Connections sharing one synapse mechanism.
struct synapse_group {
    mechanism_desc mech;
    std::vector<connection> connections;
};

struct network_description {
    std::vector<cell_description> cells;
    std::vector<density_insertion> channels;
    std::vector<synapse_group> synapses;
    fvm_size_type max_num_kids = morph_index::default_max_num_kids;

    // Number of compartments of the cells added so far: the global index of
    // the first compartment of the next cell.
    fvm_size_type num_compartments() const;

    // Insert a density mechanism on all compartments of all cells.
    void insert_everywhere(mechanism_desc mech);
};

} // namespace dend
