#include <string>

#include <dendrite/dendexcept.hpp>
#include <dendrite/common_types.hpp>

#include "util/strprintf.hpp"

namespace dend {

using dend::util::pprintf;

dendrite_exception::dendrite_exception(const std::string& what):
    std::runtime_error{what}
{}

dendrite_internal_error::dendrite_internal_error(const std::string& what):
    std::logic_error(what)
{}

topology_error::topology_error(fvm_size_type cell, const std::string& what):
    dendrite_exception(pprintf("Topology error on cell {}: {}", cell, what)),
    cell(cell)
{}

empty_morphology::empty_morphology(fvm_size_type cell):
    topology_error(cell, "morphology has no branches")
{}

bad_parent_index::bad_parent_index(fvm_size_type cell, fvm_index_type branch, fvm_index_type parent):
    topology_error(cell, pprintf("branch {} has invalid parent index {}", branch, parent)),
    branch(branch),
    parent(parent)
{}

bad_root_count::bad_root_count(fvm_size_type cell, fvm_size_type num_roots):
    topology_error(cell, pprintf("expected exactly one root branch, found {}", num_roots)),
    num_roots(num_roots)
{}

cyclic_topology::cyclic_topology(fvm_size_type cell, fvm_index_type branch):
    topology_error(cell, pprintf("branch {} is reachable from itself via parent indices", branch)),
    branch(branch)
{}

empty_branch::empty_branch(fvm_size_type cell, fvm_index_type branch):
    topology_error(cell, pprintf("branch {} has no compartments", branch)),
    branch(branch)
{}

too_many_children::too_many_children(fvm_size_type cell, fvm_index_type branch, fvm_size_type num_children, fvm_size_type max_num_kids):
    topology_error(cell, pprintf("branch {} has {} children, more than the maximum of {}", branch, num_children, max_num_kids)),
    branch(branch),
    num_children(num_children),
    max_num_kids(max_num_kids)
{}

configuration_error::configuration_error(const std::string& what):
    dendrite_exception(what)
{}

no_such_mechanism::no_such_mechanism(const std::string& mech_name):
    configuration_error(pprintf("no mechanism {} in catalogue", mech_name)),
    mech_name(mech_name)
{}

duplicate_mechanism::duplicate_mechanism(const std::string& mech_name):
    configuration_error(pprintf("mechanism {} already exists", mech_name)),
    mech_name(mech_name)
{}

invalid_mechanism_kind::invalid_mechanism_kind(const std::string& mech_name, const std::string& placement):
    configuration_error(pprintf("mechanism {} cannot be used as a {}", mech_name, placement)),
    mech_name(mech_name)
{}

no_such_parameter::no_such_parameter(const std::string& mech_name, const std::string& param_name):
    configuration_error(pprintf("mechanism {} has no parameter {}", mech_name, param_name)),
    mech_name(mech_name),
    param_name(param_name)
{}

invalid_parameter_value::invalid_parameter_value(const std::string& mech_name, const std::string& param_name, fvm_value_type value):
    configuration_error(pprintf("invalid parameter value for mechanism {} parameter {}: {}", mech_name, param_name, value)),
    mech_name(mech_name),
    param_name(param_name),
    value(value)
{}

invalid_parameter_value::invalid_parameter_value(const std::string& mech_name, const std::string& param_name, const std::string& reason):
    configuration_error(pprintf("invalid parameter value for mechanism {} parameter {}: {}", mech_name, param_name, reason)),
    mech_name(mech_name),
    param_name(param_name),
    value(0)
{}

bad_compartment_index::bad_compartment_index(const std::string& context, fvm_index_type index, fvm_size_type num_compartments):
    configuration_error(pprintf("{}: compartment index {} is out of range: there are only {} compartments", context, index, num_compartments)),
    context(context),
    index(index),
    num_compartments(num_compartments)
{}

bad_geometry_size::bad_geometry_size(fvm_size_type cell, const std::string& field, std::size_t size, std::size_t expected):
    configuration_error(pprintf("cell {}: {} has {} values, expected {}", cell, field, size, expected)),
    cell(cell),
    field(field),
    size(size),
    expected(expected)
{}

missing_state::missing_state(const std::string& key):
    configuration_error(pprintf("state vector has no entry {}", key)),
    key(key)
{}

unexpected_state::unexpected_state(const std::string& key):
    configuration_error(pprintf("state vector entry {} is not a state of the model", key)),
    key(key)
{}

bad_state_shape::bad_state_shape(const std::string& key, std::size_t size, std::size_t expected):
    configuration_error(pprintf("state vector entry {} has {} values, expected {}", key, size, expected)),
    key(key),
    size(size),
    expected(expected)
{}

bad_max_num_kids::bad_max_num_kids(fvm_size_type max_num_kids, fvm_size_type num_branches):
    configuration_error(pprintf("max_num_kids {} is too large for {} branches", max_num_kids, num_branches)),
    max_num_kids(max_num_kids),
    num_branches(num_branches)
{}

bad_time_step::bad_time_step(fvm_value_type dt):
    configuration_error(pprintf("time step must be positive and finite, got {}", dt)),
    dt(dt)
{}

numerical_error::numerical_error(const std::string& what):
    dendrite_exception(what)
{}

singular_system::singular_system(fvm_index_type compartment, fvm_index_type branch, fvm_value_type diagonal):
    numerical_error(pprintf("singular or non-finite diagonal {} at compartment {} (branch {})", diagonal, compartment, branch)),
    compartment(compartment),
    branch(branch),
    diagonal(diagonal)
{}

non_finite_state::non_finite_state(const std::string& key, fvm_index_type index):
    numerical_error(pprintf("non-finite value in {} at index {}", key, index)),
    key(key),
    index(index)
{}

} // namespace dend
