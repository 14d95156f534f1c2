#pragma once

#include <stdexcept>
#include <string>

#include <dendrite/common_types.hpp>

// Dendrite-specific exception hierarchy.

namespace dend {

// Dendrite internal logic error (if these are thrown,
// there is a bug in the library.)

struct dendrite_internal_error: std::logic_error {
    dendrite_internal_error(const std::string&);
};

// Common base-class for dendrite run-time errors.

struct dendrite_exception: std::runtime_error {
    dendrite_exception(const std::string&);
};

// Topology errors: malformed parent/child relationships.
// Raised when a morphology is indexed, before any stepping.

struct topology_error: dendrite_exception {
    topology_error(fvm_size_type cell, const std::string& what);
    fvm_size_type cell;
};

struct empty_morphology: topology_error {
    explicit empty_morphology(fvm_size_type cell);
};

struct bad_parent_index: topology_error {
    bad_parent_index(fvm_size_type cell, fvm_index_type branch, fvm_index_type parent);
    fvm_index_type branch;
    fvm_index_type parent;
};

struct bad_root_count: topology_error {
    bad_root_count(fvm_size_type cell, fvm_size_type num_roots);
    fvm_size_type num_roots;
};

struct cyclic_topology: topology_error {
    cyclic_topology(fvm_size_type cell, fvm_index_type branch);
    fvm_index_type branch;
};

struct empty_branch: topology_error {
    empty_branch(fvm_size_type cell, fvm_index_type branch);
    fvm_index_type branch;
};

struct too_many_children: topology_error {
    too_many_children(fvm_size_type cell, fvm_index_type branch, fvm_size_type num_children, fvm_size_type max_num_kids);
    fvm_index_type branch;
    fvm_size_type num_children;
    fvm_size_type max_num_kids;
};

// Configuration errors: mechanisms, parameters, placements and state vectors
// that do not match the model.

struct configuration_error: dendrite_exception {
    configuration_error(const std::string& what);
};

struct no_such_mechanism: configuration_error {
    explicit no_such_mechanism(const std::string& mech_name);
    std::string mech_name;
};

struct duplicate_mechanism: configuration_error {
    explicit duplicate_mechanism(const std::string& mech_name);
    std::string mech_name;
};

struct invalid_mechanism_kind: configuration_error {
    invalid_mechanism_kind(const std::string& mech_name, const std::string& placement);
    std::string mech_name;
};

struct no_such_parameter: configuration_error {
    no_such_parameter(const std::string& mech_name, const std::string& param_name);
    std::string mech_name;
    std::string param_name;
};

struct invalid_parameter_value: configuration_error {
    invalid_parameter_value(const std::string& mech_name, const std::string& param_name, fvm_value_type value);
    invalid_parameter_value(const std::string& mech_name, const std::string& param_name, const std::string& reason);
    std::string mech_name;
    std::string param_name;
    fvm_value_type value;
};

struct bad_compartment_index: configuration_error {
    bad_compartment_index(const std::string& context, fvm_index_type index, fvm_size_type num_compartments);
    std::string context;
    fvm_index_type index;
    fvm_size_type num_compartments;
};

struct bad_geometry_size: configuration_error {
    bad_geometry_size(fvm_size_type cell, const std::string& field, std::size_t size, std::size_t expected);
    fvm_size_type cell;
    std::string field;
    std::size_t size;
    std::size_t expected;
};

struct missing_state: configuration_error {
    explicit missing_state(const std::string& key);
    std::string key;
};

struct unexpected_state: configuration_error {
    explicit unexpected_state(const std::string& key);
    std::string key;
};

struct bad_state_shape: configuration_error {
    bad_state_shape(const std::string& key, std::size_t size, std::size_t expected);
    std::string key;
    std::size_t size;
    std::size_t expected;
};

// Too many child slots per branch to index the kid-slot table.
struct bad_max_num_kids: configuration_error {
    bad_max_num_kids(fvm_size_type max_num_kids, fvm_size_type num_branches);
    fvm_size_type max_num_kids;
    fvm_size_type num_branches;
};

struct bad_time_step: configuration_error {
    explicit bad_time_step(fvm_value_type dt);
    fvm_value_type dt;
};

// Numerical errors: non-finite or singular terms in the linear solve.

struct numerical_error: dendrite_exception {
    numerical_error(const std::string& what);
};

struct singular_system: numerical_error {
    singular_system(fvm_index_type compartment, fvm_index_type branch, fvm_value_type diagonal);
    fvm_index_type compartment;
    fvm_index_type branch;
    fvm_value_type diagonal;
};

struct non_finite_state: numerical_error {
    non_finite_state(const std::string& key, fvm_index_type index);
    std::string key;
    fvm_index_type index;
};

} // namespace dend
