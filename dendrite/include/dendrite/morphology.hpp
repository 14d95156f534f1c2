#pragma once

#include <vector>

#include <dendrite/common_types.hpp>

namespace dend {

// Default cable parameters, as for NEURON.
struct cable_parameter_defaults {
    static constexpr fvm_value_type axial_resistivity = 35.4; // [Ω·cm]
    static constexpr fvm_value_type capacitance = 0.01;       // [F/m²]
    static constexpr fvm_value_type radius = 1.0;             // [µm]
    static constexpr fvm_value_type length = 10.0;            // [µm]
    static constexpr fvm_value_type init_voltage = -65.0;     // [mV]
};

// Description of the branch tree of one cell and the geometry of its
// compartments.
//
// Compartments are numbered branch by branch in branch index order, and within
// a branch from the proximal end (adjacent to the parent branch) to the distal
// end. The per-compartment vectors are in that order; an empty vector selects
// the default value for every compartment.
struct cell_description {
    std::vector<fvm_index_type> parents;         // parent branch of each branch; -1 for the root
    std::vector<fvm_size_type> ncomp;            // number of compartments on each branch

    std::vector<fvm_value_type> radius;            // [µm]
    std::vector<fvm_value_type> length;            // [µm]
    std::vector<fvm_value_type> axial_resistivity; // [Ω·cm]
    std::vector<fvm_value_type> capacitance;       // [F/m²]

    fvm_size_type num_branches() const { return parents.size(); }
    fvm_size_type num_compartments() const;
};

// Build a cell description from per-branch morphometrics, as delivered by a
// morphology reader: the path length of each branch, the radius at its distal
// end point, and the radius at the proximal end of the root branch.
//
// Each branch is cut into ncomp[b] compartments of equal length. Compartment
// radii are interpolated linearly at the compartment mid points, between the
// radius at the end of the parent branch (or start_radius for the root) and
// the branch's own end point radius.
cell_description cell_description_from_branches(
    std::vector<fvm_index_type> parents,
    std::vector<fvm_size_type> ncomp,
    const std::vector<fvm_value_type>& pathlengths,
    const std::vector<fvm_value_type>& endpoint_radii,
    fvm_value_type start_radius,
    fvm_value_type axial_resistivity = cable_parameter_defaults::axial_resistivity,
    fvm_value_type capacitance = cable_parameter_defaults::capacitance);

} // namespace dend
