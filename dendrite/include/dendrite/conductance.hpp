#pragma once

#include <vector>

#include <dendrite/common_types.hpp>
#include <dendrite/morph_index.hpp>
#include <dendrite/morphology.hpp>

namespace dend {

// Axial coupling and membrane terms of the discretised cable equation.
//
// For each compartment i with parent compartment p (see morph_index::comp_parent):
//
//   coupling_fwd[i]  conductance coupling p to i, as seen from the equation of p;
//   coupling_bwd[i]  conductance coupling i to p, as seen from the equation of i.
//
// Within a branch these are the forward (i-1 -> i) and backward (i -> i-1)
// couplings of adjacent compartments; for the first compartment of a branch
// they couple it to the last compartment of the parent branch, and they are
// zero for the first compartment of a root branch. In absolute units the
// coupling is symmetric, so the two arrays hold equal values; they are kept
// apart because the solver accepts non-symmetric systems.
//
// summed_coupling[i] is the sum of the conductances of all faces of i: the
// face to its parent and the faces to each of its children.
struct cable_conductances {
    std::vector<fvm_value_type> coupling_fwd;     // [µS]
    std::vector<fvm_value_type> coupling_bwd;     // [µS]
    std::vector<fvm_value_type> summed_coupling;  // [µS]

    std::vector<fvm_value_type> area;             // [µm²] lateral membrane area
    std::vector<fvm_value_type> capacitance;      // [pF]

    // Compartments with non-positive radius, length or axial resistivity.
    // Their faces get zero conductance and they get zero membrane area.
    std::vector<fvm_index_type> degenerate_compartments;

    fvm_size_type size() const { return summed_coupling.size(); }

    // Coupling of the first compartment of branch b to its parent branch.
    fvm_value_type branch_fwd(const morph_index& index, fvm_size_type b) const {
        return coupling_fwd[index.branch_comp_divs[b]];
    }
    fvm_value_type branch_bwd(const morph_index& index, fvm_size_type b) const {
        return coupling_bwd[index.branch_comp_divs[b]];
    }
};

// Per compartment geometry in the global compartment order, with defaults
// substituted for empty per-cell vectors.
struct compartment_geometry {
    std::vector<fvm_value_type> radius;            // [µm]
    std::vector<fvm_value_type> length;            // [µm]
    std::vector<fvm_value_type> axial_resistivity; // [Ω·cm]
    std::vector<fvm_value_type> capacitance;       // [F/m²]
};

// Throws bad_geometry_size if a non-empty per-compartment vector of a cell
// does not have one entry per compartment.
compartment_geometry flatten_geometry(const std::vector<cell_description>& cells);

// Axial resistance of half a compartment in units of 10 kΩ, i.e. the value r for
// which the conductance of the half-compartment is 100/r µS.
fvm_value_type half_compartment_resistance(fvm_value_type radius, fvm_value_type length, fvm_value_type resistivity);

cable_conductances build_conductances(const morph_index& index, const compartment_geometry& geom);

} // namespace dend
