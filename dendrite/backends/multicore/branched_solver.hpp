#pragma once

#include <vector>

#include <dendrite/common_types.hpp>
#include <dendrite/conductance.hpp>
#include <dendrite/morph_index.hpp>

namespace dend {
namespace multicore {

// Direct solver for the tree-structured linear system of the cable equation.
//
// Row i of the system couples compartment i to its parent compartment p and to
// the first compartment c of each child branch when i ends a branch:
//
//     d[i]·x[i] + lower[i]·x[p] + Σ_c upper[c]·x[c] = rhs[i]
//
// Within a branch this is the classical tridiagonal system, solved by the Thomas
// algorithm. Branches are visited by level: elimination goes from the deepest
// level up to the roots, folding each reduced child branch into the last
// compartment of its parent, and back substitution goes from the roots down.
// Branches on the same level touch disjoint rows and are processed in parallel.
struct branched_solver {
    using value_type = fvm_value_type;
    using index_type = fvm_index_type;
    using array      = std::vector<value_type>;
    using iarray     = std::vector<index_type>;

    iarray branch_comp_divs;
    iarray branch_kids;
    iarray level_divs;
    iarray level_branches;
    iarray comp_parent;
    iarray comp_branch;
    unsigned max_num_kids = 0;

    array upper;          // [μS] coefficient of i in the row of its parent
    array lower;          // [μS] coefficient of the parent of i in the row of i
    array invariant_d;    // [μS] invariant part of matrix diagonal
    array cv_capacitance; // [pF]

    branched_solver() = default;

    branched_solver(const morph_index& index, const cable_conductances& D);

    // Build the matrix diagonal and right hand side for a backward Euler step
    // of length dt [ms] from voltage v [mV]:
    //   voltage_term  [μS] linearised membrane conductance per compartment
    //   current       [nA] current into each compartment, other than the axial
    //                      and capacitive currents
    // Throws singular_system if a diagonal entry is zero or not finite.
    void assemble(value_type dt, const array& v, const array& voltage_term, const array& current, array& d, array& rhs) const;

    // Solve in place; afterwards rhs holds the solution and d is overwritten.
    // Throws singular_system if the solution is not finite.
    void solve(array& d, array& rhs) const;

    // Assemble and solve; returns the voltage after the step.
    array step(value_type dt, const array& v, const array& voltage_term, const array& current) const;

    std::size_t num_levels() const { return level_divs.empty()? 0: level_divs.size()-1; }
    std::size_t size() const { return comp_parent.size(); }
};

} // namespace multicore
} // namespace dend
