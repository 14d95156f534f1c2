#pragma once

#include <cstddef>
#include <span>
#include <utility>
#include <vector>

#include <dendrite/common_types.hpp>
#include <dendrite/morphology.hpp>

namespace dend {

// Flattened indexing of the compartments and branches of a set of cells.
//
// Compartments are laid out cell by cell, in cell order; within a cell branch
// by branch, in branch order; within a branch from proximal to distal. Branch
// indices are likewise global: the branches of cell c occupy the half-open
// interval [cell_branch_divs[c], cell_branch_divs[c+1]).
//
// Branches are further grouped by their distance from the root of their cell.
// Level 0 holds the root branches of all cells, level k+1 the branches whose
// parent is on level k. Every branch has max_num_kids child slots; unused slots
// hold fvm_npos. The structure is immutable once built.
struct morph_index {
    using size_type = fvm_size_type;
    using index_type = fvm_index_type;
    using iarray = std::vector<index_type>;

    static constexpr size_type default_max_num_kids = 4;

    size_type max_num_kids = default_max_num_kids;

    iarray cell_branch_divs;    // Partitions branch indices by cell.
    iarray cell_comp_divs;      // Partitions compartment indices by cell.
    iarray branch_comp_divs;    // Partitions compartment indices by branch.

    iarray branch_cell;         // Cell of each branch.
    iarray branch_parent;       // Global parent branch of each branch; -1 for roots.
    iarray branch_depth;        // Level of each branch.
    iarray branch_sibling;      // Position of each branch among its parent's children.
    iarray branch_kids;         // max_num_kids child slots per branch.

    iarray level_divs;          // Partitions level_branches by level.
    iarray level_branches;      // Branches ordered by level, then by index.

    iarray comp_parent;         // Parent compartment of each compartment; -1 for cell roots.
    iarray comp_branch;         // Branch of each compartment.

    morph_index() = default;

    // Throws a topology_error if any cell's parent index does not describe a
    // tree, or a branch has more than max_num_kids children or no compartments.
    explicit morph_index(const std::vector<cell_description>& cells, size_type max_num_kids = default_max_num_kids);

    size_type num_cells() const { return cell_branch_divs.empty()? 0: cell_branch_divs.size()-1; }
    size_type num_branches() const { return branch_parent.size(); }
    size_type num_compartments() const { return comp_parent.size(); }
    size_type num_levels() const { return level_divs.empty()? 0: level_divs.size()-1; }

    // Global branch index of branch `local_branch` of cell `cell`.
    index_type global_branch(size_type cell, size_type local_branch) const;

    // Global compartment index of compartment `local` on branch `branch` of cell `cell`.
    index_type compartment(size_type cell, size_type branch, size_type local) const;

    // Half-open interval of the compartments of global branch b.
    std::pair<index_type, index_type> branch_compartments(size_type b) const {
        return {branch_comp_divs[b], branch_comp_divs[b+1]};
    }

    std::pair<index_type, index_type> cell_compartments(size_type c) const {
        return {cell_comp_divs[c], cell_comp_divs[c+1]};
    }

    // Global branches at level l.
    std::span<const index_type> level(size_type l) const {
        return {level_branches.data()+level_divs[l], size_type(level_divs[l+1]-level_divs[l])};
    }

    // Child slots of global branch b; unused slots hold fvm_npos.
    std::span<const index_type> kids(size_type b) const {
        return {branch_kids.data()+std::size_t(b)*max_num_kids, max_num_kids};
    }
};

} // namespace dend
