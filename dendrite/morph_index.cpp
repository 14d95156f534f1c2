#include <algorithm>
#include <cstddef>
#include <limits>
#include <vector>

#include <dendrite/common_types.hpp>
#include <dendrite/dendexcept.hpp>
#include <dendrite/morph_index.hpp>

#include "tree.hpp"
#include "util/partition.hpp"
#include "util/span.hpp"
#include "util/strprintf.hpp"

namespace dend {

morph_index::morph_index(const std::vector<cell_description>& cells, size_type max_kids):
    max_num_kids(max_kids)
{
    using util::make_span;

    // Every kid slot must be addressable by an index_type.
    std::size_t total_branches = 0;
    for (const auto& cell: cells) {
        total_branches += cell.num_branches();
    }
    if (total_branches && std::size_t(max_num_kids) > std::size_t(std::numeric_limits<index_type>::max())/total_branches) {
        throw bad_max_num_kids(max_num_kids, total_branches);
    }

    // Validate and analyse each cell's branch tree independently.
    std::vector<tree> trees;
    trees.reserve(cells.size());
    for (auto c: make_span(cells.size())) {
        const auto& cell = cells[c];
        if (cell.ncomp.size()!=cell.parents.size()) {
            throw bad_geometry_size(c, "ncomp", cell.ncomp.size(), cell.parents.size());
        }
        for (auto b: make_span(cell.ncomp.size())) {
            if (cell.ncomp[b]==0) {
                throw empty_branch(c, b);
            }
        }
        trees.emplace_back(cell.parents, max_num_kids, c);
    }

    std::vector<size_type> nbranch, ncomp;
    for (const auto& cell: cells) {
        nbranch.push_back(cell.num_branches());
        ncomp.push_back(cell.num_compartments());
    }
    util::make_partition(cell_branch_divs, nbranch);
    util::make_partition(cell_comp_divs, ncomp);

    const auto n_branch = cell_branch_divs.back();
    const auto n_comp = cell_comp_divs.back();

    std::vector<size_type> branch_ncomp;
    branch_ncomp.reserve(n_branch);
    for (const auto& cell: cells) {
        branch_ncomp.insert(branch_ncomp.end(), cell.ncomp.begin(), cell.ncomp.end());
    }
    util::make_partition(branch_comp_divs, branch_ncomp);

    branch_cell.resize(n_branch);
    branch_parent.resize(n_branch);
    branch_depth.resize(n_branch);
    branch_sibling.resize(n_branch);
    branch_kids.assign(std::size_t(n_branch)*max_num_kids, fvm_npos);

    size_type num_levels = 0;
    for (auto c: make_span(cells.size())) {
        const auto& t = trees[c];
        const auto offset = cell_branch_divs[c];
        for (auto b: make_span(t.num_branches())) {
            const auto g = offset + b;
            const auto p = t.parent(b);
            branch_cell[g] = c;
            branch_parent[g] = p==tree::no_parent? fvm_npos: offset+p;
            branch_depth[g] = t.depth(b);
            branch_sibling[g] = t.sibling_index(b);
            for (auto k: t.children(b)) {
                branch_kids[std::size_t(g)*max_num_kids + t.sibling_index(k)] = offset + k;
            }
        }
        num_levels = std::max(num_levels, t.num_levels());
    }

    // Merge the per-cell levels: level l holds level l of cell 0, then of cell 1, ...
    std::vector<size_type> level_count(num_levels, 0);
    for (const auto& t: trees) {
        for (auto l: make_span(t.num_levels())) {
            level_count[l] += t.level(l).size();
        }
    }
    util::make_partition(level_divs, level_count);

    level_branches.resize(n_branch);
    std::vector<index_type> pos(level_divs.begin(), level_divs.end()-1);
    for (auto c: make_span(cells.size())) {
        const auto& t = trees[c];
        for (auto l: make_span(t.num_levels())) {
            for (auto b: t.level(l)) {
                level_branches[pos[l]++] = cell_branch_divs[c] + b;
            }
        }
    }

    // The first compartment of a branch is attached to the last compartment
    // of its parent branch; the others to their proximal neighbour.
    comp_parent.resize(n_comp);
    comp_branch.resize(n_comp);
    for (auto b: make_span(n_branch)) {
        const auto [first, last] = branch_compartments(b);
        const auto p = branch_parent[b];
        comp_parent[first] = p==fvm_npos? fvm_npos: branch_comp_divs[p+1]-1;
        comp_branch[first] = b;
        for (auto i: make_span(first+1, last)) {
            comp_parent[i] = i-1;
            comp_branch[i] = b;
        }
    }
}

morph_index::index_type morph_index::global_branch(size_type cell, size_type local_branch) const {
    if (cell>=num_cells() || local_branch>=size_type(cell_branch_divs[cell+1]-cell_branch_divs[cell])) {
        throw configuration_error(util::pprintf("no branch {} on cell {}", local_branch, cell));
    }
    return cell_branch_divs[cell] + local_branch;
}

morph_index::index_type morph_index::compartment(size_type cell, size_type branch, size_type local) const {
    const auto b = global_branch(cell, branch);
    const auto [first, last] = branch_compartments(b);
    if (local>=size_type(last-first)) {
        throw configuration_error(util::pprintf("no compartment {} on branch {} of cell {}", local, branch, cell));
    }
    return first + local;
}

} // namespace dend
