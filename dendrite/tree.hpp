#pragma once

#include <span>
#include <type_traits>
#include <vector>

#include <dendrite/common_types.hpp>

namespace dend {

// Branch tree of a single cell.
//
// Built from a parent index over branches (-1 marks the root). Construction
// validates that the index describes a tree: every parent in range, exactly one
// root, no cycles, and at most `max_num_kids` children per branch. The root
// need not be branch 0, and a child may have a smaller index than its parent.
class tree {
public:
    using int_type   = fvm_index_type;
    using size_type  = fvm_size_type;

    using iarray = std::vector<int_type>;
    static constexpr int_type no_parent = fvm_npos;

    tree() = default;

    /// Create the tree from a parent index that lists the parent branch
    /// of each branch in a cell. `cell` is used for error reporting only.
    tree(const iarray& parent_index, size_type max_num_kids, size_type cell = 0);

    size_type num_branches() const {
        return static_cast<size_type>(parents_.size());
    }

    int_type root() const { return root_; }

    /// return the list of parents
    const iarray& parents() const { return parents_; }

    /// return the parent of branch b
    int_type parent(size_type b) const { return parents_[b]; }

    size_type num_children(size_type b) const {
        return child_index_[b+1] - child_index_[b];
    }

    /// return the list of all children of branch b, in increasing index order
    std::span<const int_type> children(size_type b) const {
        return {children_.data() + child_index_[b], num_children(b)};
    }

    /// position of branch b among the children of its parent (0 for the root)
    int_type sibling_index(size_type b) const { return sibling_index_[b]; }

    /// distance of branch b from the root; the root has depth 0
    int_type depth(size_type b) const { return depth_[b]; }
    const iarray& depths() const { return depth_; }

    size_type num_levels() const {
        return level_divs_.empty()? 0: level_divs_.size()-1;
    }

    /// branches with depth l, in increasing index order
    std::span<const int_type> level(size_type l) const {
        return {level_order_.data() + level_divs_[l], size_type(level_divs_[l+1] - level_divs_[l])};
    }

private:
    int_type root_ = no_parent;
    iarray parents_;
    iarray children_;
    iarray child_index_;
    iarray sibling_index_;
    iarray depth_;
    iarray level_divs_;
    iarray level_order_;
};

// returns a vector containing the number of children for each node.
template<typename C>
std::vector<typename C::value_type> child_count(const C& parent_index)
{
    using value_type = typename C::value_type;
    static_assert(
        std::is_integral<value_type>::value,
        "integral type required"
    );

    std::vector<value_type> count(parent_index.size(), 0);
    for (auto i = 0u; i < parent_index.size(); ++i) {
        auto p = parent_index[i];
        // -1 means no parent
        if (p != value_type(i) && p != value_type(-1)) {
            ++count[p];
        }
    }
    return count;
}

} // namespace dend
