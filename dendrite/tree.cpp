#include <algorithm>
#include <vector>

#include <dendrite/common_types.hpp>
#include <dendrite/dendexcept.hpp>

#include "tree.hpp"
#include "util/partition.hpp"
#include "util/span.hpp"

namespace dend {

tree::tree(const iarray& parent_index, size_type max_num_kids, size_type cell) {
    using util::make_span;

    const auto n = static_cast<int_type>(parent_index.size());
    if (n==0) {
        throw empty_morphology(cell);
    }

    // validate the input
    size_type num_roots = 0;
    for (auto i: make_span(n)) {
        auto p = parent_index[i];
        if (p==no_parent) {
            ++num_roots;
            root_ = i;
        }
        else if (p==i) {
            throw cyclic_topology(cell, i);
        }
        else if (p<0 || p>=n) {
            throw bad_parent_index(cell, i, p);
        }
    }
    if (num_roots!=1) {
        throw bad_root_count(cell, num_roots);
    }

    parents_ = parent_index;

    // Walk each branch towards the root until a branch of known depth is met.
    // A walk that returns to a branch on its own path has found a cycle, which
    // can never reach the root.
    enum mark: char {unvisited, on_path, done};
    std::vector<char> state(n, unvisited);
    depth_.assign(n, 0);
    state[root_] = done;

    iarray path;
    for (auto i: make_span(n)) {
        int_type b = i;
        while (state[b]==unvisited) {
            state[b] = on_path;
            path.push_back(b);
            b = parents_[b];
        }
        if (state[b]==on_path) {
            throw cyclic_topology(cell, b);
        }
        auto d = depth_[b];
        while (!path.empty()) {
            auto c = path.back();
            path.pop_back();
            depth_[c] = ++d;
            state[c] = done;
        }
    }

    // compute offsets into children_ array
    auto count = child_count(parents_);
    for (auto b: make_span(n)) {
        if (size_type(count[b])>max_num_kids) {
            throw too_many_children(cell, b, count[b], max_num_kids);
        }
    }
    util::make_partition(child_index_, count);

    children_.resize(n-1);
    sibling_index_.assign(n, 0);
    std::vector<int_type> pos(n, 0);
    for (auto b: make_span(n)) {
        auto p = parents_[b];
        if (p!=no_parent) {
            children_[child_index_[p] + pos[p]] = b;
            sibling_index_[b] = pos[p]++;
        }
    }

    // group branches by depth; stable, so that each level is in index order
    auto max_depth = *std::max_element(depth_.begin(), depth_.end());
    std::vector<int_type> level_count(max_depth+1, 0);
    for (auto d: depth_) {
        ++level_count[d];
    }
    util::make_partition(level_divs_, level_count);

    level_order_.resize(n);
    std::fill(pos.begin(), pos.end(), 0);
    for (auto b: make_span(n)) {
        auto d = depth_[b];
        level_order_[level_divs_[d] + pos[d]++] = b;
    }
}

} // namespace dend
