#include <cmath>
#include <vector>

#include <dendrite/assert.hpp>
#include <dendrite/dendexcept.hpp>

#include "backends/multicore/branched_solver.hpp"
#include "threading/threading.hpp"
#include "util/span.hpp"

namespace dend {
namespace multicore {

branched_solver::branched_solver(const morph_index& index, const cable_conductances& D):
    branch_comp_divs(index.branch_comp_divs),
    branch_kids(index.branch_kids),
    level_divs(index.level_divs),
    level_branches(index.level_branches),
    comp_parent(index.comp_parent),
    comp_branch(index.comp_branch),
    max_num_kids(index.max_num_kids),
    upper(index.num_compartments()),
    lower(index.num_compartments()),
    invariant_d(D.summed_coupling),
    cv_capacitance(D.capacitance)
{
    for (auto i: util::make_span(size())) {
        upper[i] = -D.coupling_fwd[i];
        lower[i] = -D.coupling_bwd[i];
    }
}

void branched_solver::assemble(value_type dt, const array& v, const array& voltage_term, const array& current, array& d, array& rhs) const {
    const auto n = size();
    dend_assert(v.size()==n && voltage_term.size()==n && current.size()==n);

    d.resize(n);
    rhs.resize(n);

    const value_type oodt = 1e-3/dt; // [1/µs]
    for (auto i: util::make_span(n)) {
        const auto gi = oodt*cv_capacitance[i];  // [μS]
        d[i] = gi + invariant_d[i] + voltage_term[i];
        rhs[i] = gi*v[i] + current[i];          // [nA]
    }

    for (auto i: util::make_span(n)) {
        if (d[i]==0 || !std::isfinite(d[i])) {
            throw singular_system(i, comp_branch[i], d[i]);
        }
    }
}

void branched_solver::solve(array& d, array& rhs) const {
    dend_assert(d.size()==size() && rhs.size()==size());

    value_type* const d_ = d.data();
    value_type* const r_ = rhs.data();

    const value_type* const u_ = upper.data();
    const value_type* const l_ = lower.data();
    const index_type* const div_ = branch_comp_divs.data();
    const index_type* const kids_ = branch_kids.data();
    const index_type* const p_ = comp_parent.data();

    const int nlevels = num_levels();

    // backward sweep: leaves to roots
    for (int l = nlevels-1; l>=0; --l) {
        const index_type lo = level_divs[l];
        const index_type hi = level_divs[l+1];
        threading::parallel_for::apply(lo, hi, [&](int j) {
            const auto b = level_branches[j];
            const auto first = div_[b];
            const auto last = div_[b+1]-1;

            // fold the reduced first row of each child branch into the last row
            for (unsigned k = 0; k<max_num_kids; ++k) {
                const auto c = kids_[b*max_num_kids+k];
                if (c<0) continue;
                const auto f = div_[c];
                const auto factor = u_[f]/d_[f];
                d_[last] -= factor*l_[f];
                r_[last] -= factor*r_[f];
            }

            for (auto i = last; i>first; --i) {
                const auto factor = u_[i]/d_[i];
                d_[i-1] -= factor*l_[i];
                r_[i-1] -= factor*r_[i];
            }
        });
    }

    // forward sweep: roots to leaves
    for (int l = 0; l<nlevels; ++l) {
        const index_type lo = level_divs[l];
        const index_type hi = level_divs[l+1];
        threading::parallel_for::apply(lo, hi, [&](int j) {
            const auto b = level_branches[j];
            const auto first = div_[b];
            const auto last = div_[b+1];

            const auto p = p_[first];
            if (p<0) {
                r_[first] /= d_[first];
            }
            else {
                r_[first] = (r_[first] - l_[first]*r_[p])/d_[first];
            }
            for (auto i = first+1; i<last; ++i) {
                r_[i] = (r_[i] - l_[i]*r_[i-1])/d_[i];
            }
        });
    }

    for (auto i: util::make_span(size())) {
        if (!std::isfinite(r_[i])) {
            throw singular_system(i, comp_branch[i], d_[i]);
        }
    }
}

branched_solver::array branched_solver::step(value_type dt, const array& v, const array& voltage_term, const array& current) const {
    array d, rhs;
    assemble(dt, v, voltage_term, current, d, rhs);
    solve(d, rhs);
    return rhs;
}

} // namespace multicore
} // namespace dend
