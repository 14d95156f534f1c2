#include <numeric>
#include <vector>

#include <dendrite/dendexcept.hpp>
#include <dendrite/math.hpp>
#include <dendrite/morphology.hpp>

#include "util/span.hpp"

namespace dend {

fvm_size_type cell_description::num_compartments() const {
    return std::accumulate(ncomp.begin(), ncomp.end(), fvm_size_type(0));
}

cell_description cell_description_from_branches(
    std::vector<fvm_index_type> parents,
    std::vector<fvm_size_type> ncomp,
    const std::vector<fvm_value_type>& pathlengths,
    const std::vector<fvm_value_type>& endpoint_radii,
    fvm_value_type start_radius,
    fvm_value_type axial_resistivity,
    fvm_value_type capacitance)
{
    using util::make_span;

    const auto nbranch = parents.size();
    if (ncomp.size()!=nbranch) {
        throw bad_geometry_size(0, "ncomp", ncomp.size(), nbranch);
    }
    if (pathlengths.size()!=nbranch) {
        throw bad_geometry_size(0, "pathlengths", pathlengths.size(), nbranch);
    }
    if (endpoint_radii.size()!=nbranch) {
        throw bad_geometry_size(0, "endpoint radii", endpoint_radii.size(), nbranch);
    }

    cell_description desc;
    desc.parents = std::move(parents);
    desc.ncomp = std::move(ncomp);

    const auto n = desc.num_compartments();
    desc.radius.reserve(n);
    desc.length.reserve(n);
    desc.axial_resistivity.assign(n, axial_resistivity);
    desc.capacitance.assign(n, capacitance);

    for (auto b: make_span(nbranch)) {
        const auto p = desc.parents[b];
        // A parent index out of range is reported by the indexer; fall back to
        // the start radius here so that the geometry can still be built.
        const bool has_parent = p>=0 && std::size_t(p)<nbranch;
        const auto r_prox = has_parent? endpoint_radii[p]: start_radius;
        const auto r_dist = endpoint_radii[b];
        const auto nc = desc.ncomp[b];
        const auto dx = nc? pathlengths[b]/nc: 0.;

        for (auto i: make_span(nc)) {
            desc.length.push_back(dx);
            desc.radius.push_back(math::lerp(r_prox, r_dist, (i+0.5)/nc));
        }
    }

    return desc;
}

} // namespace dend
