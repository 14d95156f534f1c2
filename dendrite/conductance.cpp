#include <cmath>
#include <string>
#include <vector>

#include <dendrite/conductance.hpp>
#include <dendrite/dendexcept.hpp>
#include <dendrite/math.hpp>

#include "util/span.hpp"

namespace dend {

namespace {
void append_field(
    std::vector<fvm_value_type>& out,
    const std::vector<fvm_value_type>& values,
    fvm_value_type dflt,
    fvm_size_type n,
    fvm_size_type cell,
    const char* field)
{
    if (values.empty()) {
        out.insert(out.end(), n, dflt);
    }
    else if (values.size()==n) {
        out.insert(out.end(), values.begin(), values.end());
    }
    else {
        throw bad_geometry_size(cell, field, values.size(), n);
    }
}

bool is_degenerate(fvm_value_type r, fvm_value_type l, fvm_value_type ra) {
    return !(r>0 && l>0 && ra>0);
}
} // anonymous namespace

compartment_geometry flatten_geometry(const std::vector<cell_description>& cells) {
    using defaults = cable_parameter_defaults;

    compartment_geometry geom;
    for (auto c: util::make_span(cells.size())) {
        const auto& cell = cells[c];
        const auto n = cell.num_compartments();
        append_field(geom.radius, cell.radius, defaults::radius, n, c, "radius");
        append_field(geom.length, cell.length, defaults::length, n, c, "length");
        append_field(geom.axial_resistivity, cell.axial_resistivity, defaults::axial_resistivity, n, c, "axial resistivity");
        append_field(geom.capacitance, cell.capacitance, defaults::capacitance, n, c, "capacitance");
    }
    return geom;
}

fvm_value_type half_compartment_resistance(fvm_value_type radius, fvm_value_type length, fvm_value_type resistivity) {
    // [Ω·cm]·[µm]/[µm²] = 1e4 Ω; 100/r then has units of µS.
    return resistivity*0.5*length/math::area_circle(radius);
}

cable_conductances build_conductances(const morph_index& index, const compartment_geometry& geom) {
    const auto n = index.num_compartments();

    cable_conductances D;
    D.coupling_fwd.assign(n, 0);
    D.coupling_bwd.assign(n, 0);
    D.summed_coupling.assign(n, 0);
    D.area.assign(n, 0);
    D.capacitance.assign(n, 0);

    std::vector<char> degenerate(n, 0);
    for (auto i: util::make_span(n)) {
        const auto r = geom.radius[i];
        const auto l = geom.length[i];
        if (is_degenerate(r, l, geom.axial_resistivity[i])) {
            degenerate[i] = 1;
            D.degenerate_compartments.push_back(i);
            continue;
        }
        D.area[i] = math::area_cylinder(l, r);
        D.capacitance[i] = geom.capacitance[i]*D.area[i]; // [F/m²]·[µm²] = [pF]
    }

    for (auto i: util::make_span(n)) {
        const auto p = index.comp_parent[i];
        if (p==fvm_npos || degenerate[i] || degenerate[p]) {
            continue;
        }

        // Resistance between the mid points of the two compartments:
        // the half compartments on either side of the face in series.
        const auto resistance =
            half_compartment_resistance(geom.radius[p], geom.length[p], geom.axial_resistivity[p]) +
            half_compartment_resistance(geom.radius[i], geom.length[i], geom.axial_resistivity[i]);
        const auto g = 100/resistance; // 100 scales to µS.

        D.coupling_fwd[i] = g;
        D.coupling_bwd[i] = g;
        D.summed_coupling[i] += g;
        D.summed_coupling[p] += g;
    }

    return D;
}

} // namespace dend
