#include <map>
#include <set>
#include <string>
#include <vector>

#include <dendrite/assert.hpp>
#include <dendrite/dendexcept.hpp>
#include <dendrite/mechanism.hpp>

#include "mechanism_layout.hpp"
#include "util/span.hpp"
#include "util/strprintf.hpp"

namespace dend {

using util::count_along;
using util::make_span;
using util::pprintf;

using value_type = fvm_value_type;
using index_type = fvm_index_type;

namespace {

// Where the parameters of one density mechanism instance come from.
struct instance_source {
    const mechanism_desc* desc;
    std::size_t pos;
};

struct density_placement {
    std::string name;
    std::map<index_type, instance_source> instances;
};

void verify_kind(const mechanism& mech, mechanism_kind kind, const std::string& placement) {
    if (mech.kind()!=kind) {
        throw invalid_mechanism_kind(mech.name(), placement);
    }
}

void verify_parameters(const mechanism& mech, const mechanism_desc& desc, std::size_t n_instances) {
    const auto& fields = mech.parameters();

    for (const auto& [key, value]: desc.params) {
        auto idx = find_field(fields, key);
        if (idx<0) {
            throw no_such_parameter(desc.name, key);
        }
        if (!fields[idx].valid(value)) {
            throw invalid_parameter_value(desc.name, key, value);
        }
    }

    for (const auto& [key, values]: desc.instance_params) {
        auto idx = find_field(fields, key);
        if (idx<0) {
            throw no_such_parameter(desc.name, key);
        }
        if (values.size()!=n_instances) {
            throw invalid_parameter_value(desc.name, key,
                pprintf("{} values given for {} instances", values.size(), n_instances));
        }
        for (auto value: values) {
            if (!fields[idx].valid(value)) {
                throw invalid_parameter_value(desc.name, key, value);
            }
        }
    }
}

value_type parameter_value(const mechanism_desc& desc, const mechanism_field_spec& field, std::size_t pos) {
    if (auto it = desc.instance_params.find(field.name); it!=desc.instance_params.end()) {
        return it->second[pos];
    }
    if (auto it = desc.params.find(field.name); it!=desc.params.end()) {
        return it->second;
    }
    return field.default_value;
}

void verify_compartment(const std::string& context, index_type c, fvm_size_type ncomp) {
    if (c<0 || c>=(index_type)ncomp) {
        throw bad_compartment_index(context, c, ncomp);
    }
}

void set_state_keys(mechanism_layout& m) {
    for (const auto& s: m.mech->states()) {
        m.state_keys.push_back(state_key(m.alias, s.name));
    }
}

// Instance voltages, parameters and states gathered for one batched call.
class instance_pack {
public:
    instance_pack(const mechanism_layout& m, value_type dt, const std::vector<value_type>& v, const state_map* state):
        v_(m.width()), v_pre_(m.width())
    {
        const auto n = m.width();
        dend_assert(m.peer_cv.size()==n && m.state_index.size()==n);

        for (auto i: make_span(n)) {
            v_[i] = v[m.cv[i]];
            v_pre_[i] = v[m.peer_cv[i]];
        }

        for (const auto& p: m.param_values) {
            param_ptr_.push_back(p.data());
        }

        if (state) {
            state_.resize(m.state_keys.size(), std::vector<value_type>(n));
            for (auto k: count_along(m.state_keys)) {
                const auto& src = state->at(m.state_keys[k]);
                for (auto i: make_span(n)) {
                    state_[k][i] = src[m.state_index[i]];
                }
                state_ptr_.push_back(state_[k].data());
            }
        }

        pp_.width = n;
        pp_.dt = dt;
        pp_.v = v_.data();
        pp_.v_pre = v_pre_.data();
        pp_.parameters = param_ptr_.data();
        pp_.state = state_ptr_.data();
    }

    instance_pack(const instance_pack&) = delete;
    instance_pack& operator=(const instance_pack&) = delete;

    const mechanism_ppack& ppack() const { return pp_; }

private:
    std::vector<value_type> v_;
    std::vector<value_type> v_pre_;
    std::vector<std::vector<value_type>> state_;
    std::vector<const value_type*> param_ptr_;
    std::vector<const value_type*> state_ptr_;
    mechanism_ppack pp_;
};

// Output buffers for one state vector per mechanism state.
struct state_buffers {
    std::vector<std::vector<value_type>> data;
    std::vector<value_type*> ptr;

    state_buffers(std::size_t nstate, std::size_t width):
        data(nstate, std::vector<value_type>(width))
    {
        for (auto& d: data) ptr.push_back(d.data());
    }

    void scatter(const mechanism_layout& m, state_map& state) const {
        for (auto k: count_along(m.state_keys)) {
            auto& dst = state.at(m.state_keys[k]);
            for (auto i: make_span(m.width())) {
                dst[m.state_index[i]] = data[k][i];
            }
        }
    }
};

} // anonymous namespace

std::vector<mechanism_layout> layout_mechanisms(
    const network_description& desc,
    const cable_conductances& D,
    const mechanism_catalogue& catalogue)
{
    const fvm_size_type ncomp = D.size();

    // Density insertions, merged by alias; later insertions take precedence.
    std::map<std::string, density_placement> density;
    std::vector<std::string> density_order;

    for (const auto& ins: desc.channels) {
        auto mech = catalogue[ins.mech.name];
        verify_kind(*mech, mechanism_kind::density, "channel");
        verify_parameters(*mech, ins.mech, ins.compartments.size());

        const auto& alias = ins.mech.prefix();
        auto [it, inserted] = density.try_emplace(alias);
        auto& placement = it->second;
        if (inserted) {
            placement.name = ins.mech.name;
            density_order.push_back(alias);
        }
        else if (placement.name!=ins.mech.name) {
            throw duplicate_mechanism(alias);
        }

        for (auto i: count_along(ins.compartments)) {
            auto c = ins.compartments[i];
            verify_compartment(pprintf("channel '{}'", alias), c, ncomp);
            placement.instances.insert_or_assign(c, instance_source{&ins.mech, i});
        }
    }

    std::vector<mechanism_layout> layouts;
    std::set<std::string> aliases;

    for (const auto& alias: density_order) {
        const auto& placement = density.at(alias);

        mechanism_layout m;
        m.mech = catalogue[placement.name];
        m.alias = alias;
        m.state_size = ncomp;

        const auto& fields = m.mech->parameters();
        m.param_values.resize(fields.size());
        for (const auto& [c, src]: placement.instances) {
            m.cv.push_back(c);
            m.peer_cv.push_back(c);
            m.state_index.push_back(c);
            m.weight.push_back(1e-3*D.area[c]);
            for (auto k: count_along(fields)) {
                m.param_values[k].push_back(parameter_value(*src.desc, fields[k], src.pos));
            }
        }
        set_state_keys(m);

        aliases.insert(alias);
        layouts.push_back(std::move(m));
    }

    for (const auto& group: desc.synapses) {
        auto mech = catalogue[group.mech.name];
        verify_kind(*mech, mechanism_kind::point, "synapse");
        verify_parameters(*mech, group.mech, group.connections.size());

        const auto& alias = group.mech.prefix();
        if (!aliases.insert(alias).second) {
            throw duplicate_mechanism(alias);
        }

        mechanism_layout m;
        m.mech = mech;
        m.alias = alias;
        m.state_size = group.connections.size();

        const auto& fields = m.mech->parameters();
        m.param_values.resize(fields.size());
        for (auto i: count_along(group.connections)) {
            const auto& conn = group.connections[i];
            verify_compartment(pprintf("synapse '{}' presynaptic", alias), conn.pre, ncomp);
            verify_compartment(pprintf("synapse '{}' postsynaptic", alias), conn.post, ncomp);

            m.cv.push_back(conn.post);
            m.peer_cv.push_back(conn.pre);
            m.state_index.push_back(i);
            m.weight.push_back(1);
            for (auto k: count_along(fields)) {
                m.param_values[k].push_back(parameter_value(group.mech, fields[k], i));
            }
        }
        set_state_keys(m);

        layouts.push_back(std::move(m));
    }

    // State keys are "<alias>_<state>", so distinct aliases can still collide.
    std::set<std::string> keys = {voltage_key};
    for (const auto& m: layouts) {
        for (const auto& key: m.state_keys) {
            if (!keys.insert(key).second) {
                throw duplicate_mechanism(m.alias);
            }
        }
    }

    return layouts;
}

void init_mechanism(const mechanism_layout& m, const std::vector<value_type>& v, state_map& state) {
    for (auto k: count_along(m.state_keys)) {
        state[m.state_keys[k]].assign(m.state_size, m.mech->states()[k].default_value);
    }
    if (!m.width() || m.state_keys.empty()) return;

    instance_pack pack(m, 0, v, nullptr);
    state_buffers out(m.state_keys.size(), m.width());
    m.mech->init_state(pack.ppack(), out.ptr.data());
    out.scatter(m, state);
}

void advance_mechanism(const mechanism_layout& m, value_type dt, const std::vector<value_type>& v, const state_map& in, state_map& out) {
    if (!m.width() || m.state_keys.empty()) return;

    instance_pack pack(m, dt, v, &in);
    state_buffers next(m.state_keys.size(), m.width());
    m.mech->advance_state(pack.ppack(), next.ptr.data());
    next.scatter(m, out);
}

void linearize_mechanism(
    const mechanism_layout& m,
    const std::vector<value_type>& v,
    const state_map& state,
    std::vector<value_type>& voltage_term,
    std::vector<value_type>& constant_term)
{
    const auto n = m.width();
    voltage_term.assign(n, 0);
    constant_term.assign(n, 0);
    if (!n) return;

    instance_pack pack(m, 0, v, &state);
    m.mech->linearize_current(pack.ppack(), voltage_term.data(), constant_term.data());

    for (auto i: make_span(n)) {
        voltage_term[i] *= m.weight[i];
        constant_term[i] *= m.weight[i];
    }
}

} // namespace dend
