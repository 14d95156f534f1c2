#include <cmath>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <dendrite/cable_model.hpp>
#include <dendrite/dendexcept.hpp>

#include "backends/multicore/branched_solver.hpp"
#include "mechanism_layout.hpp"
#include "threading/threading.hpp"
#include "util/span.hpp"
#include "util/strprintf.hpp"

namespace dend {

using util::count_along;
using util::make_span;
using util::pprintf;

using array = std::vector<fvm_value_type>;

class cable_model_state {
public:
    cable_model_state(const network_description& desc, const mechanism_catalogue& catalogue):
        index(desc.cells, desc.max_num_kids),
        D(build_conductances(index, flatten_geometry(desc.cells))),
        solver(index, D),
        mechanisms(layout_mechanisms(desc, D, catalogue))
    {
        layout[voltage_key] = index.num_compartments();
        for (const auto& m: mechanisms) {
            for (const auto& key: m.state_keys) {
                layout[key] = m.state_size;
            }
        }
    }

    morph_index index;
    cable_conductances D;
    multicore::branched_solver solver;
    std::vector<mechanism_layout> mechanisms;
    std::map<std::string, std::size_t> layout;

    fvm_size_type num_compartments() const {
        return index.num_compartments();
    }

    void verify_time_step(fvm_value_type dt) const {
        if (!(dt>0) || !std::isfinite(dt)) {
            throw bad_time_step(dt);
        }
    }

    void verify_state(const state_map& state) const {
        for (const auto& [key, size]: layout) {
            auto it = state.find(key);
            if (it==state.end()) {
                throw missing_state(key);
            }
            if (it->second.size()!=size) {
                throw bad_state_shape(key, it->second.size(), size);
            }
        }
        for (const auto& entry: state) {
            if (!layout.count(entry.first)) {
                throw unexpected_state(entry.first);
            }
        }

        const auto& v = state.at(voltage_key);
        for (auto i: count_along(v)) {
            if (!std::isfinite(v[i])) {
                throw non_finite_state(voltage_key, i);
            }
        }
    }

    void verify_stimulus(const stimulus& stim) const {
        if (stim.compartments.size()!=stim.current.size()) {
            throw configuration_error(
                pprintf("stimulus has {} compartments and {} currents", stim.compartments.size(), stim.current.size()));
        }
        const auto n = num_compartments();
        for (auto c: stim.compartments) {
            if (c<0 || c>=(fvm_index_type)n) {
                throw bad_compartment_index("stimulus", c, n);
            }
        }
    }

    state_map init(const array& v) const {
        state_map state;
        state[voltage_key] = v;
        for (const auto& m: mechanisms) {
            init_mechanism(m, v, state);
        }
        return state;
    }

    state_map advance(const state_map& state, fvm_value_type dt) const {
        state_map next = state;
        const auto& v = state.at(voltage_key);

        threading::parallel_for::apply(0, mechanisms.size(),
            [&](int i) { advance_mechanism(mechanisms[i], dt, v, state, next); });

        for (const auto& m: mechanisms) {
            for (const auto& key: m.state_keys) {
                const auto& s = next.at(key);
                for (auto i: count_along(s)) {
                    if (!std::isfinite(s[i])) {
                        throw non_finite_state(key, i);
                    }
                }
            }
        }
        return next;
    }

    // Mechanism states are taken from `state`, voltages from `v`.
    linear_terms linearize(const state_map& state, const array& v) const {
        const auto nmech = mechanisms.size();
        std::vector<array> voltage_term(nmech), constant_term(nmech);

        threading::parallel_for::apply(0, nmech,
            [&](int i) { linearize_mechanism(mechanisms[i], v, state, voltage_term[i], constant_term[i]); });

        // Sum in a fixed order, independent of the thread count.
        const auto n = num_compartments();
        linear_terms terms{array(n, 0), array(n, 0)};
        for (auto k: make_span(nmech)) {
            const auto& cv = mechanisms[k].cv;
            for (auto i: count_along(cv)) {
                terms.voltage_term[cv[i]] += voltage_term[k][i];
                terms.constant_term[cv[i]] += constant_term[k][i];
            }
        }
        return terms;
    }

    state_map step(const state_map& state, fvm_value_type dt, const stimulus& stim) const {
        verify_time_step(dt);
        verify_state(state);
        verify_stimulus(stim);

        const auto& v = state.at(voltage_key);

        auto next = advance(state, dt);
        auto terms = linearize(next, v);

        array current(num_compartments());
        for (auto i: count_along(current)) {
            current[i] = -terms.constant_term[i];
        }
        for (auto j: make_span(stim.size())) {
            current[stim.compartments[j]] += stim.current[j];
        }

        next[voltage_key] = solver.step(dt, v, terms.voltage_term, current);
        return next;
    }
};

cable_model::cable_model(const network_description& desc, const mechanism_catalogue& catalogue):
    impl_(new cable_model_state(desc, catalogue))
{}

cable_model::cable_model(cable_model&&) = default;
cable_model& cable_model::operator=(cable_model&&) = default;
cable_model::~cable_model() = default;

const morph_index& cable_model::index() const {
    return impl_->index;
}

const cable_conductances& cable_model::conductances() const {
    return impl_->D;
}

fvm_size_type cable_model::num_compartments() const {
    return impl_->num_compartments();
}

std::map<std::string, std::size_t> cable_model::state_layout() const {
    return impl_->layout;
}

state_map cable_model::initial_state(fvm_value_type v_init) const {
    return initial_state(array(num_compartments(), v_init));
}

state_map cable_model::initial_state(const std::vector<fvm_value_type>& v_init) const {
    if (v_init.size()!=num_compartments()) {
        throw bad_state_shape(voltage_key, v_init.size(), num_compartments());
    }
    for (auto i: count_along(v_init)) {
        if (!std::isfinite(v_init[i])) {
            throw non_finite_state(voltage_key, i);
        }
    }
    return impl_->init(v_init);
}

state_map cable_model::advance_states(const state_map& state, fvm_value_type dt) const {
    impl_->verify_time_step(dt);
    impl_->verify_state(state);
    return impl_->advance(state, dt);
}

linear_terms cable_model::linearize(const state_map& state) const {
    impl_->verify_state(state);
    return impl_->linearize(state, state.at(voltage_key));
}

state_map cable_model::step(const state_map& state, fvm_value_type dt, const stimulus& stim) const {
    return impl_->step(state, dt, stim);
}

state_map cable_model::integrate(
    state_map state,
    fvm_value_type dt,
    const stimulus_schedule& schedule,
    std::size_t n_steps,
    const step_callback& callback) const
{
    for (std::size_t k = 0; k<n_steps; ++k) {
        state = impl_->step(state, dt, schedule.at(k));
        if (callback) {
            callback(k+1, state);
        }
    }
    return state;
}

} // namespace dend
