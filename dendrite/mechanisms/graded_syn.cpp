#include <cmath>
#include <vector>

#include <dendrite/mechanism.hpp>

#include "mechanisms/builtin_mechanisms.hpp"

namespace dend {

namespace {

// Graded (non-spiking) synapse.
//
// The open fraction s relaxes towards a sigmoid of the presynaptic voltage,
//     s_inf = 1/(1 + exp((vth - v_pre)/delta)),
// with time constant (1 - s_inf)/k_minus. The postsynaptic current is
//     I = gsyn·s·(v - esyn).
class mechanism_graded_syn: public mechanism {
public:
    enum param: int {gsyn, esyn, vth, delta, k_minus};
    enum state: int {s};

    std::string name() const override { return "graded_syn"; }
    mechanism_kind kind() const override { return mechanism_kind::point; }

    const std::vector<mechanism_field_spec>& parameters() const override {
        static const std::vector<mechanism_field_spec> fields = {
            {"gsyn", "uS", 0.001, 0.},
            {"esyn", "mV", 0.},
            {"vth", "mV", -35.},
            {"delta", "mV", 10., 1e-9},
            {"k_minus", "1/ms", 0.025, 1e-9},
        };
        return fields;
    }

    const std::vector<mechanism_field_spec>& states() const override {
        static const std::vector<mechanism_field_spec> fields = {
            {"s", "", 0., 0., 1.},
        };
        return fields;
    }

    static fvm_value_type s_inf(fvm_value_type v_pre, fvm_value_type th, fvm_value_type d) {
        return 1./(1. + std::exp((th - v_pre)/d));
    }

    void init_state(const mechanism_ppack& pp, fvm_value_type* const* out) const override {
        const auto* P = pp.parameters;
        for (fvm_size_type i = 0; i<pp.width; ++i) {
            out[s][i] = s_inf(pp.v_pre[i], P[vth][i], P[delta][i]);
        }
    }

    void advance_state(const mechanism_ppack& pp, fvm_value_type* const* out) const override {
        const auto* P = pp.parameters;
        for (fvm_size_type i = 0; i<pp.width; ++i) {
            const auto sinf = s_inf(pp.v_pre[i], P[vth][i], P[delta][i]);
            const auto tau = (1. - sinf)/P[k_minus][i];
            out[s][i] = sinf + (pp.state[s][i] - sinf)*std::exp(-pp.dt/tau);
        }
    }

    void linearize_current(const mechanism_ppack& pp, fvm_value_type* voltage_term, fvm_value_type* constant_term) const override {
        const auto* P = pp.parameters;
        for (fvm_size_type i = 0; i<pp.width; ++i) {
            const auto g = P[gsyn][i]*pp.state[s][i];  // [µS]
            voltage_term[i] = g;
            constant_term[i] = -g*P[esyn][i];         // [nA]
        }
    }
};

} // anonymous namespace

mechanism_ptr make_graded_syn_mechanism() {
    return std::make_shared<mechanism_graded_syn>();
}

} // namespace dend
