#include <cmath>
#include <vector>

#include <dendrite/math.hpp>
#include <dendrite/mechanism.hpp>

#include "mechanisms/builtin_mechanisms.hpp"

namespace dend {

namespace {

struct hh_rates {
    fvm_value_type minf, mtau;
    fvm_value_type hinf, htau;
    fvm_value_type ninf, ntau;
};

hh_rates rates(fvm_value_type v, fvm_value_type celsius) {
    using math::exprelr;

    hh_rates r;
    const fvm_value_type q10 = std::pow(3., (celsius - 6.3)/10.);

    fvm_value_type alpha, beta, sum;

    alpha = 0.1*exprelr(-(v + 40.), 10.);
    beta  = 4.*std::exp(-(v + 65.)/18.);
    sum = alpha + beta;
    r.mtau = 1./(q10*sum);
    r.minf = alpha/sum;

    alpha = 0.07*std::exp(-(v + 65.)/20.);
    beta  = 1./(std::exp(-(v + 35.)/10.) + 1.);
    sum = alpha + beta;
    r.htau = 1./(q10*sum);
    r.hinf = alpha/sum;

    alpha = 0.01*exprelr(-(v + 55.), 10.);
    beta  = 0.125*std::exp(-(v + 65.)/80.);
    sum = alpha + beta;
    r.ntau = 1./(q10*sum);
    r.ninf = alpha/sum;

    return r;
}

class mechanism_hh: public mechanism {
public:
    enum param: int {gnabar, gkbar, gl, ena, ek, el, celsius};
    enum state: int {m, h, n};

    std::string name() const override { return "hh"; }
    mechanism_kind kind() const override { return mechanism_kind::density; }

    const std::vector<mechanism_field_spec>& parameters() const override {
        static const std::vector<mechanism_field_spec> fields = {
            {"gnabar", "S/cm2", 0.12, 0.},
            {"gkbar", "S/cm2", 0.036, 0.},
            {"gl", "S/cm2", 0.0003, 0.},
            {"ena", "mV", 50.},
            {"ek", "mV", -77.},
            {"el", "mV", -54.3},
            {"celsius", "degC", 6.3},
        };
        return fields;
    }

    const std::vector<mechanism_field_spec>& states() const override {
        static const std::vector<mechanism_field_spec> fields = {
            {"m", "", 0.05, 0., 1.},
            {"h", "", 0.6, 0., 1.},
            {"n", "", 0.32, 0., 1.},
        };
        return fields;
    }

    void init_state(const mechanism_ppack& pp, fvm_value_type* const* out) const override {
        const fvm_value_type* T = pp.parameters[celsius];
        for (fvm_size_type i = 0; i<pp.width; ++i) {
            auto r = rates(pp.v[i], T[i]);
            out[m][i] = r.minf;
            out[h][i] = r.hinf;
            out[n][i] = r.ninf;
        }
    }

    // Exponential Euler: each gate relaxes towards its steady state at the
    // present voltage with the present time constant.
    void advance_state(const mechanism_ppack& pp, fvm_value_type* const* out) const override {
        const fvm_value_type* T = pp.parameters[celsius];
        const fvm_value_type dt = pp.dt;
        for (fvm_size_type i = 0; i<pp.width; ++i) {
            auto r = rates(pp.v[i], T[i]);
            out[m][i] = r.minf + (pp.state[m][i] - r.minf)*std::exp(-dt/r.mtau);
            out[h][i] = r.hinf + (pp.state[h][i] - r.hinf)*std::exp(-dt/r.htau);
            out[n][i] = r.ninf + (pp.state[n][i] - r.ninf)*std::exp(-dt/r.ntau);
        }
    }

    void linearize_current(const mechanism_ppack& pp, fvm_value_type* voltage_term, fvm_value_type* constant_term) const override {
        const auto* P = pp.parameters;
        const auto* S = pp.state;
        for (fvm_size_type i = 0; i<pp.width; ++i) {
            const auto gna = P[gnabar][i]*math::cube(S[m][i])*S[h][i];
            const auto gk = P[gkbar][i]*math::square(math::square(S[n][i]));
            const auto g = gna + gk + P[gl][i];

            // [S/cm²]·10 = [kS/m²]; [kS/m²]·[mV] = [A/m²]
            voltage_term[i] = 10*g;
            constant_term[i] = -10*(gna*P[ena][i] + gk*P[ek][i] + P[gl][i]*P[el][i]);
        }
    }
};

} // anonymous namespace

mechanism_ptr make_hh_mechanism() {
    return std::make_shared<mechanism_hh>();
}

} // namespace dend
