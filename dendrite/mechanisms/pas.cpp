#include <vector>

#include <dendrite/mechanism.hpp>

#include "mechanisms/builtin_mechanisms.hpp"

namespace dend {

namespace {

// I = g·(v - e)
class mechanism_pas: public mechanism {
public:
    std::string name() const override { return "pas"; }
    mechanism_kind kind() const override { return mechanism_kind::density; }

    const std::vector<mechanism_field_spec>& parameters() const override {
        static const std::vector<mechanism_field_spec> fields = {
            {"g", "S/cm2", 0.001, 0.},
            {"e", "mV", -70.},
        };
        return fields;
    }

    const std::vector<mechanism_field_spec>& states() const override {
        static const std::vector<mechanism_field_spec> fields;
        return fields;
    }

    void init_state(const mechanism_ppack&, fvm_value_type* const*) const override {}
    void advance_state(const mechanism_ppack&, fvm_value_type* const*) const override {}

    void linearize_current(const mechanism_ppack& pp, fvm_value_type* voltage_term, fvm_value_type* constant_term) const override {
        const fvm_value_type* g = pp.parameters[0];
        const fvm_value_type* e = pp.parameters[1];

        // [S/cm²]·10 = [kS/m²]; [kS/m²]·[mV] = [A/m²]
        for (fvm_size_type i = 0; i<pp.width; ++i) {
            voltage_term[i] = 10*g[i];
            constant_term[i] = -10*g[i]*e[i];
        }
    }
};

} // anonymous namespace

mechanism_ptr make_pas_mechanism() {
    return std::make_shared<mechanism_pas>();
}

} // namespace dend
