#pragma once

#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <dendrite/common_types.hpp>

namespace dend {

enum class mechanism_kind {
    density,   // distributed over the membrane of a compartment
    point      // attached to a compartment at a single site, e.g. a synapse
};

struct mechanism_field_spec {
    std::string name;
    std::string units;

    fvm_value_type default_value = 0;
    fvm_value_type lower_bound = std::numeric_limits<fvm_value_type>::lowest();
    fvm_value_type upper_bound = std::numeric_limits<fvm_value_type>::max();

    bool valid(fvm_value_type x) const {
        return x>=lower_bound && x<=upper_bound;
    }
};

// Index of the field called `name` in `fields`, or -1.
fvm_index_type find_field(const std::vector<mechanism_field_spec>& fields, const std::string& name);

// Arguments to the batched mechanism operations.
//
// A mechanism operates on all of its instances at once; field k of instance i
// is found at parameters[k][i] or state[k][i].
//
//   v      membrane voltage of the compartment the instance is attached to;
//   v_pre  voltage of the presynaptic compartment for point mechanisms that
//          connect two compartments. Equal to v for density mechanisms.
struct mechanism_ppack {
    fvm_size_type width = 0;
    fvm_value_type dt = 0;                                 // [ms]
    const fvm_value_type* v = nullptr;                     // [mV]
    const fvm_value_type* v_pre = nullptr;                 // [mV]
    const fvm_value_type* const* parameters = nullptr;
    const fvm_value_type* const* state = nullptr;
};

// Kinetics of an ion channel or synapse.
//
// Implementations are stateless: all state is passed in and out through the
// arguments, and the operations are deterministic functions of them.
//
// The membrane current of an instance is linearised about the present voltage,
//     I ≈ voltage_term·V + constant_term,
// with outward current positive. Density mechanisms report a conductance
// density [kS/m²] and a current density [A/m²]; point mechanisms report a
// conductance [µS] and a current [nA].
class mechanism {
public:
    virtual ~mechanism() = default;

    virtual std::string name() const = 0;
    virtual mechanism_kind kind() const = 0;

    virtual const std::vector<mechanism_field_spec>& parameters() const = 0;
    virtual const std::vector<mechanism_field_spec>& states() const = 0;

    // Initial state for instances at the voltages in pp; writes out[k][i].
    virtual void init_state(const mechanism_ppack& pp, fvm_value_type* const* out) const = 0;

    // State after a time step pp.dt from pp.state; writes out[k][i].
    virtual void advance_state(const mechanism_ppack& pp, fvm_value_type* const* out) const = 0;

    // Linearised current at pp.state and pp.v.
    virtual void linearize_current(const mechanism_ppack& pp, fvm_value_type* voltage_term, fvm_value_type* constant_term) const = 0;
};

using mechanism_ptr = std::shared_ptr<const mechanism>;

} // namespace dend
