#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include <dendrite/common_types.hpp>

namespace dend {

// Currents injected during one time step.
// Entries for the same compartment accumulate.
struct stimulus {
    std::vector<fvm_index_type> compartments;
    std::vector<fvm_value_type> current;       // [nA]

    void add(fvm_index_type compartment, fvm_value_type i) {
        compartments.push_back(compartment);
        current.push_back(i);
    }

    std::size_t size() const { return compartments.size(); }
    bool empty() const { return compartments.empty(); }
};

// Time series of injected currents, one sample per time step.
class stimulus_schedule {
public:
    stimulus_schedule() = default;

    // Add a current trace [nA] for a compartment. Traces for the same
    // compartment accumulate.
    void add(fvm_index_type compartment, std::vector<fvm_value_type> trace);

    // Constant current for the first n steps.
    void add_constant(fvm_index_type compartment, fvm_value_type i, std::size_t n);

    // The stimulus of step `step`; traces contribute nothing past their end.
    stimulus at(std::size_t step) const;

    // Number of steps up to the end of the longest trace.
    std::size_t num_steps() const;

    const std::vector<std::pair<fvm_index_type, std::vector<fvm_value_type>>>& traces() const {
        return traces_;
    }

private:
    std::vector<std::pair<fvm_index_type, std::vector<fvm_value_type>>> traces_;
};

} // namespace dend
