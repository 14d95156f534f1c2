#include <algorithm>
#include <vector>

#include <dendrite/stimulus.hpp>

namespace dend {

void stimulus_schedule::add(fvm_index_type compartment, std::vector<fvm_value_type> trace) {
    traces_.emplace_back(compartment, std::move(trace));
}

void stimulus_schedule::add_constant(fvm_index_type compartment, fvm_value_type i, std::size_t n) {
    add(compartment, std::vector<fvm_value_type>(n, i));
}

stimulus stimulus_schedule::at(std::size_t step) const {
    stimulus s;
    for (const auto& [cv, trace]: traces_) {
        if (step<trace.size()) {
            s.add(cv, trace[step]);
        }
    }
    return s;
}

std::size_t stimulus_schedule::num_steps() const {
    std::size_t n = 0;
    for (const auto& t: traces_) {
        n = std::max(n, t.second.size());
    }
    return n;
}

} // namespace dend
