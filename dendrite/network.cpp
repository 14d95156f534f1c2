#include <numeric>
#include <vector>

#include <dendrite/network.hpp>

namespace dend {

fvm_size_type network_description::num_compartments() const {
    fvm_size_type n = 0;
    for (const auto& c: cells) {
        n += c.num_compartments();
    }
    return n;
}

void network_description::insert_everywhere(mechanism_desc mech) {
    std::vector<fvm_index_type> all(num_compartments());
    std::iota(all.begin(), all.end(), 0);
    channels.push_back({std::move(mech), std::move(all)});
}

} // namespace dend
