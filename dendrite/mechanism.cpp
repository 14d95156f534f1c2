#include <string>
#include <vector>

#include <dendrite/mechanism.hpp>

#include "util/span.hpp"

namespace dend {

fvm_index_type find_field(const std::vector<mechanism_field_spec>& fields, const std::string& name) {
    for (auto i: util::count_along(fields)) {
        if (fields[i].name==name) return i;
    }
    return -1;
}

} // namespace dend
