#pragma once

#include <map>
#include <string>
#include <vector>

#include <dendrite/mechanism.hpp>

// Mechanism catalogue maintains a collection of mechanism implementations
// indexed by name.
//
// There is in addition a global default mechanism catalogue object that is
// populated with the mechanisms built into the library.

namespace dend {

class mechanism_catalogue {
public:
    mechanism_catalogue() = default;

    // Register an implementation under its own name, or under `name`.
    // Throws duplicate_mechanism if the name is taken.
    void add(mechanism_ptr proto);
    void add(const std::string& name, mechanism_ptr proto);

    bool has(const std::string& name) const;

    // Throws no_such_mechanism if there is no mechanism `name`.
    mechanism_ptr operator[](const std::string& name) const;

    // Remove mechanism from catalogue.
    void remove(const std::string& name);

    // Copy over another catalogue's mechanisms and attach a -- possibly empty -- prefix.
    void import(const mechanism_catalogue& other, const std::string& prefix);

    // Grab a collection of all mechanism names in the catalogue.
    std::vector<std::string> mechanism_names() const;

private:
    std::map<std::string, mechanism_ptr> impl_;
};

const mechanism_catalogue& global_default_catalogue();

} // namespace dend
