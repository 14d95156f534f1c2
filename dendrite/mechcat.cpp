#include <map>
#include <string>
#include <vector>

#include <dendrite/dendexcept.hpp>
#include <dendrite/mechcat.hpp>

#include "mechanisms/builtin_mechanisms.hpp"

namespace dend {

void mechanism_catalogue::add(mechanism_ptr proto) {
    auto name = proto->name();
    add(name, std::move(proto));
}

void mechanism_catalogue::add(const std::string& name, mechanism_ptr proto) {
    if (!proto) {
        throw dendrite_internal_error("null mechanism prototype for "+name);
    }
    if (has(name)) {
        throw duplicate_mechanism(name);
    }
    impl_.emplace(name, std::move(proto));
}

bool mechanism_catalogue::has(const std::string& name) const {
    return impl_.count(name);
}

mechanism_ptr mechanism_catalogue::operator[](const std::string& name) const {
    auto it = impl_.find(name);
    if (it==impl_.end()) {
        throw no_such_mechanism(name);
    }
    return it->second;
}

void mechanism_catalogue::remove(const std::string& name) {
    if (!impl_.erase(name)) {
        throw no_such_mechanism(name);
    }
}

void mechanism_catalogue::import(const mechanism_catalogue& other, const std::string& prefix) {
    // Check all names before adding any, so that a failed import leaves this
    // catalogue unchanged.
    for (const auto& [name, proto]: other.impl_) {
        if (has(prefix+name)) {
            throw duplicate_mechanism(prefix+name);
        }
    }
    for (const auto& [name, proto]: other.impl_) {
        impl_.emplace(prefix+name, proto);
    }
}

std::vector<std::string> mechanism_catalogue::mechanism_names() const {
    std::vector<std::string> names;
    for (const auto& kv: impl_) {
        names.push_back(kv.first);
    }
    return names;
}

namespace {
mechanism_catalogue build_default_catalogue() {
    mechanism_catalogue cat;
    cat.add(make_pas_mechanism());
    cat.add(make_hh_mechanism());
    cat.add(make_graded_syn_mechanism());
    return cat;
}
} // anonymous namespace

const mechanism_catalogue& global_default_catalogue() {
    static mechanism_catalogue cat = build_default_catalogue();
    return cat;
}

} // namespace dend
