#include <charconv>
#include <map>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <dendrite/morphology.hpp>
#include <dendrite/network.hpp>
#include <dendrite/stimulus.hpp>

#include <dendio/json_helpers.hpp>
#include <dendio/jsonio.hpp>

namespace dendio {

void throw_if_not_empty(const nlohmann::json& json) {
    if (!json.empty()) {
        throw jsonio_unused_input(json.begin().key());
    }
}

template <typename T>
T find_and_remove_required(const char* name, nlohmann::json& j) {
    auto o = find_and_remove_json<T>(name, j);
    if (!o) {
        throw jsonio_missing_field(name);
    }
    return std::move(*o);
}

} // namespace dendio

namespace dend {

using dendio::find_and_remove_json;
using dendio::find_and_remove_required;
using dendio::param_from_json;
using dendio::throw_if_not_empty;

void to_json(nlohmann::json& j, const cell_description& cell) {
    j["parents"] = cell.parents;
    j["ncomp"] = cell.ncomp;
    if (!cell.radius.empty()) j["radius"] = cell.radius;
    if (!cell.length.empty()) j["length"] = cell.length;
    if (!cell.axial_resistivity.empty()) j["axial-resistivity"] = cell.axial_resistivity;
    if (!cell.capacitance.empty()) j["capacitance"] = cell.capacitance;
}

void from_json(const nlohmann::json& j, cell_description& cell) {
    auto j_copy = j;
    auto parents = find_and_remove_required<std::vector<fvm_index_type>>("parents", j_copy);
    auto ncomp = find_and_remove_required<std::vector<fvm_size_type>>("ncomp", j_copy);

    // Per-branch morphometrics, as delivered by a morphology reader.
    if (auto pathlengths = find_and_remove_json<std::vector<fvm_value_type>>("pathlengths", j_copy)) {
        auto radii = find_and_remove_required<std::vector<fvm_value_type>>("endpoint-radii", j_copy);
        auto start_radius = find_and_remove_required<fvm_value_type>("start-radius", j_copy);

        fvm_value_type ra = cable_parameter_defaults::axial_resistivity;
        fvm_value_type cm = cable_parameter_defaults::capacitance;
        param_from_json(ra, "axial-resistivity", j_copy);
        param_from_json(cm, "capacitance", j_copy);
        throw_if_not_empty(j_copy);

        cell = cell_description_from_branches(std::move(parents), std::move(ncomp), *pathlengths, radii, start_radius, ra, cm);
        return;
    }

    cell = cell_description{};
    cell.parents = std::move(parents);
    cell.ncomp = std::move(ncomp);
    param_from_json(cell.radius, "radius", j_copy);
    param_from_json(cell.length, "length", j_copy);
    param_from_json(cell.axial_resistivity, "axial-resistivity", j_copy);
    param_from_json(cell.capacitance, "capacitance", j_copy);
    throw_if_not_empty(j_copy);
}

void to_json(nlohmann::json& j, const mechanism_desc& mech) {
    j["mechanism"] = mech.name;
    if (!mech.alias.empty()) j["alias"] = mech.alias;
    if (!mech.params.empty()) j["params"] = mech.params;
    if (!mech.instance_params.empty()) j["instance-params"] = mech.instance_params;
}

// Reads the mechanism keys of j, removing them.
static mechanism_desc mechanism_desc_from_json(nlohmann::json& j) {
    mechanism_desc mech(find_and_remove_required<std::string>("mechanism", j));
    param_from_json(mech.alias, "alias", j);
    param_from_json(mech.params, "params", j);
    param_from_json(mech.instance_params, "instance-params", j);
    return mech;
}

void from_json(const nlohmann::json& j, mechanism_desc& mech) {
    auto j_copy = j;
    mech = mechanism_desc_from_json(j_copy);
    throw_if_not_empty(j_copy);
}

void to_json(nlohmann::json& j, const density_insertion& ins) {
    to_json(j, ins.mech);
    j["compartments"] = ins.compartments;
}

void from_json(const nlohmann::json& j, density_insertion& ins) {
    auto j_copy = j;
    ins.mech = mechanism_desc_from_json(j_copy);
    ins.compartments = find_and_remove_required<std::vector<fvm_index_type>>("compartments", j_copy);
    throw_if_not_empty(j_copy);
}

void to_json(nlohmann::json& j, const synapse_group& group) {
    to_json(j, group.mech);
    auto conns = nlohmann::json::array();
    for (const auto& c: group.connections) {
        conns.push_back({c.pre, c.post});
    }
    j["connections"] = conns;
}

void from_json(const nlohmann::json& j, synapse_group& group) {
    auto j_copy = j;
    group.mech = mechanism_desc_from_json(j_copy);

    auto conns = find_and_remove_required<std::vector<std::pair<fvm_index_type, fvm_index_type>>>("connections", j_copy);
    group.connections.clear();
    for (const auto& [pre, post]: conns) {
        group.connections.push_back({pre, post});
    }
    throw_if_not_empty(j_copy);
}

void to_json(nlohmann::json& j, const network_description& net) {
    j["max-num-kids"] = net.max_num_kids;
    j["cells"] = net.cells;
    j["channels"] = net.channels;
    j["synapses"] = net.synapses;
}

void from_json(const nlohmann::json& j, network_description& net) {
    auto j_copy = j;
    net = network_description{};
    param_from_json(net.max_num_kids, "max-num-kids", j_copy);
    net.cells = find_and_remove_required<std::vector<cell_description>>("cells", j_copy);
    param_from_json(net.channels, "channels", j_copy);
    param_from_json(net.synapses, "synapses", j_copy);
    throw_if_not_empty(j_copy);
}

// Traces of the same compartment are summed.
void to_json(nlohmann::json& j, const stimulus_schedule& schedule) {
    std::map<fvm_index_type, std::vector<fvm_value_type>> merged;
    for (const auto& [cv, trace]: schedule.traces()) {
        auto& m = merged[cv];
        if (m.size()<trace.size()) m.resize(trace.size(), 0);
        for (std::size_t i = 0; i<trace.size(); ++i) {
            m[i] += trace[i];
        }
    }

    j = nlohmann::json::object();
    for (const auto& [cv, trace]: merged) {
        j[std::to_string(cv)] = trace;
    }
}

void from_json(const nlohmann::json& j, stimulus_schedule& schedule) {
    if (!j.is_object()) {
        throw dendio::jsonio_load_error("stimulus-schedule", "expected an object of compartment traces");
    }

    schedule = stimulus_schedule{};
    for (const auto& [key, value]: j.items()) {
        fvm_index_type cv = 0;
        auto end = key.data()+key.size();
        auto [ptr, ec] = std::from_chars(key.data(), end, cv);
        if (ec!=std::errc() || ptr!=end) {
            throw dendio::jsonio_load_error("stimulus-schedule", "\""+key+"\" is not a compartment index");
        }
        schedule.add(cv, value.get<std::vector<fvm_value_type>>());
    }
}

} // namespace dend

namespace dendio {

jsonio_error::jsonio_error(const std::string& msg):
    dend::dendrite_exception(msg)
{}

jsonio_unused_input::jsonio_unused_input(const std::string& key):
    jsonio_error("Unused input parameter: \"" + key + "\"")
{}

jsonio_missing_field::jsonio_missing_field(const std::string& field):
    jsonio_error("Missing \"" + field + "\" field.")
{}

jsonio_version_error::jsonio_version_error(const unsigned ver):
    jsonio_error("Unsupported version: \"" + std::to_string(ver) + "\".")
{}

jsonio_type_error::jsonio_type_error(const std::string& type):
    jsonio_error("Unsupported type: \"" + type + "\".")
{}

jsonio_load_error::jsonio_load_error(const std::string& type, const std::string& err):
    jsonio_error("Error loading " + type + ": " + err)
{}

// Public functions - read and write directly from and to json

std::variant<dend::network_description, dend::stimulus_schedule> load_json(const nlohmann::json& json_data) {
    if (!json_data.count("version")) {
        throw jsonio_missing_field("version");
    }
    if (!json_data.count("type")) {
        throw jsonio_missing_field("type");
    }
    if (!json_data.count("data")) {
        throw jsonio_missing_field("data");
    }

    std::string type;
    try {
        if (auto version = json_data.at("version").get<unsigned>(); version != DENDIO_JSONIO_VERSION) {
            throw jsonio_version_error(version);
        }
        type = json_data.at("type").get<std::string>();

        const auto& data = json_data.at("data");
        if (type == "network") {
            return data.get<dend::network_description>();
        }
        else if (type == "stimulus-schedule") {
            return data.get<dend::stimulus_schedule>();
        }
    }
    catch (nlohmann::json::exception& e) {
        throw jsonio_load_error(type.empty()? "envelope": type, e.what());
    }
    throw jsonio_type_error(type);
}

nlohmann::json write_json(const dend::network_description& net) {
    return nlohmann::json{{"version", DENDIO_JSONIO_VERSION}, {"type", "network"}, {"data", net}};
}

nlohmann::json write_json(const dend::stimulus_schedule& schedule) {
    return nlohmann::json{{"version", DENDIO_JSONIO_VERSION}, {"type", "stimulus-schedule"}, {"data", schedule}};
}

} // namespace dendio
