#pragma once

#include <string>
#include <variant>

#include <dendrite/dendexcept.hpp>
#include <dendrite/network.hpp>
#include <dendrite/stimulus.hpp>

#include <nlohmann/json.hpp>

#define DENDIO_JSONIO_VERSION 1

namespace dendio {

struct jsonio_error: public dend::dendrite_exception {
    jsonio_error(const std::string& msg);
};

// Input in JSON not used
struct jsonio_unused_input: jsonio_error {
    explicit jsonio_unused_input(const std::string& key);
};

struct jsonio_missing_field: jsonio_error {
    explicit jsonio_missing_field(const std::string& field);
};

struct jsonio_version_error: jsonio_error {
    explicit jsonio_version_error(const unsigned version);
};

struct jsonio_type_error: jsonio_error {
    explicit jsonio_type_error(const std::string& type);
};

// Value of the wrong JSON type, or otherwise malformed
struct jsonio_load_error: jsonio_error {
    jsonio_load_error(const std::string& type, const std::string& err);
};

// Load a network description or stimulus schedule from a JSON document of the form
//   {"version": 1, "type": "network" | "stimulus-schedule", "data": {...}}
std::variant<dend::network_description, dend::stimulus_schedule> load_json(const nlohmann::json&);

nlohmann::json write_json(const dend::network_description&);
nlohmann::json write_json(const dend::stimulus_schedule&);

} // namespace dendio

namespace dend {

// Serialization of the description types, for use with nlohmann::json::get
// and assignment. Unknown keys in the input raise dendio::jsonio_unused_input.

void to_json(nlohmann::json& j, const cell_description& cell);
void from_json(const nlohmann::json& j, cell_description& cell);

void to_json(nlohmann::json& j, const mechanism_desc& mech);
void from_json(const nlohmann::json& j, mechanism_desc& mech);

void to_json(nlohmann::json& j, const density_insertion& ins);
void from_json(const nlohmann::json& j, density_insertion& ins);

void to_json(nlohmann::json& j, const synapse_group& group);
void from_json(const nlohmann::json& j, synapse_group& group);

void to_json(nlohmann::json& j, const network_description& net);
void from_json(const nlohmann::json& j, network_description& net);

void to_json(nlohmann::json& j, const stimulus_schedule& schedule);
void from_json(const nlohmann::json& j, stimulus_schedule& schedule);

} // namespace dend
