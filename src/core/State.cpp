#include "State.hpp"
#include <stdexcept>

namespace TVD {
namespace Core {

std::string to_string(FieldLocation location) {
    return location == FieldLocation::NODE ? "node" : "link";
}

State::State(int number_of_nodes, int number_of_links)
    : number_of_nodes_(number_of_nodes), number_of_links_(number_of_links) {}

std::map<std::string, Field<1>>& State::fields_at(FieldLocation location) {
    return location == FieldLocation::NODE ? node_fields_ : link_fields_;
}

const std::map<std::string, Field<1>>& State::fields_at(FieldLocation location) const {
    return location == FieldLocation::NODE ? node_fields_ : link_fields_;
}

int State::size_of(FieldLocation location) const {
    return location == FieldLocation::NODE ? number_of_nodes_ : number_of_links_;
}

Field<1>& State::add_field(FieldLocation location, const std::string& name) {
    auto& fields = fields_at(location);
    auto result = fields.try_emplace(name, name, std::array<int, 1>{size_of(location)});
    if (!result.second) {
        throw std::runtime_error("Field '" + name + "' already exists at " + to_string(location) + ".");
    }
    return result.first->second;
}

Field<1>& State::get_field(FieldLocation location, const std::string& name) {
    try {
        return fields_at(location).at(name);
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("Field '" + name + "' not found at " + to_string(location) + ".");
    }
}

const Field<1>& State::get_field(FieldLocation location, const std::string& name) const {
    try {
        return fields_at(location).at(name);
    }
    catch (const std::out_of_range&) {
        throw std::runtime_error("Field '" + name + "' not found at " + to_string(location) + ".");
    }
}

bool State::has_field(FieldLocation location, const std::string& name) const {
    return fields_at(location).count(name) > 0;
}

std::vector<std::string> State::field_names(FieldLocation location) const {
    std::vector<std::string> names;
    for (const auto& pair : fields_at(location)) {
        names.push_back(pair.first);
    }
    return names;
}

} // namespace Core
} // namespace TVD
