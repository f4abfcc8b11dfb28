// State class holds the named fields of a grid, grouped by the grid element
// they are defined on (nodes or links).

#ifndef TVD_CORE_STATE_HPP
#define TVD_CORE_STATE_HPP

#include "Field.hpp"
#include <map>
#include <string>
#include <vector>

namespace TVD {
namespace Core {

enum class FieldLocation {
    NODE,
    LINK
};

std::string to_string(FieldLocation location);

class State {
public:
    State(int number_of_nodes, int number_of_links);

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    // Create a zero-initialised field sized for the given location.
    // Throws if a field with the same name already exists there.
    Field<1>& add_field(FieldLocation location, const std::string& name);

    // Get a field by name
    Field<1>& get_field(FieldLocation location, const std::string& name);
    const Field<1>& get_field(FieldLocation location, const std::string& name) const;

    bool has_field(FieldLocation location, const std::string& name) const;
    std::vector<std::string> field_names(FieldLocation location) const;

    int size_of(FieldLocation location) const;

private:
    std::map<std::string, Field<1>>& fields_at(FieldLocation location);
    const std::map<std::string, Field<1>>& fields_at(FieldLocation location) const;

    int number_of_nodes_;
    int number_of_links_;
    std::map<std::string, Field<1>> node_fields_;
    std::map<std::string, Field<1>> link_fields_;
};

} // namespace Core
} // namespace TVD

#endif // TVD_CORE_STATE_HPP
