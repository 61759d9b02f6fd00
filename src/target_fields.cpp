#include "target_fields.hpp"
#include "mesh.hpp"
#include "remap_errors.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_map>

TargetFieldSet TargetFieldSet::from_mesh(const Mesh& mesh)
{
    TargetFieldSet set(mesh.num_elements());

    std::unordered_map<int, size_t> tag_to_cell;
    for (size_t e = 0; e < mesh.num_elements(); ++e) {
        tag_to_cell[mesh.element(e).tag] = e;
    }

    // Level count of a field is the highest time step seen plus one.
    std::map<std::string, int> levels;
    for (const auto& block : mesh.element_data()) {
        if (block.level < 0) continue;
        int& n = levels[block.name];
        n = std::max(n, block.level + 1);
    }
    for (const auto& kv : levels) {
        set.add(kv.first, kv.second);
    }

    for (const auto& block : mesh.element_data()) {
        if (block.level < 0) {
            std::cerr << "[WARNING] Ignoring negative level " << block.level
                      << " of field " << block.name << "\n";
            continue;
        }
        CellField& field = set.get(block.name);
        size_t unknown = 0;
        for (const auto& tv : block.values) {
            auto it = tag_to_cell.find(tv.first);
            if (it == tag_to_cell.end()) { ++unknown; continue; }
            field.at(it->second, block.level) = tv.second;
        }
        if (unknown > 0) {
            std::cerr << "[WARNING] Field " << block.name << " level " << block.level
                      << ": " << unknown << " values reference no polygonal cell\n";
        }
    }
    return set;
}

CellField& TargetFieldSet::get(const std::string& name)
{
    auto it = fields_.find(name);
    if (it == fields_.end()) {
        throw ConfigurationError("target has no field '" + name + "'");
    }
    return it->second;
}

const CellField& TargetFieldSet::get(const std::string& name) const
{
    auto it = fields_.find(name);
    if (it == fields_.end()) {
        throw ConfigurationError("target has no field '" + name + "'");
    }
    return it->second;
}

CellField& TargetFieldSet::add(const std::string& name, int levels, double fill)
{
    auto result = fields_.emplace(name, CellField(name, num_cells_, levels, fill));
    return result.first->second;
}
