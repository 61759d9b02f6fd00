#pragma once
#include "mesh.hpp"
#include "target_fields.hpp"
#include <string>

namespace GmshWriter {

// Gmsh 2.2 ASCII file with the polygonal cells and one $ElementData view per
// field level (level stored as the time-step tag). Readable by Mesh::load_gmsh,
// so a converted target can be fed to the next conversion.
// history, when non-empty, is stored as a $Comments section.
bool write_with_element_data(const std::string& path,
                             const Mesh& mesh,
                             const TargetFieldSet& fields,
                             const std::string& history = std::string());

} // namespace GmshWriter
