#pragma once
#include "mesh.hpp"
#include "target_fields.hpp"
#include <string>

namespace VTKWriter {

// VTU (XML, ascii) of the polygonal cells. Cell arrays:
//   cellTag             Gmsh element tag
//   <field>[:<level>]   one array per field level, level suffix only for layered fields
//   originalActiveMask  1 where the cell held a trusted value before extrapolation
bool write_vtu(const std::string& path,
               const Mesh& mesh,
               const TargetFieldSet& fields,
               const ActiveMask& original_mask);

} // namespace VTKWriter
