#include "vtk.hpp"
#include <fstream>
#include <iomanip>
#include <string>

namespace VTKWriter {

namespace {

int vtk_cell_type(size_t num_vertices) {
    switch (num_vertices) {
        case 3:  return 5;   // VTK_TRIANGLE
        case 4:  return 9;   // VTK_QUAD
        default: return 7;   // VTK_POLYGON
    }
}

template <typename Fn>
void data_array(std::ostream& out, const char* type, const std::string& name, size_t n, Fn value) {
    out << "<DataArray type=\"" << type << "\" Name=\"" << name << "\" format=\"ascii\">\n";
    for (size_t i = 0; i < n; ++i) out << value(i) << "\n";
    out << "</DataArray>\n";
}

void write_geometry(std::ostream& out, const Mesh& mesh) {
    out << "<Points>\n<DataArray type=\"Float64\" NumberOfComponents=\"3\" format=\"ascii\">\n";
    for (size_t i = 0; i < mesh.num_nodes(); ++i) {
        const Node& p = mesh.node(i);
        out << p.x << " " << p.y << " 0\n";
    }
    out << "</DataArray>\n</Points>\n<Cells>\n";

    out << "<DataArray type=\"Int32\" Name=\"connectivity\" format=\"ascii\">\n";
    for (size_t e = 0; e < mesh.num_elements(); ++e) {
        const auto& vid = mesh.element(e).vid;
        for (size_t k = 0; k < vid.size(); ++k) out << (k ? " " : "") << vid[k];
        out << "\n";
    }
    out << "</DataArray>\n";

    size_t offset = 0;
    data_array(out, "Int32", "offsets", mesh.num_elements(),
               [&](size_t e) { return offset += mesh.element(e).vid.size(); });
    data_array(out, "UInt8", "types", mesh.num_elements(),
               [&](size_t e) { return vtk_cell_type(mesh.element(e).vid.size()); });
    out << "</Cells>\n";
}

} // namespace

bool write_vtu(const std::string& path,
               const Mesh& mesh,
               const TargetFieldSet& fields,
               const ActiveMask& original_mask) {
    std::ofstream out(path);
    if (!out) return false;
    const size_t n = mesh.num_elements();

    out << "<?xml version=\"1.0\"?>\n"
        << "<VTKFile type=\"UnstructuredGrid\" version=\"0.1\" byte_order=\"LittleEndian\">\n"
        << "<UnstructuredGrid>\n"
        << "<Piece NumberOfPoints=\"" << mesh.num_nodes() << "\" NumberOfCells=\"" << n << "\">\n";
    out << std::setprecision(16);

    write_geometry(out, mesh);

    out << "<CellData>\n";
    data_array(out, "Int32", "cellTag", n, [&](size_t e) { return mesh.element(e).tag; });
    for (const auto& kv : fields.fields()) {
        const CellField& f = kv.second;
        if (f.num_cells() != n) continue;
        for (int level = 0; level < f.n_levels; ++level) {
            const std::string name = f.n_levels > 1 ? f.name + ":" + std::to_string(level) : f.name;
            data_array(out, "Float64", name, n, [&](size_t e) { return f.at(e, level); });
        }
    }
    if (original_mask.size() == n) {
        data_array(out, "UInt8", "originalActiveMask", n,
                   [&](size_t e) { return original_mask[e] ? 1 : 0; });
    }
    out << "</CellData>\n";

    out << "</Piece>\n</UnstructuredGrid>\n</VTKFile>\n";
    return static_cast<bool>(out);
}

} // namespace VTKWriter
