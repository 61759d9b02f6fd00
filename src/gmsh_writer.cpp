#include "gmsh_writer.hpp"
#include <fstream>
#include <iomanip>

namespace GmshWriter {

bool write_with_element_data(const std::string& path,
                             const Mesh& mesh,
                             const TargetFieldSet& fields,
                             const std::string& history) {
    std::ofstream out(path);
    if (!out) return false;

    out << "$MeshFormat\n2.2 0 8\n$EndMeshFormat\n";
    if (!history.empty()) {
        out << "$Comments\n" << history << "\n$EndComments\n";
    }

    out << std::setprecision(16);
    out << "$Nodes\n" << mesh.num_nodes() << "\n";
    for (size_t i = 0; i < mesh.num_nodes(); ++i) {
        out << i + 1 << " " << mesh.node(i).x << " " << mesh.node(i).y << " 0\n";
    }
    out << "$EndNodes\n";

    // Original element tags are kept so external views stay valid.
    out << "$Elements\n" << mesh.num_elements() << "\n";
    for (size_t e = 0; e < mesh.num_elements(); ++e) {
        const auto& el = mesh.element(e);
        const int type = el.vid.size() == 4 ? 3 : 2;
        out << el.tag << " " << type << " 2 0 0";
        for (int v : el.vid) out << " " << v + 1;
        out << "\n";
    }
    out << "$EndElements\n";

    for (const auto& kv : fields.fields()) {
        const CellField& f = kv.second;
        for (int level = 0; level < f.n_levels; ++level) {
            out << "$ElementData\n"
                << "1\n\"" << f.name << "\"\n"
                << "1\n0\n"
                << "3\n" << level << "\n1\n" << mesh.num_elements() << "\n";
            for (size_t e = 0; e < mesh.num_elements(); ++e) {
                out << mesh.element(e).tag << " " << f.at(e, level) << "\n";
            }
            out << "$EndElementData\n";
        }
    }
    return static_cast<bool>(out);
}

} // namespace GmshWriter
