#include "mesh.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <map>

namespace {

// Number of nodes of a Gmsh element type, 0 if unknown.
int gmsh_nodes_per_element(int type)
{
    switch (type) {
        case 1:  return 2;   // 2-node line
        case 2:  return 3;   // 3-node triangle
        case 3:  return 4;   // 4-node quadrangle
        case 4:  return 4;   // 4-node tetrahedron
        case 5:  return 8;   // 8-node hexahedron
        case 8:  return 3;   // 3-node line
        case 9:  return 6;   // 6-node triangle
        case 15: return 1;   // 1-node point
        case 16: return 8;   // 8-node quadrangle
        case 20: return 9;   // 9-node triangle
        case 21: return 10;  // 10-node triangle
        default: return 0;
    }
}

// Linear 2-D cells become graph cells; everything else is skipped.
bool is_polygon_type(int type)
{
    return type == 2 || type == 3;
}

std::string strip_quotes(std::string s)
{
    s.erase(std::remove(s.begin(), s.end(), '"'), s.end());
    return s;
}

} // namespace

void Mesh::track_bounds(double x, double y)
{
    _xmin = std::min(_xmin, x); _xmax = std::max(_xmax, x);
    _ymin = std::min(_ymin, y); _ymax = std::max(_ymax, y);
}

bool Mesh::load_gmsh(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "Cannot open Gmsh file: " << path << std::endl;
        return false;
    }

    std::string line;
    double version = 2.2;
    std::map<int, int> gmsh_to_internal;
    nodes.clear();
    elems.clear();
    data_blocks.clear();
    comments.clear();

    _xmin = _ymin = std::numeric_limits<double>::max();
    _xmax = _ymax = -std::numeric_limits<double>::max();

    auto add_polygon = [&](int id, const std::vector<int>& gmsh_nodes) {
        Element e;
        e.tag = id;
        for (int n : gmsh_nodes) {
            auto it = gmsh_to_internal.find(n);
            if (it == gmsh_to_internal.end()) {
                std::cerr << "[WARNING] Element " << id << " references unknown Gmsh node " << n << "\n";
                return;
            }
            e.vid.push_back(it->second);
        }
        elems.push_back(e);
    };

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line == "$MeshFormat") {
            std::getline(in, line);
            std::istringstream iss(line);
            iss >> version;
        }
        else if (line == "$Nodes") {
            if (version < 4.0) {
                std::getline(in, line);
                int num_nodes_file = std::stoi(line);
                for (int i = 0; i < num_nodes_file; ++i) {
                    std::getline(in, line);
                    std::istringstream iss(line);
                    int id; double x, y, z;
                    iss >> id >> x >> y >> z;
                    nodes.push_back({x, y});
                    gmsh_to_internal[id] = (int)nodes.size() - 1;
                    track_bounds(x, y);
                }
            } else {
                size_t numEntityBlocks, totalNodes, minTag, maxTag;
                in >> numEntityBlocks >> totalNodes >> minTag >> maxTag;
                nodes.reserve(totalNodes);

                for (size_t b = 0; b < numEntityBlocks; ++b) {
                    int entityDim, entityTag, parametric;
                    size_t numNodesInBlock;
                    in >> entityDim >> entityTag >> parametric >> numNodesInBlock;

                    std::vector<int> tags(numNodesInBlock);
                    for (size_t i = 0; i < numNodesInBlock; ++i) in >> tags[i];

                    for (size_t i = 0; i < numNodesInBlock; ++i) {
                        double x, y, z;
                        in >> x >> y >> z;
                        nodes.push_back({x, y});
                        gmsh_to_internal[tags[i]] = (int)nodes.size() - 1;
                        track_bounds(x, y);
                    }
                }
            }
        }
        else if (line == "$Elements") {
            if (version < 4.0) {
                std::getline(in, line);
                int num_elems_file = std::stoi(line);
                for (int i = 0; i < num_elems_file; ++i) {
                    std::getline(in, line);
                    std::istringstream iss(line);
                    int id, type, ntags;
                    iss >> id >> type >> ntags;
                    for (int t = 0; t < ntags; ++t) { int dummy; iss >> dummy; }
                    if (!is_polygon_type(type)) continue;

                    std::vector<int> gmsh_nodes(gmsh_nodes_per_element(type));
                    for (auto& n : gmsh_nodes) iss >> n;
                    if (iss) add_polygon(id, gmsh_nodes);
                }
            } else {
                size_t numEntityBlocks, totalElems, minTag, maxTag;
                in >> numEntityBlocks >> totalElems >> minTag >> maxTag;
                for (size_t b = 0; b < numEntityBlocks; ++b) {
                    int entityDim, entityTag, elementType;
                    size_t numElemsInBlock;
                    in >> entityDim >> entityTag >> elementType >> numElemsInBlock;

                    const int numNodes = gmsh_nodes_per_element(elementType);
                    for (size_t i = 0; i < numElemsInBlock; ++i) {
                        int id;
                        in >> id;
                        if (numNodes == 0) {
                            std::cerr << "[WARNING] Unknown element type " << elementType
                                      << " in element " << id << ", skipping\n";
                            std::string remainder;
                            std::getline(in, remainder);
                            continue;
                        }
                        // Consume node IDs to keep stream synchronized
                        std::vector<int> gmsh_nodes(numNodes);
                        for (auto& n : gmsh_nodes) in >> n;
                        if (is_polygon_type(elementType)) add_polygon(id, gmsh_nodes);
                    }
                }
            }
        }
        else if (line == "$ElementData") {
            read_element_data(in);
        }
        else if (line == "$Comments") {
            while (std::getline(in, line)) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                if (line == "$EndComments") break;
                if (!comments.empty()) comments += '\n';
                comments += line;
            }
        }
    }

    std::cout << "[MESH] Loaded Gmsh V" << version << " | Nodes: " << nodes.size()
              << " | Cells: " << elems.size()
              << " | Element data views: " << data_blocks.size() << std::endl;
    return (!nodes.empty() && !elems.empty());
}

// Reads one view up to $EndElementData. Only the first component is kept.
void Mesh::read_element_data(std::istream& in)
{
    ElementDataBlock block;
    std::string line;

    int num_string_tags = 0;
    in >> num_string_tags;
    std::getline(in, line);
    for (int i = 0; i < num_string_tags; ++i) {
        std::getline(in, line);
        if (i == 0) block.name = strip_quotes(line);
    }

    int num_real_tags = 0;
    in >> num_real_tags;
    for (int i = 0; i < num_real_tags; ++i) { double dummy; in >> dummy; }

    int num_int_tags = 0;
    in >> num_int_tags;
    std::vector<int> int_tags(num_int_tags, 0);
    for (auto& t : int_tags) in >> t;

    const int time_step  = num_int_tags > 0 ? int_tags[0] : 0;
    const int components = num_int_tags > 1 ? int_tags[1] : 1;
    const int entities   = num_int_tags > 2 ? int_tags[2] : 0;
    block.level = time_step;

    block.values.reserve(entities);
    for (int i = 0; i < entities; ++i) {
        int tag;
        in >> tag;
        double value = 0.0;
        for (int c = 0; c < components; ++c) {
            double v; in >> v;
            if (c == 0) value = v;
        }
        block.values.emplace_back(tag, value);
    }

    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line == "$EndElementData") break;
    }

    if (block.name.empty()) {
        std::cerr << "[WARNING] Skipping unnamed $ElementData view\n";
        return;
    }
    data_blocks.push_back(std::move(block));
}

int Mesh::add_node(double x, double y) {
    nodes.push_back({x, y});
    track_bounds(x, y);
    return static_cast<int>(nodes.size()) - 1;
}

int Mesh::add_element(const std::vector<int>& vid) {
    Element e;
    e.vid = vid;
    e.tag = static_cast<int>(elems.size()) + 1;
    elems.push_back(e);
    return static_cast<int>(elems.size()) - 1;
}

// Vertex average of the polygon.
std::array<double, 2> Mesh::element_centroid(size_t e) const {
    const auto& v = elems[e].vid;
    double cx = 0.0, cy = 0.0;
    for (int id : v) {
        cx += nodes[id].x;
        cy += nodes[id].y;
    }
    const double n = static_cast<double>(v.size());
    return { cx / n, cy / n };
}
