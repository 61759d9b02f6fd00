#include "mesh_graph.hpp"
#include "mesh.hpp"
#include "remap_errors.hpp"

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <unordered_map>

namespace {

// Undirected edge key; node ids are non-negative.
std::uint64_t edge_key(int a, int b)
{
    const auto lo = static_cast<std::uint64_t>(std::min(a, b));
    const auto hi = static_cast<std::uint64_t>(std::max(a, b));
    return (lo << 32) | hi;
}

} // namespace

MeshGraph MeshGraph::from_padded(const std::vector<double>& x,
                                 const std::vector<double>& y,
                                 const std::vector<int>& cells_on_cell,
                                 const std::vector<int>& edges_on_cell,
                                 int max_degree)
{
    const size_t n = x.size();
    if (y.size() != n || edges_on_cell.size() != n ||
        cells_on_cell.size() != n * static_cast<size_t>(max_degree)) {
        std::stringstream ss;
        ss << "inconsistent mesh arrays: " << x.size() << " x, " << y.size() << " y, "
           << edges_on_cell.size() << " degrees, " << cells_on_cell.size()
           << " neighbour slots for max degree " << max_degree;
        throw TopologyError(ss.str());
    }

    MeshGraph g;
    g.centroids_.reserve(n);
    g.offsets_.reserve(n + 1);
    for (size_t c = 0; c < n; ++c) {
        g.centroids_.emplace_back(x[c], y[c]);

        const int deg = edges_on_cell[c];
        if (deg < 0 || deg > max_degree) {
            std::stringstream ss;
            ss << "cell " << c + 1 << " declares " << deg << " edges (max " << max_degree << ")";
            throw TopologyError(ss.str());
        }
        for (int k = 0; k < deg; ++k) {
            const int id = cells_on_cell[c * max_degree + k];
            if (id == 0) continue;  // boundary edge
            if (id < 0 || id > static_cast<int>(n)) {
                std::stringstream ss;
                ss << "cell " << c + 1 << " lists neighbour " << id << " outside [1, " << n << "]";
                throw TopologyError(ss.str());
            }
            g.adjacency_.push_back(id - 1);
        }
        g.offsets_.push_back(static_cast<int>(g.adjacency_.size()));
    }
    return g;
}

MeshGraph MeshGraph::from_mesh(const Mesh& mesh)
{
    const size_t n = mesh.num_elements();

    // Each interior edge is shared by exactly two polygons.
    std::unordered_map<std::uint64_t, std::vector<int>> edge_cells;
    edge_cells.reserve(n * 2);
    for (size_t e = 0; e < n; ++e) {
        const auto& vid = mesh.element(e).vid;
        for (size_t k = 0; k < vid.size(); ++k) {
            const int a = vid[k];
            const int b = vid[(k + 1) % vid.size()];
            edge_cells[edge_key(a, b)].push_back(static_cast<int>(e));
        }
    }

    MeshGraph g;
    g.centroids_.reserve(n);
    g.offsets_.reserve(n + 1);
    for (size_t e = 0; e < n; ++e) {
        const auto c = mesh.element_centroid(e);
        g.centroids_.emplace_back(c[0], c[1]);

        const auto& vid = mesh.element(e).vid;
        for (size_t k = 0; k < vid.size(); ++k) {
            const auto& owners = edge_cells[edge_key(vid[k], vid[(k + 1) % vid.size()])];
            for (int other : owners) {
                if (other != static_cast<int>(e)) g.adjacency_.push_back(other);
            }
        }
        g.offsets_.push_back(static_cast<int>(g.adjacency_.size()));
    }
    return g;
}

int MeshGraph::max_degree() const
{
    int best = 0;
    for (size_t c = 0; c < num_cells(); ++c) {
        best = std::max(best, degree(static_cast<int>(c)));
    }
    return best;
}
