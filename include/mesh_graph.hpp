#ifndef MESH_GRAPH_HPP
#define MESH_GRAPH_HPP

#include <Eigen/Dense>
#include <vector>

class Mesh;

/**
 * @brief Read-only cell adjacency of the target mesh
 *
 * Cells are 0-based. Each cell stores its centroid and the ids of its real
 * neighbours (compressed rows); the "no neighbour" padding of the persisted
 * layout is removed at construction, so degree(c) counts real neighbours only.
 * Symmetry of the adjacency is not required.
 */
class MeshGraph {
public:
    // Contiguous view of one neighbour list.
    struct Neighbors {
        const int* first;
        const int* last;
        const int* begin() const { return first; }
        const int* end() const { return last; }
        int size() const { return static_cast<int>(last - first); }
        bool empty() const { return first == last; }
    };

    MeshGraph() = default;

    /**
     * @brief Build from padded MPAS-style arrays
     * @param x,y           centroid coordinates, one per cell
     * @param cells_on_cell row-major [num_cells x max_degree], 1-based ids, 0 = no neighbour
     * @param edges_on_cell number of used slots per row
     * @param max_degree    row width of cells_on_cell
     *
     * Throws TopologyError when a slot holds an id outside [0, num_cells] or a
     * degree exceeds max_degree.
     */
    static MeshGraph from_padded(const std::vector<double>& x,
                                 const std::vector<double>& y,
                                 const std::vector<int>& cells_on_cell,
                                 const std::vector<int>& edges_on_cell,
                                 int max_degree);

    // Cells are the mesh polygons; two cells are neighbours when they share an edge.
    static MeshGraph from_mesh(const Mesh& mesh);

    size_t num_cells() const { return centroids_.size(); }
    int degree(int cell) const { return offsets_[cell + 1] - offsets_[cell]; }
    int max_degree() const;

    Neighbors neighbors(int cell) const {
        return { adjacency_.data() + offsets_[cell], adjacency_.data() + offsets_[cell + 1] };
    }

    const Eigen::Vector2d& centroid(int cell) const { return centroids_[cell]; }
    double x(int cell) const { return centroids_[cell].x(); }
    double y(int cell) const { return centroids_[cell].y(); }

    double distance(int a, int b) const { return (centroids_[a] - centroids_[b]).norm(); }

private:
    std::vector<Eigen::Vector2d> centroids_;
    std::vector<int> offsets_{0};
    std::vector<int> adjacency_;
};

#endif // MESH_GRAPH_HPP
