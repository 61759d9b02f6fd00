#ifndef NEIGHBOR_STENCIL_HPP
#define NEIGHBOR_STENCIL_HPP

#include "field_catalog.hpp"
#include "target_fields.hpp"

#include <Eigen/Dense>
#include <vector>

class MeshGraph;

/**
 * @brief Active neighbours of one cell and the weights to combine them
 *
 * Shared by the extrapolation and smoothing stages so both apply the same
 * minimum / inverse-distance rules.
 */
struct NeighborStencil {
    int cell = -1;
    std::vector<int> donors;   // neighbours active in the mask used to build the stencil
    Eigen::VectorXd weights;   // normalised 1/d weights (InverseDistance only)

    /**
     * @brief Collect the donors of cell under mask
     *
     * For InverseDistance the weights are computed here; a donor at zero
     * distance throws GeometryError. Returns the number of donors.
     */
    int build(NeighborRule rule, const MeshGraph& graph, int cell_id, const ActiveMask& mask);

    // Combine donor values of one level; requires at least one donor.
    double apply(NeighborRule rule, const CellField& field, int level = 0) const;
};

#endif // NEIGHBOR_STENCIL_HPP
