#ifndef GRAPH_SMOOTHER_HPP
#define GRAPH_SMOOTHER_HPP

#include "field_catalog.hpp"
#include "neighbor_stencil.hpp"
#include "target_fields.hpp"

#include <petscmat.h>
#include <petscvec.h>
#include <vector>

class MeshGraph;

/**
 * @brief Fixed number of neighbour-smoothing passes over the cells that were
 *        inactive before extrapolation
 *
 * Every pass reads neighbour values from the state at the start of the pass.
 * The inverse-distance rule does not change between passes (geometry is fixed
 * and the mask is saturated), so it is assembled once as a sparse operator W
 * (identity rows for untouched cells) and applied as v <- W v. The minimum
 * rule is applied directly on the graph.
 *
 * The inverse-distance path uses PETSc; PetscInitialize must have been called.
 */
class GraphSmoother {
public:
    GraphSmoother(const MeshGraph& graph, const FieldRule& rule)
        : graph_(graph), rule_(rule) {}

    // Throws ConfigurationError for negative counts, or for a positive count on a field without a smoothing rule.
    static void validate(const FieldRule& rule, int iterations);

    /**
     * @brief Smooth the originally inactive cells
     * @param field      values to smooth (all levels)
     * @param original   mask captured before extrapolation; false = smooth this cell
     * @param current    mask after extrapolation; donors must be active here
     * @param iterations number of passes, 0 leaves field untouched
     *
     * Throws TopologyError when a smoothed cell has no active neighbour.
     */
    void smooth(CellField& field, const ActiveMask& original, const ActiveMask& current,
                int iterations) const;

private:
    std::vector<NeighborStencil> build_stencils(const ActiveMask& original,
                                                const ActiveMask& current) const;
    void smooth_minimum(CellField& field, const std::vector<NeighborStencil>& stencils,
                        int iterations) const;

    PetscErrorCode assemble_operator(const std::vector<NeighborStencil>& stencils, Mat& W) const;
    PetscErrorCode apply_operator(const Mat& W, CellField& field, int iterations) const;
    PetscErrorCode apply_levels(const Mat& W, Vec v, Vec w, CellField& field, int iterations) const;

    const MeshGraph& graph_;
    FieldRule rule_;
};

#endif // GRAPH_SMOOTHER_HPP
