#ifndef EXTRAPOLATOR_HPP
#define EXTRAPOLATOR_HPP

#include "field_catalog.hpp"
#include "target_fields.hpp"
#include <vector>

class MeshGraph;

struct ExtrapolationReport {
    int passes = 0;
    size_t cells_filled = 0;
    std::vector<size_t> remaining_after_pass;  // inactive cells left after each pass
};

/**
 * @brief Flood fill of inactive cells from active neighbours
 *
 * Each pass works on a snapshot of the mask taken at its start, so the active
 * region grows by exactly one adjacency ring per pass and values written in a
 * pass are never read as donors within that pass. Every level of the field is
 * filled with the same donors.
 */
class FloodFillExtrapolator {
public:
    FloodFillExtrapolator(const MeshGraph& graph, NeighborRule rule)
        : graph_(graph), rule_(rule) {}

    /**
     * @brief Run passes until every cell is active
     * @param field values, overwritten at inactive cells
     * @param mask  in: current active cells; out: all true
     *
     * Throws TopologyError when a pass activates nothing while inactive cells
     * remain (a region unreachable from any active cell), GeometryError for a
     * zero-distance donor under the inverse-distance rule.
     */
    ExtrapolationReport run(CellField& field, ActiveMask& mask) const;

    // One ring; returns the number of cells activated. frozen is left untouched.
    size_t sweep(CellField& field, const ActiveMask& frozen, ActiveMask& next) const;

    NeighborRule rule() const { return rule_; }

private:
    const MeshGraph& graph_;
    NeighborRule rule_;
};

#endif // EXTRAPOLATOR_HPP
