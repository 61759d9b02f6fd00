#include "extrapolator.hpp"
#include "mesh_graph.hpp"
#include "neighbor_stencil.hpp"
#include "remap_errors.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

size_t count_inactive(const ActiveMask& mask)
{
    return static_cast<size_t>(std::count(mask.begin(), mask.end(), false));
}

} // namespace

size_t FloodFillExtrapolator::sweep(CellField& field, const ActiveMask& frozen, ActiveMask& next) const
{
    NeighborStencil stencil;
    size_t activated = 0;
    const int n = static_cast<int>(graph_.num_cells());
    for (int c = 0; c < n; ++c) {
        if (frozen[c]) continue;
        if (stencil.build(rule_, graph_, c, frozen) == 0) continue;  // retried next pass

        for (int level = 0; level < field.n_levels; ++level) {
            field.at(c, level) = stencil.apply(rule_, field, level);
        }
        next[c] = true;
        ++activated;
    }
    return activated;
}

ExtrapolationReport FloodFillExtrapolator::run(CellField& field, ActiveMask& mask) const
{
    ExtrapolationReport report;
    const size_t n = graph_.num_cells();
    if (mask.size() != n || field.num_cells() != n) {
        std::stringstream ss;
        ss << "mask (" << mask.size() << ") and field (" << field.num_cells()
           << ") do not match the " << n << " graph cells";
        throw TopologyError(ss.str());
    }

    ActiveMask next = mask;
    size_t remaining = count_inactive(mask);
    while (remaining > 0) {
        const ActiveMask frozen = next;
        const size_t activated = sweep(field, frozen, next);
        if (activated == 0) {
            mask = next;
            std::stringstream ss;
            ss << remaining << " of " << n << " cells cannot be reached from any active cell";
            throw TopologyError(ss.str());
        }

        remaining -= activated;
        report.cells_filled += activated;
        report.remaining_after_pass.push_back(remaining);
        ++report.passes;
        std::cout << "[EXTRAP] " << std::setw(8) << remaining
                  << " cells left for extrapolation in total " << std::setw(8) << n << " cells\n";
    }

    mask = next;
    return report;
}
