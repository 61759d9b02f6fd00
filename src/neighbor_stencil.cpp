#include "neighbor_stencil.hpp"
#include "mesh_graph.hpp"
#include "remap_errors.hpp"

#include <iomanip>
#include <sstream>

int NeighborStencil::build(NeighborRule rule, const MeshGraph& graph, int cell_id, const ActiveMask& mask)
{
    cell = cell_id;
    donors.clear();
    for (int nb : graph.neighbors(cell_id)) {
        if (mask[nb]) donors.push_back(nb);
    }

    const int n = static_cast<int>(donors.size());
    if (rule != NeighborRule::InverseDistance || n == 0) {
        weights.resize(0);
        return n;
    }

    weights.resize(n);
    for (int k = 0; k < n; ++k) {
        const double d = graph.distance(cell_id, donors[k]);
        if (!(d > 0.0)) {
            std::stringstream ss;
            ss << std::setprecision(10) << "cells " << cell_id + 1 << " and " << donors[k] + 1
               << " share the centroid (" << graph.x(cell_id) << ", " << graph.y(cell_id)
               << "); inverse-distance weight undefined";
            throw GeometryError(ss.str());
        }
        weights(k) = 1.0 / d;
    }
    weights /= weights.sum();
    return n;
}

double NeighborStencil::apply(NeighborRule rule, const CellField& field, int level) const
{
    const int n = static_cast<int>(donors.size());
    Eigen::VectorXd v(n);
    for (int k = 0; k < n; ++k) v(k) = field.at(donors[k], level);

    if (rule == NeighborRule::Minimum) {
        return v.minCoeff();
    }
    return weights.dot(v);
}
