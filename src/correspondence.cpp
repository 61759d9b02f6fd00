#include "correspondence.hpp"
#include "mesh_graph.hpp"
#include "remap_errors.hpp"

#include <CGAL/Exact_predicates_inexact_constructions_kernel.h>
#include <CGAL/Orthogonal_k_neighbor_search.h>
#include <CGAL/Search_traits_2.h>
#include <CGAL/Search_traits_adapter.h>
#include <CGAL/property_map.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <utility>

typedef CGAL::Exact_predicates_inexact_constructions_kernel K;
typedef K::Point_2 Point;
typedef std::pair<Point, int> PointWithCell;
typedef CGAL::Search_traits_adapter<PointWithCell,
                                    CGAL::First_of_pair_property_map<PointWithCell>,
                                    CGAL::Search_traits_2<K> > CellTraits;
typedef CGAL::Orthogonal_k_neighbor_search<CellTraits> NeighborSearch;
typedef NeighborSearch::Tree CellTree;

CorrespondenceMethod parse_correspondence_method(const std::string& token)
{
    if (token == "id") return CorrespondenceMethod::PrecomputedId;
    if (token == "coord") return CorrespondenceMethod::Coordinate;
    if (token == "nearest") return CorrespondenceMethod::Nearest;
    throw ConfigurationError("unsupported conversion method '" + token +
                             "' (expected id, coord or nearest)");
}

void CorrespondenceMap::save(std::ostream& out) const
{
    out << cells_.size() << "\n";
    for (int c : cells_) out << c + 1 << "\n";
}

bool CorrespondenceMap::save(const std::string& path) const
{
    std::ofstream out(path);
    if (!out) return false;
    save(out);
    return static_cast<bool>(out);
}

CorrespondenceMap CorrespondenceResolver::match_coordinates(const std::vector<double>& sx,
                                                            const std::vector<double>& sy) const
{
    if (sx.size() != sy.size()) {
        throw CorrespondenceError("source x and y arrays differ in length");
    }

    const int n_cells = static_cast<int>(graph_.num_cells());
    std::vector<int> cells(sx.size(), -1);
    std::vector<int> index_x, index_y, both;

    for (size_t i = 0; i < sx.size(); ++i) {
        index_x.clear();
        index_y.clear();
        for (int c = 0; c < n_cells; ++c) {
            const double xc = graph_.x(c);
            const double yc = graph_.y(c);
            if (std::abs(xc - sx[i]) / (std::abs(xc) + kOriginGuard) < kRelativeTolerance)
                index_x.push_back(c);
            if (std::abs(yc - sy[i]) / (std::abs(yc) + kOriginGuard) < kRelativeTolerance)
                index_y.push_back(c);
        }

        // Both candidate lists are ascending; the first common id wins.
        both.clear();
        std::set_intersection(index_x.begin(), index_x.end(),
                              index_y.begin(), index_y.end(),
                              std::back_inserter(both));
        if (both.empty()) {
            std::stringstream ss;
            ss << std::setprecision(10) << "source sample " << i << " at (" << sx[i] << ", " << sy[i]
               << ") matches no target cell (" << index_x.size() << " x-candidates, "
               << index_y.size() << " y-candidates); meshes do not overlap";
            throw CorrespondenceError(ss.str());
        }
        cells[i] = both.front();
    }

    std::cout << "[CORR] Coordinate match resolved " << cells.size() << " samples\n";
    return CorrespondenceMap(std::move(cells));
}

CorrespondenceMap CorrespondenceResolver::match_nearest(const std::vector<double>& sx,
                                                        const std::vector<double>& sy,
                                                        double max_distance) const
{
    if (sx.size() != sy.size()) {
        throw CorrespondenceError("source x and y arrays differ in length");
    }
    if (graph_.num_cells() == 0) {
        throw CorrespondenceError("target mesh has no cells");
    }

    std::vector<PointWithCell> centroids;
    centroids.reserve(graph_.num_cells());
    for (size_t c = 0; c < graph_.num_cells(); ++c) {
        const int id = static_cast<int>(c);
        centroids.emplace_back(Point(graph_.x(id), graph_.y(id)), id);
    }
    CellTree tree(centroids.begin(), centroids.end());

    std::vector<int> cells(sx.size(), -1);
    double worst = 0.0;
    for (size_t i = 0; i < sx.size(); ++i) {
        NeighborSearch search(tree, Point(sx[i], sy[i]), 1);
        const auto& hit = *search.begin();
        const double dist = std::sqrt(hit.second);  // squared Euclidean
        if (max_distance > 0.0 && dist > max_distance) {
            std::stringstream ss;
            ss << std::setprecision(10) << "source sample " << i << " at (" << sx[i] << ", " << sy[i]
               << ") is " << dist << " from the nearest cell centroid (limit " << max_distance << ")";
            throw CorrespondenceError(ss.str());
        }
        worst = std::max(worst, dist);
        cells[i] = hit.first.second;
    }

    std::cout << "[CORR] Nearest-centroid match resolved " << cells.size()
              << " samples, max distance " << worst << "\n";
    return CorrespondenceMap(std::move(cells));
}

CorrespondenceMap CorrespondenceResolver::read_precomputed(std::istream& in, size_t num_samples) const
{
    long long declared = -1;
    if (!(in >> declared)) {
        throw CorrespondenceError("id map is empty or unreadable");
    }
    if (declared < 0 || static_cast<size_t>(declared) != num_samples) {
        std::stringstream ss;
        ss << "id map declares " << declared << " entries but the source has "
           << num_samples << " samples per level";
        throw CorrespondenceError(ss.str());
    }

    const long long n_cells = static_cast<long long>(graph_.num_cells());
    std::vector<int> cells;
    cells.reserve(num_samples);
    long long id = 0;
    while (cells.size() < num_samples && in >> id) {
        if (id < 1 || id > n_cells) {
            std::stringstream ss;
            ss << "id map entry " << cells.size() << " is cell " << id
               << ", outside [1, " << n_cells << "]";
            throw CorrespondenceError(ss.str());
        }
        cells.push_back(static_cast<int>(id - 1));
    }
    if (cells.size() != num_samples) {
        std::stringstream ss;
        ss << "id map holds " << cells.size() << " entries, declared " << declared;
        throw CorrespondenceError(ss.str());
    }
    return CorrespondenceMap(std::move(cells));
}

CorrespondenceMap CorrespondenceResolver::read_precomputed(const std::string& path, size_t num_samples) const
{
    std::ifstream in(path);
    if (!in) {
        throw CorrespondenceError("cannot open id map " + path);
    }
    CorrespondenceMap map = read_precomputed(in, num_samples);
    std::cout << "[CORR] Read " << map.size() << " ids from " << path << "\n";
    return map;
}
