#ifndef CORRESPONDENCE_HPP
#define CORRESPONDENCE_HPP

#include <iosfwd>
#include <string>
#include <vector>

class MeshGraph;

enum class CorrespondenceMethod {
    PrecomputedId,  // "id": read a saved map
    Coordinate,     // "coord": relative-tolerance coordinate match
    Nearest         // "nearest": closest target centroid
};

CorrespondenceMethod parse_correspondence_method(const std::string& token);

/**
 * @brief Source sample index -> 0-based target cell id
 *
 * On disk the map is the sample count followed by one 1-based cell id per line.
 */
class CorrespondenceMap {
public:
    CorrespondenceMap() = default;
    explicit CorrespondenceMap(std::vector<int> cells) : cells_(std::move(cells)) {}

    size_t size() const { return cells_.size(); }
    bool empty() const { return cells_.empty(); }
    int target_cell(size_t sample) const { return cells_[sample]; }
    const std::vector<int>& cells() const { return cells_; }

    void save(std::ostream& out) const;
    bool save(const std::string& path) const;

    bool operator==(const CorrespondenceMap& other) const { return cells_ == other.cells_; }
    bool operator!=(const CorrespondenceMap& other) const { return !(*this == other); }

private:
    std::vector<int> cells_;
};

/**
 * @brief Resolves which target cell each source sample belongs to
 *
 * The coordinate strategy is the ground truth but costs O(samples * cells) and
 * is fragile where a coordinate is close to zero; its result is meant to be
 * saved and re-read with read_precomputed on later runs.
 */
class CorrespondenceResolver {
public:
    static constexpr double kRelativeTolerance = 1e-3;
    static constexpr double kOriginGuard = 1e-10;

    explicit CorrespondenceResolver(const MeshGraph& graph) : graph_(graph) {}

    // Throws CorrespondenceError when a sample matches no cell in both x and y.
    CorrespondenceMap match_coordinates(const std::vector<double>& sx,
                                        const std::vector<double>& sy) const;

    // max_distance <= 0 disables the distance check.
    CorrespondenceMap match_nearest(const std::vector<double>& sx,
                                    const std::vector<double>& sy,
                                    double max_distance = 0.0) const;

    // Throws CorrespondenceError when the declared count differs from num_samples.
    CorrespondenceMap read_precomputed(std::istream& in, size_t num_samples) const;
    CorrespondenceMap read_precomputed(const std::string& path, size_t num_samples) const;

private:
    const MeshGraph& graph_;
};

#endif // CORRESPONDENCE_HPP
