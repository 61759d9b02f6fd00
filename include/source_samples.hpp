#pragma once

#include <string>
#include <vector>

// Storage order of the vertical levels in a raw source dump.
enum class SourceOrdering {
    LayerWise = 0,   // stride = nodes per level; sample = level*stride + node
    ColumnWise = 1   // stride = number of levels; sample = node*stride + level
};

/**
 * @brief Source-mesh samples, de-strided into levels
 *
 * Raw values are stored as read; coordinates and values are scaled once on
 * ingestion (km -> m for coordinates, the field's input_scale for values).
 */
class SourceSamples {
public:
    SourceSamples() = default;

    // Throws ConfigurationError for an invalid ordering or a stride that does not divide the sample count.
    SourceSamples(SourceOrdering ordering, int stride,
                  std::vector<double> x, std::vector<double> y, std::vector<double> values);

    /**
     * @brief Read the ASCII sample file
     *
     *   ordering <0|1>
     *   stride <n>
     *   x y value        (one row per raw sample, '#' starts a comment)
     */
    static SourceSamples load(const std::string& path, double coord_scale, double value_scale);

    SourceOrdering ordering() const { return ordering_; }
    size_t num_nodes() const { return num_nodes_; }
    int num_levels() const { return num_levels_; }
    size_t num_raw() const { return values_.size(); }

    // Coordinates of the level-0 samples, one per source node.
    std::vector<double> node_x() const;
    std::vector<double> node_y() const;

    std::vector<double> level_values(int level) const;

private:
    size_t raw_index(size_t node, int level) const;

    SourceOrdering ordering_ = SourceOrdering::ColumnWise;
    int stride_ = 1;
    size_t num_nodes_ = 0;
    int num_levels_ = 0;
    std::vector<double> x_, y_, values_;
};

SourceOrdering parse_source_ordering(int indicator);
