#include "source_samples.hpp"
#include "remap_errors.hpp"

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

SourceOrdering parse_source_ordering(int indicator)
{
    if (indicator == 0) return SourceOrdering::LayerWise;
    if (indicator == 1) return SourceOrdering::ColumnWise;
    throw ConfigurationError("invalid ordering " + std::to_string(indicator) +
                             " in source samples (must be 0 or 1)");
}

SourceSamples::SourceSamples(SourceOrdering ordering, int stride,
                             std::vector<double> x, std::vector<double> y,
                             std::vector<double> values)
    : ordering_(ordering), stride_(stride),
      x_(std::move(x)), y_(std::move(y)), values_(std::move(values))
{
    if (x_.size() != values_.size() || y_.size() != values_.size()) {
        throw ConfigurationError("source coordinate and value counts differ");
    }
    const size_t total = values_.size();
    if (stride_ <= 0 || total == 0 || total % static_cast<size_t>(stride_) != 0) {
        std::stringstream ss;
        ss << "stride " << stride_ << " does not divide " << total << " source samples";
        throw ConfigurationError(ss.str());
    }

    if (ordering_ == SourceOrdering::ColumnWise) {
        num_levels_ = stride_;
        num_nodes_ = total / stride_;
        std::cout << "[SOURCE] column wise pattern: ";
    } else {
        num_nodes_ = static_cast<size_t>(stride_);
        num_levels_ = static_cast<int>(total / stride_);
        std::cout << "[SOURCE] layer wise pattern: ";
    }
    std::cout << num_nodes_ << " nodes x " << num_levels_ << " levels\n";
}

SourceSamples SourceSamples::load(const std::string& path, double coord_scale, double value_scale)
{
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open source sample file: " + path);
    }

    std::optional<int> ordering;
    std::optional<int> stride;
    std::vector<double> x, y, v;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream iss(line);
        std::string first;
        if (!(iss >> first)) continue;

        if (first == "ordering") {
            int value;
            if (!(iss >> value)) throw ConfigurationError("malformed ordering line in " + path);
            ordering = value;
        } else if (first == "stride") {
            int value;
            if (!(iss >> value)) throw ConfigurationError("malformed stride line in " + path);
            stride = value;
        } else {
            double xs, ys, vs;
            std::istringstream row(line);
            if (!(row >> xs >> ys >> vs)) {
                throw std::runtime_error("Malformed sample at " + path + ":" + std::to_string(line_no));
            }
            x.push_back(xs * coord_scale);
            y.push_back(ys * coord_scale);
            v.push_back(vs * value_scale);
        }
    }

    if (!ordering || !stride) {
        throw ConfigurationError("source sample file " + path + " lacks ordering/stride header");
    }

    std::cout << "[SOURCE] " << v.size() << " raw samples from " << path << "\n";
    return SourceSamples(parse_source_ordering(*ordering), *stride,
                         std::move(x), std::move(y), std::move(v));
}

size_t SourceSamples::raw_index(size_t node, int level) const
{
    if (ordering_ == SourceOrdering::ColumnWise) {
        return node * static_cast<size_t>(stride_) + static_cast<size_t>(level);
    }
    return static_cast<size_t>(level) * static_cast<size_t>(stride_) + node;
}

std::vector<double> SourceSamples::node_x() const
{
    std::vector<double> out(num_nodes_);
    for (size_t i = 0; i < num_nodes_; ++i) out[i] = x_[raw_index(i, 0)];
    return out;
}

std::vector<double> SourceSamples::node_y() const
{
    std::vector<double> out(num_nodes_);
    for (size_t i = 0; i < num_nodes_; ++i) out[i] = y_[raw_index(i, 0)];
    return out;
}

std::vector<double> SourceSamples::level_values(int level) const
{
    if (level < 0 || level >= num_levels_) {
        std::stringstream ss;
        ss << "source level " << level << " outside [0, " << num_levels_ - 1 << "]";
        throw ConfigurationError(ss.str());
    }
    std::vector<double> out(num_nodes_);
    for (size_t i = 0; i < num_nodes_; ++i) out[i] = values_[raw_index(i, level)];
    return out;
}
