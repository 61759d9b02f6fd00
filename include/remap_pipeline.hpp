#ifndef REMAP_PIPELINE_HPP
#define REMAP_PIPELINE_HPP

#include "correspondence.hpp"
#include "extrapolator.hpp"
#include "field_catalog.hpp"
#include "mask_builder.hpp"
#include "target_fields.hpp"

#include <string>

class MeshGraph;
class SourceSamples;

struct RemapOptions {
    std::string variable;
    CorrespondenceMethod method = CorrespondenceMethod::PrecomputedId;
    std::string id_map_path;      // read by the precomputed method
    double max_distance = 0.0;    // nearest method only; <= 0 disables the check
    MaskScheme mask_scheme = MaskScheme::Grounded;
    NeighborRule extrapolation = NeighborRule::Minimum;
    int smooth_iterations = 3;
};

struct RemapReport {
    CorrespondenceMap correspondence;
    int levels_written = 0;
    bool extrapolated = false;
    ExtrapolationReport extrapolation;
    ActiveMask original_mask;   // before extrapolation
    ActiveMask final_mask;
};

/**
 * @brief Correspondence -> transfer -> mask -> extrapolation -> smoothing
 *
 * The options are checked in the constructor so a bad field or selector fails
 * before anything is read or written. Any RemapError thrown by run() leaves the
 * target field set partially updated and must not be persisted.
 */
class RemapPipeline {
public:
    RemapPipeline(const MeshGraph& graph, const RemapOptions& options);

    CorrespondenceMap resolve(const SourceSamples& samples) const;
    RemapReport run(const SourceSamples& samples, TargetFieldSet& target) const;

    const FieldRule& rule() const { return rule_; }
    const RemapOptions& options() const { return options_; }

private:
    const MeshGraph& graph_;
    RemapOptions options_;
    FieldRule rule_;
};

#endif // REMAP_PIPELINE_HPP
