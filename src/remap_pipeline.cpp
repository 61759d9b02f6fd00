#include "remap_pipeline.hpp"
#include "field_transfer.hpp"
#include "graph_smoother.hpp"
#include "mesh_graph.hpp"
#include "remap_errors.hpp"
#include "source_samples.hpp"

#include <iostream>
#include <sstream>

RemapPipeline::RemapPipeline(const MeshGraph& graph, const RemapOptions& options)
    : graph_(graph), options_(options), rule_(find_field_rule(options.variable))
{
    GraphSmoother::validate(rule_, options_.smooth_iterations);
    if (options_.method == CorrespondenceMethod::PrecomputedId && options_.id_map_path.empty()) {
        throw ConfigurationError("the id method needs an id map file");
    }
}

CorrespondenceMap RemapPipeline::resolve(const SourceSamples& samples) const
{
    CorrespondenceResolver resolver(graph_);
    switch (options_.method) {
        case CorrespondenceMethod::Coordinate:
            std::cout << "[CORR] use coordinate method\n";
            return resolver.match_coordinates(samples.node_x(), samples.node_y());
        case CorrespondenceMethod::Nearest:
            std::cout << "[CORR] use nearest-centroid method\n";
            return resolver.match_nearest(samples.node_x(), samples.node_y(), options_.max_distance);
        case CorrespondenceMethod::PrecomputedId:
            break;
    }
    std::cout << "[CORR] use global id method\n";
    return resolver.read_precomputed(options_.id_map_path, samples.num_nodes());
}

RemapReport RemapPipeline::run(const SourceSamples& samples, TargetFieldSet& target) const
{
    if (target.num_cells() != graph_.num_cells()) {
        std::stringstream ss;
        ss << "target fields cover " << target.num_cells() << " cells, graph has " << graph_.num_cells();
        throw TopologyError(ss.str());
    }
    if (!target.has(rule_.name)) {
        throw ConfigurationError("unsupported variable '" + rule_.name +
                                 "' requested: the target holds no such field");
    }

    RemapReport report;

    // --- 1. Correspondence (fails before any field is written) ---
    report.correspondence = resolve(samples);

    // --- 2. Transfer ---
    FieldTransfer transfer;
    report.levels_written = transfer.transfer(rule_, report.correspondence, samples, target);
    std::cout << "[TRANSFER] Wrote " << report.correspondence.size() << " samples into "
              << report.levels_written << " level(s) of " << rule_.name << "\n";

    // --- 3. Mask ---
    MaskBuilder masks(options_.mask_scheme);
    report.original_mask = masks.build(target);
    ActiveMask current = report.original_mask;

    CellField& field = target.get(rule_.name);

    // --- 4. Extrapolation ---
    if (!rule_.extrapolate) {
        std::cout << "[EXTRAP] Do not do extrapolation for " << rule_.name << "!\n";
    } else {
        std::cout << "[EXTRAP] Start extrapolation ("
                  << neighbor_rule_name(options_.extrapolation) << ")\n";
        FloodFillExtrapolator extrapolator(graph_, options_.extrapolation);
        report.extrapolation = extrapolator.run(field, current);
        report.extrapolated = true;
    }

    // --- 5. Smoothing ---
    GraphSmoother smoother(graph_, rule_);
    smoother.smooth(field, report.original_mask, current, options_.smooth_iterations);

    report.final_mask = current;
    std::cout << "[REMAP] Extrapolation and smoothing finished!\n";
    return report;
}
