#include "field_transfer.hpp"
#include "correspondence.hpp"
#include "remap_errors.hpp"
#include "source_samples.hpp"
#include "target_fields.hpp"

#include <cmath>
#include <iostream>
#include <sstream>

int FieldTransfer::source_level(const FieldRule& rule, int target_level, int n_target_levels)
{
    if (rule.staggering == VerticalStaggering::Layers) {
        return n_target_levels - target_level;
    }
    return n_target_levels - target_level - 1;
}

double FieldTransfer::transformed(const FieldRule& rule, double v)
{
    switch (rule.transform) {
        case TransferTransform::Exponential:
            return std::exp(v) * rule.transform_multiplier;
        case TransferTransform::Copy:
        case TransferTransform::SurfacePreserving:
            break;
    }
    return v;
}

void FieldTransfer::transfer_level(const FieldRule& rule,
                                   const CorrespondenceMap& map,
                                   const std::vector<double>& values,
                                   int target_level,
                                   TargetFieldSet& target) const
{
    if (!target.has(rule.name)) {
        throw ConfigurationError("unsupported variable '" + rule.name +
                                 "' requested: the target holds no such field");
    }
    if (map.size() != values.size()) {
        std::stringstream ss;
        ss << "map has " << map.size() << " entries for " << values.size() << " source values";
        throw CorrespondenceError(ss.str());
    }

    CellField& field = target.get(rule.name);
    if (target_level < 0 || target_level >= field.n_levels) {
        std::stringstream ss;
        ss << "level " << target_level << " outside field " << rule.name
           << " with " << field.n_levels << " levels";
        throw ConfigurationError(ss.str());
    }

    // Keep the surface elevation: bed moves by the thickness change. The surface
    // is taken from the pre-transfer state, so repeated hits on a cell agree.
    if (rule.transform == TransferTransform::SurfacePreserving && target.has(kBedTopographyField)) {
        CellField& bed = target.get(kBedTopographyField);
        const CellField h_old = field;
        const CellField bed_old = bed;
        for (size_t i = 0; i < map.size(); ++i) {
            const int c = map.target_cell(i);
            bed.at(c) = h_old.at(c, target_level) + bed_old.at(c) - values[i];
        }
    }

    for (size_t i = 0; i < map.size(); ++i) {
        field.at(map.target_cell(i), target_level) = transformed(rule, values[i]);
    }
}

int FieldTransfer::transfer(const FieldRule& rule,
                            const CorrespondenceMap& map,
                            const SourceSamples& samples,
                            TargetFieldSet& target) const
{
    if (!target.has(rule.name)) {
        throw ConfigurationError("unsupported variable '" + rule.name +
                                 "' requested: the target holds no such field");
    }
    const int n_levels = target.get(rule.name).n_levels;

    for (int level = 0; level < n_levels; ++level) {
        const int src = source_level(rule, level, n_levels);
        std::cout << "[TRANSFER] " << rule.name << " level " << level
                  << " <- source level " << src << "\n";
        transfer_level(rule, map, samples.level_values(src), level, target);
    }
    return n_levels;
}
