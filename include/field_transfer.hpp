#ifndef FIELD_TRANSFER_HPP
#define FIELD_TRANSFER_HPP

#include "field_catalog.hpp"
#include <vector>

class CorrespondenceMap;
class SourceSamples;
class TargetFieldSet;

/**
 * @brief Writes source samples into the target field at corresponded cells
 *
 * Cells that no sample maps to keep whatever value the target already holds;
 * filling them is left to the extrapolation stage.
 */
class FieldTransfer {
public:
    FieldTransfer() = default;

    /**
     * @brief Source level that feeds target level target_level
     *
     * The source stores its levels bottom-up, the target top-down. For
     * layer-centred fields source level 0 is the basal sublevel, which has
     * its own target field and is skipped.
     */
    static int source_level(const FieldRule& rule, int target_level, int n_target_levels);

    /**
     * @brief Write one target level
     * @param rule          catalog entry of the target field
     * @param map           sample -> cell correspondence
     * @param values        one value per sample, already unit-converted
     * @param target_level  level of the target field to write
     * @param target        target field set (the field and, for thickness, bedTopography)
     */
    void transfer_level(const FieldRule& rule,
                        const CorrespondenceMap& map,
                        const std::vector<double>& values,
                        int target_level,
                        TargetFieldSet& target) const;

    // Write every level of the target field; returns the number of levels written.
    int transfer(const FieldRule& rule,
                 const CorrespondenceMap& map,
                 const SourceSamples& samples,
                 TargetFieldSet& target) const;

private:
    static double transformed(const FieldRule& rule, double v);
};

#endif // FIELD_TRANSFER_HPP
