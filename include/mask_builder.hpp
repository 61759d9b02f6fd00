#pragma once

#include "target_fields.hpp"
#include <string>

enum class MaskScheme {
    Grounded,  // "grd": ice resting on bedrock
    AllIce     // "all": any positive thickness
};

MaskScheme parse_mask_scheme(const std::string& token);

// Marks the cells whose current value is trusted as a donor for extrapolation.
class MaskBuilder {
public:
    static constexpr double kIceDensity = 910.0;     // kg/m^3
    static constexpr double kOceanDensity = 1028.0;  // kg/m^3

    explicit MaskBuilder(MaskScheme scheme) : scheme_(scheme) {}

    // Reads thickness and, when present, bedTopography (taken as 0 otherwise).
    ActiveMask build(const TargetFieldSet& fields) const;

    MaskScheme scheme() const { return scheme_; }

private:
    MaskScheme scheme_;
};
