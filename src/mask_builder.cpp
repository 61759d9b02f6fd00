#include "mask_builder.hpp"
#include "field_catalog.hpp"
#include "remap_errors.hpp"

#include <iostream>

MaskScheme parse_mask_scheme(const std::string& token)
{
    if (token == "grd") return MaskScheme::Grounded;
    if (token == "all") return MaskScheme::AllIce;
    throw ConfigurationError("wrong masking scheme '" + token + "' (expected all or grd)");
}

ActiveMask MaskBuilder::build(const TargetFieldSet& fields) const
{
    const CellField& thickness = fields.get(kThicknessField);
    const CellField* bed = fields.has(kBedTopographyField) ? &fields.get(kBedTopographyField) : nullptr;

    const size_t n = fields.num_cells();
    ActiveMask mask(n, false);
    size_t active = 0;
    for (size_t c = 0; c < n; ++c) {
        const double h = thickness.at(c);
        if (scheme_ == MaskScheme::Grounded) {
            const double b = bed ? bed->at(c) : 0.0;
            mask[c] = h * kIceDensity / kOceanDensity + b > 0.0;
        } else {
            mask[c] = h > 0.0;
        }
        if (mask[c]) ++active;
    }

    std::cout << "[MASK] " << (scheme_ == MaskScheme::Grounded ? "grounded" : "all-ice")
              << " mask: " << active << " of " << n << " cells active\n";
    return mask;
}
