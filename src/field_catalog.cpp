#include "field_catalog.hpp"
#include "remap_errors.hpp"

#include <sstream>

namespace {

constexpr double kSecondsPerYear = 60.0 * 60.0 * 24.0 * 365.0;

FieldRule make_rule(const std::string& name, const std::string& source_name)
{
    FieldRule rule;
    rule.name = name;
    rule.source_name = source_name;
    return rule;
}

std::vector<FieldRule> build_catalog()
{
    std::vector<FieldRule> rules;

    FieldRule beta = make_rule("beta", "basal_friction");
    beta.transform = TransferTransform::Exponential;
    beta.transform_multiplier = 1000.0;
    beta.smoothable = true;
    beta.smoothing_rule = NeighborRule::Minimum;
    rules.push_back(beta);

    // Ice thickness below the waterline is a real zero, never a gap.
    FieldRule thickness = make_rule(kThicknessField, "ice_thickness");
    thickness.input_scale = 1000.0;  // km -> m
    thickness.transform = TransferTransform::SurfacePreserving;
    thickness.extrapolate = false;
    rules.push_back(thickness);

    FieldRule stiffness = make_rule("stiffnessFactor", "stiffening_factor");
    stiffness.smoothable = true;
    stiffness.smoothing_rule = NeighborRule::InverseDistance;
    rules.push_back(stiffness);

    rules.push_back(make_rule("basalTemperature", "temperature"));

    FieldRule temperature = make_rule("temperature", "temperature");
    temperature.staggering = VerticalStaggering::Layers;
    rules.push_back(temperature);

    rules.push_back(make_rule("surfaceTemperature", "surface_air_temperature"));

    FieldRule ux = make_rule("uReconstructX", "solution_1");
    ux.input_scale = 1.0 / kSecondsPerYear;  // m/yr -> m/s
    rules.push_back(ux);

    FieldRule uy = make_rule("uReconstructY", "solution_2");
    uy.input_scale = 1.0 / kSecondsPerYear;
    rules.push_back(uy);

    return rules;
}

} // namespace

const std::vector<FieldRule>& field_catalog()
{
    static const std::vector<FieldRule> catalog = build_catalog();
    return catalog;
}

const FieldRule& find_field_rule(const std::string& name)
{
    for (const auto& rule : field_catalog()) {
        if (rule.name == name) return rule;
    }
    std::stringstream ss;
    ss << "unsupported field '" << name << "'. Supported fields:";
    for (const auto& rule : field_catalog()) {
        ss << ' ' << rule.name;
    }
    throw ConfigurationError(ss.str());
}

NeighborRule parse_neighbor_rule(const std::string& token)
{
    if (token == "min") return NeighborRule::Minimum;
    if (token == "idw") return NeighborRule::InverseDistance;
    throw ConfigurationError("unknown extrapolation scheme '" + token + "' (expected min or idw)");
}

const char* neighbor_rule_name(NeighborRule rule)
{
    switch (rule) {
        case NeighborRule::Minimum:         return "min";
        case NeighborRule::InverseDistance: return "idw";
    }
    return "??";
}
