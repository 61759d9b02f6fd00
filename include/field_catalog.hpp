#ifndef FIELD_CATALOG_HPP
#define FIELD_CATALOG_HPP

#include <string>
#include <vector>

/**
 * @brief Per-field behaviour of the remap, carried as data
 *
 * Every target field the tool can fill has exactly one FieldRule. The stages
 * look the rule up by name instead of branching on the name themselves, so an
 * unknown field fails in one place (find_field_rule).
 */

// How a value read from the source is turned into the stored value.
enum class TransferTransform {
    Copy,               // store as given
    Exponential,        // store exp(v) * multiplier
    SurfacePreserving   // thickness: keep thickness + bedTopography constant
};

// Vertical placement of the target levels relative to the source levels.
enum class VerticalStaggering {
    Interfaces,   // target level k <- source level n-k-1
    Layers        // target level k <- source level n-k (source level 0 is basal)
};

// Rule used when a cell value is rebuilt from its neighbours.
enum class NeighborRule {
    Minimum,
    InverseDistance
};

struct FieldRule {
    std::string name;          // target field name
    std::string source_name;   // variable name on the source mesh
    double input_scale = 1.0;  // unit conversion applied on ingestion
    VerticalStaggering staggering = VerticalStaggering::Interfaces;
    TransferTransform transform = TransferTransform::Copy;
    double transform_multiplier = 1.0;
    bool extrapolate = true;
    bool smoothable = false;
    NeighborRule smoothing_rule = NeighborRule::Minimum;
};

// Name of the bed elevation field coupled to thickness.
constexpr const char* kBedTopographyField = "bedTopography";
constexpr const char* kThicknessField = "thickness";

const std::vector<FieldRule>& field_catalog();

// Throws ConfigurationError for names outside the catalog.
const FieldRule& find_field_rule(const std::string& name);

NeighborRule parse_neighbor_rule(const std::string& token);
const char* neighbor_rule_name(NeighborRule rule);

#endif // FIELD_CATALOG_HPP
