#ifndef TARGET_FIELDS_HPP
#define TARGET_FIELDS_HPP

#include <map>
#include <string>
#include <vector>

class Mesh;

// Per-cell scalar with n_levels values per cell, stored cell-major.
struct CellField {
    std::string name;
    int n_levels = 1;
    std::vector<double> values;

    CellField() = default;
    CellField(const std::string& name_, size_t num_cells, int levels = 1, double fill = 0.0)
        : name(name_), n_levels(levels), values(num_cells * levels, fill) {}

    size_t num_cells() const { return n_levels > 0 ? values.size() / n_levels : 0; }
    double& at(size_t cell, int level = 0) { return values[cell * n_levels + level]; }
    double at(size_t cell, int level = 0) const { return values[cell * n_levels + level]; }
};

using ActiveMask = std::vector<bool>;

/**
 * @brief Named fields of the target mesh
 *
 * Field lookups by name throw ConfigurationError when the field is absent.
 */
class TargetFieldSet {
public:
    TargetFieldSet() = default;
    explicit TargetFieldSet(size_t num_cells) : num_cells_(num_cells) {}

    // Collect the $ElementData views of a mesh; cells without a value read 0.
    static TargetFieldSet from_mesh(const Mesh& mesh);

    size_t num_cells() const { return num_cells_; }
    bool has(const std::string& name) const { return fields_.count(name) != 0; }

    CellField& get(const std::string& name);
    const CellField& get(const std::string& name) const;

    CellField& add(const std::string& name, int levels = 1, double fill = 0.0);

    const std::map<std::string, CellField>& fields() const { return fields_; }

private:
    size_t num_cells_ = 0;
    std::map<std::string, CellField> fields_;
};

#endif // TARGET_FIELDS_HPP
