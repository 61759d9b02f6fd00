/**
 * test_field_transfer.cpp — Catalog, de-striding, transfer and masks
 *
 *   - catalog lookup and level mapping
 *   - column-wise and layer-wise dumps yield the same levels
 *   - exponential transform, surface-preserving thickness, layered temperature
 *   - grounded / all-ice mask predicates
 */

#include "correspondence.hpp"
#include "field_catalog.hpp"
#include "field_transfer.hpp"
#include "mask_builder.hpp"
#include "remap_errors.hpp"
#include "source_samples.hpp"
#include "target_fields.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& what)
{
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << what << "\n";
    if (!ok) ++failures;
}

template <class E, class F>
static bool throws(F&& f)
{
    try {
        f();
    } catch (const E& e) {
        std::cout << "  expected: " << e.what() << "\n";
        return true;
    } catch (const std::exception& e) {
        std::cerr << "  unexpected: " << e.what() << "\n";
    }
    return false;
}

static bool nearly_equal(double a, double b, double tol = 1e-12)
{
    return std::abs(a - b) <= tol * std::max(1.0, std::max(std::abs(a), std::abs(b)));
}

int main()
{
    std::cout << "=== FIELD TRANSFER TEST ===\n";

    // --- Catalog ---
    check(find_field_rule("beta").transform == TransferTransform::Exponential, "beta is exponential");
    check(!find_field_rule("thickness").extrapolate, "thickness is never extrapolated");
    check(find_field_rule("temperature").staggering == VerticalStaggering::Layers,
          "temperature is layer-centred");
    check(throws<ConfigurationError>([] { find_field_rule("velocity"); }),
          "unknown field -> ConfigurationError");
    check(throws<ConfigurationError>([] { parse_neighbor_rule("max"); }),
          "unknown extrapolation rule -> ConfigurationError");

    // --- Level mapping ---
    const FieldRule& beta = find_field_rule("beta");
    const FieldRule& temperature = find_field_rule("temperature");
    check(FieldTransfer::source_level(beta, 0, 1) == 0, "single level maps to itself");
    check(FieldTransfer::source_level(beta, 0, 3) == 2 && FieldTransfer::source_level(beta, 2, 3) == 0,
          "interfaces inverted (n-k-1)");
    check(FieldTransfer::source_level(temperature, 0, 3) == 3 &&
          FieldTransfer::source_level(temperature, 2, 3) == 1,
          "layers skip the basal source level (n-k)");

    // --- De-striding: 2 nodes x 3 levels, level 0 basal ---
    const std::vector<double> xs = {5.0, 5.0, 5.0, 7.0, 7.0, 7.0};
    const std::vector<double> ys = {1.0, 1.0, 1.0, 2.0, 2.0, 2.0};
    const SourceSamples column(SourceOrdering::ColumnWise, 3, xs, ys,
                               {270, 260, 250, 271, 261, 251});
    const SourceSamples layer(SourceOrdering::LayerWise, 2,
                              {5.0, 7.0, 5.0, 7.0, 5.0, 7.0},
                              {1.0, 2.0, 1.0, 2.0, 1.0, 2.0},
                              {270, 271, 260, 261, 250, 251});
    check(column.num_nodes() == 2 && column.num_levels() == 3, "column-wise node/level counts");
    check(layer.num_nodes() == 2 && layer.num_levels() == 3, "layer-wise node/level counts");
    {
        bool same = true;
        for (int k = 0; k < 3; ++k) same = same && column.level_values(k) == layer.level_values(k);
        same = same && column.node_x() == layer.node_x() && column.node_y() == layer.node_y();
        check(same, "both orderings de-stride to the same levels");
    }
    check(throws<ConfigurationError>([] {
              SourceSamples(SourceOrdering::ColumnWise, 4, {0, 0, 0}, {0, 0, 0}, {1, 2, 3});
          }), "stride not dividing the sample count -> ConfigurationError");
    check(throws<ConfigurationError>([] { parse_source_ordering(2); }),
          "ordering indicator outside {0,1} -> ConfigurationError");
    check(throws<ConfigurationError>([&] { column.level_values(3); }),
          "level beyond the source -> ConfigurationError");

    // --- Sample file ingestion: header, comments, unit scaling ---
    {
        const std::filesystem::path dir = std::filesystem::temp_directory_path();
        const std::string good = (dir / "fieldgraft_samples.txt").string();
        {
            std::ofstream out(good);
            out << "# two nodes, two levels, km coordinates\n"
                << "ordering 1\n"
                << "stride 2   # levels per node\n"
                << "\n"
                << "1.5 2.0 0.25\n"
                << "1.5 2.0 0.5   # top\n"
                << "3.0 4.0 0.75\n"
                << "3.0 4.0 1.0\n";
        }
        const double h_scale = find_field_rule("thickness").input_scale;
        SourceSamples loaded;
        bool ok = true;
        try {
            loaded = SourceSamples::load(good, 1000.0, h_scale);
        } catch (const std::exception& e) {
            std::cerr << "  unexpected: " << e.what() << "\n";
            ok = false;
        }
        check(ok && loaded.num_nodes() == 2 && loaded.num_levels() == 2 &&
              loaded.ordering() == SourceOrdering::ColumnWise, "header and comments parsed");
        check(ok && loaded.node_x() == std::vector<double>({1500.0, 3000.0}) &&
              loaded.node_y() == std::vector<double>({2000.0, 4000.0}), "coordinates scaled km -> m");
        check(ok && loaded.level_values(0) == std::vector<double>({250.0, 750.0}) &&
              loaded.level_values(1) == std::vector<double>({500.0, 1000.0}), "thickness scaled km -> m");
        std::filesystem::remove(good);

        check(nearly_equal(find_field_rule("uReconstructX").input_scale * 365.0 * 24.0 * 3600.0, 1.0),
              "velocity scaled m/yr -> m/s");

        const std::string headless = (dir / "fieldgraft_samples_headless.txt").string();
        {
            std::ofstream out(headless);
            out << "stride 1\n1.0 1.0 5.0\n";
        }
        check(throws<ConfigurationError>([&] { SourceSamples::load(headless, 1.0, 1.0); }),
              "missing ordering header -> ConfigurationError");
        std::filesystem::remove(headless);
    }

    FieldTransfer transfer;

    // --- Exponential transform, unmapped cells untouched ---
    {
        TargetFieldSet target(4);
        target.add("beta", 1, -1.0);
        const CorrespondenceMap map(std::vector<int>{2, 0});
        transfer.transfer_level(beta, map, {0.0, std::log(2.0)}, 0, target);
        const CellField& f = target.get("beta");
        check(nearly_equal(f.at(2), 1000.0) && nearly_equal(f.at(0), 2000.0),
              "beta stored as exp(v) * 1000");
        check(f.at(1) == -1.0 && f.at(3) == -1.0, "cells without a sample keep their value");

        check(throws<CorrespondenceError>([&] {
                  transfer.transfer_level(beta, map, {1.0, 2.0, 3.0}, 0, target);
              }), "map/value size mismatch -> CorrespondenceError");
        check(throws<ConfigurationError>([&] {
                  transfer.transfer_level(find_field_rule("stiffnessFactor"), map, {1.0, 2.0}, 0, target);
              }), "field absent from the target -> ConfigurationError");
    }

    // --- Thickness keeps the upper surface ---
    {
        TargetFieldSet target(3);
        CellField& h = target.add("thickness");
        CellField& b = target.add("bedTopography");
        h.values = {100.0, 50.0, 0.0};
        b.values = {-20.0, 10.0, -300.0};
        const std::vector<double> surface_before = {80.0, 60.0, -300.0};

        transfer.transfer_level(find_field_rule("thickness"), CorrespondenceMap(std::vector<int>{0, 2}),
                                {80.0, 30.0}, 0, target);
        const CellField& h2 = target.get("thickness");
        const CellField& b2 = target.get("bedTopography");
        check(h2.at(0) == 80.0 && h2.at(2) == 30.0 && h2.at(1) == 50.0, "thickness written");
        bool preserved = true;
        for (size_t c = 0; c < 3; ++c) preserved = preserved && nearly_equal(h2.at(c) + b2.at(c), surface_before[c]);
        check(preserved, "thickness + bedTopography unchanged per cell");
        check(nearly_equal(b2.at(0), 0.0) && nearly_equal(b2.at(2), -330.0), "bed moved by the thickness change");
    }
    {
        // Two samples on one cell: the last write wins for both fields.
        TargetFieldSet target(1);
        target.add("thickness").values = {100.0};
        target.add("bedTopography").values = {-20.0};
        transfer.transfer_level(find_field_rule("thickness"), CorrespondenceMap(std::vector<int>{0, 0}),
                                {70.0, 80.0}, 0, target);
        const double h = target.get("thickness").at(0);
        const double b = target.get("bedTopography").at(0);
        check(h == 80.0 && nearly_equal(b, 0.0) && nearly_equal(h + b, 80.0),
              "repeated cell keeps the surface");
    }
    {
        TargetFieldSet target(2);
        target.add("thickness");
        bool ok = true;
        try {
            transfer.transfer_level(find_field_rule("thickness"), CorrespondenceMap(std::vector<int>{1}),
                                    {12.0}, 0, target);
        } catch (const std::exception& e) {
            std::cerr << "  unexpected: " << e.what() << "\n";
            ok = false;
        }
        check(ok && target.get("thickness").at(1) == 12.0, "thickness without bedTopography is a plain copy");
    }

    // --- Layered field: target level k <- source level n-k ---
    {
        TargetFieldSet target(2);
        target.add("temperature", 2);
        const int written = transfer.transfer(temperature, CorrespondenceMap(std::vector<int>{1, 0}),
                                              column, target);
        const CellField& t = target.get("temperature");
        check(written == 2, "two target levels written");
        check(t.at(1, 0) == 250.0 && t.at(1, 1) == 260.0, "node 0 -> cell 1, levels top-down");
        check(t.at(0, 0) == 251.0 && t.at(0, 1) == 261.0, "node 1 -> cell 0, levels top-down");
    }

    // --- Masks ---
    {
        TargetFieldSet fields(4);
        fields.add("thickness").values = {100.0, 100.0, 0.0, 10.0};
        fields.add("bedTopography").values = {0.0, -200.0, 5.0, -100.0};

        const ActiveMask grd = MaskBuilder(MaskScheme::Grounded).build(fields);
        const ActiveMask all = MaskBuilder(MaskScheme::AllIce).build(fields);
        check(grd == ActiveMask({true, false, true, false}), "grounded: h*910/1028 + bed > 0");
        check(all == ActiveMask({true, true, false, true}), "all-ice: h > 0");
        check(throws<ConfigurationError>([] { parse_mask_scheme("floating"); }),
              "unknown mask scheme -> ConfigurationError");

        TargetFieldSet no_thickness(4);
        check(throws<ConfigurationError>([&] { MaskBuilder(MaskScheme::AllIce).build(no_thickness); }),
              "mask without thickness -> ConfigurationError");
    }

    std::cout << (failures == 0 ? "[PASS] Field transfer\n" : "[FAIL] Field transfer\n");
    return failures == 0 ? 0 : 1;
}
