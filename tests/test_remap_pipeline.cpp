/**
 * test_remap_pipeline.cpp — End-to-end remap on a 3x3 quad mesh
 *
 *   6 7 8      thickness 500 on cells 0-4, 0 elsewhere
 *   3 4 5      samples on the centroids of cells 0-4
 *   0 1 2      cell spacing 1000 m
 *
 * With the all-ice mask, cells 5,6,7 are filled in pass 1 and cell 8 in pass 2.
 */

#include "correspondence.hpp"
#include "field_catalog.hpp"
#include "gmsh_writer.hpp"
#include "mesh.hpp"
#include "mesh_graph.hpp"
#include "remap_errors.hpp"
#include "remap_pipeline.hpp"
#include "source_samples.hpp"
#include "target_fields.hpp"
#include "vtk.hpp"

#include <petscsys.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
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

static bool nearly_equal(double a, double b, double rel = 1e-9)
{
    return std::abs(a - b) <= rel * std::max(1.0, std::abs(b));
}

static Mesh make_quad_mesh()
{
    Mesh m;
    for (int j = 0; j <= 3; ++j)
        for (int i = 0; i <= 3; ++i)
            m.add_node(1000.0 * (i + 1), 1000.0 * (j + 1));
    auto n = [](int i, int j) { return j*4 + i; };
    for (int j = 0; j < 3; ++j)
        for (int i = 0; i < 3; ++i)
            m.add_element({n(i,j), n(i+1,j), n(i+1,j+1), n(i,j+1)});
    return m;
}

static TargetFieldSet make_fields(size_t n)
{
    TargetFieldSet fields(n);
    CellField& h = fields.add("thickness");
    CellField& b = fields.add("bedTopography");
    fields.add("beta", 1, -1.0);
    for (size_t c = 0; c < n; ++c) {
        h.at(c) = c < 5 ? 500.0 : 0.0;
        b.at(c) = -100.0;
    }
    return fields;
}

// One sample per centroid of cells 0-4, value ln(c+1).
static SourceSamples make_beta_samples(const MeshGraph& g)
{
    std::vector<double> x, y, v;
    for (int c = 0; c < 5; ++c) {
        x.push_back(g.x(c));
        y.push_back(g.y(c));
        v.push_back(std::log(c + 1.0));
    }
    return SourceSamples(SourceOrdering::ColumnWise, 1, x, y, v);
}

int main(int argc, char** argv)
{
    PetscErrorCode ierr = PetscInitialize(&argc, &argv, nullptr, nullptr);
    if (ierr) {
        std::cerr << "[FAIL] PETSc initialisation\n";
        return 1;
    }
    std::cout << "=== REMAP PIPELINE TEST ===\n";

    const Mesh mesh = make_quad_mesh();
    const MeshGraph graph = MeshGraph::from_mesh(mesh);
    const SourceSamples beta_samples = make_beta_samples(graph);
    const std::filesystem::path tmp = std::filesystem::temp_directory_path();

    RemapOptions opts;
    opts.variable = "beta";
    opts.method = CorrespondenceMethod::Coordinate;
    opts.mask_scheme = MaskScheme::AllIce;
    opts.extrapolation = NeighborRule::Minimum;
    opts.smooth_iterations = 2;

    // --- beta: transfer, extrapolate (min), smooth (min) ---
    RemapReport coord_report;
    TargetFieldSet coord_fields = make_fields(mesh.num_elements());
    try {
        coord_report = RemapPipeline(graph, opts).run(beta_samples, coord_fields);
        const CellField& beta = coord_fields.get("beta");
        const std::vector<double> expected = {1000, 2000, 3000, 4000, 5000, 3000, 3000, 3000, 3000};
        bool match = true;
        for (size_t c = 0; c < expected.size(); ++c) match = match && nearly_equal(beta.at(c), expected[c]);
        check(match, "beta transferred, extrapolated and smoothed");
        check(coord_report.extrapolated && coord_report.extrapolation.passes == 2 &&
              coord_report.extrapolation.cells_filled == 4, "two extrapolation passes, four cells");
        check(std::all_of(coord_report.final_mask.begin(), coord_report.final_mask.end(),
                          [](bool a) { return a; }), "final mask saturated");
        check(std::count(coord_report.original_mask.begin(), coord_report.original_mask.end(), true) == 5,
              "original mask kept separately");
        check(coord_report.correspondence.cells() == std::vector<int>({0, 1, 2, 3, 4}),
              "coordinate correspondence");
        check(coord_fields.get("thickness").at(0) == 500.0, "other fields untouched");
    } catch (const std::exception& e) {
        std::cerr << "  unexpected: " << e.what() << "\n";
        check(false, "beta remap");
    }

    // --- Saved id map reproduces the coordinate run ---
    {
        const std::string id_path = (tmp / "fieldgraft_test_ids.txt").string();
        check(coord_report.correspondence.save(id_path), "id map written");
        RemapOptions by_id = opts;
        by_id.method = CorrespondenceMethod::PrecomputedId;
        by_id.id_map_path = id_path;
        TargetFieldSet id_fields = make_fields(mesh.num_elements());
        try {
            RemapPipeline(graph, by_id).run(beta_samples, id_fields);
            check(id_fields.get("beta").values == coord_fields.get("beta").values,
                  "id method matches coordinate method");
        } catch (const std::exception& e) {
            std::cerr << "  unexpected: " << e.what() << "\n";
            check(false, "id method run");
        }
        std::filesystem::remove(id_path);
    }

    // --- Nearest method tolerates jitter ---
    {
        std::vector<double> x = beta_samples.node_x(), y = beta_samples.node_y();
        for (size_t i = 0; i < x.size(); ++i) { x[i] += 120.0; y[i] -= 80.0; }
        const SourceSamples jittered(SourceOrdering::ColumnWise, 1, x, y, beta_samples.level_values(0));
        RemapOptions nearest = opts;
        nearest.method = CorrespondenceMethod::Nearest;
        nearest.max_distance = 500.0;
        TargetFieldSet fields = make_fields(mesh.num_elements());
        try {
            const RemapReport r = RemapPipeline(graph, nearest).run(jittered, fields);
            check(r.correspondence == coord_report.correspondence, "nearest method finds the same cells");
        } catch (const std::exception& e) {
            std::cerr << "  unexpected: " << e.what() << "\n";
            check(false, "nearest method run");
        }
    }

    // --- thickness: never extrapolated, surface preserved ---
    {
        RemapOptions th = opts;
        th.variable = "thickness";
        th.smooth_iterations = 0;
        TargetFieldSet fields = make_fields(mesh.num_elements());
        const std::vector<double> v_m = {400, 500, 600, 700, 800};
        try {
            // Metres, as SourceSamples::load delivers them after input_scale.
            const SourceSamples scaled(SourceOrdering::ColumnWise, 1,
                                       beta_samples.node_x(), beta_samples.node_y(), v_m);
            const RemapReport r = RemapPipeline(graph, th).run(scaled, fields);
            check(!r.extrapolated && r.extrapolation.cells_filled == 0, "thickness not extrapolated");
            const CellField& h = fields.get("thickness");
            const CellField& b = fields.get("bedTopography");
            bool ok = true;
            for (size_t c = 0; c < 9; ++c) {
                const double surface = c < 5 ? 400.0 : -100.0;
                ok = ok && nearly_equal(h.at(c) + b.at(c), surface);
            }
            check(ok && h.at(2) == 600.0 && h.at(8) == 0.0, "thickness + bed preserved, unmapped cells untouched");
        } catch (const std::exception& e) {
            std::cerr << "  unexpected: " << e.what() << "\n";
            check(false, "thickness run");
        }
    }

    // --- Failures before any write ---
    {
        std::vector<double> x = beta_samples.node_x(), y = beta_samples.node_y();
        x[3] = 99999.0;
        const SourceSamples off_mesh(SourceOrdering::ColumnWise, 1, x, y, beta_samples.level_values(0));
        TargetFieldSet fields = make_fields(mesh.num_elements());
        const std::vector<double> before = fields.get("beta").values;
        check(throws<CorrespondenceError>([&] { RemapPipeline(graph, opts).run(off_mesh, fields); }),
              "sample off the mesh -> CorrespondenceError");
        check(fields.get("beta").values == before, "target unchanged after a correspondence failure");

        RemapOptions bad = opts;
        bad.variable = "thickness";
        bad.smooth_iterations = 3;
        check(throws<ConfigurationError>([&] { RemapPipeline{graph, bad}; }),
              "smoothing a non-smoothable field -> ConfigurationError");
        bad.variable = "velocity";
        check(throws<ConfigurationError>([&] { RemapPipeline{graph, bad}; }),
              "unknown variable -> ConfigurationError");
        bad = opts;
        bad.method = CorrespondenceMethod::PrecomputedId;
        bad.id_map_path.clear();
        check(throws<ConfigurationError>([&] { RemapPipeline{graph, bad}; }),
              "id method without a map -> ConfigurationError");

        RemapOptions stiff = opts;
        stiff.variable = "stiffnessFactor";
        check(throws<ConfigurationError>([&] {
                  TargetFieldSet f = make_fields(mesh.num_elements());
                  RemapPipeline(graph, stiff).run(beta_samples, f);
              }), "field missing from the target -> ConfigurationError");
    }

    // --- Gmsh output reads back as the same fields ---
    {
        const std::string msh = (tmp / "fieldgraft_test_out.msh").string();
        const std::string history = "Tue Mar 03 10:00:00 2026: fieldgraft -v beta\n"
                                    "Mon Mar 02 09:00:00 2026: fieldgraft -v thickness";
        bool ok = GmshWriter::write_with_element_data(msh, mesh, coord_fields, history);
        Mesh reread;
        ok = ok && reread.load_gmsh(msh);
        if (ok) {
            const TargetFieldSet back = TargetFieldSet::from_mesh(reread);
            ok = back.num_cells() == 9 && back.has("beta") && back.has("thickness");
            for (size_t c = 0; ok && c < 9; ++c)
                ok = nearly_equal(back.get("beta").at(c), coord_fields.get("beta").at(c), 1e-14);
        }
        check(ok, "Gmsh $ElementData round trip");
        check(reread.history() == history, "command history kept in $Comments");
        std::filesystem::remove(msh);
    }

    // --- Views with only negative levels do not create a field ---
    {
        Mesh m = make_quad_mesh();
        ElementDataBlock stray;
        stray.name = "beta";
        stray.level = -1;
        stray.values = {{1, 2.0}};
        ElementDataBlock h;
        h.name = "thickness";
        h.level = 0;
        h.values = {{1, 300.0}, {9, 50.0}};
        m.add_element_data(stray);
        m.add_element_data(h);
        const TargetFieldSet fields = TargetFieldSet::from_mesh(m);
        check(!fields.has("beta"), "negative-level view ignored");
        check(fields.has("thickness") && fields.get("thickness").n_levels == 1 &&
              fields.get("thickness").at(0) == 300.0 && fields.get("thickness").at(8) == 50.0,
              "valid view still read");
    }

    // --- VTU output carries every field and the original mask ---
    {
        const std::string vtu = (tmp / "fieldgraft_test_out.vtu").string();
        bool ok = VTKWriter::write_vtu(vtu, mesh, coord_fields, coord_report.original_mask);
        std::stringstream contents;
        {
            std::ifstream in(vtu);
            contents << in.rdbuf();
        }
        const std::string text = contents.str();
        ok = ok && text.find("NumberOfCells=\"9\"") != std::string::npos
                && text.find("Name=\"beta\"") != std::string::npos
                && text.find("Name=\"originalActiveMask\"") != std::string::npos;
        check(ok, "VTU written with field and mask arrays");
        std::filesystem::remove(vtu);
    }

    std::cout << (failures == 0 ? "[PASS] Remap pipeline\n" : "[FAIL] Remap pipeline\n");
    PetscFinalize();
    return failures == 0 ? 0 : 1;
}
