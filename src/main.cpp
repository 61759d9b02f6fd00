/**
 * main.cpp — fieldgraft driver
 *
 * Transplants one field from source-mesh samples onto a target Gmsh mesh,
 * extrapolates it across the cell-adjacency graph and smooths the filled
 * region. Output: the updated target as Gmsh ($ElementData) and VTU, plus the
 * sample -> cell id map when it was computed from coordinates.
 */

#include "field_catalog.hpp"
#include "gmsh_writer.hpp"
#include "mesh.hpp"
#include "mesh_graph.hpp"
#include "remap_config.hpp"
#include "remap_errors.hpp"
#include "remap_pipeline.hpp"
#include "source_samples.hpp"
#include "target_fields.hpp"
#include "vtk.hpp"

#include <petscsys.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace
{
    // "<local time>: <command line>" prepended to the history the target already carries.
    std::string history_entry(int argc, char** argv, const std::string& previous)
    {
        const std::time_t now = std::time(nullptr);
        std::ostringstream entry;
        entry << std::put_time(std::localtime(&now), "%a %b %d %H:%M:%S %Y") << ":";
        for (int i = 0; i < argc; ++i) entry << " " << argv[i];
        if (!previous.empty()) entry << "\n" << previous;
        return entry.str();
    }

    int run(int argc, char** argv)
    {
        const auto t0 = std::chrono::steady_clock::now();

        // --- 1. Options ---
        RemapConfig config = parse_remap_config(argc, argv);
        RemapOptions& opts = config.remap;
        const FieldRule& rule = find_field_rule(opts.variable);
        std::cout << "============================================================\n"
                  << "Converting " << rule.source_name << " -> " << rule.name << "\n"
                  << "============================================================\n";

        // --- 2. Target mesh and fields ---
        Mesh mesh;
        if (!mesh.load_gmsh(config.mesh_path)) {
            std::cerr << "[ERROR] Cannot load mesh: " << config.mesh_path << "\n";
            return 1;
        }
        const MeshGraph graph = MeshGraph::from_mesh(mesh);
        TargetFieldSet fields = TargetFieldSet::from_mesh(mesh);
        std::cout << std::fixed << std::setprecision(3)
                  << "[MESH] Domain: x=[" << mesh.xmin() << "," << mesh.xmax()
                  << "] y=[" << mesh.ymin() << "," << mesh.ymax() << "]"
                  << ", max degree " << graph.max_degree() << "\n"
                  << std::defaultfloat;

        // Validates variable, smoothing and method before any data is read.
        RemapPipeline pipeline(graph, opts);

        // --- 3. Source samples ---
        const SourceSamples samples = SourceSamples::load(config.samples_path,
                                                          config.coord_scale, rule.input_scale);

        // --- 4. Remap ---
        const RemapReport report = pipeline.run(samples, fields);

        // --- 5. Output ---
        const std::filesystem::path prefix(config.output_prefix);
        if (prefix.has_parent_path()) {
            std::filesystem::create_directories(prefix.parent_path());
        }

        if (opts.method != CorrespondenceMethod::PrecomputedId) {
            if (report.correspondence.save(config.id_map_path))
                std::cout << "[OUTPUT] Coordinate IDs written to \"" << config.id_map_path
                          << "\". You can use this file with the \"id\" method.\n";
            else
                std::cerr << "[WARNING] Could not write id map " << config.id_map_path << "\n";
        }

        const std::string msh = config.output_prefix + ".msh";
        if (!GmshWriter::write_with_element_data(msh, mesh, fields,
                                               history_entry(argc, argv, mesh.history()))) {
            std::cerr << "[ERROR] Gmsh write failed: " << msh << "\n";
            return 1;
        }
        std::cout << "[OUTPUT] Gmsh: " << msh << "\n";

        const std::string vtu = config.output_prefix + ".vtu";
        if (VTKWriter::write_vtu(vtu, mesh, fields, report.original_mask))
            std::cout << "[OUTPUT] VTU: " << vtu << "\n";
        else
            std::cerr << "[ERROR] VTU write failed\n";

        const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        std::cout << "============================================================\n"
                  << "Remap complete in " << seconds << " s\n"
                  << "  Samples transplanted  = " << report.correspondence.size() << "\n"
                  << "  Levels written        = " << report.levels_written << "\n"
                  << "  Cells extrapolated    = " << report.extrapolation.cells_filled << "\n"
                  << "  Extrapolation passes  = " << report.extrapolation.passes << "\n"
                  << "============================================================\n";
        return 0;
    }
}

int main(int argc, char** argv)
{
    PetscErrorCode ierr = PetscInitialize(&argc, &argv, nullptr, nullptr);
    if (ierr) {
        std::cerr << "[ERROR] PETSc initialisation failed\n";
        return 1;
    }

    int status = 1;
    try {
        status = run(argc, argv);
    } catch (const RemapError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n"
                  << "[ERROR] Remap aborted; target left unchanged.\n";
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
    }

    PetscFinalize();
    return status;
}
