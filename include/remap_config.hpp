#pragma once

#include "remap_pipeline.hpp"

#include <string>

struct RemapConfig {
    std::string samples_path;
    std::string mesh_path;
    std::string output_prefix = "results/remap";
    std::string id_map_path = "exodus_to_mpas_id_map.txt";
    double coord_scale = 1000.0;  // source coordinates km -> m
    RemapOptions remap;
};

// Throws std::runtime_error for unknown or missing arguments and
// ConfigurationError for unknown selector values.
RemapConfig parse_remap_config(int argc, char** argv);
