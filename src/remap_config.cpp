#include "remap_config.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace {

void print_usage(const char* binary)
{
    std::cerr << "Usage: " << binary
              << " --samples file --mesh target.msh --variable name --mask {grd|all}\n"
              << "             [--method {id|coord|nearest}] [--id-map file]\n"
              << "             [--extrapolation {min|idw}] [--smooth-iter n]\n"
              << "             [--coord-scale value] [--max-distance value]\n"
              << "             [--output-prefix path]\n"
              << "Example: " << binary
              << " --samples antarctica.txt --mesh target.msh --method id --id-map ids.txt"
              << " --variable beta --mask grd\n";
}

int parse_int(const std::string& flag, const std::string& token)
{
    std::size_t used = 0;
    const int value = std::stoi(token, &used);
    if (used != token.size()) {
        throw std::runtime_error("Expected an integer for " + flag + ", got: " + token);
    }
    return value;
}

} // namespace

RemapConfig parse_remap_config(int argc, char** argv)
{
    RemapConfig config;
    std::optional<std::string> mask_token;
    std::optional<std::string> id_map_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--samples" || arg == "-e") && i + 1 < argc) {
            config.samples_path = argv[++i];
        } else if ((arg == "--mesh" || arg == "-o") && i + 1 < argc) {
            config.mesh_path = argv[++i];
        } else if ((arg == "--variable" || arg == "-v") && i + 1 < argc) {
            config.remap.variable = argv[++i];
        } else if ((arg == "--method" || arg == "-m") && i + 1 < argc) {
            config.remap.method = parse_correspondence_method(argv[++i]);
        } else if ((arg == "--id-map" || arg == "-a") && i + 1 < argc) {
            id_map_override = argv[++i];
        } else if ((arg == "--mask" || arg == "-k") && i + 1 < argc) {
            mask_token = argv[++i];
        } else if ((arg == "--extrapolation" || arg == "-x") && i + 1 < argc) {
            config.remap.extrapolation = parse_neighbor_rule(argv[++i]);
        } else if ((arg == "--smooth-iter" || arg == "-i") && i + 1 < argc) {
            config.remap.smooth_iterations = parse_int(arg, argv[++i]);
        } else if (arg == "--coord-scale" && i + 1 < argc) {
            config.coord_scale = std::stod(argv[++i]);
        } else if (arg == "--max-distance" && i + 1 < argc) {
            config.remap.max_distance = std::stod(argv[++i]);
        } else if (arg == "--output-prefix" && i + 1 < argc) {
            config.output_prefix = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(EXIT_SUCCESS);
        } else {
            print_usage(argv[0]);
            throw std::runtime_error("Unknown CLI argument: " + arg);
        }
    }

    if (config.samples_path.empty() || config.mesh_path.empty() || config.remap.variable.empty()) {
        print_usage(argv[0]);
        throw std::runtime_error("--samples, --mesh and --variable are required");
    }
    if (!mask_token) {
        print_usage(argv[0]);
        throw std::runtime_error("--mask is required (all or grd)");
    }
    config.remap.mask_scheme = parse_mask_scheme(*mask_token);

    if (id_map_override) {
        config.id_map_path = *id_map_override;
    }
    config.remap.id_map_path = config.id_map_path;

    return config;
}
