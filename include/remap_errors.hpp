#pragma once

#include <stdexcept>
#include <string>

// Every failure of a remap run is fatal for that run; the driver reports the
// message and leaves the target untouched.
class RemapError : public std::runtime_error {
public:
    explicit RemapError(const std::string& what) : std::runtime_error(what) {}
};

// Unsupported field, unknown selector, invalid layering or missing field.
class ConfigurationError : public RemapError {
public:
    explicit ConfigurationError(const std::string& what)
        : RemapError("configuration: " + what) {}
};

// Source samples and target cells cannot be put in correspondence.
class CorrespondenceError : public RemapError {
public:
    explicit CorrespondenceError(const std::string& what)
        : RemapError("correspondence: " + what) {}
};

// Degenerate geometry, e.g. two cells sharing a centroid.
class GeometryError : public RemapError {
public:
    explicit GeometryError(const std::string& what)
        : RemapError("geometry: " + what) {}
};

// The adjacency graph cannot deliver values to every cell.
class TopologyError : public RemapError {
public:
    explicit TopologyError(const std::string& what)
        : RemapError("topology: " + what) {}
};
