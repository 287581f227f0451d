#pragma once

#include <stdexcept>
#include <string>

namespace cellpipe {

class CellpipeError : public std::runtime_error {
public:
    explicit CellpipeError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public CellpipeError {
public:
    explicit ConfigError(const std::string& message)
        : CellpipeError("Config error: " + message) {}
};

class ValidationError : public CellpipeError {
public:
    explicit ValidationError(const std::string& message)
        : CellpipeError("Validation error: " + message) {}
};

class IOError : public CellpipeError {
public:
    explicit IOError(const std::string& message)
        : CellpipeError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class Hdf5Error : public IOError {
public:
    explicit Hdf5Error(const std::string& message)
        : IOError("HDF5 error: " + message) {}
};

// Upstream artifact absent for a FOV; fails that FOV only.
class MissingArtifactError : public CellpipeError {
public:
    explicit MissingArtifactError(const std::string& message)
        : CellpipeError("Missing artifact: " + message) {}
};

class TrackingError : public CellpipeError {
public:
    explicit TrackingError(const std::string& message)
        : CellpipeError("Tracking error: " + message) {}
};

class PipelineError : public CellpipeError {
public:
    explicit PipelineError(const std::string& message)
        : CellpipeError("Pipeline error: " + message) {}
};

} // namespace cellpipe
