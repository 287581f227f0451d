#pragma once

#include "cellpipe/core/types.hpp"
#include "cellpipe/io/fits_stack.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace cellpipe::io {

namespace fs = std::filesystem;

struct MicroscopyMetadata {
    fs::path file_path;
    std::string base_name;
    std::string file_type;
    int height = 0;
    int width = 0;
    int n_frames = 0;
    int n_fovs = 0;
    int n_channels = 0;
    std::vector<double> timepoints;  // ms, one per frame when known
    std::vector<std::string> channel_names;
    std::string dtype = "uint16";
};

// Source of raw acquisition planes, one (fov, channel, frame) at a time.
class FrameReader {
public:
    virtual ~FrameReader() = default;

    virtual const MicroscopyMetadata& metadata() const = 0;
    virtual Matrix2Du16 read_frame(int fov, int channel, int frame) = 0;
};

// Acquisition stored as one FITS cube per (fov, channel), named
// <base>_fov<NNN>_ch<C>.fits inside a single directory. Cubes of the FOV
// being read stay open; asking for another FOV closes them.
class FitsAcquisitionReader : public FrameReader {
public:
    explicit FitsAcquisitionReader(const fs::path& input_dir);

    const MicroscopyMetadata& metadata() const override { return metadata_; }
    Matrix2Du16 read_frame(int fov, int channel, int frame) override;

    size_t open_cube_count() const;

    static fs::path source_path(const fs::path& input_dir, const std::string& base_name,
                                int fov, int channel);

private:
    FitsCube& cube_for(int fov, int channel);

    fs::path input_dir_;
    MicroscopyMetadata metadata_;
    int open_fov_ = -1;
    std::map<int, FitsCube> open_cubes_;  // by channel
    mutable std::mutex mutex_;
};

} // namespace cellpipe::io
