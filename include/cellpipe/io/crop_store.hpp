#pragma once

#include "cellpipe/core/types.hpp"

#include <hdf5.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace cellpipe::io {

namespace fs = std::filesystem;

// Everything stored for one tracked cell in a FOV crop container.
//
// Layout inside the HDF5 file:
//   /cell_<id:04d>/bboxes                         int32 (n, 5): t, y0, x0, y1, x1
//   /cell_<id:04d>/frames                         int32 (n)
//   /cell_<id:04d>/masks/frame_<t:04d>            uint8 (h, w)
//   /cell_<id:04d>/channels/<name>/frame_<t:04d>  uint16 (h, w)
//   /cell_<id:04d>/backgrounds/<name>/frame_<t:04d> float32 (h, w)
struct CellCrop {
    int cell_id = 0;
    std::vector<FrameBox> boxes;  // ascending frame order
    std::map<int, MaskFrame> masks;
    std::map<std::string, std::map<int, Matrix2Du16>> channels;
    std::map<std::string, std::map<int, Matrix2Df>> backgrounds;

    std::vector<int> frames() const;
};

std::string cell_group_name(int cell_id);
std::string frame_dataset_name(int frame);

class CropWriter {
public:
    // Creates (truncating) the container at `path`.
    explicit CropWriter(const fs::path& path, int compression = 4);
    ~CropWriter();

    CropWriter(const CropWriter&) = delete;
    CropWriter& operator=(const CropWriter&) = delete;

    void write_cell(const CellCrop& cell);
    void close();

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    hid_t file_id_ = -1;
    int compression_ = 4;
};

class CropReader {
public:
    explicit CropReader(const fs::path& path);
    ~CropReader();

    CropReader(const CropReader&) = delete;
    CropReader& operator=(const CropReader&) = delete;

    // Cell ids in ascending order
    std::vector<int> cell_ids() const;
    CellCrop read_cell(int cell_id) const;

private:
    fs::path path_;
    hid_t file_id_ = -1;
};

} // namespace cellpipe::io
