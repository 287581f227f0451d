#pragma once

#include "cellpipe/core/types.hpp"

#include <filesystem>
#include <string>
#include <tuple>

namespace cellpipe::io {

namespace fs = std::filesystem;

enum class PixelType {
    UINT16,
    FLOAT32
};

// A (frames x rows x cols) image cube stored as one FITS primary HDU.
// Planes are read and written one at a time, so a stack never has to
// fit in memory.
class FitsCube {
public:
    FitsCube() = default;
    ~FitsCube();

    FitsCube(const FitsCube&) = delete;
    FitsCube& operator=(const FitsCube&) = delete;
    FitsCube(FitsCube&& o) noexcept;
    FitsCube& operator=(FitsCube&& o) noexcept;

    // Creates (overwriting) a cube of the given shape.
    static FitsCube create(const fs::path& path, int frames, int rows, int cols,
                           PixelType type);
    static FitsCube open(const fs::path& path, bool writable = false);

    int frames() const { return frames_; }
    int rows() const { return rows_; }
    int cols() const { return cols_; }
    PixelType pixel_type() const { return type_; }
    const fs::path& path() const { return path_; }
    bool is_open() const { return handle_ != nullptr; }

    Matrix2Du16 read_u16(int t) const;
    Matrix2Df read_float(int t) const;

    void write(int t, const Matrix2Du16& plane);
    void write(int t, const Matrix2Df& plane);

    // Flushes and closes; throws if cfitsio reports an error.
    void close();

private:
    void check_plane(int t, Eigen::Index rows, Eigen::Index cols) const;

    void* handle_ = nullptr;  // fitsfile*
    fs::path path_;
    int frames_ = 0;
    int rows_ = 0;
    int cols_ = 0;
    PixelType type_ = PixelType::UINT16;
};

// Shape of an existing cube without reading pixel data: (frames, rows, cols)
std::tuple<int, int, int> get_cube_shape(const fs::path& path);

} // namespace cellpipe::io
