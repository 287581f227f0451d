#include "cellpipe/io/fits_stack.hpp"
#include "cellpipe/core/errors.hpp"

#include <fitsio.h>
#include <utility>

namespace cellpipe::io {

namespace {

fitsfile* as_fits(void* handle) {
    return static_cast<fitsfile*>(handle);
}

std::string status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

[[noreturn]] void fail(fitsfile* fptr, const std::string& what, const fs::path& path, int status) {
    const std::string reason = status_text(status);
    if (fptr) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
    }
    throw FitsError(what + ": " + path.string() + " (" + reason + ")");
}

} // namespace

FitsCube::~FitsCube() {
    if (handle_) {
        int status = 0;
        fits_close_file(as_fits(handle_), &status);
        handle_ = nullptr;
    }
}

FitsCube::FitsCube(FitsCube&& o) noexcept
    : handle_(std::exchange(o.handle_, nullptr)),
      path_(std::move(o.path_)),
      frames_(o.frames_),
      rows_(o.rows_),
      cols_(o.cols_),
      type_(o.type_) {}

FitsCube& FitsCube::operator=(FitsCube&& o) noexcept {
    if (this != &o) {
        if (handle_) {
            int status = 0;
            fits_close_file(as_fits(handle_), &status);
        }
        handle_ = std::exchange(o.handle_, nullptr);
        path_ = std::move(o.path_);
        frames_ = o.frames_;
        rows_ = o.rows_;
        cols_ = o.cols_;
        type_ = o.type_;
    }
    return *this;
}

FitsCube FitsCube::create(const fs::path& path, int frames, int rows, int cols,
                          PixelType type) {
    if (frames < 1 || rows < 1 || cols < 1) {
        throw FitsError("Invalid cube shape for " + path.string());
    }

    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        fail(nullptr, "Cannot create FITS file", path, status);
    }

    long naxes[3] = {cols, rows, frames};
    const int bitpix = (type == PixelType::UINT16) ? USHORT_IMG : FLOAT_IMG;
    fits_create_img(fptr, bitpix, 3, naxes, &status);
    if (status) {
        fail(fptr, "Cannot create FITS image", path, status);
    }

    FitsCube cube;
    cube.handle_ = fptr;
    cube.path_ = path;
    cube.frames_ = frames;
    cube.rows_ = rows;
    cube.cols_ = cols;
    cube.type_ = type;
    return cube;
}

FitsCube FitsCube::open(const fs::path& path, bool writable) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), writable ? READWRITE : READONLY, &status)) {
        fail(nullptr, "Cannot open FITS file", path, status);
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;
    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fail(fptr, "Cannot read FITS image parameters", path, status);
    }
    if (naxis < 2 || naxis > 3) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Expected a 2D or 3D image: " + path.string());
    }

    int equiv = 0;
    fits_get_img_equivtype(fptr, &equiv, &status);
    if (status) {
        fail(fptr, "Cannot read FITS image type", path, status);
    }

    FitsCube cube;
    cube.handle_ = fptr;
    cube.path_ = path;
    cube.cols_ = static_cast<int>(naxes[0]);
    cube.rows_ = static_cast<int>(naxes[1]);
    cube.frames_ = (naxis == 3) ? static_cast<int>(naxes[2]) : 1;
    cube.type_ = (equiv == FLOAT_IMG || equiv == DOUBLE_IMG) ? PixelType::FLOAT32
                                                            : PixelType::UINT16;
    return cube;
}

void FitsCube::check_plane(int t, Eigen::Index rows, Eigen::Index cols) const {
    if (!handle_) {
        throw FitsError("Cube is not open: " + path_.string());
    }
    if (t < 0 || t >= frames_) {
        throw FitsError("Frame " + std::to_string(t) + " out of range [0," +
                        std::to_string(frames_) + ") in " + path_.string());
    }
    if (rows != rows_ || cols != cols_) {
        throw FitsError("Plane shape " + std::to_string(rows) + "x" + std::to_string(cols) +
                        " does not match cube " + std::to_string(rows_) + "x" +
                        std::to_string(cols_) + " in " + path_.string());
    }
}

Matrix2Du16 FitsCube::read_u16(int t) const {
    check_plane(t, rows_, cols_);
    Matrix2Du16 plane(rows_, cols_);
    long fpixel[3] = {1, 1, t + 1};
    int status = 0;
    fits_read_pix(as_fits(handle_), TUSHORT, fpixel, static_cast<LONGLONG>(plane.size()),
                  nullptr, plane.data(), nullptr, &status);
    if (status) {
        throw FitsError("Cannot read frame " + std::to_string(t) + " from " + path_.string() +
                        " (" + status_text(status) + ")");
    }
    return plane;
}

Matrix2Df FitsCube::read_float(int t) const {
    check_plane(t, rows_, cols_);
    Matrix2Df plane(rows_, cols_);
    long fpixel[3] = {1, 1, t + 1};
    int status = 0;
    fits_read_pix(as_fits(handle_), TFLOAT, fpixel, static_cast<LONGLONG>(plane.size()),
                  nullptr, plane.data(), nullptr, &status);
    if (status) {
        throw FitsError("Cannot read frame " + std::to_string(t) + " from " + path_.string() +
                        " (" + status_text(status) + ")");
    }
    return plane;
}

void FitsCube::write(int t, const Matrix2Du16& plane) {
    check_plane(t, plane.rows(), plane.cols());
    long fpixel[3] = {1, 1, t + 1};
    int status = 0;
    fits_write_pix(as_fits(handle_), TUSHORT, fpixel, static_cast<LONGLONG>(plane.size()),
                   const_cast<uint16_t*>(plane.data()), &status);
    if (status) {
        throw FitsError("Cannot write frame " + std::to_string(t) + " to " + path_.string() +
                        " (" + status_text(status) + ")");
    }
}

void FitsCube::write(int t, const Matrix2Df& plane) {
    check_plane(t, plane.rows(), plane.cols());
    long fpixel[3] = {1, 1, t + 1};
    int status = 0;
    fits_write_pix(as_fits(handle_), TFLOAT, fpixel, static_cast<LONGLONG>(plane.size()),
                   const_cast<float*>(plane.data()), &status);
    if (status) {
        throw FitsError("Cannot write frame " + std::to_string(t) + " to " + path_.string() +
                        " (" + status_text(status) + ")");
    }
}

void FitsCube::close() {
    if (!handle_) return;
    int status = 0;
    fits_close_file(as_fits(handle_), &status);
    handle_ = nullptr;
    if (status) {
        throw FitsError("Cannot close FITS file: " + path_.string() + " (" +
                        status_text(status) + ")");
    }
}

std::tuple<int, int, int> get_cube_shape(const fs::path& path) {
    FitsCube cube = FitsCube::open(path);
    return {cube.frames(), cube.rows(), cube.cols()};
}

} // namespace cellpipe::io
