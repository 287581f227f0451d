#include "cellpipe/processing/background.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"

#include <algorithm>
#include <cmath>

namespace cellpipe::processing {

namespace {

std::vector<float> tile_centers(int extent, int tile_size, int n_tiles) {
    std::vector<float> centers(static_cast<size_t>(n_tiles));
    for (int i = 0; i < n_tiles; ++i) {
        const int start = i * tile_size;
        const int len = std::min(tile_size, extent - start);
        centers[static_cast<size_t>(i)] = static_cast<float>(start) + 0.5f * static_cast<float>(len) - 0.5f;
    }
    return centers;
}

// Index of the left bracket and the weight of the right one.
void bracket(const std::vector<float>& centers, float pos, int& i0, float& w) {
    const int n = static_cast<int>(centers.size());
    if (n == 1 || pos <= centers.front()) {
        i0 = 0;
        w = 0.0f;
        return;
    }
    if (pos >= centers.back()) {
        i0 = n - 1;
        w = 0.0f;
        return;
    }
    auto it = std::upper_bound(centers.begin(), centers.end(), pos);
    i0 = static_cast<int>(it - centers.begin()) - 1;
    const float span = centers[static_cast<size_t>(i0 + 1)] - centers[static_cast<size_t>(i0)];
    w = span > 0.0f ? (pos - centers[static_cast<size_t>(i0)]) / span : 0.0f;
}

} // namespace

TileSupport compute_tile_support(const Matrix2Df& image, const LabelFrame& labels,
                                 int tile_size, int min_samples) {
    if (image.rows() != labels.rows() || image.cols() != labels.cols()) {
        throw ValidationError("Background image and segmentation shapes differ");
    }
    if (tile_size < 1) {
        throw ValidationError("background.tile_size must be >= 1");
    }

    const int rows = static_cast<int>(image.rows());
    const int cols = static_cast<int>(image.cols());
    const int ty = (rows + tile_size - 1) / tile_size;
    const int tx = (cols + tile_size - 1) / tile_size;

    TileSupport support;
    support.centers_y = tile_centers(rows, tile_size, ty);
    support.centers_x = tile_centers(cols, tile_size, tx);
    support.values = Matrix2Df::Zero(ty, tx);

    Matrix2Du8 valid = Matrix2Du8::Zero(ty, tx);
    std::vector<float> samples;
    std::vector<float> all_background;
    for (int j = 0; j < ty; ++j) {
        for (int i = 0; i < tx; ++i) {
            samples.clear();
            const int y_end = std::min(rows, (j + 1) * tile_size);
            const int x_end = std::min(cols, (i + 1) * tile_size);
            for (int y = j * tile_size; y < y_end; ++y) {
                for (int x = i * tile_size; x < x_end; ++x) {
                    if (labels(y, x) == 0) samples.push_back(image(y, x));
                }
            }
            all_background.insert(all_background.end(), samples.begin(), samples.end());
            if (static_cast<int>(samples.size()) >= min_samples) {
                support.values(j, i) = core::median_of(samples);
                valid(j, i) = 1;
            }
        }
    }

    if (valid.cast<int>().sum() == 0) {
        // No usable tile: fall back to one global level.
        float level = 0.0f;
        if (!all_background.empty()) {
            level = core::median_of(all_background);
        } else {
            std::vector<float> pixels(image.data(), image.data() + image.size());
            level = core::median_of(pixels);
        }
        support.values.setConstant(level);
        return support;
    }

    // Grow valid tiles into invalid ones, averaging valid 8-neighbours.
    while (valid.cast<int>().sum() < ty * tx) {
        Matrix2Df next = support.values;
        Matrix2Du8 next_valid = valid;
        for (int j = 0; j < ty; ++j) {
            for (int i = 0; i < tx; ++i) {
                if (valid(j, i)) continue;
                float sum = 0.0f;
                int n = 0;
                for (int dj = -1; dj <= 1; ++dj) {
                    for (int di = -1; di <= 1; ++di) {
                        const int jj = j + dj;
                        const int ii = i + di;
                        if (jj < 0 || ii < 0 || jj >= ty || ii >= tx) continue;
                        if (!valid(jj, ii)) continue;
                        sum += support.values(jj, ii);
                        ++n;
                    }
                }
                if (n > 0) {
                    next(j, i) = sum / static_cast<float>(n);
                    next_valid(j, i) = 1;
                }
            }
        }
        support.values = next;
        valid = next_valid;
    }
    return support;
}

Matrix2Df interpolate_support(const TileSupport& support, int rows, int cols) {
    Matrix2Df out(rows, cols);

    std::vector<int> xi(static_cast<size_t>(cols));
    std::vector<float> xw(static_cast<size_t>(cols));
    for (int x = 0; x < cols; ++x) {
        bracket(support.centers_x, static_cast<float>(x), xi[static_cast<size_t>(x)],
                xw[static_cast<size_t>(x)]);
    }

    const int tx = static_cast<int>(support.values.cols());
    const int ty = static_cast<int>(support.values.rows());
    for (int y = 0; y < rows; ++y) {
        int j0 = 0;
        float wy = 0.0f;
        bracket(support.centers_y, static_cast<float>(y), j0, wy);
        const int j1 = std::min(j0 + 1, ty - 1);
        for (int x = 0; x < cols; ++x) {
            const int i0 = xi[static_cast<size_t>(x)];
            const int i1 = std::min(i0 + 1, tx - 1);
            const float wx = xw[static_cast<size_t>(x)];
            const float top = (1.0f - wx) * support.values(j0, i0) + wx * support.values(j0, i1);
            const float bottom = (1.0f - wx) * support.values(j1, i0) + wx * support.values(j1, i1);
            out(y, x) = (1.0f - wy) * top + wy * bottom;
        }
    }
    return out;
}

Matrix2Df estimate_background(const Matrix2Df& image, const LabelFrame& labels,
                              const config::BackgroundConfig& cfg) {
    TileSupport support = compute_tile_support(image, labels, cfg.tile_size, cfg.min_samples);
    return interpolate_support(support, static_cast<int>(image.rows()),
                               static_cast<int>(image.cols()));
}

bool estimate_background_stack(const io::FitsCube& fl, const io::FitsCube& labels,
                               io::FitsCube& out, const config::BackgroundConfig& cfg,
                               const core::CancellationToken& cancel,
                               const core::ProgressCallback& progress) {
    if (fl.frames() != labels.frames() || fl.rows() != labels.rows() || fl.cols() != labels.cols()) {
        throw ValidationError("Segmentation shape (" + std::to_string(labels.frames()) + "," +
                              std::to_string(labels.rows()) + "," + std::to_string(labels.cols()) +
                              ") does not match fluorescence shape (" +
                              std::to_string(fl.frames()) + "," + std::to_string(fl.rows()) + "," +
                              std::to_string(fl.cols()) + ")");
    }

    const int n_frames = fl.frames();
    for (int t = 0; t < n_frames; ++t) {
        if (cancel.is_cancelled()) {
            return false;
        }
        out.write(t, estimate_background(fl.read_float(t), labels.read_u16(t), cfg));
        core::report(progress, t, n_frames, "Background");
    }
    return true;
}

} // namespace cellpipe::processing
