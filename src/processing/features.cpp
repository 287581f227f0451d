#include "cellpipe/processing/features.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <mutex>
#include <queue>
#include <tuple>

namespace cellpipe::processing {

namespace {

constexpr double kGaussianSigma = 2.0;
constexpr int kVotingWindow = 1000;
constexpr int kVotingStride = 50;
constexpr int kPeakMinDistance = 30;
constexpr double kMinParticleRadius = 3.0;
constexpr double kMinParticleIntensity = 50.0;

// image - weight * background, or the image itself.
Matrix2Df corrected(const FeatureContext& ctx) {
    if (!ctx.background || ctx.background_weight == 0.0f) {
        return ctx.image;
    }
    if (ctx.background->rows() != ctx.image.rows() || ctx.background->cols() != ctx.image.cols()) {
        throw ValidationError("Background crop shape does not match image crop");
    }
    return ctx.image - ctx.background_weight * (*ctx.background);
}

void check_mask(const FeatureContext& ctx) {
    if (ctx.mask.rows() != ctx.image.rows() || ctx.mask.cols() != ctx.image.cols()) {
        throw ValidationError("Mask shape does not match image crop");
    }
}

struct Peak {
    float value;
    int y;
    int x;
};

// Local maxima of `image` inside `mask`, at least `min_distance`
// (Chebyshev) apart, strongest first.
std::vector<Peak> find_peaks(const Matrix2Df& image, const MaskFrame& mask, int min_distance) {
    const int rows = static_cast<int>(image.rows());
    const int cols = static_cast<int>(image.cols());

    cv::Mat src(rows, cols, CV_32F, const_cast<float*>(image.data()));
    cv::Mat maxed;
    const int k = 2 * min_distance + 1;
    cv::dilate(src, maxed, cv::getStructuringElement(cv::MORPH_RECT, cv::Size(k, k)));

    const float floor_value = image.minCoeff();
    std::vector<Peak> candidates;
    for (int y = 0; y < rows; ++y) {
        const float* m = maxed.ptr<float>(y);
        for (int x = 0; x < cols; ++x) {
            const float v = image(y, x);
            if (mask(y, x) && v == m[x] && v > floor_value) {
                candidates.push_back({v, y, x});
            }
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Peak& a, const Peak& b) { return a.value > b.value; });

    std::vector<Peak> kept;
    for (const auto& c : candidates) {
        bool too_close = false;
        for (const auto& p : kept) {
            if (std::max(std::abs(p.y - c.y), std::abs(p.x - c.x)) <= min_distance) {
                too_close = true;
                break;
            }
        }
        if (!too_close) kept.push_back(c);
    }
    return kept;
}

// Floods `mask` from the seeds in order of decreasing intensity
// (4-connected). Returns per-pixel seed index + 1, 0 outside.
Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>
flood_from_seeds(const Matrix2Df& image, const MaskFrame& mask, const std::vector<Peak>& seeds) {
    const int rows = static_cast<int>(image.rows());
    const int cols = static_cast<int>(image.cols());
    Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> labels =
        Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>::Zero(rows, cols);

    // (-intensity, age, y, x); lowest first
    using Entry = std::tuple<float, long, int, int>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> queue;
    long age = 0;
    for (size_t i = 0; i < seeds.size(); ++i) {
        labels(seeds[i].y, seeds[i].x) = static_cast<int>(i) + 1;
        queue.emplace(-image(seeds[i].y, seeds[i].x), age++, seeds[i].y, seeds[i].x);
    }

    const int dy[4] = {-1, 1, 0, 0};
    const int dx[4] = {0, 0, -1, 1};
    while (!queue.empty()) {
        const auto [neg, a, y, x] = queue.top();
        queue.pop();
        (void)neg;
        (void)a;
        for (int n = 0; n < 4; ++n) {
            const int yy = y + dy[n];
            const int xx = x + dx[n];
            if (yy < 0 || xx < 0 || yy >= rows || xx >= cols) continue;
            if (!mask(yy, xx) || labels(yy, xx) != 0) continue;
            labels(yy, xx) = labels(y, x);
            queue.emplace(-image(yy, xx), age++, yy, xx);
        }
    }
    return labels;
}

struct FeatureRegistry {
    FeatureRegistry() {
        functions["intensity_total"] = feature_intensity_total;
        functions["particle_num"] = feature_particle_num;
        functions["area"] = feature_area;
        functions["aspect_ratio"] = feature_aspect_ratio;
    }

    std::mutex mutex;
    std::map<std::string, FeatureFunction> functions;
};

FeatureRegistry& registry() {
    static FeatureRegistry reg;
    return reg;
}

} // namespace

float threshold_li(const std::vector<float>& values) {
    std::vector<double> v;
    v.reserve(values.size());
    for (float f : values) {
        if (!std::isnan(f)) v.push_back(f);
    }
    if (v.empty()) {
        return std::numeric_limits<float>::quiet_NaN();
    }

    std::vector<double> uniq = v;
    std::sort(uniq.begin(), uniq.end());
    uniq.erase(std::unique(uniq.begin(), uniq.end()), uniq.end());
    if (uniq.size() == 1) {
        return static_cast<float>(uniq.front());
    }
    double tolerance = std::numeric_limits<double>::max();
    for (size_t i = 1; i < uniq.size(); ++i) {
        tolerance = std::min(tolerance, uniq[i] - uniq[i - 1]);
    }
    tolerance /= 2.0;

    const double vmin = uniq.front();
    double mean = 0.0;
    for (double& d : v) {
        mean += d;
        d -= vmin;
    }
    mean /= static_cast<double>(v.size());

    double t_next = mean - vmin;
    double t_curr = -2.0 * tolerance;
    for (int iter = 0; iter < 1000 && std::abs(t_next - t_curr) > tolerance; ++iter) {
        t_curr = t_next;
        double sum_fore = 0.0, sum_back = 0.0;
        size_t n_fore = 0, n_back = 0;
        for (double d : v) {
            if (d > t_curr) {
                sum_fore += d;
                ++n_fore;
            } else {
                sum_back += d;
                ++n_back;
            }
        }
        if (n_fore == 0 || n_back == 0) break;
        const double mean_fore = sum_fore / static_cast<double>(n_fore);
        const double mean_back = sum_back / static_cast<double>(n_back);
        if (mean_back == 0.0) break;
        t_next = (mean_back - mean_fore) / (std::log(mean_back) - std::log(mean_fore));
    }
    return static_cast<float>(t_next + vmin);
}

MaskFrame li_voting_mask(const Matrix2Df& image, int window_size, int stride) {
    if (window_size < 1 || stride < 1) {
        throw ValidationError("Voting window and stride must be >= 1");
    }
    const int rows = static_cast<int>(image.rows());
    const int cols = static_cast<int>(image.cols());
    const int pad = window_size / 2;

    cv::Mat src(rows, cols, CV_32F, const_cast<float*>(image.data()));
    cv::Mat padded;
    cv::copyMakeBorder(src, padded, pad, pad, pad, pad, cv::BORDER_REFLECT_101);

    Matrix2Df votes = Matrix2Df::Zero(rows, cols);
    Eigen::MatrixXi counts = Eigen::MatrixXi::Zero(rows, cols);
    std::vector<float> window;
    for (int r = 0; r < rows; r += stride) {
        for (int c = 0; c < cols; c += stride) {
            const int wr = std::min(window_size, padded.rows - (r + pad));
            const int wc = std::min(window_size, padded.cols - (c + pad));
            window.clear();
            for (int y = 0; y < wr; ++y) {
                const float* p = padded.ptr<float>(r + pad + y) + (c + pad);
                window.insert(window.end(), p, p + wc);
            }
            const float thr = threshold_li(window);

            const int r_end = std::min(r + window_size, rows);
            const int c_end = std::min(c + window_size, cols);
            for (int y = r; y < r_end; ++y) {
                const float* p = padded.ptr<float>(y + pad);
                for (int x = c; x < c_end; ++x) {
                    if (p[x + pad] > thr) votes(y, x) += 1.0f;
                    counts(y, x) += 1;
                }
            }
        }
    }

    MaskFrame mask(rows, cols);
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            mask(y, x) = votes(y, x) / static_cast<float>(counts(y, x)) > 0.5f ? 1 : 0;
        }
    }
    return mask;
}

double feature_intensity_total(const FeatureContext& ctx) {
    check_mask(ctx);
    const Matrix2Df img = corrected(ctx);
    double total = 0.0;
    for (Eigen::Index i = 0; i < img.size(); ++i) {
        if (ctx.mask.data()[i]) total += img.data()[i];
    }
    return total;
}

double feature_particle_num(const FeatureContext& ctx) {
    check_mask(ctx);
    if (ctx.mask.size() == 0 || ctx.mask.cast<int>().sum() == 0) {
        return 0.0;
    }
    const int rows = static_cast<int>(ctx.image.rows());
    const int cols = static_cast<int>(ctx.image.cols());

    Matrix2Df img = ctx.image;
    if (ctx.background) {
        if (ctx.background->rows() != img.rows() || ctx.background->cols() != img.cols()) {
            throw ValidationError("Background crop shape does not match image crop");
        }
        img -= ctx.background_weight * (*ctx.background);
    }
    img = img.cwiseMax(0.0f);
    img = img.cwiseProduct(ctx.mask.cast<float>());

    cv::Mat src(rows, cols, CV_32F, img.data());
    cv::Mat blurred_mat;
    const int ksize = 2 * static_cast<int>(std::lround(4.0 * kGaussianSigma)) + 1;
    cv::GaussianBlur(src, blurred_mat, cv::Size(ksize, ksize), kGaussianSigma, kGaussianSigma,
                     cv::BORDER_REPLICATE);
    Matrix2Df blurred(rows, cols);
    for (int y = 0; y < rows; ++y) {
        std::copy(blurred_mat.ptr<float>(y), blurred_mat.ptr<float>(y) + cols, &blurred(y, 0));
    }

    const int window = std::min(kVotingWindow, std::max(rows, cols));
    const int stride = std::min(kVotingStride, window / 4);
    MaskFrame spots;
    if (stride >= 1) {
        spots = li_voting_mask(blurred, window, stride);
    } else {
        // Crop too small to vote over: mean level inside the cell.
        double sum = 0.0;
        int n = 0;
        for (Eigen::Index i = 0; i < blurred.size(); ++i) {
            if (ctx.mask.data()[i]) {
                sum += blurred.data()[i];
                ++n;
            }
        }
        const float thr = static_cast<float>(sum / n);
        spots = (blurred.array() > thr).cast<uint8_t>().matrix();
    }
    spots = spots.cwiseProduct(ctx.mask);

    const Matrix2Df peaks_image = blurred.cwiseProduct(spots.cast<float>());
    const auto seeds = find_peaks(peaks_image, spots, kPeakMinDistance);
    if (seeds.empty()) {
        return 0.0;
    }
    const auto particles = flood_from_seeds(peaks_image, spots, seeds);

    struct Extent {
        int y0 = std::numeric_limits<int>::max();
        int x0 = std::numeric_limits<int>::max();
        int y1 = -1;
        int x1 = -1;
        float peak = -std::numeric_limits<float>::max();
    };
    std::vector<Extent> extents(seeds.size());
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const int l = particles(y, x);
            if (l == 0) continue;
            Extent& e = extents[static_cast<size_t>(l - 1)];
            e.y0 = std::min(e.y0, y);
            e.x0 = std::min(e.x0, x);
            e.y1 = std::max(e.y1, y);
            e.x1 = std::max(e.x1, x);
            e.peak = std::max(e.peak, img(y, x));
        }
    }

    int count = 0;
    for (const auto& e : extents) {
        if (e.y1 < 0) continue;
        const double radius = 0.25 * static_cast<double>((e.y1 - e.y0 + 1) + (e.x1 - e.x0 + 1));
        if (radius < kMinParticleRadius) continue;
        if (e.peak >= kMinParticleIntensity) ++count;
    }
    return static_cast<double>(count);
}

double feature_area(const FeatureContext& ctx) {
    check_mask(ctx);
    return static_cast<double>((ctx.mask.array() != 0).count());
}

double feature_aspect_ratio(const FeatureContext& ctx) {
    check_mask(ctx);
    double n = 0.0, sy = 0.0, sx = 0.0;
    for (int y = 0; y < ctx.mask.rows(); ++y) {
        for (int x = 0; x < ctx.mask.cols(); ++x) {
            if (!ctx.mask(y, x)) continue;
            n += 1.0;
            sy += y;
            sx += x;
        }
    }
    if (n == 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const double cy = sy / n;
    const double cx = sx / n;
    double myy = 0.0, mxx = 0.0, mxy = 0.0;
    for (int y = 0; y < ctx.mask.rows(); ++y) {
        for (int x = 0; x < ctx.mask.cols(); ++x) {
            if (!ctx.mask(y, x)) continue;
            myy += (y - cy) * (y - cy);
            mxx += (x - cx) * (x - cx);
            mxy += (y - cy) * (x - cx);
        }
    }
    myy /= n;
    mxx /= n;
    mxy /= n;

    const double half_trace = 0.5 * (myy + mxx);
    const double disc = std::sqrt(0.25 * (myy - mxx) * (myy - mxx) + mxy * mxy);
    const double l_major = half_trace + disc;
    const double l_minor = half_trace - disc;
    if (l_minor <= 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return std::sqrt(l_major / l_minor);
}

void register_feature(const std::string& name, FeatureFunction fn) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.functions[name] = std::move(fn);
}

FeatureFunction get_feature(const std::string& name) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    auto it = reg.functions.find(name);
    if (it == reg.functions.end()) {
        std::vector<std::string> known;
        for (const auto& [key, _] : reg.functions) known.push_back(key);
        throw ConfigError("Unknown feature '" + name + "' (available: " + core::join(known, ", ") +
                          ")");
    }
    return it->second;
}

std::vector<std::string> list_features() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    std::vector<std::string> names;
    for (const auto& [key, _] : reg.functions) names.push_back(key);
    return names;
}

} // namespace cellpipe::processing
