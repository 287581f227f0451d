#include "cellpipe/processing/segmentation.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"

#include <opencv2/opencv.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <mutex>

namespace cellpipe::processing {

namespace {

struct SegmenterRegistry {
    SegmenterRegistry() {
        factories["logstd"] = [](const config::ProcessingConfig& cfg) {
            return std::make_unique<LogStdSegmenter>(cfg.segmentation);
        };
    }

    std::mutex mutex;
    std::map<std::string, SegmenterFactory> factories;
};

SegmenterRegistry& registry() {
    static SegmenterRegistry reg;
    return reg;
}

} // namespace

LogStdSegmenter::LogStdSegmenter(const config::SegmentationConfig& cfg) : cfg_(cfg) {}

LabelFrame LogStdSegmenter::segment(const Matrix2Du16& frame) const {
    Matrix2Df image = frame.cast<float>();
    Matrix2Df logstd = compute_logstd(image, 1);
    const float threshold = mode_threshold(logstd, 200, 3.0f);

    MaskFrame binary = (logstd.array() > threshold).cast<uint8_t>().matrix();
    return label_components(clean_mask(binary), cfg_.min_size, cfg_.max_size);
}

Matrix2Df compute_logstd(const Matrix2Df& image, int radius) {
    const int k = 2 * radius + 1;
    cv::Mat src(static_cast<int>(image.rows()), static_cast<int>(image.cols()), CV_32F,
                const_cast<float*>(image.data()));
    cv::Mat src64;
    src.convertTo(src64, CV_64F);

    cv::Mat mean;
    cv::Mat mean_sq;
    cv::boxFilter(src64, mean, CV_64F, cv::Size(k, k), cv::Point(-1, -1), true,
                  cv::BORDER_REFLECT);
    cv::boxFilter(src64.mul(src64), mean_sq, CV_64F, cv::Size(k, k), cv::Point(-1, -1), true,
                  cv::BORDER_REFLECT);

    Matrix2Df out(image.rows(), image.cols());
    for (int y = 0; y < mean.rows; ++y) {
        const double* m = mean.ptr<double>(y);
        const double* m2 = mean_sq.ptr<double>(y);
        for (int x = 0; x < mean.cols; ++x) {
            const double var = m2[x] - m[x] * m[x];
            out(y, x) = var > 0.0 ? static_cast<float>(0.5 * std::log(var)) : 0.0f;
        }
    }
    return out;
}

float mode_threshold(const Matrix2Df& values, int n_bins, float n_sigma) {
    if (values.size() == 0) return 0.0f;

    const float lo = values.minCoeff();
    const float hi = values.maxCoeff();
    if (!(hi > lo)) {
        return lo;
    }

    const float width = (hi - lo) / static_cast<float>(n_bins);
    std::vector<int> hist(static_cast<size_t>(n_bins), 0);
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        int b = static_cast<int>((values.data()[i] - lo) / width);
        b = std::min(std::max(b, 0), n_bins - 1);
        hist[static_cast<size_t>(b)] += 1;
    }
    const auto peak = std::max_element(hist.begin(), hist.end()) - hist.begin();
    const float mode = lo + (static_cast<float>(peak) + 0.5f) * width;

    std::vector<float> below;
    below.reserve(static_cast<size_t>(values.size()));
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        if (values.data()[i] <= mode) below.push_back(values.data()[i]);
    }
    return mode + n_sigma * core::stddev_of(below);
}

MaskFrame clean_mask(const MaskFrame& mask) {
    const int rows = static_cast<int>(mask.rows());
    const int cols = static_cast<int>(mask.cols());
    cv::Mat bin(rows, cols, CV_8U, const_cast<uint8_t*>(mask.data()));
    cv::Mat fg = bin > 0;

    // Holes are background pixels not reachable from the image border.
    cv::Mat padded;
    cv::copyMakeBorder(fg, padded, 1, 1, 1, 1, cv::BORDER_CONSTANT, cv::Scalar(0));
    cv::floodFill(padded, cv::Point(0, 0), cv::Scalar(255));
    cv::Mat outside = padded(cv::Rect(1, 1, cols, rows));
    cv::Mat filled = fg | ~outside;

    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(7, 7));
    cv::Mat opened;
    cv::Mat closed;
    cv::morphologyEx(filled, opened, cv::MORPH_OPEN, kernel, cv::Point(-1, -1), 3);
    cv::morphologyEx(opened, closed, cv::MORPH_CLOSE, kernel, cv::Point(-1, -1), 3);

    MaskFrame out(rows, cols);
    for (int y = 0; y < rows; ++y) {
        const uint8_t* p = closed.ptr<uint8_t>(y);
        for (int x = 0; x < cols; ++x) {
            out(y, x) = p[x] ? 1 : 0;
        }
    }
    return out;
}

LabelFrame label_components(const MaskFrame& mask, int min_size, int max_size) {
    const int rows = static_cast<int>(mask.rows());
    const int cols = static_cast<int>(mask.cols());
    cv::Mat bin(rows, cols, CV_8U, const_cast<uint8_t*>(mask.data()));

    cv::Mat labels;
    cv::Mat stats;
    cv::Mat centroids;
    const int n = cv::connectedComponentsWithStats(bin, labels, stats, centroids, 4, CV_32S);
    if (n - 1 > std::numeric_limits<uint16_t>::max()) {
        throw PipelineError("Too many components for 16-bit labels: " + std::to_string(n - 1));
    }

    std::vector<uint8_t> keep(static_cast<size_t>(n), 1);
    keep[0] = 0;
    for (int i = 1; i < n; ++i) {
        const int area = stats.at<int>(i, cv::CC_STAT_AREA);
        if ((min_size > 0 && area < min_size) || (max_size > 0 && area > max_size)) {
            keep[static_cast<size_t>(i)] = 0;
        }
    }

    LabelFrame out(rows, cols);
    for (int y = 0; y < rows; ++y) {
        const int* l = labels.ptr<int>(y);
        for (int x = 0; x < cols; ++x) {
            out(y, x) = keep[static_cast<size_t>(l[x])] ? static_cast<uint16_t>(l[x]) : 0;
        }
    }
    return out;
}

bool segment_stack(const Segmenter& segmenter, const io::FitsCube& pc, io::FitsCube& out,
                   const core::CancellationToken& cancel,
                   const core::ProgressCallback& progress) {
    const int n_frames = pc.frames();
    for (int t = 0; t < n_frames; ++t) {
        if (cancel.is_cancelled()) {
            return false;
        }
        out.write(t, segmenter.segment(pc.read_u16(t)));
        core::report(progress, t, n_frames, "Segmentation");
    }
    return true;
}

void register_segmenter(const std::string& name, SegmenterFactory factory) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.factories[name] = std::move(factory);
}

std::unique_ptr<Segmenter> make_segmenter(const std::string& name,
                                          const config::ProcessingConfig& cfg) {
    SegmenterFactory factory;
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        auto it = reg.factories.find(name);
        if (it == reg.factories.end()) {
            std::vector<std::string> known;
            for (const auto& [key, _] : reg.factories) known.push_back(key);
            throw ConfigError("Unknown segmentation method '" + name + "' (available: " +
                              core::join(known, ", ") + ")");
        }
        factory = it->second;
    }
    return factory(cfg);
}

std::vector<std::string> list_segmenters() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    std::vector<std::string> names;
    for (const auto& [key, _] : reg.factories) names.push_back(key);
    return names;
}

} // namespace cellpipe::processing
