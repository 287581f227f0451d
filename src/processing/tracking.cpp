#include "cellpipe/processing/tracking.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"
#include "cellpipe/processing/regions.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <mutex>
#include <set>
#include <sstream>

namespace cellpipe::processing {

namespace {

constexpr int kMaxLabel = std::numeric_limits<uint16_t>::max();

int allocate_id(int& next_id) {
    if (next_id > kMaxLabel) {
        throw TrackingError("Cell id space exhausted (more than " + std::to_string(kMaxLabel) +
                            " tracks)");
    }
    return next_id++;
}

LabelFrame relabel(const LabelFrame& current, const std::map<int, int>& mapping) {
    LabelFrame out(current.rows(), current.cols());
    for (Eigen::Index i = 0; i < current.size(); ++i) {
        const int c = current.data()[i];
        if (c == 0) {
            out.data()[i] = 0;
            continue;
        }
        auto it = mapping.find(c);
        out.data()[i] = it == mapping.end() ? 0 : static_cast<uint16_t>(it->second);
    }
    return out;
}

void check_shapes(const io::FitsCube& in, const io::FitsCube& out) {
    if (in.frames() != out.frames() || in.rows() != out.rows() || in.cols() != out.cols()) {
        throw TrackingError("Output stack shape does not match input labels: " +
                            out.path().string());
    }
}

struct TrackerRegistry {
    TrackerRegistry() {
        factories["iou"] = [](const config::ProcessingConfig& cfg) {
            return std::make_unique<IouTracker>(cfg.tracking.iou);
        };
        factories["kalman"] = [](const config::ProcessingConfig& cfg) {
            return std::make_unique<KalmanTracker>(cfg.tracking.kalman);
        };
    }

    std::mutex mutex;
    std::map<std::string, TrackerFactory> factories;
};

TrackerRegistry& registry() {
    static TrackerRegistry reg;
    return reg;
}

} // namespace

// --- IouTracker ---

IouTracker::IouTracker(const config::IouTrackingConfig& cfg) : cfg_(cfg) {
    if (!(cfg_.min_iou > 0.0f && cfg_.min_iou <= 1.0f)) {
        throw TrackingError("iou.min_iou must be in (0,1]");
    }
}

LabelFrame IouTracker::link(const LabelFrame& prev_tracked, const LabelFrame& current) {
    const bool has_prev = prev_tracked.size() > 0;
    if (has_prev && (prev_tracked.rows() != current.rows() || prev_tracked.cols() != current.cols())) {
        throw TrackingError("Frame shape changed between frames");
    }

    std::map<int, int> prev_area;
    std::map<int, int> cur_area;
    std::map<std::pair<int, int>, int> overlap;
    for (Eigen::Index i = 0; i < current.size(); ++i) {
        const int c = current.data()[i];
        const int p = has_prev ? prev_tracked.data()[i] : 0;
        if (c) cur_area[c] += 1;
        if (p) prev_area[p] += 1;
        if (c && p) overlap[{p, c}] += 1;
    }

    struct Candidate {
        double iou;
        int prev;
        int cur;
    };
    std::vector<Candidate> candidates;
    for (const auto& [key, inter] : overlap) {
        const int uni = prev_area[key.first] + cur_area[key.second] - inter;
        const double iou = static_cast<double>(inter) / static_cast<double>(uni);
        if (iou >= cfg_.min_iou) {
            candidates.push_back({iou, key.first, key.second});
        }
    }
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.iou != b.iou) return a.iou > b.iou;
        if (a.prev != b.prev) return a.prev < b.prev;
        return a.cur < b.cur;
    });

    std::map<int, int> mapping;
    std::set<int> used_prev;
    for (const auto& cand : candidates) {
        if (mapping.count(cand.cur) || used_prev.count(cand.prev)) continue;
        mapping[cand.cur] = cand.prev;
        used_prev.insert(cand.prev);
    }
    for (const auto& [label, area] : cur_area) {
        if (!mapping.count(label)) {
            mapping[label] = allocate_id(next_id_);
        }
    }
    return relabel(current, mapping);
}

bool IouTracker::track(const io::FitsCube& labels_in, io::FitsCube& labels_out,
                       const core::CancellationToken& cancel,
                       const core::ProgressCallback& progress) {
    check_shapes(labels_in, labels_out);
    reset();

    LabelFrame prev;
    const int n_frames = labels_in.frames();
    for (int t = 0; t < n_frames; ++t) {
        if (cancel.is_cancelled()) {
            return false;
        }
        LabelFrame tracked = link(prev, labels_in.read_u16(t));
        labels_out.write(t, tracked);
        prev = std::move(tracked);
        core::report(progress, t, n_frames, "Tracking");
    }
    return true;
}

// --- KalmanTracker ---

KalmanTracker::KalmanTracker(const config::KalmanTrackingConfig& cfg) : cfg_(cfg) {
    auto require_positive = [](float v, const char* key) {
        if (!(std::isfinite(v) && v > 0.0f)) {
            std::ostringstream oss;
            oss << "kalman." << key << " must be a positive finite number (got " << v << ")";
            throw TrackingError(oss.str());
        }
    };
    require_positive(cfg_.max_search_radius, "max_search_radius");
    require_positive(cfg_.process_noise, "process_noise");
    require_positive(cfg_.measurement_noise, "measurement_noise");
    if (cfg_.max_lost_frames < 0) {
        throw TrackingError("kalman.max_lost_frames must be >= 0 (got " +
                            std::to_string(cfg_.max_lost_frames) + ")");
    }
}

void KalmanTracker::reset() {
    tracks_.clear();
    next_id_ = 1;
}

void KalmanTracker::predict() {
    Eigen::Matrix4f F = Eigen::Matrix4f::Identity();
    F(0, 2) = 1.0f;
    F(1, 3) = 1.0f;
    const Eigen::Matrix4f Q = Eigen::Matrix4f::Identity() * cfg_.process_noise;

    for (auto& tr : tracks_) {
        tr.state = F * tr.state;
        tr.cov = F * tr.cov * F.transpose() + Q;
    }
}

LabelFrame KalmanTracker::step(const LabelFrame& current) {
    const auto regions = region_stats(current);
    predict();

    struct Candidate {
        float dist;
        size_t track;
        int label;
    };
    std::vector<Candidate> candidates;
    for (size_t i = 0; i < tracks_.size(); ++i) {
        const auto& tr = tracks_[i];
        for (const auto& [label, r] : regions) {
            const float dx = static_cast<float>(r.centroid_x) - tr.state(0);
            const float dy = static_cast<float>(r.centroid_y) - tr.state(1);
            const float dist = std::sqrt(dx * dx + dy * dy);
            if (dist <= cfg_.max_search_radius) {
                candidates.push_back({dist, i, label});
            }
        }
    }
    std::sort(candidates.begin(), candidates.end(), [this](const Candidate& a, const Candidate& b) {
        if (a.dist != b.dist) return a.dist < b.dist;
        if (tracks_[a.track].id != tracks_[b.track].id) return tracks_[a.track].id < tracks_[b.track].id;
        return a.label < b.label;
    });

    Eigen::Matrix<float, 2, 4> H = Eigen::Matrix<float, 2, 4>::Zero();
    H(0, 0) = 1.0f;
    H(1, 1) = 1.0f;
    const Eigen::Matrix2f R =
        Eigen::Matrix2f::Identity() * (cfg_.measurement_noise * cfg_.measurement_noise);

    std::map<int, int> mapping;
    std::vector<bool> matched(tracks_.size(), false);
    for (const auto& cand : candidates) {
        if (matched[cand.track] || mapping.count(cand.label)) continue;
        matched[cand.track] = true;

        Track& tr = tracks_[cand.track];
        const auto& r = regions.at(cand.label);
        const Eigen::Vector2f z(static_cast<float>(r.centroid_x), static_cast<float>(r.centroid_y));
        const Eigen::Vector2f innovation = z - H * tr.state;
        const Eigen::Matrix2f S = H * tr.cov * H.transpose() + R;
        const Eigen::Matrix<float, 4, 2> K = tr.cov * H.transpose() * S.inverse();
        tr.state += K * innovation;
        tr.cov = (Eigen::Matrix4f::Identity() - K * H) * tr.cov;
        tr.lost = 0;

        mapping[cand.label] = tr.id;
    }

    for (size_t i = 0; i < tracks_.size(); ++i) {
        if (!matched[i]) tracks_[i].lost += 1;
    }
    tracks_.erase(std::remove_if(tracks_.begin(), tracks_.end(),
                                 [this](const Track& tr) { return tr.lost > cfg_.max_lost_frames; }),
                  tracks_.end());

    for (const auto& [label, r] : regions) {
        if (mapping.count(label)) continue;
        Track tr;
        tr.id = allocate_id(next_id_);
        tr.state << static_cast<float>(r.centroid_x), static_cast<float>(r.centroid_y), 0.0f, 0.0f;
        tr.cov = Eigen::Matrix4f::Identity();
        tr.cov(0, 0) = tr.cov(1, 1) = cfg_.measurement_noise * cfg_.measurement_noise;
        tr.cov(2, 2) = tr.cov(3, 3) = cfg_.max_search_radius * cfg_.max_search_radius;
        tracks_.push_back(tr);
        mapping[label] = tr.id;
    }

    return relabel(current, mapping);
}

bool KalmanTracker::track(const io::FitsCube& labels_in, io::FitsCube& labels_out,
                          const core::CancellationToken& cancel,
                          const core::ProgressCallback& progress) {
    check_shapes(labels_in, labels_out);
    reset();

    const int n_frames = labels_in.frames();
    for (int t = 0; t < n_frames; ++t) {
        if (cancel.is_cancelled()) {
            return false;
        }
        labels_out.write(t, step(labels_in.read_u16(t)));
        core::report(progress, t, n_frames, "Tracking");
    }
    return true;
}

// --- registry ---

void register_tracker(const std::string& name, TrackerFactory factory) {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.factories[name] = std::move(factory);
}

std::unique_ptr<Tracker> make_tracker(const std::string& name,
                                      const config::ProcessingConfig& cfg) {
    TrackerFactory factory;
    {
        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        auto it = reg.factories.find(name);
        if (it == reg.factories.end()) {
            std::vector<std::string> known;
            for (const auto& [key, _] : reg.factories) known.push_back(key);
            throw ConfigError("Unknown tracking method '" + name + "' (available: " +
                              core::join(known, ", ") + ")");
        }
        factory = it->second;
    }
    return factory(cfg);
}

std::vector<std::string> list_trackers() {
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    std::vector<std::string> names;
    for (const auto& [key, _] : reg.factories) names.push_back(key);
    return names;
}

} // namespace cellpipe::processing
