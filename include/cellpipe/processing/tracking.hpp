#pragma once

#include "cellpipe/config/configuration.hpp"
#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/core/types.hpp"
#include "cellpipe/io/fits_stack.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cellpipe::processing {

// Assigns time-consistent cell ids to a stack of per-frame labels.
//
// Implementations read `labels_in` one frame at a time and write the
// relabelled frame to `labels_out` (same shape). Ids are stable across
// frames, new ids are allocated in increasing order and never reused.
// `cancel` is checked before each frame; returns false if cancelled.
class Tracker {
public:
    virtual ~Tracker() = default;
    virtual std::string name() const = 0;
    virtual bool track(const io::FitsCube& labels_in, io::FitsCube& labels_out,
                       const core::CancellationToken& cancel,
                       const core::ProgressCallback& progress) = 0;
};

// Frame-to-frame linker. A region inherits the id of the previous-frame
// region it overlaps best (IoU >= min_iou); candidate pairs are taken
// greedily by descending IoU, ties going to the lower previous id.
// Unmatched regions get a fresh id.
class IouTracker : public Tracker {
public:
    explicit IouTracker(const config::IouTrackingConfig& cfg);

    std::string name() const override { return "iou"; }
    bool track(const io::FitsCube& labels_in, io::FitsCube& labels_out,
               const core::CancellationToken& cancel,
               const core::ProgressCallback& progress) override;

    // Links one frame against the previous tracked frame.
    LabelFrame link(const LabelFrame& prev_tracked, const LabelFrame& current);
    void reset() { next_id_ = 1; }

private:
    config::IouTrackingConfig cfg_;
    int next_id_ = 1;
};

// Constant-velocity Kalman filter per cell; regions are treated as noisy
// centroid detections and associated to predicted tracks by gated
// nearest-neighbour matching. Suited to cells that move between frames.
class KalmanTracker : public Tracker {
public:
    // Throws TrackingError on invalid parameters.
    explicit KalmanTracker(const config::KalmanTrackingConfig& cfg);

    std::string name() const override { return "kalman"; }
    bool track(const io::FitsCube& labels_in, io::FitsCube& labels_out,
               const core::CancellationToken& cancel,
               const core::ProgressCallback& progress) override;

    LabelFrame step(const LabelFrame& current);
    void reset();

private:
    struct Track {
        int id = 0;
        Eigen::Vector4f state;  // x, y, vx, vy
        Eigen::Matrix4f cov;
        int lost = 0;
    };

    void predict();

    config::KalmanTrackingConfig cfg_;
    std::vector<Track> tracks_;
    int next_id_ = 1;
};

using TrackerFactory =
    std::function<std::unique_ptr<Tracker>(const config::ProcessingConfig&)>;

void register_tracker(const std::string& name, TrackerFactory factory);
std::unique_ptr<Tracker> make_tracker(const std::string& name,
                                      const config::ProcessingConfig& cfg);
std::vector<std::string> list_trackers();

} // namespace cellpipe::processing
