#include "cellpipe/processing/cropping.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"
#include "cellpipe/processing/regions.hpp"

#include <opencv2/opencv.hpp>

#include <cstdlib>

namespace cellpipe::processing {

std::map<int, std::vector<FrameBox>> compute_bounding_boxes(const io::FitsCube& tracked,
                                                            int padding) {
    std::map<int, std::vector<FrameBox>> boxes;
    for (int t = 0; t < tracked.frames(); ++t) {
        const LabelFrame labels = tracked.read_u16(t);
        for (const auto& [id, r] : region_stats(labels)) {
            FrameBox fb;
            fb.frame = t;
            fb.box = pad_and_clip(r.box, padding, tracked.rows(), tracked.cols());
            boxes[id].push_back(fb);
        }
    }
    return boxes;
}

void filter_short_tracks(std::map<int, std::vector<FrameBox>>& boxes, int min_frames) {
    for (auto it = boxes.begin(); it != boxes.end();) {
        if (static_cast<int>(it->second.size()) < min_frames) {
            it = boxes.erase(it);
        } else {
            ++it;
        }
    }
}

MaskFrame adjust_mask(const MaskFrame& mask, int margin) {
    if (margin == 0 || mask.size() == 0) {
        return mask;
    }

    const int rows = static_cast<int>(mask.rows());
    const int cols = static_cast<int>(mask.cols());
    const int k = 2 * std::abs(margin) + 1;
    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(k, k));
    cv::Mat src(rows, cols, CV_8U, const_cast<uint8_t*>(mask.data()));
    cv::Mat dst;
    if (margin > 0) {
        cv::dilate(src, dst, kernel, cv::Point(-1, -1), 1, cv::BORDER_CONSTANT, cv::Scalar(0));
    } else {
        cv::erode(src, dst, kernel, cv::Point(-1, -1), 1, cv::BORDER_CONSTANT, cv::Scalar(0));
        if (cv::countNonZero(dst) == 0) {
            return mask;
        }
    }

    MaskFrame out(rows, cols);
    for (int y = 0; y < rows; ++y) {
        const uint8_t* p = dst.ptr<uint8_t>(y);
        for (int x = 0; x < cols; ++x) {
            out(y, x) = p[x] ? 1 : 0;
        }
    }
    return out;
}

bool crop_cells(const io::FitsCube& tracked, const std::vector<CropSource>& sources,
                const CropParams& params, const fs::path& out_path,
                const core::CancellationToken& cancel, const core::ProgressCallback& progress) {
    for (const auto& src : sources) {
        for (const io::FitsCube* cube : {src.frames, src.background}) {
            if (!cube) continue;
            if (cube->frames() != tracked.frames() || cube->rows() != tracked.rows() ||
                cube->cols() != tracked.cols()) {
                throw ValidationError("Stack " + cube->path().string() +
                                      " does not match the tracked segmentation shape");
            }
        }
        if (!src.frames) {
            throw ValidationError("Crop source " + src.name + " has no frame stack");
        }
    }

    if (cancel.is_cancelled()) {
        return false;
    }
    core::report(progress, 0, 3, "Computing bounding boxes");
    auto boxes = compute_bounding_boxes(tracked, params.padding);
    filter_short_tracks(boxes, params.min_frames);

    if (cancel.is_cancelled()) {
        return false;
    }
    core::report(progress, 1, 3, "Extracting crops");

    std::map<int, std::vector<std::pair<int, BoundingBox>>> by_frame;
    std::map<int, io::CellCrop> cells;
    for (const auto& [id, frame_boxes] : boxes) {
        io::CellCrop& cell = cells[id];
        cell.cell_id = id;
        cell.boxes = frame_boxes;
        for (const auto& fb : frame_boxes) {
            by_frame[fb.frame].emplace_back(id, fb.box);
        }
    }

    for (const auto& [t, entries] : by_frame) {
        const LabelFrame labels = tracked.read_u16(t);
        std::vector<Matrix2Du16> planes;
        std::vector<Matrix2Df> bg_planes;
        planes.reserve(sources.size());
        bg_planes.reserve(sources.size());
        for (const auto& src : sources) {
            planes.push_back(src.frames->read_u16(t));
            bg_planes.push_back(src.background ? src.background->read_float(t) : Matrix2Df());
        }

        for (const auto& [id, box] : entries) {
            io::CellCrop& cell = cells[id];
            const auto h = box.height();
            const auto w = box.width();
            MaskFrame mask = (labels.block(box.y0, box.x0, h, w).array() == static_cast<uint16_t>(id))
                                 .cast<uint8_t>()
                                 .matrix();
            cell.masks.emplace(t, adjust_mask(mask, params.mask_margin));

            for (size_t s = 0; s < sources.size(); ++s) {
                cell.channels[sources[s].name].emplace(t, planes[s].block(box.y0, box.x0, h, w));
                if (sources[s].background) {
                    cell.backgrounds[sources[s].name].emplace(t, bg_planes[s].block(box.y0, box.x0, h, w));
                }
            }
        }
    }

    io::CropWriter writer(out_path);
    for (const auto& [id, cell] : cells) {
        if (cancel.is_cancelled()) {
            writer.close();
            core::remove_quietly(out_path);
            return false;
        }
        writer.write_cell(cell);
    }
    writer.close();
    core::report(progress, 2, 3, "Done");
    return true;
}

} // namespace cellpipe::processing
