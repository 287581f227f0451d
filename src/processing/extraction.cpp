#include "cellpipe/processing/extraction.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/io/crop_store.hpp"
#include "cellpipe/processing/features.hpp"

#include <algorithm>
#include <limits>
#include <map>

namespace cellpipe::processing {

namespace {

std::vector<std::string> sorted_unique(std::vector<std::string> names) {
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

// Midpoint of the occupied row/column extent, in frame coordinates.
void mask_position(const MaskFrame& mask, const BoundingBox& box, double& px, double& py) {
    int r0 = -1, r1 = -1, c0 = -1, c1 = -1;
    for (int y = 0; y < mask.rows(); ++y) {
        for (int x = 0; x < mask.cols(); ++x) {
            if (!mask(y, x)) continue;
            if (r0 < 0) r0 = y;
            r1 = y;
            c0 = c0 < 0 ? x : std::min(c0, x);
            c1 = std::max(c1, x);
        }
    }
    if (r0 < 0) {
        px = 0.5 * (box.x0 + box.x1);
        py = 0.5 * (box.y0 + box.y1);
        return;
    }
    px = box.x0 + 0.5 * (c0 + c1);
    py = box.y0 + 0.5 * (r0 + r1);
}

} // namespace

std::vector<ChannelFeatureConfig> build_channel_configs(const config::ProcessingConfig& cfg) {
    std::vector<ChannelFeatureConfig> out;
    const float weight = std::clamp(cfg.params.background_weight, 0.0f, 1.0f);

    if (cfg.channels.pc && !cfg.channels.pc->features.empty()) {
        ChannelFeatureConfig c;
        c.channel_id = cfg.channels.pc->channel;
        c.channel_name = "pc_ch_" + std::to_string(c.channel_id);
        c.features = sorted_unique(cfg.channels.pc->features);
        c.background_weight = 0.0f;
        c.use_bbox_as_mask = cfg.channels.pc->use_bbox_as_mask;
        out.push_back(std::move(c));
    }
    for (const auto& sel : cfg.channels.fl) {
        if (sel.features.empty()) continue;
        ChannelFeatureConfig c;
        c.channel_id = sel.channel;
        c.channel_name = "fl_ch_" + std::to_string(sel.channel);
        c.background_name = c.channel_name;
        c.features = sorted_unique(sel.features);
        c.background_weight = weight;
        c.use_bbox_as_mask = sel.use_bbox_as_mask;
        out.push_back(std::move(c));
    }

    for (const auto& c : out) {
        for (const auto& f : c.features) {
            get_feature(f);
        }
    }
    return out;
}

std::vector<std::string> feature_columns(const std::vector<ChannelFeatureConfig>& channels) {
    std::vector<std::string> cols;
    for (const auto& c : channels) {
        for (const auto& f : c.features) {
            cols.push_back(f + "_ch_" + std::to_string(c.channel_id));
        }
    }
    return cols;
}

bool extract_traces(const fs::path& crops_path, const std::vector<ChannelFeatureConfig>& channels,
                    int fov, const std::vector<double>& timepoints_ms,
                    const core::CancellationToken& cancel, const core::ProgressCallback& progress,
                    io::FeatureTable& table) {
    table.feature_columns = feature_columns(channels);
    table.rows.clear();

    std::vector<std::vector<FeatureFunction>> functions;
    for (const auto& c : channels) {
        std::vector<FeatureFunction> fns;
        for (const auto& f : c.features) fns.push_back(get_feature(f));
        functions.push_back(std::move(fns));
    }

    io::CropReader reader(crops_path);
    const std::vector<int> ids = reader.cell_ids();
    const int n_cells = static_cast<int>(ids.size());
    const double nan = std::numeric_limits<double>::quiet_NaN();

    for (int idx = 0; idx < n_cells; ++idx) {
        if (cancel.is_cancelled()) {
            return false;
        }
        const io::CellCrop cell = reader.read_cell(ids[static_cast<size_t>(idx)]);

        for (const auto& fb : cell.boxes) {
            auto mask_it = cell.masks.find(fb.frame);
            if (mask_it == cell.masks.end()) continue;
            const MaskFrame& mask = mask_it->second;

            io::TraceRow row;
            row.fov = fov;
            row.cell = cell.cell_id;
            row.frame = fb.frame;
            row.time = fb.frame < static_cast<int>(timepoints_ms.size())
                           ? timepoints_ms[static_cast<size_t>(fb.frame)] / 60000.0
                           : static_cast<double>(fb.frame);
            row.good = true;
            mask_position(mask, fb.box, row.position_x, row.position_y);
            row.bbox_x0 = fb.box.x0;
            row.bbox_y0 = fb.box.y0;
            row.bbox_x1 = fb.box.x1;
            row.bbox_y1 = fb.box.y1;

            for (size_t c = 0; c < channels.size(); ++c) {
                const auto& ch = channels[c];
                const Matrix2Du16* image = nullptr;
                auto ch_it = cell.channels.find(ch.channel_name);
                if (ch_it != cell.channels.end()) {
                    auto f_it = ch_it->second.find(fb.frame);
                    if (f_it != ch_it->second.end()) image = &f_it->second;
                }
                if (!image) {
                    row.features.insert(row.features.end(), ch.features.size(), nan);
                    continue;
                }

                FeatureContext ctx;
                ctx.image = image->cast<float>();
                ctx.mask = ch.use_bbox_as_mask ? MaskFrame::Ones(image->rows(), image->cols())
                                               : mask;
                ctx.background_weight = ch.background_weight;
                if (!ch.background_name.empty()) {
                    auto bg_it = cell.backgrounds.find(ch.background_name);
                    if (bg_it != cell.backgrounds.end()) {
                        auto f_it = bg_it->second.find(fb.frame);
                        if (f_it != bg_it->second.end()) ctx.background = &f_it->second;
                    }
                }

                for (const auto& fn : functions[c]) {
                    row.features.push_back(fn(ctx));
                }
            }
            table.rows.push_back(std::move(row));
        }
        core::report(progress, idx, n_cells, "Extracting features");
    }

    table.sort_rows();
    return true;
}

} // namespace cellpipe::processing
