#include "cellpipe/io/microscopy.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <optional>
#include <regex>
#include <set>

namespace cellpipe::io {

namespace {

struct SourceEntry {
    std::string base_name;
    int fov = 0;
    int channel = 0;
    fs::path path;
};

std::optional<SourceEntry> parse_source_name(const fs::path& path) {
    static const std::regex re(R"(^(.+)_fov(\d+)_ch(\d+)\.fits$)", std::regex::icase);
    std::smatch m;
    const std::string name = path.filename().string();
    if (!std::regex_match(name, m, re)) {
        return std::nullopt;
    }
    const auto fov = core::parse_index(m[2].str());
    const auto channel = core::parse_index(m[3].str());
    if (!fov || !channel) {
        return std::nullopt;
    }
    SourceEntry e;
    e.base_name = m[1].str();
    e.fov = *fov;
    e.channel = *channel;
    e.path = path;
    return e;
}

// Optional header keywords: CHNAME (channel label), TSTEP (ms per frame).
struct SourceHeader {
    std::string channel_name;
    double frame_interval_ms = 0.0;
};

SourceHeader read_source_header(const fs::path& path) {
    SourceHeader h;
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    char value[FLEN_VALUE];
    int key_status = 0;
    fits_read_key(fptr, TSTRING, const_cast<char*>("CHNAME"), value, nullptr, &key_status);
    if (key_status == 0) {
        h.channel_name = core::trim(value);
    }

    double tstep = 0.0;
    key_status = 0;
    fits_read_key(fptr, TDOUBLE, const_cast<char*>("TSTEP"), &tstep, nullptr, &key_status);
    if (key_status == 0 && tstep > 0.0) {
        h.frame_interval_ms = tstep;
    }

    fits_close_file(fptr, &status);
    return h;
}

} // namespace

fs::path FitsAcquisitionReader::source_path(const fs::path& input_dir,
                                            const std::string& base_name, int fov,
                                            int channel) {
    return input_dir / (base_name + "_fov" + core::zero_pad(fov, 3) + "_ch" +
                        std::to_string(channel) + ".fits");
}

FitsAcquisitionReader::FitsAcquisitionReader(const fs::path& input_dir)
    : input_dir_(input_dir) {
    if (!fs::is_directory(input_dir)) {
        throw IOError("Input directory not found: " + input_dir.string());
    }

    std::vector<SourceEntry> entries;
    for (const auto& p : core::discover_files(input_dir, "*_fov*_ch*.fits")) {
        if (auto e = parse_source_name(p)) {
            entries.push_back(*e);
        }
    }
    if (entries.empty()) {
        throw IOError("No <base>_fov<NNN>_ch<C>.fits cubes in " + input_dir.string());
    }

    std::set<std::string> bases;
    std::set<int> fovs;
    std::set<int> channels;
    for (const auto& e : entries) {
        bases.insert(e.base_name);
        fovs.insert(e.fov);
        channels.insert(e.channel);
    }
    if (bases.size() != 1) {
        throw IOError("Mixed acquisitions in " + input_dir.string() + ": " +
                      core::join(std::vector<std::string>(bases.begin(), bases.end()), ", "));
    }

    metadata_.file_path = input_dir;
    metadata_.base_name = *bases.begin();
    metadata_.file_type = "fits";
    metadata_.n_fovs = *fovs.rbegin() + 1;
    metadata_.n_channels = *channels.rbegin() + 1;

    // Every (fov, channel) pair must be present with one shared shape.
    for (int fov = 0; fov < metadata_.n_fovs; ++fov) {
        for (int ch = 0; ch < metadata_.n_channels; ++ch) {
            const fs::path p = source_path(input_dir, metadata_.base_name, fov, ch);
            if (!fs::exists(p)) {
                throw IOError("Missing source cube: " + p.string());
            }
            auto [frames, rows, cols] = get_cube_shape(p);
            if (fov == 0 && ch == 0) {
                metadata_.n_frames = frames;
                metadata_.height = rows;
                metadata_.width = cols;
            } else if (frames != metadata_.n_frames || rows != metadata_.height ||
                       cols != metadata_.width) {
                throw IOError("Shape mismatch in " + p.string());
            }
        }
    }

    double interval_ms = 0.0;
    for (int ch = 0; ch < metadata_.n_channels; ++ch) {
        SourceHeader h = read_source_header(source_path(input_dir, metadata_.base_name, 0, ch));
        metadata_.channel_names.push_back(h.channel_name.empty() ? "C" + std::to_string(ch)
                                                                 : h.channel_name);
        if (ch == 0) interval_ms = h.frame_interval_ms;
    }
    if (interval_ms > 0.0) {
        metadata_.timepoints.reserve(static_cast<size_t>(metadata_.n_frames));
        for (int t = 0; t < metadata_.n_frames; ++t) {
            metadata_.timepoints.push_back(interval_ms * t);
        }
    }
}

FitsCube& FitsAcquisitionReader::cube_for(int fov, int channel) {
    if (fov != open_fov_) {
        open_cubes_.clear();
        open_fov_ = fov;
    }
    auto it = open_cubes_.find(channel);
    if (it == open_cubes_.end()) {
        FitsCube cube = FitsCube::open(source_path(input_dir_, metadata_.base_name, fov, channel));
        it = open_cubes_.emplace(channel, std::move(cube)).first;
    }
    return it->second;
}

size_t FitsAcquisitionReader::open_cube_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_cubes_.size();
}

Matrix2Du16 FitsAcquisitionReader::read_frame(int fov, int channel, int frame) {
    if (fov < 0 || fov >= metadata_.n_fovs || channel < 0 || channel >= metadata_.n_channels) {
        throw IOError("No source data for fov " + std::to_string(fov) + " channel " +
                      std::to_string(channel));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return cube_for(fov, channel).read_u16(frame);
}

} // namespace cellpipe::io
