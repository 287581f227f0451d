#include "cellpipe/processing/copying.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"
#include "cellpipe/io/fits_stack.hpp"
#include "cellpipe/io/naming.hpp"

namespace cellpipe::processing {

bool copy_channel(io::FrameReader& reader, int fov, int channel, const fs::path& dst,
                  const core::CancellationToken& cancel, const core::ProgressCallback& progress,
                  const std::string& label) {
    const auto& meta = reader.metadata();
    if (fov < 0 || fov >= meta.n_fovs) {
        throw ValidationError("FOV " + std::to_string(fov) + " out of range (n_fovs=" +
                              std::to_string(meta.n_fovs) + ")");
    }
    if (channel < 0 || channel >= meta.n_channels) {
        throw ValidationError("Channel " + std::to_string(channel) + " out of range (n_channels=" +
                              std::to_string(meta.n_channels) + ")");
    }

    core::PartialFile part(dst, io::partial_path(dst));
    const int n_frames = meta.n_frames;
    bool cancelled = false;
    {
        io::FitsCube out = io::FitsCube::create(part.path(), n_frames, meta.height, meta.width,
                                                io::PixelType::UINT16);
        for (int t = 0; t < n_frames; ++t) {
            if (cancel.is_cancelled()) {
                cancelled = true;
                break;
            }
            const Matrix2Du16 frame = reader.read_frame(fov, channel, t);
            if (frame.rows() != meta.height || frame.cols() != meta.width) {
                throw ValidationError("Frame " + std::to_string(t) + " of fov " +
                                      std::to_string(fov) + " channel " + std::to_string(channel) +
                                      " has an unexpected shape");
            }
            out.write(t, frame);
            core::report(progress, t, n_frames, label);
        }
        out.close();
    }

    if (cancelled) {
        return false;
    }
    part.commit();
    return true;
}

} // namespace cellpipe::processing
