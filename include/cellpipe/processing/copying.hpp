#pragma once

#include "cellpipe/core/cancellation.hpp"
#include "cellpipe/io/microscopy.hpp"

#include <filesystem>
#include <string>

namespace cellpipe::processing {

namespace fs = std::filesystem;

// Copies all frames of (fov, channel) from `reader` into a uint16 cube at
// `dst`. Frames go to partial_path(dst) first and the file is renamed once
// complete. Cancellation is checked before each frame; a cancelled copy
// removes the partial file and returns false.
bool copy_channel(io::FrameReader& reader, int fov, int channel, const fs::path& dst,
                  const core::CancellationToken& cancel, const core::ProgressCallback& progress,
                  const std::string& label);

} // namespace cellpipe::processing
