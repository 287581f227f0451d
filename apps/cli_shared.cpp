#include "cli_shared.hpp"

#include "cellpipe/core/utils.hpp"

#include <filesystem>
#include <map>

namespace cellpipe::cli {

using json = nlohmann::json;

TeeBuf::TeeBuf(std::streambuf *console, std::streambuf *log)
    : console_(console), log_(log) {}

int TeeBuf::overflow(int c) {
  if (traits_type::eq_int_type(c, traits_type::eof()))
    return traits_type::not_eof(c);
  const char ch = traits_type::to_char_type(c);
  if (console_)
    console_->sputc(ch);
  if (log_ && traits_type::eq_int_type(log_->sputc(ch), traits_type::eof()))
    return traits_type::eof();
  return c;
}

std::streamsize TeeBuf::xsputn(const char *s, std::streamsize n) {
  if (console_)
    console_->sputn(s, n);
  return log_ ? log_->sputn(s, n) : n;
}

int TeeBuf::sync() {
  if (console_)
    console_->pubsync();
  return (log_ && log_->pubsync() != 0) ? -1 : 0;
}

json metadata_to_json(const io::MicroscopyMetadata &meta) {
  return {{"file_path", meta.file_path.string()},
          {"base_name", meta.base_name},
          {"file_type", meta.file_type},
          {"height", meta.height},
          {"width", meta.width},
          {"n_frames", meta.n_frames},
          {"n_fovs", meta.n_fovs},
          {"n_channels", meta.n_channels},
          {"timepoints", meta.timepoints},
          {"channel_names", meta.channel_names},
          {"dtype", meta.dtype}};
}

namespace {

json channel_map(const std::map<int, std::filesystem::path> &m) {
  json out = json::object();
  for (const auto &[c, p] : m) {
    out[std::to_string(c)] = p.string();
  }
  return out;
}

} // namespace

json artifacts_to_json(const io::FovArtifacts &a) {
  json j;
  j["fov"] = a.fov;
  j["dir"] = a.dir.string();
  j["pc_frames"] = channel_map(a.pc_frames);
  j["fl_frames"] = channel_map(a.fl_frames);
  j["seg_labeled"] = channel_map(a.seg_labeled);
  j["seg_tracked"] = channel_map(a.seg_tracked);
  j["fl_background"] = channel_map(a.fl_background);
  j["crops"] = a.crops ? json(a.crops->string()) : json(nullptr);
  j["traces"] = a.traces ? json(a.traces->string()) : json(nullptr);
  j["traces_sha256"] =
      a.traces ? json(core::sha256_file(*a.traces)) : json(nullptr);
  return j;
}

} // namespace cellpipe::cli
