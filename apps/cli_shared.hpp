#pragma once

#include "cellpipe/io/microscopy.hpp"
#include "cellpipe/io/naming.hpp"

#include <nlohmann/json.hpp>

#include <streambuf>

namespace cellpipe::cli {

// Copies the event stream to the console and to the run's event log. The
// log is authoritative: a console write failure is ignored, a log failure
// puts the stream in a failed state. Either side may be null.
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *console, std::streambuf *log);

protected:
  int overflow(int c) override;
  std::streamsize xsputn(const char *s, std::streamsize n) override;
  int sync() override;

private:
  std::streambuf *console_;
  std::streambuf *log_;
};

nlohmann::json metadata_to_json(const io::MicroscopyMetadata &meta);

nlohmann::json artifacts_to_json(const io::FovArtifacts &artifacts);

} // namespace cellpipe::cli
