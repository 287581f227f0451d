#pragma once

#include "types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cellpipe::core {

namespace fs = std::filesystem;

// ISO-8601 UTC with milliseconds, e.g. 2024-01-31T12:00:00.123Z
std::string get_iso_timestamp();
// run_<yyyymmdd>T<hhmmss>Z_<6 hex>
std::string get_run_id();

// Regular files in `dir` whose name matches the wildcard `pattern`, sorted.
std::vector<fs::path> discover_files(const fs::path& dir, const std::string& pattern);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Remove a file if present, ignoring a missing file.
void remove_quietly(const fs::path& path);

// Temporary file that is removed on destruction unless committed onto its
// final name.
class PartialFile {
public:
    PartialFile(fs::path final_path, fs::path tmp_path);
    ~PartialFile();

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    const fs::path& path() const { return tmp_; }
    const fs::path& final_path() const { return final_; }
    void commit();

private:
    fs::path final_;
    fs::path tmp_;
    bool committed_ = false;
};

// Lowercase hex SHA-256 digests.
std::string sha256_hex(const std::string& data);
std::string sha256_file(const fs::path& path);

// Math utilities
float median_of(std::vector<float>& v);
float stddev_of(const std::vector<float>& v);

// String utilities
std::string zero_pad(int value, int width);
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Plain decimal digits to int; nullopt for signs, other characters or overflow.
std::optional<int> parse_index(const std::string& digits);

// Case-insensitive wildcard match: '*' any run, '?' one character.
bool glob_match(const std::string& pattern, const std::string& str);

} // namespace cellpipe::core
