#include "cellpipe/core/utils.hpp"
#include "cellpipe/core/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <sstream>

#include <openssl/evp.h>

namespace cellpipe::core {

namespace {

std::tm utc_now(std::chrono::system_clock::time_point now) {
    const auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    return tm_buf;
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtx new_sha256() {
    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw CellpipeError("SHA-256 initialisation failed");
    }
    return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &len) != 1) {
        throw CellpipeError("SHA-256 finalisation failed");
    }
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0f];
    }
    return out;
}

char fold(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

void commit_file(const fs::path& tmp, const fs::path& dst) {
    std::error_code ec;
    fs::rename(tmp, dst, ec);
    if (ec) {
        throw IOError("Cannot move " + tmp.string() + " to " + dst.string() + ": " +
                      ec.message());
    }
}

} // namespace

std::string get_iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const std::tm tm_buf = utc_now(now);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string get_run_id() {
    const std::tm tm_buf = utc_now(std::chrono::system_clock::now());
    std::random_device rd;
    const unsigned suffix = rd() & 0xffffffu;

    std::ostringstream oss;
    oss << "run_" << std::put_time(&tm_buf, "%Y%m%dT%H%M%SZ") << '_'
        << std::hex << std::setfill('0') << std::setw(6) << suffix;
    return oss.str();
}

std::vector<fs::path> discover_files(const fs::path& dir, const std::string& pattern) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return files;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && glob_match(pattern, it->path().filename().string())) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::string read_text(const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream file(path);
    if (!file) {
        throw IOError("Cannot create file: " + path.string());
    }
    file << text;
}

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

PartialFile::PartialFile(fs::path final_path, fs::path tmp_path)
    : final_(std::move(final_path)), tmp_(std::move(tmp_path)) {
    if (final_.has_parent_path()) {
        fs::create_directories(final_.parent_path());
    }
    remove_quietly(tmp_);
}

PartialFile::~PartialFile() {
    if (!committed_) {
        remove_quietly(tmp_);
    }
}

void PartialFile::commit() {
    commit_file(tmp_, final_);
    committed_ = true;
}

std::string sha256_hex(const std::string& data) {
    MdCtx ctx = new_sha256();
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw CellpipeError("SHA-256 update failed");
    }
    return finish_hex(ctx.get());
}

std::string sha256_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Cannot open file: " + path.string());
    }
    MdCtx ctx = new_sha256();
    std::vector<char> chunk(1 << 16);
    while (file) {
        file.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<size_t>(got)) != 1) {
            throw CellpipeError("SHA-256 update failed");
        }
    }
    if (file.bad()) {
        throw IOError("Cannot read file: " + path.string());
    }
    return finish_hex(ctx.get());
}

float median_of(std::vector<float>& v) {
    if (v.empty()) return 0.0f;
    const size_t mid = v.size() / 2;
    auto mid_it = v.begin() + static_cast<std::ptrdiff_t>(mid);
    std::nth_element(v.begin(), mid_it, v.end());
    const float upper = *mid_it;
    if (v.size() % 2 == 1) return upper;
    // lower half is now unordered but all <= upper
    const float lower = *std::max_element(v.begin(), mid_it);
    return 0.5f * (lower + upper);
}

float stddev_of(const std::vector<float>& v) {
    if (v.size() < 2) return 0.0f;
    double mean = 0.0;
    double m2 = 0.0;
    size_t n = 0;
    for (float x : v) {
        ++n;
        const double d = static_cast<double>(x) - mean;
        mean += d / static_cast<double>(n);
        m2 += d * (static_cast<double>(x) - mean);
    }
    const double var = m2 / static_cast<double>(n);
    return var > 0.0 ? static_cast<float>(std::sqrt(var)) : 0.0f;
}

std::string zero_pad(int value, int width) {
    std::string digits = std::to_string(value);
    if (static_cast<int>(digits.size()) < width) {
        digits.insert(0, static_cast<size_t>(width) - digits.size(), '0');
    }
    return digits;
}

std::string to_lower(const std::string& s) {
    std::string out(s.size(), '\0');
    std::transform(s.begin(), s.end(), out.begin(), fold);
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           std::equal(prefix.begin(), prefix.end(), str.begin());
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    if (str.empty()) return parts;
    size_t start = 0;
    for (;;) {
        const size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(str.substr(start));
            break;
        }
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += delimiter;
        out += parts[i];
    }
    return out;
}

std::optional<int> parse_index(const std::string& digits) {
    if (digits.empty() || !std::isdigit(static_cast<unsigned char>(digits.front()))) {
        return std::nullopt;
    }
    int value = 0;
    const char* end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

bool glob_match(const std::string& pattern, const std::string& str) {
    size_t p = 0;
    size_t s = 0;
    size_t star = std::string::npos;
    size_t resume = 0;
    while (s < str.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || fold(pattern[p]) == fold(str[s]))) {
            ++p;
            ++s;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = s;
        } else if (star != std::string::npos) {
            p = star + 1;
            s = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

} // namespace cellpipe::core
