#include "cellpipe/io/crop_store.hpp"
#include "cellpipe/core/errors.hpp"
#include "cellpipe/core/utils.hpp"

#include <algorithm>
#include <mutex>

namespace cellpipe::io {

namespace {

// libhdf5 is not reentrant unless built thread-safe; every call goes
// through this lock.
std::recursive_mutex& hdf5_mutex() {
    static std::recursive_mutex m;
    return m;
}

// Turns off the HDF5 error stack printer for the current scope.
class ErrorSilencer {
public:
    ErrorSilencer() {
        H5Eget_auto2(H5E_DEFAULT, &old_func_, &old_client_data_);
        H5Eset_auto2(H5E_DEFAULT, nullptr, nullptr);
    }
    ~ErrorSilencer() { H5Eset_auto2(H5E_DEFAULT, old_func_, old_client_data_); }

private:
    H5E_auto2_t old_func_ = nullptr;
    void* old_client_data_ = nullptr;
};

// Owns one hid_t and releases it with the matching close function.
class Handle {
public:
    using Closer = herr_t (*)(hid_t);

    Handle(hid_t id, Closer closer) : id_(id), closer_(closer) {}
    ~Handle() {
        if (id_ >= 0) closer_(id_);
    }
    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    hid_t get() const { return id_; }
    bool valid() const { return id_ >= 0; }

private:
    hid_t id_;
    Closer closer_;
};

Handle checked(hid_t id, Handle::Closer closer, const std::string& what) {
    if (id < 0) {
        throw Hdf5Error(what);
    }
    return Handle(id, closer);
}

Handle create_group(hid_t parent, const std::string& name) {
    return checked(H5Gcreate2(parent, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT),
                   H5Gclose, "Cannot create group " + name);
}

Handle open_group(hid_t parent, const std::string& name) {
    return checked(H5Gopen2(parent, name.c_str(), H5P_DEFAULT), H5Gclose,
                   "Cannot open group " + name);
}

bool link_exists(hid_t parent, const std::string& name) {
    ErrorSilencer quiet;
    return H5Lexists(parent, name.c_str(), H5P_DEFAULT) > 0;
}

template <typename T>
void write_dataset(hid_t parent, const std::string& name, hid_t mem_type, const T* data,
                   const std::vector<hsize_t>& dims, int compression) {
    Handle space = checked(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr),
                           H5Sclose, "Cannot create dataspace for " + name);
    Handle plist = checked(H5Pcreate(H5P_DATASET_CREATE), H5Pclose,
                           "Cannot create property list for " + name);

    const bool chunkable = compression > 0 &&
                           std::all_of(dims.begin(), dims.end(), [](hsize_t d) { return d > 0; });
    if (chunkable) {
        H5Pset_chunk(plist.get(), static_cast<int>(dims.size()), dims.data());
        H5Pset_deflate(plist.get(), static_cast<unsigned>(compression));
    }

    Handle dset = checked(H5Dcreate2(parent, name.c_str(), mem_type, space.get(), H5P_DEFAULT,
                                     plist.get(), H5P_DEFAULT),
                          H5Dclose, "Cannot create dataset " + name);
    size_t count = 1;
    for (hsize_t d : dims) count *= static_cast<size_t>(d);
    if (count > 0 &&
        H5Dwrite(dset.get(), mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, data) < 0) {
        throw Hdf5Error("Cannot write dataset " + name);
    }
}

template <typename T>
std::vector<T> read_dataset(hid_t parent, const std::string& name, hid_t mem_type,
                            std::vector<hsize_t>& dims) {
    Handle dset = checked(H5Dopen2(parent, name.c_str(), H5P_DEFAULT), H5Dclose,
                          "Cannot open dataset " + name);
    Handle space = checked(H5Dget_space(dset.get()), H5Sclose,
                           "Cannot read dataspace of " + name);
    const int rank = H5Sget_simple_extent_ndims(space.get());
    if (rank < 0) {
        throw Hdf5Error("Cannot read rank of " + name);
    }
    dims.assign(static_cast<size_t>(rank), 0);
    if (rank > 0 && H5Sget_simple_extent_dims(space.get(), dims.data(), nullptr) < 0) {
        throw Hdf5Error("Cannot read dimensions of " + name);
    }
    size_t count = 1;
    for (hsize_t d : dims) count *= static_cast<size_t>(d);
    std::vector<T> out(count);
    if (count > 0 &&
        H5Dread(dset.get(), mem_type, H5S_ALL, H5S_ALL, H5P_DEFAULT, out.data()) < 0) {
        throw Hdf5Error("Cannot read dataset " + name);
    }
    return out;
}

herr_t collect_link_name(hid_t, const char* name, const H5L_info_t*, void* op_data) {
    static_cast<std::vector<std::string>*>(op_data)->emplace_back(name);
    return 0;
}

std::vector<std::string> list_links(hid_t group) {
    std::vector<std::string> names;
    if (H5Literate(group, H5_INDEX_NAME, H5_ITER_INC, nullptr, collect_link_name, &names) < 0) {
        throw Hdf5Error("Cannot list group members");
    }
    return names;
}

// frame_0012 -> 12; -1 if the name does not parse
int parse_frame_name(const std::string& name) {
    if (!core::starts_with(name, "frame_")) return -1;
    return core::parse_index(name.substr(6)).value_or(-1);
}

template <typename Matrix>
void write_plane(hid_t parent, const std::string& name, hid_t mem_type, const Matrix& m,
                 int compression) {
    write_dataset(parent, name, mem_type, m.data(),
                  {static_cast<hsize_t>(m.rows()), static_cast<hsize_t>(m.cols())}, compression);
}

template <typename Matrix>
Matrix read_plane(hid_t parent, const std::string& name, hid_t mem_type) {
    using Scalar = typename Matrix::Scalar;
    std::vector<hsize_t> dims;
    auto data = read_dataset<Scalar>(parent, name, mem_type, dims);
    if (dims.size() != 2) {
        throw Hdf5Error("Expected 2D dataset: " + name);
    }
    Matrix m(static_cast<Eigen::Index>(dims[0]), static_cast<Eigen::Index>(dims[1]));
    std::copy(data.begin(), data.end(), m.data());
    return m;
}

template <typename Matrix>
std::map<std::string, std::map<int, Matrix>> read_named_planes(hid_t cell_group,
                                                               const std::string& group_name,
                                                               hid_t mem_type) {
    std::map<std::string, std::map<int, Matrix>> out;
    if (!link_exists(cell_group, group_name)) {
        return out;
    }
    Handle group = open_group(cell_group, group_name);
    for (const auto& channel : list_links(group.get())) {
        Handle ch = open_group(group.get(), channel);
        auto& planes = out[channel];
        for (const auto& frame_name : list_links(ch.get())) {
            const int t = parse_frame_name(frame_name);
            if (t < 0) continue;
            planes.emplace(t, read_plane<Matrix>(ch.get(), frame_name, mem_type));
        }
    }
    return out;
}

} // namespace

std::vector<int> CellCrop::frames() const {
    std::vector<int> out;
    out.reserve(boxes.size());
    for (const auto& b : boxes) out.push_back(b.frame);
    return out;
}

std::string cell_group_name(int cell_id) {
    return "cell_" + core::zero_pad(cell_id, 4);
}

std::string frame_dataset_name(int frame) {
    return "frame_" + core::zero_pad(frame, 4);
}

CropWriter::CropWriter(const fs::path& path, int compression)
    : path_(path), compression_(compression) {
    std::lock_guard<std::recursive_mutex> lock(hdf5_mutex());
    ErrorSilencer quiet;
    file_id_ = H5Fcreate(path.string().c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file_id_ < 0) {
        throw Hdf5Error("Cannot create crop container: " + path.string());
    }
}

CropWriter::~CropWriter() {
    if (file_id_ >= 0) {
        std::lock_guard<std::recursive_mutex> lock(hdf5_mutex());
        H5Fclose(file_id_);
        file_id_ = -1;
    }
}

void CropWriter::write_cell(const CellCrop& cell) {
    std::lock_guard<std::recursive_mutex> lock(hdf5_mutex());
    if (file_id_ < 0) {
        throw Hdf5Error("Crop container is closed: " + path_.string());
    }
    const std::string gname = cell_group_name(cell.cell_id);
    Handle group = create_group(file_id_, gname);

    const hsize_t n = static_cast<hsize_t>(cell.boxes.size());
    std::vector<int32_t> bboxes;
    std::vector<int32_t> frames;
    bboxes.reserve(cell.boxes.size() * 5);
    frames.reserve(cell.boxes.size());
    for (const auto& fb : cell.boxes) {
        bboxes.insert(bboxes.end(), {fb.frame, fb.box.y0, fb.box.x0, fb.box.y1, fb.box.x1});
        frames.push_back(fb.frame);
    }
    write_dataset(group.get(), "bboxes", H5T_NATIVE_INT32, bboxes.data(), {n, 5}, compression_);
    write_dataset(group.get(), "frames", H5T_NATIVE_INT32, frames.data(), {n}, compression_);

    Handle masks = create_group(group.get(), "masks");
    for (const auto& [t, mask] : cell.masks) {
        write_plane(masks.get(), frame_dataset_name(t), H5T_NATIVE_UINT8, mask, compression_);
    }

    Handle channels = create_group(group.get(), "channels");
    for (const auto& [name, planes] : cell.channels) {
        Handle ch = create_group(channels.get(), name);
        for (const auto& [t, plane] : planes) {
            write_plane(ch.get(), frame_dataset_name(t), H5T_NATIVE_UINT16, plane, compression_);
        }
    }

    if (!cell.backgrounds.empty()) {
        Handle backgrounds = create_group(group.get(), "backgrounds");
        for (const auto& [name, planes] : cell.backgrounds) {
            Handle bg = create_group(backgrounds.get(), name);
            for (const auto& [t, plane] : planes) {
                write_plane(bg.get(), frame_dataset_name(t), H5T_NATIVE_FLOAT, plane, compression_);
            }
        }
    }
}

void CropWriter::close() {
    std::lock_guard<std::recursive_mutex> lock(hdf5_mutex());
    if (file_id_ < 0) return;
    const herr_t status = H5Fclose(file_id_);
    file_id_ = -1;
    if (status < 0) {
        throw Hdf5Error("Cannot close crop container: " + path_.string());
    }
}

CropReader::CropReader(const fs::path& path) : path_(path) {
    std::lock_guard<std::recursive_mutex> lock(hdf5_mutex());
    if (!fs::exists(path)) {
        throw Hdf5Error("Crop container not found: " + path.string());
    }
    ErrorSilencer quiet;
    file_id_ = H5Fopen(path.string().c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file_id_ < 0) {
        throw Hdf5Error("Cannot open crop container: " + path.string());
    }
}

CropReader::~CropReader() {
    if (file_id_ >= 0) {
        std::lock_guard<std::recursive_mutex> lock(hdf5_mutex());
        H5Fclose(file_id_);
        file_id_ = -1;
    }
}

std::vector<int> CropReader::cell_ids() const {
    std::lock_guard<std::recursive_mutex> lock(hdf5_mutex());
    std::vector<int> ids;
    for (const auto& name : list_links(file_id_)) {
        if (!core::starts_with(name, "cell_")) continue;
        if (auto id = core::parse_index(name.substr(5))) {
            ids.push_back(*id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

CellCrop CropReader::read_cell(int cell_id) const {
    std::lock_guard<std::recursive_mutex> lock(hdf5_mutex());
    const std::string gname = cell_group_name(cell_id);
    if (!link_exists(file_id_, gname)) {
        throw Hdf5Error("No cell " + std::to_string(cell_id) + " in " + path_.string());
    }
    Handle group = open_group(file_id_, gname);

    CellCrop cell;
    cell.cell_id = cell_id;

    std::vector<hsize_t> dims;
    auto bboxes = read_dataset<int32_t>(group.get(), "bboxes", H5T_NATIVE_INT32, dims);
    if (!bboxes.empty() && (dims.size() != 2 || dims[1] != 5)) {
        throw Hdf5Error("Malformed bboxes for " + gname + " in " + path_.string());
    }
    for (size_t i = 0; i + 4 < bboxes.size(); i += 5) {
        FrameBox fb;
        fb.frame = bboxes[i];
        fb.box = BoundingBox{bboxes[i + 1], bboxes[i + 2], bboxes[i + 3], bboxes[i + 4]};
        cell.boxes.push_back(fb);
    }

    if (link_exists(group.get(), "masks")) {
        Handle masks = open_group(group.get(), "masks");
        for (const auto& name : list_links(masks.get())) {
            const int t = parse_frame_name(name);
            if (t < 0) continue;
            cell.masks.emplace(t, read_plane<MaskFrame>(masks.get(), name, H5T_NATIVE_UINT8));
        }
    }

    cell.channels = read_named_planes<Matrix2Du16>(group.get(), "channels", H5T_NATIVE_UINT16);
    cell.backgrounds = read_named_planes<Matrix2Df>(group.get(), "backgrounds", H5T_NATIVE_FLOAT);
    return cell;
}

} // namespace cellpipe::io
