#include "io/hdf5_codec.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "common/array.hpp"
#include "common/errors.hpp"
#include "mpi/collectives.hpp"

extern "C" {
#include <hdf5.h>
}

namespace fs = std::filesystem;

namespace shardcat {

    using nlohmann::json;

    // ============================ HDF5 helpers ============================

    static inline void h5_check(herr_t status, const std::string& msg) {
        if (status < 0) throw std::runtime_error("HDF5 error: " + msg);
    }

    // Closes an HDF5 identifier on scope exit.
    struct H5Id {
        hid_t id = -1;
        herr_t(*close)(hid_t) = nullptr;
        H5Id(hid_t i, herr_t(*c)(hid_t)) : id(i), close(c) {}
        ~H5Id() { if (id >= 0 && close) close(id); }
        H5Id(const H5Id&) = delete;
        H5Id& operator=(const H5Id&) = delete;
        bool ok() const { return id >= 0; }
        operator hid_t() const { return id; }
    };

    static bool object_exists(hid_t loc, const std::string& path) {
        if (path.empty() || path == "/") return true;
        // walk each level: H5Lexists fails if an intermediate link is missing
        std::string partial;
        size_t pos = (path[0] == '/') ? 1 : 0;
        if (path[0] == '/') partial = "/";
        while (pos <= path.size()) {
            size_t next = path.find('/', pos);
            if (next == std::string::npos) next = path.size();
            if (next > pos) {
                if (!partial.empty() && partial.back() != '/') partial += "/";
                partial += path.substr(pos, next - pos);
                if (H5Lexists(loc, partial.c_str(), H5P_DEFAULT) <= 0) return false;
            }
            pos = next + 1;
        }
        return true;
    }

    static inline size_t safe_strnlen(const char* s, size_t maxlen) {
        size_t n = 0;
        while (n < maxlen && s[n] != '\0') ++n;
        return n;
    }

    // Plain (serial) read-only open; each rank opens independently.
    static hid_t open_file_readonly(const std::string& path) {
        if (!fs::exists(path)) throw NotFound("File not found: " + path);
        if (H5Fis_hdf5(path.c_str()) <= 0) throw Corrupt(path + " is not a readable HDF5 file");
        hid_t file = H5Fopen(path.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
        if (file < 0) throw Corrupt("Failed to open HDF5 file: " + path);
        return file;
    }

    // Boolean columns use the same enum layout as h5py (int8 FALSE=0 / TRUE=1).
    static hid_t create_bool_type() {
        hid_t t = H5Tenum_create(H5T_NATIVE_INT8);
        int8_t v = 0;
        H5Tenum_insert(t, "FALSE", &v);
        v = 1;
        H5Tenum_insert(t, "TRUE", &v);
        return t;
    }

    static hid_t memory_type(DType dtype) {
        switch (dtype) {
        case DType::Bool:    return create_bool_type();
        case DType::Int8:    return H5Tcopy(H5T_NATIVE_INT8);
        case DType::Int16:   return H5Tcopy(H5T_NATIVE_INT16);
        case DType::Int32:   return H5Tcopy(H5T_NATIVE_INT32);
        case DType::Int64:   return H5Tcopy(H5T_NATIVE_INT64);
        case DType::UInt8:   return H5Tcopy(H5T_NATIVE_UINT8);
        case DType::UInt16:  return H5Tcopy(H5T_NATIVE_UINT16);
        case DType::UInt32:  return H5Tcopy(H5T_NATIVE_UINT32);
        case DType::UInt64:  return H5Tcopy(H5T_NATIVE_UINT64);
        case DType::Float32: return H5Tcopy(H5T_NATIVE_FLOAT);
        case DType::Float64: return H5Tcopy(H5T_NATIVE_DOUBLE);
        }
        throw std::runtime_error("No HDF5 type for dtype " + dtype_str(dtype));
    }

    static DType dtype_from_h5(hid_t ftype, const std::string& where) {
        const H5T_class_t cls = H5Tget_class(ftype);
        const size_t sz = H5Tget_size(ftype);
        if (cls == H5T_INTEGER) {
            const bool is_signed = (H5Tget_sign(ftype) == H5T_SGN_2);
            switch (sz) {
            case 1: return is_signed ? DType::Int8 : DType::UInt8;
            case 2: return is_signed ? DType::Int16 : DType::UInt16;
            case 4: return is_signed ? DType::Int32 : DType::UInt32;
            case 8: return is_signed ? DType::Int64 : DType::UInt64;
            default: break;
            }
        }
        else if (cls == H5T_FLOAT) {
            if (sz == 4) return DType::Float32;
            if (sz == 8) return DType::Float64;
        }
        else if (cls == H5T_ENUM) {
            if (sz == 1 && H5Tget_nmembers(ftype) == 2) return DType::Bool;
        }
        throw UnsupportedLayout(where + " has an unsupported HDF5 type (class " + std::to_string((int)cls)
            + ", size " + std::to_string(sz) + ")");
    }

    // Robust attribute-string reader (handles fixed- and variable-length; preserves cset/padding)
    static std::string read_attr_string_safe(hid_t obj, const char* attr_name) {
        if (H5Aexists(obj, attr_name) <= 0) return {};
        hid_t attr = H5Aopen(obj, attr_name, H5P_DEFAULT);
        if (attr < 0) return {};
        hid_t ftype = H5Aget_type(attr);
        if (H5Tget_class(ftype) != H5T_STRING) {
            H5Tclose(ftype); H5Aclose(attr);
            return {};
        }

        std::string out;
        if (H5Tis_variable_str(ftype) > 0) {
            char* s = nullptr;
            hid_t mtype = H5Tcopy(H5T_C_S1);
            H5Tset_size(mtype, H5T_VARIABLE);
            H5Tset_cset(mtype, H5Tget_cset(ftype));
            H5Tset_strpad(mtype, H5Tget_strpad(ftype));
            if (H5Aread(attr, mtype, &s) >= 0) out = s ? s : "";
            if (s) H5free_memory(s);
            H5Tclose(mtype);
        }
        else {
            const size_t sz = H5Tget_size(ftype);
            std::vector<char> buf(sz, 0);
            hid_t mtype = H5Tcopy(H5T_C_S1);
            H5Tset_size(mtype, sz);
            H5Tset_cset(mtype, H5Tget_cset(ftype));
            H5Tset_strpad(mtype, H5Tget_strpad(ftype));
            if (H5Aread(attr, mtype, buf.data()) >= 0) {
                out.assign(buf.data(), safe_strnlen(buf.data(), sz));
                while (!out.empty() && out.back() == ' ') out.pop_back();
            }
            H5Tclose(mtype);
        }

        H5Tclose(ftype);
        H5Aclose(attr);
        return out;
    }

    // One attribute as JSON; false if its type has no JSON counterpart.
    static bool read_attr_json(hid_t obj, const char* name, json& v) {
        H5Id attr(H5Aopen(obj, name, H5P_DEFAULT), H5Aclose);
        if (!attr.ok()) return false;
        H5Id ftype(H5Aget_type(attr), H5Tclose);
        H5Id space(H5Aget_space(attr), H5Sclose);
        const hssize_t npoints = H5Sget_simple_extent_npoints(space);
        const int nd = H5Sget_simple_extent_ndims(space);
        if (npoints <= 0) return false;

        switch (H5Tget_class(ftype)) {
        case H5T_STRING:
            if (npoints != 1) return false;
            v = read_attr_string_safe(obj, name);
            return true;
        case H5T_INTEGER: {
            std::vector<long long> buf((size_t)npoints);
            h5_check(H5Aread(attr, H5T_NATIVE_LLONG, buf.data()), std::string("read attribute ") + name);
            v = (nd == 0) ? json(buf[0]) : json(buf);
            return true;
        }
        case H5T_FLOAT: {
            std::vector<double> buf((size_t)npoints);
            h5_check(H5Aread(attr, H5T_NATIVE_DOUBLE, buf.data()), std::string("read attribute ") + name);
            v = (nd == 0) ? json(buf[0]) : json(buf);
            return true;
        }
        case H5T_ENUM: {
            if (H5Tget_size(ftype) != 1 || npoints != 1) return false;
            int8_t b = 0;
            h5_check(H5Aread(attr, ftype, &b), std::string("read attribute ") + name);
            v = (b != 0);
            return true;
        }
        default:
            return false;
        }
    }

    struct AttrCollector {
        json* out = nullptr;
        std::string error;
    };

    static herr_t collect_attr(hid_t loc, const char* name, const H5A_info_t*, void* op_data) {
        auto* ctx = static_cast<AttrCollector*>(op_data);
        try {
            json v;
            if (read_attr_json(loc, name, v)) (*ctx->out)[name] = std::move(v);
        }
        catch (const std::exception& e) {
            ctx->error = e.what();
            return -1;
        }
        return 0;
    }

    static json read_attrs(hid_t obj, const std::string& where) {
        json out = json::object();
        AttrCollector ctx;
        ctx.out = &out;
        hsize_t idx = 0;
        if (H5Aiterate2(obj, H5_INDEX_NAME, H5_ITER_INC, &idx, collect_attr, &ctx) < 0) {
            throw Corrupt("Cannot read attributes of " + where + (ctx.error.empty() ? "" : ": " + ctx.error));
        }
        return out;
    }

    static void write_attr(hid_t obj, const std::string& name, hid_t type, hid_t space, const void* buf) {
        H5Id attr(H5Acreate2(obj, name.c_str(), type, space, H5P_DEFAULT, H5P_DEFAULT), H5Aclose);
        if (!attr.ok()) throw std::runtime_error("HDF5 error: create attribute " + name);
        h5_check(H5Awrite(attr, type, buf), "write attribute " + name);
    }

    static void write_string_attr(hid_t obj, const std::string& name, const std::string& value) {
        H5Id type(H5Tcopy(H5T_C_S1), H5Tclose);
        H5Tset_size(type, H5T_VARIABLE);
        H5Tset_cset(type, H5T_CSET_UTF8);
        H5Id space(H5Screate(H5S_SCALAR), H5Sclose);
        const char* s = value.c_str();
        write_attr(obj, name, type, space, &s);
    }

    // Scalars map to scalar attributes, flat numeric lists to 1-D attributes;
    // anything else is stored as its JSON text.
    static void write_attrs(hid_t obj, const json& attrs) {
        for (auto it = attrs.begin(); it != attrs.end(); ++it) {
            const std::string& key = it.key();
            const json& v = it.value();
            H5Id scalar(H5Screate(H5S_SCALAR), H5Sclose);

            if (v.is_boolean()) {
                H5Id t(create_bool_type(), H5Tclose);
                int8_t b = v.get<bool>() ? 1 : 0;
                write_attr(obj, key, t, scalar, &b);
            }
            else if (v.is_number_unsigned()) {
                unsigned long long x = v.get<unsigned long long>();
                write_attr(obj, key, H5T_NATIVE_ULLONG, scalar, &x);
            }
            else if (v.is_number_integer()) {
                long long x = v.get<long long>();
                write_attr(obj, key, H5T_NATIVE_LLONG, scalar, &x);
            }
            else if (v.is_number_float()) {
                double x = v.get<double>();
                write_attr(obj, key, H5T_NATIVE_DOUBLE, scalar, &x);
            }
            else if (v.is_string()) {
                write_string_attr(obj, key, v.get<std::string>());
            }
            else if (v.is_array() && !v.empty()
                && std::all_of(v.begin(), v.end(), [](const json& e) { return e.is_number(); })) {
                hsize_t n = v.size();
                H5Id space(H5Screate_simple(1, &n, nullptr), H5Sclose);
                const bool all_int = std::all_of(v.begin(), v.end(), [](const json& e) { return e.is_number_integer(); });
                if (all_int) {
                    std::vector<long long> buf = v.get<std::vector<long long>>();
                    write_attr(obj, key, H5T_NATIVE_LLONG, space, buf.data());
                }
                else {
                    std::vector<double> buf = v.get<std::vector<double>>();
                    write_attr(obj, key, H5T_NATIVE_DOUBLE, space, buf.data());
                }
            }
            else {
                write_string_attr(obj, key, v.dump());
            }
        }
    }

    static hid_t create_group(hid_t file, const std::string& group) {
        if (group == "/") return H5Gopen(file, "/", H5P_DEFAULT);
        H5Id lcpl(H5Pcreate(H5P_LINK_CREATE), H5Pclose);
        H5Pset_create_intermediate_group(lcpl, 1);
        return H5Gcreate2(file, group.c_str(), lcpl, H5P_DEFAULT, H5P_DEFAULT);
    }

    static std::vector<hsize_t> to_hdims(const std::vector<int64_t>& shape) {
        return std::vector<hsize_t>(shape.begin(), shape.end());
    }

    // ============================ codec ============================

    HDF5Codec::HDF5Codec(std::string group) : group_(std::move(group)) {
        // "", "/", "//" all mean the root group
        if (group_.find_first_not_of('/') == std::string::npos) group_ = "/";
        else if (group_[0] != '/') group_ = "/" + group_;
        while (group_.size() > 1 && group_.back() == '/') group_.pop_back();
    }

    std::string HDF5Codec::dataset_path(const std::string& column) const {
        return (group_ == "/") ? "/" + column : group_ + "/" + column;
    }

    FileHeader HDF5Codec::read_header(const std::string& path) const {
        H5Id file(open_file_readonly(path), H5Fclose);
        if (!object_exists(file, group_)) throw NotFound("Group " + group_ + " not found in " + path);

        H5Id obj(H5Oopen(file, group_.c_str(), H5P_DEFAULT), H5Oclose);
        if (!obj.ok() || H5Iget_type(obj) != H5I_GROUP)
            throw UnsupportedLayout(group_ + " in " + path + " is not a group");

        H5G_info_t ginfo;
        h5_check(H5Gget_info(obj, &ginfo), "H5Gget_info " + group_);

        FileHeader h;
        bool first = true;
        for (hsize_t i = 0; i < ginfo.nlinks; ++i) {
            ssize_t len = H5Lget_name_by_idx(obj, ".", H5_INDEX_NAME, H5_ITER_INC, i, nullptr, 0, H5P_DEFAULT);
            if (len < 0) throw Corrupt("Cannot list group " + group_ + " in " + path);
            std::vector<char> buf((size_t)len + 1, 0);
            H5Lget_name_by_idx(obj, ".", H5_INDEX_NAME, H5_ITER_INC, i, buf.data(), buf.size(), H5P_DEFAULT);
            const std::string name(buf.data(), (size_t)len);

            // skip sub-groups and other non-dataset links
            H5Id child(H5Oopen(obj, name.c_str(), H5P_DEFAULT), H5Oclose);
            if (!child.ok() || H5Iget_type(child) != H5I_DATASET) continue;

            H5Id space(H5Dget_space(child), H5Sclose);
            const int nd = H5Sget_simple_extent_ndims(space);
            if (nd < 1) throw UnsupportedLayout("Column " + name + " in " + path + " is a scalar dataset");
            std::vector<hsize_t> dims((size_t)nd);
            H5Sget_simple_extent_dims(space, dims.data(), nullptr);

            if (first) {
                h.size = (int64_t)dims[0];
                first = false;
            }
            else if ((int64_t)dims[0] != h.size) {
                throw Corrupt("Column " + name + " in " + path + " has different length (expected "
                    + std::to_string(h.size) + ", found " + std::to_string(dims[0]) + ")");
            }
            h.columns.push_back(name);
        }

        h.attrs = read_attrs(obj, group_ + " in " + path);
        return h;
    }

    Array HDF5Codec::read_slice(const std::string& path, const std::string& column, RowRange rows) const {
        H5Id file(open_file_readonly(path), H5Fclose);
        const std::string dpath = dataset_path(column);
        if (!object_exists(file, dpath)) throw ColumnNotFound("Column " + column + " not found in " + path);

        H5Id dset(H5Dopen(file, dpath.c_str(), H5P_DEFAULT), H5Dclose);
        if (!dset.ok()) throw Corrupt("Failed to open dataset " + dpath + " in " + path);
        H5Id ftype(H5Dget_type(dset), H5Tclose);
        const DType dtype = dtype_from_h5(ftype, "Column " + column + " in " + path);

        H5Id fspace(H5Dget_space(dset), H5Sclose);
        const int nd = H5Sget_simple_extent_ndims(fspace);
        if (nd < 1) throw UnsupportedLayout("Column " + column + " in " + path + " is a scalar dataset");
        std::vector<hsize_t> dims((size_t)nd);
        H5Sget_simple_extent_dims(fspace, dims.data(), nullptr);

        if (rows.begin < 0 || rows.end > (int64_t)dims[0] || rows.begin > rows.end) {
            throw Corrupt("Rows [" + std::to_string(rows.begin) + ", " + std::to_string(rows.end)
                + ") out of range for column " + column + " in " + path + " (" + std::to_string(dims[0]) + " rows)");
        }

        std::vector<int64_t> itemshape(dims.begin() + 1, dims.end());
        Array out = make_array(dtype, get_shape(rows.size(), itemshape));
        if (out.n_elems() == 0) return out;

        std::vector<hsize_t> start((size_t)nd, 0), count(dims);
        start[0] = (hsize_t)rows.begin;
        count[0] = (hsize_t)rows.size();
        h5_check(H5Sselect_hyperslab(fspace, H5S_SELECT_SET, start.data(), nullptr, count.data(), nullptr),
            "select hyperslab " + dpath);
        H5Id mspace(H5Screate_simple(nd, count.data(), nullptr), H5Sclose);
        H5Id mtype(memory_type(dtype), H5Tclose);
        h5_check(H5Dread(dset, mtype, mspace, fspace, H5P_DEFAULT, out.bytes.data()), "H5Dread " + dpath);
        return out;
    }

#ifdef H5_HAVE_PARALLEL

    void HDF5Codec::write_slice(MPI_Comm comm, const std::string& path, const SliceData& data,
        const json& attrs) const {
        const ColumnSet* cols = std::get_if<ColumnSet>(&data);
        if (!cols) throw std::runtime_error("HDF5 codec expects column packing");

        H5Id fapl(H5Pcreate(H5P_FILE_ACCESS), H5Pclose);
        h5_check(H5Pset_fapl_mpio(fapl, comm, MPI_INFO_NULL), "H5Pset_fapl_mpio");
        H5Id file(H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, fapl), H5Fclose);
        run_on_all(comm, [&]() { if (!file.ok()) throw IOFailure("Cannot create HDF5 file " + path); });

        H5Id grp(create_group(file, group_), H5Gclose);
        run_on_all(comm, [&]() { if (!grp.ok()) throw IOFailure("Cannot create group " + group_ + " in " + path); });
        write_attrs(grp, attrs);

        H5Id dxpl(H5Pcreate(H5P_DATASET_XFER), H5Pclose);
        H5Pset_dxpl_mpio(dxpl, H5FD_MPIO_COLLECTIVE);

        for (const auto& kv : *cols) {
            const Array& local = kv.second;
            const std::vector<int64_t> sizes = allgather_sizes(comm, local.n_rows());
            const std::vector<int64_t> offsets = size_offsets(sizes);
            const int rank = comm_rank(comm);

            std::vector<hsize_t> dims = to_hdims(get_shape(offsets.back(), local.itemshape()));
            H5Id fspace(H5Screate_simple((int)dims.size(), dims.data(), nullptr), H5Sclose);
            H5Id ftype(memory_type(local.dtype), H5Tclose);
            H5Id dset(H5Dcreate2(grp, kv.first.c_str(), ftype, fspace, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT), H5Dclose);
            run_on_all(comm, [&]() { if (!dset.ok()) throw IOFailure("Cannot create dataset " + kv.first + " in " + path); });

            std::vector<hsize_t> start(dims.size(), 0), count = to_hdims(local.shape);
            start[0] = (hsize_t)offsets[(size_t)rank];
            H5Id mspace(H5Screate_simple((int)count.size(), count.data(), nullptr), H5Sclose);
            if (local.n_elems() > 0) {
                H5Sselect_hyperslab(fspace, H5S_SELECT_SET, start.data(), nullptr, count.data(), nullptr);
            }
            else {
                H5Sselect_none(fspace);
                H5Sselect_none(mspace);
            }
            const herr_t st = H5Dwrite(dset, ftype, mspace, fspace, dxpl, local.bytes.data());
            run_on_all(comm, [&]() { if (st < 0) throw IOFailure("Failed writing column " + kv.first + " to " + path); });
        }
    }

#else

    void HDF5Codec::write_slice(MPI_Comm comm, const std::string& path, const SliceData& data,
        const json& attrs) const {
        const ColumnSet* cols = std::get_if<ColumnSet>(&data);
        if (!cols) throw std::runtime_error("HDF5 codec expects column packing");

        // Serial HDF5: gather each column to rank 0, which writes the whole file
        const int root = 0;
        ColumnSet full;
        for (const auto& kv : *cols) {
            Array g = gather_array(comm, kv.second, root);
            if (comm_rank(comm) == root) full[kv.first] = std::move(g);
        }

        run_on_root(comm, root, [&]() {
            H5Id file(H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT), H5Fclose);
            if (!file.ok()) throw IOFailure("Cannot create HDF5 file " + path);
            H5Id grp(create_group(file, group_), H5Gclose);
            if (!grp.ok()) throw IOFailure("Cannot create group " + group_ + " in " + path);
            write_attrs(grp, attrs);

            for (const auto& kv : full) {
                const Array& a = kv.second;
                std::vector<hsize_t> dims = to_hdims(a.shape);
                H5Id fspace(H5Screate_simple((int)dims.size(), dims.data(), nullptr), H5Sclose);
                H5Id ftype(memory_type(a.dtype), H5Tclose);
                H5Id dset(H5Dcreate2(grp, kv.first.c_str(), ftype, fspace, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT), H5Dclose);
                if (!dset.ok()) throw IOFailure("Cannot create dataset " + kv.first + " in " + path);
                if (a.n_elems() > 0) {
                    h5_check(H5Dwrite(dset, ftype, H5S_ALL, H5S_ALL, H5P_DEFAULT, a.bytes.data()),
                        "H5Dwrite " + kv.first + " to " + path);
                }
            }
            h5_check(H5Fflush(file, H5F_SCOPE_GLOBAL), "H5Fflush " + path);
            });
    }

#endif

} // namespace shardcat
