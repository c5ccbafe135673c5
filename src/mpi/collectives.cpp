#include "mpi/collectives.hpp"

#include <climits>
#include <stdexcept>
#include "common/array.hpp"
#include "common/errors.hpp"

namespace shardcat {

    using nlohmann::json;

    int comm_rank(MPI_Comm comm) {
        int rank = 0;
        MPI_Comm_rank(comm, &rank);
        return rank;
    }

    int comm_size(MPI_Comm comm) {
        int world = 1;
        MPI_Comm_size(comm, &world);
        return world;
    }

    RowRange partition_bounds(int64_t total, int rank, int world) {
        RowRange r;
        r.begin = (int64_t)rank * total / world;
        r.end = ((int64_t)rank + 1) * total / world;
        return r;
    }

    std::vector<int64_t> allgather_sizes(MPI_Comm comm, int64_t local) {
        std::vector<long long> all((size_t)comm_size(comm), 0);
        long long mine = static_cast<long long>(local);
        MPI_Allgather(&mine, 1, MPI_LONG_LONG, all.data(), 1, MPI_LONG_LONG, comm);
        return std::vector<int64_t>(all.begin(), all.end());
    }

    int64_t allreduce_sum(MPI_Comm comm, int64_t local) {
        long long mine = static_cast<long long>(local), total = 0;
        MPI_Allreduce(&mine, &total, 1, MPI_LONG_LONG, MPI_SUM, comm);
        return static_cast<int64_t>(total);
    }

    std::vector<int64_t> size_offsets(const std::vector<int64_t>& sizes) {
        std::vector<int64_t> off(sizes.size() + 1, 0);
        for (size_t i = 0; i < sizes.size(); ++i) off[i + 1] = off[i] + sizes[i];
        return off;
    }

    // ============================ broadcast ============================

    static std::vector<uint8_t> bcast_bytes(MPI_Comm comm, std::vector<uint8_t> buf, int root) {
        long long n = (long long)buf.size();
        MPI_Bcast(&n, 1, MPI_LONG_LONG, root, comm);
        if (n > INT_MAX) throw std::runtime_error("Broadcast payload too large: " + std::to_string(n) + " bytes");
        buf.resize((size_t)n);
        if (n > 0) MPI_Bcast(buf.data(), (int)n, MPI_BYTE, root, comm);
        return buf;
    }

    json bcast_json(MPI_Comm comm, const json& value, int root) {
        std::vector<uint8_t> buf;
        if (comm_rank(comm) == root) buf = json::to_msgpack(value);
        buf = bcast_bytes(comm, std::move(buf), root);
        return json::from_msgpack(buf);
    }

    std::string bcast_string(MPI_Comm comm, const std::string& value, int root) {
        std::vector<uint8_t> buf;
        if (comm_rank(comm) == root) buf.assign(value.begin(), value.end());
        buf = bcast_bytes(comm, std::move(buf), root);
        return std::string(buf.begin(), buf.end());
    }

    bool bcast_bool(MPI_Comm comm, bool value, int root) {
        int v = value ? 1 : 0;
        MPI_Bcast(&v, 1, MPI_INT, root, comm);
        return v != 0;
    }

    // ============================ scatter / gather ============================

    // One MPI element per row, so counts stay in rows rather than bytes.
    struct RowType {
        MPI_Datatype type = MPI_BYTE;
        bool owned = false;
        explicit RowType(int64_t row_bytes) {
            if (row_bytes <= 0) return;
            if (row_bytes > INT_MAX) throw std::runtime_error("Row of " + std::to_string(row_bytes) + " bytes is too large");
            MPI_Type_contiguous((int)row_bytes, MPI_BYTE, &type);
            MPI_Type_commit(&type);
            owned = true;
        }
        ~RowType() { if (owned) MPI_Type_free(&type); }
        RowType(const RowType&) = delete;
        RowType& operator=(const RowType&) = delete;
    };

    static std::vector<int> to_int_counts(const std::vector<int64_t>& v, const char* what) {
        std::vector<int> out(v.size());
        for (size_t i = 0; i < v.size(); ++i) {
            if (v[i] > INT_MAX) throw std::runtime_error(std::string(what) + " exceeds MPI count limit: " + std::to_string(v[i]));
            out[i] = (int)v[i];
        }
        return out;
    }

    Array scatter_array(MPI_Comm comm, const Array* full, int root) {
        const int rank = comm_rank(comm);
        const int world = comm_size(comm);

        // Describe the array to everyone
        json meta;
        run_on_root(comm, root, [&]() {
            if (!full) throw std::runtime_error("scatter_array: no array on root rank " + std::to_string(root));
            meta = { {"dtype", dtype_str(full->dtype)}, {"shape", full->shape} };
            });
        meta = bcast_json(comm, meta, root);

        const DType dtype = dtype_from_str(meta.at("dtype").get<std::string>());
        const std::vector<int64_t> shape = meta.at("shape").get<std::vector<int64_t>>();
        const int64_t total = shape.empty() ? 0 : shape[0];
        const std::vector<int64_t> itemshape(shape.begin() + (shape.empty() ? 0 : 1), shape.end());

        std::vector<int64_t> counts64((size_t)world), displs64((size_t)world);
        for (int r = 0; r < world; ++r) {
            RowRange b = partition_bounds(total, r, world);
            counts64[(size_t)r] = b.size();
            displs64[(size_t)r] = b.begin;
        }
        const std::vector<int> counts = to_int_counts(counts64, "scatter count");
        const std::vector<int> displs = to_int_counts(displs64, "scatter displacement");

        Array local = make_array(dtype, get_shape(counts64[(size_t)rank], itemshape));
        RowType rt(local.row_bytes());
        if (rt.owned) {
            MPI_Scatterv(rank == root ? full->bytes.data() : nullptr, counts.data(), displs.data(), rt.type,
                local.bytes.data(), counts[(size_t)rank], rt.type, root, comm);
        }
        return local;
    }

    // Every rank must agree on dtype and item shape before rows are exchanged.
    static void check_uniform_layout(MPI_Comm comm, const Array& local) {
        constexpr int kMaxDims = 8;
        const int world = comm_size(comm);
        const auto itemshape = local.itemshape();
        long long desc[kMaxDims + 2] = { 0 };
        desc[0] = static_cast<long long>(local.dtype);
        desc[1] = (itemshape.size() > (size_t)kMaxDims) ? -1 : (long long)itemshape.size();
        for (size_t i = 0; i < itemshape.size() && i < (size_t)kMaxDims; ++i) desc[i + 2] = itemshape[i];

        std::vector<long long> all((size_t)world * (kMaxDims + 2), 0);
        MPI_Allgather(desc, kMaxDims + 2, MPI_LONG_LONG, all.data(), kMaxDims + 2, MPI_LONG_LONG, comm);
        for (int r = 0; r < world; ++r) {
            const long long* d = all.data() + (size_t)r * (kMaxDims + 2);
            if (d[1] < 0)
                throw std::runtime_error("gather_array: rank " + std::to_string(r) + " holds more than "
                    + std::to_string(kMaxDims) + " item dimensions");
            for (int k = 0; k < kMaxDims + 2; ++k) {
                if (d[k] != all[(size_t)k]) {
                    throw std::runtime_error("gather_array: rank " + std::to_string(r)
                        + " holds a different dtype or item shape than rank 0");
                }
            }
        }
    }

    Array gather_array(MPI_Comm comm, const Array& local, int root) {
        const int rank = comm_rank(comm);
        check_uniform_layout(comm, local);

        const std::vector<int64_t> sizes = allgather_sizes(comm, local.n_rows());
        const std::vector<int64_t> offsets = size_offsets(sizes);
        const std::vector<int> counts = to_int_counts(sizes, "gather count");
        const std::vector<int> displs = to_int_counts(std::vector<int64_t>(offsets.begin(), offsets.end() - 1),
            "gather displacement");

        const bool receives = (root == kAllRanks) || (rank == root);
        Array out = make_array(local.dtype, get_shape(receives ? offsets.back() : 0, local.itemshape()));
        RowType rt(local.row_bytes());
        if (!rt.owned) return out;

        if (root == kAllRanks) {
            MPI_Allgatherv(local.bytes.data(), counts[(size_t)rank], rt.type,
                out.bytes.data(), counts.data(), displs.data(), rt.type, comm);
        }
        else {
            MPI_Gatherv(local.bytes.data(), counts[(size_t)rank], rt.type,
                receives ? out.bytes.data() : nullptr, counts.data(), displs.data(), rt.type, root, comm);
        }
        return out;
    }

    // ============================ communicators & errors ============================

    void ensure_same_comm(MPI_Comm a, MPI_Comm b) {
        int result = MPI_UNEQUAL;
        MPI_Comm_compare(a, b, &result);
        if (result != MPI_IDENT) {
            throw CommunicatorMismatch("Catalogs are bound to different MPI communicators (MPI_Comm_compare result "
                + std::to_string(result) + ")");
        }
    }

    static json describe_error(const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        }
        catch (const CatalogError& e) {
            return { {"kind", error_kind_name(e.kind())}, {"what", e.what()} };
        }
        catch (const std::exception& e) {
            return { {"kind", error_kind_name(ErrorKind::Runtime)}, {"what", e.what()} };
        }
        catch (...) {
            return { {"kind", error_kind_name(ErrorKind::Runtime)}, {"what", "unknown error"} };
        }
    }

    static void raise_described(const json& d) {
        raise(error_kind_from_name(d.at("kind").get<std::string>()), d.at("what").get<std::string>());
    }

    void bcast_error(MPI_Comm comm, const std::exception_ptr& error, int root) {
        const bool failed = bcast_bool(comm, (comm_rank(comm) == root) && error != nullptr, root);
        if (!failed) return;
        json d;
        if (comm_rank(comm) == root) d = describe_error(error);
        d = bcast_json(comm, d, root);
        if (comm_rank(comm) == root) std::rethrow_exception(error);
        raise_described(d);
    }

    void sync_error(MPI_Comm comm, const std::exception_ptr& error) {
        const int world = comm_size(comm);
        int mine = error ? comm_rank(comm) : world;
        int first = world;
        MPI_Allreduce(&mine, &first, 1, MPI_INT, MPI_MIN, comm);
        if (first == world) return;
        json d;
        if (comm_rank(comm) == first) d = describe_error(error);
        d = bcast_json(comm, d, first);
        if (error) std::rethrow_exception(error);
        raise_described(d);
    }

} // namespace shardcat
