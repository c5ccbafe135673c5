#pragma once
#include <mpi.h>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace shardcat {

    // Pass as 'root' to gather onto every rank.
    constexpr int kAllRanks = -1;

    int comm_rank(MPI_Comm comm);
    int comm_size(MPI_Comm comm);

    // Even contiguous split of 'total' rows: [rank*total/world, (rank+1)*total/world).
    RowRange partition_bounds(int64_t total, int rank, int world);

    // Local sizes of all ranks, in rank order.
    std::vector<int64_t> allgather_sizes(MPI_Comm comm, int64_t local);
    int64_t allreduce_sum(MPI_Comm comm, int64_t local);

    // Exclusive prefix sum of sizes: offsets[r] = sum(sizes[0..r)); offsets.size() == sizes.size()+1.
    std::vector<int64_t> size_offsets(const std::vector<int64_t>& sizes);

    // Root's value is returned on every rank.
    nlohmann::json bcast_json(MPI_Comm comm, const nlohmann::json& value, int root = 0);
    std::string bcast_string(MPI_Comm comm, const std::string& value, int root = 0);
    bool bcast_bool(MPI_Comm comm, bool value, int root = 0);

    // Split an array held on 'root' evenly over all ranks (partition_bounds).
    // 'full' is only read on root and may be null elsewhere.
    Array scatter_array(MPI_Comm comm, const Array* full, int root = 0);

    // Rank-ordered concatenation of every rank's local array on 'root' (or on all ranks
    // with kAllRanks). Non-receiving ranks get a zero-row array of the same dtype.
    // All ranks must hold the same dtype and item shape.
    Array gather_array(MPI_Comm comm, const Array& local, int root = 0);

    // Throws CommunicatorMismatch unless 'a' and 'b' are the same communicator.
    void ensure_same_comm(MPI_Comm a, MPI_Comm b);

    // Propagate the outcome of a step that only 'root' performed: if 'error' (meaningful
    // on root only) is set, every rank throws an exception of the same kind and message.
    void bcast_error(MPI_Comm comm, const std::exception_ptr& error, int root = 0);

    // Same for a step every rank performed: if any rank failed, all ranks throw the
    // error of the lowest failing rank.
    void sync_error(MPI_Comm comm, const std::exception_ptr& error);

    // Run f() on root only and fail on every rank if it throws.
    template <typename F>
    void run_on_root(MPI_Comm comm, int root, F&& f) {
        std::exception_ptr err;
        if (comm_rank(comm) == root) {
            try { f(); }
            catch (...) { err = std::current_exception(); }
        }
        bcast_error(comm, err, root);
    }

    // Run f() on every rank and fail on every rank if any of them throws.
    template <typename F>
    void run_on_all(MPI_Comm comm, F&& f) {
        std::exception_ptr err;
        try { f(); }
        catch (...) { err = std::current_exception(); }
        sync_error(comm, err);
    }

} // namespace shardcat
