#pragma once
#include <mpi.h>
#include <optional>
#include "common/types.hpp"

namespace shardcat {

    // Collective reductions of a row-partitioned array.
    //
    // axis == std::nullopt : reduce over all axes -> shape (1,)
    // axis == 0            : reduce over rows of all ranks -> shape = item shape ((1,) if none)
    // axis >= 1            : reduce along an item axis of the local rows; no communication
    //
    // Collective forms return the same result on every rank. std::nullopt means there was
    // nothing to reduce on any rank (min/max/average of zero elements).
    // Sums accumulate integers in 64 bits and floats in double; averages are float64;
    // min/max keep the input dtype.

    std::optional<Array> sum_array(MPI_Comm comm, const Array& local, std::optional<int> axis = 0);

    // Weighted mean; 'weights' is null (all ones), one weight per local row, or the full local shape.
    std::optional<Array> average_array(MPI_Comm comm, const Array& local, const Array* weights = nullptr,
        std::optional<int> axis = 0);

    std::optional<Array> min_array(MPI_Comm comm, const Array& local, std::optional<int> axis = 0);
    std::optional<Array> max_array(MPI_Comm comm, const Array& local, std::optional<int> axis = 0);

} // namespace shardcat
