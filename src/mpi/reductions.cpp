#include "mpi/reductions.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <vector>
#include "common/array.hpp"
#include "mpi/collectives.hpp"

namespace shardcat {

    template <typename T> static MPI_Datatype mpi_type_of();
    template <> MPI_Datatype mpi_type_of<int8_t>() { return MPI_INT8_T; }
    template <> MPI_Datatype mpi_type_of<int16_t>() { return MPI_INT16_T; }
    template <> MPI_Datatype mpi_type_of<int32_t>() { return MPI_INT32_T; }
    template <> MPI_Datatype mpi_type_of<int64_t>() { return MPI_INT64_T; }
    template <> MPI_Datatype mpi_type_of<uint8_t>() { return MPI_UINT8_T; }
    template <> MPI_Datatype mpi_type_of<uint16_t>() { return MPI_UINT16_T; }
    template <> MPI_Datatype mpi_type_of<uint32_t>() { return MPI_UINT32_T; }
    template <> MPI_Datatype mpi_type_of<uint64_t>() { return MPI_UINT64_T; }
    template <> MPI_Datatype mpi_type_of<float>() { return MPI_FLOAT; }
    template <> MPI_Datatype mpi_type_of<double>() { return MPI_DOUBLE; }

    // Array viewed as [outer, len, inner] around the reduced axis.
    struct AxisPlan {
        int64_t outer = 1;
        int64_t len = 1;
        int64_t inner = 1;
        std::vector<int64_t> out_shape;
        bool collective = true;   // reduced axis includes the row axis

        int64_t out_size() const { return outer * inner; }
    };

    static AxisPlan plan_axis(const Array& a, std::optional<int> axis) {
        AxisPlan p;
        if (!axis) {
            p.len = a.n_elems();
            p.out_shape = { 1 };
            return p;
        }
        const int nd = (int)a.shape.size();
        int k = *axis;
        if (k < 0) k += nd;
        if (k < 0 || k >= nd)
            throw std::runtime_error("axis " + std::to_string(*axis) + " is out of range for shape " + shape_str(a.shape));
        for (int i = 0; i < k; ++i) p.outer *= a.shape[(size_t)i];
        p.len = a.shape[(size_t)k];
        for (int i = k + 1; i < nd; ++i) p.inner *= a.shape[(size_t)i];
        for (int i = 0; i < nd; ++i) if (i != k) p.out_shape.push_back(a.shape[(size_t)i]);
        if (p.out_shape.empty()) p.out_shape = { 1 };
        p.collective = (k == 0);
        return p;
    }

    // out[o, i] = op(out[o, i], get(o, l, i)) for l in [0, len).
    template <typename A, typename Get, typename Op>
    static std::vector<A> reduce_axis(const AxisPlan& p, A init, Get get, Op op) {
        std::vector<A> out((size_t)p.out_size(), init);
        for (int64_t o = 0; o < p.outer; ++o) {
            for (int64_t l = 0; l < p.len; ++l) {
                const int64_t base = (o * p.len + l) * p.inner;
                A* dst = out.data() + (size_t)(o * p.inner);
                for (int64_t i = 0; i < p.inner; ++i) dst[i] = op(dst[i], get(base + i));
            }
        }
        return out;
    }

    // Number of reduced elements per output slot, summed over ranks when collective.
    static int64_t reduced_count(MPI_Comm comm, const AxisPlan& p) {
        return p.collective ? allreduce_sum(comm, p.len) : p.len;
    }

    // ------------------------------------------------------------------
    // Sum
    // ------------------------------------------------------------------
    std::optional<Array> sum_array(MPI_Comm comm, const Array& local, std::optional<int> axis) {
        const AxisPlan p = plan_axis(local, axis);
        return dispatch_dtype(local.dtype, [&](auto tag) -> std::optional<Array> {
            using T = decltype(tag);
            using A = std::conditional_t<std::is_floating_point<T>::value, double,
                std::conditional_t<std::is_unsigned<T>::value, uint64_t, int64_t>>;
            const T* src = local.data<T>();
            std::vector<A> part = reduce_axis<A>(p, A(0),
                [&](int64_t i) { return static_cast<A>(src[i]); },
                [](A x, A y) { return x + y; });
            if (p.collective && !part.empty()) {
                MPI_Allreduce(MPI_IN_PLACE, part.data(), (int)part.size(), mpi_type_of<A>(), MPI_SUM, comm);
            }
            Array out = array_from_vector(part, {}, dtype_of<A>());
            out.shape = p.out_shape;
            return out;
            });
    }

    // ------------------------------------------------------------------
    // Min / max
    // ------------------------------------------------------------------
    template <bool IsMin>
    static std::optional<Array> extremum_array(MPI_Comm comm, const Array& local, std::optional<int> axis) {
        const AxisPlan p = plan_axis(local, axis);
        if (reduced_count(comm, p) == 0) return std::nullopt;

        return dispatch_dtype(local.dtype, [&](auto tag) -> std::optional<Array> {
            using T = decltype(tag);
            T init;
            if constexpr (std::numeric_limits<T>::has_infinity) {
                init = IsMin ? std::numeric_limits<T>::infinity() : -std::numeric_limits<T>::infinity();
            }
            else {
                init = IsMin ? std::numeric_limits<T>::max() : std::numeric_limits<T>::lowest();
            }
            const T* src = local.data<T>();
            std::vector<T> part = reduce_axis<T>(p, init,
                [&](int64_t i) { return src[i]; },
                [](T x, T y) { return IsMin ? (y < x ? y : x) : (y > x ? y : x); });
            if (p.collective && !part.empty()) {
                MPI_Allreduce(MPI_IN_PLACE, part.data(), (int)part.size(), mpi_type_of<T>(),
                    IsMin ? MPI_MIN : MPI_MAX, comm);
            }
            Array out = array_from_vector(part, {}, local.dtype);
            out.shape = p.out_shape;
            return out;
            });
    }

    std::optional<Array> min_array(MPI_Comm comm, const Array& local, std::optional<int> axis) {
        return extremum_array<true>(comm, local, axis);
    }

    std::optional<Array> max_array(MPI_Comm comm, const Array& local, std::optional<int> axis) {
        return extremum_array<false>(comm, local, axis);
    }

    // ------------------------------------------------------------------
    // Weighted average
    // ------------------------------------------------------------------
    std::optional<Array> average_array(MPI_Comm comm, const Array& local, const Array* weights,
        std::optional<int> axis) {
        const AxisPlan p = plan_axis(local, axis);

        // Per-element weight lookup; a bad shape on any rank fails all ranks
        const int64_t row_elems = local.row_elems();
        bool per_row = false;
        auto check_weights = [&]() {
            if (!weights) return;
            if (weights->shape == local.shape) {
                per_row = false;
            }
            else if (weights->shape.size() == 1 && weights->n_rows() == local.n_rows()) {
                per_row = true;
            }
            else {
                throw std::runtime_error("Weights of shape " + shape_str(weights->shape)
                    + " do not match column of shape " + shape_str(local.shape));
            }
            };
        if (p.collective) run_on_all(comm, check_weights);
        else check_weights();
        auto weight_at = [&](int64_t i) -> double {
            if (!weights) return 1.0;
            return element_as_double(*weights, per_row ? (row_elems > 0 ? i / row_elems : 0) : i);
            };

        std::vector<double> num = reduce_axis<double>(p, 0.0,
            [&](int64_t i) { return weight_at(i) * element_as_double(local, i); },
            [](double x, double y) { return x + y; });
        std::vector<double> den = reduce_axis<double>(p, 0.0,
            [&](int64_t i) { return weight_at(i); },
            [](double x, double y) { return x + y; });

        if (reduced_count(comm, p) == 0) return std::nullopt;

        if (p.collective && !num.empty()) {
            std::vector<double> buf(num);
            buf.insert(buf.end(), den.begin(), den.end());
            MPI_Allreduce(MPI_IN_PLACE, buf.data(), (int)buf.size(), MPI_DOUBLE, MPI_SUM, comm);
            std::copy(buf.begin(), buf.begin() + (ptrdiff_t)num.size(), num.begin());
            std::copy(buf.begin() + (ptrdiff_t)num.size(), buf.end(), den.begin());
        }

        for (size_t i = 0; i < num.size(); ++i) {
            if (den[i] == 0.0) throw std::runtime_error("Weights sum to zero, cannot normalize average");
            num[i] /= den[i];
        }
        Array out = array_from_vector(num);
        out.shape = p.out_shape;
        return out;
    }

} // namespace shardcat
