#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include "common/types.hpp"

namespace shardcat {

    template <typename T> constexpr DType dtype_of();
    template <> constexpr DType dtype_of<int8_t>() { return DType::Int8; }
    template <> constexpr DType dtype_of<int16_t>() { return DType::Int16; }
    template <> constexpr DType dtype_of<int32_t>() { return DType::Int32; }
    template <> constexpr DType dtype_of<int64_t>() { return DType::Int64; }
    template <> constexpr DType dtype_of<uint8_t>() { return DType::UInt8; }
    template <> constexpr DType dtype_of<uint16_t>() { return DType::UInt16; }
    template <> constexpr DType dtype_of<uint32_t>() { return DType::UInt32; }
    template <> constexpr DType dtype_of<uint64_t>() { return DType::UInt64; }
    template <> constexpr DType dtype_of<float>() { return DType::Float32; }
    template <> constexpr DType dtype_of<double>() { return DType::Float64; }

    // Call f(T{}) with the C++ storage type of 't'. Bool is stored as one byte (0/1).
    template <typename F>
    decltype(auto) dispatch_dtype(DType t, F&& f) {
        switch (t) {
        case DType::Bool:    return f(uint8_t{});
        case DType::Int8:    return f(int8_t{});
        case DType::Int16:   return f(int16_t{});
        case DType::Int32:   return f(int32_t{});
        case DType::Int64:   return f(int64_t{});
        case DType::UInt8:   return f(uint8_t{});
        case DType::UInt16:  return f(uint16_t{});
        case DType::UInt32:  return f(uint32_t{});
        case DType::UInt64:  return f(uint64_t{});
        case DType::Float32: return f(float{});
        case DType::Float64: return f(double{});
        }
        throw std::runtime_error("Unknown dtype code " + std::to_string(static_cast<int>(t)));
    }

    // Join local size and item shape into a full shape.
    std::vector<int64_t> get_shape(int64_t size, const std::vector<int64_t>& itemshape);
    std::string shape_str(const std::vector<int64_t>& shape);

    // Zero-filled array of the given shape.
    Array make_array(DType dtype, const std::vector<int64_t>& shape);
    Array full_array(DType dtype, const std::vector<int64_t>& shape, double value);

    template <typename T>
    Array array_from_vector(const std::vector<T>& values,
        const std::vector<int64_t>& itemshape = {},
        DType dtype = dtype_of<T>()) {
        static_assert(std::is_arithmetic<T>::value, "numeric element type required");
        int64_t per_row = 1;
        for (auto d : itemshape) per_row *= d;
        const int64_t rows = per_row > 0 ? (int64_t)values.size() / per_row : 0;
        if (rows * per_row != (int64_t)values.size())
            throw std::runtime_error("array_from_vector: " + std::to_string(values.size())
                + " values do not fill item shape " + shape_str(itemshape));
        if (dtype_size(dtype) != sizeof(T))
            throw std::runtime_error("array_from_vector: element size does not match dtype " + dtype_str(dtype));
        Array a = make_array(dtype, get_shape(rows, itemshape));
        if (!values.empty()) std::memcpy(a.bytes.data(), values.data(), values.size() * sizeof(T));
        return a;
    }

    template <typename T>
    std::vector<T> array_to_vector(const Array& a) {
        if (dtype_size(a.dtype) != sizeof(T))
            throw std::runtime_error("array_to_vector: element size does not match dtype " + dtype_str(a.dtype));
        std::vector<T> out((size_t)a.n_elems());
        if (!out.empty()) std::memcpy(out.data(), a.bytes.data(), out.size() * sizeof(T));
        return out;
    }

    // Flattened element i converted to double.
    double element_as_double(const Array& a, int64_t i);

    Array cast(const Array& a, DType dtype);

    // Rows [begin, end) (clipped).
    Array slice_rows(const Array& a, int64_t begin, int64_t end);

    // Python slice semantics: resolved start, step and number of selected rows.
    struct ResolvedSlice {
        int64_t start = 0;
        int64_t step = 1;
        int64_t count = 0;
    };
    ResolvedSlice resolve_slice(const SliceSpec& sl, int64_t n);
    Array slice_rows(const Array& a, const SliceSpec& sl);

    Array take_rows(const Array& a, const std::vector<int64_t>& rows);
    Array mask_rows(const Array& a, const std::vector<uint8_t>& mask);

    // Concatenate along the first axis. All parts must share dtype and item shape.
    Array concat_rows(const std::vector<Array>& parts);

    // New leading axis; parts must share shape. Mixed dtypes are promoted to float64.
    Array stack(const std::vector<Array>& parts);

    // Same shape and element-wise equal values (NaN never compares equal).
    bool array_equal(const Array& a, const Array& b);

} // namespace shardcat
