#include "common/array.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace shardcat {

    // ============================ dtype table ============================

    struct DTypeInfo {
        DType dtype;
        size_t size;
        const char* str;
    };

    static const DTypeInfo kDTypes[] = {
        { DType::Bool,    1, "|b1" },
        { DType::Int8,    1, "|i1" },
        { DType::Int16,   2, "<i2" },
        { DType::Int32,   4, "<i4" },
        { DType::Int64,   8, "<i8" },
        { DType::UInt8,   1, "|u1" },
        { DType::UInt16,  2, "<u2" },
        { DType::UInt32,  4, "<u4" },
        { DType::UInt64,  8, "<u8" },
        { DType::Float32, 4, "<f4" },
        { DType::Float64, 8, "<f8" },
    };

    static const DTypeInfo& info(DType t) {
        for (const auto& d : kDTypes) if (d.dtype == t) return d;
        throw std::runtime_error("Unknown dtype code " + std::to_string(static_cast<int>(t)));
    }

    size_t dtype_size(DType t) { return info(t).size; }

    std::string dtype_str(DType t) { return info(t).str; }

    DType dtype_from_str(const std::string& s) {
        // Accept "=" (native) and, for one-byte types, "<" in place of "|".
        std::string key = s;
        if (!key.empty() && key[0] == '=') key[0] = '<';
        for (const auto& d : kDTypes) {
            std::string ref = d.str;
            if (key == ref) return d.dtype;
            if (ref[0] == '|' && key.size() == ref.size() && key[0] == '<' && key.substr(1) == ref.substr(1))
                return d.dtype;
        }
        throw std::runtime_error("Unsupported dtype string: " + s);
    }

    // ============================ shapes ============================

    std::vector<int64_t> get_shape(int64_t size, const std::vector<int64_t>& itemshape) {
        std::vector<int64_t> shape;
        shape.reserve(itemshape.size() + 1);
        shape.push_back(size);
        shape.insert(shape.end(), itemshape.begin(), itemshape.end());
        return shape;
    }

    std::string shape_str(const std::vector<int64_t>& shape) {
        std::ostringstream os;
        os << "(";
        for (size_t i = 0; i < shape.size(); ++i) {
            if (i) os << ", ";
            os << shape[i];
        }
        if (shape.size() == 1) os << ",";
        os << ")";
        return os.str();
    }

    Array make_array(DType dtype, const std::vector<int64_t>& shape) {
        Array a;
        a.dtype = dtype;
        a.shape = shape.empty() ? std::vector<int64_t>{ 0 } : shape;
        for (auto d : a.shape) {
            if (d < 0) throw std::runtime_error("Negative dimension in shape " + shape_str(a.shape));
        }
        a.bytes.assign((size_t)(a.n_elems() * (int64_t)dtype_size(dtype)), 0);
        return a;
    }

    Array full_array(DType dtype, const std::vector<int64_t>& shape, double value) {
        Array a = make_array(dtype, shape);
        const int64_t n = a.n_elems();
        dispatch_dtype(dtype, [&](auto tag) {
            using T = decltype(tag);
            T v = (dtype == DType::Bool) ? static_cast<T>(value != 0.0) : static_cast<T>(value);
            T* p = a.data<T>();
            for (int64_t i = 0; i < n; ++i) p[i] = v;
            });
        return a;
    }

    double element_as_double(const Array& a, int64_t i) {
        return dispatch_dtype(a.dtype, [&](auto tag) -> double {
            using T = decltype(tag);
            return static_cast<double>(a.at<T>(i));
            });
    }

    Array cast(const Array& a, DType dtype) {
        if (a.dtype == dtype) return a;
        Array out = make_array(dtype, a.shape);
        const int64_t n = a.n_elems();
        dispatch_dtype(a.dtype, [&](auto src_tag) {
            using S = decltype(src_tag);
            const S* src = a.data<S>();
            dispatch_dtype(dtype, [&](auto dst_tag) {
                using D = decltype(dst_tag);
                D* dst = out.data<D>();
                for (int64_t i = 0; i < n; ++i) {
                    dst[i] = (dtype == DType::Bool) ? static_cast<D>(src[i] != S(0)) : static_cast<D>(src[i]);
                }
                });
            });
        return out;
    }

    // ============================ row selection ============================

    Array slice_rows(const Array& a, int64_t begin, int64_t end) {
        const int64_t n = a.n_rows();
        begin = std::clamp<int64_t>(begin, 0, n);
        end = std::clamp<int64_t>(end, begin, n);
        Array out = make_array(a.dtype, get_shape(end - begin, a.itemshape()));
        const size_t rb = (size_t)a.row_bytes();
        if (end > begin && rb > 0) {
            std::memcpy(out.bytes.data(), a.bytes.data() + (size_t)begin * rb, (size_t)(end - begin) * rb);
        }
        return out;
    }

    ResolvedSlice resolve_slice(const SliceSpec& sl, int64_t n) {
        ResolvedSlice r;
        r.step = sl.step.value_or(1);
        if (r.step == 0) throw std::runtime_error("slice step cannot be zero");

        const int64_t lower = (r.step > 0) ? 0 : -1;
        const int64_t upper = (r.step > 0) ? n : n - 1;

        auto adjust = [&](const std::optional<int64_t>& v, int64_t dflt) {
            if (!v) return dflt;
            int64_t x = *v;
            if (x < 0) {
                x += n;
                if (x < lower) x = lower;
            }
            else if (x > upper) {
                x = upper;
            }
            return x;
            };

        r.start = adjust(sl.start, r.step < 0 ? upper : lower);
        const int64_t stop = adjust(sl.stop, r.step < 0 ? lower : upper);

        if (r.step < 0) r.count = (stop < r.start) ? (r.start - stop - 1) / (-r.step) + 1 : 0;
        else            r.count = (r.start < stop) ? (stop - r.start - 1) / r.step + 1 : 0;
        return r;
    }

    Array slice_rows(const Array& a, const SliceSpec& sl) {
        ResolvedSlice r = resolve_slice(sl, a.n_rows());
        if (r.step == 1) return slice_rows(a, r.start, r.start + r.count);
        std::vector<int64_t> rows((size_t)r.count);
        for (int64_t i = 0; i < r.count; ++i) rows[(size_t)i] = r.start + i * r.step;
        return take_rows(a, rows);
    }

    Array take_rows(const Array& a, const std::vector<int64_t>& rows) {
        const int64_t n = a.n_rows();
        Array out = make_array(a.dtype, get_shape((int64_t)rows.size(), a.itemshape()));
        const size_t rb = (size_t)a.row_bytes();
        for (size_t i = 0; i < rows.size(); ++i) {
            int64_t r = rows[i];
            if (r < 0) r += n;
            if (r < 0 || r >= n)
                throw std::out_of_range("Row index " + std::to_string(rows[i]) + " out of range for size " + std::to_string(n));
            if (rb) std::memcpy(out.bytes.data() + i * rb, a.bytes.data() + (size_t)r * rb, rb);
        }
        return out;
    }

    Array mask_rows(const Array& a, const std::vector<uint8_t>& mask) {
        if ((int64_t)mask.size() != a.n_rows())
            throw std::runtime_error("Mask length " + std::to_string(mask.size())
                + " does not match row count " + std::to_string(a.n_rows()));
        std::vector<int64_t> rows;
        for (size_t i = 0; i < mask.size(); ++i) if (mask[i]) rows.push_back((int64_t)i);
        return take_rows(a, rows);
    }

    Array concat_rows(const std::vector<Array>& parts) {
        if (parts.empty()) throw std::runtime_error("concat_rows: nothing to concatenate");
        const DType dtype = parts.front().dtype;
        const auto itemshape = parts.front().itemshape();
        int64_t rows = 0;
        for (const auto& p : parts) {
            if (p.dtype != dtype)
                throw std::runtime_error("concat_rows: dtype " + dtype_str(p.dtype) + " != " + dtype_str(dtype));
            if (p.itemshape() != itemshape)
                throw std::runtime_error("concat_rows: item shape " + shape_str(p.itemshape())
                    + " != " + shape_str(itemshape));
            rows += p.n_rows();
        }
        Array out = make_array(dtype, get_shape(rows, itemshape));
        size_t off = 0;
        for (const auto& p : parts) {
            if (!p.bytes.empty()) std::memcpy(out.bytes.data() + off, p.bytes.data(), p.bytes.size());
            off += p.bytes.size();
        }
        return out;
    }

    Array stack(const std::vector<Array>& parts) {
        if (parts.empty()) throw std::runtime_error("stack: nothing to stack");
        DType dtype = parts.front().dtype;
        for (const auto& p : parts) {
            if (p.shape != parts.front().shape)
                throw std::runtime_error("stack: shape " + shape_str(p.shape) + " != " + shape_str(parts.front().shape));
            if (p.dtype != dtype) dtype = DType::Float64;
        }
        std::vector<int64_t> shape = get_shape((int64_t)parts.size(), parts.front().shape);
        Array out = make_array(dtype, shape);
        size_t off = 0;
        for (const auto& p : parts) {
            Array c = cast(p, dtype);
            if (!c.bytes.empty()) std::memcpy(out.bytes.data() + off, c.bytes.data(), c.bytes.size());
            off += c.bytes.size();
        }
        return out;
    }

    bool array_equal(const Array& a, const Array& b) {
        if (a.shape != b.shape) return false;
        const int64_t n = a.n_elems();
        if (a.dtype == b.dtype) {
            return dispatch_dtype(a.dtype, [&](auto tag) {
                using T = decltype(tag);
                const T* pa = a.data<T>();
                const T* pb = b.data<T>();
                for (int64_t i = 0; i < n; ++i) if (!(pa[i] == pb[i])) return false;
                return true;
                });
        }
        for (int64_t i = 0; i < n; ++i) {
            const long double va = dispatch_dtype(a.dtype, [&](auto tag) -> long double {
                using T = decltype(tag);
                return static_cast<long double>(a.at<T>(i));
                });
            const long double vb = dispatch_dtype(b.dtype, [&](auto tag) -> long double {
                using T = decltype(tag);
                return static_cast<long double>(b.at<T>(i));
                });
            if (!(va == vb)) return false;
        }
        return true;
    }

} // namespace shardcat
