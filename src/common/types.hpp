#pragma once
#include <cstdint>
#include <cstring>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shardcat {

	// Element types a column may hold. Strings are not supported (flat numeric columns only).
	enum class DType : int {
		Bool = 0,
		Int8, Int16, Int32, Int64,
		UInt8, UInt16, UInt32, UInt64,
		Float32, Float64
	};

	size_t dtype_size(DType t);

	// NumPy-style type string ("<f8", "|b1", ...) and back.
	std::string dtype_str(DType t);
	DType dtype_from_str(const std::string& s);

	// Dense row-major array. shape[0] is the (local) row count, trailing axes the item shape.
	struct Array {
		DType dtype = DType::Float64;
		std::vector<int64_t> shape{ 0 };
		std::vector<uint8_t> bytes;

		int64_t n_rows() const { return shape.empty() ? 0 : shape[0]; }
		std::vector<int64_t> itemshape() const {
			return shape.empty() ? std::vector<int64_t>{} : std::vector<int64_t>(shape.begin() + 1, shape.end());
		}
		// Number of elements in one row.
		int64_t row_elems() const {
			int64_t n = 1;
			for (size_t i = 1; i < shape.size(); ++i) n *= shape[i];
			return n;
		}
		int64_t row_bytes() const { return row_elems() * (int64_t)dtype_size(dtype); }
		int64_t n_elems() const { return n_rows() * row_elems(); }

		template <typename T>
		T* data() { return reinterpret_cast<T*>(bytes.data()); }
		template <typename T>
		const T* data() const { return reinterpret_cast<const T*>(bytes.data()); }

		// Element i of the flattened array, as T (no conversion, T must match dtype).
		template <typename T>
		T at(int64_t i) const {
			T v;
			std::memcpy(&v, bytes.data() + (size_t)i * sizeof(T), sizeof(T));
			return v;
		}
	};

	// Column name -> local array. Ordered so iteration is identical on every rank.
	using ColumnSet = std::map<std::string, Array>;

	// Half-open row interval [begin, end).
	struct RowRange {
		int64_t begin = 0;
		int64_t end = 0;
		int64_t size() const { return end > begin ? end - begin : 0; }
	};

	// Python slice(start, stop, step); unset members take Python's defaults.
	struct SliceSpec {
		std::optional<int64_t> start;
		std::optional<int64_t> stop;
		std::optional<int64_t> step;
	};

	// Layout a codec prefers to receive on write.
	enum class Packing {
		Columns,   // struct of arrays (ColumnSet)
		Records    // array of structs (RecordArray)
	};

} // namespace shardcat
