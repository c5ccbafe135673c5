#include "common/records.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include "common/array.hpp"

namespace shardcat {

    const RecordField* RecordArray::field(const std::string& name) const {
        for (const auto& f : fields) if (f.name == name) return &f;
        return nullptr;
    }

    int64_t column_set_rows(const ColumnSet& columns) {
        int64_t rows = -1;
        std::string first;
        for (const auto& kv : columns) {
            if (rows < 0) { rows = kv.second.n_rows(); first = kv.first; continue; }
            if (kv.second.n_rows() != rows) {
                throw std::runtime_error("Column " + kv.first + " has " + std::to_string(kv.second.n_rows())
                    + " rows, expected " + std::to_string(rows) + " (as column " + first + ")");
            }
        }
        return rows < 0 ? 0 : rows;
    }

    std::vector<RecordField> record_layout(const ColumnSet& columns,
        const std::vector<std::string>& order, int64_t& itemsize) {
        std::vector<std::string> names = order;
        if (names.empty()) {
            for (const auto& kv : columns) names.push_back(kv.first);
        }
        std::vector<RecordField> fields;
        fields.reserve(names.size());
        itemsize = 0;
        for (const auto& name : names) {
            auto it = columns.find(name);
            if (it == columns.end()) throw std::runtime_error("Cannot pack missing column " + name);
            RecordField f;
            f.name = name;
            f.dtype = it->second.dtype;
            f.itemshape = it->second.itemshape();
            f.offset = itemsize;
            itemsize += it->second.row_bytes();
            fields.push_back(std::move(f));
        }
        return fields;
    }

    RecordArray pack_records(const ColumnSet& columns, const std::vector<std::string>& order) {
        RecordArray out;
        out.fields = record_layout(columns, order, out.itemsize);
        out.n_rows = column_set_rows(columns);
        out.bytes.assign((size_t)(out.n_rows * out.itemsize), 0);

        for (const auto& f : out.fields) {
            const Array& col = columns.at(f.name);
            const size_t rb = (size_t)col.row_bytes();
            if (rb == 0) continue;
            for (int64_t r = 0; r < out.n_rows; ++r) {
                std::memcpy(out.bytes.data() + (size_t)(r * out.itemsize + f.offset),
                    col.bytes.data() + (size_t)r * rb, rb);
            }
        }
        return out;
    }

    Array extract_field(const RecordArray& records, const std::string& name) {
        const RecordField* f = records.field(name);
        if (!f) throw std::runtime_error("Record array has no field " + name);
        Array col = make_array(f->dtype, get_shape(records.n_rows, f->itemshape));
        const size_t rb = (size_t)col.row_bytes();
        if (rb == 0) return col;
        for (int64_t r = 0; r < records.n_rows; ++r) {
            std::memcpy(col.bytes.data() + (size_t)r * rb,
                records.bytes.data() + (size_t)(r * records.itemsize + f->offset), rb);
        }
        return col;
    }

    ColumnSet unpack_records(const RecordArray& records) {
        ColumnSet out;
        for (const auto& f : records.fields) out[f.name] = extract_field(records, f.name);
        return out;
    }

} // namespace shardcat
