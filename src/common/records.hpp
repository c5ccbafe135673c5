#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "common/types.hpp"

namespace shardcat {

    struct RecordField {
        std::string name;
        DType dtype = DType::Float64;
        std::vector<int64_t> itemshape;
        int64_t offset = 0;   // byte offset inside one record
    };

    // Packed array of structs: n_rows records of 'itemsize' bytes each, fields laid out
    // back to back in declaration order (NumPy structured dtype without padding).
    struct RecordArray {
        std::vector<RecordField> fields;
        int64_t itemsize = 0;
        int64_t n_rows = 0;
        std::vector<uint8_t> bytes;

        const RecordField* field(const std::string& name) const;
    };

    // Field layout for the given columns (packed, in the given order).
    std::vector<RecordField> record_layout(const ColumnSet& columns,
        const std::vector<std::string>& order, int64_t& itemsize);

    // Struct of arrays -> array of structs. 'order' defaults to the ColumnSet order.
    RecordArray pack_records(const ColumnSet& columns, const std::vector<std::string>& order = {});

    // Array of structs -> struct of arrays.
    ColumnSet unpack_records(const RecordArray& records);

    // One field as a column.
    Array extract_field(const RecordArray& records, const std::string& name);

    // Local row count of a ColumnSet; throws if columns disagree.
    int64_t column_set_rows(const ColumnSet& columns);

} // namespace shardcat
