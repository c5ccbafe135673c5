#pragma once
#include <mpi.h>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "io/file_codec.hpp"

namespace shardcat {

    // Parsed header of a structured .npy file.
    struct NpyHeader {
        int major = 1;
        int minor = 0;
        std::vector<RecordField> fields;   // padding fields dropped, offsets kept
        int64_t itemsize = 0;
        int64_t rows = 0;
        int64_t data_offset = 0;           // byte offset of the first record
    };

    // Parse the "{'descr': ..., 'fortran_order': ..., 'shape': ...}" dictionary of a .npy
    // header into JSON (dicts -> objects, tuples/lists -> arrays, True/False/None).
    nlohmann::json parse_py_literal(const std::string& text);

    NpyHeader read_npy_header(const std::string& path);

    // Header dictionary text for a record layout (without magic/padding).
    std::string npy_header_dict(const std::vector<RecordField>& fields, int64_t rows);

    // One-dimensional structured NumPy arrays (.npy, format 1.0 / 2.0 / 3.0).
    // Columns are the record fields; there are no attrs.
    class NpyCodec : public FileCodec {
    public:
        std::string name() const override { return "npy"; }
        Packing packing() const override { return Packing::Records; }

        FileHeader read_header(const std::string& path) const override;
        Array read_slice(const std::string& path, const std::string& column, RowRange rows) const override;

        // Records are gathered to rank 0, which writes the file.
        void write_slice(MPI_Comm comm, const std::string& path, const SliceData& data,
            const nlohmann::json& attrs) const override;
    };

} // namespace shardcat
