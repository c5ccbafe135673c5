#pragma once
#include <mpi.h>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/records.hpp"
#include "common/types.hpp"

namespace shardcat {

    // What a codec reports about one physical file.
    struct FileHeader {
        int64_t size = 0;                      // row count
        std::vector<std::string> columns;
        nlohmann::json attrs = nlohmann::json::object();
    };

    void to_json(nlohmann::json& j, const FileHeader& h);
    void from_json(const nlohmann::json& j, FileHeader& h);

    // Local slice handed to a codec on write, already in the codec's preferred packing.
    using SliceData = std::variant<ColumnSet, RecordArray>;

    // Per-format adapter. read_header / read_slice are called by a single rank and must not
    // communicate; write_slice is collective over 'comm' (every rank passes its own slice,
    // possibly empty) and creates or overwrites the file.
    class FileCodec {
    public:
        virtual ~FileCodec() = default;

        virtual std::string name() const = 0;
        virtual Packing packing() const = 0;

        // Throws NotFound, Corrupt or UnsupportedLayout.
        virtual FileHeader read_header(const std::string& path) const = 0;

        virtual Array read_slice(const std::string& path, const std::string& column, RowRange rows) const = 0;

        virtual void write_slice(MPI_Comm comm, const std::string& path, const SliceData& data,
            const nlohmann::json& attrs) const = 0;
    };

} // namespace shardcat
