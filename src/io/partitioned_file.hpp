#pragma once
#include <mpi.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/records.hpp"
#include "common/types.hpp"
#include "io/file_codec.hpp"

namespace shardcat {

    // One contiguous piece of a global row interval that falls inside part 'index'.
    // 'rows' are local to that part.
    struct Segment {
        size_t index = 0;
        RowRange rows;
    };

    // Map the global interval 'global' onto consecutive parts of the given sizes
    // (files of a partitioned file, or ranks of a communicator). Only non-empty pieces
    // are returned, in part order. A boundary equal to global.begin resolves to the part
    // that starts there.
    std::vector<Segment> map_range(const std::vector<int64_t>& part_sizes, RowRange global);

    // Header consolidated over all files; broadcast from root as a value.
    struct MergedHeader {
        std::vector<int64_t> csizes;
        std::vector<std::string> columns;
        nlohmann::json attrs = nlohmann::json::object();
    };

    // Rows of a logical table spread over one or more physical files, seen through the
    // rows [start, stop) assigned to this rank.
    class PartitionedFile {
    public:
        // mode: "", "r", "w" or "rw" (case-insensitive). "r" reads the header now (collective).
        PartitionedFile(MPI_Comm comm,
            std::vector<std::string> paths,
            std::shared_ptr<const FileCodec> codec,
            const std::string& mode = "",
            nlohmann::json attrs = nlohmann::json::object());

        MPI_Comm comm() const { return comm_; }
        int root() const { return root_; }
        bool is_root() const { return rank_ == root_; }

        const std::vector<std::string>& paths() const { return paths_; }
        const FileCodec& codec() const { return *codec_; }
        bool has_header() const { return has_header_; }

        const std::vector<int64_t>& csizes() const { return csizes_; }
        int64_t csize() const { return csize_; }
        int64_t start() const { return start_; }
        int64_t stop() const { return stop_; }
        int64_t size() const { return stop_ - start_; }

        const std::vector<std::string>& columns() const { return columns_; }
        bool has_column(const std::string& name) const;

        const nlohmann::json& attrs() const { return attrs_; }
        nlohmann::json& attrs() { return attrs_; }

        // Collective: root reads every file header, checks schemas, broadcasts.
        void read_header();

        // Local rows of 'column'. Collective only if the header has not been read yet.
        Array read(const std::string& column);

        // Collective. Rows are redistributed evenly over the existing file list.
        // mpiroot: data is held by that rank only and is scattered first.
        void write(const ColumnSet& data, std::optional<int> mpiroot = std::nullopt);
        void write(const RecordArray& data, std::optional<int> mpiroot = std::nullopt);

    private:
        void merge_header(const MergedHeader& h);
        void set_total(int64_t total);
        void write_columns(const ColumnSet& local, const std::vector<std::string>& order);

        MPI_Comm comm_;
        int rank_ = 0;
        int world_ = 1;
        int root_ = 0;

        std::vector<std::string> paths_;
        std::shared_ptr<const FileCodec> codec_;

        bool has_header_ = false;
        std::vector<int64_t> csizes_;
        int64_t csize_ = 0;
        int64_t start_ = 0;
        int64_t stop_ = 0;
        std::vector<std::string> columns_;
        nlohmann::json attrs_;
    };

} // namespace shardcat
