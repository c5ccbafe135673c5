#pragma once
#include <mpi.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/records.hpp"
#include "common/types.hpp"
#include "io/file_codec.hpp"
#include "io/partitioned_file.hpp"

namespace shardcat {

    // Column store distributed over the ranks of a communicator. Every rank holds a
    // contiguous block of rows; columns of a backed catalog are read from the source on
    // first access and cached.
    //
    // All methods that take no rank argument must be called by every rank in the same
    // order unless documented as local.
    class Catalog {
    public:
        // Fully materialized; nothing left to read.
        struct Detached {};
        // Columns still to be read from 'file'. 'columns' is what this catalog offers
        // from it (erase() drops names here, the shared file is left alone).
        struct Backed {
            std::shared_ptr<PartitionedFile> file;
            std::vector<std::string> columns;
        };
        using Source = std::variant<Detached, Backed>;

        explicit Catalog(MPI_Comm comm, nlohmann::json attrs = nlohmann::json::object());
        Catalog(MPI_Comm comm, std::shared_ptr<PartitionedFile> source,
            nlohmann::json attrs = nlohmann::json::object());

        // Local data (mpiroot unset) or data held by 'mpiroot' only, scattered evenly.
        static Catalog from_columns(const ColumnSet& data, MPI_Comm comm,
            std::optional<int> mpiroot = std::nullopt, nlohmann::json attrs = nlohmann::json::object());
        static Catalog from_records(const RecordArray& data, MPI_Comm comm,
            std::optional<int> mpiroot = std::nullopt, nlohmann::json attrs = nlohmann::json::object());

        MPI_Comm comm() const { return comm_; }
        int root() const { return root_; }
        bool is_root() const { return rank_ == root_; }

        nlohmann::json& attrs() { return attrs_; }
        const nlohmann::json& attrs() const { return attrs_; }

        const Source& source() const { return source_; }
        bool has_source() const { return std::holds_alternative<Backed>(source_); }

        // ---- column access (local) ----

        // Materialized column, else read from the source. Throws ColumnNotFound.
        const Array& get(const std::string& column) const;
        // 'default_value' if the column is unknown; a failed source read still throws.
        Array get(const std::string& column, const Array& default_value) const;

        // Must match the local size of the other columns.
        void set(const std::string& column, Array value);

        // Removes a materialized column, or stops offering a source column.
        void erase(const std::string& column);

        // Materialized columns only.
        bool contains(const std::string& column) const;

        // Collective. Materialized plus source columns, filtered by glob patterns ('*' matches
        // anything; a pattern matches names starting with it). 'exclude' applies after 'include'.
        std::vector<std::string> columns(const std::vector<std::string>& include = {},
            const std::vector<std::string>& exclude = {}) const;

        // ---- sizes ----

        int64_t size() const;    // local
        int64_t csize() const;   // collective

        // Collective. Global row numbers of the local rows (int64).
        Array cindices() const;

        Array zeros(const std::vector<int64_t>& itemshape = {}, DType dtype = DType::Float64) const;
        Array ones(const std::vector<int64_t>& itemshape = {}, DType dtype = DType::Float64) const;
        Array full(double value, const std::vector<int64_t>& itemshape = {}, DType dtype = DType::Float64) const;
        Array falses(const std::vector<int64_t>& itemshape = {}) const;
        Array trues(const std::vector<int64_t>& itemshape = {}) const;
        Array nans(const std::vector<int64_t>& itemshape = {}) const;

        // ---- global views ----

        // Collective. Whole column, rank order, on 'root' (kAllRanks: everywhere).
        Array cget(const std::string& column, int root = 0) const;

        // Collective. Global Python-style slice, rows re-spread evenly.
        // Gathers every column on root: O(global size) per column.
        Catalog cslice(const SliceSpec& sl) const;
        Catalog cslice(std::optional<int64_t> start, std::optional<int64_t> stop,
            std::optional<int64_t> step = std::nullopt) const;

        // Local row selections (no communication, rows stay on this rank).
        Catalog slice_local(const SliceSpec& sl) const;
        Catalog take_local(const std::vector<int64_t>& rows) const;
        Catalog take_local(const std::vector<uint8_t>& mask) const;

        // Shares the source; columns defaults to all.
        Catalog copy(const std::vector<std::string>& columns = {}) const;

        // Collective. Same column set required (ColumnMismatch); catalogs without columns are
        // skipped. attrs are merged, later catalogs winning.
        // keep_order: global row order of the inputs, one after the other (gather + scatter);
        // otherwise each rank appends its own rows of every input.
        static Catalog concatenate(const std::vector<const Catalog*>& catalogs, bool keep_order = true);
        void extend(const Catalog& other, bool keep_order = true);

        // Collective. Same columns and same gathered values; attrs are ignored.
        bool equals(const Catalog& other) const;
        bool operator==(const Catalog& other) const { return equals(other); }
        bool operator!=(const Catalog& other) const { return !equals(other); }

        // ---- reductions (collective when axis is unset or 0) ----

        std::optional<Array> csum(const std::string& column, std::optional<int> axis = 0) const;
        std::optional<Array> csum(const std::vector<std::string>& columns, std::optional<int> axis = 0) const;
        std::optional<Array> caverage(const std::string& column, const Array* weights = nullptr,
            std::optional<int> axis = 0) const;
        std::optional<Array> caverage(const std::vector<std::string>& columns, const Array* weights = nullptr,
            std::optional<int> axis = 0) const;
        std::optional<Array> cmean(const std::string& column, std::optional<int> axis = 0) const;
        std::optional<Array> cmean(const std::vector<std::string>& columns, std::optional<int> axis = 0) const;
        std::optional<Array> cmin(const std::string& column, std::optional<int> axis = 0) const;
        std::optional<Array> cmin(const std::vector<std::string>& columns, std::optional<int> axis = 0) const;
        std::optional<Array> cmax(const std::string& column, std::optional<int> axis = 0) const;
        std::optional<Array> cmax(const std::vector<std::string>& columns, std::optional<int> axis = 0) const;

        // ---- conversion ----

        // Local rows packed as records; columns defaults to all (collective then).
        RecordArray to_records(const std::vector<std::string>& columns = {}) const;

        // ---- persistence (collective) ----

        static Catalog load_files(MPI_Comm comm, const std::vector<std::string>& paths,
            std::shared_ptr<const FileCodec> codec);
        void save_files(const std::vector<std::string>& paths, std::shared_ptr<const FileCodec> codec) const;

        static Catalog load_hdf5(MPI_Comm comm, const std::vector<std::string>& paths, const std::string& group = "/");
        void save_hdf5(const std::vector<std::string>& paths, const std::string& group = "/") const;
        static Catalog load_npy(MPI_Comm comm, const std::vector<std::string>& paths);
        void save_npy(const std::vector<std::string>& paths) const;

        // Single-file checkpoint of the whole catalog (see checkpoint.hpp); loadable with
        // any number of ranks.
        static Catalog load(const std::string& path, MPI_Comm comm);
        void save(const std::string& path) const;

    private:
        std::optional<Array> reduce_columns(const std::vector<std::string>& columns,
            const std::function<std::optional<Array>(const std::string&)>& reduce) const;
        // Detached catalog with the same comm and attrs holding 'data'.
        Catalog with_data(ColumnSet data) const;

        MPI_Comm comm_;
        int rank_ = 0;
        int root_ = 0;
        nlohmann::json attrs_;
        Source source_;
        // lazily filled from the source
        mutable ColumnSet data_;
    };

} // namespace shardcat
