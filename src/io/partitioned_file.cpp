#include "io/partitioned_file.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <sstream>
#include <stdexcept>
#include "common/array.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "mpi/collectives.hpp"

namespace fs = std::filesystem;

namespace shardcat {

    using nlohmann::json;

    // ============================ header (de)serialization ============================

    void to_json(json& j, const FileHeader& h) {
        j = json{ {"size", h.size}, {"columns", h.columns}, {"attrs", h.attrs} };
    }

    void from_json(const json& j, FileHeader& h) {
        j.at("size").get_to(h.size);
        j.at("columns").get_to(h.columns);
        h.attrs = j.value("attrs", json::object());
    }

    static json merged_to_json(const MergedHeader& h) {
        return json{ {"csizes", h.csizes}, {"columns", h.columns}, {"attrs", h.attrs} };
    }

    static MergedHeader merged_from_json(const json& j) {
        MergedHeader h;
        j.at("csizes").get_to(h.csizes);
        j.at("columns").get_to(h.columns);
        h.attrs = j.at("attrs");
        return h;
    }

    // ============================ range mapping ============================

    std::vector<Segment> map_range(const std::vector<int64_t>& part_sizes, RowRange global) {
        std::vector<Segment> out;
        if (part_sizes.empty() || global.size() == 0) return out;

        std::vector<int64_t> ends(part_sizes.size());
        int64_t acc = 0;
        for (size_t i = 0; i < part_sizes.size(); ++i) {
            acc += part_sizes[i];
            ends[i] = acc;
        }

        // first part ending after 'begin'; first part ending at or after 'end'
        size_t first = (size_t)(std::upper_bound(ends.begin(), ends.end(), global.begin) - ends.begin());
        size_t last = (size_t)(std::lower_bound(ends.begin(), ends.end(), global.end) - ends.begin());
        last = std::min(last, part_sizes.size() - 1);

        for (size_t i = first; i <= last && i < part_sizes.size(); ++i) {
            const int64_t cumstart = (i == 0) ? 0 : ends[i - 1];
            Segment s;
            s.index = i;
            s.rows.begin = std::max<int64_t>(global.begin - cumstart, 0);
            s.rows.end = std::min<int64_t>(global.end - cumstart, part_sizes[i]);
            if (s.rows.size() > 0) out.push_back(s);
        }
        return out;
    }

    // ============================ construction ============================

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    PartitionedFile::PartitionedFile(MPI_Comm comm,
        std::vector<std::string> paths,
        std::shared_ptr<const FileCodec> codec,
        const std::string& mode,
        json attrs)
        : comm_(comm), paths_(std::move(paths)), codec_(std::move(codec)), attrs_(std::move(attrs)) {
        MPI_Comm_rank(comm_, &rank_);
        MPI_Comm_size(comm_, &world_);

        const std::string m = lower(mode);
        if (m != "" && m != "r" && m != "w" && m != "rw") {
            throw InvalidMode("mode must be one of '', 'r', 'w', 'rw'; got '" + mode + "'");
        }
        if (paths_.empty()) throw std::runtime_error("PartitionedFile needs at least one file name");
        if (!codec_) throw std::runtime_error("PartitionedFile needs a codec");
        if (attrs_.is_null()) attrs_ = json::object();

        if (m.find('r') != std::string::npos) read_header();
    }

    bool PartitionedFile::has_column(const std::string& name) const {
        return std::find(columns_.begin(), columns_.end(), name) != columns_.end();
    }

    void PartitionedFile::set_total(int64_t total) {
        csize_ = total;
        RowRange r = partition_bounds(total, rank_, world_);
        start_ = r.begin;
        stop_ = r.end;
    }

    void PartitionedFile::merge_header(const MergedHeader& h) {
        csizes_ = h.csizes;
        columns_ = h.columns;
        attrs_ = h.attrs;
        int64_t total = 0;
        for (auto s : csizes_) total += s;
        set_total(total);
        has_header_ = true;
    }

    // ------------------------------------------------------------------
    // Header: root reads all files, everyone else receives the merged result
    // ------------------------------------------------------------------
    void PartitionedFile::read_header() {
        MergedHeader merged;
        run_on_root(comm_, root_, [&]() {
            merged.attrs = attrs_;
            for (size_t i = 0; i < paths_.size(); ++i) {
                const std::string& path = paths_[i];
                log_info(comm_, "Loading " + path + ".", root_);
                FileHeader h = codec_->read_header(path);
                merged.csizes.push_back(h.size);

                if (i == 0) {
                    merged.columns = h.columns;
                }
                else {
                    std::set<std::string> known(merged.columns.begin(), merged.columns.end());
                    std::vector<std::string> extra_cols;
                    for (const auto& c : h.columns) if (!known.count(c)) extra_cols.push_back(c);
                    if (!extra_cols.empty()) {
                        std::ostringstream os;
                        os << path << " does not match the columns of " << paths_.front() << ": extra columns {";
                        for (size_t k = 0; k < extra_cols.size(); ++k) os << (k ? ", " : "") << extra_cols[k];
                        os << "}";
                        throw SchemaMismatch(os.str());
                    }
                    // accepted, but reading such a column over this file's rows fails
                    std::set<std::string> have(h.columns.begin(), h.columns.end());
                    std::string missing;
                    for (const auto& c : merged.columns) {
                        if (!have.count(c)) missing += (missing.empty() ? "" : ", ") + c;
                    }
                    if (!missing.empty()) log_warn(comm_, path + " lacks columns {" + missing + "}");
                }

                // earlier files (and caller attrs) win
                for (auto it = h.attrs.begin(); it != h.attrs.end(); ++it) {
                    if (!merged.attrs.contains(it.key())) merged.attrs[it.key()] = it.value();
                }
            }
            });

        json state = is_root() ? merged_to_json(merged) : json();
        merge_header(merged_from_json(bcast_json(comm_, state, root_)));
    }

    // ------------------------------------------------------------------
    // Read: concatenate the pieces of every file overlapping [start, stop)
    // ------------------------------------------------------------------
    Array PartitionedFile::read(const std::string& column) {
        if (!has_header_) read_header();

        const std::vector<Segment> segs = map_range(csizes_, RowRange{ start_, stop_ });
        if (segs.empty()) {
            // zero local rows: still return the right dtype and item shape
            return codec_->read_slice(paths_.front(), column, RowRange{ 0, 0 });
        }

        std::vector<Array> parts;
        parts.reserve(segs.size());
        for (const auto& s : segs) {
            parts.push_back(codec_->read_slice(paths_[s.index], column, s.rows));
        }
        if (parts.size() == 1) return std::move(parts.front());
        return concat_rows(parts);
    }

    // ------------------------------------------------------------------
    // Write: redistribute rows evenly over the existing file list
    // ------------------------------------------------------------------
    void PartitionedFile::write(const ColumnSet& data, std::optional<int> mpiroot) {
        if (!mpiroot) {
            std::vector<std::string> order;
            for (const auto& kv : data) order.push_back(kv.first);
            write_columns(data, order);
            return;
        }

        json names;
        if (rank_ == *mpiroot) {
            names = json::array();
            for (const auto& kv : data) names.push_back(kv.first);
        }
        const auto order = bcast_json(comm_, names, *mpiroot).get<std::vector<std::string>>();
        ColumnSet local;
        for (const auto& name : order) {
            local[name] = scatter_array(comm_, rank_ == *mpiroot ? &data.at(name) : nullptr, *mpiroot);
        }
        write_columns(local, order);
    }

    void PartitionedFile::write(const RecordArray& data, std::optional<int> mpiroot) {
        if (!mpiroot) {
            std::vector<std::string> order;
            for (const auto& f : data.fields) order.push_back(f.name);
            write_columns(unpack_records(data), order);
            return;
        }

        json names;
        ColumnSet full;
        if (rank_ == *mpiroot) {
            names = json::array();
            for (const auto& f : data.fields) names.push_back(f.name);
            full = unpack_records(data);
        }
        const auto order = bcast_json(comm_, names, *mpiroot).get<std::vector<std::string>>();
        ColumnSet local;
        for (const auto& name : order) {
            local[name] = scatter_array(comm_, rank_ == *mpiroot ? &full.at(name) : nullptr, *mpiroot);
        }
        write_columns(local, order);
    }

    void PartitionedFile::write_columns(const ColumnSet& local, const std::vector<std::string>& order) {
        int64_t nlocal = 0;
        run_on_all(comm_, [&]() { nlocal = column_set_rows(local); });

        const std::vector<int64_t> sizes = allgather_sizes(comm_, nlocal);
        int64_t total = 0;
        for (auto s : sizes) total += s;
        const size_t nfiles = paths_.size();

        // Directories first, once, before any file is touched
        run_on_root(comm_, root_, [&]() {
            for (const auto& path : paths_) {
                log_info(comm_, "Saving to " + path + ".", root_);
                const fs::path dir = fs::path(path).parent_path();
                if (dir.empty()) continue;
                std::error_code ec;
                fs::create_directories(dir, ec);
                if (ec) throw IOFailure("Cannot create directory " + dir.string() + ": " + ec.message());
            }
            });

        std::vector<int64_t> new_sizes(nfiles, 0);
        for (size_t i = 0; i < nfiles; ++i) {
            const RowRange file_rows = partition_bounds(total, (int)i, (int)nfiles);
            new_sizes[i] = file_rows.size();

            // my rows that land in this file (empty if I do not overlap it)
            RowRange mine{ 0, 0 };
            for (const auto& s : map_range(sizes, file_rows)) {
                if ((int)s.index == rank_) mine = s.rows;
            }

            ColumnSet piece;
            for (const auto& kv : local) piece[kv.first] = slice_rows(kv.second, mine.begin, mine.end);

            if (codec_->packing() == Packing::Records) {
                codec_->write_slice(comm_, paths_[i], SliceData(pack_records(piece, order)), attrs_);
            }
            else {
                codec_->write_slice(comm_, paths_[i], SliceData(std::move(piece)), attrs_);
            }
        }

        // all files complete before anyone may reopen them
        MPI_Barrier(comm_);

        MergedHeader h;
        h.csizes = new_sizes;
        h.columns = order;
        h.attrs = attrs_;
        merge_header(h);
    }

} // namespace shardcat
