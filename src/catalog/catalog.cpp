#include "catalog/catalog.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include "common/array.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "io/hdf5_codec.hpp"
#include "io/npy_codec.hpp"
#include "mpi/collectives.hpp"
#include "mpi/reductions.hpp"

namespace shardcat {

    using nlohmann::json;

    // ============================ helpers ============================

    // Glob -> regex: '*' is any sequence, everything else literal.
    static std::regex glob_regex(const std::string& pattern) {
        std::string re;
        for (char c : pattern) {
            if (c == '*') re += ".*";
            else if (std::string("\\^$.|?+()[]{}").find(c) != std::string::npos) { re += '\\'; re += c; }
            else re += c;
        }
        return std::regex(re);
    }

    // Anchored at the start only: "a" matches "ab".
    static bool glob_match(const std::regex& re, const std::string& name) {
        return std::regex_search(name, re, std::regex_constants::match_continuous);
    }

    static std::string names_str(const std::vector<std::string>& names) {
        std::ostringstream os;
        os << "[";
        for (size_t i = 0; i < names.size(); ++i) os << (i ? ", " : "") << names[i];
        os << "]";
        return os.str();
    }

    // ============================ construction ============================

    Catalog::Catalog(MPI_Comm comm, json attrs)
        : comm_(comm), attrs_(std::move(attrs)), source_(Detached{}) {
        rank_ = comm_rank(comm_);
        if (attrs_.is_null()) attrs_ = json::object();
    }

    Catalog::Catalog(MPI_Comm comm, std::shared_ptr<PartitionedFile> source, json attrs)
        : Catalog(comm, std::move(attrs)) {
        if (!source) return;
        ensure_same_comm(comm_, source->comm());
        Backed b;
        b.columns = source->columns();
        b.file = std::move(source);
        source_ = std::move(b);
    }

    Catalog Catalog::from_columns(const ColumnSet& data, MPI_Comm comm, std::optional<int> mpiroot, json attrs) {
        Catalog out(comm, std::move(attrs));
        if (!mpiroot) {
            run_on_all(comm, [&]() { column_set_rows(data); });
            out.data_ = data;
            return out;
        }

        const int rank = comm_rank(comm);
        json names;
        if (rank == *mpiroot) {
            names = json::array();
            for (const auto& kv : data) names.push_back(kv.first);
        }
        run_on_root(comm, *mpiroot, [&]() { column_set_rows(data); });
        for (const auto& name : bcast_json(comm, names, *mpiroot).get<std::vector<std::string>>()) {
            out.data_[name] = scatter_array(comm, rank == *mpiroot ? &data.at(name) : nullptr, *mpiroot);
        }
        return out;
    }

    Catalog Catalog::from_records(const RecordArray& data, MPI_Comm comm, std::optional<int> mpiroot, json attrs) {
        if (!mpiroot) return from_columns(unpack_records(data), comm, mpiroot, std::move(attrs));
        ColumnSet full;
        if (comm_rank(comm) == *mpiroot) full = unpack_records(data);
        return from_columns(full, comm, mpiroot, std::move(attrs));
    }

    Catalog Catalog::with_data(ColumnSet data) const {
        Catalog out(comm_, attrs_);
        out.data_ = std::move(data);
        return out;
    }

    // ============================ column access ============================

    const Array& Catalog::get(const std::string& column) const {
        auto it = data_.find(column);
        if (it != data_.end()) return it->second;

        if (const Backed* b = std::get_if<Backed>(&source_)) {
            if (std::find(b->columns.begin(), b->columns.end(), column) != b->columns.end()) {
                return data_[column] = b->file->read(column);
            }
        }
        throw ColumnNotFound("Column " + column + " does not exist");
    }

    // Only an unknown name falls back; read errors of a declared column propagate.
    Array Catalog::get(const std::string& column, const Array& default_value) const {
        bool known = data_.count(column) > 0;
        if (const Backed* b = std::get_if<Backed>(&source_)) {
            known = known || std::find(b->columns.begin(), b->columns.end(), column) != b->columns.end();
        }
        if (!known) return default_value;
        return get(column);
    }

    void Catalog::set(const std::string& column, Array value) {
        int64_t expected = -1;
        for (const auto& kv : data_) {
            if (kv.first != column) { expected = kv.second.n_rows(); break; }
        }
        if (expected < 0 && has_source()) expected = std::get<Backed>(source_).file->size();
        if (expected >= 0 && value.n_rows() != expected) {
            throw std::runtime_error("Column " + column + " has " + std::to_string(value.n_rows())
                + " local rows, catalog has " + std::to_string(expected));
        }
        data_[column] = std::move(value);
    }

    void Catalog::erase(const std::string& column) {
        if (data_.erase(column)) return;
        if (Backed* b = std::get_if<Backed>(&source_)) {
            auto it = std::find(b->columns.begin(), b->columns.end(), column);
            if (it != b->columns.end()) {
                b->columns.erase(it);
                return;
            }
        }
        throw ColumnNotFound("Column " + column + " not found");
    }

    bool Catalog::contains(const std::string& column) const {
        return data_.count(column) > 0;
    }

    std::vector<std::string> Catalog::columns(const std::vector<std::string>& include,
        const std::vector<std::string>& exclude) const {
        json names;
        if (is_root()) {
            // source order first, then columns only set in memory
            std::vector<std::string> all;
            if (const Backed* b = std::get_if<Backed>(&source_)) all = b->columns;
            for (const auto& kv : data_) {
                if (std::find(all.begin(), all.end(), kv.first) == all.end()) all.push_back(kv.first);
            }

            std::vector<std::string> kept;
            if (include.empty()) {
                kept = all;
            }
            else {
                std::vector<std::regex> pats;
                for (const auto& p : include) pats.push_back(glob_regex(p));
                for (const auto& name : all) {
                    for (const auto& re : pats) {
                        if (glob_match(re, name)) { kept.push_back(name); break; }
                    }
                }
            }

            if (!exclude.empty()) {
                std::vector<std::regex> pats;
                for (const auto& p : exclude) pats.push_back(glob_regex(p));
                std::vector<std::string> rest;
                for (const auto& name : kept) {
                    bool drop = false;
                    for (const auto& re : pats) drop = drop || glob_match(re, name);
                    if (!drop) rest.push_back(name);
                }
                kept.swap(rest);
            }
            names = kept;
        }
        return bcast_json(comm_, names, root_).get<std::vector<std::string>>();
    }

    // ============================ sizes ============================

    int64_t Catalog::size() const {
        if (!data_.empty()) return data_.begin()->second.n_rows();
        if (const Backed* b = std::get_if<Backed>(&source_)) return b->file->size();
        return 0;
    }

    int64_t Catalog::csize() const {
        return allreduce_sum(comm_, size());
    }

    Array Catalog::cindices() const {
        const std::vector<int64_t> sizes = allgather_sizes(comm_, size());
        const int64_t offset = size_offsets(sizes)[(size_t)rank_];
        std::vector<int64_t> idx((size_t)size());
        for (size_t i = 0; i < idx.size(); ++i) idx[i] = offset + (int64_t)i;
        return array_from_vector(idx);
    }

    Array Catalog::zeros(const std::vector<int64_t>& itemshape, DType dtype) const {
        return make_array(dtype, get_shape(size(), itemshape));
    }

    Array Catalog::ones(const std::vector<int64_t>& itemshape, DType dtype) const {
        return full_array(dtype, get_shape(size(), itemshape), 1.0);
    }

    Array Catalog::full(double value, const std::vector<int64_t>& itemshape, DType dtype) const {
        return full_array(dtype, get_shape(size(), itemshape), value);
    }

    Array Catalog::falses(const std::vector<int64_t>& itemshape) const {
        return zeros(itemshape, DType::Bool);
    }

    Array Catalog::trues(const std::vector<int64_t>& itemshape) const {
        return ones(itemshape, DType::Bool);
    }

    Array Catalog::nans(const std::vector<int64_t>& itemshape) const {
        return full(std::numeric_limits<double>::quiet_NaN(), itemshape, DType::Float64);
    }

    // ============================ global views ============================

    Array Catalog::cget(const std::string& column, int root) const {
        const Array* local = nullptr;
        run_on_all(comm_, [&]() { local = &get(column); });
        return gather_array(comm_, *local, root);
    }

    Catalog Catalog::cslice(const SliceSpec& sl) const {
        // every rank holds 'sl', so reject a bad step before any collective
        if (sl.step && *sl.step == 0) throw std::runtime_error("slice step cannot be zero");
        ColumnSet out;
        for (const auto& name : columns()) {
            Array full = cget(name, root_);
            Array picked;
            run_on_root(comm_, root_, [&]() { picked = slice_rows(full, sl); });
            out[name] = scatter_array(comm_, is_root() ? &picked : nullptr, root_);
        }
        return with_data(std::move(out));
    }

    Catalog Catalog::cslice(std::optional<int64_t> start, std::optional<int64_t> stop,
        std::optional<int64_t> step) const {
        SliceSpec sl;
        sl.start = start;
        sl.stop = stop;
        sl.step = step;
        return cslice(sl);
    }

    Catalog Catalog::slice_local(const SliceSpec& sl) const {
        ColumnSet out;
        for (const auto& name : columns()) out[name] = slice_rows(get(name), sl);
        return with_data(std::move(out));
    }

    Catalog Catalog::take_local(const std::vector<int64_t>& rows) const {
        ColumnSet out;
        for (const auto& name : columns()) out[name] = take_rows(get(name), rows);
        return with_data(std::move(out));
    }

    Catalog Catalog::take_local(const std::vector<uint8_t>& mask) const {
        ColumnSet out;
        for (const auto& name : columns()) out[name] = mask_rows(get(name), mask);
        return with_data(std::move(out));
    }

    Catalog Catalog::copy(const std::vector<std::string>& columns) const {
        Catalog out(comm_, attrs_);
        if (columns.empty()) {
            out.data_ = data_;
            out.source_ = source_;
            return out;
        }

        const Backed* b = std::get_if<Backed>(&source_);
        Backed nb;
        if (b) nb.file = b->file;
        for (const auto& name : columns) {
            auto it = data_.find(name);
            if (it != data_.end()) {
                out.data_[name] = it->second;
            }
            else if (b && std::find(b->columns.begin(), b->columns.end(), name) != b->columns.end()) {
                nb.columns.push_back(name);
            }
            else {
                throw ColumnNotFound("Column " + name + " does not exist");
            }
        }
        if (b) out.source_ = std::move(nb);
        return out;
    }

    // ------------------------------------------------------------------
    // Concatenation
    // ------------------------------------------------------------------
    Catalog Catalog::concatenate(const std::vector<const Catalog*>& catalogs, bool keep_order) {
        if (catalogs.empty()) throw std::runtime_error("concatenate needs at least one catalog");
        const Catalog& first = *catalogs.front();

        // later catalogs win
        json attrs = json::object();
        for (const Catalog* c : catalogs) {
            ensure_same_comm(first.comm_, c->comm_);
            for (auto it = c->attrs_.begin(); it != c->attrs_.end(); ++it) attrs[it.key()] = it.value();
        }

        std::vector<const Catalog*> inputs;
        std::vector<std::vector<std::string>> input_columns;
        for (const Catalog* c : catalogs) {
            std::vector<std::string> cols = c->columns();
            if (cols.empty()) continue;
            inputs.push_back(c);
            input_columns.push_back(std::move(cols));
        }
        if (inputs.empty()) {
            Catalog out = first.copy();
            out.attrs_ = attrs;
            return out;
        }

        const std::vector<std::string>& names = input_columns.front();
        const std::set<std::string> ref(names.begin(), names.end());
        for (size_t i = 1; i < inputs.size(); ++i) {
            const std::set<std::string> other(input_columns[i].begin(), input_columns[i].end());
            if (other != ref) {
                throw ColumnMismatch("Cannot concatenate catalogs as columns do not match: "
                    + names_str(input_columns[i]) + " != " + names_str(names));
            }
        }

        const Catalog& lead = *inputs.front();
        ColumnSet out;
        for (const auto& name : names) {
            if (keep_order) {
                std::vector<Array> parts;
                for (const Catalog* c : inputs) parts.push_back(c->cget(name, lead.root_));
                Array full;
                run_on_root(lead.comm_, lead.root_, [&]() { full = concat_rows(parts); });
                out[name] = scatter_array(lead.comm_, lead.is_root() ? &full : nullptr, lead.root_);
            }
            else {
                std::vector<Array> parts;
                run_on_all(lead.comm_, [&]() {
                    for (const Catalog* c : inputs) parts.push_back(c->get(name));
                    out[name] = concat_rows(parts);
                    });
            }
        }

        Catalog result = lead.with_data(std::move(out));
        result.attrs_ = attrs;
        return result;
    }

    void Catalog::extend(const Catalog& other, bool keep_order) {
        Catalog merged = concatenate({ this, &other }, keep_order);
        attrs_ = std::move(merged.attrs_);
        source_ = std::move(merged.source_);
        data_ = std::move(merged.data_);
    }

    bool Catalog::equals(const Catalog& other) const {
        ensure_same_comm(comm_, other.comm_);
        const std::vector<std::string> mine = columns();
        const std::vector<std::string> theirs = other.columns();
        if (std::set<std::string>(mine.begin(), mine.end()) != std::set<std::string>(theirs.begin(), theirs.end()))
            return false;

        bool same = true;
        for (const auto& name : mine) {
            Array a = cget(name, root_);
            Array b = other.cget(name, root_);
            if (is_root()) same = array_equal(a, b);
            // every rank leaves the loop together
            same = bcast_bool(comm_, same, root_);
            if (!same) break;
        }
        return same;
    }

    // ============================ reductions ============================

    // Per-column results stacked along a new leading axis; unset if no column had one.
    std::optional<Array> Catalog::reduce_columns(const std::vector<std::string>& columns,
        const std::function<std::optional<Array>(const std::string&)>& reduce) const {
        std::vector<Array> parts;
        size_t missing = 0;
        for (const auto& name : columns) {
            std::optional<Array> r = reduce(name);
            if (r) parts.push_back(std::move(*r));
            else ++missing;
        }
        if (parts.empty()) return std::nullopt;
        if (missing) throw std::runtime_error("Cannot stack reductions: " + std::to_string(missing)
            + " of " + std::to_string(columns.size()) + " columns have no value");
        return stack(parts);
    }

    // get() may fail on one rank only (short read); fail everywhere before reducing
    static const Array& column_for_reduction(const Catalog& cat, const std::string& column) {
        const Array* local = nullptr;
        run_on_all(cat.comm(), [&]() { local = &cat.get(column); });
        return *local;
    }

    std::optional<Array> Catalog::csum(const std::string& column, std::optional<int> axis) const {
        return sum_array(comm_, column_for_reduction(*this, column), axis);
    }

    std::optional<Array> Catalog::csum(const std::vector<std::string>& columns, std::optional<int> axis) const {
        return reduce_columns(columns, [&](const std::string& c) { return csum(c, axis); });
    }

    std::optional<Array> Catalog::caverage(const std::string& column, const Array* weights,
        std::optional<int> axis) const {
        return average_array(comm_, column_for_reduction(*this, column), weights, axis);
    }

    std::optional<Array> Catalog::caverage(const std::vector<std::string>& columns, const Array* weights,
        std::optional<int> axis) const {
        return reduce_columns(columns, [&](const std::string& c) { return caverage(c, weights, axis); });
    }

    std::optional<Array> Catalog::cmean(const std::string& column, std::optional<int> axis) const {
        return caverage(column, nullptr, axis);
    }

    std::optional<Array> Catalog::cmean(const std::vector<std::string>& columns, std::optional<int> axis) const {
        return caverage(columns, nullptr, axis);
    }

    std::optional<Array> Catalog::cmin(const std::string& column, std::optional<int> axis) const {
        return min_array(comm_, column_for_reduction(*this, column), axis);
    }

    std::optional<Array> Catalog::cmin(const std::vector<std::string>& columns, std::optional<int> axis) const {
        return reduce_columns(columns, [&](const std::string& c) { return cmin(c, axis); });
    }

    std::optional<Array> Catalog::cmax(const std::string& column, std::optional<int> axis) const {
        return max_array(comm_, column_for_reduction(*this, column), axis);
    }

    std::optional<Array> Catalog::cmax(const std::vector<std::string>& columns, std::optional<int> axis) const {
        return reduce_columns(columns, [&](const std::string& c) { return cmax(c, axis); });
    }

    // ============================ conversion ============================

    RecordArray Catalog::to_records(const std::vector<std::string>& columns) const {
        const std::vector<std::string> names = columns.empty() ? this->columns() : columns;
        ColumnSet cols;
        for (const auto& name : names) cols[name] = get(name);
        return pack_records(cols, names);
    }

    // ============================ files ============================

    Catalog Catalog::load_files(MPI_Comm comm, const std::vector<std::string>& paths,
        std::shared_ptr<const FileCodec> codec) {
        auto file = std::make_shared<PartitionedFile>(comm, paths, std::move(codec), "r");
        json attrs = file->attrs();
        return Catalog(comm, std::move(file), std::move(attrs));
    }

    void Catalog::save_files(const std::vector<std::string>& paths, std::shared_ptr<const FileCodec> codec) const {
        PartitionedFile out(comm_, paths, std::move(codec), "w", attrs_);
        const std::vector<std::string> names = columns();
        ColumnSet cols;
        run_on_all(comm_, [&]() {
            for (const auto& name : names) cols[name] = get(name);
            });
        // keep the catalog's column order in record layouts
        if (out.codec().packing() == Packing::Records) out.write(pack_records(cols, names));
        else out.write(cols);
    }

    Catalog Catalog::load_hdf5(MPI_Comm comm, const std::vector<std::string>& paths, const std::string& group) {
        return load_files(comm, paths, std::make_shared<HDF5Codec>(group));
    }

    void Catalog::save_hdf5(const std::vector<std::string>& paths, const std::string& group) const {
        save_files(paths, std::make_shared<HDF5Codec>(group));
    }

    Catalog Catalog::load_npy(MPI_Comm comm, const std::vector<std::string>& paths) {
        return load_files(comm, paths, std::make_shared<NpyCodec>());
    }

    void Catalog::save_npy(const std::vector<std::string>& paths) const {
        save_files(paths, std::make_shared<NpyCodec>());
    }

} // namespace shardcat
