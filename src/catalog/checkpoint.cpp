#include "catalog/checkpoint.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include "catalog/catalog.hpp"
#include "common/array.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"
#include "mpi/collectives.hpp"

namespace fs = std::filesystem;

namespace shardcat {

    using nlohmann::json;

    // ============================ blob ============================

    std::vector<uint8_t> encode_checkpoint(const CheckpointData& data) {
        json cols = json::object();
        for (const auto& name : data.order) {
            const Array& a = data.columns.at(name);
            cols[name] = json{
                {"dtype", dtype_str(a.dtype)},
                {"shape", a.shape},
                {"data", json::binary(a.bytes)}
            };
        }
        json doc = { {"attrs", data.attrs}, {"order", data.order}, {"columns", std::move(cols)} };
        return json::to_msgpack(doc);
    }

    CheckpointData decode_checkpoint(const std::vector<uint8_t>& blob, const std::string& where) {
        CheckpointData out;
        try {
            const json doc = json::from_msgpack(blob);
            out.attrs = doc.at("attrs");
            out.order = doc.at("order").get<std::vector<std::string>>();
            const json& cols = doc.at("columns");
            for (const auto& name : out.order) {
                const json& c = cols.at(name);
                Array a = make_array(dtype_from_str(c.at("dtype").get<std::string>()),
                    c.at("shape").get<std::vector<int64_t>>());
                const auto& bin = c.at("data").get_binary();
                if (bin.size() != a.bytes.size()) {
                    throw Corrupt(where + ": column " + name + " holds " + std::to_string(bin.size())
                        + " bytes, shape " + shape_str(a.shape) + " needs " + std::to_string(a.bytes.size()));
                }
                a.bytes.assign(bin.begin(), bin.end());
                out.columns[name] = std::move(a);
            }
        }
        catch (const json::exception& e) {
            throw Corrupt(where + " is not a valid checkpoint: " + e.what());
        }
        catch (const CatalogError&) {
            throw;
        }
        catch (const std::runtime_error& e) {
            // unknown dtype string
            throw Corrupt(where + " is not a valid checkpoint: " + e.what());
        }
        return out;
    }

    void write_checkpoint_file(const std::string& path, const CheckpointData& data) {
        const fs::path dir = fs::path(path).parent_path();
        if (!dir.empty()) {
            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) throw IOFailure("Cannot create directory " + dir.string() + ": " + ec.message());
        }
        const std::vector<uint8_t> blob = encode_checkpoint(data);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) throw IOFailure("Cannot create " + path);
        out.write(reinterpret_cast<const char*>(blob.data()), (std::streamsize)blob.size());
        out.flush();
        if (!out) throw IOFailure("Failed writing " + path);
    }

    CheckpointData read_checkpoint_file(const std::string& path) {
        if (!fs::exists(path)) throw NotFound("File not found: " + path);
        std::ifstream in(path, std::ios::binary);
        if (!in) throw NotFound("Cannot open " + path);
        std::vector<uint8_t> blob((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        return decode_checkpoint(blob, path);
    }

    // ============================ Catalog::save / load ============================

    void Catalog::save(const std::string& path) const {
        CheckpointData cp;
        cp.attrs = attrs_;
        cp.order = columns();
        for (const auto& name : cp.order) {
            Array full = cget(name, root_);
            if (is_root()) cp.columns[name] = std::move(full);
        }
        run_on_root(comm_, root_, [&]() {
            log_info(comm_, "Saving to " + path + ".", root_);
            write_checkpoint_file(path, cp);
            });
    }

    Catalog Catalog::load(const std::string& path, MPI_Comm comm) {
        const int root = 0;
        CheckpointData cp;
        json meta;
        run_on_root(comm, root, [&]() {
            log_info(comm, "Loading " + path + ".", root);
            cp = read_checkpoint_file(path);
            meta = json{ {"attrs", cp.attrs}, {"order", cp.order} };
            });
        meta = bcast_json(comm, meta, root);

        Catalog out(comm, meta.at("attrs"));
        const bool on_root = comm_rank(comm) == root;
        for (const auto& name : meta.at("order").get<std::vector<std::string>>()) {
            out.data_[name] = scatter_array(comm, on_root ? &cp.columns.at(name) : nullptr, root);
        }
        return out;
    }

} // namespace shardcat
