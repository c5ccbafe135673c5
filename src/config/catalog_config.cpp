#include "config/catalog_config.hpp"
#include <fstream>
#include <stdexcept>
#include <algorithm> // std::transform, std::tolower
#include <filesystem>

namespace shardcat {

    using nlohmann::json;

    // Generic helper: if key exists and is non-null, assign to target (strongly typed).
    template <typename T>
    static void set_if(const json& j, const char* key, T& target) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) {
            try {
                it->get_to(target);
            }
            catch (const json::exception& e) {
                throw std::runtime_error(std::string("Config key \"") + key + "\": " + e.what());
            }
        }
    }

    // A single string or a list of strings.
    static void set_if_names(const json& j, const char* key, std::vector<std::string>& target) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return;
        if (it->is_string()) {
            target = { it->get<std::string>() };
            return;
        }
        if (!it->is_array() || !std::all_of(it->begin(), it->end(), [](const json& e) { return e.is_string(); })) {
            throw std::runtime_error(std::string("Config key \"") + key + "\" must be a string or a list of strings");
        }
        target = it->get<std::vector<std::string>>();
    }

    // Slice bound: integer or null.
    static std::optional<int64_t> slice_bound(const json& v) {
        if (v.is_null()) return std::nullopt;
        if (v.is_number_integer()) return v.get<int64_t>();
        throw std::runtime_error("Config key \"slice\" entries must be integers or null; got " + v.dump());
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static void check_format(const char* key, std::string& format) {
        format = lower(format);
        if (!format.empty() && format != "hdf5" && format != "npy") {
            throw std::runtime_error(std::string(key) + " must be \"hdf5\" or \"npy\"; got: " + format);
        }
    }

    std::string infer_format(const std::string& path) {
        const std::string ext = lower(std::filesystem::path(path).extension().string());
        if (ext == ".h5" || ext == ".hdf5" || ext == ".hdf") return "hdf5";
        if (ext == ".npy") return "npy";
        throw std::runtime_error("Cannot infer file format of " + path + "; set the format explicitly");
    }

    CatalogConfig parse_catalog_config(const json& j) {
        if (!j.is_object()) throw std::runtime_error("Config must be a JSON object");

        CatalogConfig cfg;

        // File lists
        set_if_names(j, "input", cfg.input);
        set_if_names(j, "output", cfg.output);
        set_if_names(j, "include", cfg.include);
        set_if_names(j, "exclude", cfg.exclude);

        // Strings
        set_if(j, "input_format", cfg.input_format);
        set_if(j, "input_group", cfg.input_group);
        set_if(j, "output_format", cfg.output_format);
        set_if(j, "output_group", cfg.output_group);
        set_if(j, "checkpoint_in", cfg.checkpoint_in);
        set_if(j, "checkpoint_out", cfg.checkpoint_out);

        // Booleans
        set_if(j, "summary", cfg.summary);
        set_if(j, "quiet", cfg.quiet);

        auto sl = j.find("slice");
        if (sl != j.end() && !sl->is_null()) {
            if (!sl->is_array() || sl->empty() || sl->size() > 3)
                throw std::runtime_error("Config key \"slice\" must be [stop], [start, stop] or [start, stop, step]");
            SliceSpec s;
            // same argument order as Python's slice()
            if (sl->size() == 1) {
                s.stop = slice_bound((*sl)[0]);
            }
            else {
                s.start = slice_bound((*sl)[0]);
                s.stop = slice_bound((*sl)[1]);
                if (sl->size() == 3) s.step = slice_bound((*sl)[2]);
            }
            if (s.step && *s.step == 0) throw std::runtime_error("Config key \"slice\": step cannot be zero");
            cfg.slice = s;
        }

        // Guards
        if (cfg.input.empty() == cfg.checkpoint_in.empty()) {
            throw std::runtime_error("Config needs exactly one of \"input\" and \"checkpoint_in\"");
        }
        check_format("input_format", cfg.input_format);
        check_format("output_format", cfg.output_format);
        if (!cfg.input.empty() && cfg.input_format.empty()) cfg.input_format = infer_format(cfg.input.front());
        if (!cfg.output.empty() && cfg.output_format.empty()) cfg.output_format = infer_format(cfg.output.front());

        return cfg;
    }

    CatalogConfig load_catalog_config(const std::string& json_path) {
        std::ifstream in(json_path);
        if (!in) throw std::runtime_error("Could not open config file: " + json_path);

        json j;
        try {
            in >> j;
        }
        catch (const std::exception& e) {
            throw std::runtime_error(std::string("Invalid JSON in config file: ") + e.what());
        }
        return parse_catalog_config(j);
    }

} // namespace shardcat
