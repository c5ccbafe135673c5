#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace shardcat {

    // Whole catalog in one MessagePack document:
    //   { "attrs": {...}, "order": [names...],
    //     "columns": { name: { "dtype": "<f8", "shape": [...], "data": <bin> } } }
    struct CheckpointData {
        nlohmann::json attrs = nlohmann::json::object();
        std::vector<std::string> order;
        ColumnSet columns;
    };

    std::vector<uint8_t> encode_checkpoint(const CheckpointData& data);

    // 'where' names the source in error messages. Throws Corrupt.
    CheckpointData decode_checkpoint(const std::vector<uint8_t>& blob, const std::string& where);

    void write_checkpoint_file(const std::string& path, const CheckpointData& data);
    CheckpointData read_checkpoint_file(const std::string& path);

} // namespace shardcat
