#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace shardcat {

	struct CatalogConfig {
		// Input: partitioned files or a checkpoint (exactly one)
		std::vector<std::string> input;       // one or more files of the same format
		std::string input_format;             // "hdf5" | "npy"; empty = from extension
		std::string input_group = "/";        // HDF5 group holding the columns
		std::string checkpoint_in;

		// Column selection (glob patterns) and global slice
		std::vector<std::string> include;
		std::vector<std::string> exclude;
		std::optional<SliceSpec> slice;       // [start, stop, step], nulls allowed

		// Output
		std::vector<std::string> output;      // rows are spread evenly over these files
		std::string output_format;
		std::string output_group = "/";
		std::string checkpoint_out;

		bool summary = true;                  // per-column statistics on rank 0
		bool quiet = false;                   // silence "Loading"/"Saving" lines
	};

	// "hdf5" for .h5/.hdf5/.hdf, "npy" for .npy; throws otherwise.
	std::string infer_format(const std::string& path);

	// Parse and validate an already decoded JSON object.
	CatalogConfig parse_catalog_config(const nlohmann::json& j);

	// Load from a JSON file on disk.
	CatalogConfig load_catalog_config(const std::string& json_path);

} // namespace shardcat
