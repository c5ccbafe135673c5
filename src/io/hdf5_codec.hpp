#pragma once
#include <mpi.h>
#include <string>
#include "io/file_codec.hpp"

namespace shardcat {

	// Columns are the datasets of one HDF5 group; group attributes are the file attrs.
	// All datasets share their first dimension (the row count).
	class HDF5Codec : public FileCodec {
	public:
		explicit HDF5Codec(std::string group = "/");

		std::string name() const override { return "hdf5"; }
		Packing packing() const override { return Packing::Columns; }
		const std::string& group() const { return group_; }

		FileHeader read_header(const std::string& path) const override;
		Array read_slice(const std::string& path, const std::string& column, RowRange rows) const override;

		// With a parallel HDF5 build every rank writes its own hyperslab (MPI-IO);
		// otherwise columns are gathered to rank 0, which writes the file.
		void write_slice(MPI_Comm comm, const std::string& path, const SliceData& data,
			const nlohmann::json& attrs) const override;

	private:
		std::string dataset_path(const std::string& column) const;

		std::string group_;
	};

} // namespace shardcat
