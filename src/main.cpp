#include <mpi.h>
#include <iostream>
#include <string>
#include <iomanip>
#include <sstream>
#include "catalog/catalog.hpp"
#include "common/array.hpp"
#include "common/log.hpp"
#include "config/catalog_config.hpp"

using shardcat::Array;
using shardcat::Catalog;
using shardcat::CatalogConfig;

static std::string scalar_str(const std::optional<Array>& a) {
    if (!a || a->n_elems() == 0) return "-";
    std::ostringstream os;
    os << std::setprecision(8) << shardcat::element_as_double(*a, 0);
    return os.str();
}

// Global statistics of every column, printed by rank 0.
static void print_summary(const Catalog& cat, const std::vector<std::string>& columns, int rank) {
    const int64_t csize = cat.csize();
    if (rank == 0) {
        std::cout << "\nCatalog: " << csize << " rows, " << columns.size() << " columns\n";
        std::cout << std::left << std::setw(24) << "Column" << std::setw(8) << "dtype"
            << std::setw(12) << "item" << std::setw(16) << "sum" << std::setw(16) << "min"
            << std::setw(16) << "max" << "mean\n";
    }
    for (const auto& name : columns) {
        const Array& local = cat.get(name);
        // everything over all axes
        auto sum = cat.csum(name, std::nullopt);
        auto mn = cat.cmin(name, std::nullopt);
        auto mx = cat.cmax(name, std::nullopt);
        auto mean = cat.cmean(name, std::nullopt);
        if (rank == 0) {
            std::cout << std::left << std::setw(24) << name
                << std::setw(8) << shardcat::dtype_str(local.dtype)
                << std::setw(12) << shardcat::shape_str(local.itemshape())
                << std::setw(16) << scalar_str(sum) << std::setw(16) << scalar_str(mn)
                << std::setw(16) << scalar_str(mx) << scalar_str(mean) << "\n";
        }
    }
}

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank = 0, world = 1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &world);

    if (argc < 2) {
        if (rank == 0) {
            std::cerr << "Usage: shardcat <config.json>\n";
        }
        MPI_Finalize();
        return 1;
    }

    try {
        const std::string cfg_path = argv[1];

        // Load config
        CatalogConfig cfg = shardcat::load_catalog_config(cfg_path);
        if (cfg.quiet) shardcat::set_log_level(shardcat::LogLevel::Warn);
        if (rank == 0 && !cfg.quiet) {
            std::cout << "Ranks: " << world
                << " | input: " << (cfg.checkpoint_in.empty() ? cfg.input_format : "checkpoint") << "\n";
        }

        // Read
        Catalog cat = cfg.checkpoint_in.empty()
            ? (cfg.input_format == "npy"
                ? Catalog::load_npy(MPI_COMM_WORLD, cfg.input)
                : Catalog::load_hdf5(MPI_COMM_WORLD, cfg.input, cfg.input_group))
            : Catalog::load(cfg.checkpoint_in, MPI_COMM_WORLD);

        // Select
        const std::vector<std::string> columns = cat.columns(cfg.include, cfg.exclude);
        if (!cfg.include.empty() || !cfg.exclude.empty()) cat = cat.copy(columns);
        if (cfg.slice) cat = cat.cslice(*cfg.slice);

        std::cout << "[rank " << rank << "/" << world << "] holds "
            << cat.size() << " rows\n";

        if (cfg.summary) print_summary(cat, columns, rank);

        // Write
        if (!cfg.output.empty()) {
            if (cfg.output_format == "npy") cat.save_npy(cfg.output);
            else cat.save_hdf5(cfg.output, cfg.output_group);
        }
        if (!cfg.checkpoint_out.empty()) cat.save(cfg.checkpoint_out);
    }
    catch (const std::exception& e) {
        std::cerr << "[rank " << rank << "] Error: " << e.what() << "\n";
        MPI_Abort(MPI_COMM_WORLD, 2);
    }

    MPI_Finalize();
    return 0;
}
