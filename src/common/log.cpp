#include "common/log.hpp"

#include <atomic>
#include <iostream>

namespace shardcat {

    static std::atomic<int> g_log_level{ static_cast<int>(LogLevel::Info) };

    void set_log_level(LogLevel level) { g_log_level.store(static_cast<int>(level)); }

    LogLevel log_level() { return static_cast<LogLevel>(g_log_level.load()); }

    void log_info(MPI_Comm comm, const std::string& msg, int root) {
        if (log_level() < LogLevel::Info) return;
        int rank = 0;
        MPI_Comm_rank(comm, &rank);
        if (rank != root) return;
        std::cout << "[rank " << rank << "] " << msg << std::endl;
    }

    void log_warn(MPI_Comm comm, const std::string& msg) {
        if (log_level() < LogLevel::Warn) return;
        int rank = 0;
        MPI_Comm_rank(comm, &rank);
        std::cerr << "[rank " << rank << "] Warning: " << msg << "\n";
    }

} // namespace shardcat
