#pragma once
#include <mpi.h>
#include <string>

namespace shardcat {

    enum class LogLevel { Quiet = 0, Warn = 1, Info = 2 };

    // Process-wide verbosity (default Info).
    void set_log_level(LogLevel level);
    LogLevel log_level();

    // "[rank 0] msg" on stdout, printed by the root rank of 'comm' only.
    void log_info(MPI_Comm comm, const std::string& msg, int root = 0);

    // "[rank r] Warning: msg" on stderr, printed by the calling rank.
    void log_warn(MPI_Comm comm, const std::string& msg);

} // namespace shardcat
