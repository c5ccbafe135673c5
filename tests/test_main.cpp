#include <mpi.h>
#include <gtest/gtest.h>
#include "common/log.hpp"

// GoogleTest under MPI: every rank runs every test, rank 0 prints, and the exit
// status is a failure if any rank failed.
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);
    ::testing::InitGoogleTest(&argc, argv);
    shardcat::set_log_level(shardcat::LogLevel::Warn);

    int rank = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    if (rank != 0) {
        auto& listeners = ::testing::UnitTest::GetInstance()->listeners();
        delete listeners.Release(listeners.default_result_printer());
    }

    int rc = RUN_ALL_TESTS();
    int any = 0;
    MPI_Allreduce(&rc, &any, 1, MPI_INT, MPI_MAX, MPI_COMM_WORLD);

    MPI_Finalize();
    return any;
}
