#include <gtest/gtest.h>
#include <mpi.h>
#include "common/array.hpp"
#include "mpi/collectives.hpp"
#include "mpi/reductions.hpp"
#include "test_util.hpp"

using namespace shardcat;
using shardcat::test::iota64;
using shardcat::test::local_part;

// Rows i = 0..9, item (i, 10*i): every rank sees the same global values.
static Array pairs_local(MPI_Comm comm) {
    std::vector<double> v;
    for (int i = 0; i < 10; ++i) { v.push_back(i); v.push_back(10.0 * i); }
    return local_part(comm, array_from_vector(v, { 2 }));
}

TEST(ReductionsTest, SumOverRows) {
    MPI_Comm comm = MPI_COMM_WORLD;
    auto s = sum_array(comm, pairs_local(comm), 0);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->shape, std::vector<int64_t>{ 2 });
    EXPECT_EQ(array_to_vector<double>(*s), (std::vector<double>{ 45, 450 }));
}

TEST(ReductionsTest, SumOverAllAxes) {
    MPI_Comm comm = MPI_COMM_WORLD;
    auto s = sum_array(comm, pairs_local(comm), std::nullopt);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->shape, std::vector<int64_t>{ 1 });
    EXPECT_DOUBLE_EQ(s->at<double>(0), 495.0);
}

TEST(ReductionsTest, ItemAxisIsLocal) {
    MPI_Comm comm = MPI_COMM_WORLD;
    Array local = pairs_local(comm);
    auto s = sum_array(comm, local, 1);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->n_rows(), local.n_rows());
    for (int64_t r = 0; r < local.n_rows(); ++r) {
        EXPECT_DOUBLE_EQ(s->at<double>(r), 11.0 * local.at<double>(2 * r));
    }
}

TEST(ReductionsTest, IntegerAndBoolSumsWiden) {
    MPI_Comm comm = MPI_COMM_WORLD;
    Array ints = local_part(comm, array_from_vector(std::vector<int8_t>(100, 100)));
    auto s = sum_array(comm, ints, 0);
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->dtype, DType::Int64);
    EXPECT_EQ(s->at<int64_t>(0), 10000);

    std::vector<uint8_t> flags(9, 0);
    flags[2] = flags[5] = flags[8] = 1;
    auto b = sum_array(comm, local_part(comm, array_from_vector(flags, {}, DType::Bool)), std::nullopt);
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->dtype, DType::UInt64);
    EXPECT_EQ(b->at<uint64_t>(0), 3u);
}

TEST(ReductionsTest, MinMaxKeepDtype) {
    MPI_Comm comm = MPI_COMM_WORLD;
    Array local = local_part(comm, array_from_vector(std::vector<int32_t>{ 5, -3, 8, 0, 2 }));
    auto mn = min_array(comm, local, 0);
    auto mx = max_array(comm, local, std::nullopt);
    ASSERT_TRUE(mn && mx);
    EXPECT_EQ(mn->dtype, DType::Int32);
    EXPECT_EQ(mn->at<int32_t>(0), -3);
    EXPECT_EQ(mx->at<int32_t>(0), 8);
}

TEST(ReductionsTest, EmptyHasNoExtremumOrMean) {
    MPI_Comm comm = MPI_COMM_WORLD;
    Array empty = array_from_vector(std::vector<double>{});
    EXPECT_FALSE(min_array(comm, empty, 0).has_value());
    EXPECT_FALSE(max_array(comm, empty, std::nullopt).has_value());
    EXPECT_FALSE(average_array(comm, empty, nullptr, 0).has_value());
    auto s = sum_array(comm, empty, 0);
    ASSERT_TRUE(s.has_value());
    EXPECT_DOUBLE_EQ(s->at<double>(0), 0.0);
}

TEST(ReductionsTest, WeightedAverage) {
    MPI_Comm comm = MPI_COMM_WORLD;
    Array values = local_part(comm, array_from_vector(std::vector<double>{ 1, 2, 3, 4 }));
    Array weights = local_part(comm, array_from_vector(std::vector<double>{ 1, 1, 1, 5 }));
    auto m = average_array(comm, values, &weights, 0);
    ASSERT_TRUE(m.has_value());
    EXPECT_DOUBLE_EQ(m->at<double>(0), 26.0 / 8.0);

    auto plain = average_array(comm, values, nullptr, 0);
    ASSERT_TRUE(plain.has_value());
    EXPECT_DOUBLE_EQ(plain->at<double>(0), 2.5);

    // one weight per row broadcast over the item axis
    Array pairs = pairs_local(comm);
    Array row_w = local_part(comm, array_from_vector(std::vector<double>(10, 2.0)));
    auto pm = average_array(comm, pairs, &row_w, 0);
    ASSERT_TRUE(pm.has_value());
    EXPECT_EQ(array_to_vector<double>(*pm), (std::vector<double>{ 4.5, 45 }));
}

TEST(ReductionsTest, BadWeightsFailEverywhere) {
    MPI_Comm comm = MPI_COMM_WORLD;
    Array values = local_part(comm, array_from_vector(iota64(6)));
    Array wrong = array_from_vector(std::vector<double>{ 1, 2, 3, 4, 5, 6, 7 }, { 7 });
    EXPECT_THROW(average_array(comm, values, &wrong, 0), std::runtime_error);

    Array zeros = local_part(comm, array_from_vector(std::vector<double>(6, 0.0)));
    EXPECT_THROW(average_array(comm, values, &zeros, 0), std::runtime_error);
}
