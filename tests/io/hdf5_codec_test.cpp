#include <gtest/gtest.h>
#include <mpi.h>
#include <fstream>
#include "common/array.hpp"
#include "common/errors.hpp"
#include "io/hdf5_codec.hpp"
#include "io/partitioned_file.hpp"
#include "mpi/collectives.hpp"
#include "test_util.hpp"

extern "C" {
#include <hdf5.h>
}

using namespace shardcat;
using nlohmann::json;
using shardcat::test::iota64;
using shardcat::test::local_part;

namespace {

    class HDF5CodecTest : public ::testing::Test {
    protected:
        void SetUp() override { dir_ = shardcat::test::shared_tmpdir(MPI_COMM_WORLD, "hdf5"); }
        void TearDown() override { shardcat::test::remove_shared_tmpdir(MPI_COMM_WORLD, dir_); }
        std::string path(const std::string& name) const { return dir_ + "/" + name; }
        std::string dir_;
    };

    // 1-D float64 dataset written straight through the C API (rank 0 only).
    void put_dataset(hid_t file, const char* name, const std::vector<double>& v) {
        hsize_t n = v.size();
        hid_t space = H5Screate_simple(1, &n, nullptr);
        hid_t dset = H5Dcreate2(file, name, H5T_NATIVE_DOUBLE, space, H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        H5Dwrite(dset, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT, v.data());
        H5Dclose(dset);
        H5Sclose(space);
    }

    ColumnSet local_columns(MPI_Comm comm, int64_t n) {
        ColumnSet cols;
        cols["id"] = local_part(comm, array_from_vector(iota64(n)));
        std::vector<float> pos((size_t)(3 * n));
        for (size_t i = 0; i < pos.size(); ++i) pos[i] = 0.5f * (float)i;
        cols["pos"] = local_part(comm, array_from_vector(pos, { 3 }));
        std::vector<uint8_t> flags((size_t)n);
        for (size_t i = 0; i < flags.size(); ++i) flags[i] = (uint8_t)(i % 3 == 0);
        cols["flag"] = local_part(comm, array_from_vector(flags, {}, DType::Bool));
        return cols;
    }

} // namespace

TEST(HDF5CodecGroupTest, GroupNamesAreNormalized) {
    EXPECT_EQ(HDF5Codec().group(), "/");
    EXPECT_EQ(HDF5Codec("").group(), "/");
    EXPECT_EQ(HDF5Codec("data/cat/").group(), "/data/cat");
}

TEST_F(HDF5CodecTest, WriteThenReadWithAttrs) {
    MPI_Comm comm = MPI_COMM_WORLD;
    HDF5Codec codec("/data/cat");
    const json attrs = {
        {"boxsize", 1000.5}, {"seed", 42}, {"name", "mock"}, {"periodic", true},
        {"los", {0, 0, 1}}, {"cosmo", {{"h", 0.7}}}
    };
    codec.write_slice(comm, path("cat.h5"), SliceData(local_columns(comm, 10)), attrs);
    MPI_Barrier(comm);

    FileHeader h = codec.read_header(path("cat.h5"));
    EXPECT_EQ(h.size, 10);
    EXPECT_EQ(h.columns, (std::vector<std::string>{ "flag", "id", "pos" }));
    EXPECT_EQ(h.attrs["boxsize"], 1000.5);
    EXPECT_EQ(h.attrs["seed"], 42);
    EXPECT_EQ(h.attrs["name"], "mock");
    EXPECT_EQ(h.attrs["periodic"], true);
    EXPECT_EQ(h.attrs["los"], json::array({ 0, 0, 1 }));
    EXPECT_EQ(json::parse(h.attrs["cosmo"].get<std::string>()), attrs["cosmo"]);

    Array id = codec.read_slice(path("cat.h5"), "id", { 4, 7 });
    EXPECT_EQ(id.dtype, DType::Int64);
    EXPECT_EQ(array_to_vector<int64_t>(id), (std::vector<int64_t>{ 4, 5, 6 }));

    Array pos = codec.read_slice(path("cat.h5"), "pos", { 9, 10 });
    EXPECT_EQ(pos.shape, (std::vector<int64_t>{ 1, 3 }));
    EXPECT_EQ(array_to_vector<float>(pos), (std::vector<float>{ 13.5f, 14.0f, 14.5f }));

    Array flag = codec.read_slice(path("cat.h5"), "flag", { 0, 4 });
    EXPECT_EQ(flag.dtype, DType::Bool);
    EXPECT_EQ(array_to_vector<uint8_t>(flag), (std::vector<uint8_t>{ 1, 0, 0, 1 }));

    Array none = codec.read_slice(path("cat.h5"), "pos", { 3, 3 });
    EXPECT_EQ(none.shape, (std::vector<int64_t>{ 0, 3 }));

    EXPECT_THROW(codec.read_slice(path("cat.h5"), "vel", { 0, 1 }), ColumnNotFound);
    EXPECT_THROW(codec.read_slice(path("cat.h5"), "id", { 8, 11 }), Corrupt);
}

TEST_F(HDF5CodecTest, MissingThings) {
    MPI_Comm comm = MPI_COMM_WORLD;
    HDF5Codec root_group;
    EXPECT_THROW(root_group.read_header(path("absent.h5")), NotFound);

    if (comm_rank(comm) == 0) {
        std::ofstream out(path("text.h5"));
        out << "not hdf5\n";
    }
    MPI_Barrier(comm);
    EXPECT_THROW(root_group.read_header(path("text.h5")), Corrupt);

    root_group.write_slice(comm, path("flat.h5"), SliceData(local_columns(comm, 4)), json::object());
    MPI_Barrier(comm);
    EXPECT_THROW(HDF5Codec("/other").read_header(path("flat.h5")), NotFound);
    EXPECT_THROW(HDF5Codec("/id").read_header(path("flat.h5")), UnsupportedLayout);
}

TEST_F(HDF5CodecTest, UnequalColumnsAreCorrupt) {
    MPI_Comm comm = MPI_COMM_WORLD;
    if (comm_rank(comm) == 0) {
        hid_t file = H5Fcreate(path("ragged.h5").c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
        put_dataset(file, "a", { 1, 2, 3 });
        put_dataset(file, "b", { 1, 2 });
        H5Fclose(file);
    }
    MPI_Barrier(comm);
    try {
        HDF5Codec().read_header(path("ragged.h5"));
        FAIL() << "expected Corrupt";
    }
    catch (const Corrupt& e) {
        EXPECT_NE(std::string(e.what()).find("Column b"), std::string::npos);
    }
}

TEST_F(HDF5CodecTest, PartitionedAcrossFiles) {
    MPI_Comm comm = MPI_COMM_WORLD;
    auto codec = std::make_shared<HDF5Codec>();
    const std::vector<std::string> paths{ path("p0.h5"), path("p1.h5"), path("p2.h5") };

    PartitionedFile out(comm, paths, codec, "w", json{ {"run", 7} });
    out.write(local_columns(comm, 22));

    PartitionedFile back(comm, paths, codec, "r");
    EXPECT_EQ(back.csizes(), (std::vector<int64_t>{ 7, 7, 8 }));
    EXPECT_EQ(back.attrs()["run"], 7);
    EXPECT_TRUE(array_equal(gather_array(comm, back.read("id"), kAllRanks), array_from_vector(iota64(22))));
    EXPECT_EQ(back.read("pos").shape, get_shape(back.size(), { 3 }));
}
