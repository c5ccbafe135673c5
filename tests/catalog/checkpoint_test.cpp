#include <gtest/gtest.h>
#include <mpi.h>
#include <fstream>
#include "catalog/catalog.hpp"
#include "catalog/checkpoint.hpp"
#include "common/array.hpp"
#include "common/errors.hpp"
#include "mpi/collectives.hpp"
#include "test_util.hpp"

using namespace shardcat;
using nlohmann::json;
using shardcat::test::iota64;

namespace {

    CheckpointData sample() {
        CheckpointData cp;
        cp.attrs = { {"boxsize", 500}, {"los", {0, 0, 1}} };
        cp.order = { "vel", "id" };
        cp.columns["id"] = array_from_vector(iota64(4));
        cp.columns["vel"] = array_from_vector(std::vector<float>{ 1, 2, 3, 4, 5, 6, 7, 8 }, { 2 });
        return cp;
    }

    class CheckpointFileTest : public ::testing::Test {
    protected:
        void SetUp() override { dir_ = shardcat::test::shared_tmpdir(MPI_COMM_WORLD, "checkpoint"); }
        void TearDown() override { shardcat::test::remove_shared_tmpdir(MPI_COMM_WORLD, dir_); }
        std::string path(const std::string& name) const { return dir_ + "/" + name; }
        std::string dir_;
    };

} // namespace

TEST(CheckpointTest, EncodeDecode) {
    const CheckpointData cp = sample();
    CheckpointData back = decode_checkpoint(encode_checkpoint(cp), "memory");
    EXPECT_EQ(back.attrs, cp.attrs);
    EXPECT_EQ(back.order, cp.order);
    ASSERT_EQ(back.columns.size(), 2u);
    EXPECT_TRUE(array_equal(back.columns["vel"], cp.columns.at("vel")));
    EXPECT_EQ(back.columns["vel"].dtype, DType::Float32);
    EXPECT_EQ(back.columns["id"].shape, (std::vector<int64_t>{ 4 }));
}

TEST(CheckpointTest, GarbageIsCorrupt) {
    const std::vector<uint8_t> junk{ 0xc1, 0x00, 0x17 };
    EXPECT_THROW(decode_checkpoint(junk, "junk"), Corrupt);

    // valid MessagePack, wrong document
    EXPECT_THROW(decode_checkpoint(json::to_msgpack(json{ {"order", 3} }), "doc"), Corrupt);

    // byte count does not match the shape
    json doc = json::from_msgpack(encode_checkpoint(sample()));
    doc["columns"]["id"]["shape"] = json::array({ 5 });
    EXPECT_THROW(decode_checkpoint(json::to_msgpack(doc), "short"), Corrupt);

    doc = json::from_msgpack(encode_checkpoint(sample()));
    doc["columns"]["id"]["dtype"] = "<U8";
    EXPECT_THROW(decode_checkpoint(json::to_msgpack(doc), "strings"), Corrupt);
}

TEST_F(CheckpointFileTest, MissingFile) {
    EXPECT_THROW(read_checkpoint_file(path("nothing.ckpt")), NotFound);
    EXPECT_THROW(Catalog::load(path("nothing.ckpt"), MPI_COMM_WORLD), NotFound);
}

TEST_F(CheckpointFileTest, SaveThenLoad) {
    MPI_Comm comm = MPI_COMM_WORLD;
    const int world = comm_size(comm);
    Catalog cat(comm, json{ {"seed", 7} });
    cat.set("id", array_from_vector(iota64(3 + comm_rank(comm), 10 * comm_rank(comm))));
    cat.set("w", cat.full(0.5));

    // nested directories are created
    const std::string file = path("deep/er/cat.ckpt");
    cat.save(file);

    Catalog back = Catalog::load(file, comm);
    EXPECT_FALSE(back.has_source());
    EXPECT_EQ(back.attrs()["seed"], 7);
    EXPECT_EQ(back.columns(), (std::vector<std::string>{ "id", "w" }));
    EXPECT_EQ(back.csize(), cat.csize());
    EXPECT_EQ(back.size(), partition_bounds(cat.csize(), comm_rank(comm), world).size());
    EXPECT_TRUE(back == cat);
}

TEST_F(CheckpointFileTest, LoadWithFewerRanks) {
    MPI_Comm comm = MPI_COMM_WORLD;
    Catalog cat(comm);
    cat.set("x", array_from_vector(iota64(4, 4 * comm_rank(comm))));
    cat.save(path("all.ckpt"));

    // every rank reads the checkpoint alone
    MPI_Comm self;
    MPI_Comm_split(comm, comm_rank(comm), 0, &self);
    {
        Catalog alone = Catalog::load(path("all.ckpt"), self);
        EXPECT_EQ(alone.size(), 4 * comm_size(comm));
        EXPECT_EQ(array_to_vector<int64_t>(alone.get("x")), iota64(4 * comm_size(comm)));
    }
    MPI_Comm_free(&self);
}
