#include <gtest/gtest.h>
#include "common/array.hpp"
#include "common/records.hpp"

using namespace shardcat;

namespace {

    ColumnSet sample_columns() {
        ColumnSet cols;
        cols["id"] = array_from_vector(std::vector<int32_t>{ 7, 8, 9 });
        cols["pos"] = array_from_vector(std::vector<double>{ 0, 1, 2, 3, 4, 5, 6, 7, 8 }, { 3 });
        cols["flag"] = array_from_vector(std::vector<uint8_t>{ 1, 0, 1 }, {}, DType::Bool);
        return cols;
    }

} // namespace

TEST(RecordsTest, PackedLayoutFollowsOrder) {
    RecordArray rec = pack_records(sample_columns(), { "pos", "id", "flag" });
    ASSERT_EQ(rec.fields.size(), 3u);
    EXPECT_EQ(rec.fields[0].name, "pos");
    EXPECT_EQ(rec.fields[0].offset, 0);
    EXPECT_EQ(rec.fields[1].offset, 24);
    EXPECT_EQ(rec.fields[2].offset, 28);
    EXPECT_EQ(rec.itemsize, 29);
    EXPECT_EQ(rec.n_rows, 3);
    EXPECT_EQ(rec.bytes.size(), 87u);
    EXPECT_EQ(rec.fields[0].itemshape, std::vector<int64_t>{ 3 });
}

TEST(RecordsTest, UnpackRestoresColumns) {
    const ColumnSet cols = sample_columns();
    ColumnSet back = unpack_records(pack_records(cols));
    ASSERT_EQ(back.size(), cols.size());
    for (const auto& kv : cols) {
        EXPECT_TRUE(array_equal(back.at(kv.first), kv.second)) << kv.first;
        EXPECT_EQ(back.at(kv.first).dtype, kv.second.dtype);
    }
}

TEST(RecordsTest, ExtractField) {
    RecordArray rec = pack_records(sample_columns());
    EXPECT_TRUE(array_equal(extract_field(rec, "id"), sample_columns().at("id")));
    EXPECT_THROW(extract_field(rec, "nope"), std::runtime_error);
}

TEST(RecordsTest, RowCountsMustAgree) {
    ColumnSet cols = sample_columns();
    EXPECT_EQ(column_set_rows(cols), 3);
    cols["short"] = array_from_vector(std::vector<double>{ 1.0 });
    EXPECT_THROW(column_set_rows(cols), std::runtime_error);
    EXPECT_THROW(pack_records(cols), std::runtime_error);
    EXPECT_EQ(column_set_rows(ColumnSet{}), 0);
}
