#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <unistd.h>
#include "config/catalog_config.hpp"

using namespace shardcat;
using nlohmann::json;

TEST(CatalogConfigTest, Defaults) {
    CatalogConfig cfg = parse_catalog_config(json{ {"input", "halos.h5"} });
    EXPECT_EQ(cfg.input, (std::vector<std::string>{ "halos.h5" }));
    EXPECT_EQ(cfg.input_format, "hdf5");
    EXPECT_EQ(cfg.input_group, "/");
    EXPECT_TRUE(cfg.output.empty());
    EXPECT_TRUE(cfg.output_format.empty());
    EXPECT_FALSE(cfg.slice.has_value());
    EXPECT_TRUE(cfg.summary);
    EXPECT_FALSE(cfg.quiet);
}

TEST(CatalogConfigTest, FullConfig) {
    const json j = {
        {"input", {"a.0.npy", "a.1.npy"}},
        {"include", {"pos*", "id"}},
        {"exclude", "*_err"},
        {"slice", {nullptr, 100, 2}},
        {"output", json::array({ "out.data" })},
        {"output_format", "HDF5"},
        {"output_group", "/cat"},
        {"checkpoint_out", "cat.ckpt"},
        {"summary", false},
        {"quiet", true}
    };
    CatalogConfig cfg = parse_catalog_config(j);
    EXPECT_EQ(cfg.input.size(), 2u);
    EXPECT_EQ(cfg.input_format, "npy");
    EXPECT_EQ(cfg.include, (std::vector<std::string>{ "pos*", "id" }));
    EXPECT_EQ(cfg.exclude, (std::vector<std::string>{ "*_err" }));
    ASSERT_TRUE(cfg.slice.has_value());
    EXPECT_FALSE(cfg.slice->start.has_value());
    EXPECT_EQ(*cfg.slice->stop, 100);
    EXPECT_EQ(*cfg.slice->step, 2);
    EXPECT_EQ(cfg.output_format, "hdf5");
    EXPECT_EQ(cfg.output_group, "/cat");
    EXPECT_EQ(cfg.checkpoint_out, "cat.ckpt");
    EXPECT_FALSE(cfg.summary);
    EXPECT_TRUE(cfg.quiet);
}

TEST(CatalogConfigTest, SliceForms) {
    CatalogConfig stop_only = parse_catalog_config(json{ {"checkpoint_in", "c"}, {"slice", json::array({ 5 })} });
    EXPECT_FALSE(stop_only.slice->start.has_value());
    EXPECT_EQ(*stop_only.slice->stop, 5);

    CatalogConfig pair = parse_catalog_config(json{ {"checkpoint_in", "c"}, {"slice", {-3, nullptr}} });
    EXPECT_EQ(*pair.slice->start, -3);
    EXPECT_FALSE(pair.slice->stop.has_value());
    EXPECT_FALSE(pair.slice->step.has_value());

    EXPECT_THROW(parse_catalog_config(json{ {"checkpoint_in", "c"}, {"slice", {0, 4, 0}} }), std::runtime_error);
    EXPECT_THROW(parse_catalog_config(json{ {"checkpoint_in", "c"}, {"slice", json::array()} }), std::runtime_error);
    EXPECT_THROW(parse_catalog_config(json{ {"checkpoint_in", "c"}, {"slice", {1, 2, 3, 4}} }), std::runtime_error);
    EXPECT_THROW(parse_catalog_config(json{ {"checkpoint_in", "c"}, {"slice", json::array({ 0.5 })} }), std::runtime_error);
}

TEST(CatalogConfigTest, Rejected) {
    EXPECT_THROW(parse_catalog_config(json::array()), std::runtime_error);
    EXPECT_THROW(parse_catalog_config(json::object()), std::runtime_error);
    EXPECT_THROW(parse_catalog_config(json{ {"input", "a.h5"}, {"checkpoint_in", "c"} }), std::runtime_error);
    EXPECT_THROW(parse_catalog_config(json{ {"input", "a.fits"} }), std::runtime_error);
    EXPECT_THROW(parse_catalog_config(json{ {"input", "a.h5"}, {"input_format", "fits"} }), std::runtime_error);
    EXPECT_THROW(parse_catalog_config(json{ {"input", {"a.h5", 3}} }), std::runtime_error);
    EXPECT_THROW(parse_catalog_config(json{ {"input", "a.h5"}, {"quiet", "yes"} }), std::runtime_error);
}

TEST(CatalogConfigTest, InferFormat) {
    EXPECT_EQ(infer_format("dir/cat.h5"), "hdf5");
    EXPECT_EQ(infer_format("cat.HDF5"), "hdf5");
    EXPECT_EQ(infer_format("cat.hdf"), "hdf5");
    EXPECT_EQ(infer_format("cat.npy"), "npy");
    EXPECT_THROW(infer_format("cat"), std::runtime_error);
}

TEST(CatalogConfigTest, LoadFromFile) {
    const std::string path = "/tmp/shardcat_config_" + std::to_string(::getpid()) + ".json";
    EXPECT_THROW(load_catalog_config(path), std::runtime_error);
    {
        std::ofstream out(path);
        out << "{ \"input\": \"x.npy\", ";
    }
    EXPECT_THROW(load_catalog_config(path), std::runtime_error);
    {
        std::ofstream out(path);
        out << "{ \"input\": \"x.npy\", \"summary\": false }";
    }
    CatalogConfig cfg = load_catalog_config(path);
    EXPECT_EQ(cfg.input_format, "npy");
    EXPECT_FALSE(cfg.summary);
    std::remove(path.c_str());
}
