#include <gtest/gtest.h>
#include "f1metrics/core/config.h"
#include <string>

namespace f1metrics {
namespace core {
namespace {

TEST(DataConfigTest, DefaultConstruction) {
    DataConfig config;
    EXPECT_EQ(config.dataset_dir, "");
    EXPECT_EQ(config.min_year, 0);
}

TEST(DataConfigTest, DefaultFactory) {
    DataConfig config = DataConfig::Default();
    EXPECT_EQ(config.dataset_dir, "dataset");
    EXPECT_EQ(config.min_year, 2011);
}

TEST(CacheConfigTest, DefaultConstruction) {
    CacheConfig config;
    EXPECT_EQ(config.cache_dir, "");
    EXPECT_FALSE(config.enabled);
    EXPECT_EQ(config.ttl_seconds, 0);
}

TEST(CacheConfigTest, DefaultFactory) {
    CacheConfig config = CacheConfig::Default();
    EXPECT_EQ(config.cache_dir, "cache");
    EXPECT_TRUE(config.enabled);
    EXPECT_EQ(config.ttl_seconds, 3600);
}

TEST(ConfigTest, DefaultFactoryIsValid) {
    Config config = Config::Default();
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.Validate().ok());
}

TEST(ConfigTest, CopyConstruction) {
    Config original = Config::Default();
    original.data.dataset_dir = "/data/f1";
    original.cache.ttl_seconds = 60;

    Config copy(original);
    EXPECT_EQ(copy.data.dataset_dir, "/data/f1");
    EXPECT_EQ(copy.cache.ttl_seconds, 60);
}

TEST(ConfigTest, RejectsEmptyDatasetDir) {
    Config config = Config::Default();
    config.data.dataset_dir.clear();
    auto result = config.Validate();
    ASSERT_FALSE(result.ok());
    EXPECT_NE(result.error().find("dataset_dir"), std::string::npos);
}

TEST(ConfigTest, RejectsOutOfRangeMinYear) {
    Config config = Config::Default();
    config.data.min_year = 1949;
    EXPECT_FALSE(config.Validate().ok());

    config.data.min_year = 2101;
    EXPECT_FALSE(config.Validate().ok());

    config.data.min_year = 1950;
    EXPECT_TRUE(config.Validate().ok());
}

TEST(ConfigTest, CacheDirOnlyRequiredWhenEnabled) {
    Config config = Config::Default();
    config.cache.cache_dir.clear();
    EXPECT_FALSE(config.Validate().ok());

    config.cache.enabled = false;
    EXPECT_TRUE(config.Validate().ok());
}

TEST(ConfigTest, RejectsNegativeTtl) {
    Config config = Config::Default();
    config.cache.ttl_seconds = -1;
    EXPECT_FALSE(config.Validate().ok());

    config.cache.ttl_seconds = 0;
    EXPECT_TRUE(config.Validate().ok());
}

TEST(ConfigTest, RejectsUnknownLogLevel) {
    Config config = Config::Default();
    config.log_level = "verbose";
    EXPECT_FALSE(config.Validate().ok());

    config.log_level = "warn";
    EXPECT_TRUE(config.Validate().ok());
}

} // namespace
} // namespace core
} // namespace f1metrics
