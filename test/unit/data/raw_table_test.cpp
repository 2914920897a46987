#include <gtest/gtest.h>

#include <arrow/api.h>

#include "f1metrics/core/error.h"
#include "f1metrics/data/csv_table_reader.h"
#include "f1metrics/data/raw_table.h"
#include "test_util/dataset_fixture.h"
#include "test_util/temp_dir.h"

namespace f1metrics {
namespace data {
namespace {

class RawTableTest : public ::testing::Test {
protected:
    RawTableTest() : dir_("f1metrics_raw_table") {}

    RawTable ReadCsv(const std::string& name, const std::string& contents) {
        testutil::WriteTable(dir_.path(), name, contents);
        CsvTableReader reader;
        auto opened = reader.Open((dir_.path() / name).string());
        EXPECT_TRUE(opened.ok()) << (opened.ok() ? "" : opened.error());
        std::shared_ptr<arrow::Table> table;
        auto read = reader.Read(&table);
        EXPECT_TRUE(read.ok()) << (read.ok() ? "" : read.error());
        EXPECT_TRUE(reader.Close().ok());
        return RawTable(name, table);
    }

    testutil::ScopedTempDir dir_;
};

TEST(CoerceTest, Integers) {
    EXPECT_EQ(CoerceInt64("12"), 12);
    EXPECT_EQ(CoerceInt64(" 7 "), 7);
    EXPECT_EQ(CoerceInt64("-3"), -3);
    EXPECT_EQ(CoerceInt64("3.0"), 3);
    EXPECT_FALSE(CoerceInt64("3.5").has_value());
}

TEST(CoerceTest, SentinelsBecomeNull) {
    EXPECT_FALSE(CoerceInt64("\\N").has_value());
    EXPECT_FALSE(CoerceInt64("R").has_value());
    EXPECT_FALSE(CoerceInt64("Ret").has_value());
    EXPECT_FALSE(CoerceInt64("").has_value());
    EXPECT_FALSE(CoerceDouble("\\N").has_value());
    EXPECT_FALSE(CoerceDouble("").has_value());
}

TEST(CoerceTest, Doubles) {
    EXPECT_DOUBLE_EQ(*CoerceDouble("2.5"), 2.5);
    EXPECT_DOUBLE_EQ(*CoerceDouble("18"), 18.0);
    EXPECT_FALSE(CoerceDouble("nan").has_value());
    EXPECT_FALSE(CoerceDouble("inf").has_value());
    EXPECT_FALSE(CoerceDouble("1:27.452").has_value());
}

TEST_F(RawTableTest, NullMarkerReadsAsNull) {
    RawTable table = ReadCsv("results.csv", testutil::dataset::kResults);
    EXPECT_EQ(table.num_rows(), 14);

    auto positions = table.Int64Column("position");
    ASSERT_EQ(positions.size(), 14u);
    EXPECT_EQ(positions[0], 1);
    // Row 1003: "\N" position
    EXPECT_FALSE(positions[5].has_value());
}

TEST_F(RawTableTest, MixedColumnCoercesPerCell) {
    RawTable table = ReadCsv("results.csv", testutil::dataset::kResults);
    auto texts = table.StringColumn("positionText");
    EXPECT_EQ(texts[0], "1");
    EXPECT_EQ(texts[5], "R");

    // "R" never becomes a number
    auto as_ints = table.Int64Column("positionText");
    EXPECT_EQ(as_ints[0], 1);
    EXPECT_FALSE(as_ints[5].has_value());
}

TEST_F(RawTableTest, IntegerColumnReadAsDouble) {
    RawTable table = ReadCsv("results.csv", testutil::dataset::kResults);
    auto points = table.DoubleColumn("points");
    ASSERT_TRUE(points[0].has_value());
    EXPECT_DOUBLE_EQ(*points[0], 25.0);
}

TEST_F(RawTableTest, DecimalPoints) {
    RawTable table = ReadCsv("points.csv", "raceId,points\n1,25\n2,0.5\n3,\\N\n");
    auto points = table.DoubleColumn("points");
    ASSERT_EQ(points.size(), 3u);
    EXPECT_DOUBLE_EQ(*points[0], 25.0);
    EXPECT_DOUBLE_EQ(*points[1], 0.5);
    EXPECT_FALSE(points[2].has_value());

    // 0.5 is not an integer
    auto as_ints = table.Int64Column("points");
    EXPECT_EQ(as_ints[0], 25);
    EXPECT_FALSE(as_ints[1].has_value());
}

TEST_F(RawTableTest, ColumnLookup) {
    RawTable table = ReadCsv("drivers.csv", testutil::dataset::kDrivers);
    EXPECT_TRUE(table.HasColumn("forename"));
    EXPECT_FALSE(table.HasColumn("nationality"));
    EXPECT_EQ(table.StringColumn("surname")[2], "Verstappen");
    EXPECT_THROW(table.Int64Column("nationality"), core::MalformedDataError);
}

TEST_F(RawTableTest, KeyColumnRejectsNull) {
    RawTable table = ReadCsv("bad.csv", "raceId,year\n1,2020\n\\N,2021\n");
    EXPECT_THROW(table.KeyColumn("raceId"), core::MalformedDataError);
    EXPECT_EQ(table.KeyColumn("year"), (std::vector<int64_t>{2020, 2021}));
}

TEST(CsvTableReaderTest, MissingFile) {
    CsvTableReader reader;
    auto result = reader.Open("/nonexistent/f1metrics/races.csv");
    EXPECT_FALSE(result.ok());
}

TEST(RawTableConstructionTest, RejectsNullTable) {
    EXPECT_THROW(RawTable("races.csv", nullptr), core::InternalError);
}

} // namespace
} // namespace data
} // namespace f1metrics
