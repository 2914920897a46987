#include <gtest/gtest.h>
#include "f1metrics/core/error.h"
#include <string>

namespace f1metrics {
namespace core {
namespace {

TEST(ErrorTest, Construction) {
    Error error("Invalid input", Error::Code::INVALID_PARAMETER);
    EXPECT_EQ(error.code(), Error::Code::INVALID_PARAMETER);
    EXPECT_EQ(error.what(), std::string("Invalid input"));
}

TEST(ErrorTest, DefaultCodeIsUnknown) {
    Error error("Something happened");
    EXPECT_EQ(error.code(), Error::Code::UNKNOWN);
}

TEST(ErrorTest, CopyConstruction) {
    Error original("Table missing", Error::Code::NOT_FOUND);
    Error copy(original);

    EXPECT_EQ(copy.code(), original.code());
    EXPECT_EQ(copy.what(), std::string(original.what()));
}

TEST(ErrorTest, CaughtAsRuntimeError) {
    try {
        throw MalformedDataError("bad row");
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(e.what(), std::string("bad row"));
        return;
    }
    FAIL() << "MalformedDataError was not caught as std::runtime_error";
}

TEST(ErrorTest, SpecificErrorTypes) {
    InvalidParameterError invalid("constructor_id required");
    EXPECT_EQ(invalid.code(), Error::Code::INVALID_PARAMETER);

    NotFoundError not_found("results.csv not found");
    EXPECT_EQ(not_found.code(), Error::Code::NOT_FOUND);

    MalformedDataError malformed("raceId is not an integer");
    EXPECT_EQ(malformed.code(), Error::Code::MALFORMED_DATA);

    UnknownMetricError unknown("no_such_metric");
    EXPECT_EQ(unknown.code(), Error::Code::UNKNOWN_METRIC);

    InternalError internal("Internal error");
    EXPECT_EQ(internal.code(), Error::Code::INTERNAL);
    EXPECT_EQ(internal.what(), std::string("Internal error"));
}

TEST(ErrorTest, DataUnavailableNamesViewAndTable) {
    DataUnavailableError error("pit_stops", "pit_stops.csv");
    EXPECT_EQ(error.code(), Error::Code::DATA_UNAVAILABLE);
    EXPECT_EQ(error.view(), "pit_stops");
    EXPECT_EQ(error.table(), "pit_stops.csv");

    std::string message = error.what();
    EXPECT_NE(message.find("pit_stops"), std::string::npos);
    EXPECT_NE(message.find("pit_stops.csv"), std::string::npos);
}

TEST(ErrorTest, DerivedErrorsCaughtAsBase) {
    try {
        throw DataUnavailableError("lap_times", "lap_times.csv");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), Error::Code::DATA_UNAVAILABLE);
        return;
    }
    FAIL() << "DataUnavailableError was not caught as Error";
}

} // namespace
} // namespace core
} // namespace f1metrics
