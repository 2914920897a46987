#ifndef F1METRICS_CORE_ERROR_H_
#define F1METRICS_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace f1metrics {
namespace core {

/**
 * @brief Base class for all f1metrics errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_PARAMETER = 1,
        NOT_FOUND = 2,
        MALFORMED_DATA = 3,
        DATA_UNAVAILABLE = 4,
        UNKNOWN_METRIC = 5,
        INTERNAL = 6
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid or missing request parameters
 * (e.g. a constructor metric requested without a constructor id)
 */
class InvalidParameterError : public Error {
public:
    explicit InvalidParameterError(const std::string& message)
        : Error(message, Code::INVALID_PARAMETER) {}
    explicit InvalidParameterError(const char* message)
        : Error(message, Code::INVALID_PARAMETER) {}
};

/**
 * @brief Error indicating a missing backing table or resource
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating a schema or type violation in raw data
 */
class MalformedDataError : public Error {
public:
    explicit MalformedDataError(const std::string& message)
        : Error(message, Code::MALFORMED_DATA) {}
    explicit MalformedDataError(const char* message)
        : Error(message, Code::MALFORMED_DATA) {}
};

/**
 * @brief Error indicating that a derived view cannot be built because a
 * table it requires is absent
 *
 * This is not a system fault: callers treat it as a definitive "no result".
 */
class DataUnavailableError : public Error {
public:
    DataUnavailableError(const std::string& view, const std::string& table)
        : Error("view '" + view + "' unavailable: missing table '" + table + "'",
                Code::DATA_UNAVAILABLE),
          view_(view), table_(table) {}

    const std::string& view() const { return view_; }
    const std::string& table() const { return table_; }

private:
    std::string view_;
    std::string table_;
};

/**
 * @brief Error indicating a metric name that is not registered
 */
class UnknownMetricError : public Error {
public:
    explicit UnknownMetricError(const std::string& message)
        : Error(message, Code::UNKNOWN_METRIC) {}
    explicit UnknownMetricError(const char* message)
        : Error(message, Code::UNKNOWN_METRIC) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace f1metrics

#endif // F1METRICS_CORE_ERROR_H_
