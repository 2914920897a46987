#ifndef F1METRICS_MODEL_METRIC_VALUE_H_
#define F1METRICS_MODEL_METRIC_VALUE_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace f1metrics {
namespace model {

/**
 * @brief Schema-less value carried by metric results and metadata
 *
 * A closed set of kinds: null, bool, 64-bit integer, double, string,
 * list and ordered string-keyed map. Maps preserve insertion order.
 */
class MetricValue {
public:
    enum class Kind {
        NONE,
        BOOL,
        INT,
        DOUBLE,
        STRING,
        LIST,
        MAP
    };

    using List = std::vector<MetricValue>;
    using Map = std::vector<std::pair<std::string, MetricValue>>;

    MetricValue() : kind_(Kind::NONE) {}
    MetricValue(std::nullptr_t) : kind_(Kind::NONE) {}
    MetricValue(bool v) : kind_(Kind::BOOL), bool_(v) {}
    MetricValue(int v) : kind_(Kind::INT), int_(v) {}
    MetricValue(long v) : kind_(Kind::INT), int_(static_cast<int64_t>(v)) {}
    MetricValue(long long v) : kind_(Kind::INT), int_(static_cast<int64_t>(v)) {}
    MetricValue(unsigned long v) : kind_(Kind::INT), int_(static_cast<int64_t>(v)) {}
    MetricValue(double v) : kind_(Kind::DOUBLE), double_(v) {}
    MetricValue(const char* v) : kind_(Kind::STRING), string_(v) {}
    MetricValue(std::string v) : kind_(Kind::STRING), string_(std::move(v)) {}
    MetricValue(List v) : kind_(Kind::LIST), list_(std::move(v)) {}
    MetricValue(Map v) : kind_(Kind::MAP), map_(std::move(v)) {}

    // Empty optional maps to null
    template <typename T>
    MetricValue(const std::optional<T>& v) : MetricValue() {
        if (v) {
            *this = MetricValue(*v);
        }
    }

    Kind kind() const { return kind_; }

    bool isNull() const { return kind_ == Kind::NONE; }
    bool isBool() const { return kind_ == Kind::BOOL; }
    bool isInt() const { return kind_ == Kind::INT; }
    bool isDouble() const { return kind_ == Kind::DOUBLE; }
    bool isNumber() const { return kind_ == Kind::INT || kind_ == Kind::DOUBLE; }
    bool isString() const { return kind_ == Kind::STRING; }
    bool isList() const { return kind_ == Kind::LIST; }
    bool isMap() const { return kind_ == Kind::MAP; }

    bool getBool() const { return bool_; }
    int64_t getInt() const { return int_; }
    double getDouble() const { return double_; }
    // INT or DOUBLE as double
    double asDouble() const { return kind_ == Kind::INT ? static_cast<double>(int_) : double_; }
    const std::string& getString() const { return string_; }
    const List& getList() const { return list_; }
    const Map& getMap() const { return map_; }

    /**
     * @brief Look up a key in a MAP value
     * @return Pointer to the value, or nullptr if absent or not a map
     */
    const MetricValue* find(const std::string& key) const;

    // Set a key of a MAP value, replacing an existing entry (a null value becomes a map)
    void set(const std::string& key, MetricValue value);

    bool operator==(const MetricValue& other) const;
    bool operator!=(const MetricValue& other) const { return !(*this == other); }

    std::string kind_name() const;

private:
    Kind kind_;
    bool bool_ = false;
    int64_t int_ = 0;
    double double_ = 0.0;
    std::string string_;
    List list_;
    Map map_;
};

using Metadata = MetricValue::Map;

} // namespace model
} // namespace f1metrics

#endif // F1METRICS_MODEL_METRIC_VALUE_H_
