#include <gtest/gtest.h>

#include <algorithm>

#include "f1metrics/metrics/registry.h"

namespace f1metrics {
namespace metrics {
namespace {

MetricDefinition MakeDefinition(const std::string& name, MetricKind kind, const std::string& unit) {
    MetricDefinition definition;
    definition.name = name;
    definition.description = "test metric";
    definition.unit = unit;
    definition.kind = kind;
    definition.formula = [](const MetricContext&, const model::MetricParams&) {
        return model::MetricResult();
    };
    return definition;
}

TEST(MetricRegistryTest, RegisterAndGet) {
    MetricRegistry registry;
    EXPECT_EQ(registry.Get("dnf_rate"), nullptr);

    registry.Register(MakeDefinition("dnf_rate", MetricKind::DRIVER, "percentage"));
    const MetricDefinition* definition = registry.Get("dnf_rate");
    ASSERT_NE(definition, nullptr);
    EXPECT_EQ(definition->unit, "percentage");
    EXPECT_EQ(registry.size(), 1u);
}

TEST(MetricRegistryTest, ReRegisterReplaces) {
    MetricRegistry registry;
    registry.Register(MakeDefinition("dnf_rate", MetricKind::DRIVER, "percentage"));
    registry.Register(MakeDefinition("dnf_rate", MetricKind::DRIVER, "ratio"));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.Get("dnf_rate")->unit, "ratio");
}

TEST(MetricRegistryTest, NamesSortedAndFilteredByKind) {
    MetricRegistry registry;
    registry.Register(MakeDefinition("podium_rate", MetricKind::DRIVER, "percentage"));
    registry.Register(MakeDefinition("constructor_win_rate", MetricKind::CONSTRUCTOR, "percentage"));
    registry.Register(MakeDefinition("dnf_rate", MetricKind::DRIVER, "percentage"));

    EXPECT_EQ(registry.Names(),
              (std::vector<std::string>{"constructor_win_rate", "dnf_rate", "podium_rate"}));
    EXPECT_EQ(registry.Names(MetricKind::DRIVER),
              (std::vector<std::string>{"dnf_rate", "podium_rate"}));
    EXPECT_EQ(registry.Names(MetricKind::CONSTRUCTOR),
              (std::vector<std::string>{"constructor_win_rate"}));
}

TEST(MetricRegistryTest, BuiltinCatalog) {
    MetricRegistry registry;
    RegisterBuiltinMetrics(registry);

    auto drivers = registry.Names(MetricKind::DRIVER);
    auto constructors = registry.Names(MetricKind::CONSTRUCTOR);
    EXPECT_EQ(drivers.size(), 9u);
    EXPECT_EQ(constructors.size(), 34u);
    EXPECT_EQ(registry.size(), drivers.size() + constructors.size());

    for (const auto& name : constructors) {
        EXPECT_EQ(name.rfind("constructor_", 0), 0u) << name;
    }
    for (const auto& name : registry.Names()) {
        const MetricDefinition* definition = registry.Get(name);
        ASSERT_NE(definition, nullptr);
        EXPECT_FALSE(definition->description.empty()) << name;
        EXPECT_FALSE(definition->unit.empty()) << name;
        EXPECT_FALSE(definition->required_tables.empty()) << name;
        EXPECT_TRUE(static_cast<bool>(definition->formula)) << name;
    }

    const auto& teammate = registry.Get("teammate_race_comparison")->required_params;
    EXPECT_NE(std::find(teammate.begin(), teammate.end(), "driver_id"), teammate.end());
}

TEST(MetricRegistryTest, KindNames) {
    EXPECT_EQ(MetricKindName(MetricKind::DRIVER), "driver");
    EXPECT_EQ(MetricKindName(MetricKind::CONSTRUCTOR), "constructor");
}

} // namespace
} // namespace metrics
} // namespace f1metrics
