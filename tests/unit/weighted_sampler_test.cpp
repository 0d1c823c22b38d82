#include "scheduler/random_source.hpp"
#include "scheduler/weighted_sampler.hpp"
#include "test_balancer_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <vector>

using testutils::MakeBackend;
using testutils::ScriptedRandomSource;
using zonelb::scheduler::AcceptAllBackends;
using zonelb::scheduler::SeededRandomSource;
using zonelb::scheduler::SelectWeighted;

namespace {

using Multipliers = std::map<std::string, double>;

} // namespace

TEST(WeightedSamplerTest, AcceptsWhenDrawBelowRunningShare) {
    std::vector<testutils::Backend> backends{
        MakeBackend("x", "a", 1.0),
        MakeBackend("y", "a", 1.0),
        MakeBackend("z", "a", 2.0),
    };
    Multipliers multipliers{{"a", 1.0}};

    // x: 1/1 接受; y: 1/2, 0.7 不接受; z: 2/4, 0.3 接受
    ScriptedRandomSource random({0.99, 0.7, 0.3});
    auto selected = SelectWeighted(backends, multipliers, AcceptAllBackends{}, random);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, "z");
    EXPECT_EQ(random.Draws(), 3u);

    // y: 1/2, 0.4 接受; z: 2/4, 0.6 不接受
    ScriptedRandomSource keep_y({0.0, 0.4, 0.6});
    selected = SelectWeighted(backends, multipliers, AcceptAllBackends{}, keep_y);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, "y");
}

TEST(WeightedSamplerTest, SkipsZonesWithoutMultiplier) {
    std::vector<testutils::Backend> backends{
        MakeBackend("x", "a"),
        MakeBackend("y", "b"),
        MakeBackend("z", "c"),
    };
    Multipliers multipliers{{"b", 0.5}, {"c", 0.0}};

    ScriptedRandomSource random({0.999});
    auto selected = SelectWeighted(backends, multipliers, AcceptAllBackends{}, random);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, "y");
    // 只有 y 是候选, 只消耗一次随机数
    EXPECT_EQ(random.Draws(), 1u);
}

TEST(WeightedSamplerTest, NoEligibleBackend) {
    auto backends = testutils::ReferenceBackends();
    Multipliers multipliers{{"a", 1.0}, {"b", 1.0}, {"c", 1.0}};
    ScriptedRandomSource random({0.0});

    auto reject_all = [](const testutils::Backend&) { return false; };
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(SelectWeighted(backends, multipliers, reject_all, random).has_value());
    }
    EXPECT_EQ(random.Draws(), 0u);
}

TEST(WeightedSamplerTest, EmptyMultipliersSelectNothing) {
    auto backends = testutils::ReferenceBackends();
    Multipliers multipliers;
    ScriptedRandomSource random({0.0});
    EXPECT_FALSE(SelectWeighted(backends, multipliers, AcceptAllBackends{}, random).has_value());

    Multipliers zeros{{"a", 0.0}, {"b", 0.0}, {"c", 0.0}};
    EXPECT_FALSE(SelectWeighted(backends, zeros, AcceptAllBackends{}, random).has_value());
}

TEST(WeightedSamplerTest, PredicateRestrictsCandidates) {
    auto backends = testutils::ReferenceBackends();
    Multipliers multipliers{{"a", 1.0}, {"b", 1.0}, {"c", 1.0}};
    SeededRandomSource random(11);

    auto only_b = [](const testutils::Backend& b) { return b.zone == "b"; };
    for (int i = 0; i < 1000; ++i) {
        auto selected = SelectWeighted(backends, multipliers, only_b, random);
        ASSERT_TRUE(selected.has_value());
        const int id = std::stoi(*selected);
        EXPECT_GE(id, 1);
        EXPECT_LE(id, 5);
    }
}

TEST(WeightedSamplerTest, ConvergesToWeightShareInAnyOrder) {
    std::vector<testutils::Backend> backends{
        MakeBackend("w1", "a", 1.0),
        MakeBackend("w2", "a", 2.0),
        MakeBackend("w3", "b", 3.0),
        MakeBackend("w4", "b", 4.0),
    };
    // 乘数对 zone b 减半: 实际权重 1, 2, 1.5, 2, 总和 6.5
    Multipliers multipliers{{"a", 1.0}, {"b", 0.5}};
    const std::map<std::string, double> expected{
        {"w1", 1.0 / 6.5}, {"w2", 2.0 / 6.5}, {"w3", 1.5 / 6.5}, {"w4", 2.0 / 6.5}};

    std::mt19937 shuffler(3);
    SeededRandomSource random(2024);
    constexpr int kDraws = 200000;
    for (int order = 0; order < 3; ++order) {
        std::shuffle(backends.begin(), backends.end(), shuffler);
        std::map<std::string, int> counts;
        for (int i = 0; i < kDraws; ++i) {
            auto selected = SelectWeighted(backends, multipliers, AcceptAllBackends{}, random);
            ASSERT_TRUE(selected.has_value());
            ++counts[*selected];
        }
        for (const auto& [id, share] : expected) {
            EXPECT_NEAR(static_cast<double>(counts[id]) / kDraws, share, 0.01)
                << "backend " << id << " order " << order;
        }
    }
}

TEST(WeightedSamplerTest, GenericIdAndZoneTypes) {
    using IntBackend = zonelb::registry::Backend<int, char>;
    std::vector<IntBackend> backends{{7, 'a', 1.0}, {8, 'b', 1.0}};
    std::map<char, double> multipliers{{'b', 1.0}};

    ScriptedRandomSource random({0.5});
    auto selected = SelectWeighted(backends, multipliers, AcceptAllBackends{}, random);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(*selected, 8);
}

TEST(SeededRandomSourceTest, StaysInUnitInterval) {
    SeededRandomSource random(42);
    for (int i = 0; i < 100000; ++i) {
        const double v = random.NextUniform();
        ASSERT_GE(v, 0.0);
        ASSERT_LT(v, 1.0);
    }
}

TEST(SeededRandomSourceTest, SameSeedSameSequence) {
    SeededRandomSource first(99);
    SeededRandomSource second(99);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(first.NextUniform(), second.NextUniform());
    }
}

TEST(SeededRandomSourceTest, EntropySourceProducesUnitInterval) {
    auto random = zonelb::scheduler::MakeEntropyRandomSource();
    ASSERT_NE(random, nullptr);
    const double v = random->NextUniform();
    EXPECT_GE(v, 0.0);
    EXPECT_LT(v, 1.0);
}
