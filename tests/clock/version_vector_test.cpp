#include "synccore/clock/version_vector.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <vector>

using synccore::ErrorCode;
using synccore::clock::CausalRelation;
using synccore::clock::CompressedVersionVector;
using synccore::clock::CounterMap;
using synccore::clock::CounterRun;
using synccore::clock::VersionVector;

namespace {

VersionVector make_vector(synccore::clock::CounterMap counters) {
    return VersionVector::from_mapping(std::move(counters)).value();
}

std::vector<VersionVector> sample_vectors() {
    return {
        VersionVector{},
        make_vector({{"d1", 1}}),
        make_vector({{"d2", 1}}),
        make_vector({{"d1", 1}, {"d2", 1}}),
        make_vector({{"d1", 2}, {"d2", 1}}),
        make_vector({{"d1", 1}, {"d2", 0}}),
        make_vector({{"d1", 3}, {"d3", 7}}),
    };
}

} // namespace

TEST(VersionVectorTest, IncrementCountsPerReplica) {
    VersionVector vv;
    EXPECT_EQ(vv.increment("device1").value(), 1);
    EXPECT_EQ(vv.increment("device1").value(), 2);
    EXPECT_EQ(vv.increment("device2").value(), 1);
    EXPECT_EQ(vv.get("device1"), 2);
    EXPECT_EQ(vv.get("device2"), 1);
    EXPECT_EQ(vv.get("device3"), 0);
}

TEST(VersionVectorTest, IncrementLeavesOtherReplicasUnchanged) {
    auto vv = make_vector({{"a", 4}, {"b", 9}});
    const auto before_b = vv.get("b");
    const auto before_a = vv.get("a");

    ASSERT_TRUE(vv.increment("a").is_ok());

    EXPECT_EQ(vv.get("a"), before_a + 1);
    EXPECT_EQ(vv.get("b"), before_b);
    EXPECT_EQ(vv.size(), 2u);
}

TEST(VersionVectorTest, MergeTakesPointwiseMaximum) {
    VersionVector vv1;
    ASSERT_TRUE(vv1.increment("device1").is_ok());
    ASSERT_TRUE(vv1.increment("device1").is_ok());
    ASSERT_TRUE(vv1.increment("device2").is_ok());

    VersionVector vv2;
    ASSERT_TRUE(vv2.increment("device1").is_ok());
    ASSERT_TRUE(vv2.increment("device3").is_ok());
    ASSERT_TRUE(vv2.increment("device3").is_ok());

    vv1.merge(vv2);
    EXPECT_EQ(vv1.get("device1"), 2);
    EXPECT_EQ(vv1.get("device2"), 1);
    EXPECT_EQ(vv1.get("device3"), 2);
}

TEST(VersionVectorTest, MergeIsCommutativeAndIdempotent) {
    const auto vectors = sample_vectors();
    for (const auto& a : vectors) {
        EXPECT_EQ(a.merged_with(a), a);
        for (const auto& b : vectors) {
            EXPECT_EQ(a.merged_with(b), b.merged_with(a)) << a.to_string() << " / " << b.to_string();
        }
    }
}

TEST(VersionVectorTest, MergedVectorDominatesBothInputs) {
    const auto vectors = sample_vectors();
    for (const auto& a : vectors) {
        for (const auto& b : vectors) {
            const auto merged = a.merged_with(b);
            EXPECT_TRUE(merged.dominates(a)) << merged.to_string() << " vs " << a.to_string();
            EXPECT_TRUE(merged.dominates(b)) << merged.to_string() << " vs " << b.to_string();
        }
    }
}

TEST(VersionVectorTest, CausalRelations) {
    VersionVector vv1;
    ASSERT_TRUE(vv1.increment("device1").is_ok());

    auto vv2 = vv1;
    ASSERT_TRUE(vv2.increment("device2").is_ok());

    auto vv3 = vv2;
    ASSERT_TRUE(vv3.increment("device3").is_ok());

    auto vv4 = vv1;
    ASSERT_TRUE(vv4.increment("device3").is_ok());

    EXPECT_EQ(vv1.causal_relation(vv1), CausalRelation::Identical);

    EXPECT_EQ(vv1.causal_relation(vv2), CausalRelation::HappensBefore);
    EXPECT_EQ(vv2.causal_relation(vv1), CausalRelation::HappensAfter);
    EXPECT_EQ(vv1.causal_relation(vv3), CausalRelation::HappensBefore);
    EXPECT_EQ(vv3.causal_relation(vv1), CausalRelation::HappensAfter);
    EXPECT_EQ(vv2.causal_relation(vv3), CausalRelation::HappensBefore);
    EXPECT_EQ(vv3.causal_relation(vv2), CausalRelation::HappensAfter);

    EXPECT_EQ(vv2.causal_relation(vv4), CausalRelation::Concurrent);
    EXPECT_EQ(vv4.causal_relation(vv2), CausalRelation::Concurrent);
}

TEST(VersionVectorTest, CausalRelationIsSymmetric) {
    const auto vectors = sample_vectors();
    for (const auto& a : vectors) {
        for (const auto& b : vectors) {
            const auto forward = a.causal_relation(b);
            const auto backward = b.causal_relation(a);
            switch (forward) {
                case CausalRelation::HappensBefore:
                    EXPECT_EQ(backward, CausalRelation::HappensAfter);
                    break;
                case CausalRelation::HappensAfter:
                    EXPECT_EQ(backward, CausalRelation::HappensBefore);
                    break;
                default:
                    EXPECT_EQ(backward, forward);
                    break;
            }
        }
    }
}

TEST(VersionVectorTest, AbsentEntryEqualsZero) {
    auto explicit_zero = make_vector({{"d1", 1}, {"d2", 0}});
    auto implicit_zero = make_vector({{"d1", 1}});

    EXPECT_EQ(explicit_zero.causal_relation(implicit_zero), CausalRelation::Identical);
    EXPECT_EQ(implicit_zero.causal_relation(explicit_zero), CausalRelation::Identical);
    EXPECT_EQ(explicit_zero, implicit_zero);
    EXPECT_EQ(explicit_zero.hash(), implicit_zero.hash());
}

TEST(VersionVectorTest, DerivedPredicates) {
    auto older = make_vector({{"d1", 1}});
    auto newer = make_vector({{"d1", 2}});
    auto other = make_vector({{"d2", 1}});

    EXPECT_TRUE(newer.dominates(older));
    EXPECT_FALSE(older.dominates(newer));
    EXPECT_TRUE(older.is_dominated_by(newer));
    EXPECT_TRUE(older.dominates(older));
    EXPECT_TRUE(older.is_dominated_by(older));
    EXPECT_TRUE(older.is_concurrent_with(other));
    EXPECT_FALSE(older.is_concurrent_with(newer));
}

TEST(VersionVectorTest, DeltaCarriesOnlyNewerEntries) {
    auto local = make_vector({{"d1", 5}, {"d2", 1}});
    auto remote = make_vector({{"d1", 3}, {"d2", 4}, {"d3", 2}});

    const auto delta = local.create_delta(remote);
    ASSERT_EQ(delta.size(), 2u);
    EXPECT_EQ(delta.at("d2"), 4);
    EXPECT_EQ(delta.at("d3"), 2);

    ASSERT_TRUE(local.apply_delta(delta).is_ok());
    EXPECT_EQ(local, make_vector({{"d1", 5}, {"d2", 4}}).merged_with(make_vector({{"d3", 2}})));
    EXPECT_TRUE(local.create_delta(remote).empty());
}

TEST(VersionVectorTest, CompressRoundTrip) {
    for (const auto& vv : sample_vectors()) {
        auto restored = VersionVector::decompress(vv.compress());
        ASSERT_TRUE(restored.is_ok()) << restored.error().to_string();
        EXPECT_EQ(restored.value(), vv);
    }
}

TEST(VersionVectorTest, CompressGroupsEqualCounters) {
    auto vv = make_vector({{"a", 2}, {"b", 2}, {"c", 2}, {"d", 5}});
    const auto compressed = vv.compress();

    ASSERT_EQ(compressed.replicas.size(), 4u);
    EXPECT_EQ(compressed.replicas.front(), "a");
    ASSERT_EQ(compressed.runs.size(), 2u);
    EXPECT_EQ(compressed.runs[0].length, 3u);
    EXPECT_EQ(compressed.runs[0].value, 2);
    EXPECT_EQ(compressed.runs[1].length, 1u);
    EXPECT_EQ(compressed.runs[1].value, 5);
}

TEST(VersionVectorTest, DecompressRejectsInconsistentRuns) {
    CompressedVersionVector too_long;
    too_long.replicas = {"a"};
    too_long.runs = {CounterRun{2, 1}};
    auto result = VersionVector::decompress(too_long);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::DataFormat);

    CompressedVersionVector too_short;
    too_short.replicas = {"a", "b"};
    too_short.runs = {CounterRun{1, 1}};
    EXPECT_TRUE(VersionVector::decompress(too_short).is_error());

    CompressedVersionVector empty_run;
    empty_run.replicas = {"a"};
    empty_run.runs = {CounterRun{0, 1}, CounterRun{1, 1}};
    EXPECT_TRUE(VersionVector::decompress(empty_run).is_error());
}

TEST(VersionVectorTest, HashCacheInvalidatedOnMutation) {
    VersionVector vv;
    ASSERT_TRUE(vv.increment("d1").is_ok());
    const auto first = vv.hash();
    EXPECT_EQ(vv.hash(), first);

    ASSERT_TRUE(vv.increment("d1").is_ok());
    EXPECT_NE(vv.hash(), first);

    auto same = make_vector({{"d1", 2}});
    EXPECT_EQ(vv.hash(), same.hash());
}

TEST(VersionVectorTest, PruneOnlyRemovesRetiredReplicas) {
    auto vv = make_vector({{"retired-low", 1}, {"retired-high", 9}, {"live-low", 1}});
    const auto hash_before = vv.hash();

    const auto removed = vv.prune_inactive_entries(2, {"retired-low", "retired-high"});

    EXPECT_EQ(removed, 1u);
    EXPECT_EQ(vv.size(), 2u);
    EXPECT_EQ(vv.get("retired-low"), 0);
    EXPECT_EQ(vv.get("retired-high"), 9);
    EXPECT_EQ(vv.get("live-low"), 1);
    EXPECT_NE(vv.hash(), hash_before);
}

TEST(VersionVectorTest, ToStringListsSortedEntries) {
    auto vv = make_vector({{"b", 2}, {"a", 1}});
    EXPECT_EQ(vv.to_string(), "{a:1, b:2}");
    EXPECT_EQ(VersionVector{}.to_string(), "{}");
}

TEST(VersionVectorTest, NegativeCountersAreRejected) {
    auto built = VersionVector::from_mapping({{"a", -1}});
    ASSERT_TRUE(built.is_error());
    EXPECT_EQ(built.error().code, ErrorCode::DataFormat);

    auto vv = make_vector({{"a", 2}});
    auto applied = vv.apply_delta({{"a", 5}, {"b", -3}});
    ASSERT_TRUE(applied.is_error());
    EXPECT_EQ(applied.error().code, ErrorCode::DataFormat);
    EXPECT_EQ(vv.to_mapping(), (CounterMap{{"a", 2}}));

    CompressedVersionVector negative_run;
    negative_run.replicas = {"a"};
    negative_run.runs = {CounterRun{1, -4}};
    EXPECT_TRUE(VersionVector::decompress(negative_run).is_error());
}

TEST(VersionVectorTest, EveryConstructibleVectorSurvivesBinaryForm) {
    for (const auto& vv : sample_vectors()) {
        auto bytes = vv.to_bytes();
        ASSERT_TRUE(bytes.is_ok());
        auto decoded = VersionVector::from_bytes(bytes.value());
        ASSERT_TRUE(decoded.is_ok()) << decoded.error().to_string();
        EXPECT_EQ(decoded.value(), vv);
    }
}

TEST(VersionVectorTest, IncrementStopsAtMaximumCounter) {
    auto vv = make_vector({{"a", std::numeric_limits<std::int64_t>::max() - 1}});
    auto last = vv.increment("a");
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(last.value(), std::numeric_limits<std::int64_t>::max());

    auto overflow = vv.increment("a");
    ASSERT_TRUE(overflow.is_error());
    EXPECT_EQ(overflow.error().code, ErrorCode::DataFormat);
    EXPECT_EQ(vv.get("a"), std::numeric_limits<std::int64_t>::max());
}
