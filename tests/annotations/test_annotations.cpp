/**
 * @file test_annotations.cpp
 * @brief Annotation store tests
 */

#include "stackless/annotations.hpp"

#include <vector>

#include <gtest/gtest.h>

namespace stackless::annotations::test {

TEST(AnnotationsTest, MissingKindIsNull)
{
    Annotations store;
    EXPECT_TRUE(store.empty());
    EXPECT_EQ(store.get<LiveVarAnnotation>(), nullptr);
    EXPECT_FALSE(store.contains(AnalysisKind::kLiveVar));
}

TEST(AnnotationsTest, SetAndGetByPayloadType)
{
    Annotations store;
    LiveVarAnnotation live;
    live.at[0] = LiveVarInfo{.before = {1, 2}, .after = {2}};
    store.set(live);

    ASSERT_NE(store.get<LiveVarAnnotation>(), nullptr);
    EXPECT_EQ(*store.get<LiveVarAnnotation>(), live);
    EXPECT_TRUE(store.contains(AnalysisKind::kLiveVar));
    // Each payload type owns a separate slot.
    EXPECT_EQ(store.get<BorrowAnnotation>(), nullptr);
    EXPECT_EQ(store.size(), 1U);
}

TEST(AnnotationsTest, SetReplacesSameKind)
{
    Annotations store;
    store.set(LifetimeAnnotation{.intervals = {{3, LifetimeInterval{.begin = 0, .end = 4}}}});
    store.set(LifetimeAnnotation{.intervals = {{5, LifetimeInterval{.begin = 1, .end = 2}}}});

    const auto* lifetime = store.get<LifetimeAnnotation>();
    ASSERT_NE(lifetime, nullptr);
    EXPECT_EQ(lifetime->intervals.size(), 1U);
    EXPECT_TRUE(lifetime->intervals.contains(5));
    EXPECT_EQ(store.size(), 1U);
}

TEST(AnnotationsTest, KindsAreInEnumOrder)
{
    Annotations store;
    store.set(WriteBackAnnotation{});
    store.set(LiveVarAnnotation{});
    store.set(PackRefAnnotation{});

    const std::vector<AnalysisKind> expected{
        AnalysisKind::kLiveVar, AnalysisKind::kPackRef, AnalysisKind::kWriteBack};
    EXPECT_EQ(store.kinds(), expected);
}

TEST(AnnotationsTest, CopyFromCopiesOnlyRequestedKind)
{
    Annotations source;
    source.set(ReachingDefAnnotation{});
    source.set(BorrowAnnotation{});

    Annotations target;
    EXPECT_TRUE(target.copy_from(source, AnalysisKind::kBorrow));
    EXPECT_FALSE(target.copy_from(source, AnalysisKind::kLifetime));

    EXPECT_TRUE(target.contains(AnalysisKind::kBorrow));
    EXPECT_FALSE(target.contains(AnalysisKind::kReachingDef));
    EXPECT_FALSE(target.contains(AnalysisKind::kLifetime));
}

TEST(AnnotationsTest, KindNames)
{
    EXPECT_EQ(analysis_kind_name(AnalysisKind::kLiveVar), "livevar");
    EXPECT_EQ(analysis_kind_name(AnalysisKind::kReachingDef), "reaching_def");
    EXPECT_EQ(analysis_kind_name(AnalysisKind::kWriteBack), "writeback");
}

}  // namespace stackless::annotations::test
