#include <gtest/gtest.h>
#include "drawstat/snapshot.hpp"
#include "drawstat/errors.hpp"

#include <string>
#include <vector>

using namespace drawstat;

namespace {

Draw draw(std::string date, std::vector<Value> values) {
    return Draw{std::move(date), std::move(values)};
}

const DrawLayout kPick3 = DrawLayout::uniform(3, 0, 9);

}  // namespace

// ─── DrawLayout ───────────────────────────────────────────────────────────────

TEST(Layout_Uniform, SharesOneRange) {
    const auto layout = DrawLayout::uniform(4, 1, 6);
    ASSERT_EQ(layout.positions(), 4u);
    for (const auto& r : layout.ranges) {
        EXPECT_EQ(r.min, 1);
        EXPECT_EQ(r.max, 6);
        EXPECT_EQ(r.size(), 6u);
    }
}

TEST(Layout_Accepts, WrongArity_Rejected) {
    const std::vector<Value> two{1, 2};
    EXPECT_FALSE(kPick3.accepts(two));
}

TEST(Layout_Accepts, OutOfRangeValue_Rejected) {
    const std::vector<Value> bad{1, 10, 2};
    EXPECT_FALSE(kPick3.accepts(bad));
}

TEST(Layout_Accepts, MixedRanges_CheckedPerPosition) {
    const DrawLayout layout{{ValueRange{1, 5}, ValueRange{1, 20}}};
    const std::vector<Value> ok{5, 20};
    const std::vector<Value> bad{6, 1};
    EXPECT_TRUE(layout.accepts(ok));
    EXPECT_FALSE(layout.accepts(bad));
}

// ─── Snapshot ─────────────────────────────────────────────────────────────────

TEST(Snapshot_Construct, InvalidDraw_Throws) {
    EXPECT_THROW(Snapshot(kPick3, {draw("2024-01-01", {1, 2})}), InvalidDrawError);
    EXPECT_THROW(Snapshot(kPick3, {draw("2024-01-01", {1, 2, -1})}), InvalidDrawError);
}

TEST(Snapshot_Construct, EmptyHistory_IsValid) {
    const Snapshot s(kPick3, {});
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.size(), 0u);
    EXPECT_EQ(s.positions(), 3u);
}

TEST(Snapshot_PositionSeries, ReturnsColumnInOrder) {
    const Snapshot s(kPick3, {draw("2024-01-01", {1, 2, 3}),
                              draw("2024-01-02", {4, 5, 6}),
                              draw("2024-01-03", {7, 8, 9})});
    EXPECT_EQ(s.position_series(1), (std::vector<Value>{2, 5, 8}));
    EXPECT_EQ(s.value_at(2, 0), 7);
}

TEST(Snapshot_PositionSeries, OutsideLayout_Empty) {
    const Snapshot s(kPick3, {draw("2024-01-01", {1, 2, 3})});
    EXPECT_TRUE(s.position_series(3).empty());
}

TEST(Snapshot_Fingerprint, EqualContent_EqualFingerprint) {
    const Snapshot a(kPick3, {draw("2024-01-01", {1, 2, 3})});
    const Snapshot b(kPick3, {draw("2024-01-01", {1, 2, 3})});
    EXPECT_EQ(a.fingerprint(), b.fingerprint());
}

TEST(Snapshot_Fingerprint, ChangedValue_ChangesFingerprint) {
    const Snapshot a(kPick3, {draw("2024-01-01", {1, 2, 3})});
    const Snapshot b(kPick3, {draw("2024-01-01", {1, 2, 4})});
    EXPECT_NE(a.fingerprint(), b.fingerprint());
}

TEST(Snapshot_Fingerprint, AppendedDraw_ChangesFingerprint) {
    const Snapshot a(kPick3, {draw("2024-01-01", {1, 2, 3})});
    const Snapshot b(kPick3, {draw("2024-01-01", {1, 2, 3}), draw("2024-01-02", {0, 0, 0})});
    EXPECT_NE(a.fingerprint(), b.fingerprint());
}

TEST(Snapshot_Fingerprint, DifferentLayout_ChangesFingerprint) {
    const Snapshot a(DrawLayout::uniform(3, 0, 9), {draw("2024-01-01", {1, 2, 3})});
    const Snapshot b(DrawLayout::uniform(3, 0, 8), {draw("2024-01-01", {1, 2, 3})});
    EXPECT_NE(a.fingerprint(), b.fingerprint());
}

// ─── InMemorySequenceStore ────────────────────────────────────────────────────

TEST(Store_Construct, SortsByDate) {
    const InMemorySequenceStore store(kPick3, {draw("2024-01-03", {3, 3, 3}),
                                               draw("2024-01-01", {1, 1, 1}),
                                               draw("2024-01-02", {2, 2, 2})});
    const auto all = store.draws({});
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].date, "2024-01-01");
    EXPECT_EQ(all[1].date, "2024-01-02");
    EXPECT_EQ(all[2].date, "2024-01-03");
}

TEST(Store_Construct, EqualDates_KeepInsertionOrder) {
    const InMemorySequenceStore store(kPick3, {draw("2024-01-01", {1, 1, 1}),
                                               draw("2024-01-01", {2, 2, 2})});
    const auto all = store.draws({});
    EXPECT_EQ(all[0].values[0], 1);
    EXPECT_EQ(all[1].values[0], 2);
}

TEST(Store_Construct, InvalidDraw_Throws) {
    EXPECT_THROW(InMemorySequenceStore(kPick3, {draw("2024-01-01", {1})}), InvalidDrawError);
}

TEST(Store_Filter, DateBoundsAreInclusive) {
    const InMemorySequenceStore store(kPick3, {draw("2024-01-01", {1, 1, 1}),
                                               draw("2024-01-02", {2, 2, 2}),
                                               draw("2024-01-03", {3, 3, 3}),
                                               draw("2024-01-04", {4, 4, 4})});
    DrawFilter f;
    f.from_date = "2024-01-02";
    f.to_date   = "2024-01-03";
    const auto out = store.draws(f);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out.front().date, "2024-01-02");
    EXPECT_EQ(out.back().date, "2024-01-03");
}

TEST(Store_Filter, LastN_KeepsMostRecent) {
    const InMemorySequenceStore store(kPick3, {draw("2024-01-01", {1, 1, 1}),
                                               draw("2024-01-02", {2, 2, 2}),
                                               draw("2024-01-03", {3, 3, 3})});
    DrawFilter f;
    f.last_n = 2;
    const auto out = store.draws(f);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out.front().date, "2024-01-02");
}

TEST(Store_Append, InsertsChronologically) {
    InMemorySequenceStore store(kPick3, {draw("2024-01-01", {1, 1, 1}),
                                         draw("2024-01-03", {3, 3, 3})});
    store.append(draw("2024-01-02", {2, 2, 2}));
    EXPECT_EQ(store.size(), 3u);
    const auto all = store.draws({});
    EXPECT_EQ(all[1].date, "2024-01-02");
}

TEST(Store_Snapshot, ReflectsFilterAndLayout) {
    const InMemorySequenceStore store(kPick3, {draw("2024-01-01", {1, 1, 1}),
                                               draw("2024-01-02", {2, 2, 2})});
    DrawFilter f;
    f.last_n = 1;
    const auto snap = store.snapshot(f);
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(snap->size(), 1u);
    EXPECT_TRUE(snap->layout() == kPick3);
    EXPECT_EQ(snap->value_at(0, 0), 2);
}
