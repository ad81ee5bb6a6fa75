///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>

#include "constraints.hpp"
#include "model.hpp"
#include "test_catalogs.hpp"


///////////////////////////
///   VALID  INPUTS     ///
///////////////////////////
TEST(ValidateAssignment, EmptyAssignmentIsValid) {
    Catalog catalog = makeTestCatalog(2, 2, {5, 3});
    EXPECT_FALSE(validateAssignment(Assignment{}, catalog).has_value());
}

TEST(ValidateAssignment, InjectiveAssignmentIsValid) {
    Catalog catalog = makeTestCatalog(2, 2, {5, 3, 1});
    Assignment a;
    a.entries = {{{1, 1}, 1}, {{2, 1}, 2}, {{1, 2}, 3}};
    EXPECT_FALSE(validateAssignment(a, catalog).has_value());
}


///////////////////////////
///     VIOLATIONS      ///
///////////////////////////
TEST(ValidateAssignment, DetectsDuplicateSlot) {
    Catalog catalog = makeTestCatalog(2, 2, {5, 3});
    Assignment a;
    a.entries = {{{1, 1}, 1}, {{1, 1}, 2}};
    auto v = validateAssignment(a, catalog);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::DUPLICATE_SLOT);
}

TEST(ValidateAssignment, DetectsDuplicateSession) {
    Catalog catalog = makeTestCatalog(2, 2, {5, 3});
    Assignment a;
    a.entries = {{{1, 1}, 1}, {{2, 2}, 1}};
    auto v = validateAssignment(a, catalog);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::DUPLICATE_SESSION);
    EXPECT_NE(v->detail.find("1"), std::string::npos);
}

TEST(ValidateAssignment, DetectsBlockedSlot) {
    Catalog catalog = makeTestCatalog(2, 2, {5, 3}, {2});
    Assignment a;
    a.entries = {{{1, 2}, 1}};
    auto v = validateAssignment(a, catalog);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::BLOCKED_SLOT);
}

TEST(ValidateAssignment, DetectsDanglingRoomTimeslotAndSession) {
    Catalog catalog = makeTestCatalog(2, 2, {5, 3});

    Assignment room;
    room.entries = {{{9, 1}, 1}};
    auto v = validateAssignment(room, catalog);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::DANGLING_REFERENCE);

    Assignment timeslot;
    timeslot.entries = {{{1, 9}, 1}};
    v = validateAssignment(timeslot, catalog);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::DANGLING_REFERENCE);

    Assignment session;
    session.entries = {{{1, 1}, 99}};
    v = validateAssignment(session, catalog);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::DANGLING_REFERENCE);
}

TEST(ValidateAssignment, ReportsDanglingBeforeDuplicates) {
    Catalog catalog = makeTestCatalog(2, 2, {5, 3}, {2});
    Assignment a;
    a.entries = {{{1, 1}, 1}, {{1, 1}, 1}, {{1, 2}, 2}, {{7, 1}, 2}};
    auto v = validateAssignment(a, catalog);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::DANGLING_REFERENCE);

    a.entries.pop_back();
    v = validateAssignment(a, catalog);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::BLOCKED_SLOT);

    a.entries.pop_back();
    v = validateAssignment(a, catalog);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::DUPLICATE_SLOT);
}


///////////////////////////
///   CANONICAL ORDER   ///
///////////////////////////
TEST(Catalog, EligibleSlotsFollowStartTimeThenRoom) {
    Catalog catalog = makeTestCatalog(2, 3, {}, {2});
    // Timeslot 3 starts before timeslot 1 once moved.
    catalog.timeslots[2].startMinute = 8 * 60;
    catalog.timeslots[2].endMinute = 9 * 60;

    std::vector<Slot> slots = catalog.eligibleSlots();
    std::vector<Slot> expected = {{1, 3}, {2, 3}, {1, 1}, {2, 1}};
    EXPECT_EQ(slots, expected);
}

TEST(Catalog, SortCanonicalOrdersEntries) {
    Catalog catalog = makeTestCatalog(3, 2, {1, 2, 3});
    Assignment a;
    a.entries = {{{3, 2}, 1}, {{1, 1}, 2}, {{2, 1}, 3}};
    catalog.sortCanonical(a);
    ASSERT_EQ(a.size(), 3u);
    EXPECT_EQ(a.entries[0].slot, (Slot{1, 1}));
    EXPECT_EQ(a.entries[1].slot, (Slot{2, 1}));
    EXPECT_EQ(a.entries[2].slot, (Slot{3, 2}));
}
