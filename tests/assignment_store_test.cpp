///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>

#include "assignment_store.hpp"
#include "test_catalogs.hpp"


///////////////////////////
///     SNAPSHOTS       ///
///////////////////////////
TEST(AssignmentStore, StartsEmptyAtVersionZero) {
    AssignmentStore store(makeTestCatalog(2, 2, {4, 2}));
    StoreSnapshot snap = store.snapshot();
    EXPECT_TRUE(snap.assignment.empty());
    EXPECT_EQ(snap.assignmentVersion, 0u);
    EXPECT_EQ(snap.catalogVersion, 0u);
    EXPECT_EQ(snap.catalog->rooms.size(), 2u);
}


///////////////////////////
///    TRANSACTIONS     ///
///////////////////////////
TEST(AssignmentStore, CommitBumpsAssignmentVersionOnly) {
    AssignmentStore store(makeTestCatalog(2, 2, {4, 2}));
    auto before = store.snapshot().catalog;

    CommitOutcome out = store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        draft.assignment.entries.push_back({{1, 1}, 1});
        return std::nullopt;
    });

    EXPECT_FALSE(out.error.has_value());
    EXPECT_TRUE(out.committed);
    EXPECT_EQ(out.assignmentVersion, 1u);
    EXPECT_EQ(out.catalogVersion, 0u);

    StoreSnapshot snap = store.snapshot();
    EXPECT_EQ(snap.assignment.sessionAt({1, 1}), 1);
    // Untouched catalog is shared, not copied.
    EXPECT_EQ(snap.catalog.get(), before.get());
}

TEST(AssignmentStore, CatalogEditBumpsBothVersions) {
    AssignmentStore store(makeTestCatalog(1, 1, {}));
    CommitOutcome out = store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        draft.editCatalog().rooms.push_back(Room{2, "Annex", "Floor 2", 10});
        return std::nullopt;
    });
    EXPECT_TRUE(out.committed);
    EXPECT_EQ(out.assignmentVersion, 1u);
    EXPECT_EQ(out.catalogVersion, 1u);
    EXPECT_EQ(out.structureVersion, 1u);
    EXPECT_NE(store.snapshot().catalog->findRoom(2), nullptr);
}

TEST(AssignmentStore, VoteRefreshKeepsStructureVersion) {
    AssignmentStore store(makeTestCatalog(2, 1, {4, 2}));
    CommitOutcome out = store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        for (Session& s : draft.editCatalog().sessions) s.votes += 10;
        return std::nullopt;
    });
    EXPECT_TRUE(out.committed);
    EXPECT_EQ(out.catalogVersion, 1u);
    EXPECT_EQ(out.structureVersion, 0u);

    out = store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        draft.editCatalog().timeslots.front().blockedReason = "Lunch";
        return std::nullopt;
    });
    EXPECT_EQ(out.catalogVersion, 2u);
    EXPECT_EQ(out.structureVersion, 1u);
    EXPECT_EQ(store.snapshot().structureVersion, 1u);
}

TEST(AssignmentStore, RejectedMutatorLeavesNoTrace) {
    AssignmentStore store(makeTestCatalog(2, 2, {4, 2}));
    CommitOutcome out = store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        draft.assignment.entries.push_back({{1, 1}, 1});
        draft.editCatalog().rooms.clear();
        return CommandError{ErrorKind::NOT_FOUND, "nope"};
    });

    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->kind, ErrorKind::NOT_FOUND);
    EXPECT_FALSE(out.committed);

    StoreSnapshot snap = store.snapshot();
    EXPECT_TRUE(snap.assignment.empty());
    EXPECT_EQ(snap.catalog->rooms.size(), 2u);
    EXPECT_EQ(snap.assignmentVersion, 0u);
}

TEST(AssignmentStore, InvalidDraftIsRejectedAsInvariantViolation) {
    AssignmentStore store(makeTestCatalog(2, 2, {4, 2}));
    CommitOutcome out = store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        draft.assignment.entries.push_back({{1, 1}, 1});
        draft.assignment.entries.push_back({{1, 1}, 2});
        return std::nullopt;
    });

    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->kind, ErrorKind::INVARIANT_VIOLATION);
    EXPECT_TRUE(store.snapshot().assignment.empty());
    EXPECT_EQ(store.assignmentVersion(), 0u);
}

TEST(AssignmentStore, RoomRemovalWithoutCascadeIsRejected) {
    AssignmentStore store(makeTestCatalog(2, 1, {4}));
    store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        draft.assignment.entries.push_back({{2, 1}, 1});
        return std::nullopt;
    });

    CommitOutcome out = store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        draft.editCatalog().rooms.pop_back();
        return std::nullopt;
    });
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->kind, ErrorKind::INVARIANT_VIOLATION);
    EXPECT_EQ(store.snapshot().catalog->rooms.size(), 2u);
}

TEST(AssignmentStore, UnchangedDraftKeepsVersion) {
    AssignmentStore store(makeTestCatalog(1, 1, {1}));
    CommitOutcome out = store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        draft.unchanged = true;
        return std::nullopt;
    });
    EXPECT_FALSE(out.error.has_value());
    EXPECT_FALSE(out.committed);
    EXPECT_EQ(out.assignmentVersion, 0u);
}

TEST(AssignmentStore, CommittedEntriesAreInCanonicalOrder) {
    AssignmentStore store(makeTestCatalog(2, 2, {4, 2, 1}));
    store.transact([](StoreDraft& draft) -> std::optional<CommandError> {
        draft.assignment.entries = {{{2, 2}, 1}, {{1, 2}, 2}, {{2, 1}, 3}};
        return std::nullopt;
    });
    Assignment a = store.snapshot().assignment;
    ASSERT_EQ(a.size(), 3u);
    EXPECT_EQ(a.entries[0].slot, (Slot{2, 1}));
    EXPECT_EQ(a.entries[1].slot, (Slot{1, 2}));
    EXPECT_EQ(a.entries[2].slot, (Slot{2, 2}));
}
