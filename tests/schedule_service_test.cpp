///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <gtest/gtest.h>

#include "assignment_store.hpp"
#include "constraints.hpp"
#include "schedule_service.hpp"
#include "sequential_optimizer.hpp"
#include "test_catalogs.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Sequential optimizer with a hook that runs inside optimize().
 *
 * The hook runs before the search, off the store lock, which lets tests
 * interleave other commands with an in-flight generate.
 */
class HookedOptimizer : public IOptimizer {
public:
    explicit HookedOptimizer(std::function<void(int call, const CancelFlag&)> hook, bool honorCancel = true)
            : hook_(std::move(hook)), honorCancel_(honorCancel), inner_(quietConfig()) {}

    OptimizerResult optimize(const ScheduleInstance& inst, const Assignment* seed,
                             const CancelFlag& cancel) const override {
        int call = calls_++;
        if (hook_) hook_(call, cancel);
        return inner_.optimize(inst, seed, honorCancel_ ? cancel : CancelFlag());
    }

    const char* name() const override { return "hooked"; }

    static EngineConfig quietConfig() {
        EngineConfig cfg;
        cfg.timeBudgetMs = 0;
        return cfg;
    }

private:
    std::function<void(int, const CancelFlag&)> hook_;
    bool honorCancel_;
    SequentialOptimizer inner_;
    mutable std::atomic<int> calls_{0};
};

/**
 * @brief Store + service over the 3 rooms x 2 timeslots example catalog.
 */
class ScheduleServiceTest : public ::testing::Test {
protected:
    ScheduleServiceTest()
            : store_(makeTestCatalog(3, 2, {10, 7, 7, 1})),
              service_(store_, std::make_unique<SequentialOptimizer>(HookedOptimizer::quietConfig())) {}

    /// Generate and return the committed assignment.
    Assignment generated() {
        CommandResult r = service_.generate(facilitator());
        EXPECT_TRUE(r.ok());
        return service_.snapshot().assignment;
    }

    void expectValid() {
        StoreSnapshot snap = service_.snapshot();
        auto v = validateAssignment(snap.assignment, *snap.catalog);
        EXPECT_FALSE(v.has_value()) << (v ? v->detail : "");
    }

    AssignmentStore store_;
    ScheduleService service_;
};


///////////////////////////
///     PERMISSIONS     ///
///////////////////////////
TEST_F(ScheduleServiceTest, ViewerCannotMutate) {
    generated();
    uint64_t version = service_.snapshot().assignmentVersion;

    EXPECT_EQ(service_.generate(viewer()).kind(), ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(service_.improve(viewer()).kind(), ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(service_.clear(viewer()).kind(), ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(service_.move(viewer(), {1, 1}, {2, 2}).kind(), ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(service_.swap(viewer(), {1, 1}, {2, 1}).kind(), ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(service_.removeRoom(viewer(), 1).kind(), ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(service_.addTimeslot(viewer(), Timeslot{9, 900, 960, std::nullopt}).kind(),
              ErrorKind::PERMISSION_DENIED);
    EXPECT_EQ(service_.upsertSession(viewer(), Session{50, "x", "", 1, std::nullopt, 10}).kind(),
              ErrorKind::PERMISSION_DENIED);

    EXPECT_EQ(service_.snapshot().assignmentVersion, version);
    EXPECT_EQ(service_.snapshot().assignment.size(), 4u);
}

TEST_F(ScheduleServiceTest, AdminAndFacilitatorCanMutate) {
    EXPECT_TRUE(service_.generate(admin()).ok());
    EXPECT_TRUE(service_.clear(facilitator()).ok());
}

TEST_F(ScheduleServiceTest, PermissionCheckedBeforeVersion) {
    generated();
    EXPECT_EQ(service_.move(viewer(), {1, 1}, {2, 2}, 12345u).kind(), ErrorKind::PERMISSION_DENIED);
}


///////////////////////////
///   GENERATE / CLEAR  ///
///////////////////////////
TEST_F(ScheduleServiceTest, GeneratePlacesExampleScenario) {
    CommandResult r = service_.generate(facilitator());
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.assignment.has_value());
    EXPECT_EQ(r.version, 1u);

    Assignment a = service_.snapshot().assignment;
    EXPECT_EQ(*r.assignment, a);
    // The 10-vote session gets the second timeslot to itself.
    EXPECT_EQ(a.sessionAt({1, 1}), 4);
    EXPECT_EQ(a.sessionAt({2, 1}), 2);
    EXPECT_EQ(a.sessionAt({3, 1}), 3);
    EXPECT_EQ(a.sessionAt({1, 2}), 1);
    EXPECT_EQ(service_.freeSlots().size(), 2u);
    EXPECT_TRUE(service_.unassignedSessions().empty());
}

TEST_F(ScheduleServiceTest, GenerateTwiceIsIdentical) {
    Assignment first = generated();
    Assignment second = generated();
    EXPECT_EQ(first, second);
}

TEST_F(ScheduleServiceTest, ClearEmptiesAssignmentOnly) {
    generated();
    CommandResult r = service_.clear(facilitator());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.touched.size(), 4u);
    StoreSnapshot snap = service_.snapshot();
    EXPECT_TRUE(snap.assignment.empty());
    EXPECT_EQ(snap.catalog->sessions.size(), 4u);
    EXPECT_EQ(snap.catalog->rooms.size(), 3u);
}

TEST_F(ScheduleServiceTest, ImproveKeepsGoodScheduleAndFillsGaps) {
    generated();
    ASSERT_TRUE(service_.unassign(facilitator(), {1, 1}).ok());
    ASSERT_TRUE(service_.unassign(facilitator(), {2, 1}).ok());

    CommandResult r = service_.improve(facilitator());
    ASSERT_TRUE(r.ok());
    Assignment a = service_.snapshot().assignment;
    EXPECT_EQ(a.size(), 4u);
    // Untouched entries stay where the editor left them.
    EXPECT_EQ(a.sessionAt({3, 1}), 3);
    EXPECT_EQ(a.sessionAt({1, 2}), 1);
    expectValid();
}

TEST_F(ScheduleServiceTest, ImproveNeverEvictsAPlacedSession) {
    AssignmentStore store(makeTestCatalog(1, 1, {5, 10}));
    ScheduleService service(store, std::make_unique<SequentialOptimizer>(HookedOptimizer::quietConfig()));
    ASSERT_TRUE(service.place(admin(), 1, {1, 1}).ok());

    CommandResult r = service.improve(admin());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(service.assignment().sessionAt({1, 1}), 1);
    ASSERT_EQ(service.unassignedSessions().size(), 1u);
    EXPECT_EQ(service.unassignedSessions()[0].id, 2);
}

TEST_F(ScheduleServiceTest, ImproveSpreadsPopularSessionsItPlaces) {
    // Nothing placed yet: improve builds the schedule and may rearrange all of it.
    // The vote-only layout stacks the three popular sessions in the first timeslot.
    ScheduleScore before;
    {
        AssignmentStore stacked(makeTestCatalog(3, 2, {10, 7, 7, 1}));
        ScheduleService editor(stacked, std::make_unique<SequentialOptimizer>(HookedOptimizer::quietConfig()));
        ASSERT_TRUE(editor.place(admin(), 1, {1, 1}).ok());
        ASSERT_TRUE(editor.place(admin(), 2, {2, 1}).ok());
        ASSERT_TRUE(editor.place(admin(), 3, {3, 1}).ok());
        ASSERT_TRUE(editor.place(admin(), 4, {1, 2}).ok());
        before = editor.evaluate();
    }

    ASSERT_TRUE(service_.improve(facilitator()).ok());
    ScheduleScore after = service_.evaluate();
    EXPECT_EQ(after.assignedVotes, before.assignedVotes);
    EXPECT_LT(after.weighted, before.weighted);
    EXPECT_EQ(service_.assignment().sessionAt({1, 2}), 1);
}


///////////////////////////
///        MOVE         ///
///////////////////////////
TEST_F(ScheduleServiceTest, MoveToEmptySlot) {
    generated();
    CommandResult r = service_.move(facilitator(), {1, 1}, {3, 2});
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.touched.size(), 2u);
    EXPECT_EQ(r.touched[0], (SlotState{{1, 1}, std::nullopt}));
    EXPECT_EQ(r.touched[1], (SlotState{{3, 2}, 4}));

    Assignment a = service_.snapshot().assignment;
    EXPECT_FALSE(a.sessionAt({1, 1}).has_value());
    EXPECT_EQ(a.sessionAt({3, 2}), 4);
    EXPECT_EQ(a.size(), 4u);
    expectValid();
}

TEST_F(ScheduleServiceTest, MoveToOccupiedSlotSwaps) {
    generated();
    CommandResult r = service_.move(facilitator(), {1, 1}, {2, 1});
    ASSERT_TRUE(r.ok());
    Assignment a = service_.snapshot().assignment;
    EXPECT_EQ(a.sessionAt({1, 1}), 2);
    EXPECT_EQ(a.sessionAt({2, 1}), 4);
    EXPECT_EQ(a.size(), 4u);
}

TEST_F(ScheduleServiceTest, MoveOntoItselfIsNoOp) {
    generated();
    uint64_t version = service_.snapshot().assignmentVersion;
    CommandResult r = service_.move(facilitator(), {1, 1}, {1, 1});
    EXPECT_TRUE(r.ok());
    EXPECT_EQ(r.version, version);
    EXPECT_EQ(service_.snapshot().assignmentVersion, version);
}

TEST_F(ScheduleServiceTest, MoveRejections) {
    generated();
    ASSERT_TRUE(service_.blockTimeslot(admin(), 2, "Lunch").ok());

    EXPECT_EQ(service_.move(facilitator(), {1, 1}, {2, 2}).kind(), ErrorKind::SLOT_BLOCKED);
    EXPECT_EQ(service_.move(facilitator(), {1, 2}, {2, 1}).kind(), ErrorKind::NOT_FOUND);
    EXPECT_EQ(service_.move(facilitator(), {1, 1}, {7, 1}).kind(), ErrorKind::NOT_FOUND);
    EXPECT_EQ(service_.move(facilitator(), {1, 1}, {1, 7}).kind(), ErrorKind::NOT_FOUND);
    expectValid();
}

TEST_F(ScheduleServiceTest, StaleVersionIsConflict) {
    generated();
    uint64_t version = service_.snapshot().assignmentVersion;

    ASSERT_TRUE(service_.move(facilitator(), {1, 1}, {2, 1}, version).ok());
    CommandResult stale = service_.move(facilitator(), {2, 1}, {1, 1}, version);
    EXPECT_EQ(stale.kind(), ErrorKind::CONFLICT);
    EXPECT_EQ(stale.version, version + 1);

    Assignment a = service_.snapshot().assignment;
    EXPECT_EQ(a.sessionAt({1, 1}), 2);
    EXPECT_EQ(a.sessionAt({2, 1}), 4);
}


///////////////////////////
///        SWAP         ///
///////////////////////////
TEST_F(ScheduleServiceTest, SwapExchangesSessions) {
    generated();
    CommandResult r = service_.swap(facilitator(), {3, 1}, {1, 2});
    ASSERT_TRUE(r.ok());
    Assignment a = service_.snapshot().assignment;
    EXPECT_EQ(a.sessionAt({3, 1}), 1);
    EXPECT_EQ(a.sessionAt({1, 2}), 3);
    expectValid();
}

TEST_F(ScheduleServiceTest, SwapNeedsTwoOccupiedSlots) {
    generated();
    EXPECT_EQ(service_.swap(facilitator(), {1, 1}, {2, 2}).kind(), ErrorKind::NOT_FOUND);
    EXPECT_EQ(service_.swap(facilitator(), {3, 2}, {1, 1}).kind(), ErrorKind::NOT_FOUND);
    EXPECT_EQ(service_.swap(facilitator(), {1, 1}, {9, 9}).kind(), ErrorKind::NOT_FOUND);
}

TEST_F(ScheduleServiceTest, SwapIntoBlockedTimeslotIsRejected) {
    generated();
    ASSERT_TRUE(service_.blockTimeslot(admin(), 2, "Keynote").ok());
    EXPECT_EQ(service_.swap(facilitator(), {1, 1}, {1, 2}).kind(), ErrorKind::SLOT_BLOCKED);
}


///////////////////////////
///  PLACE / UNASSIGN   ///
///////////////////////////
TEST_F(ScheduleServiceTest, LeftOverSessionCanBePlacedOnceSlotsAppear) {
    // Only one open timeslot: the vote-1 session is left out.
    ASSERT_TRUE(service_.blockTimeslot(admin(), 2, "Lunch").ok());
    generated();
    std::vector<Session> waiting = service_.unassignedSessions();
    ASSERT_EQ(waiting.size(), 1u);
    EXPECT_EQ(waiting[0].id, 4);

    ASSERT_TRUE(service_.addTimeslot(admin(), Timeslot{3, 14 * 60, 15 * 60, std::nullopt}).ok());
    size_t before = service_.snapshot().assignment.size();

    CommandResult r = service_.place(facilitator(), 4, {2, 3});
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(service_.snapshot().assignment.size(), before + 1);
    EXPECT_EQ(service_.snapshot().assignment.sessionAt({2, 3}), 4);
    EXPECT_TRUE(service_.unassignedSessions().empty());
}

TEST_F(ScheduleServiceTest, PlaceRejections) {
    generated();
    ASSERT_TRUE(service_.unassign(facilitator(), {1, 2}).ok());

    EXPECT_EQ(service_.place(facilitator(), 2, {3, 2}).kind(), ErrorKind::ALREADY_SCHEDULED);
    EXPECT_EQ(service_.place(facilitator(), 1, {1, 1}).kind(), ErrorKind::CONFLICT);
    EXPECT_EQ(service_.place(facilitator(), 99, {3, 2}).kind(), ErrorKind::NOT_FOUND);
    ASSERT_TRUE(service_.blockTimeslot(admin(), 2, "Lunch").ok());
    EXPECT_EQ(service_.place(facilitator(), 1, {3, 2}).kind(), ErrorKind::SLOT_BLOCKED);
}

TEST_F(ScheduleServiceTest, AddToScheduleUsesFirstFreeSlot) {
    generated();
    ASSERT_TRUE(service_.unassign(facilitator(), {2, 1}).ok());

    CommandResult r = service_.addToSchedule(facilitator(), 2);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.touched.size(), 1u);
    EXPECT_EQ(r.touched[0].slot, (Slot{2, 1}));

    EXPECT_EQ(service_.addToSchedule(facilitator(), 2).kind(), ErrorKind::ALREADY_SCHEDULED);
}

TEST_F(ScheduleServiceTest, AddToScheduleReportsFullSchedule) {
    ASSERT_TRUE(service_.blockTimeslot(admin(), 2, "Lunch").ok());
    generated();
    EXPECT_EQ(service_.addToSchedule(facilitator(), 4).kind(), ErrorKind::SCHEDULE_FULL);
}

TEST_F(ScheduleServiceTest, UnassignEmptySlotIsNotFound) {
    generated();
    EXPECT_EQ(service_.unassign(facilitator(), {3, 2}).kind(), ErrorKind::NOT_FOUND);
    CommandResult r = service_.unassign(facilitator(), {1, 1});
    ASSERT_TRUE(r.ok());
    EXPECT_FALSE(service_.snapshot().assignment.slotOf(4).has_value());
}


///////////////////////////
///      CASCADES       ///
///////////////////////////
TEST_F(ScheduleServiceTest, RemoveRoomCascadesExactlyItsEntries) {
    generated();
    // Room 1 holds sessions 4 and 1.
    CommandResult r = service_.removeRoom(admin(), 1);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.touched.size(), 2u);

    StoreSnapshot snap = service_.snapshot();
    EXPECT_EQ(snap.assignment.size(), 2u);
    EXPECT_EQ(snap.assignment.sessionAt({2, 1}), 2);
    EXPECT_EQ(snap.assignment.sessionAt({3, 1}), 3);
    EXPECT_EQ(snap.catalog->findRoom(1), nullptr);
    expectValid();
}

TEST_F(ScheduleServiceTest, RemoveTimeslotCascades) {
    generated();
    ASSERT_TRUE(service_.removeTimeslot(admin(), 1).ok());
    StoreSnapshot snap = service_.snapshot();
    EXPECT_EQ(snap.assignment.size(), 1u);
    EXPECT_EQ(snap.assignment.sessionAt({1, 2}), 1);
    expectValid();
}

TEST_F(ScheduleServiceTest, BlockTimeslotEvictsAndUnblockRestoresEligibility) {
    generated();
    ASSERT_TRUE(service_.blockTimeslot(admin(), 1, "Opening keynote").ok());
    EXPECT_EQ(service_.snapshot().assignment.size(), 1u);
    EXPECT_EQ(service_.freeSlots().size(), 2u);
    expectValid();

    ASSERT_TRUE(service_.unblockTimeslot(admin(), 1).ok());
    EXPECT_EQ(service_.freeSlots().size(), 5u);
}

TEST_F(ScheduleServiceTest, RemoveSessionCascades) {
    generated();
    ASSERT_TRUE(service_.removeSession(admin(), 2).ok());
    StoreSnapshot snap = service_.snapshot();
    EXPECT_FALSE(snap.assignment.slotOf(2).has_value());
    EXPECT_EQ(snap.assignment.size(), 3u);
    EXPECT_EQ(service_.removeSession(admin(), 2).kind(), ErrorKind::NOT_FOUND);
}

TEST_F(ScheduleServiceTest, CatalogInputIsValidated) {
    EXPECT_EQ(service_.addRoom(admin(), Room{1, "Dup", "", 10}).kind(), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(service_.addRoom(admin(), Room{8, "Neg", "", -1}).kind(), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(service_.addTimeslot(admin(), Timeslot{1, 0, 60, std::nullopt}).kind(), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(service_.addTimeslot(admin(), Timeslot{5, 60, 60, std::nullopt}).kind(), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(service_.addTimeslot(admin(), Timeslot{5, 60, 120, std::string()}).kind(),
              ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(service_.blockTimeslot(admin(), 1, "").kind(), ErrorKind::INVALID_ARGUMENT);
    EXPECT_EQ(service_.blockTimeslot(admin(), 42, "Lunch").kind(), ErrorKind::NOT_FOUND);
    EXPECT_EQ(service_.upsertSession(admin(), Session{9, "x", "", -3, std::nullopt, 1}).kind(),
              ErrorKind::INVALID_ARGUMENT);

    ASSERT_TRUE(service_.addTimeslot(admin(), Timeslot{5, 60, 120, std::string("Lunch")}).ok());
    EXPECT_TRUE(service_.snapshot().catalog->findTimeslot(5)->isBlocked());
}

TEST_F(ScheduleServiceTest, UpsertSessionRefreshesVotes) {
    uint64_t catalogVersion = service_.snapshot().catalogVersion;
    uint64_t structureVersion = service_.snapshot().structureVersion;
    ASSERT_TRUE(service_.upsertSession(admin(), Session{4, "Talk 4", "", 50, std::nullopt, 1}).ok());
    EXPECT_EQ(service_.snapshot().catalogVersion, catalogVersion + 1);
    EXPECT_EQ(service_.snapshot().structureVersion, structureVersion);

    // Now the most popular session, it gets the second timeslot to itself.
    Assignment a = generated();
    EXPECT_EQ(a.sessionAt({1, 2}), 4);
    EXPECT_EQ(a.sessionAt({1, 1}), 3);
}


///////////////////////////
///     SCORE  READS    ///
///////////////////////////
TEST_F(ScheduleServiceTest, AssignmentReadMatchesSnapshot) {
    EXPECT_TRUE(service_.assignment().empty());
    generated();
    EXPECT_EQ(service_.assignment(), service_.snapshot().assignment);
    EXPECT_EQ(service_.assignment().size(), 4u);
}

TEST_F(ScheduleServiceTest, EvaluateReportsAssignedVotes) {
    generated();
    ScheduleScore score = service_.evaluate();
    EXPECT_EQ(score.assignedVotes, 25);
    // Row 0: [7, 7, 1] -> 49 + 7; row 1 holds one session.
    EXPECT_EQ(score.conflictPenalty, 56);
    EXPECT_EQ(score.missingPenalty, 0);
    EXPECT_EQ(score.latePenalty, 0);
}


///////////////////////////
///     CONCURRENCY     ///
///////////////////////////
TEST_F(ScheduleServiceTest, ConcurrentOppositeMovesNeverLoseASession) {
    generated();
    const Slot a{1, 1}, b{2, 1};

    std::promise<void> go;
    std::shared_future<void> start = go.get_future().share();
    auto editor = [&](Slot from, Slot to) {
        start.wait();
        int failures = 0;
        for (int i = 0; i < 200; ++i) {
            if (!service_.move(facilitator(), from, to).ok()) ++failures;
        }
        return failures;
    };

    auto first = std::async(std::launch::async, editor, a, b);
    auto second = std::async(std::launch::async, editor, b, a);
    go.set_value();

    EXPECT_EQ(first.get(), 0);
    EXPECT_EQ(second.get(), 0);

    StoreSnapshot snap = service_.snapshot();
    EXPECT_EQ(snap.assignment.size(), 4u);
    EXPECT_TRUE(snap.assignment.slotOf(4).has_value());
    EXPECT_TRUE(snap.assignment.slotOf(2).has_value());
    std::optional<int> atA = snap.assignment.sessionAt(a);
    std::optional<int> atB = snap.assignment.sessionAt(b);
    ASSERT_TRUE(atA && atB);
    EXPECT_TRUE((*atA == 4 && *atB == 2) || (*atA == 2 && *atB == 4));
    EXPECT_EQ(snap.assignmentVersion, 1u + 400u);
    expectValid();
}

TEST_F(ScheduleServiceTest, ConcurrentVersionedMovesHaveOneWinner) {
    generated();
    uint64_t version = service_.snapshot().assignmentVersion;

    std::promise<void> go;
    std::shared_future<void> start = go.get_future().share();
    auto editor = [&](Slot from, Slot to) {
        start.wait();
        return service_.move(facilitator(), from, to, version);
    };

    auto first = std::async(std::launch::async, editor, Slot{1, 1}, Slot{2, 1});
    auto second = std::async(std::launch::async, editor, Slot{2, 1}, Slot{1, 1});
    go.set_value();

    CommandResult r1 = first.get();
    CommandResult r2 = second.get();
    EXPECT_NE(r1.ok(), r2.ok());
    const CommandResult& loser = r1.ok() ? r2 : r1;
    EXPECT_EQ(loser.kind(), ErrorKind::CONFLICT);

    StoreSnapshot snap = service_.snapshot();
    EXPECT_EQ(snap.assignment.sessionAt({1, 1}), 2);
    EXPECT_EQ(snap.assignment.sessionAt({2, 1}), 4);
    EXPECT_EQ(snap.assignmentVersion, version + 1);
}

TEST(ScheduleServiceGenerate, CatalogChangeDuringGenerateIsConflict) {
    AssignmentStore store(makeTestCatalog(3, 2, {10, 7, 7, 1}));
    ScheduleService* self = nullptr;
    auto optimizer = std::make_unique<HookedOptimizer>([&](int call, const CancelFlag&) {
        if (call == 0) {
            EXPECT_TRUE(self->addRoom(admin(), Room{4, "Annex", "", 10}).ok());
        }
    });
    ScheduleService service(store, std::move(optimizer));
    self = &service;

    CommandResult r = service.generate(facilitator());
    EXPECT_EQ(r.kind(), ErrorKind::CONFLICT);
    EXPECT_TRUE(service.snapshot().assignment.empty());

    // Retry on the fresh catalog succeeds.
    EXPECT_TRUE(service.generate(facilitator()).ok());
}

TEST(ScheduleServiceGenerate, VoteRefreshDuringGenerateStillCommits) {
    AssignmentStore store(makeTestCatalog(3, 2, {10, 7, 7, 1}));
    ScheduleService* self = nullptr;
    auto optimizer = std::make_unique<HookedOptimizer>([&](int call, const CancelFlag&) {
        if (call == 0) {
            EXPECT_TRUE(self->upsertSession(admin(), Session{4, "Talk 4", "", 3, std::nullopt, 1}).ok());
        }
    });
    ScheduleService service(store, std::move(optimizer));
    self = &service;

    CommandResult r = service.generate(facilitator());
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(service.assignment().size(), 4u);
    EXPECT_EQ(service.snapshot().catalog->findSession(4)->votes, 3);
}

TEST(ScheduleServiceGenerate, ThrowingBackEndIsReportedAndReleasesTheRun) {
    AssignmentStore store(makeTestCatalog(3, 2, {10, 7, 7, 1}));
    auto optimizer = std::make_unique<HookedOptimizer>([](int call, const CancelFlag&) {
        if (call == 0) throw std::runtime_error("device lost");
    });
    ScheduleService service(store, std::move(optimizer));

    CommandResult failed = service.generate(facilitator());
    EXPECT_EQ(failed.kind(), ErrorKind::OPTIMIZER_FAILED);
    ASSERT_TRUE(failed.error.has_value());
    EXPECT_NE(failed.error->message.find("device lost"), std::string::npos);
    EXPECT_EQ(failed.version, 0u);
    EXPECT_TRUE(service.assignment().empty());

    // The next run is not treated as superseding a live one.
    CommandResult next = service.generate(facilitator());
    EXPECT_TRUE(next.ok());
    EXPECT_EQ(service.assignment().size(), 4u);
}

TEST(ScheduleServiceGenerate, NewerGenerateCancelsInFlightOne) {
    AssignmentStore store(makeTestCatalog(3, 2, {10, 7, 7, 1}));
    std::promise<void> firstStarted;
    auto optimizer = std::make_unique<HookedOptimizer>([&](int call, const CancelFlag& cancel) {
        if (call != 0) return;
        firstStarted.set_value();
        // Hold the first run until a newer request cancels it.
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (!cancel->load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    ScheduleService service(store, std::move(optimizer));

    auto first = std::async(std::launch::async, [&]() { return service.generate(facilitator()); });
    firstStarted.get_future().wait();

    CommandResult second = service.generate(facilitator());
    CommandResult superseded = first.get();

    EXPECT_TRUE(second.ok());
    EXPECT_EQ(superseded.kind(), ErrorKind::CANCELLED);
    EXPECT_EQ(service.snapshot().assignmentVersion, 1u);
}

TEST(ScheduleServiceGenerate, SupersededRunDoesNotCommitAfterFinishing) {
    AssignmentStore store(makeTestCatalog(3, 2, {10, 7, 7, 1}));
    std::promise<void> firstStarted;
    std::promise<void> secondDone;
    std::shared_future<void> secondDoneFuture = secondDone.get_future().share();
    auto optimizer = std::make_unique<HookedOptimizer>([&](int call, const CancelFlag&) {
        if (call != 0) return;
        firstStarted.set_value();
        secondDoneFuture.wait();
    }, false);
    ScheduleService service(store, std::move(optimizer));

    auto first = std::async(std::launch::async, [&]() { return service.generate(facilitator()); });
    firstStarted.get_future().wait();
    CommandResult second = service.generate(facilitator());
    secondDone.set_value();

    EXPECT_TRUE(second.ok());
    EXPECT_EQ(first.get().kind(), ErrorKind::CANCELLED);
    EXPECT_EQ(service.snapshot().assignmentVersion, 1u);
}
