///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "assignment_store.hpp"
#include "constraints.hpp"
#include "logging.hpp"
#include <algorithm>
#include <tuple>
#include <utility>
#include <vector>


///////////////////////////
///      STRUCTURE      ///
///////////////////////////
/// Everything about a catalog that decides which slots exist and which sessions need one.
static std::vector<std::tuple<int, int, int, int, bool>> structureOf(const Catalog& catalog) {
    std::vector<std::tuple<int, int, int, int, bool>> keys;
    for (const Room& r : catalog.rooms) {
        keys.emplace_back(0, r.id, 0, 0, false);
    }
    for (const Timeslot& t : catalog.timeslots) {
        keys.emplace_back(1, t.id, t.startMinute, t.endMinute, t.isBlocked());
    }
    for (const Session& s : catalog.sessions) {
        keys.emplace_back(2, s.id, 0, 0, false);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}


///////////////////////////
///        DRAFT        ///
///////////////////////////
StoreDraft::StoreDraft(std::shared_ptr<const Catalog> base, Assignment assignment,
                       uint64_t assignmentVersion, uint64_t catalogVersion, uint64_t structureVersion)
        : assignment(std::move(assignment)),
          assignmentVersion(assignmentVersion),
          catalogVersion(catalogVersion),
          structureVersion(structureVersion),
          base_(std::move(base)) {}

bool StoreDraft::structureChanged() const {
    return edited_ && structureOf(*edited_) != structureOf(*base_);
}

Catalog& StoreDraft::editCatalog() {
    if (!edited_) {
        edited_ = std::make_shared<Catalog>(*base_);
    }
    return *edited_;
}

std::shared_ptr<const Catalog> StoreDraft::releaseCatalog() {
    if (edited_) return std::move(edited_);
    return base_;
}


///////////////////////////
///        STORE        ///
///////////////////////////
AssignmentStore::AssignmentStore()
        : catalog_(std::make_shared<const Catalog>()) {}

AssignmentStore::AssignmentStore(Catalog catalog)
        : catalog_(std::make_shared<const Catalog>(std::move(catalog))) {}

StoreSnapshot AssignmentStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    StoreSnapshot snap;
    snap.catalog = catalog_;
    snap.assignment = assignment_;
    snap.assignmentVersion = assignmentVersion_;
    snap.catalogVersion = catalogVersion_;
    snap.structureVersion = structureVersion_;
    return snap;
}

uint64_t AssignmentStore::assignmentVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return assignmentVersion_;
}

/**
 * @brief Draft, validate and publish under the store mutex.
 *
 * The committed state is replaced only after the whole draft validated, so
 * a rejected transaction leaves no trace.
 */
CommitOutcome AssignmentStore::transact(const Mutator& mutator) {
    std::lock_guard<std::mutex> lock(mutex_);

    CommitOutcome outcome;
    outcome.assignmentVersion = assignmentVersion_;
    outcome.catalogVersion = catalogVersion_;
    outcome.structureVersion = structureVersion_;

    StoreDraft draft(catalog_, assignment_, assignmentVersion_, catalogVersion_, structureVersion_);

    std::optional<CommandError> rejection = mutator(draft);
    if (rejection) {
        outcome.error = std::move(rejection);
        return outcome;
    }
    if (draft.unchanged) {
        return outcome;
    }

    draft.catalog().sortCanonical(draft.assignment);
    if (std::optional<Violation> violation = validateAssignment(draft.assignment, draft.catalog())) {
        LogLine(LogLevel::ERROR, "store") << "rejecting invalid transition (" << toString(violation->kind)
                                          << "): " << violation->detail;
        outcome.error = CommandError{ErrorKind::INVARIANT_VIOLATION, violation->detail};
        return outcome;
    }

    bool catalogChanged = draft.catalogChanged();
    bool structureChanged = draft.structureChanged();
    catalog_ = draft.releaseCatalog();
    assignment_ = std::move(draft.assignment);
    ++assignmentVersion_;
    if (catalogChanged) ++catalogVersion_;
    if (structureChanged) ++structureVersion_;

    outcome.assignmentVersion = assignmentVersion_;
    outcome.catalogVersion = catalogVersion_;
    outcome.structureVersion = structureVersion_;
    outcome.committed = true;
    return outcome;
}
