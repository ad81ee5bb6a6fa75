#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "model.hpp"
#include "command_result.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Consistent point-in-time view of the store.
 *
 * The catalog is shared and immutable; the assignment is a private copy.
 */
struct StoreSnapshot {
    std::shared_ptr<const Catalog> catalog; ///< Catalog at the time of the snapshot.
    Assignment assignment; ///< Assignment in canonical slot order.
    uint64_t assignmentVersion = 0; ///< Bumped by every committed mutation.
    uint64_t catalogVersion = 0; ///< Bumped by committed catalog edits only.
    uint64_t structureVersion = 0; ///< Bumped when rooms, timeslots or the session set change.
};

/**
 * @brief Private working copy handed to a transaction's mutator.
 *
 * The catalog is copied lazily: only mutators that call editCatalog() pay for
 * a copy, and only they bump the catalog version on commit. The structure
 * version is bumped only if the edit added, removed, re-timed, blocked or
 * unblocked something; vote and title refreshes leave it alone.
 */
class StoreDraft {
public:
    StoreDraft(std::shared_ptr<const Catalog> base, Assignment assignment,
               uint64_t assignmentVersion, uint64_t catalogVersion, uint64_t structureVersion);

    /// Catalog as seen by the draft (edited copy if any).
    const Catalog& catalog() const { return edited_ ? *edited_ : *base_; }

    /// Writable catalog; copies the base on first use.
    Catalog& editCatalog();

    bool catalogChanged() const { return edited_ != nullptr; }

    /// True if the edited catalog differs from the base in more than session content.
    bool structureChanged() const;

    /// Assignment being edited.
    Assignment assignment;

    /// Versions of the committed state the draft was taken from.
    const uint64_t assignmentVersion;
    const uint64_t catalogVersion;
    const uint64_t structureVersion;

    /// Set by a mutator that accepts the request but changes nothing.
    bool unchanged = false;

    /// Hand out the edited catalog (or the untouched base).
    std::shared_ptr<const Catalog> releaseCatalog();

private:
    std::shared_ptr<const Catalog> base_;
    std::shared_ptr<Catalog> edited_;
};

/**
 * @brief Outcome of AssignmentStore::transact().
 */
struct CommitOutcome {
    std::optional<CommandError> error; ///< Set iff the transaction was rejected.
    uint64_t assignmentVersion = 0; ///< Version after the transaction.
    uint64_t catalogVersion = 0; ///< Catalog version after the transaction.
    uint64_t structureVersion = 0; ///< Structure version after the transaction.
    bool committed = false; ///< True if a new state was published.
};


///////////////////////////
///        STORE        ///
///////////////////////////
/**
 * @brief Owned, versioned catalog and assignment of one unconference.
 *
 * Single writer at a time: every mutation runs as a transaction under one
 * mutex. The mutator edits a private draft of the current state; the draft is
 * validated against the structural invariants and published in one step, or
 * discarded entirely. Readers copy a snapshot under the same mutex, so they
 * never observe a partially applied swap or cascade.
 */
class AssignmentStore {
public:
    /**
     * @brief Create a store with an empty catalog and an empty assignment.
     */
    AssignmentStore();

    /**
     * @brief Create a store over an initial catalog, with an empty assignment.
     */
    explicit AssignmentStore(Catalog catalog);

    AssignmentStore(const AssignmentStore&) = delete;
    AssignmentStore& operator=(const AssignmentStore&) = delete;

    /**
     * @brief Take a consistent snapshot of catalog, assignment and versions.
     */
    StoreSnapshot snapshot() const;

    /// Current assignment version.
    uint64_t assignmentVersion() const;

    /**
     * @brief Mutator run inside a transaction.
     *
     * Returns an error to reject the request (nothing is applied) or
     * std::nullopt to commit the draft.
     */
    using Mutator = std::function<std::optional<CommandError>(StoreDraft&)>;

    /**
     * @brief Run a mutator against the current state and commit atomically.
     *
     * Requested -> Validated -> Committed, or Requested -> Rejected. The
     * mutator sees the state current at commit time. A draft that fails
     * invariant validation is rejected with INVARIANT_VIOLATION and logged as
     * a programming error.
     */
    CommitOutcome transact(const Mutator& mutator);

private:
    /// Guards every field below.
    mutable std::mutex mutex_;

    std::shared_ptr<const Catalog> catalog_;
    Assignment assignment_;
    uint64_t assignmentVersion_ = 0;
    uint64_t catalogVersion_ = 0;
    uint64_t structureVersion_ = 0;
};
