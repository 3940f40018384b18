#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace nettrack {

struct CheckpointStoreOptions {
    std::string path;
    Track track = Track::NonVolatile;
    // Wipe the history when the recorded boot id differs from the current one.
    bool clearOnBoot = false;
    // Current boot id; read from /proc when empty.
    std::string bootId;
};

// CheckpointStore is the SQLite-backed, append-only history of one track.
// Commits are immutable once written; checkpoints are named references into
// the history and never own a state. Writes are serialized per store;
// reads take no writer lock.
class CheckpointStore {
public:
    explicit CheckpointStore(const CheckpointStoreOptions &options);
    ~CheckpointStore();

    CheckpointStore(const CheckpointStore &) = delete;
    CheckpointStore &operator=(const CheckpointStore &) = delete;

    Track track() const;
    const std::string &path() const;

    // True if the history was wiped at open because the boot id changed.
    bool wasClearedAtOpen() const;

    // Append a commit. A parent, if given, may name a commit or a checkpoint
    // and must exist (StoreError::ParentNotFound otherwise).
    std::string commit(const NetworkState &state,
                       const std::optional<std::string> &parent);

    // New named (or anonymous when label is empty) checkpoint at the head.
    std::string openCheckpoint(const std::string &label);

    // Stored state at a checkpoint or commit. Never mutates history.
    NetworkState rollback(const std::string &id) const;

    // Make a checkpoint the current baseline. Sibling checkpoints are kept.
    void commitCheckpoint(const std::string &checkpointId);

    void deleteCheckpoint(const std::string &checkpointId);

    // Commits on the head lineage, oldest first, strictly after `since`.
    std::vector<Commit> history(const std::optional<std::string> &since = std::nullopt) const;

    std::vector<Checkpoint> listCheckpoints() const;
    std::optional<Checkpoint> getCheckpoint(const std::string &id) const;
    std::optional<Checkpoint> currentCheckpoint() const;

    std::optional<std::string> head() const;
    std::optional<Commit> getCommit(const std::string &id) const;

    // Commit id a checkpoint or commit identifier refers to.
    std::optional<std::string> resolve(const std::string &id) const;

    // Remove commits unreachable from the head, the current checkpoint and
    // every checkpoint. Returns the number of commits removed.
    int collectGarbage();

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace nettrack
