#pragma once

#include "bundle/artifact.hpp"
#include "bundle/file_ops.hpp"
#include "bundle/reconciler.hpp"
#include "bundle/scratch_area.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace curator {

enum class SessionState {
    Open,
    Committed,
    Aborted,
};

const char* SessionStateName(SessionState state);

// The caller's pending decision over a set of extracted libraries.
//
// Starts Open with every library kept. Commit() deletes the libraries that
// are not kept; Cancel() deletes the whole scratch directory. Both are
// terminal, after which mutators are rejected. A session destroyed while
// still Open is cancelled. All operations are serialized.
class CurationSession {
  public:
    // Fails when `libraries` is empty: with nothing to curate no session exists.
    static Result Open(std::vector<ArtifactDescriptor> libraries,
                       std::string display_name,
                       std::filesystem::path scratch_dir,
                       std::unique_ptr<CurationSession>& out,
                       std::shared_ptr<const Reconciler> reconciler = nullptr,
                       ScratchLease lease = {});

    CurationSession(const CurationSession&) = delete;
    CurationSession& operator=(const CurationSession&) = delete;
    ~CurationSession();

    // Mutators return false when nothing was applied.
    bool Toggle(ArtifactId id);
    bool SelectAll();
    bool DeselectAll();
    // Deselects everything when all are kept, otherwise selects everything.
    bool ToggleAll();

    Result Commit(std::filesystem::path& out_dir);
    Result Cancel();

    SessionState State() const;
    bool IsOpen() const { return State() == SessionState::Open; }

    const std::vector<ArtifactDescriptor>& Libraries() const { return libraries_; }
    const std::string& DisplayName() const { return display_name_; }
    const std::filesystem::path& ScratchDirectory() const { return scratch_dir_; }

    KeepSet KeepSetSnapshot() const;
    bool IsKept(ArtifactId id) const;
    std::size_t KeptCount() const;
    bool AllKept() const;
    // "2 of 3 selected"
    std::string SelectionSummary() const;

    CleanupReport LastCleanup() const;

  private:
    CurationSession(std::vector<ArtifactDescriptor> libraries,
                    std::string display_name,
                    std::filesystem::path scratch_dir,
                    std::shared_ptr<const Reconciler> reconciler,
                    ScratchLease lease);

    bool RejectUnlessOpenLocked(const char* op) const;
    void AbortLocked();

    mutable std::mutex mu_;
    const std::vector<ArtifactDescriptor> libraries_;
    const std::string display_name_;
    const std::filesystem::path scratch_dir_;
    std::set<ArtifactId> library_ids_;
    KeepSet keep_;
    SessionState state_ = SessionState::Open;
    CleanupReport last_cleanup_;
    std::shared_ptr<const Reconciler> reconciler_;
    ScratchLease lease_;
};

} // namespace curator
