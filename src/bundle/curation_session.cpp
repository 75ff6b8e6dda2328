#include "bundle/curation_session.hpp"

#include "util/logger.hpp"

#include <cerrno>

namespace fs = std::filesystem;

namespace curator {

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Open:      return "open";
        case SessionState::Committed: return "committed";
        case SessionState::Aborted:   return "aborted";
    }
    return "unknown";
}

Result CurationSession::Open(std::vector<ArtifactDescriptor> libraries,
                             std::string display_name,
                             fs::path scratch_dir,
                             std::unique_ptr<CurationSession>& out,
                             std::shared_ptr<const Reconciler> reconciler,
                             ScratchLease lease) {
    if (libraries.empty()) {
        return Result::Fail(-1, "no libraries to curate");
    }
    if (!reconciler) {
        reconciler = std::make_shared<const Reconciler>();
    }
    out.reset(new CurationSession(std::move(libraries),
                                  std::move(display_name),
                                  std::move(scratch_dir),
                                  std::move(reconciler),
                                  std::move(lease)));
    return Result::Ok();
}

CurationSession::CurationSession(std::vector<ArtifactDescriptor> libraries,
                                 std::string display_name,
                                 fs::path scratch_dir,
                                 std::shared_ptr<const Reconciler> reconciler,
                                 ScratchLease lease)
    : libraries_(std::move(libraries)), display_name_(std::move(display_name)),
      scratch_dir_(std::move(scratch_dir)), reconciler_(std::move(reconciler)),
      lease_(std::move(lease)) {
    for (const auto& lib : libraries_) {
        library_ids_.insert(lib.id);
    }
    keep_ = library_ids_;
    LogDebug("session opened for %s with %zu libraries",
             display_name_.c_str(),
             libraries_.size());
}

CurationSession::~CurationSession() {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ == SessionState::Open) {
        LogInfo("Session for %s dropped without a decision; discarding", display_name_.c_str());
        AbortLocked();
    }
}

bool CurationSession::RejectUnlessOpenLocked(const char* op) const {
    if (state_ == SessionState::Open)
        return false;
    LogWarn("%s ignored: session for %s is %s", op, display_name_.c_str(), SessionStateName(state_));
    return true;
}

bool CurationSession::Toggle(ArtifactId id) {
    std::lock_guard<std::mutex> lk(mu_);
    if (RejectUnlessOpenLocked("toggle"))
        return false;
    if (library_ids_.count(id) == 0) {
        LogDebug("toggle ignored: unknown artifact %llu", (unsigned long long)id);
        return false;
    }
    if (!keep_.erase(id)) {
        keep_.insert(id);
    }
    return true;
}

bool CurationSession::SelectAll() {
    std::lock_guard<std::mutex> lk(mu_);
    if (RejectUnlessOpenLocked("select all"))
        return false;
    keep_ = library_ids_;
    return true;
}

bool CurationSession::DeselectAll() {
    std::lock_guard<std::mutex> lk(mu_);
    if (RejectUnlessOpenLocked("deselect all"))
        return false;
    keep_.clear();
    return true;
}

bool CurationSession::ToggleAll() {
    std::lock_guard<std::mutex> lk(mu_);
    if (RejectUnlessOpenLocked("toggle all"))
        return false;
    if (keep_.size() == library_ids_.size()) {
        keep_.clear();
    } else {
        keep_ = library_ids_;
    }
    return true;
}

Result CurationSession::Commit(fs::path& out_dir) {
    std::lock_guard<std::mutex> lk(mu_);
    if (RejectUnlessOpenLocked("commit"))
        return Result::Fail(EINVAL, std::string("session is ") + SessionStateName(state_));
    if (keep_.empty())
        return Result::Fail(EINVAL, "nothing selected to keep");

    state_ = SessionState::Committed;
    CleanupReport report;
    out_dir = reconciler_->Finalize(libraries_, keep_, scratch_dir_, &report);
    last_cleanup_ = report;
    lease_.Release();
    return Result::Ok();
}

Result CurationSession::Cancel() {
    std::lock_guard<std::mutex> lk(mu_);
    if (RejectUnlessOpenLocked("cancel"))
        return Result::Fail(EINVAL, std::string("session is ") + SessionStateName(state_));
    AbortLocked();
    return Result::Ok();
}

void CurationSession::AbortLocked() {
    state_ = SessionState::Aborted;
    keep_.clear();
    last_cleanup_ = reconciler_->Abort(scratch_dir_);
    lease_.Release();
}

SessionState CurationSession::State() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

KeepSet CurationSession::KeepSetSnapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return keep_;
}

bool CurationSession::IsKept(ArtifactId id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return keep_.count(id) > 0;
}

std::size_t CurationSession::KeptCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return keep_.size();
}

bool CurationSession::AllKept() const {
    std::lock_guard<std::mutex> lk(mu_);
    return keep_.size() == library_ids_.size();
}

std::string CurationSession::SelectionSummary() const {
    std::lock_guard<std::mutex> lk(mu_);
    return std::to_string(keep_.size()) + " of " + std::to_string(libraries_.size()) + " selected";
}

CleanupReport CurationSession::LastCleanup() const {
    std::lock_guard<std::mutex> lk(mu_);
    return last_cleanup_;
}

} // namespace curator
