#pragma once

#include "bundle/artifact_classifier.hpp"
#include "bundle/bundle_extractor.hpp"
#include "bundle/collaborators.hpp"
#include "bundle/curation_session.hpp"
#include "bundle/file_ops.hpp"
#include "bundle/reconciler.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace curator {

struct ExtractionRequest {
    std::string application_id;
    std::string display_name;
};

struct ExtractionOutcome {
    // Null when no library survived classification.
    std::unique_ptr<CurationSession> session;
    std::filesystem::path scratch_directory;
    std::size_t files_extracted = 0;
    std::size_t libraries_found = 0;
    CleanupReport incidental_cleanup;

    bool HasSession() const { return session != nullptr; }
};

// Handle on a background extraction.
class ExtractionJob {
  public:
    ExtractionJob() = default;
    ExtractionJob(ExtractionJob&&) noexcept = default;
    // A job dropped or overwritten before Wait() is cancelled and joined.
    ExtractionJob& operator=(ExtractionJob&& other) noexcept;
    ~ExtractionJob();

    bool Valid() const { return future_.valid(); }
    bool Ready() const;
    // Stops copying at the next block; staged files are discarded.
    void Cancel();
    // Blocks until done. May be called once.
    Result Wait(ExtractionOutcome& out);

  private:
    friend class ExtractionPipeline;

    void CancelAndJoin();

    std::shared_ptr<std::atomic_bool> cancel_;
    std::future<std::pair<Result, ExtractionOutcome>> future_;
};

// resolve -> extract -> classify -> open a curation session.
class ExtractionPipeline {
  public:
    struct Options {
        BundleExtractor::Options extractor;
        std::string library_suffix = ArtifactClassifier::kDefaultLibrarySuffix;
    };

    ExtractionPipeline(Options opt,
                       std::shared_ptr<const IBundleDirectoryResolver> resolver,
                       std::shared_ptr<IFileRevealer> revealer = nullptr,
                       std::shared_ptr<const IFileOps> file_ops = nullptr);

    // Synchronous; cancellation follows Options::extractor.cancel.
    Result Run(const ExtractionRequest& request, ExtractionOutcome& out) const;
    Result RunForBundle(const std::filesystem::path& bundle_root,
                        std::string_view display_name,
                        ExtractionOutcome& out) const;

    // Background variants. The job carries its own cancel flag.
    ExtractionJob Start(ExtractionRequest request) const;
    ExtractionJob StartForBundle(std::filesystem::path bundle_root, std::string display_name) const;

    // Commit the session and hand the retained directory to the revealer.
    Result CommitAndReveal(CurationSession& session, std::filesystem::path& out_dir) const;

    const std::shared_ptr<const Reconciler>& GetReconciler() const { return reconciler_; }

  private:
    Result ResolveBundle(const ExtractionRequest& request, std::filesystem::path& out) const;
    Result Execute(const std::filesystem::path& bundle_root,
                   std::string_view display_name,
                   const std::atomic_bool* cancel,
                   ExtractionOutcome& out) const;
    ExtractionJob Launch(std::function<Result(const ExtractionPipeline&,
                                              const std::atomic_bool*,
                                              ExtractionOutcome&)> body) const;

    Options opt_;
    std::shared_ptr<const IBundleDirectoryResolver> resolver_;
    std::shared_ptr<IFileRevealer> revealer_;
    std::shared_ptr<const IFileOps> file_ops_;
    std::shared_ptr<const Reconciler> reconciler_;
};

} // namespace curator
