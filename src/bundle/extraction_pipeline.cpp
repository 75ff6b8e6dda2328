#include "bundle/extraction_pipeline.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <cerrno>
#include <chrono>
#include <vector>

namespace fs = std::filesystem;

namespace curator {

namespace {

std::string DisplayNameOf(const ExtractionRequest& request) {
    return request.display_name.empty() ? request.application_id : request.display_name;
}

} // namespace

ExtractionJob::~ExtractionJob() { CancelAndJoin(); }

ExtractionJob& ExtractionJob::operator=(ExtractionJob&& other) noexcept {
    if (this != &other) {
        CancelAndJoin();
        cancel_ = std::move(other.cancel_);
        future_ = std::move(other.future_);
    }
    return *this;
}

void ExtractionJob::CancelAndJoin() {
    if (future_.valid()) {
        Cancel();
        future_.wait();
    }
}

bool ExtractionJob::Ready() const {
    return future_.valid() &&
           future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void ExtractionJob::Cancel() {
    if (cancel_) {
        cancel_->store(true, std::memory_order_relaxed);
    }
}

Result ExtractionJob::Wait(ExtractionOutcome& out) {
    if (!future_.valid()) {
        return Result::Fail(EINVAL, "extraction job has no result");
    }
    auto result = future_.get();
    out = std::move(result.second);
    return result.first;
}

ExtractionPipeline::ExtractionPipeline(Options opt,
                                       std::shared_ptr<const IBundleDirectoryResolver> resolver,
                                       std::shared_ptr<IFileRevealer> revealer,
                                       std::shared_ptr<const IFileOps> file_ops)
    : opt_(std::move(opt)), resolver_(std::move(resolver)), revealer_(std::move(revealer)),
      file_ops_(file_ops ? std::move(file_ops) : DefaultFileOps()),
      reconciler_(std::make_shared<const Reconciler>(file_ops_)) {}

Result ExtractionPipeline::ResolveBundle(const ExtractionRequest& request, fs::path& out) const {
    if (!resolver_) {
        return Result::Fail(-1, "no bundle resolver configured");
    }
    auto dir = resolver_->ResolveBundleDirectory(request.application_id);
    if (!dir) {
        return Result::Fail(ENOENT, "cannot resolve bundle for " + request.application_id);
    }
    out = std::move(*dir);
    return Result::Ok();
}

Result ExtractionPipeline::Run(const ExtractionRequest& request, ExtractionOutcome& out) const {
    fs::path bundle_root;
    auto resolve_result = ResolveBundle(request, bundle_root);
    if (!resolve_result.is_ok()) {
        out = ExtractionOutcome{};
        LogError("%s", resolve_result.msg.c_str());
        return resolve_result;
    }
    return Execute(bundle_root, DisplayNameOf(request), opt_.extractor.cancel, out);
}

Result ExtractionPipeline::RunForBundle(const fs::path& bundle_root,
                                        std::string_view display_name,
                                        ExtractionOutcome& out) const {
    return Execute(bundle_root, display_name, opt_.extractor.cancel, out);
}

Result ExtractionPipeline::Execute(const fs::path& bundle_root,
                                   std::string_view display_name,
                                   const std::atomic_bool* cancel,
                                   ExtractionOutcome& out) const {
    out = ExtractionOutcome{};
    const std::string folder = SanitizeFolderName(display_name);

    BundleExtractor::Options extractor_opt = opt_.extractor;
    extractor_opt.cancel = cancel;
    const BundleExtractor extractor(extractor_opt, file_ops_);
    out.scratch_directory = extractor.DestinationFor(folder);

    std::vector<ArtifactDescriptor> all;
    ScratchLease lease;
    auto extract_result = extractor.Extract(bundle_root, folder, all, &lease);
    if (!extract_result.is_ok()) {
        return extract_result;
    }
    out.files_extracted = all.size();

    const ArtifactClassifier classifier(opt_.library_suffix, file_ops_);
    Classification classification = classifier.Classify(std::move(all));
    out.incidental_cleanup = classification.cleanup;
    out.libraries_found = classification.libraries.size();

    if (cancel && cancel->load(std::memory_order_relaxed)) {
        (void)reconciler_->Abort(out.scratch_directory);
        return Result::Fail(ECANCELED, "Extraction cancelled");
    }

    if (classification.libraries.empty()) {
        return Result::Ok();
    }

    return CurationSession::Open(std::move(classification.libraries),
                                 folder,
                                 out.scratch_directory,
                                 out.session,
                                 reconciler_,
                                 std::move(lease));
}

ExtractionJob ExtractionPipeline::Launch(
    std::function<Result(const ExtractionPipeline&, const std::atomic_bool*, ExtractionOutcome&)> body)
    const {
    ExtractionJob job;
    job.cancel_ = std::make_shared<std::atomic_bool>(false);

    auto cancel = job.cancel_;
    job.future_ = std::async(std::launch::async,
                             [self = *this, cancel, body = std::move(body)]() {
                                 std::pair<Result, ExtractionOutcome> r;
                                 r.first = body(self, cancel.get(), r.second);
                                 return r;
                             });
    return job;
}

ExtractionJob ExtractionPipeline::Start(ExtractionRequest request) const {
    return Launch([request = std::move(request)](const ExtractionPipeline& p,
                                                 const std::atomic_bool* cancel,
                                                 ExtractionOutcome& out) {
        fs::path bundle_root;
        auto resolve_result = p.ResolveBundle(request, bundle_root);
        if (!resolve_result.is_ok()) {
            LogError("%s", resolve_result.msg.c_str());
            return resolve_result;
        }
        return p.Execute(bundle_root, DisplayNameOf(request), cancel, out);
    });
}

ExtractionJob ExtractionPipeline::StartForBundle(fs::path bundle_root, std::string display_name) const {
    return Launch([bundle_root = std::move(bundle_root), display_name = std::move(display_name)](
                      const ExtractionPipeline& p,
                      const std::atomic_bool* cancel,
                      ExtractionOutcome& out) {
        return p.Execute(bundle_root, display_name, cancel, out);
    });
}

Result ExtractionPipeline::CommitAndReveal(CurationSession& session, fs::path& out_dir) const {
    auto commit_result = session.Commit(out_dir);
    if (!commit_result.is_ok())
        return commit_result;
    if (revealer_) {
        revealer_->Reveal(out_dir);
    }
    return Result::Ok();
}

} // namespace curator
