#include <gtest/gtest.h>

#include "bundle/extraction_pipeline.hpp"
#include "testing.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace curator {
namespace {

namespace fs = std::filesystem;

class FakeResolver final : public IBundleDirectoryResolver {
  public:
    std::map<std::string, fs::path> bundles;
    mutable int calls = 0;

    std::optional<fs::path> ResolveBundleDirectory(std::string_view application_id) const override {
        ++calls;
        auto it = bundles.find(std::string(application_id));
        if (it == bundles.end())
            return std::nullopt;
        return it->second;
    }
};

class RecordingRevealer final : public IFileRevealer {
  public:
    std::vector<fs::path> revealed;
    void Reveal(const fs::path& dir) override { revealed.push_back(dir); }
};

// Parks the extraction after its first staged file until released.
class GateProgress final : public IProgress {
  public:
    std::promise<void> reached;
    std::shared_future<void> release;
    std::atomic_int events{0};

    explicit GateProgress(std::shared_future<void> r) : release(std::move(r)) {}

    void OnProgress(const ProgressEvent&) override {
        ++events;
        if (!signalled_) {
            signalled_ = true;
            reached.set_value();
            release.wait();
        }
    }

  private:
    bool signalled_ = false;
};

class ExtractionPipelineTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::shared_ptr<FakeResolver> resolver = std::make_shared<FakeResolver>();
    std::shared_ptr<RecordingRevealer> revealer = std::make_shared<RecordingRevealer>();

    fs::path ScratchRoot() const { return tmp.Path() / "scratch"; }

    ExtractionPipeline::Options MakeOptions() const {
        ExtractionPipeline::Options opt;
        opt.extractor.scratch_root = ScratchRoot();
        opt.extractor.copy_buffer_bytes = 32;
        return opt;
    }

    ExtractionPipeline MakePipeline() const { return ExtractionPipeline(MakeOptions(), resolver, revealer); }

    fs::path DemoBundle() {
        return testutil::MakeBundle(tmp.Path(), "Demo.app", {
            {"Demo", "executable"},
            {"Info.plist", "<plist/>"},
            {"Frameworks/libA.dylib", "AAAA"},
            {"Frameworks/libB.dylib", "BBBBBB"},
            {"PlugIns/Ext.appex/libC.DYLIB", "CC"},
        });
    }

    static const ArtifactDescriptor* Find(const CurationSession& s, const std::string& name) {
        for (const auto& lib : s.Libraries()) {
            if (lib.name == name)
                return &lib;
        }
        return nullptr;
    }
};

TEST_F(ExtractionPipelineTest, ExtractCurateCommit) {
    resolver->bundles["com.example.demo"] = DemoBundle();
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    auto res = pipeline.Run({"com.example.demo", "Demo"}, outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(outcome.HasSession());
    EXPECT_EQ(outcome.files_extracted, 5u);
    EXPECT_EQ(outcome.libraries_found, 3u);
    EXPECT_EQ(outcome.incidental_cleanup.removed, 2u);
    EXPECT_EQ(outcome.scratch_directory, ScratchRoot() / "Demo");

    // Only libraries remain staged while the session is open.
    EXPECT_EQ(testutil::ListFileNames(outcome.scratch_directory),
              (std::set<std::string>{"libA.dylib", "libB.dylib", "libC.DYLIB"}));

    CurationSession& session = *outcome.session;
    EXPECT_EQ(session.DisplayName(), "Demo");
    EXPECT_EQ(session.SelectionSummary(), "3 of 3 selected");
    const ArtifactDescriptor* b = Find(session, "libB.dylib");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->original_path, "Frameworks/libB.dylib");
    EXPECT_EQ(b->FormattedSize(), "6 bytes");
    ASSERT_TRUE(session.Toggle(b->id));

    fs::path out_dir;
    res = pipeline.CommitAndReveal(session, out_dir);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(out_dir, outcome.scratch_directory);
    EXPECT_EQ(testutil::ListFileNames(out_dir), (std::set<std::string>{"libA.dylib", "libC.DYLIB"}));
    ASSERT_EQ(revealer->revealed.size(), 1u);
    EXPECT_EQ(revealer->revealed[0], out_dir);

    // The original bundle is untouched.
    EXPECT_EQ(testutil::ListFileNames(resolver->bundles["com.example.demo"]).size(), 5u);
}

TEST_F(ExtractionPipelineTest, KeepOneOfTwoLibraries) {
    const auto bundle = testutil::MakeBundle(tmp.Path(), "Pair.app", {
        {"libA.dylib", "AAAA"},
        {"libB.dylib", "BBBB"},
        {"Info.plist", "<plist/>"},
        {"readme.txt", "hello"},
        {"data.bin", "0101"},
    });
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    ASSERT_TRUE(pipeline.RunForBundle(bundle, "Pair", outcome).is_ok());
    ASSERT_TRUE(outcome.HasSession());
    EXPECT_EQ(outcome.files_extracted, 5u);
    EXPECT_EQ(outcome.libraries_found, 2u);
    EXPECT_EQ(outcome.incidental_cleanup.removed, 3u);
    EXPECT_EQ(testutil::ListFileNames(outcome.scratch_directory),
              (std::set<std::string>{"libA.dylib", "libB.dylib"}));

    CurationSession& session = *outcome.session;
    const ArtifactDescriptor* b = Find(session, "libB.dylib");
    ASSERT_NE(b, nullptr);
    ASSERT_TRUE(session.Toggle(b->id));

    fs::path out_dir;
    ASSERT_TRUE(pipeline.CommitAndReveal(session, out_dir).is_ok());
    EXPECT_EQ(out_dir, outcome.scratch_directory);
    EXPECT_EQ(testutil::ListFileNames(out_dir), (std::set<std::string>{"libA.dylib"}));
}

TEST_F(ExtractionPipelineTest, CancelBeforeAnyToggleRemovesScratch) {
    const auto bundle = testutil::MakeBundle(tmp.Path(), "Pair.app", {
        {"libA.dylib", "AAAA"},
        {"libB.dylib", "BBBB"},
        {"Info.plist", "<plist/>"},
        {"readme.txt", "hello"},
        {"data.bin", "0101"},
    });
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    ASSERT_TRUE(pipeline.RunForBundle(bundle, "Pair", outcome).is_ok());
    ASSERT_TRUE(outcome.HasSession());

    ASSERT_TRUE(outcome.session->Cancel().is_ok());
    EXPECT_FALSE(fs::exists(outcome.scratch_directory));
    EXPECT_EQ(testutil::ListFileNames(bundle).size(), 5u);
}

TEST_F(ExtractionPipelineTest, NoLibrariesMeansNoSession) {
    const auto bundle = testutil::MakeBundle(tmp.Path(), "Plain.app", {
        {"Plain", "exec"},
        {"Info.plist", "<plist/>"},
    });
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    auto res = pipeline.RunForBundle(bundle, "Plain", outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_FALSE(outcome.HasSession());
    EXPECT_EQ(outcome.files_extracted, 2u);
    EXPECT_EQ(outcome.libraries_found, 0u);
    EXPECT_TRUE(testutil::ListFileNames(outcome.scratch_directory).empty());
    EXPECT_FALSE(ScratchLease::IsLeased(outcome.scratch_directory));
    EXPECT_TRUE(revealer->revealed.empty());
}

TEST_F(ExtractionPipelineTest, CancelSessionDiscardsScratch) {
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    ASSERT_TRUE(pipeline.RunForBundle(DemoBundle(), "Demo", outcome).is_ok());
    ASSERT_TRUE(outcome.HasSession());

    ASSERT_TRUE(outcome.session->Cancel().is_ok());
    EXPECT_FALSE(fs::exists(outcome.scratch_directory));
    EXPECT_TRUE(revealer->revealed.empty());

    fs::path out_dir;
    EXPECT_FALSE(pipeline.CommitAndReveal(*outcome.session, out_dir).is_ok());
    EXPECT_TRUE(revealer->revealed.empty());
}

TEST_F(ExtractionPipelineTest, UnresolvableApplication) {
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    auto res = pipeline.Run({"com.example.missing", "Missing"}, outcome);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, ENOENT);
    EXPECT_FALSE(outcome.HasSession());
    EXPECT_EQ(resolver->calls, 1);
    EXPECT_FALSE(fs::exists(ScratchRoot() / "Missing"));
}

TEST_F(ExtractionPipelineTest, ResolvedButAbsentBundle) {
    resolver->bundles["com.example.gone"] = tmp.Path() / "Gone.app";
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    auto res = pipeline.Run({"com.example.gone", "Gone"}, outcome);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, ENOENT);
    EXPECT_FALSE(fs::exists(ScratchRoot() / "Gone"));
}

TEST_F(ExtractionPipelineTest, DisplayNameIsSanitized) {
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    ASSERT_TRUE(pipeline.RunForBundle(DemoBundle(), "Acme: Demo/Pro", outcome).is_ok());
    ASSERT_TRUE(outcome.HasSession());
    EXPECT_EQ(outcome.scratch_directory, ScratchRoot() / "Acme- Demo-Pro");
    EXPECT_EQ(outcome.session->DisplayName(), "Acme- Demo-Pro");
    EXPECT_TRUE(fs::is_directory(outcome.scratch_directory));
}

TEST_F(ExtractionPipelineTest, FallsBackToApplicationIdForName) {
    resolver->bundles["com.example.demo"] = DemoBundle();
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    ASSERT_TRUE(pipeline.Run({"com.example.demo", ""}, outcome).is_ok());
    EXPECT_EQ(outcome.scratch_directory, ScratchRoot() / "com.example.demo");
}

TEST_F(ExtractionPipelineTest, SameNameWhileSessionOpenIsBusy) {
    auto pipeline = MakePipeline();
    const auto bundle = DemoBundle();

    ExtractionOutcome first;
    ASSERT_TRUE(pipeline.RunForBundle(bundle, "Demo", first).is_ok());
    ASSERT_TRUE(first.HasSession());

    ExtractionOutcome second;
    auto res = pipeline.RunForBundle(bundle, "Demo", second);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, EBUSY);
    EXPECT_EQ(testutil::ListFileNames(first.scratch_directory).size(), 3u);

    // Once decided, the name is free again and a rerun starts from a clean directory.
    fs::path out_dir;
    ASSERT_TRUE(first.session->DeselectAll());
    ASSERT_TRUE(first.session->Toggle(first.session->Libraries()[0].id));
    ASSERT_TRUE(first.session->Commit(out_dir).is_ok());

    res = pipeline.RunForBundle(bundle, "Demo", second);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(second.HasSession());
    EXPECT_EQ(testutil::ListFileNames(second.scratch_directory).size(), 3u);
}

TEST_F(ExtractionPipelineTest, DistinctNamesDoNotInterfere) {
    auto pipeline = MakePipeline();
    const auto bundle = DemoBundle();

    ExtractionOutcome a;
    ExtractionOutcome b;
    ASSERT_TRUE(pipeline.RunForBundle(bundle, "One", a).is_ok());
    ASSERT_TRUE(pipeline.RunForBundle(bundle, "Two", b).is_ok());

    ASSERT_TRUE(a.session->Cancel().is_ok());
    EXPECT_FALSE(fs::exists(a.scratch_directory));
    EXPECT_EQ(testutil::ListFileNames(b.scratch_directory).size(), 3u);
}

TEST_F(ExtractionPipelineTest, ArchiveBundle) {
    const auto ipa = testutil::WriteTar(tmp.Path() / "Demo.ipa", {
        {"Payload/Demo.app/Demo", "exec", AE_IFREG},
        {"Payload/Demo.app/Frameworks/libA.dylib", "AAAA", AE_IFREG},
        {"Payload/Demo.app/Frameworks/Sub/libA.dylib", "aaaaaa", AE_IFREG},
    });
    auto pipeline = MakePipeline();

    ExtractionOutcome outcome;
    auto res = pipeline.RunForBundle(ipa, "Demo", outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(outcome.HasSession());
    ASSERT_EQ(outcome.session->Libraries().size(), 2u);
    EXPECT_EQ(testutil::ListFileNames(outcome.scratch_directory),
              (std::set<std::string>{"libA.dylib", "libA_1.dylib"}));
}

TEST_F(ExtractionPipelineTest, CancelledRunLeavesNothing) {
    std::atomic_bool cancel{true};
    auto opt = MakeOptions();
    opt.extractor.cancel = &cancel;
    ExtractionPipeline pipeline(opt, resolver, revealer);

    ExtractionOutcome outcome;
    auto res = pipeline.RunForBundle(DemoBundle(), "Demo", outcome);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, ECANCELED);
    EXPECT_FALSE(outcome.HasSession());
    EXPECT_FALSE(fs::exists(ScratchRoot() / "Demo"));
}

TEST_F(ExtractionPipelineTest, StartAndWait) {
    resolver->bundles["com.example.demo"] = DemoBundle();
    auto pipeline = MakePipeline();

    ExtractionJob job = pipeline.Start({"com.example.demo", "Demo"});
    ASSERT_TRUE(job.Valid());

    ExtractionOutcome outcome;
    auto res = job.Wait(outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(outcome.HasSession());
    EXPECT_EQ(outcome.libraries_found, 3u);
    EXPECT_FALSE(job.Valid());

    // A second Wait has nothing to return.
    ExtractionOutcome again;
    EXPECT_FALSE(job.Wait(again).is_ok());
}

TEST_F(ExtractionPipelineTest, StartReportsResolveFailure) {
    auto pipeline = MakePipeline();

    ExtractionJob job = pipeline.Start({"com.example.missing", "Missing"});
    ExtractionOutcome outcome;
    auto res = job.Wait(outcome);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, ENOENT);
}

TEST_F(ExtractionPipelineTest, CancelBackgroundJobMidway) {
    std::promise<void> release;
    GateProgress gate(release.get_future().share());
    auto opt = MakeOptions();
    opt.extractor.progress_sink = &gate;
    ExtractionPipeline pipeline(opt, resolver, revealer);
    auto reached = gate.reached.get_future();

    ExtractionJob job = pipeline.StartForBundle(DemoBundle(), "Demo");
    reached.wait();
    EXPECT_FALSE(job.Ready());
    job.Cancel();
    release.set_value();

    ExtractionOutcome outcome;
    auto res = job.Wait(outcome);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.err, ECANCELED);
    EXPECT_FALSE(outcome.HasSession());
    EXPECT_FALSE(fs::exists(ScratchRoot() / "Demo"));
    EXPECT_FALSE(ScratchLease::IsLeased(ScratchRoot() / "Demo"));
}

TEST_F(ExtractionPipelineTest, DroppedJobLeavesNothing) {
    auto pipeline = MakePipeline();
    {
        ExtractionJob job = pipeline.StartForBundle(DemoBundle(), "Demo");
        ASSERT_TRUE(job.Valid());
    }
    EXPECT_FALSE(fs::exists(ScratchRoot() / "Demo"));
    EXPECT_FALSE(ScratchLease::IsLeased(ScratchRoot() / "Demo"));
}

TEST_F(ExtractionPipelineTest, OverwrittenJobIsCancelled) {
    std::promise<void> release;
    GateProgress gate(release.get_future().share());
    auto opt = MakeOptions();
    opt.extractor.progress_sink = &gate;
    ExtractionPipeline gated(opt, resolver, revealer);
    auto pipeline = MakePipeline();
    auto reached = gate.reached.get_future();

    ExtractionJob job = gated.StartForBundle(DemoBundle(), "First");
    reached.wait();

    // The assignment blocks until the first job is joined, so the gate is
    // opened from another thread.
    std::thread opener([&release] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        release.set_value();
    });
    job = pipeline.StartForBundle(DemoBundle(), "Second");
    opener.join();

    EXPECT_EQ(gate.events.load(), 1);
    EXPECT_FALSE(fs::exists(ScratchRoot() / "First"));
    EXPECT_FALSE(ScratchLease::IsLeased(ScratchRoot() / "First"));

    ExtractionOutcome outcome;
    auto res = job.Wait(outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(outcome.HasSession());
    EXPECT_EQ(outcome.scratch_directory, ScratchRoot() / "Second");
    EXPECT_EQ(outcome.session->Libraries().size(), 3u);
}

TEST_F(ExtractionPipelineTest, IncidentalCleanupFailureIsSoft) {
    auto ops = std::make_shared<testutil::RefusingFileOps>();
    ops->refuse = {"Info.plist"};
    ExtractionPipeline pipeline(MakeOptions(), resolver, revealer, ops);

    ExtractionOutcome outcome;
    auto res = pipeline.RunForBundle(DemoBundle(), "Demo", outcome);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    ASSERT_TRUE(outcome.HasSession());
    EXPECT_EQ(outcome.incidental_cleanup.failed, 1u);
    EXPECT_EQ(outcome.incidental_cleanup.removed, 1u);
    EXPECT_TRUE(fs::exists(outcome.scratch_directory / "Info.plist"));

    // Commit still succeeds and the kept libraries stay put.
    fs::path out_dir;
    ASSERT_TRUE(pipeline.CommitAndReveal(*outcome.session, out_dir).is_ok());
    EXPECT_EQ(testutil::ListFileNames(out_dir).count("libA.dylib"), 1u);
}

} // namespace
} // namespace curator
