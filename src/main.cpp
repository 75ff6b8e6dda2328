#include "bundle/collaborators.hpp"
#include "bundle/extraction_pipeline.hpp"
#include "bundle/progress_sinks.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <memory>
#include <string>
#include <vector>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s (-b <bundle> -n <name> | -a <app-id>) [-k <library>]... [--list] [--cancel]\n"
        "\n"
        "Options:\n"
        "  -b, --bundle    Bundle directory or archive (.ipa, .zip, .tar)\n"
        "  -a, --app       Application id, resolved through the configured AppIndex\n"
        "  -n, --name      Display name; names the scratch directory\n"
        "  -k, --keep      Library to keep (repeatable). Default keeps all\n"
        "  -l, --list      List extracted libraries, then discard them\n"
        "  -x, --cancel    Extract, then roll everything back\n"
        "  -c, --config    Config file (default %s)\n"
        "  -v, --verbose   Debug logging\n"
        "  -h, --help      Show this help\n",
        argv,
        curator::config::CuratorConfigFromFile::kDefaultPath);
}

void PrintLibraries(const curator::CurationSession& session) {
    std::printf("%s: %s\n", session.DisplayName().c_str(), session.SelectionSummary().c_str());
    for (const auto& lib : session.Libraries()) {
        std::printf("  [%c] %-40s %10s  %s\n",
                    session.IsKept(lib.id) ? 'x' : ' ',
                    lib.name.c_str(),
                    lib.FormattedSize().c_str(),
                    lib.original_path.c_str());
    }
}

} // namespace

int main(int argc, char **argv) {
    curator::InstallSignalHandlers();

    std::string bundle;
    std::string app_id;
    std::string name;
    std::string config_path;
    std::vector<std::string> keep;
    bool list_only = false;
    bool cancel = false;
    bool verbose = false;

    static option long_opts[] = {
        {"bundle", required_argument, nullptr, 'b'},
        {"app", required_argument, nullptr, 'a'},
        {"name", required_argument, nullptr, 'n'},
        {"keep", required_argument, nullptr, 'k'},
        {"list", no_argument, nullptr, 'l'},
        {"cancel", no_argument, nullptr, 'x'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hb:a:n:k:lxc:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'b':
                bundle = optarg;
                break;
            case 'a':
                app_id = optarg;
                break;
            case 'n':
                name = optarg;
                break;
            case 'k':
                keep.emplace_back(optarg);
                break;
            case 'l':
                list_only = true;
                break;
            case 'x':
                cancel = true;
                break;
            case 'c':
                config_path = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (bundle.empty() == app_id.empty() || (!bundle.empty() && name.empty())) {
        PrintUsage(argv[0]);
        return 2;
    }

    curator::config::CuratorConfigFromFile cfg;
    if (!config_path.empty()) {
        if (auto r = cfg.LoadFile(config_path); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
    } else {
        std::error_code ec;
        const std::string default_path = curator::config::CuratorConfigFromFile::kDefaultPath;
        if (std::filesystem::exists(default_path, ec)) {
            if (auto r = cfg.LoadFile(default_path); !r.is_ok()) {
                std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
                return 1;
            }
        } else {
            LogWarn("no config at %s, using defaults", default_path.c_str());
        }
    }

    curator::Logger::Instance().SetLevel(verbose ? curator::LogLevel::Debug : cfg.log_level);

    auto resolver = std::make_shared<curator::JsonAppIndexResolver>();
    if (!app_id.empty()) {
        if (!cfg.app_index) {
            std::fprintf(stderr, "ERROR: --app needs AppIndex in the config\n");
            return 2;
        }
        if (auto r = curator::JsonAppIndexResolver::LoadFromFile(*cfg.app_index, *resolver); !r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
        if (name.empty()) {
            name = resolver->DisplayNameFor(app_id).value_or(app_id);
        }
    }

    curator::ConsoleProgressSink progress;

    curator::ExtractionPipeline::Options opt;
    opt.extractor.scratch_root = cfg.scratch_root;
    opt.extractor.copy_buffer_bytes = static_cast<std::size_t>(cfg.copy_buffer_bytes);
    opt.extractor.fsync_staged_files = cfg.fsync_staged_files;
    opt.extractor.cancel = &curator::g_cancel;
    opt.extractor.progress_sink = cfg.progress ? &progress : nullptr;
    opt.library_suffix = cfg.library_suffix;

    const curator::ExtractionPipeline pipeline(
        opt, resolver, std::make_shared<curator::LoggingFileRevealer>());

    curator::ExtractionOutcome outcome;
    const curator::Result run_result =
        bundle.empty() ? pipeline.Run({.application_id = app_id, .display_name = name}, outcome)
                       : pipeline.RunForBundle(bundle, name, outcome);
    progress.Finish();

    if (!run_result.is_ok()) {
        if (run_result.err == ECANCELED) {
            std::fprintf(stderr, "Canceled.\n");
            return 130;
        }
        std::fprintf(stderr, "ERROR: %s\n", run_result.msg.c_str());
        return 1;
    }

    if (!outcome.HasSession()) {
        std::printf("No %s files found in %s (%zu files scanned)\n",
                    cfg.library_suffix.c_str(),
                    name.c_str(),
                    outcome.files_extracted);
        return 0;
    }

    curator::CurationSession& session = *outcome.session;

    if (!keep.empty()) {
        session.DeselectAll();
        for (const auto& wanted : keep) {
            bool found = false;
            for (const auto& lib : session.Libraries()) {
                if (lib.name != wanted)
                    continue;
                found = true;
                if (!session.IsKept(lib.id))
                    session.Toggle(lib.id);
            }
            if (!found) {
                std::fprintf(stderr, "ERROR: no extracted library named %s\n", wanted.c_str());
                (void)session.Cancel();
                return 1;
            }
        }
    }

    PrintLibraries(session);

    if (list_only || cancel || curator::g_cancel.load()) {
        auto r = session.Cancel();
        if (!r.is_ok()) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return 1;
        }
        return curator::g_cancel.load() ? 130 : 0;
    }

    std::filesystem::path kept_dir;
    if (auto r = pipeline.CommitAndReveal(session, kept_dir); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        (void)session.Cancel();
        return 1;
    }

    return 0;
}
