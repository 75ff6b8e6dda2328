#include "bundle/file_ops.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;

namespace curator {

namespace {

class StdFileOps final : public IFileOps {
  public:
    Result RemoveFile(const fs::path& p, bool& existed) const override {
        std::error_code ec;
        existed = fs::remove(p, ec);
        if (ec) {
            existed = true;
            return Result::Fail(ec.value(), "remove " + p.string() + ": " + ec.message());
        }
        return Result::Ok();
    }

    Result RemoveTree(const fs::path& p, bool& existed) const override {
        std::error_code ec;
        const auto n = fs::remove_all(p, ec);
        if (ec) {
            existed = true;
            return Result::Fail(ec.value(), "remove_all " + p.string() + ": " + ec.message());
        }
        existed = n > 0;
        return Result::Ok();
    }

    Result CreateDirectories(const fs::path& p) const override {
        std::error_code ec;
        fs::create_directories(p, ec);
        if (ec) {
            return Result::Fail(ec.value(), "create_directories " + p.string() + ": " + ec.message());
        }
        if (!fs::is_directory(p, ec)) {
            return Result::Fail(ENOTDIR, "not a directory: " + p.string());
        }
        return Result::Ok();
    }
};

} // namespace

std::shared_ptr<const IFileOps> DefaultFileOps() {
    static const std::shared_ptr<const IFileOps> kDefault = std::make_shared<StdFileOps>();
    return kDefault;
}

void RemoveBestEffort(const IFileOps& ops,
                      RemoveKind kind,
                      const fs::path& p,
                      CleanupReport& report) {
    bool existed = false;
    const Result r = kind == RemoveKind::Tree ? ops.RemoveTree(p, existed)
                                              : ops.RemoveFile(p, existed);
    if (!r.is_ok()) {
        ++report.failed;
        LogWarn("cleanup failed, leaving %s: %s", p.c_str(), r.msg.c_str());
        return;
    }
    if (existed) {
        ++report.removed;
        LogDebug("removed %s", p.c_str());
    } else {
        ++report.missing;
        LogDebug("already absent: %s", p.c_str());
    }
}

} // namespace curator
