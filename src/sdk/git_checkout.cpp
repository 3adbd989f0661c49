#include "sdk/git_checkout.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace espkit {

namespace {

std::string JoinArgs(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out.push_back(' ');
        out += a;
    }
    return out;
}

class PosixCommandRunner final : public GitCheckout::ICommandRunner {
  public:
    Result Run(const std::vector<std::string>& argv) const override {
        if (argv.empty()) return Result::Fail(-1, "empty command line");

        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
        cargv.push_back(nullptr);

        LogDebug("exec: %s", JoinArgs(argv).c_str());

        const pid_t pid = ::fork();
        if (pid < 0) {
            return Result::Fail(errno, "fork failed: " + std::string(std::strerror(errno)));
        }
        if (pid == 0) {
            ::execvp(cargv[0], cargv.data());
            _exit(127);
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return Result::Fail(errno, "waitpid failed: " + std::string(std::strerror(errno)));
            }
        }

        if (WIFEXITED(status) && WEXITSTATUS(status) == 0) return Result::Ok();
        if (WIFEXITED(status)) {
            return Result::Fail(WEXITSTATUS(status),
                                "Command '" + JoinArgs(argv) + "' exited with status " +
                                    std::to_string(WEXITSTATUS(status)));
        }
        return Result::Fail(-1, "Command '" + JoinArgs(argv) + "' terminated abnormally");
    }
};

} // namespace

std::shared_ptr<const GitCheckout::ICommandRunner> GitCheckout::DefaultRunner() {
    static const std::shared_ptr<const ICommandRunner> kDefault = std::make_shared<PosixCommandRunner>();
    return kDefault;
}

GitCheckout::GitCheckout() : runner_(DefaultRunner()) {}

GitCheckout::GitCheckout(std::shared_ptr<const ICommandRunner> runner)
    : runner_(runner ? std::move(runner) : DefaultRunner()) {}

Result GitCheckout::Ensure(const std::string& repo_url,
                           const RemoteRef& ref,
                           const fs::path& dir) const {
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        LogInfo("Using existing SDK checkout: %s", dir.c_str());
        return Result::Ok();
    }

    fs::create_directories(dir.parent_path(), ec);
    if (ec) {
        return Result::Fail(ec.value(), "Creating directory " + dir.parent_path().string() +
                                            " failed: " + ec.message());
    }

    const fs::path staging = dir.string() + ".partial";
    fs::remove_all(staging, ec);
    if (ec) {
        return Result::Fail(ec.value(), "Cannot clear stale " + staging.string() + ": " + ec.message());
    }

    LogInfo("Cloning %s (%s %s) into %s",
            repo_url.c_str(), RefKind(ref), RefName(ref).c_str(), dir.c_str());

    std::vector<std::vector<std::string>> steps;
    if (std::holds_alternative<Commit>(ref)) {
        steps.push_back({"git", "clone", "--recursive", repo_url, staging.string()});
        steps.push_back({"git", "-C", staging.string(), "checkout", RefName(ref)});
        steps.push_back({"git", "-C", staging.string(), "submodule", "update", "--init", "--recursive"});
    } else {
        steps.push_back({"git", "clone", "--depth", "1", "--branch", RefName(ref),
                         "--recursive", "--shallow-submodules", repo_url, staging.string()});
    }

    for (const auto& argv : steps) {
        auto res = runner_->Run(argv);
        if (!res.is_ok()) {
            std::error_code cleanup_ec;
            fs::remove_all(staging, cleanup_ec);
            return Result::Fail(res.err, "Could not check out SDK: " + res.msg);
        }
    }

    fs::rename(staging, dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "Cannot move " + staging.string() + " to " + dir.string() +
                                            ": " + ec.message());
    }
    return Result::Ok();
}

} // namespace espkit
