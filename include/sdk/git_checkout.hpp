#pragma once

#include "sdk/remote_ref.hpp"
#include "util/result.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace espkit {

class GitCheckout {
  public:
    class ICommandRunner {
      public:
        virtual ~ICommandRunner() = default;
        // Runs argv[0] with argv (PATH lookup) and waits; non-zero exit is a failure.
        virtual Result Run(const std::vector<std::string>& argv) const = 0;
    };

    GitCheckout();
    explicit GitCheckout(std::shared_ptr<const ICommandRunner> runner);

    // Clones repo_url at ref into dir, including submodules. An existing dir
    // is taken as a finished checkout and left untouched. The clone goes to a
    // sibling "<dir>.partial" first and is renamed into place on success.
    Result Ensure(const std::string& repo_url,
                  const RemoteRef& ref,
                  const std::filesystem::path& dir) const;

  private:
    static std::shared_ptr<const ICommandRunner> DefaultRunner();

    std::shared_ptr<const ICommandRunner> runner_;
};

} // namespace espkit
