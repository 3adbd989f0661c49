#define _FILE_OFFSET_BITS 64

#include "fetch/fetcher.hpp"
#include "fetch/progress_sinks.hpp"
#include "net/curl_http_client.hpp"
#include "platform/host_capabilities.hpp"
#include "sdk/env_exporter.hpp"
#include "sdk/git_checkout.hpp"
#include "sdk/sdk_installer.hpp"
#include "sdk/tools_index_installer.hpp"
#include "system/signals.hpp"
#include "target/target_parser.hpp"
#include "toolchain/llvm_toolchain.hpp"
#include "util/config.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr const char *kDefaultSdkVersion = "release/v4.4";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-t <targets>] [-e <version>] [--minify] [-c <config>] [-r <dir>]\n"
        "\n"
        "Options:\n"
        "  -t, --targets          Comma or space separated chips, or 'all' (default all)\n"
        "  -e, --sdk-version      esp-idf ref: 4.4, branch:<b>, tag:<t> or commit:<c> (default %s)\n"
        "  -m, --minify           Remove docs, examples and test tools from the SDK\n"
        "  -c, --config           JSON config file (default $XDG_CONFIG_HOME/espkit/config.json)\n"
        "  -r, --tools-root       Install root (default $IDF_TOOLS_PATH or ~/.espressif)\n"
        "  -H, --host             Host triple to install for (default: build host)\n"
        "  -x, --export-file      Write IDF_PATH/IDF_TOOLS_PATH exports to this file\n"
        "  -l, --llvm-version     Also install the Xtensa LLVM toolchain (13 or 14)\n"
        "  -L, --log-level        debug|info|warn|error|none\n"
        "      --no-progress      Do not draw download progress\n"
        "  -h, --help             Show this help\n",
        argv, kDefaultSdkVersion);
}

} // namespace

int main(int argc, char **argv) {
    espkit::InstallSignalHandlers();

    std::string targets_arg = "all";
    std::string sdk_version = kDefaultSdkVersion;
    bool minify = false;
    std::optional<std::string> config_cli;
    std::optional<std::string> tools_root_cli;
    std::optional<std::string> host_cli;
    std::optional<std::string> export_file;
    std::optional<std::string> llvm_version;
    std::optional<espkit::LogLevel> log_level_cli;
    std::optional<bool> progress_cli;

    enum { kOptNoProgress = 1000 };

    static option long_opts[] = {
        {"targets", required_argument, nullptr, 't'},
        {"sdk-version", required_argument, nullptr, 'e'},
        {"minify", no_argument, nullptr, 'm'},
        {"config", required_argument, nullptr, 'c'},
        {"tools-root", required_argument, nullptr, 'r'},
        {"host", required_argument, nullptr, 'H'},
        {"export-file", required_argument, nullptr, 'x'},
        {"llvm-version", required_argument, nullptr, 'l'},
        {"log-level", required_argument, nullptr, 'L'},
        {"no-progress", no_argument, nullptr, kOptNoProgress},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "ht:e:mc:r:H:x:l:L:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 't':
                targets_arg = optarg;
                break;

            case 'e':
                sdk_version = optarg;
                break;

            case 'm':
                minify = true;
                break;

            case 'c':
                config_cli = optarg;
                break;

            case 'r':
                tools_root_cli = optarg;
                break;

            case 'H':
                host_cli = optarg;
                break;

            case 'x':
                export_file = optarg;
                break;

            case 'l':
                llvm_version = optarg;
                break;

            case 'L': {
                auto lvl = espkit::ParseLogLevel(optarg);
                if (!lvl) {
                    std::fprintf(stderr, "Invalid --log-level: %s\n", optarg);
                    return 2;
                }
                log_level_cli = *lvl;
                break;
            }

            case kOptNoProgress:
                progress_cli = false;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return 2;
    }

    espkit::config::InstallerConfigFromFile cfg;
    {
        const std::string config_path = config_cli.value_or(espkit::config::DefaultConfigPath());
        std::error_code ec;
        // The default location is optional; an explicit --config must load.
        if (config_cli || std::filesystem::exists(config_path, ec)) {
            if (auto r = cfg.LoadFile(config_path); !r.ok) {
                std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
                return 1;
            }
        }
    }

    espkit::Logger::Instance().SetLevel(log_level_cli.value_or(cfg.log_level.value_or(espkit::LogLevel::Info)));

    auto targets = espkit::ParseTargets(targets_arg);
    if (!targets) {
        LogError("%s", targets.error().c_str());
        return 2;
    }

    std::optional<std::string> llvm_release;
    if (llvm_version) {
        auto parsed = espkit::ParseLlvmVersion(*llvm_version);
        if (!parsed) {
            LogError("%s", parsed.error().c_str());
            return 2;
        }
        llvm_release = *parsed;
    }

    const espkit::PlatformId platform = host_cli.value_or(cfg.host_triple.value_or(espkit::BuildHostPlatform()));
    const espkit::ToolsLayout layout(espkit::config::ResolveToolsRoot(tools_root_cli, cfg));
    const auto caps = espkit::HostCapabilities::ForPlatform(platform);

    LogInfo("Host %s, tools root %s", platform.c_str(), layout.Root().c_str());

    espkit::ConsoleProgressSink progress;
    espkit::Fetcher::Options fetch_opt{};
    if (progress_cli.value_or(cfg.progress.value_or(true))) {
        fetch_opt.progress_sink = &progress;
    }

    auto http = std::make_shared<espkit::CurlHttpClient>();
    auto fetcher = std::make_shared<const espkit::Fetcher>(http, fetch_opt);
    auto git = std::make_shared<const espkit::GitCheckout>();

    espkit::ToolsIndexInstaller::Options tools_opt{};
    tools_opt.platform = platform;
    tools_opt.bundled_index_path = cfg.bundled_tools_index.value_or("");
    auto tools = std::make_shared<espkit::ToolsIndexInstaller>(fetcher, git, tools_opt);

    espkit::SdkInstaller::Options sdk_opt{};
    sdk_opt.repository_url = cfg.sdk_repository.value_or(espkit::config::kDefaultSdkRepository);
    sdk_opt.caps = caps;

    espkit::SdkInstaller installer(layout, tools, sdk_opt);

    std::string sdk_dir;
    if (auto r = installer.Install(*targets, sdk_version, minify, sdk_dir); !r.ok) {
        LogError("%s", r.msg.c_str());
        return 1;
    }

    if (llvm_release) {
        espkit::LlvmToolchain llvm(fetcher, platform);
        std::string archive;
        if (auto r = llvm.Install(layout, *llvm_release, archive); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
    }

    if (export_file) {
        const std::vector<std::string> exports = {
            "IDF_PATH=" + sdk_dir,
            "IDF_TOOLS_PATH=" + layout.Root().string(),
        };
        if (auto r = espkit::WriteExportFile(*export_file, exports); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
    }

    LogInfo("esp-idf installed at %s", sdk_dir.c_str());
    return 0;
}
