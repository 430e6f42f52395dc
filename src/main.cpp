#include "genesis/image_builder.hpp"
#include "genesis/logging.hpp"
#include "genesis/pipeline.hpp"
#include "genesis/version.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <print>
#include <string>
#include <string_view>

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void on_signal(int) {
    g_interrupted.store(true, std::memory_order_relaxed);
}

constexpr int EXIT_USAGE = 2;

void print_help() {
    std::println("Usage: genesis <command> <project-root> [options]");
    std::println("Commands:");
    std::println("  build            Build every image declared in genesis/genesis.yaml");
    std::println("  get-version      Print the version derived from the repository");
    std::println("  clean            Remove the output and work directories");
    std::println("Options:");
    std::println("  -h, --help                Show this help message");
    std::println("  --version                 Show the tool version");
    std::println("  -i <path>                 Developer public key to install into the images");
    std::println("  -f, --force               Rebuild images and rewrite files that already exist");
    std::println("  -j, --jobs <N>            Number of images built in parallel (default: auto)");
    std::println("  -o <dir>                  Output directory (default: <project-root>/output)");
    std::println("  --timeout <seconds>       Limit for each builder invocation (default: none)");
    std::println("  --packer <exe>            Packer executable (default: packer)");
    std::println("  --release-mode <mode>     auto, rc or dev (default: auto)");
    std::println("  --release-branch <glob>   Branch treated as a release branch (repeatable)");
    std::println("  --plan                    Print the resolved build plan without building");
    std::println("  -v, --verbose             Debug logging");
    std::println("  -q, --quiet               Warnings and errors only");
}

bool parse_count(std::string_view text, size_t &value) {
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    return res.ec == std::errc() && res.ptr == text.data() + text.size();
}

void apply_environment(genesis::BuildOptions &options) {
    if (const char *jobs = std::getenv("GENESIS_JOBS")) {
        size_t value = 0;
        if (parse_count(jobs, value))
            options.jobs = value;
    }
    if (const char *timeout = std::getenv("GENESIS_BUILD_TIMEOUT")) {
        size_t value = 0;
        if (parse_count(timeout, value))
            options.timeout = std::chrono::seconds(value);
    }
    if (const char *packer = std::getenv("GENESIS_PACKER")) {
        options.packer = packer;
    }
    if (const char *mode = std::getenv("GENESIS_RELEASE_MODE")) {
        if (auto parsed = genesis::parse_release_mode(mode))
            options.release.mode = *parsed;
    }
}

void print_summary(const genesis::RunSummary &summary) {
    std::println("genesis {}", summary.version);
    for (const auto &report : summary.reports) {
        if (report.status == genesis::UnitStatus::Built || report.status == genesis::UnitStatus::Skipped) {
            std::println("  {:<9} {}/{} -> {}", genesis::to_string(report.status), report.element, report.image,
                         report.artifact.string());
        } else {
            std::println("  {:<9} {}/{}: {}", genesis::to_string(report.status), report.element, report.image,
                         report.message);
        }
    }
    for (const auto &error : summary.errors) {
        std::println(std::cerr, "{}", error.describe());
    }
}

} // namespace

int main(const int argc, const char *const *argv) {
    genesis::BuildOptions options;
    genesis::LoggingOptions logging;
    bool custom_release_branches = false;
    std::string command;
    std::filesystem::path project_root;

    apply_environment(options);

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&](std::string_view flag) -> const char * {
            if (i + 1 < argc)
                return argv[++i];
            std::println(std::cerr, "Missing argument for {}", flag);
            return nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "--version") {
            std::println("genesis {}", GENESIS_PROJ_VER);
            return 0;
        } else if (arg == "-i") {
            const char *value = next(arg);
            if (!value)
                return EXIT_USAGE;
            options.developer_key = value;
        } else if (arg == "-f" || arg == "--force") {
            options.force = true;
        } else if (arg == "-j" || arg == "--jobs") {
            const char *value = next(arg);
            if (!value || !parse_count(value, options.jobs)) {
                std::println(std::cerr, "Invalid job count: {}", value ? value : "");
                return EXIT_USAGE;
            }
        } else if (arg == "-o") {
            const char *value = next(arg);
            if (!value)
                return EXIT_USAGE;
            options.output_dir = std::filesystem::absolute(value);
        } else if (arg == "--timeout") {
            const char *value = next(arg);
            size_t seconds = 0;
            if (!value || !parse_count(value, seconds)) {
                std::println(std::cerr, "Invalid timeout: {}", value ? value : "");
                return EXIT_USAGE;
            }
            options.timeout = std::chrono::seconds(seconds);
        } else if (arg == "--packer") {
            const char *value = next(arg);
            if (!value)
                return EXIT_USAGE;
            options.packer = value;
        } else if (arg == "--release-mode") {
            const char *value = next(arg);
            auto mode = value ? genesis::parse_release_mode(value) : std::nullopt;
            if (!mode) {
                std::println(std::cerr, "Invalid release mode: {} (expected auto, rc or dev)", value ? value : "");
                return EXIT_USAGE;
            }
            options.release.mode = *mode;
        } else if (arg == "--release-branch") {
            const char *value = next(arg);
            if (!value)
                return EXIT_USAGE;
            if (!custom_release_branches) {
                options.release.release_branches.clear();
                custom_release_branches = true;
            }
            options.release.release_branches.emplace_back(value);
        } else if (arg == "--plan") {
            options.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            logging.level = "debug";
        } else if (arg == "-q" || arg == "--quiet") {
            logging.level = "warn";
        } else if (!arg.empty() && arg.front() == '-') {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return EXIT_USAGE;
        } else if (command.empty()) {
            command = arg;
        } else if (project_root.empty()) {
            project_root = arg;
        } else {
            std::println(std::cerr, "Unexpected argument: {}", arg);
            return EXIT_USAGE;
        }
    }

    if (command.empty() || project_root.empty()) {
        print_help();
        return EXIT_USAGE;
    }

    genesis::init_logging(logging);

    std::error_code ec;
    project_root = std::filesystem::absolute(project_root, ec);
    if (ec || !std::filesystem::is_directory(project_root)) {
        std::println(std::cerr, "Project root {} is not a directory", project_root.string());
        return 1;
    }

    genesis::GitRepositoryState repo(project_root);
    int rc = 0;

    if (command == "get-version") {
        auto version = genesis::resolve_version(repo, options.release);
        if (!version) {
            std::println(std::cerr, "{}", version.error().describe());
            rc = 1;
        } else {
            std::println("{}", version->to_string());
        }
    } else if (command == "clean") {
        if (auto res = genesis::clean_project(project_root, options); !res) {
            std::println(std::cerr, "{}", res.error().describe());
            rc = 1;
        }
    } else if (command == "build") {
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);
        options.interrupt = &g_interrupted;

        genesis::PackerImageBuilder builder({.packer = options.packer, .timeout = options.timeout});
        auto summary = genesis::build_project(project_root, options, builder, repo);
        if (!summary) {
            std::println(std::cerr, "{}", summary.error().describe());
            rc = 1;
        } else {
            if (!options.dry_run)
                print_summary(*summary);
            rc = summary->success() ? 0 : 1;
        }
    } else {
        std::println(std::cerr, "Unknown command: {}", command);
        print_help();
        rc = EXIT_USAGE;
    }

    genesis::shutdown_logging();
    return rc;
}
