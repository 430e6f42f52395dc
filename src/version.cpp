#include "genesis/version.hpp"

#include "genesis/logging.hpp"
#include "genesis/process_exec.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <fnmatch.h>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace genesis {

namespace {

constexpr size_t COMMIT_PREFIX = 8;

// Tags made only of digits and dots; SemVer::parse rejects the rest.
constexpr std::string_view STABLE_TAG_MATCH = "[0-9]*.[0-9]*.[0-9]*";
constexpr std::string_view STABLE_TAG_EXCLUDE = "*[!0-9.]*";

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

bool parse_number(std::string_view text, uint32_t &value) {
    if (text.empty() || (text.size() > 1 && text.front() == '0'))
        return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc() && ptr == text.data() + text.size();
}

bool is_hex(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

} // namespace

std::string SemVer::to_string() const {
    return std::format("{}.{}.{}", major, minor, patch);
}

std::optional<SemVer> SemVer::parse(std::string_view text) {
    SemVer version;
    uint32_t *parts[] = {&version.major, &version.minor, &version.patch};
    for (size_t i = 0; i < 3; ++i) {
        size_t dot = text.find('.');
        std::string_view part = i < 2 ? text.substr(0, dot) : text;
        if (i < 2 && dot == std::string_view::npos)
            return std::nullopt;
        if (!parse_number(part, *parts[i]))
            return std::nullopt;
        if (i < 2)
            text.remove_prefix(dot + 1);
    }
    return version;
}

std::string_view to_string(VersionKind kind) {
    switch (kind) {
    case VersionKind::stable:
        return "stable";
    case VersionKind::rc:
        return "rc";
    case VersionKind::dev:
        return "dev";
    }
    return "dev";
}

std::string VersionTag::to_string() const {
    if (kind == VersionKind::stable)
        return base.to_string();
    return std::format("{}-{}+{:%Y%m%d%H%M%S}.{}", base.to_string(), genesis::to_string(kind), timestamp, commit);
}

std::optional<ReleaseMode> parse_release_mode(std::string_view text) {
    if (text == "auto")
        return ReleaseMode::automatic;
    if (text == "rc")
        return ReleaseMode::release_candidate;
    if (text == "dev")
        return ReleaseMode::development;
    return std::nullopt;
}

bool ReleasePolicy::is_release_candidate(const HeadState &head) const {
    switch (mode) {
    case ReleaseMode::release_candidate:
        return true;
    case ReleaseMode::development:
        return false;
    case ReleaseMode::automatic:
        break;
    }
    if (head.dirty || !head.branch)
        return false;
    return std::any_of(release_branches.begin(), release_branches.end(), [&](const std::string &pattern) {
        return fnmatch(pattern.c_str(), head.branch->c_str(), 0) == 0;
    });
}

GitRepositoryState::GitRepositoryState(std::filesystem::path repo_dir, std::string git)
    : repo_dir_(std::move(repo_dir)), git_(std::move(git)) {
}

Result<std::string> GitRepositoryState::git(std::vector<std::string> args, bool allow_failure, int *status) {
    args.insert(args.begin(), git_);
    const std::string command = args.size() > 1 ? args[1] : git_;

    auto output = process_capture(std::move(args), repo_dir_);
    if (!output) {
        return fail(ErrorKind::VersionUndetermined, "{}", output.error().message);
    }
    if (status)
        *status = output->status;
    if (output->status != 0 && !allow_failure) {
        return fail(ErrorKind::VersionUndetermined, "git {} failed in {}: {}", command, repo_dir_.string(),
                    trim(output->err));
    }
    return std::string(trim(output->out));
}

Result<std::optional<HeadState>> GitRepositoryState::head() {
    if (auto inside = git({"rev-parse", "--git-dir"}); !inside) {
        return std::unexpected(inside.error());
    }

    int status = 0;
    auto commit = git({"rev-parse", "--verify", "-q", "HEAD"}, true, &status);
    if (!commit)
        return std::unexpected(commit.error());
    if (status != 0 || commit->empty()) {
        return std::nullopt;
    }

    HeadState head;
    head.commit = std::move(*commit);

    auto branch = git({"symbolic-ref", "-q", "--short", "HEAD"}, true, &status);
    if (!branch)
        return std::unexpected(branch.error());
    if (status == 0 && !branch->empty())
        head.branch = std::move(*branch);

    // Untracked files (build outputs, editor droppings) do not make a tree dirty.
    auto changes = git({"status", "--porcelain", "--untracked-files=no"});
    if (!changes)
        return std::unexpected(changes.error());
    head.dirty = !changes->empty();

    return head;
}

Result<std::optional<TagInfo>> GitRepositoryState::nearest_tag() {
    std::vector<std::string> args{"describe", "--tags", "--long", "--match", std::string(STABLE_TAG_MATCH),
                                  "--exclude", std::string(STABLE_TAG_EXCLUDE)};

    // The glob admits tags like `01.5.0` or `1.2.3.4`; skip those and keep looking further back.
    while (true) {
        std::vector<std::string> command = args;
        command.emplace_back("HEAD");

        int status = 0;
        auto described = git(std::move(command), true, &status);
        if (!described)
            return std::unexpected(described.error());
        if (status != 0 || described->empty()) {
            return std::nullopt;
        }

        // <tag>-<distance>-g<hash>
        std::string_view text = *described;
        const size_t hash_dash = text.rfind('-');
        const size_t distance_dash =
            hash_dash == std::string_view::npos || hash_dash == 0 ? std::string_view::npos : text.rfind('-', hash_dash - 1);
        if (distance_dash == std::string_view::npos) {
            return fail(ErrorKind::VersionUndetermined, "unexpected git describe output: {}", text);
        }

        const std::string_view tag = text.substr(0, distance_dash);
        const auto version = SemVer::parse(tag);
        if (!version) {
            GENESIS_LOG_DEBUG("skipping non-semantic tag", {str_field("tag", tag)});
            args.emplace_back("--exclude");
            args.emplace_back(tag);
            continue;
        }

        TagInfo info{.version = *version, .distance = 0};
        const auto distance = text.substr(distance_dash + 1, hash_dash - distance_dash - 1);
        if (std::from_chars(distance.data(), distance.data() + distance.size(), info.distance).ec != std::errc()) {
            return fail(ErrorKind::VersionUndetermined, "unexpected git describe output: {}", text);
        }
        return info;
    }
}

VersionResolver::VersionResolver(RepositoryStateProvider &repo, ReleasePolicy policy, Clock clock)
    : repo_(repo), policy_(std::move(policy)), clock_(std::move(clock)) {
    if (!clock_)
        clock_ = [] { return std::chrono::system_clock::now(); };
}

Result<VersionTag> VersionResolver::resolve() {
    auto head = repo_.head();
    if (!head)
        return std::unexpected(head.error());
    if (!*head) {
        return fail(ErrorKind::VersionUndetermined, "repository has no commits");
    }
    const HeadState &state = **head;

    if (state.commit.size() < COMMIT_PREFIX || !is_hex(state.commit)) {
        return fail(ErrorKind::VersionUndetermined, "unusable commit identifier '{}'", state.commit);
    }

    auto tag = repo_.nearest_tag();
    if (!tag)
        return std::unexpected(tag.error());

    VersionTag version;
    if (*tag)
        version.base = (*tag)->version;

    if (*tag && (*tag)->distance == 0 && !state.dirty) {
        version.kind = VersionKind::stable;
        return version;
    }

    version.kind = policy_.is_release_candidate(state) ? VersionKind::rc : VersionKind::dev;
    version.timestamp = std::chrono::floor<std::chrono::seconds>(clock_());
    version.commit = state.commit.substr(0, COMMIT_PREFIX);
    std::transform(version.commit.begin(), version.commit.end(), version.commit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return version;
}

} // namespace genesis
