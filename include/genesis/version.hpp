#pragma once

#include "genesis/utility.hpp"

#include <chrono>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace genesis {

struct SemVer {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t patch = 0;

    auto operator<=>(const SemVer &) const = default;

    std::string to_string() const;

    /// Accepts exactly `X.Y.Z`; anything else (prefixes, pre-release suffixes) is not stable.
    static std::optional<SemVer> parse(std::string_view text);
};

enum class VersionKind { stable, rc, dev };

std::string_view to_string(VersionKind kind);

struct VersionTag {
    VersionKind kind = VersionKind::dev;
    SemVer base;
    std::chrono::sys_seconds timestamp{};
    std::string commit;

    /// `X.Y.Z` for stable, `X.Y.Z-<kind>+YYYYMMDDHHMMSS.<commit8>` otherwise.
    std::string to_string() const;
};

struct TagInfo {
    SemVer version;
    size_t distance = 0; ///< Commits between the tag and HEAD.
};

struct HeadState {
    std::string commit;
    bool dirty = false;
    std::optional<std::string> branch; ///< Unset when HEAD is detached.
};

/**
 * @brief Narrow view of source control needed to derive a version.
 */
class RepositoryStateProvider {
public:
    virtual ~RepositoryStateProvider() = default;

    /// Nearest ancestor stable tag, or nullopt when none exists.
    virtual Result<std::optional<TagInfo>> nearest_tag() = 0;

    /// Current commit and dirty flag, or nullopt for a repository without commits.
    virtual Result<std::optional<HeadState>> head() = 0;
};

/**
 * @brief Reads repository state by running `git` in @p repo_dir.
 */
class GitRepositoryState : public RepositoryStateProvider {
public:
    explicit GitRepositoryState(std::filesystem::path repo_dir, std::string git = "git");

    Result<std::optional<TagInfo>> nearest_tag() override;
    Result<std::optional<HeadState>> head() override;

private:
    Result<std::string> git(std::vector<std::string> args, bool allow_failure = false, int *status = nullptr);

    std::filesystem::path repo_dir_;
    std::string git_;
};

enum class ReleaseMode { automatic, release_candidate, development };

std::optional<ReleaseMode> parse_release_mode(std::string_view text);

/**
 * @brief Decides between rc and dev for builds that are not stable.
 *
 * `automatic` selects rc when the current branch matches one of
 * `release_branches` (fnmatch globs).
 */
struct ReleasePolicy {
    ReleaseMode mode = ReleaseMode::automatic;
    std::vector<std::string> release_branches{"release/*", "stable/*"};

    bool is_release_candidate(const HeadState &head) const;
};

using Clock = std::function<std::chrono::system_clock::time_point()>;

class VersionResolver {
public:
    VersionResolver(RepositoryStateProvider &repo, ReleasePolicy policy = {}, Clock clock = {});

    Result<VersionTag> resolve();

private:
    RepositoryStateProvider &repo_;
    ReleasePolicy policy_;
    Clock clock_;
};

} // namespace genesis
