// test_version.cpp - Tests for version derivation

#include "genesis/process_exec.hpp"
#include "genesis/version.hpp"

#include "fakes.hpp"
#include "test_support.hpp"

#include <regex>

using namespace genesis;

namespace {

// 2025-03-04T05:06:07Z
constexpr int64_t T0 = 1741064767;

// Runs git in @p dir with a fixed identity and no signing; throws on failure.
std::string git(const fs::path &dir, std::vector<std::string> args) {
    std::vector<std::string> command{"git", "-c", "user.name=genesis", "-c", "user.email=genesis@example.invalid",
                                     "-c", "commit.gpgsign=false", "-c", "tag.gpgsign=false"};
    command.insert(command.end(), args.begin(), args.end());
    auto output = process_capture(std::move(command), dir);
    if (!output || output->status != 0)
        throw std::runtime_error("git " + args.front() + " failed: " + (output ? output->err : output.error().message));
    return output->out;
}

void commit_file(const fs::path &dir, const std::string &name, const std::string &content) {
    write_file(dir / name, content);
    git(dir, {"add", name});
    git(dir, {"commit", "-q", "-m", "update " + name});
}

std::string head_commit(const fs::path &dir) {
    std::string commit = git(dir, {"rev-parse", "HEAD"});
    return commit.substr(0, 8);
}

FakeRepositoryState dirty_feature_branch() {
    FakeRepositoryState repo;
    repo.tag = TagInfo{.version = SemVer{1, 2, 3}, .distance = 4};
    repo.head_state = HeadState{.commit = "89ABCDEF0123456789abcdef0123456789abcdef", .dirty = true,
                                .branch = std::string("feature/login")};
    return repo;
}

} // namespace

void test_semver_parse() {
    ASSERT(SemVer::parse("1.2.3") == (SemVer{1, 2, 3}));
    ASSERT(SemVer::parse("10.0.12") == (SemVer{10, 0, 12}));
    ASSERT(!SemVer::parse("v1.2.3"));
    ASSERT(!SemVer::parse("1.2"));
    ASSERT(!SemVer::parse("1.2.3-rc1"));
    ASSERT(!SemVer::parse("1.2.3.4"));
    ASSERT(!SemVer::parse("01.2.3"));
}

void test_clean_checkout_at_tag_is_stable() {
    auto repo = FakeRepositoryState::tagged(SemVer{1, 2, 3});
    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT(version->kind == VersionKind::stable);
    ASSERT_EQ(version->to_string(), "1.2.3");
}

void test_dirty_tree_on_feature_branch_is_dev() {
    auto repo = dirty_feature_branch();
    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT(version->kind == VersionKind::dev);
    ASSERT_EQ(version->to_string(), "1.2.3-dev+20250304050607.89abcdef");

    const std::regex pattern(R"(^\d+\.\d+\.\d+-dev\+\d{14}\.[0-9a-f]{8}$)");
    ASSERT(std::regex_match(version->to_string(), pattern));
}

void test_dirty_tree_at_tag_is_not_stable() {
    auto repo = FakeRepositoryState::tagged(SemVer{1, 2, 3});
    repo.head_state->dirty = true;
    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT(version->kind == VersionKind::dev);
    ASSERT(version->to_string().starts_with("1.2.3-dev+"));
}

void test_resolutions_differ_only_in_timestamp() {
    auto repo = dirty_feature_branch();
    int64_t now = T0;
    VersionResolver resolver(repo, {}, [&now] { return std::chrono::system_clock::time_point(std::chrono::seconds(now)); });

    auto first = resolver.resolve();
    now += 1;
    auto second = resolver.resolve();
    ASSERT(first.has_value() && second.has_value());

    const std::string a = first->to_string();
    const std::string b = second->to_string();
    ASSERT(a != b);
    const auto plus = a.find('+');
    const auto dot = a.rfind('.');
    ASSERT_EQ(a.substr(0, plus), b.substr(0, plus));
    ASSERT_EQ(a.substr(dot), b.substr(dot));
}

void test_release_branch_is_rc() {
    FakeRepositoryState repo;
    repo.tag = TagInfo{.version = SemVer{2, 0, 0}, .distance = 3};
    repo.head_state = HeadState{.commit = "abcdef0123456789", .dirty = false, .branch = std::string("release/2.1")};

    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT(version->kind == VersionKind::rc);
    ASSERT_EQ(version->to_string(), "2.0.0-rc+20250304050607.abcdef01");
}

void test_explicit_release_modes() {
    auto repo = dirty_feature_branch();
    VersionResolver rc(repo, ReleasePolicy{.mode = ReleaseMode::release_candidate}, fixed_clock(T0));
    auto version = rc.resolve();
    ASSERT(version.has_value());
    ASSERT(version->kind == VersionKind::rc);

    FakeRepositoryState release;
    release.head_state = HeadState{.commit = "abcdef0123456789", .dirty = false, .branch = std::string("release/1")};
    VersionResolver dev(release, ReleasePolicy{.mode = ReleaseMode::development}, fixed_clock(T0));
    version = dev.resolve();
    ASSERT(version.has_value());
    ASSERT(version->kind == VersionKind::dev);

    // a stable tag wins over any mode
    auto tagged = FakeRepositoryState::tagged(SemVer{3, 1, 4});
    VersionResolver forced(tagged, ReleasePolicy{.mode = ReleaseMode::release_candidate}, fixed_clock(T0));
    version = forced.resolve();
    ASSERT(version.has_value());
    ASSERT_EQ(version->to_string(), "3.1.4");
}

void test_no_tag_uses_zero_base() {
    FakeRepositoryState repo;
    repo.head_state = HeadState{.commit = "fedcba9876543210", .dirty = false, .branch = std::nullopt};
    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT_EQ(version->to_string(), "0.0.0-dev+20250304050607.fedcba98");
}

void test_empty_repository_is_undetermined() {
    FakeRepositoryState repo;
    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(!version.has_value());
    ASSERT(version.error().kind == ErrorKind::VersionUndetermined);
}

void test_short_commit_is_undetermined() {
    FakeRepositoryState repo;
    repo.head_state = HeadState{.commit = "abc12", .dirty = false, .branch = std::nullopt};
    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(!version.has_value());
    ASSERT(version.error().kind == ErrorKind::VersionUndetermined);
}

void test_git_empty_repository() {
    TempDir dir("git");
    git(dir.path, {"init", "-q"});

    GitRepositoryState repo(dir.path);
    auto head = repo.head();
    ASSERT(head.has_value());
    ASSERT(!head->has_value());

    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(!version.has_value());
    ASSERT(version.error().kind == ErrorKind::VersionUndetermined);
}

void test_git_not_a_repository() {
    TempDir dir("git");
    GitRepositoryState repo(dir.path / "missing");
    auto head = repo.head();
    ASSERT(!head.has_value());
    ASSERT(head.error().kind == ErrorKind::VersionUndetermined);
}

void test_git_tagged_commit() {
    TempDir dir("git");
    git(dir.path, {"init", "-q"});
    git(dir.path, {"symbolic-ref", "HEAD", "refs/heads/main"});
    commit_file(dir.path, "README", "one\n");
    git(dir.path, {"tag", "1.2.3"});
    git(dir.path, {"tag", "v9.9.9"});

    GitRepositoryState repo(dir.path);
    auto tag = repo.nearest_tag();
    ASSERT(tag.has_value() && tag->has_value());
    ASSERT((*tag)->version == (SemVer{1, 2, 3}));
    ASSERT_EQ((*tag)->distance, 0u);

    auto head = repo.head();
    ASSERT(head.has_value() && head->has_value());
    ASSERT_EQ((*head)->branch, std::optional<std::string>("main"));
    ASSERT(!(*head)->dirty);

    // untracked files leave the tree clean
    write_file(dir.path / "scratch.txt", "untracked");
    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT_EQ(version->to_string(), "1.2.3");
}

void test_git_dirty_tree() {
    TempDir dir("git");
    git(dir.path, {"init", "-q"});
    git(dir.path, {"symbolic-ref", "HEAD", "refs/heads/main"});
    commit_file(dir.path, "README", "one\n");
    git(dir.path, {"tag", "1.2.3"});
    write_file(dir.path / "README", "changed\n");

    GitRepositoryState repo(dir.path);
    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT(version->kind == VersionKind::dev);
    ASSERT_EQ(version->to_string(), "1.2.3-dev+20250304050607." + head_commit(dir.path));
}

void test_git_distance_and_branches() {
    TempDir dir("git");
    git(dir.path, {"init", "-q"});
    git(dir.path, {"symbolic-ref", "HEAD", "refs/heads/main"});
    commit_file(dir.path, "README", "one\n");
    git(dir.path, {"tag", "1.2.3"});
    commit_file(dir.path, "README", "two\n");

    GitRepositoryState repo(dir.path);
    auto tag = repo.nearest_tag();
    ASSERT(tag.has_value() && tag->has_value());
    ASSERT_EQ((*tag)->distance, 1u);

    VersionResolver resolver(repo, {}, fixed_clock(T0));
    auto version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT_EQ(version->to_string(), "1.2.3-dev+20250304050607." + head_commit(dir.path));

    git(dir.path, {"checkout", "-q", "-b", "release/1.3"});
    version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT(version->kind == VersionKind::rc);

    git(dir.path, {"checkout", "-q", "--detach"});
    auto head = repo.head();
    ASSERT(head.has_value() && head->has_value());
    ASSERT(!(*head)->branch.has_value());
    version = resolver.resolve();
    ASSERT(version.has_value());
    ASSERT(version->kind == VersionKind::dev);
}

void test_git_skips_malformed_tags() {
    TempDir dir("git");
    git(dir.path, {"init", "-q"});
    commit_file(dir.path, "README", "one\n");
    git(dir.path, {"tag", "1.2.3"});
    commit_file(dir.path, "README", "two\n");
    git(dir.path, {"tag", "01.5.0"});
    git(dir.path, {"tag", "1.2.3.4"});

    GitRepositoryState repo(dir.path);
    auto tag = repo.nearest_tag();
    ASSERT(tag.has_value() && tag->has_value());
    ASSERT((*tag)->version == (SemVer{1, 2, 3}));
    ASSERT_EQ((*tag)->distance, 1u);
}

void test_release_mode_names() {
    ASSERT(parse_release_mode("auto") == ReleaseMode::automatic);
    ASSERT(parse_release_mode("rc") == ReleaseMode::release_candidate);
    ASSERT(parse_release_mode("dev") == ReleaseMode::development);
    ASSERT(!parse_release_mode("nightly"));
}

int main() {
    std::cout << "genesis version resolver tests\n";

    TEST(semver_parse);
    TEST(clean_checkout_at_tag_is_stable);
    TEST(dirty_tree_on_feature_branch_is_dev);
    TEST(dirty_tree_at_tag_is_not_stable);
    TEST(resolutions_differ_only_in_timestamp);
    TEST(release_branch_is_rc);
    TEST(explicit_release_modes);
    TEST(no_tag_uses_zero_base);
    TEST(empty_repository_is_undetermined);
    TEST(short_commit_is_undetermined);
    TEST(release_mode_names);
    TEST(git_empty_repository);
    TEST(git_not_a_repository);
    TEST(git_tagged_commit);
    TEST(git_dirty_tree);
    TEST(git_distance_and_branches);
    TEST(git_skips_malformed_tags);

    return TEST_SUMMARY("test_version");
}
