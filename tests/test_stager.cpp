// test_stager.cpp - Tests for dependency staging

#include "genesis/stager.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <vector>

using namespace genesis;

namespace {

struct StagerFixture {
    TempDir dir{"stager"};
    fs::path config_dir = dir.path / "project" / "genesis";
    fs::path app_dir = dir.path / "project" / "app";
    fs::path stage_root = dir.path / "work" / "stage";

    StagerFixture() {
        fs::create_directories(config_dir);
        write_file(app_dir / "bin" / "run.sh", "#!/bin/sh\necho run\n");
        write_file(app_dir / "etc" / "app.conf", "port=8080\n");
        write_file(dir.path / "project" / "motd", "welcome\n");
    }

    DependencyStager stager() const {
        return DependencyStager(config_dir, stage_root);
    }

    static std::vector<Dependency> deps() {
        return {{.dst = "opt/app", .src = "../app"}, {.dst = "etc/motd", .src = "../motd"}};
    }
};

std::vector<std::pair<std::string, std::string>> snapshot(const fs::path &root) {
    std::vector<std::pair<std::string, std::string>> files;
    for (const auto &entry : fs::recursive_directory_iterator(root)) {
        if (entry.is_regular_file())
            files.emplace_back(fs::relative(entry.path(), root).generic_string(), read_file(entry.path()));
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace

void test_stage_directory_and_file() {
    StagerFixture fx;
    auto staged = fx.stager().stage(StagerFixture::deps());
    ASSERT(staged.has_value());
    ASSERT_EQ(*staged, fx.stage_root);

    ASSERT_EQ(read_file(fx.stage_root / "opt/app/bin/run.sh"), "#!/bin/sh\necho run\n");
    ASSERT_EQ(read_file(fx.stage_root / "opt/app/etc/app.conf"), "port=8080\n");
    ASSERT(fs::is_regular_file(fx.stage_root / "etc/motd"));
    ASSERT_EQ(read_file(fx.stage_root / "etc/motd"), "welcome\n");
}

void test_restaging_is_identical() {
    StagerFixture fx;
    ASSERT(fx.stager().stage(StagerFixture::deps()).has_value());
    const auto first = snapshot(fx.stage_root);

    ASSERT(fx.stager().stage(StagerFixture::deps()).has_value());
    ASSERT(snapshot(fx.stage_root) == first);
}

void test_restaging_restores_deleted_file() {
    StagerFixture fx;
    ASSERT(fx.stager().stage(StagerFixture::deps()).has_value());
    const auto first = snapshot(fx.stage_root);

    fs::remove(fx.stage_root / "opt/app/etc/app.conf");
    ASSERT(fx.stager().stage(StagerFixture::deps()).has_value());
    ASSERT(fs::exists(fx.stage_root / "opt/app/etc/app.conf"));
    ASSERT(snapshot(fx.stage_root) == first);
}

void test_stale_files_are_cleared() {
    StagerFixture fx;
    write_file(fx.stage_root / "leftover/partial.bin", "junk");

    ASSERT(fx.stager().stage(StagerFixture::deps()).has_value());
    ASSERT(!fs::exists(fx.stage_root / "leftover"));
}

void test_symlinks_stay_links() {
    StagerFixture fx;
    fs::create_symlink("etc/app.conf", fx.app_dir / "config");

    ASSERT(fx.stager().stage(StagerFixture::deps()).has_value());
    const fs::path staged = fx.stage_root / "opt/app/config";
    ASSERT(fs::is_symlink(fs::symlink_status(staged)));
    ASSERT_EQ(fs::read_symlink(staged), fs::path("etc/app.conf"));
}

void test_missing_source_touches_nothing() {
    StagerFixture fx;
    write_file(fx.stage_root / "marker", "keep");

    auto deps = StagerFixture::deps();
    deps.push_back({.dst = "opt/missing", .src = "../does-not-exist"});

    auto staged = fx.stager().stage(deps);
    ASSERT(!staged.has_value());
    ASSERT(staged.error().kind == ErrorKind::DependencyMissing);
    ASSERT(staged.error().message.find("does-not-exist") != std::string::npos);
    ASSERT_EQ(read_file(fx.stage_root / "marker"), "keep");
    ASSERT(!fs::exists(fx.stage_root / "opt"));
}

void test_sources_resolve_against_config_dir() {
    StagerFixture fx;
    // A relative path that would only resolve from the current directory.
    const fs::path cwd = fs::current_path();
    fs::current_path(fx.dir.path);
    auto staged = fx.stager().stage({{.dst = "opt/app", .src = "project/app"}});
    fs::current_path(cwd);

    ASSERT(!staged.has_value());
    ASSERT(staged.error().kind == ErrorKind::DependencyMissing);
}

void test_no_dependencies() {
    StagerFixture fx;
    auto staged = fx.stager().stage({});
    ASSERT(staged.has_value());
    ASSERT(fs::is_directory(fx.stage_root));
    ASSERT(fs::is_empty(fx.stage_root));
}

int main() {
    std::cout << "genesis dependency stager tests\n";

    TEST(stage_directory_and_file);
    TEST(restaging_is_identical);
    TEST(restaging_restores_deleted_file);
    TEST(stale_files_are_cleared);
    TEST(symlinks_stay_links);
    TEST(missing_source_touches_nothing);
    TEST(sources_resolve_against_config_dir);
    TEST(no_dependencies);

    return TEST_SUMMARY("test_stager");
}
