// fakes.hpp - in-process stand-ins for git and the image builder

#pragma once

#include "genesis/image_builder.hpp"
#include "genesis/version.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <latch>
#include <mutex>
#include <set>
#include <string>
#include <vector>

class FakeRepositoryState : public genesis::RepositoryStateProvider {
public:
    std::optional<genesis::TagInfo> tag;
    std::optional<genesis::HeadState> head_state;

    genesis::Result<std::optional<genesis::TagInfo>> nearest_tag() override {
        return tag;
    }

    genesis::Result<std::optional<genesis::HeadState>> head() override {
        return head_state;
    }

    static FakeRepositoryState tagged(genesis::SemVer version) {
        FakeRepositoryState repo;
        repo.tag = genesis::TagInfo{.version = version, .distance = 0};
        repo.head_state = genesis::HeadState{.commit = "0123456789abcdef0123456789abcdef01234567", .dirty = false,
                                             .branch = std::string("main")};
        return repo;
    }
};

inline genesis::Clock fixed_clock(int64_t epoch_seconds) {
    return [epoch_seconds] {
        return std::chrono::system_clock::time_point(std::chrono::seconds(epoch_seconds));
    };
}

/**
 * Writes `image:<name>` to the unit's build output, or fails for the names in
 * `failing`. With `start_latch` set, every call waits until that many builds
 * have started.
 */
class FakeImageBuilder : public genesis::ImageBuilder {
public:
    std::set<std::string> failing;
    std::latch *start_latch = nullptr;
    std::atomic<int> calls{0};

    genesis::Result<void> build(const genesis::ResolvedBuildUnit &unit,
                                const genesis::StopPredicate &should_stop) override {
        calls++;
        {
            std::lock_guard lock(mtx_);
            built_.push_back(unit.image.name);
            deps_roots_.push_back(unit.deps_root);
        }
        if (start_latch)
            start_latch->arrive_and_wait();

        if (should_stop && should_stop())
            return genesis::fail(genesis::ErrorKind::Cancelled, "image {} cancelled", unit.image.name);
        if (failing.contains(unit.image.name))
            return genesis::fail(genesis::ErrorKind::BuildFailed, "image {}: builder exited with status 1",
                                 unit.image.name);

        std::ofstream out(unit.build_output(), std::ios::binary);
        out << "image:" << unit.image.name;
        return {};
    }

    std::vector<std::string> built() {
        std::lock_guard lock(mtx_);
        return built_;
    }

    std::vector<std::filesystem::path> deps_roots() {
        std::lock_guard lock(mtx_);
        return deps_roots_;
    }

private:
    std::mutex mtx_;
    std::vector<std::string> built_;
    std::vector<std::filesystem::path> deps_roots_;
};
