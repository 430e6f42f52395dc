// test_params.cpp - Tests for per-image parameter merging

#include "genesis/params.hpp"

#include "test_support.hpp"

#include <cstdlib>

using namespace genesis;

namespace {

ImageSpec demo_image() {
    ImageSpec image;
    image.name = "demo";
    image.format = ImageFormat::qcow2;
    image.profile = Profile::ubuntu_22;
    return image;
}

} // namespace

void test_defaults_follow_profile() {
    ImageParameterMerger merger{EnvironmentSnapshot{}};
    const auto bag = merger.merge(demo_image());

    ASSERT(bag.profile == Profile::ubuntu_22);
    ASSERT(bag.format == ImageFormat::qcow2);
    ASSERT_EQ(bag.variables.at("disk_size"), "10G");
    ASSERT_EQ(bag.variables.at("iso_url"), std::string(traits(Profile::ubuntu_22).iso_url));
    ASSERT_EQ(bag.variables.at("ssh_username"), std::string(traits(Profile::ubuntu_22).ssh_username));
    ASSERT(!bag.variables.contains("developer_keys"));
    ASSERT(bag.environment.empty());
    ASSERT(bag.unset_envs.empty());
}

void test_override_replaces_default() {
    auto image = demo_image();
    image.overrides["disk_size"] = "20G";
    image.overrides["extra_packages"] = "curl jq";

    ImageParameterMerger merger{EnvironmentSnapshot{}};
    const auto bag = merger.merge(image);
    ASSERT_EQ(bag.variables.at("disk_size"), "20G");
    ASSERT_EQ(bag.variables.at("extra_packages"), "curl jq");
    ASSERT_EQ(bag.variables.at("memory"), "2048");
}

void test_merge_is_pure() {
    auto image = demo_image();
    image.overrides["memory"] = "4096";
    image.envs = {"HTTP_PROXY"};
    const auto before = image;

    ImageParameterMerger merger{EnvironmentSnapshot(std::map<std::string, std::string>{{"HTTP_PROXY", "http://proxy:3128"}})};
    const auto first = merger.merge(image);
    const auto second = merger.merge(image);
    ASSERT(first == second);
    ASSERT(image == before);
}

void test_envs_forward_set_and_report_unset() {
    auto image = demo_image();
    image.envs = {"HTTP_PROXY", "NO_SUCH_VARIABLE", "EMPTY"};

    ImageParameterMerger merger{EnvironmentSnapshot({{"HTTP_PROXY", "http://proxy:3128"}, {"EMPTY", ""}})};
    const auto bag = merger.merge(image);
    ASSERT_EQ(bag.environment.size(), 2u);
    ASSERT_EQ(bag.environment.at("HTTP_PROXY"), "http://proxy:3128");
    ASSERT_EQ(bag.environment.at("EMPTY"), "");
    ASSERT_EQ(bag.unset_envs.size(), 1u);
    ASSERT_EQ(bag.unset_envs.front(), "NO_SUCH_VARIABLE");
}

void test_developer_key_is_injected() {
    ImageParameterMerger merger{EnvironmentSnapshot{}, std::string("ssh-ed25519 AAAA dev@host")};
    auto bag = merger.merge(demo_image());
    ASSERT_EQ(bag.variables.at("developer_keys"), "ssh-ed25519 AAAA dev@host");

    // an explicit override still wins
    auto image = demo_image();
    image.overrides["developer_keys"] = "";
    bag = merger.merge(image);
    ASSERT_EQ(bag.variables.at("developer_keys"), "");
}

void test_environment_capture() {
    ::setenv("GENESIS_TEST_CAPTURE", "captured=value", 1);
    const auto env = EnvironmentSnapshot::capture();
    ::unsetenv("GENESIS_TEST_CAPTURE");

    ASSERT(env.get("GENESIS_TEST_CAPTURE") == std::optional<std::string>("captured=value"));
    ASSERT(!EnvironmentSnapshot::capture().get("GENESIS_TEST_CAPTURE"));
}

int main() {
    std::cout << "genesis parameter merger tests\n";

    TEST(defaults_follow_profile);
    TEST(override_replaces_default);
    TEST(merge_is_pure);
    TEST(envs_forward_set_and_report_unset);
    TEST(developer_key_is_injected);
    TEST(environment_capture);

    return TEST_SUMMARY("test_params");
}
