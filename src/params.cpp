#include "genesis/params.hpp"

#include <cstring>
#include <utility>

extern char **environ;

namespace genesis {

EnvironmentSnapshot EnvironmentSnapshot::capture() {
    std::map<std::string, std::string> values;
    for (char **entry = environ; entry && *entry; ++entry) {
        const char *eq = std::strchr(*entry, '=');
        if (!eq)
            continue;
        values.emplace(std::string(static_cast<const char *>(*entry), eq), std::string(eq + 1));
    }
    return EnvironmentSnapshot(std::move(values));
}

std::optional<std::string> EnvironmentSnapshot::get(const std::string &name) const {
    if (auto it = values_.find(name); it != values_.end())
        return it->second;
    return std::nullopt;
}

std::map<std::string, std::string> default_parameters(Profile profile, ImageFormat) {
    const auto &os = traits(profile);
    return {
        {"accelerator", "kvm"},
        {"cpus", "2"},
        {"disk_size", "10G"},
        {"headless", "true"},
        {"iso_checksum", std::string(os.iso_checksum)},
        {"iso_url", std::string(os.iso_url)},
        {"memory", "2048"},
        {"ssh_password", std::string(os.ssh_username)},
        {"ssh_timeout", "30m"},
        {"ssh_username", std::string(os.ssh_username)},
    };
}

ImageParameterMerger::ImageParameterMerger(EnvironmentSnapshot env, std::optional<std::string> developer_key)
    : env_(std::move(env)), developer_key_(std::move(developer_key)) {
}

ParameterBag ImageParameterMerger::merge(const ImageSpec &image) const {
    ParameterBag bag;
    bag.profile = image.profile;
    bag.format = image.format;
    bag.variables = default_parameters(image.profile, image.format);

    if (developer_key_)
        bag.variables["developer_keys"] = *developer_key_;

    for (const auto &[key, value] : image.overrides) {
        bag.variables.insert_or_assign(key, value);
    }

    for (const auto &name : image.envs) {
        if (auto value = env_.get(name)) {
            bag.environment.insert_or_assign(name, std::move(*value));
        } else {
            bag.unset_envs.push_back(name);
        }
    }
    return bag;
}

} // namespace genesis
