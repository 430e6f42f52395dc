#pragma once

#include "genesis/domain.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace genesis {

/**
 * @brief Immutable copy of process environment variables.
 */
class EnvironmentSnapshot {
public:
    EnvironmentSnapshot() = default;
    explicit EnvironmentSnapshot(std::map<std::string, std::string> values) : values_(std::move(values)) {
    }

    /// Copies the current process environment.
    static EnvironmentSnapshot capture();

    std::optional<std::string> get(const std::string &name) const;

    bool operator==(const EnvironmentSnapshot &) const = default;

private:
    std::map<std::string, std::string> values_;
};

/**
 * @brief Final parameters for one builder invocation.
 */
struct ParameterBag {
    Profile profile = Profile::ubuntu_24;
    ImageFormat format = ImageFormat::raw;
    std::map<std::string, std::string> variables;   ///< Builder settings after overrides.
    std::map<std::string, std::string> environment; ///< Forwarded variables that are set.
    std::vector<std::string> unset_envs;            ///< Forwarded names absent from the snapshot.

    bool operator==(const ParameterBag &) const = default;
};

/**
 * @brief Builder defaults for a profile/format pair, before overrides.
 */
std::map<std::string, std::string> default_parameters(Profile profile, ImageFormat format);

class ImageParameterMerger {
public:
    explicit ImageParameterMerger(EnvironmentSnapshot env, std::optional<std::string> developer_key = std::nullopt);

    /**
     * @brief Defaults, then the developer key, then each override replacing
     *        the whole value under its key. No I/O.
     */
    ParameterBag merge(const ImageSpec &image) const;

private:
    EnvironmentSnapshot env_;
    std::optional<std::string> developer_key_;
};

} // namespace genesis
