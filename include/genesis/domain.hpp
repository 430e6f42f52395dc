#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace genesis {

enum class ImageFormat { raw, qcow2 };

enum class Profile { ubuntu_22, ubuntu_24 };

struct FormatTraits {
    ImageFormat format;
    std::string_view name;
    std::string_view extension;
};

struct ProfileTraits {
    Profile profile;
    std::string_view name;
    std::string_view iso_url;
    std::string_view iso_checksum;
    std::string_view ssh_username;
};

const FormatTraits &traits(ImageFormat format);
const ProfileTraits &traits(Profile profile);

std::optional<ImageFormat> parse_format(std::string_view name);
std::optional<Profile> parse_profile(std::string_view name);

struct Dependency {
    std::filesystem::path dst; // relative to the image root
    std::filesystem::path src; // as written, relative to the config directory

    bool operator==(const Dependency &) const = default;
};

struct ImageSpec {
    std::string name;
    ImageFormat format = ImageFormat::raw;
    Profile profile = Profile::ubuntu_24;
    std::optional<std::filesystem::path> script;
    std::vector<std::string> envs;
    std::map<std::string, std::string> overrides;

    bool operator==(const ImageSpec &) const = default;

    std::string file_name() const;
};

struct Element {
    std::optional<std::string> name;
    std::vector<ImageSpec> images;
    std::optional<std::filesystem::path> manifest;
    std::vector<std::filesystem::path> artifacts;

    bool operator==(const Element &) const = default;
};

/**
 * @brief Parsed `genesis/genesis.yaml`.
 *
 * Immutable once returned by the loader. `config_dir` anchors every relative
 * path in the model and is not part of the serialized form.
 */
struct ConfigModel {
    std::filesystem::path config_dir;
    std::vector<Dependency> deps;
    std::vector<Element> elements;

    bool operator==(const ConfigModel &) const = default;

    std::filesystem::path resolve(const std::filesystem::path &relative) const {
        return (config_dir / relative).lexically_normal();
    }
};

/**
 * @brief Directory name an element's output lands in: its name, or its index.
 */
std::string element_key(const Element &element, size_t index);

} // namespace genesis
