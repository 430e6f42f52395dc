#include "genesis/domain.hpp"

#include <array>
#include <format>

namespace genesis {

namespace {

constexpr std::array<FormatTraits, 2> FORMATS{{
    {.format = ImageFormat::raw, .name = "raw", .extension = "raw"},
    {.format = ImageFormat::qcow2, .name = "qcow2", .extension = "qcow2"},
}};

constexpr std::array<ProfileTraits, 2> PROFILES{{
    {.profile = Profile::ubuntu_22,
     .name = "ubuntu_22",
     .iso_url = "https://cloud-images.ubuntu.com/jammy/current/jammy-server-cloudimg-amd64.img",
     .iso_checksum = "file:https://cloud-images.ubuntu.com/jammy/current/SHA256SUMS",
     .ssh_username = "ubuntu"},
    {.profile = Profile::ubuntu_24,
     .name = "ubuntu_24",
     .iso_url = "https://cloud-images.ubuntu.com/noble/current/noble-server-cloudimg-amd64.img",
     .iso_checksum = "file:https://cloud-images.ubuntu.com/noble/current/SHA256SUMS",
     .ssh_username = "ubuntu"},
}};

} // namespace

const FormatTraits &traits(ImageFormat format) {
    return FORMATS[static_cast<size_t>(format)];
}

const ProfileTraits &traits(Profile profile) {
    return PROFILES[static_cast<size_t>(profile)];
}

std::optional<ImageFormat> parse_format(std::string_view name) {
    for (const auto &entry : FORMATS) {
        if (entry.name == name)
            return entry.format;
    }
    return std::nullopt;
}

std::optional<Profile> parse_profile(std::string_view name) {
    for (const auto &entry : PROFILES) {
        if (entry.name == name)
            return entry.profile;
    }
    return std::nullopt;
}

std::string ImageSpec::file_name() const {
    return std::format("{}.{}", name, traits(format).extension);
}

std::string element_key(const Element &element, size_t index) {
    if (element.name && !element.name->empty())
        return *element.name;
    return std::to_string(index);
}

} // namespace genesis
