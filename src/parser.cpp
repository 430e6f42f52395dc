#include "genesis/parser.hpp"

#include "genesis/logging.hpp"
#include "genesis/utility.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <unordered_set>

namespace genesis {

namespace {

// Files the collector writes at the top of the output tree.
const std::unordered_set<std::string> RESERVED_OUTPUT_NAMES{"version", "build-summary.json"};

// Builder settings that decide where the image lands; an override would desync the artifact path.
const std::unordered_set<std::string> RESERVED_OVERRIDES{"format", "vm_name", "output_directory"};

Result<std::string> scalar(const YAML::Node &node, const std::string &where) {
    if (!node || !node.IsScalar()) {
        return fail(ErrorKind::ConfigMalformed, "{} must be a scalar", where);
    }
    return node.Scalar();
}

Result<std::string> required_scalar(const YAML::Node &map, std::string_view key, const std::string &where) {
    const YAML::Node node = map[std::string(key)];
    if (!node || node.IsNull()) {
        return fail(ErrorKind::ConfigMalformed, "{}.{} is required", where, key);
    }
    auto value = scalar(node, std::format("{}.{}", where, key));
    if (value && value->empty()) {
        return fail(ErrorKind::ConfigMalformed, "{}.{} must not be empty", where, key);
    }
    return value;
}

Result<std::vector<std::string>> scalar_list(const YAML::Node &map, std::string_view key, const std::string &where) {
    std::vector<std::string> values;
    const YAML::Node node = map[std::string(key)];
    if (!node || node.IsNull())
        return values;
    if (!node.IsSequence()) {
        return fail(ErrorKind::ConfigMalformed, "{}.{} must be a list", where, key);
    }
    for (size_t i = 0; i < node.size(); ++i) {
        auto value = scalar(node[i], std::format("{}.{}[{}]", where, key, i));
        if (!value)
            return std::unexpected(value.error());
        values.push_back(std::move(*value));
    }
    return values;
}

Result<std::filesystem::path> parse_dst(const std::string &raw, const std::string &where) {
    std::filesystem::path dst(raw);
    // Image paths are absolute in practice; they stage under the image root.
    if (dst.has_root_path())
        dst = dst.relative_path();
    dst = dst.lexically_normal();
    if (!dst.empty() && !dst.has_filename())
        dst = dst.parent_path();

    if (dst.empty() || dst == ".") {
        return fail(ErrorKind::ConfigMalformed, "{}.dst must name a path below the image root", where);
    }
    for (const auto &part : dst) {
        if (part == "..") {
            return fail(ErrorKind::ConfigMalformed, "{}.dst must not leave the image root: {}", where, raw);
        }
    }
    return dst;
}

Result<Dependency> parse_dependency(const YAML::Node &node, const std::string &where) {
    if (!node.IsMap()) {
        return fail(ErrorKind::ConfigMalformed, "{} must be a mapping", where);
    }
    auto dst_raw = required_scalar(node, "dst", where);
    if (!dst_raw)
        return std::unexpected(dst_raw.error());
    auto dst = parse_dst(*dst_raw, where);
    if (!dst)
        return std::unexpected(dst.error());

    // Either `src: <path>` or the long form `path: {src: <path>}`.
    const YAML::Node path = node["path"];
    auto src = (path && path.IsMap()) ? required_scalar(path, "src", where + ".path")
                                      : required_scalar(node, "src", where);
    if (!src)
        return std::unexpected(src.error());

    return Dependency{.dst = std::move(*dst), .src = std::filesystem::path(*src)};
}

bool valid_image_name(const std::string &name) {
    return name != "." && name != ".." && name.find('/') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

Result<ImageSpec> parse_image(const YAML::Node &node, const std::string &where) {
    if (!node.IsMap()) {
        return fail(ErrorKind::ConfigMalformed, "{} must be a mapping", where);
    }
    ImageSpec image;

    auto name = required_scalar(node, "name", where);
    if (!name)
        return std::unexpected(name.error());
    if (!valid_image_name(*name)) {
        return fail(ErrorKind::ConfigMalformed, "{}.name is not usable as a file name: {}", where, *name);
    }
    image.name = std::move(*name);

    auto format = required_scalar(node, "format", where);
    if (!format)
        return std::unexpected(format.error());
    if (auto parsed = parse_format(*format)) {
        image.format = *parsed;
    } else {
        return fail(ErrorKind::ConfigMalformed, "{}.format: unsupported image format '{}'", where, *format);
    }

    auto profile = required_scalar(node, "profile", where);
    if (!profile)
        return std::unexpected(profile.error());
    if (auto parsed = parse_profile(*profile)) {
        image.profile = *parsed;
    } else {
        return fail(ErrorKind::ConfigMalformed, "{}.profile: unsupported profile '{}'", where, *profile);
    }

    if (const YAML::Node script = node["script"]; script && !script.IsNull()) {
        auto value = scalar(script, where + ".script");
        if (!value)
            return std::unexpected(value.error());
        image.script = std::filesystem::path(*value);
    }

    auto envs = scalar_list(node, "envs", where);
    if (!envs)
        return std::unexpected(envs.error());
    image.envs = std::move(*envs);

    if (const YAML::Node overrides = node["override"]; overrides && !overrides.IsNull()) {
        if (!overrides.IsMap()) {
            return fail(ErrorKind::ConfigMalformed, "{}.override must be a mapping", where);
        }
        for (const auto &entry : overrides) {
            const std::string key = entry.first.as<std::string>();
            if (RESERVED_OVERRIDES.contains(key)) {
                return fail(ErrorKind::ConfigMalformed, "{}.override.{} cannot be overridden", where, key);
            }
            auto value = scalar(entry.second, std::format("{}.override.{}", where, key));
            if (!value)
                return std::unexpected(value.error());
            image.overrides[key] = std::move(*value);
        }
    }

    return image;
}

Result<Element> parse_element(const YAML::Node &node, const std::string &where) {
    if (!node.IsMap()) {
        return fail(ErrorKind::ConfigMalformed, "{} must be a mapping", where);
    }
    Element element;

    if (const YAML::Node name = node["name"]; name && !name.IsNull()) {
        auto value = scalar(name, where + ".name");
        if (!value)
            return std::unexpected(value.error());
        if (!valid_image_name(*value)) {
            return fail(ErrorKind::ConfigMalformed, "{}.name is not usable as a directory name: {}", where, *value);
        }
        element.name = std::move(*value);
    }

    const YAML::Node images = node["images"];
    if (!images || !images.IsSequence() || images.size() == 0) {
        return fail(ErrorKind::ConfigMalformed, "{}.images must be a non-empty list", where);
    }
    for (size_t i = 0; i < images.size(); ++i) {
        auto image = parse_image(images[i], std::format("{}.images[{}]", where, i));
        if (!image)
            return std::unexpected(image.error());
        element.images.push_back(std::move(*image));
    }

    if (const YAML::Node manifest = node["manifest"]; manifest && !manifest.IsNull()) {
        auto value = scalar(manifest, where + ".manifest");
        if (!value)
            return std::unexpected(value.error());
        element.manifest = std::filesystem::path(*value);
    }

    auto artifacts = scalar_list(node, "artifacts", where);
    if (!artifacts)
        return std::unexpected(artifacts.error());
    for (auto &artifact : *artifacts)
        element.artifacts.emplace_back(std::move(artifact));

    return element;
}

// Images, manifest and artifacts all land flat in the element directory.
Result<void> check_element_outputs(const Element &element, const std::string &key, const std::string &where) {
    if (RESERVED_OUTPUT_NAMES.contains(key)) {
        return fail(ErrorKind::ConfigMalformed, "{}: element output directory '{}' is reserved", where, key);
    }

    std::unordered_set<std::string> files;
    for (const auto &image : element.images) {
        if (!files.insert(image.file_name()).second) {
            return fail(ErrorKind::ConfigMalformed, "{}: '{}' is produced twice in the element directory", where,
                        image.file_name());
        }
    }
    if (element.manifest && !files.insert(element.manifest->filename().string()).second) {
        return fail(ErrorKind::ConfigMalformed, "{}.manifest: '{}' collides with another file of the element",
                    where, element.manifest->filename().string());
    }
    for (size_t i = 0; i < element.artifacts.size(); ++i) {
        const std::string name = element.artifacts[i].filename().string();
        if (name.empty()) {
            return fail(ErrorKind::ConfigMalformed, "{}.artifacts[{}] must name a file", where, i);
        }
        if (!files.insert(name).second) {
            return fail(ErrorKind::ConfigMalformed, "{}.artifacts[{}]: '{}' collides with another file of the element",
                        where, i, name);
        }
    }
    return {};
}

Result<ConfigModel> parse_document(const YAML::Node &document, const std::filesystem::path &config_dir) {
    if (!document.IsMap()) {
        return fail(ErrorKind::ConfigMalformed, "document root must be a mapping");
    }

    const YAML::Node build = document["build"];
    const bool nested = build && build.IsMap();
    const YAML::Node root = nested ? build : document;
    const std::string prefix = nested ? "build." : "";

    ConfigModel model;
    model.config_dir = config_dir;

    if (const YAML::Node deps = root["deps"]; deps && !deps.IsNull()) {
        if (!deps.IsSequence()) {
            return fail(ErrorKind::ConfigMalformed, "{}deps must be a list", prefix);
        }
        for (size_t i = 0; i < deps.size(); ++i) {
            auto dep = parse_dependency(deps[i], std::format("{}deps[{}]", prefix, i));
            if (!dep)
                return std::unexpected(dep.error());
            model.deps.push_back(std::move(*dep));
        }
    }

    const YAML::Node elements = root["elements"];
    if (!elements || !elements.IsSequence() || elements.size() == 0) {
        return fail(ErrorKind::ConfigMalformed, "{}elements must be a non-empty list", prefix);
    }
    std::unordered_set<std::string> image_names;
    std::unordered_set<std::string> element_keys;
    for (size_t i = 0; i < elements.size(); ++i) {
        const std::string where = std::format("{}elements[{}]", prefix, i);
        auto element = parse_element(elements[i], where);
        if (!element)
            return std::unexpected(element.error());

        const std::string key = element_key(*element, i);
        if (!element_keys.insert(key).second) {
            return fail(ErrorKind::ConfigMalformed, "{}: duplicate element output directory '{}'", where, key);
        }
        if (auto res = check_element_outputs(*element, key, where); !res)
            return std::unexpected(res.error());
        for (const auto &image : element->images) {
            if (!image_names.insert(image.name).second) {
                return fail(ErrorKind::ConfigMalformed, "{}: duplicate image name '{}'", where, image.name);
            }
        }
        model.elements.push_back(std::move(*element));
    }

    return model;
}

} // namespace

std::filesystem::path config_path(const std::filesystem::path &project_root) {
    return project_root / CONFIG_RELATIVE_PATH;
}

Result<ConfigModel> parse_config(std::string_view text, const std::filesystem::path &config_dir) {
    YAML::Node document;
    try {
        document = YAML::Load(std::string(text));
    } catch (const YAML::Exception &e) {
        return fail(ErrorKind::ConfigMalformed, "invalid YAML: {}", e.what());
    }

    try {
        return parse_document(document, config_dir);
    } catch (const YAML::Exception &e) {
        return fail(ErrorKind::ConfigMalformed, "{}", e.what());
    }
}

Result<ConfigModel> load_config(const std::filesystem::path &project_root) {
    const auto path = config_path(project_root);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return fail(ErrorKind::ConfigNotFound, "no configuration at {}", path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return fail(ErrorKind::ConfigNotFound, "cannot open {}", path.string());
    }
    std::ostringstream content;
    content << file.rdbuf();

    auto model = parse_config(content.str(), path.parent_path());
    if (!model) {
        return fail(model.error().kind, "{}: {}", path.string(), model.error().message);
    }
    GENESIS_LOG_DEBUG("configuration loaded", {str_field("path", path.string()),
                                               int_field("elements", static_cast<std::int64_t>(model->elements.size())),
                                               int_field("deps", static_cast<std::int64_t>(model->deps.size()))});
    return model;
}

std::string emit_config(const ConfigModel &model) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "build" << YAML::Value << YAML::BeginMap;

    out << YAML::Key << "deps" << YAML::Value << YAML::BeginSeq;
    for (const auto &dep : model.deps) {
        out << YAML::BeginMap;
        out << YAML::Key << "dst" << YAML::Value << ("/" + dep.dst.generic_string());
        out << YAML::Key << "src" << YAML::Value << dep.src.generic_string();
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "elements" << YAML::Value << YAML::BeginSeq;
    for (const auto &element : model.elements) {
        out << YAML::BeginMap;
        if (element.name) {
            out << YAML::Key << "name" << YAML::Value << YAML::DoubleQuoted << *element.name;
        }

        out << YAML::Key << "images" << YAML::Value << YAML::BeginSeq;
        for (const auto &image : element.images) {
            out << YAML::BeginMap;
            out << YAML::Key << "name" << YAML::Value << YAML::DoubleQuoted << image.name;
            out << YAML::Key << "format" << YAML::Value << std::string(traits(image.format).name);
            out << YAML::Key << "profile" << YAML::Value << std::string(traits(image.profile).name);
            if (image.script) {
                out << YAML::Key << "script" << YAML::Value << image.script->generic_string();
            }
            if (!image.envs.empty()) {
                out << YAML::Key << "envs" << YAML::Value << YAML::BeginSeq;
                for (const auto &env : image.envs)
                    out << env;
                out << YAML::EndSeq;
            }
            if (!image.overrides.empty()) {
                out << YAML::Key << "override" << YAML::Value << YAML::BeginMap;
                for (const auto &[key, value] : image.overrides)
                    out << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << value;
                out << YAML::EndMap;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;

        if (element.manifest) {
            out << YAML::Key << "manifest" << YAML::Value << element.manifest->generic_string();
        }
        if (!element.artifacts.empty()) {
            out << YAML::Key << "artifacts" << YAML::Value << YAML::BeginSeq;
            for (const auto &artifact : element.artifacts)
                out << artifact.generic_string();
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    out << YAML::EndMap;
    return std::string(out.c_str());
}

} // namespace genesis
