#include "genesis/image_builder.hpp"

#include "genesis/logging.hpp"
#include "genesis/process_exec.hpp"

#include <cstdlib>
#include <format>
#include <fstream>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace genesis {

namespace {

using json = nlohmann::json;

// Consumed by provisioners, never passed to the qemu builder block.
const std::set<std::string> PROVISIONER_VARIABLES{"developer_keys"};

constexpr std::string_view DEPS_UPLOAD_DIR = "/tmp/genesis-deps";

// Packer decodes weakly, but typed values keep the template readable.
json typed_value(const std::string &value) {
    if (value == "true" || value == "false")
        return value == "true";

    char *end = nullptr;
    const long long number = std::strtoll(value.c_str(), &end, 10);
    if (!value.empty() && end && *end == '\0')
        return number;

    return value;
}

std::string cloud_init_user_data(const ParameterBag &bag) {
    const auto password = bag.variables.contains("ssh_password") ? bag.variables.at("ssh_password") : "";
    return "#cloud-config\n"
           "password: " +
           password +
           "\n"
           "chpasswd: {expire: False}\n"
           "ssh_pwauth: True\n";
}

} // namespace

json render_packer_template(const ResolvedBuildUnit &unit) {
    const ParameterBag &bag = unit.parameters;

    json builder = json::object();
    builder["type"] = "qemu";
    builder["name"] = unit.image.name;
    builder["vm_name"] = unit.image.file_name();
    builder["output_directory"] = unit.build_output().parent_path().string();
    builder["disk_image"] = true;
    builder["cd_label"] = "cidata";
    builder["cd_content"] = {{"meta-data", ""}, {"user-data", cloud_init_user_data(bag)}};
    builder["shutdown_command"] = "sudo shutdown -P now";
    for (const auto &[key, value] : bag.variables) {
        if (!PROVISIONER_VARIABLES.contains(key))
            builder[key] = typed_value(value);
    }
    builder["format"] = std::string(traits(bag.format).name);

    json environment_vars = json::array();
    environment_vars.push_back("GENESIS_VERSION=" + unit.version);
    for (const auto &[name, value] : bag.environment) {
        environment_vars.push_back(name + "=" + value);
    }

    json provisioners = json::array();
    provisioners.push_back({
        {"type", "file"},
        {"source", unit.deps_root.string() + "/"},
        {"destination", std::string(DEPS_UPLOAD_DIR)},
    });
    provisioners.push_back({
        {"type", "shell"},
        {"inline", json::array({std::format("sudo cp -a {}/. /", DEPS_UPLOAD_DIR),
                                 std::format("sudo rm -rf {}", DEPS_UPLOAD_DIR)})},
    });

    if (auto it = bag.variables.find("developer_keys"); it != bag.variables.end() && !it->second.empty()) {
        const std::string user = bag.variables.contains("ssh_username") ? bag.variables.at("ssh_username") : "ubuntu";
        provisioners.push_back({
            {"type", "shell"},
            {"environment_vars", json::array({"GENESIS_DEVELOPER_KEYS=" + it->second})},
            {"inline",
             json::array({std::format("mkdir -p /home/{}/.ssh", user),
                          std::format("printf '%s\\n' \"$GENESIS_DEVELOPER_KEYS\" >> /home/{}/.ssh/authorized_keys", user),
                          std::format("chmod 600 /home/{}/.ssh/authorized_keys", user)})},
        });
    }

    if (unit.script) {
        provisioners.push_back({
            {"type", "shell"},
            {"script", unit.script->string()},
            {"environment_vars", environment_vars},
            {"execute_command", "sudo -E sh -c '{{ .Vars }} {{ .Path }}'"},
        });
    }

    return json{{"builders", json::array({builder})}, {"provisioners", provisioners}};
}

PackerImageBuilder::PackerImageBuilder(PackerOptions options) : options_(std::move(options)) {
}

Result<void> PackerImageBuilder::build(const ResolvedBuildUnit &unit, const StopPredicate &should_stop) {
    const fs::path template_path = unit.work_dir / "template.json";
    {
        std::ofstream out(template_path, std::ios::trunc);
        out << render_packer_template(unit).dump(4);
        if (!out) {
            return fail(ErrorKind::BuildFailed, "image {}: cannot write {}", unit.image.name, template_path.string());
        }
    }

    if (!unit.parameters.unset_envs.empty()) {
        for (const auto &name : unit.parameters.unset_envs) {
            GENESIS_LOG_WARN("forwarded variable is not set", {str_field("image", unit.image.name), str_field("env", name)});
        }
    }

    ProcessOptions process_options{
        .working_dir = unit.work_dir,
        .env = unit.parameters.environment,
        .timeout = options_.timeout,
        .should_stop = should_stop,
    };
    auto res = process_exec({options_.packer, "build", "-force", "-color=false", template_path.string()},
                            process_options);
    if (!res) {
        if (res.error().kind == ErrorKind::Cancelled)
            return std::unexpected(res.error());
        return fail(ErrorKind::BuildFailed, "image {}: {}", unit.image.name, res.error().message);
    }
    if (*res != 0) {
        return fail(ErrorKind::BuildFailed, "image {}: {} exited with status {}", unit.image.name, options_.packer, *res);
    }

    std::error_code ec;
    if (!fs::is_regular_file(unit.build_output(), ec)) {
        return fail(ErrorKind::BuildFailed, "image {}: builder succeeded but produced no {}", unit.image.name,
                    unit.build_output().string());
    }
    return {};
}

} // namespace genesis
