#pragma once

#include "genesis/domain.hpp"
#include "genesis/utility.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace genesis {

/// Location of the configuration file relative to the project root.
inline constexpr std::string_view CONFIG_RELATIVE_PATH = "genesis/genesis.yaml";

std::filesystem::path config_path(const std::filesystem::path &project_root);

/**
 * @brief Loads and validates `<project_root>/genesis/genesis.yaml`.
 *
 * Both the flat layout (`deps`/`elements` at the top) and the nested
 * `build:` layout are accepted. Unknown keys are ignored.
 *
 * @return The model, `ConfigNotFound` if the file is absent, or
 *         `ConfigMalformed` naming the offending field.
 */
Result<ConfigModel> load_config(const std::filesystem::path &project_root);

/**
 * @brief Parses configuration text. Relative paths in the result are anchored
 *        at @p config_dir.
 */
Result<ConfigModel> parse_config(std::string_view text, const std::filesystem::path &config_dir);

/**
 * @brief Serializes a model back to YAML in the nested `build:` layout.
 */
std::string emit_config(const ConfigModel &model);

} // namespace genesis
