#pragma once

#include "genesis/utility.hpp"

#include <filesystem>
#include <string_view>

namespace genesis {

/**
 * @brief True when both regular files exist and hold identical bytes.
 */
bool same_contents(const std::filesystem::path &a, const std::filesystem::path &b);

/**
 * @brief Copies @p src to @p dst through a temporary sibling and a rename, so
 *        @p dst is never observed half-written.
 */
Result<void> copy_file_atomic(const std::filesystem::path &src, const std::filesystem::path &dst);

/**
 * @brief Moves @p src to @p dst, falling back to copy + rename across devices.
 */
Result<void> move_file_atomic(const std::filesystem::path &src, const std::filesystem::path &dst);

/**
 * @brief Writes @p content to @p dst (temporary + rename) unless @p dst already
 *        holds exactly that content.
 * @return Whether the file was written.
 */
Result<bool> write_if_changed(const std::filesystem::path &dst, std::string_view content);

} // namespace genesis
