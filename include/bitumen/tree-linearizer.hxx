#pragma once

#include <filesystem>
#include <vector>

namespace bitumen {
/**
 * @struct TreeNode
 * @brief One object discovered while walking a subtree.
 */
struct TreeNode {
  /** @enum Type Classification made without following symbolic links. */
  enum class Type { File, Directory, Other };

  std::filesystem::path path;
  Type type = Type::Other;

  bool is_directory() const noexcept { return type == Type::Directory; }
};

/**
 * @brief Classify a single path without following symbolic links.
 *
 * @throws std::filesystem::filesystem_error if @p path does not exist.
 */
TreeNode inspect(const std::filesystem::path &path);

/**
 * @brief Walk a subtree in depth-first pre-order.
 *
 * The root comes first and every directory is followed by its descendants.
 * Siblings are visited in ascending path order, so a given tree always
 * yields the same sequence. Symbolic links are reported as Type::Other and
 * never followed. The walk uses an explicit stack, so deep trees do not grow
 * the call stack.
 *
 * @param root Path of the subtree root; it is included in the result.
 * @return std::vector<TreeNode> Every visited object in pre-order.
 * @throws std::filesystem::filesystem_error if the root does not exist or a
 * directory cannot be listed.
 */
std::vector<TreeNode> collect_tree(const std::filesystem::path &root);

/**
 * @brief Order a subtree the way archives store it.
 *
 * All directories come first, then every other object; each group keeps the
 * pre-order of collect_tree().
 */
std::vector<TreeNode> linearize_tree(const std::filesystem::path &root);
} // namespace bitumen
