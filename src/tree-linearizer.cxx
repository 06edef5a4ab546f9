#include <bitumen/tree-linearizer.hxx>

#include <boost/log/trivial.hpp>

#include <algorithm>
#include <iterator>
#include <system_error>

namespace bitumen {
namespace {
namespace fs = std::filesystem;

/**
 * @brief List the direct children of a directory in ascending path order.
 */
std::vector<fs::path> sorted_children(const fs::path &dir) {
  std::vector<fs::path> children;
  for (const auto &entry : fs::directory_iterator(dir))
    children.push_back(entry.path());
  std::sort(children.begin(), children.end());
  return children;
}
} // unnamed namespace

TreeNode inspect(const fs::path &path) {
  const auto status = fs::symlink_status(path);
  switch (status.type()) {
  case fs::file_type::not_found:
    throw fs::filesystem_error(
        "cannot archive", path,
        std::make_error_code(std::errc::no_such_file_or_directory));
  case fs::file_type::regular:
    return {path, TreeNode::Type::File};
  case fs::file_type::directory:
    return {path, TreeNode::Type::Directory};
  default:
    return {path, TreeNode::Type::Other};
  }
}

std::vector<TreeNode> collect_tree(const fs::path &root) {
  std::vector<TreeNode> nodes;
  std::vector<fs::path> pending{root};

  while (!pending.empty()) {
    auto node = inspect(pending.back());
    pending.pop_back();

    if (node.is_directory()) {
      auto children = sorted_children(node.path);
      // Reversed so the smallest child is popped first.
      std::move(children.rbegin(), children.rend(),
                std::back_inserter(pending));
    }
    nodes.push_back(std::move(node));
  }

  BOOST_LOG_TRIVIAL(debug) << "collected " << nodes.size() << " objects under "
                           << root;
  return nodes;
}

std::vector<TreeNode> linearize_tree(const fs::path &root) {
  auto nodes = collect_tree(root);
  std::stable_partition(nodes.begin(), nodes.end(),
                        [](const TreeNode &node) { return node.is_directory(); });
  return nodes;
}
} // namespace bitumen
