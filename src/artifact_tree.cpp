#include "artifact_tree.h"

#include <stdexcept>
#include <system_error>
#include <utility>

namespace rtpack {

artifact_tree::artifact_tree(entries_t entries) : entries_{ std::move(entries) } {}

artifact_tree artifact_tree::scan(std::filesystem::path const &root) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    throw std::runtime_error("artifact_tree: not a directory: " + root.string());
  }

  entries_t entries;
  std::filesystem::recursive_directory_iterator it{ root, ec };
  if (ec) {
    throw std::runtime_error("artifact_tree: failed to scan " + root.string() + ": " +
                             ec.message());
  }

  for (; it != std::filesystem::recursive_directory_iterator{}; it.increment(ec)) {
    if (ec) {
      throw std::runtime_error("artifact_tree: failed to scan " + root.string() + ": " +
                               ec.message());
    }
    if (!it->is_regular_file(ec)) { continue; }

    auto const rel{ std::filesystem::relative(it->path(), root, ec) };
    if (ec) { throw std::system_error(ec, "artifact_tree: relative path"); }
    entries.emplace(rel.generic_string(), it->file_size(ec));
  }
  if (ec) {
    throw std::runtime_error("artifact_tree: failed to scan " + root.string() + ": " +
                             ec.message());
  }

  return artifact_tree{ std::move(entries) };
}

artifact_tree artifact_tree::from_paths(std::vector<std::string> const &paths) {
  entries_t entries;
  for (auto const &path : paths) { entries.emplace(path, 0); }
  return artifact_tree{ std::move(entries) };
}

bool artifact_tree::contains(std::string_view path) const {
  return entries_.find(path) != entries_.end();
}

std::set<std::string> artifact_tree::objects_under(std::string_view prefix) const {
  std::set<std::string> out;
  for (auto const &path : select(prefix, [](std::string_view name) {
         return name.ends_with(".o");
       })) {
    out.insert(path);
  }
  return out;
}

}  // namespace rtpack
