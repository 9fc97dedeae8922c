#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rtpack {

// Flat view of a build output tree: '/'-separated relative path -> size in bytes.
class artifact_tree {
 public:
  using entries_t = std::map<std::string, std::uint64_t, std::less<>>;

  artifact_tree() = default;
  explicit artifact_tree(entries_t entries);

  // Regular files under `root`, relative to it. Directories and symlinks to
  // directories are not entries.
  static artifact_tree scan(std::filesystem::path const &root);

  static artifact_tree from_paths(std::vector<std::string> const &paths);

  bool contains(std::string_view path) const;
  entries_t const &entries() const { return entries_; }

  // Paths ending in ".o" under `prefix` (which must end in '/').
  std::set<std::string> objects_under(std::string_view prefix) const;

  // Paths under `prefix` whose file name satisfies `pred`.
  template <typename Pred>
  std::vector<std::string> select(std::string_view prefix, Pred &&pred) const {
    std::vector<std::string> out;
    for (auto it{ entries_.lower_bound(prefix) };
         it != entries_.end() && it->first.starts_with(prefix);
         ++it) {
      auto const slash{ it->first.rfind('/') };
      std::string_view const name{ slash == std::string::npos
                                       ? std::string_view{ it->first }
                                       : std::string_view{ it->first }.substr(slash + 1) };
      if (pred(name)) { out.push_back(it->first); }
    }
    return out;
  }

 private:
  entries_t entries_;
};

}  // namespace rtpack
