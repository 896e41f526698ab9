#pragma once

#include <filesystem>
#include <functional>
#include <optional>

namespace moo {

using DirPredicate = std::function<bool(const std::filesystem::path& dir)>;

// Test `start_dir`, then each ancestor, returning the first directory for
// which `predicate` holds. The filesystem root is tested before giving up.
// The walk itself is lexical; `start_dir` should already be absolute.
std::optional<std::filesystem::path> find_upward(const std::filesystem::path& start_dir,
                                                 const DirPredicate& predicate);

} // namespace moo
