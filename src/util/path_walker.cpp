#include <moo/path_walker.hpp>
#include <moo/filesystem.hpp>

namespace moo {

namespace fs = std::filesystem;

std::optional<fs::path> find_upward(const fs::path& start_dir,
                                    const DirPredicate& predicate) {
    fs::path dir = without_trailing_separator(start_dir.lexically_normal());

    while (true) {
        if (predicate(dir)) {
            return dir;
        }

        fs::path parent = dir.parent_path();
        if (parent == dir || parent.empty()) {
            // Root (or the top of a relative path) tested and rejected
            return std::nullopt;
        }
        dir = parent;
    }
}

} // namespace moo
