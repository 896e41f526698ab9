#pragma once

#include <moo/result.hpp>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace moo {

struct DirEntry {
    std::filesystem::path path;
    // False for symlinked directories, so recursive scans never follow them
    bool is_directory = false;
};

// Read/write view of the filesystem. Everything that inspects a project goes
// through this interface so tests can substitute a synthetic tree.
class Filesystem {
public:
    virtual ~Filesystem() = default;

    virtual bool is_file(const std::filesystem::path& path) const = 0;
    virtual bool is_directory(const std::filesystem::path& path) const = 0;

    virtual Result<std::string> read_file(const std::filesystem::path& path) const = 0;

    // Immediate children of `dir`, sorted by file name
    virtual Result<std::vector<DirEntry>> list_directory(
        const std::filesystem::path& dir) const = 0;

    // Replace `path` with `contents`. Readers see either the old or the new
    // file, never a truncated one.
    virtual Status write_file(const std::filesystem::path& path,
                              const std::string& contents) = 0;

    // Create `dir` and any missing parents; succeeds if it already exists
    virtual Status create_directories(const std::filesystem::path& dir) = 0;

    // Absolute, lexically normalized form of `path`, without trailing separator
    virtual std::filesystem::path absolute(const std::filesystem::path& path) const = 0;
};

class DiskFilesystem : public Filesystem {
public:
    bool is_file(const std::filesystem::path& path) const override;
    bool is_directory(const std::filesystem::path& path) const override;
    Result<std::string> read_file(const std::filesystem::path& path) const override;
    Result<std::vector<DirEntry>> list_directory(
        const std::filesystem::path& dir) const override;
    Status write_file(const std::filesystem::path& path,
                      const std::string& contents) override;
    Status create_directories(const std::filesystem::path& dir) override;
    std::filesystem::path absolute(const std::filesystem::path& path) const override;
};

// Process-wide disk filesystem
Filesystem& disk_filesystem();

// In-memory tree rooted at "/". Adding a file creates its parent directories.
class MemoryFilesystem : public Filesystem {
public:
    void add_file(const std::filesystem::path& path, const std::string& contents);
    void add_directory(const std::filesystem::path& path);
    // Paths listed here fail to read, as if permission were denied
    void deny_read(const std::filesystem::path& path);

    bool is_file(const std::filesystem::path& path) const override;
    bool is_directory(const std::filesystem::path& path) const override;
    Result<std::string> read_file(const std::filesystem::path& path) const override;
    Result<std::vector<DirEntry>> list_directory(
        const std::filesystem::path& dir) const override;
    Status write_file(const std::filesystem::path& path,
                      const std::string& contents) override;
    Status create_directories(const std::filesystem::path& dir) override;
    std::filesystem::path absolute(const std::filesystem::path& path) const override;

    size_t write_count() const { return write_count_; }

private:
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_{"/"};
    std::set<std::string> unreadable_;
    size_t write_count_ = 0;

    std::string key(const std::filesystem::path& path) const;
};

// Strip a trailing separator ("/a/b/" -> "/a/b"); the root stays "/"
std::filesystem::path without_trailing_separator(const std::filesystem::path& path);

} // namespace moo
