#include <moo/filesystem.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>

#include <unistd.h>

namespace moo {

namespace fs = std::filesystem;

fs::path without_trailing_separator(const fs::path& path) {
    fs::path p = path;
    while (!p.has_filename() && p.has_relative_path()) {
        p = p.parent_path();
    }
    return p;
}

static void sort_entries(std::vector<DirEntry>& entries) {
    std::sort(entries.begin(), entries.end(),
        [](const DirEntry& a, const DirEntry& b) {
            return a.path.filename().string() < b.path.filename().string();
        });
}

// ---------------------------------------------------------------------------
// DiskFilesystem
// ---------------------------------------------------------------------------

bool DiskFilesystem::is_file(const fs::path& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool DiskFilesystem::is_directory(const fs::path& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

Result<std::string> DiskFilesystem::read_file(const fs::path& path) const {
    if (is_directory(path)) {
        return io_error("read", path.string(), std::make_error_code(std::errc::is_a_directory));
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return io_error("open", path.string(), {});
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return io_error("read", path.string(), {});
    }
    return Result<std::string>::ok(ss.str());
}

Result<std::vector<DirEntry>> DiskFilesystem::list_directory(const fs::path& dir) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return io_error("list directory", dir.string(), ec);

    std::vector<DirEntry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) return io_error("list directory", dir.string(), ec);
        std::error_code type_ec;
        DirEntry entry;
        entry.path = it->path();
        entry.is_directory = it->is_directory(type_ec) && !it->is_symlink(type_ec);
        if (type_ec) entry.is_directory = false;
        entries.push_back(std::move(entry));
    }
    if (ec) return io_error("list directory", dir.string(), ec);

    sort_entries(entries);
    return Result<std::vector<DirEntry>>::ok(std::move(entries));
}

Status DiskFilesystem::write_file(const fs::path& path, const std::string& contents) {
    fs::path tmp = path.parent_path() /
        ("." + path.filename().string() + ".tmp-" + std::to_string(getpid()));

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return io_error("create", tmp.string(), {});
        }
        out << contents;
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return io_error("write", tmp.string(), {});
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return io_error("replace", path.string(), ec);
    }
    return ok_status();
}

Status DiskFilesystem::create_directories(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return io_error("create directory", dir.string(), ec);
    if (!fs::is_directory(dir, ec)) {
        return io_error("create directory", dir.string(),
            std::make_error_code(std::errc::not_a_directory));
    }
    return ok_status();
}

fs::path DiskFilesystem::absolute(const fs::path& path) const {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    if (ec) abs = path;
    return without_trailing_separator(abs.lexically_normal());
}

Filesystem& disk_filesystem() {
    static DiskFilesystem instance;
    return instance;
}

// ---------------------------------------------------------------------------
// MemoryFilesystem
// ---------------------------------------------------------------------------

fs::path MemoryFilesystem::absolute(const fs::path& path) const {
    fs::path p = path.is_absolute() ? path : fs::path("/") / path;
    return without_trailing_separator(p.lexically_normal());
}

std::string MemoryFilesystem::key(const fs::path& path) const {
    return absolute(path).generic_string();
}

void MemoryFilesystem::add_directory(const fs::path& path) {
    fs::path dir = absolute(path);
    while (true) {
        dirs_.insert(dir.generic_string());
        fs::path parent = dir.parent_path();
        if (parent == dir || parent.empty()) break;
        dir = parent;
    }
}

void MemoryFilesystem::add_file(const fs::path& path, const std::string& contents) {
    fs::path file = absolute(path);
    add_directory(file.parent_path());
    files_[file.generic_string()] = contents;
}

void MemoryFilesystem::deny_read(const fs::path& path) {
    unreadable_.insert(key(path));
}

bool MemoryFilesystem::is_file(const fs::path& path) const {
    return files_.count(key(path)) > 0;
}

bool MemoryFilesystem::is_directory(const fs::path& path) const {
    return dirs_.count(key(path)) > 0;
}

Result<std::string> MemoryFilesystem::read_file(const fs::path& path) const {
    std::string k = key(path);
    auto it = files_.find(k);
    if (it == files_.end()) {
        return io_error("open", k,
            std::make_error_code(std::errc::no_such_file_or_directory));
    }
    if (unreadable_.count(k)) {
        return io_error("open", k,
            std::make_error_code(std::errc::permission_denied));
    }
    return Result<std::string>::ok(it->second);
}

Result<std::vector<DirEntry>> MemoryFilesystem::list_directory(const fs::path& dir) const {
    std::string k = key(dir);
    if (!dirs_.count(k)) {
        return io_error("list directory", k,
            std::make_error_code(std::errc::no_such_file_or_directory));
    }
    if (unreadable_.count(k)) {
        return io_error("list directory", k,
            std::make_error_code(std::errc::permission_denied));
    }

    fs::path parent(k);
    std::vector<DirEntry> entries;
    for (const auto& d : dirs_) {
        fs::path p(d);
        if (d != k && p.parent_path() == parent) {
            entries.push_back(DirEntry{p, true});
        }
    }
    for (const auto& [f, contents] : files_) {
        fs::path p(f);
        if (p.parent_path() == parent) {
            entries.push_back(DirEntry{p, false});
        }
    }

    sort_entries(entries);
    return Result<std::vector<DirEntry>>::ok(std::move(entries));
}

Status MemoryFilesystem::write_file(const fs::path& path, const std::string& contents) {
    fs::path file = absolute(path);
    if (!dirs_.count(file.parent_path().generic_string())) {
        return io_error("replace", file.generic_string(),
            std::make_error_code(std::errc::no_such_file_or_directory));
    }
    if (dirs_.count(file.generic_string())) {
        return io_error("replace", file.generic_string(),
            std::make_error_code(std::errc::is_a_directory));
    }
    files_[file.generic_string()] = contents;
    ++write_count_;
    return ok_status();
}

Status MemoryFilesystem::create_directories(const fs::path& dir) {
    fs::path abs = absolute(dir);
    for (fs::path p = abs; ; p = p.parent_path()) {
        if (files_.count(p.generic_string())) {
            return io_error("create directory", abs.generic_string(),
                std::make_error_code(std::errc::not_a_directory));
        }
        if (p.parent_path() == p || p.parent_path().empty()) break;
    }
    add_directory(abs);
    return ok_status();
}

} // namespace moo
