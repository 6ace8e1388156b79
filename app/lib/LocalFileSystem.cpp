#include "LocalFileSystem.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cerrno>
#include <system_error>

#include <sys/stat.h>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace {
[[noreturn]] void throw_errno(const char* what, const fs::path& path, int error)
{
    throw fs::filesystem_error(what, path, std::error_code(error, std::generic_category()));
}
}

bool LocalFileSystem::path_exists(const fs::path& path)
{
    struct stat st {};
    if (::lstat(path.c_str(), &st) == 0) {
        return true;
    }
    if (errno == ENOENT || errno == ENOTDIR) {
        return false;
    }
    throw_errno("lstat", path, errno);
}

std::optional<EntryInfo> LocalFileSystem::stat_entry(const fs::path& path)
{
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        const int error = errno;
        if (error == ENOENT || error == ENOTDIR) {
            return std::nullopt;
        }
        throw_errno("lstat", path, error);
    }

    EntryInfo info;
    info.size = static_cast<std::uintmax_t>(st.st_size);
    info.modified_at = st.st_mtime;
    info.is_directory = S_ISDIR(st.st_mode);
    info.is_symlink = S_ISLNK(st.st_mode);
    info.is_regular = S_ISREG(st.st_mode);
    info.device = static_cast<std::uint64_t>(st.st_dev);
    info.inode = static_cast<std::uint64_t>(st.st_ino);

    if (info.is_symlink) {
        struct stat target {};
        if (::stat(path.c_str(), &target) != 0 && errno == ELOOP) {
            info.symlink_loop = true;
        }
    }
    return info;
}

std::vector<fs::path> LocalFileSystem::list_directory(const fs::path& path)
{
    std::vector<fs::path> children;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        throw fs::filesystem_error("directory_iterator", path, ec);
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw fs::filesystem_error("directory_iterator::increment", path, ec);
        }
        children.push_back(it->path());
    }
    if (ec) {
        throw fs::filesystem_error("directory_iterator::increment", path, ec);
    }
    return children;
}

std::optional<std::uintmax_t> LocalFileSystem::free_space(const fs::path& volume_path)
{
    struct statvfs info {};
    if (::statvfs(volume_path.c_str(), &info) != 0) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->debug("statvfs failed for '{}': {}", Utils::path_to_utf8(volume_path),
                          std::generic_category().message(errno));
        }
        return std::nullopt;
    }
    return static_cast<std::uintmax_t>(info.f_bavail) * static_cast<std::uintmax_t>(info.f_frsize);
}
