#pragma once
#include "Types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

/**
 * @brief Directory/filesystem collaborator consumed by the scan and transfer engines.
 *
 * Implementations throw std::filesystem::filesystem_error for failures other than
 * "entry does not exist" (permission denied, I/O errors).
 */
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    virtual bool path_exists(const std::filesystem::path& path) = 0;

    /// Returns nullopt when the entry does not exist. Symlinks are not followed.
    virtual std::optional<EntryInfo> stat_entry(const std::filesystem::path& path) = 0;

    /// Immediate children of a directory, in the order the filesystem returns them.
    virtual std::vector<std::filesystem::path> list_directory(const std::filesystem::path& path) = 0;

    /// Best effort: nullopt when the volume cannot be queried.
    virtual std::optional<std::uintmax_t> free_space(const std::filesystem::path& volume_path) = 0;
};
