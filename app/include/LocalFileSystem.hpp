#ifndef LOCAL_FILE_SYSTEM_HPP
#define LOCAL_FILE_SYSTEM_HPP

#include "IFileSystem.hpp"

class LocalFileSystem : public IFileSystem {
public:
    bool path_exists(const std::filesystem::path& path) override;
    std::optional<EntryInfo> stat_entry(const std::filesystem::path& path) override;
    std::vector<std::filesystem::path> list_directory(const std::filesystem::path& path) override;
    std::optional<std::uintmax_t> free_space(const std::filesystem::path& volume_path) override;
};

#endif
