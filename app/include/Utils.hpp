#ifndef UTILS_HPP
#define UTILS_HPP

#include "Types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace Utils {

std::filesystem::path utf8_to_path(const std::string& value);
std::string path_to_utf8(const std::filesystem::path& path);

/**
 * @brief Formats a byte count with binary units: "512 bytes", "10.0 KB", "1.5 GB".
 */
std::string format_bytes(std::uintmax_t bytes);

/**
 * @brief Formats a duration for progress dialogs: "<1s", "42s", "3m 05s", "1h 02m".
 */
std::string format_duration(std::chrono::milliseconds duration);

/**
 * @brief Builds the dialog title for a transfer, e.g. "Copy 3 files (10.0 KB)".
 */
std::string build_transfer_title(TransferKind kind,
                                 std::size_t file_count,
                                 std::size_t dir_count,
                                 std::uintmax_t bytes_total);

std::string file_name_of(const std::string& path);
std::string parent_of(const std::string& path);

/**
 * @brief Maps a manifest entry below `destination` keeping its path relative to the source root.
 */
std::filesystem::path destination_for(const ManifestEntry& entry,
                                      const std::filesystem::path& destination);

/**
 * @brief True when `candidate` equals `root` or lies below it, compared by path components.
 */
bool is_same_or_inside(const std::filesystem::path& candidate,
                       const std::filesystem::path& root);

std::int64_t now_epoch_ms();

std::string generate_operation_id(const std::string& prefix);

std::string to_lower_copy(std::string value);

/**
 * @brief Directory holding the running executable; empty when it cannot be resolved.
 */
std::string get_executable_path();

}

#endif
