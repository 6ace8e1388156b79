#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <random>
#include <sstream>

namespace Utils {

std::filesystem::path utf8_to_path(const std::string& value)
{
#ifdef _WIN32
    return std::filesystem::u8path(value);
#else
    return std::filesystem::path(value);
#endif
}

std::string path_to_utf8(const std::filesystem::path& path)
{
#ifdef _WIN32
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
#else
    return path.string();
#endif
}

std::string format_bytes(std::uintmax_t bytes)
{
    constexpr std::uintmax_t kb = 1024;
    constexpr std::uintmax_t mb = kb * 1024;
    constexpr std::uintmax_t gb = mb * 1024;
    constexpr std::uintmax_t tb = gb * 1024;

    if (bytes >= tb) {
        return fmt::format("{:.1f} TB", static_cast<double>(bytes) / static_cast<double>(tb));
    }
    if (bytes >= gb) {
        return fmt::format("{:.1f} GB", static_cast<double>(bytes) / static_cast<double>(gb));
    }
    if (bytes >= mb) {
        return fmt::format("{:.1f} MB", static_cast<double>(bytes) / static_cast<double>(mb));
    }
    if (bytes >= kb) {
        return fmt::format("{:.1f} KB", static_cast<double>(bytes) / static_cast<double>(kb));
    }
    return fmt::format("{} {}", bytes, bytes == 1 ? "byte" : "bytes");
}

std::string format_duration(std::chrono::milliseconds duration)
{
    using namespace std::chrono;
    if (duration < seconds(1)) {
        return "<1s";
    }
    const auto total_seconds = duration_cast<seconds>(duration).count();
    const auto hours = total_seconds / 3600;
    const auto minutes = (total_seconds % 3600) / 60;
    const auto secs = total_seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h {:02}m", hours, minutes);
    }
    if (minutes > 0) {
        return fmt::format("{}m {:02}s", minutes, secs);
    }
    return fmt::format("{}s", secs);
}

std::string build_transfer_title(TransferKind kind,
                                 std::size_t file_count,
                                 std::size_t dir_count,
                                 std::uintmax_t bytes_total)
{
    const std::string verb = kind == TransferKind::Move ? "Move" : "Copy";
    const std::string files = fmt::format("{} {}", file_count, file_count == 1 ? "file" : "files");
    if (dir_count == 0) {
        return fmt::format("{} {} ({})", verb, files, format_bytes(bytes_total));
    }
    const std::string dirs = fmt::format("{} {}", dir_count, dir_count == 1 ? "folder" : "folders");
    if (file_count == 0) {
        return fmt::format("{} {}", verb, dirs);
    }
    return fmt::format("{} {} and {} ({})", verb, dirs, files, format_bytes(bytes_total));
}

std::string file_name_of(const std::string& path)
{
    std::filesystem::path p = utf8_to_path(path);
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return path_to_utf8(p.filename());
}

std::string parent_of(const std::string& path)
{
    std::filesystem::path p = utf8_to_path(path);
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return path_to_utf8(p.parent_path());
}

std::filesystem::path destination_for(const ManifestEntry& entry,
                                      const std::filesystem::path& destination)
{
    const auto relative = entry.relative_path();
    if (relative.empty() || relative == ".") {
        return destination / entry.path.filename();
    }
    return destination / relative;
}

bool is_same_or_inside(const std::filesystem::path& candidate,
                       const std::filesystem::path& root)
{
    auto strip_trailing = [](std::filesystem::path p) {
        p = p.lexically_normal();
        if (!p.has_filename() && p.has_relative_path()) {
            p = p.parent_path();
        }
        return p;
    };
    const auto normalized_candidate = strip_trailing(candidate);
    const auto normalized_root = strip_trailing(root);

    auto cand_it = normalized_candidate.begin();
    for (const auto& component : normalized_root) {
        if (cand_it == normalized_candidate.end() || *cand_it != component) {
            return false;
        }
        ++cand_it;
    }
    return true;
}

std::int64_t now_epoch_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string generate_operation_id(const std::string& prefix)
{
    static std::atomic<std::uint64_t> counter{0};
    thread_local std::mt19937_64 rng(static_cast<std::mt19937_64::result_type>(
        std::chrono::steady_clock::now().time_since_epoch().count()) ^
        static_cast<std::mt19937_64::result_type>(std::random_device{}()));
    const std::uint64_t value = rng();
    std::ostringstream oss;
    oss << prefix << std::hex << value << "-" << counter.fetch_add(1, std::memory_order_relaxed);
    return oss.str();
}

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string get_executable_path()
{
    std::error_code ec;
    const auto executable = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return {};
    }
    return path_to_utf8(executable.parent_path());
}

}
