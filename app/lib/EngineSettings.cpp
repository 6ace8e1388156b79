#include "EngineSettings.hpp"
#include "Logger.hpp"
#include "Types.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>

namespace {
constexpr const char* kAppName = "Twinpane";
constexpr const char* kConfigDirEnv = "TWINPANE_CONFIG_DIR";
constexpr const char* kTransferSection = "Transfer";
constexpr const char* kFileSystemSection = "FileSystem";

constexpr std::uint64_t kMinProgressIntervalMs = 10;
constexpr std::uint64_t kMaxProgressIntervalMs = 10000;
constexpr std::uint64_t kMinChunkBytes = 4 * 1024;
constexpr std::uint64_t kMaxChunkBytes = 64ull * 1024 * 1024;
constexpr std::uint64_t kMinStatTimeoutMs = 100;

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::uint64_t read_bounded(const IniConfig& config,
                           const char* section,
                           const char* key,
                           std::uint64_t fallback,
                           std::uint64_t min_value,
                           std::uint64_t max_value)
{
    if (!config.hasValue(section, key)) {
        return fallback;
    }
    const auto parsed = config.getUnsigned(section, key);
    if (!parsed || *parsed < min_value || *parsed > max_value) {
        settings_log(spdlog::level::warn,
                     "Ignoring invalid value '{}' for [{}] {}; using {}",
                     config.getValue(section, key), section, key, fallback);
        return fallback;
    }
    return *parsed;
}
}


EngineSettings::EngineSettings()
    : EngineSettings(define_config_path())
{
}


EngineSettings::EngineSettings(std::string path)
    : config_path(std::move(path))
{
    const auto config_dir = std::filesystem::path(config_path).parent_path();
    if (config_dir.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(config_dir, ec);
    if (ec) {
        settings_log(spdlog::level::err, "Error creating configuration directory '{}': {}",
                     config_dir.string(), ec.message());
    }
}


std::string EngineSettings::define_config_path()
{
    if (const char* override_root = std::getenv(kConfigDirEnv)) {
        if (*override_root != '\0') {
            std::filesystem::path base = override_root;
            return (base / kAppName / "config.ini").string();
        }
    }
#if defined(__APPLE__)
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/Library/Application Support/" + kAppName + "/config.ini";
    }
#else
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg != '\0') {
            return std::string(xdg) + "/" + kAppName + "/config.ini";
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config/" + kAppName + "/config.ini";
    }
#endif
    return "config.ini";
}


std::string EngineSettings::get_config_path() const
{
    return config_path;
}


bool EngineSettings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    progress_interval = std::chrono::milliseconds(read_bounded(
        config, kTransferSection, "ProgressIntervalMs",
        kDefaultProgressIntervalMs, kMinProgressIntervalMs, kMaxProgressIntervalMs));
    copy_chunk_bytes = static_cast<std::size_t>(read_bounded(
        config, kTransferSection, "CopyChunkBytes",
        kDefaultCopyChunkBytes, kMinChunkBytes, kMaxChunkBytes));
    large_file_bytes = read_bounded(
        config, kTransferSection, "LargeFileBytes",
        kDefaultLargeFileBytes, 0, UINT64_MAX);
    max_conflicts_to_show = static_cast<std::size_t>(read_bounded(
        config, kTransferSection, "MaxConflictsToShow",
        kDefaultMaxConflicts, 1, 100000));
    conflict_wait_timeout = std::chrono::seconds(read_bounded(
        config, kTransferSection, "ConflictWaitSeconds",
        kDefaultConflictWaitSeconds, 1, 24 * 3600));
    operation_retention = std::chrono::seconds(read_bounded(
        config, kTransferSection, "OperationRetentionSeconds",
        kDefaultRetentionSeconds, 1, 7 * 24 * 3600));
    stat_timeout = std::chrono::milliseconds(read_bounded(
        config, kFileSystemSection, "StatTimeoutMs",
        kDefaultStatTimeoutMs, kMinStatTimeoutMs, 10 * 60 * 1000));

    const std::string policy_value = config.getValue(kTransferSection, "ConflictPolicy", "stop");
    if (auto policy = conflict_policy_from_string(policy_value)) {
        default_conflict_policy = *policy;
    } else {
        settings_log(spdlog::level::warn, "Unknown conflict policy '{}'; using stop", policy_value);
        default_conflict_policy = ConflictPolicy::Stop;
    }

    const std::string column_value = config.getValue(kTransferSection, "SortColumn", "name");
    default_order.column = sort_column_from_string(column_value).value_or(SortColumn::Name);
    const std::string order_value = config.getValue(kTransferSection, "SortOrder", "ascending");
    default_order.order = sort_order_from_string(order_value).value_or(SortOrder::Ascending);

    return true;
}


bool EngineSettings::save()
{
    config.setValue(kTransferSection, "ProgressIntervalMs", std::to_string(progress_interval.count()));
    config.setValue(kTransferSection, "CopyChunkBytes", std::to_string(copy_chunk_bytes));
    config.setValue(kTransferSection, "LargeFileBytes", std::to_string(large_file_bytes));
    config.setValue(kTransferSection, "ConflictPolicy", to_string(default_conflict_policy));
    config.setValue(kTransferSection, "MaxConflictsToShow", std::to_string(max_conflicts_to_show));
    config.setValue(kTransferSection, "ConflictWaitSeconds", std::to_string(conflict_wait_timeout.count()));
    config.setValue(kTransferSection, "OperationRetentionSeconds", std::to_string(operation_retention.count()));
    config.setValue(kTransferSection, "SortColumn", to_string(default_order.column));
    config.setValue(kTransferSection, "SortOrder", to_string(default_order.order));
    config.setValue(kFileSystemSection, "StatTimeoutMs", std::to_string(stat_timeout.count()));

    return config.save(config_path);
}


std::chrono::milliseconds EngineSettings::get_progress_interval() const
{
    return progress_interval;
}

void EngineSettings::set_progress_interval(std::chrono::milliseconds value)
{
    progress_interval = value;
}

std::size_t EngineSettings::get_copy_chunk_bytes() const
{
    return copy_chunk_bytes;
}

void EngineSettings::set_copy_chunk_bytes(std::size_t value)
{
    copy_chunk_bytes = value > 0 ? value : kDefaultCopyChunkBytes;
}

std::uintmax_t EngineSettings::get_large_file_bytes() const
{
    return large_file_bytes;
}

void EngineSettings::set_large_file_bytes(std::uintmax_t value)
{
    large_file_bytes = value;
}

ConflictPolicy EngineSettings::get_default_conflict_policy() const
{
    return default_conflict_policy;
}

void EngineSettings::set_default_conflict_policy(ConflictPolicy value)
{
    default_conflict_policy = value;
}

std::size_t EngineSettings::get_max_conflicts_to_show() const
{
    return max_conflicts_to_show;
}

void EngineSettings::set_max_conflicts_to_show(std::size_t value)
{
    max_conflicts_to_show = value > 0 ? value : kDefaultMaxConflicts;
}

std::chrono::seconds EngineSettings::get_conflict_wait_timeout() const
{
    return conflict_wait_timeout;
}

void EngineSettings::set_conflict_wait_timeout(std::chrono::seconds value)
{
    conflict_wait_timeout = value;
}

std::chrono::seconds EngineSettings::get_operation_retention() const
{
    return operation_retention;
}

void EngineSettings::set_operation_retention(std::chrono::seconds value)
{
    operation_retention = value;
}

TraversalOrder EngineSettings::get_default_order() const
{
    return default_order;
}

void EngineSettings::set_default_order(TraversalOrder value)
{
    default_order = value;
}

std::chrono::milliseconds EngineSettings::get_stat_timeout() const
{
    return stat_timeout;
}

void EngineSettings::set_stat_timeout(std::chrono::milliseconds value)
{
    stat_timeout = value;
}
