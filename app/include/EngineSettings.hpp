#ifndef ENGINE_SETTINGS_HPP
#define ENGINE_SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

/**
 * @brief Tunables of the scan and transfer engines, persisted in config.ini.
 *
 * Values read from disk are validated; anything outside its accepted range is
 * replaced by the default and reported through the core logger.
 */
class EngineSettings
{
public:
    EngineSettings();
    explicit EngineSettings(std::string config_path);

    bool load();
    bool save();

    static std::string define_config_path();
    std::string get_config_path() const;

    std::chrono::milliseconds get_progress_interval() const;
    void set_progress_interval(std::chrono::milliseconds value);

    std::size_t get_copy_chunk_bytes() const;
    void set_copy_chunk_bytes(std::size_t value);

    std::uintmax_t get_large_file_bytes() const;
    void set_large_file_bytes(std::uintmax_t value);

    ConflictPolicy get_default_conflict_policy() const;
    void set_default_conflict_policy(ConflictPolicy value);

    std::size_t get_max_conflicts_to_show() const;
    void set_max_conflicts_to_show(std::size_t value);

    std::chrono::seconds get_conflict_wait_timeout() const;
    void set_conflict_wait_timeout(std::chrono::seconds value);

    std::chrono::seconds get_operation_retention() const;
    void set_operation_retention(std::chrono::seconds value);

    TraversalOrder get_default_order() const;
    void set_default_order(TraversalOrder value);

    std::chrono::milliseconds get_stat_timeout() const;
    void set_stat_timeout(std::chrono::milliseconds value);

    static constexpr std::int64_t kDefaultProgressIntervalMs = 100;
    static constexpr std::size_t kDefaultCopyChunkBytes = 1024 * 1024;
    static constexpr std::uintmax_t kDefaultLargeFileBytes = 64ull * 1024 * 1024;
    static constexpr std::size_t kDefaultMaxConflicts = 100;
    static constexpr std::int64_t kDefaultConflictWaitSeconds = 300;
    static constexpr std::int64_t kDefaultRetentionSeconds = 600;
    static constexpr std::int64_t kDefaultStatTimeoutMs = 5000;

private:
    std::string config_path;
    IniConfig config;

    std::chrono::milliseconds progress_interval{kDefaultProgressIntervalMs};
    std::size_t copy_chunk_bytes{kDefaultCopyChunkBytes};
    std::uintmax_t large_file_bytes{kDefaultLargeFileBytes};
    ConflictPolicy default_conflict_policy{ConflictPolicy::Stop};
    std::size_t max_conflicts_to_show{kDefaultMaxConflicts};
    std::chrono::seconds conflict_wait_timeout{kDefaultConflictWaitSeconds};
    std::chrono::seconds operation_retention{kDefaultRetentionSeconds};
    TraversalOrder default_order;
    std::chrono::milliseconds stat_timeout{kDefaultStatTimeoutMs};
};

#endif
