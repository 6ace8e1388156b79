#include <catch2/catch_test_macros.hpp>
#include "EngineSettings.hpp"
#include "TestHelpers.hpp"

#include <fstream>

namespace {

std::string config_in(const TempDir& dir)
{
    return (dir.path() / "Twinpane" / "config.ini").string();
}

void write_config(const std::string& path, const std::string& contents)
{
    std::ofstream out(path, std::ios::trunc);
    out << contents;
}

} // namespace

TEST_CASE("engine settings start from documented defaults") {
    TempDir temp_dir;
    EngineSettings settings(config_in(temp_dir));

    CHECK(settings.get_progress_interval() == std::chrono::milliseconds(100));
    CHECK(settings.get_copy_chunk_bytes() == 1024 * 1024);
    CHECK(settings.get_default_conflict_policy() == ConflictPolicy::Stop);
    CHECK(settings.get_max_conflicts_to_show() == 100);
    CHECK(settings.get_default_order().column == SortColumn::Name);
    CHECK(settings.get_default_order().order == SortOrder::Ascending);
}

TEST_CASE("missing config file keeps defaults") {
    TempDir temp_dir;
    EngineSettings settings(config_in(temp_dir));
    CHECK_FALSE(settings.load());
    CHECK(settings.get_conflict_wait_timeout() ==
          std::chrono::seconds(EngineSettings::kDefaultConflictWaitSeconds));
}

TEST_CASE("config directory override is honored") {
    TempDir temp_dir;
    EnvVarGuard guard("TWINPANE_CONFIG_DIR", temp_dir.path().string());
    CHECK(EngineSettings::define_config_path() == config_in(temp_dir));
}

TEST_CASE("valid values are loaded from the transfer section") {
    TempDir temp_dir;
    EngineSettings settings(config_in(temp_dir));
    write_config(settings.get_config_path(),
                 "[Transfer]\n"
                 "ProgressIntervalMs=250\n"
                 "CopyChunkBytes=65536\n"
                 "ConflictPolicy=skip\n"
                 "MaxConflictsToShow=20\n"
                 "SortColumn=size\n"
                 "SortOrder=descending\n"
                 "[FileSystem]\n"
                 "StatTimeoutMs=2000\n");

    REQUIRE(settings.load());
    CHECK(settings.get_progress_interval() == std::chrono::milliseconds(250));
    CHECK(settings.get_copy_chunk_bytes() == 65536);
    CHECK(settings.get_default_conflict_policy() == ConflictPolicy::Skip);
    CHECK(settings.get_max_conflicts_to_show() == 20);
    CHECK(settings.get_default_order().column == SortColumn::Size);
    CHECK(settings.get_default_order().order == SortOrder::Descending);
    CHECK(settings.get_stat_timeout() == std::chrono::milliseconds(2000));
}

TEST_CASE("out of range or malformed values fall back to defaults") {
    TempDir temp_dir;
    EngineSettings settings(config_in(temp_dir));
    write_config(settings.get_config_path(),
                 "[Transfer]\n"
                 "ProgressIntervalMs=0\n"
                 "CopyChunkBytes=lots\n"
                 "ConflictPolicy=rename\n"
                 "MaxConflictsToShow=0\n");

    REQUIRE(settings.load());
    CHECK(settings.get_progress_interval() ==
          std::chrono::milliseconds(EngineSettings::kDefaultProgressIntervalMs));
    CHECK(settings.get_copy_chunk_bytes() == EngineSettings::kDefaultCopyChunkBytes);
    CHECK(settings.get_default_conflict_policy() == ConflictPolicy::Stop);
    CHECK(settings.get_max_conflicts_to_show() == EngineSettings::kDefaultMaxConflicts);
}

TEST_CASE("saved settings load back unchanged") {
    TempDir temp_dir;
    {
        EngineSettings settings(config_in(temp_dir));
        settings.set_progress_interval(std::chrono::milliseconds(40));
        settings.set_default_conflict_policy(ConflictPolicy::Overwrite);
        settings.set_default_order(TraversalOrder{SortColumn::Modified, SortOrder::Descending});
        settings.set_operation_retention(std::chrono::seconds(30));
        REQUIRE(settings.save());
    }

    EngineSettings reloaded(config_in(temp_dir));
    REQUIRE(reloaded.load());
    CHECK(reloaded.get_progress_interval() == std::chrono::milliseconds(40));
    CHECK(reloaded.get_default_conflict_policy() == ConflictPolicy::Overwrite);
    CHECK(reloaded.get_default_order().column == SortColumn::Modified);
    CHECK(reloaded.get_default_order().order == SortOrder::Descending);
    CHECK(reloaded.get_operation_retention() == std::chrono::seconds(30));
}
