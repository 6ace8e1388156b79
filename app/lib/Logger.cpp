#include "Logger.hpp"
#include "EngineSettings.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

namespace {
constexpr const char* kLogLevelEnv = "TWINPANE_LOG_LEVEL";
constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;

spdlog::level::level_enum resolve_log_level()
{
    const char* value = std::getenv(kLogLevelEnv);
    if (!value || *value == '\0') {
        return spdlog::level::info;
    }
    return spdlog::level::from_str(value);
}
}

std::string Logger::get_log_directory()
{
    const std::filesystem::path config_dir =
        std::filesystem::path(EngineSettings::define_config_path()).parent_path();
    return (config_dir / "logs").string();
}

std::string Logger::get_log_file_path(const std::string& file_name)
{
    return (std::filesystem::path(get_log_directory()) / file_name).string();
}

void Logger::setup_loggers()
{
    if (spdlog::get("core_logger")) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(get_log_directory(), ec);
    if (ec) {
        throw spdlog::spdlog_ex("Failed to create log directory '" + get_log_directory() + "': " + ec.message());
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);

    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        get_log_file_path("twinpane.log"), kMaxLogFileSize, kMaxLogFiles);

    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    auto core_logger = std::make_shared<spdlog::logger>("core_logger", sinks.begin(), sinks.end());
    core_logger->set_level(resolve_log_level());
    core_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    core_logger->flush_on(spdlog::level::warn);

    spdlog::register_logger(core_logger);
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}
