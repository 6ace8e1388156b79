#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

#include <memory>
#include <string>

class Logger {
public:
    /**
     * @brief Registers the application loggers (console and rotating file sinks).
     *
     * Safe to call more than once; later calls leave already registered loggers alone.
     * Throws spdlog::spdlog_ex when the log directory cannot be prepared.
     */
    static void setup_loggers();

    /**
     * @brief Looks up a registered logger; returns nullptr when it does not exist.
     */
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static std::string get_log_directory();

private:
    static std::string get_log_file_path(const std::string& file_name);
};

#endif
