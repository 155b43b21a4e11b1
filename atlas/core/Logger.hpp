#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Atlas {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Two loggers share the same sinks: ATLAS for library code and APP for
 * tools built on top of it. Either logger may be used before Initialize,
 * in which case console-only logging is set up on first use.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for a rotating log
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Parse a level name (trace, debug, info, warn, error, critical, off)
     */
    [[nodiscard]] static std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

    static bool IsInitialized() { return s_initialized; }

    /**
     * @brief Get the library logger
     */
    static std::shared_ptr<spdlog::logger>& GetLibraryLogger() {
        if (!s_initialized) {
            Initialize();
        }
        return s_libraryLogger;
    }

    /**
     * @brief Get the application logger
     */
    static std::shared_ptr<spdlog::logger>& GetAppLogger() {
        if (!s_initialized) {
            Initialize();
        }
        return s_appLogger;
    }

private:
    static std::shared_ptr<spdlog::logger> s_libraryLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static bool s_initialized;
};

} // namespace Atlas

// Library logging
#define ATLAS_LOG_TRACE(...)    ::Atlas::Logger::GetLibraryLogger()->trace(__VA_ARGS__)
#define ATLAS_LOG_DEBUG(...)    ::Atlas::Logger::GetLibraryLogger()->debug(__VA_ARGS__)
#define ATLAS_LOG_INFO(...)     ::Atlas::Logger::GetLibraryLogger()->info(__VA_ARGS__)
#define ATLAS_LOG_WARN(...)     ::Atlas::Logger::GetLibraryLogger()->warn(__VA_ARGS__)
#define ATLAS_LOG_ERROR(...)    ::Atlas::Logger::GetLibraryLogger()->error(__VA_ARGS__)
#define ATLAS_LOG_CRITICAL(...) ::Atlas::Logger::GetLibraryLogger()->critical(__VA_ARGS__)

// Application logging
#define APP_LOG_TRACE(...)    ::Atlas::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Atlas::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Atlas::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Atlas::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Atlas::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::Atlas::Logger::GetAppLogger()->critical(__VA_ARGS__)
