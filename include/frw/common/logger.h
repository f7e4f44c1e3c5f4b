// =============================================================================
// frw - Logger Module
// =============================================================================
// Process-wide Quill logger shared by the library and the frw tool.
//
// The tool calls init() once after parsing its options. Library code logs
// through the FRW_LOG_* macros and may do so before init(); the first such
// call sets up a console logger at warning level, so an embedding program
// only hears about failures.
//
// Destructors and other noexcept paths must not trigger that setup. They use
// existingLogger() instead, which never creates anything.
// =============================================================================

#ifndef FRW_COMMON_LOGGER_H
#define FRW_COMMON_LOGGER_H

#include <optional>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace frw::log {

enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Parse a level name as given to --log-level.
/// @return The level, or std::nullopt for an unknown name. Matching ignores
///         case and accepts "warn" and "fatal" as aliases.
[[nodiscard]] std::optional<Level> levelFromString(std::string_view name);

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Set up the logger with a console sink and an optional file sink.
/// @param logFile File to write as well, truncated first. Empty for none.
/// @param level Minimum level written.
/// @note Once a logger exists, later calls only change its level.
void init(std::string_view logFile, Level level);

/// @brief The shared logger, created at warning level on first use.
[[nodiscard]] quill::Logger* logger();

/// @brief The shared logger if one has been created, otherwise nullptr.
[[nodiscard]] quill::Logger* existingLogger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Warn "what path: reason" from a destructor.
/// Goes to the existing logger, or to stderr when there is none.
void warnFromDestructor(std::string_view what, std::string_view path,
                        std::string_view reason) noexcept;

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

}  // namespace frw::log

#define FRW_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(frw::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define FRW_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(frw::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define FRW_LOG_INFO(fmt, ...) \
    LOG_INFO(frw::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define FRW_LOG_WARNING(fmt, ...) \
    LOG_WARNING(frw::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define FRW_LOG_ERROR(fmt, ...) \
    LOG_ERROR(frw::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define FRW_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(frw::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // FRW_COMMON_LOGGER_H
